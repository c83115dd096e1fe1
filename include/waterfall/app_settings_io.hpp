#pragma once

#include "app_settings.hpp"

namespace waterfall {

bool load_settings(const char* path, Settings& st);
bool save_settings(const char* path, const Settings& st);

}
