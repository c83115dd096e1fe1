#include "app_settings.hpp"
#include "app_settings_io.hpp"
#include "color_map.hpp"
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cstring>

namespace waterfall {

// Minimal JSON (hand-rolled) to avoid deps. Expects well-formed file we wrote.
static const char* find_value(const char* s, const char* key) {
    const char* p = std::strstr(s, key);
    if (!p) return nullptr;
    p = std::strchr(p, ':');
    return p ? p + 1 : nullptr;
}

static bool parse_key_value(const char* s, const char* key, float& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    char* end = nullptr;
    const float v = std::strtof(p, &end);
    if (end == p) return false;
    out = v;
    return true;
}

static bool parse_key_value(const char* s, const char* key, int& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    char* end = nullptr;
    const long v = std::strtol(p, &end, 10);
    if (end == p) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_key_value(const char* s, const char* key, std::string& out) {
    const char* p = find_value(s, key);
    if (!p) return false;
    while (*p == ' ' || *p == '\t') ++p;
    if (*p != '"') return false;
    ++p;
    const char* start = p;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') ++p;
    out.assign(start, p - start);
    return true;
}

bool load_settings(const char* path, Settings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    const char* s = buf.c_str();
    parse_key_value(s, "\"device_id\"", st.device_id);

    // Every numeric value goes through its setter so a hand-edited file
    // cannot put the pipeline outside its valid ranges.
    int iv = 0;
    float fv = 0.0f;
    if (parse_key_value(s, "\"fft_size\"", iv)) st.set_fft_size(iv);
    if (parse_key_value(s, "\"rows_per_second\"", iv)) st.set_rows_per_second(iv);
    if (parse_key_value(s, "\"dyn_range_db\"", fv)) st.set_dynamic_range_db(fv);
    if (parse_key_value(s, "\"contrast\"", fv)) st.set_contrast(fv);
    if (parse_key_value(s, "\"luminosity\"", fv)) st.set_luminosity(fv);
    if (parse_key_value(s, "\"sensitivity\"", fv)) st.set_sensitivity(fv);
    if (parse_key_value(s, "\"color_scheme\"", iv)) st.set_color_scheme_idx(iv, static_cast<int>(color_schemes().size()));

    std::string scale;
    if (parse_key_value(s, "\"frequency_scale\"", scale)) {
        st.frequency_scale = (scale == "mel") ? FrequencyScaleMode::Mel : FrequencyScaleMode::Linear;
    }
    return true;
}

bool save_settings(const char* path, const Settings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    std::fprintf(f,
        "{\n"
        "  \"device_id\": \"%s\",\n"
        "  \"fft_size\": %d,\n"
        "  \"rows_per_second\": %d,\n"
        "  \"dyn_range_db\": %.1f,\n"
        "  \"contrast\": %.3f,\n"
        "  \"luminosity\": %.3f,\n"
        "  \"sensitivity\": %.3f,\n"
        "  \"frequency_scale\": \"%s\",\n"
        "  \"color_scheme\": %d\n"
        "}\n",
        st.device_id.c_str(),
        st.fft_size,
        st.rows_per_second,
        st.dynamic_range_db,
        st.contrast,
        st.luminosity,
        st.sensitivity,
        frequency_scale_name(st.frequency_scale),
        st.color_scheme_idx);
    const bool ok = std::ferror(f) == 0;
    return std::fclose(f) == 0 && ok;
}

} // namespace waterfall
