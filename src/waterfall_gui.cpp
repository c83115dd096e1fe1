#include "WaterfallSession.hpp"
#include "app_settings.hpp"
#include "app_settings_io.hpp"
#include "color_map.hpp"
#include "views/waterfall_view.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <utility>

// ImGui + OpenGL ES 3
#include <GLES3/gl3.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

using namespace waterfall;

namespace {

const int fft_sizes[] = {512, 1024, 2048, 4096, 8192, 16384, 32768};
const char* fft_size_labels[] = {"512", "1024", "2048", "4096", "8192", "16384", "32768"};
constexpr int fft_size_count = 7;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--device NAME] [--settings PATH]\n"
              << "  --device NAME     ALSA capture device (default: from settings, else \"default\")\n"
              << "  --settings PATH   settings file (default: config/settings.json)\n"
              << "  --help            show this message" << std::endl;
}

} // namespace

class WaterfallGUI {
public:
    WaterfallGUI(const Settings& initial, std::string settings_path)
        : settings(initial),
          settings_path(std::move(settings_path)),
          session(initial, createAudioInput) {
        std::snprintf(device_buf, sizeof(device_buf), "%s", settings.device_id.c_str());
    }

    bool init_gui() {
        if (!glfwInit()) {
            std::cerr << "Cannot initialise GLFW" << std::endl;
            return false;
        }

        // Request OpenGL ES 3.0 context via EGL
        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

        window = glfwCreateWindow(1200, 800, "Waterfall", nullptr, nullptr);
        if (!window) {
            std::cerr << "Cannot create window" << std::endl;
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        glfwSwapInterval(1); // Enable vsync

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGuiIO& io = ImGui::GetIO();
        io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
        io.IniFilename = nullptr;

        ImGui::StyleColorsDark();

        ImGui_ImplGlfw_InitForOpenGL(window, true);
        // Use GLSL ES 3.0 shader version for OpenGL ES
        ImGui_ImplOpenGL3_Init("#version 300 es");
        return true;
    }

    void run() {
        if (!init_gui()) return;

        start_capture();

        while (!glfwWindowShouldClose(window)) {
            const bool visible = glfwGetWindowAttrib(window, GLFW_ICONIFIED) == 0
                                 && glfwGetWindowAttrib(window, GLFW_VISIBLE) != 0;
            session.set_visible(visible);

            if (!visible) {
                // No display refresh while iconified; keep producing at the hidden rate
                glfwWaitEventsTimeout(session.hidden_interval_s());
                session.frame(canvas_w, canvas_h);
                continue;
            }

            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            render_gui();

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        session.stop();
        persist();

        // Texture must go while the context is still current
        view.release();
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
    }

private:
    GLFWwindow* window = nullptr;
    Settings settings;
    std::string settings_path;
    audio::WaterfallSession session;
    gui::WaterfallView view;
    AcquisitionError status = AcquisitionError::None;
    char device_buf[128] = {};
    int canvas_w = 0;
    int canvas_h = 0;

    void start_capture() {
        status = session.start(settings.device_id);
        if (status == AcquisitionError::None) {
            settings = session.settings();
            std::snprintf(device_buf, sizeof(device_buf), "%s", settings.device_id.c_str());
        }
    }

    void persist() {
        if (settings_path == "config/settings.json") {
            mkdir("config", 0755);
        }
        if (!save_settings(settings_path.c_str(), settings)) {
            std::cerr << "Cannot save settings to " << settings_path << std::endl;
        }
    }

    void apply() {
        session.apply_settings(settings);
        if (!session.running() && session.last_error() != AcquisitionError::None) {
            status = session.last_error();
        }
        persist();
    }

    void render_controls() {
        if (session.running()) {
            if (ImGui::Button("Stop")) session.stop();
        } else {
            if (ImGui::Button("Start")) start_capture();
        }
        ImGui::SameLine();
        ImGui::SetNextItemWidth(160.0f);
        ImGui::InputText("Device", device_buf, sizeof(device_buf));
        if (ImGui::IsItemDeactivatedAfterEdit() && device_buf[0] != '\0') {
            settings.device_id = device_buf;
            apply();
        }

        ImGui::SameLine();
        int fft_idx = 2;
        for (int i = 0; i < fft_size_count; ++i) {
            if (fft_sizes[i] == settings.fft_size) fft_idx = i;
        }
        ImGui::SetNextItemWidth(90.0f);
        if (ImGui::Combo("FFT", &fft_idx, fft_size_labels, fft_size_count)) {
            settings.set_fft_size(fft_sizes[fft_idx]);
            apply();
        }

        ImGui::SameLine();
        int rps = settings.rows_per_second;
        ImGui::SetNextItemWidth(140.0f);
        if (ImGui::SliderInt("Rows/s", &rps, limits::min_rows_per_second, limits::max_rows_per_second, "%d",
                             ImGuiSliderFlags_Logarithmic)) {
            settings.set_rows_per_second(rps);
            apply();
        }

        ImGui::SameLine();
        bool mel = settings.frequency_scale == FrequencyScaleMode::Mel;
        if (ImGui::Checkbox("Mel", &mel)) {
            settings.frequency_scale = mel ? FrequencyScaleMode::Mel : FrequencyScaleMode::Linear;
            apply();
        }

        ImGui::SameLine();
        const auto& schemes = color_schemes();
        const int scheme_count = static_cast<int>(schemes.size());
        const int scheme_idx = std::clamp(settings.color_scheme_idx, 0, scheme_count - 1);
        ImGui::SetNextItemWidth(120.0f);
        if (ImGui::BeginCombo("Colours", schemes[scheme_idx].name)) {
            for (int i = 0; i < scheme_count; ++i) {
                const bool selected = i == scheme_idx;
                if (ImGui::Selectable(schemes[i].name, selected)) {
                    settings.set_color_scheme_idx(i, scheme_count);
                    apply();
                }
                if (selected) ImGui::SetItemDefaultFocus();
            }
            ImGui::EndCombo();
        }

        float dyn = settings.dynamic_range_db;
        ImGui::SetNextItemWidth(150.0f);
        if (ImGui::SliderFloat("Range", &dyn, limits::min_dynamic_range_db, limits::max_dynamic_range_db, "%.0f dB")) {
            settings.set_dynamic_range_db(dyn);
            apply();
        }
        ImGui::SameLine();
        float contrast = settings.contrast;
        ImGui::SetNextItemWidth(150.0f);
        if (ImGui::SliderFloat("Contrast", &contrast, limits::min_contrast, limits::max_contrast, "%.2f")) {
            settings.set_contrast(contrast);
            apply();
        }
        ImGui::SameLine();
        float lum = settings.luminosity;
        ImGui::SetNextItemWidth(150.0f);
        if (ImGui::SliderFloat("Luminosity", &lum, limits::min_luminosity, limits::max_luminosity, "%.2f")) {
            settings.set_luminosity(lum);
            apply();
        }
        ImGui::SameLine();
        float gain = settings.sensitivity;
        ImGui::SetNextItemWidth(150.0f);
        if (ImGui::SliderFloat("Sensitivity", &gain, limits::min_sensitivity, limits::max_sensitivity, "%.2fx",
                               ImGuiSliderFlags_Logarithmic)) {
            settings.set_sensitivity(gain);
            apply();
        }

        if (status != AcquisitionError::None && !session.running()) {
            ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.35f, 1.0f), "%s: %s",
                               acquisition_error_name(status), describe_acquisition_error(status));
        } else if (session.running()) {
            const auto& cfg = session.engine().get_config();
            const auto& pl = session.pipeline();
            ImGui::Text("%s | %u Hz | %d bins | rows %zu | queued %zu | dropped %zu",
                        cfg.device_name.c_str(), cfg.sample_rate, settings.bin_count(),
                        pl.rows_produced(), pl.queued(), pl.dropped());
        } else {
            ImGui::TextUnformatted("Stopped");
        }
    }

    void render_gui() {
        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(vp->WorkPos);
        ImGui::SetNextWindowSize(vp->WorkSize);
        ImGui::Begin("Waterfall", nullptr,
                     ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                     ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus);

        render_controls();

        const ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
        const ImVec2 avail = ImGui::GetContentRegionAvail();
        canvas_w = std::max(0, static_cast<int>(avail.x));
        canvas_h = std::max(0, static_cast<int>(avail.y));

        const int old_w = session.buffer().width();
        const int old_h = session.buffer().height();
        const bool changed = session.frame(canvas_w, canvas_h);
        if (changed || old_w != canvas_w || old_h != canvas_h) view.invalidate();

        view.draw(ImGui::GetWindowDrawList(), canvas_pos,
                  static_cast<float>(canvas_w), static_cast<float>(canvas_h),
                  session.buffer(), settings.frequency_scale, session.axis_context());
        ImGui::Dummy(ImVec2(static_cast<float>(canvas_w), static_cast<float>(canvas_h)));

        ImGui::End();
    }
};

int main(int argc, char** argv) {
    std::string settings_path = "config/settings.json";
    std::string device;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(arg, "--device") == 0 && i + 1 < argc) {
            device = argv[++i];
        } else if (std::strcmp(arg, "--settings") == 0 && i + 1 < argc) {
            settings_path = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    Settings settings;
    if (!load_settings(settings_path.c_str(), settings)) {
        std::cout << "No settings at " << settings_path << ", using defaults" << std::endl;
    }
    if (!device.empty()) settings.device_id = device;

    WaterfallGUI app(settings, settings_path);
    app.run();
    return 0;
}
