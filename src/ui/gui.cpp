#if BUILD_GUI

#include "gui.hpp"

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl2.h>

#include <GLFW/glfw3.h>
#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif
#include <GL/gl.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb/stb_image_write.h"

#include "io/scene.hpp"
#include "sim/brush.hpp"
#include "sim/simulation.hpp"
#include "ui/field_renderer.hpp"
#include "ui/presets.hpp"

namespace {

struct Toast {
    std::string text;
    float remaining{0.0f};

    void show(const std::string& message, float seconds) {
        text = message;
        remaining = seconds;
    }
};

struct FieldTexture {
    GLuint id{0};
    int w{0}, h{0};
    GLint filter{GL_NEAREST};
};

struct AppState {
    sim::Simulation sim;
    sim::VortexBrush brush;

    ui::ScaleFilter filter{ui::ScaleFilter::Nearest};
    int resolutionLevel{3};
    float temperaturePct{0.0f};
    int viewW{0}, viewH{0};   // field view size in pixels

    char scenePath[256] = "examples/vortex_dipole.json";
    Toast toast;
    FieldTexture tex;
    std::vector<unsigned char> cells;  // per-frame RGBA upload buffer
};

struct ThemeColor {
    ImGuiCol slot;
    ImVec4 value;
};

// Dark panels with a cyan accent.
static void StyleColorsVortex() {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 3.0f;
    style.GrabRounding = 3.0f;
    style.FrameBorderSize = 1.0f;
    style.ItemSpacing = ImVec2(8, 5);
    style.FramePadding = ImVec2(9, 5);

    const ImVec4 panel(0.07f, 0.08f, 0.10f, 1.0f);
    const ImVec4 control(0.12f, 0.14f, 0.17f, 1.0f);
    const ImVec4 hover(0.19f, 0.22f, 0.27f, 1.0f);
    const ImVec4 accent(0.22f, 0.78f, 0.92f, 1.0f);
    const ThemeColor table[] = {
        {ImGuiCol_WindowBg, ImVec4(0.04f, 0.05f, 0.06f, 1.0f)},
        {ImGuiCol_ChildBg, panel},
        {ImGuiCol_PopupBg, panel},
        {ImGuiCol_MenuBarBg, panel},
        {ImGuiCol_Border, ImVec4(0.21f, 0.24f, 0.28f, 1.0f)},
        {ImGuiCol_FrameBg, control},
        {ImGuiCol_FrameBgHovered, hover},
        {ImGuiCol_FrameBgActive, hover},
        {ImGuiCol_Button, control},
        {ImGuiCol_ButtonHovered, hover},
        {ImGuiCol_ButtonActive, ImVec4(0.25f, 0.30f, 0.36f, 1.0f)},
        {ImGuiCol_Header, control},
        {ImGuiCol_HeaderHovered, hover},
        {ImGuiCol_CheckMark, accent},
        {ImGuiCol_SliderGrab, accent},
        {ImGuiCol_SliderGrabActive, ImVec4(0.16f, 0.62f, 0.76f, 1.0f)},
    };
    for (const ThemeColor& c : table) style.Colors[c.slot] = c.value;
}

// Keeps one texture at simulation resolution. GL filtering does the on-screen
// upscale, so a filter change only touches the texture parameters.
static void prepare_texture(FieldTexture& tex, int w, int h, ui::ScaleFilter filter) {
    if (tex.id == 0) glGenTextures(1, &tex.id);
    glBindTexture(GL_TEXTURE_2D, tex.id);
    const GLint want = filter == ui::ScaleFilter::Bilinear ? GL_LINEAR : GL_NEAREST;
    if (tex.filter != want || tex.w == 0) {
        tex.filter = want;
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, want);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, want);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP);
    }
    if (tex.w != w || tex.h != h) {
        tex.w = w;
        tex.h = h;
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    }
}

static void upload_field(AppState& app) {
    ui::render_field_to_rgba(app.sim, app.cells);
    prepare_texture(app.tex, app.sim.Nx, app.sim.Ny, app.filter);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, app.sim.Nx, app.sim.Ny, GL_RGBA, GL_UNSIGNED_BYTE,
                    app.cells.data());
    glBindTexture(GL_TEXTURE_2D, 0);
}

// screenshots/vortices_step<N>.png, suffixed when the name is taken.
static std::filesystem::path next_screenshot_path(long long step) {
#ifdef PROJECT_SOURCE_DIR
    const std::filesystem::path root(PROJECT_SOURCE_DIR);
#else
    const std::filesystem::path root = std::filesystem::current_path();
#endif
    const std::filesystem::path dir = root / "screenshots";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    const std::string stem = "vortices_step" + std::to_string(step);
    std::filesystem::path out = dir / (stem + ".png");
    for (int n = 2; std::filesystem::exists(out); ++n) {
        out = dir / (stem + "-" + std::to_string(n) + ".png");
    }
    return out;
}

// The PNG matches the view: cells composited to the view size with the
// active upscale filter.
static bool write_view_png(const AppState& app, const std::filesystem::path& file) {
    if (app.viewW <= 0 || app.viewH <= 0) return false;
    std::vector<unsigned char> cells, view;
    ui::render_field_to_rgba(app.sim, cells);
    ui::composite_rgba(cells, app.sim.Nx, app.sim.Ny, view, app.viewW, app.viewH, app.filter);
    return stbi_write_png(file.string().c_str(), app.viewW, app.viewH, 4, view.data(),
                          app.viewW * 4) != 0;
}

static void take_screenshot(AppState& app) {
    const std::filesystem::path file = next_screenshot_path(app.sim.stepCount);
    if (write_view_png(app, file)) {
        app.toast.show("Screenshot: " + file.string(), 3.0f);
    } else {
        app.toast.show("Screenshot failed", 3.0f);
    }
}

static void refit_grid(AppState& app) {
    if (app.viewW > 0 && app.viewH > 0) {
        app.sim.fit_display(app.viewW, app.viewH, sim::cell_size_for_resolution(app.resolutionLevel));
    }
}

// Brush and temperature slider follow whatever state was just loaded.
static void sync_controls(AppState& app) {
    app.brush = sim::VortexBrush{};
    app.temperaturePct = static_cast<float>(app.sim.params.noiseLevel * 100.0);
}

static void apply_preset(AppState& app, void (*load)(sim::Simulation&), const char* name) {
    load(app.sim);
    sync_controls(app);
    app.toast.show(std::string("Preset: ") + name, 2.5f);
}

static void draw_run_controls(AppState& app) {
    ImGui::PushStyleVar(ImGuiStyleVar_FramePadding, ImVec2(12, 6));
    if (ImGui::Button(app.sim.running ? "Pause [Space]" : "Run [Space]")) {
        app.sim.running = !app.sim.running;
    }
    ImGui::SameLine();
    if (ImGui::Button("Step")) app.sim.step();
    ImGui::SameLine();
    if (ImGui::Button("Quench [R]")) app.sim.reset();
    ImGui::PopStyleVar();
}

static void draw_physics(AppState& app) {
    sim::Params& p = app.sim.params;
    double lo = 0.01, hi = 2.0;
    ImGui::SliderScalar("Diffusion D", ImGuiDataType_Double, &p.diffusion, &lo, &hi, "%.3f");
    lo = 0.001;
    hi = 0.5;
    ImGui::SliderScalar("dt", ImGuiDataType_Double, &p.dt, &lo, &hi, "%.4f", ImGuiSliderFlags_Logarithmic);

    const double bound = app.sim.stability_bound();
    if (bound >= 1.0) {
        ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.3f, 1.0f), "4*D*dt = %.3f (may diverge)", bound);
    } else {
        ImGui::Text("4*D*dt = %.3f", bound);
    }
}

static void draw_diagnostics(const AppState& app) {
    int pos = 0, neg = 0;
    app.sim.count_defects(pos, neg);
    ImGui::Text("Grid %d x %d, step %lld", app.sim.Nx, app.sim.Ny, app.sim.stepCount);
    ImGui::Text("Mean |psi| %.4f", app.sim.mean_magnitude());
    ImGui::Text("Vortices +%d / -%d", pos, neg);
    ImGui::Text("Next click spawns %+d", app.brush.nextWinding);
    if (!app.sim.all_finite()) {
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "Field diverged, lower dt");
    }
}

static void draw_scene_io(AppState& app) {
    ImGui::InputText("File", app.scenePath, sizeof(app.scenePath));
    if (ImGui::Button("Save")) {
        io::Scene scene;
        io::from_simulation(app.sim, scene);
        scene.smooth_rendering = app.filter == ui::ScaleFilter::Bilinear;
        const bool ok = io::save_scene(app.scenePath, scene);
        app.toast.show((ok ? "Saved " : "Could not save ") + std::string(app.scenePath), 2.5f);
    }
    ImGui::SameLine();
    if (ImGui::Button("Load")) {
        io::Scene scene;
        if (!io::load_scene(app.scenePath, scene)) {
            app.toast.show("Could not load " + std::string(app.scenePath), 3.0f);
            return;
        }
        // The grid keeps the view size, so cellWidth/cellHeight follow the
        // scene's Nx/Ny inside resize.
        try {
            io::to_simulation(scene, app.sim);
        } catch (const std::exception& e) {
            app.toast.show("Could not apply " + std::string(app.scenePath) + ": " + e.what(), 4.0f);
            return;
        }
        app.filter = scene.smooth_rendering ? ui::ScaleFilter::Bilinear : ui::ScaleFilter::Nearest;
        sync_controls(app);
        app.toast.show("Loaded " + std::string(app.scenePath), 2.5f);
    }
}

static void draw_settings(AppState& app) {
    draw_run_controls(app);
    ImGui::Separator();

    ImGui::SliderInt("Speed", &app.sim.params.stepsPerFrame, 1, 20, "%d steps/frame");
    if (ImGui::SliderFloat("Temperature", &app.temperaturePct, 0.0f, 100.0f, "%.0f %%")) {
        app.sim.params.noiseLevel = app.temperaturePct / 100.0;
    }
    if (ImGui::SliderInt("Resolution", &app.resolutionLevel, 1, 5)) refit_grid(app);
    bool smooth = app.filter == ui::ScaleFilter::Bilinear;
    if (ImGui::Checkbox("Smooth rendering", &smooth)) {
        app.filter = smooth ? ui::ScaleFilter::Bilinear : ui::ScaleFilter::Nearest;
    }
    ImGui::Separator();

    if (ImGui::CollapsingHeader("Physics", ImGuiTreeNodeFlags_DefaultOpen)) draw_physics(app);
    if (ImGui::CollapsingHeader("Diagnostics", ImGuiTreeNodeFlags_DefaultOpen)) draw_diagnostics(app);
    if (ImGui::CollapsingHeader("Scene")) draw_scene_io(app);
}

static void handle_pointer(AppState& app, float localX, float localY, bool hovered) {
    if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        app.brush.press(app.sim, localX, localY);
    } else if (hovered && ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
        app.brush.drag(app.sim, localX, localY);
    }
    if (ImGui::IsMouseReleased(ImGuiMouseButton_Left)) app.brush.release();

    if (!hovered) return;
    const int i = std::clamp(static_cast<int>(localX / app.sim.cellWidth), 0, app.sim.Nx - 1);
    const int j = std::clamp(static_cast<int>(localY / app.sim.cellHeight), 0, app.sim.Ny - 1);
    const int k = app.sim.idx(i, j);
    const double u = app.sim.field.re[k];
    const double v = app.sim.field.im[k];
    ImGui::SetTooltip("cell (%d, %d)\n|psi| %.3f  phase %.3f rad", i, j, std::sqrt(u * u + v * v),
                      std::atan2(v, u));
}

static void draw_field_view(AppState& app) {
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const int w = std::max(1, static_cast<int>(avail.x));
    const int h = std::max(1, static_cast<int>(avail.y));
    if (w != app.viewW || h != app.viewH) {
        app.viewW = w;
        app.viewH = h;
        refit_grid(app);
    }

    upload_field(app);
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    ImGui::Image((void*)(intptr_t)app.tex.id, ImVec2(static_cast<float>(w), static_cast<float>(h)));

    const ImVec2 mouse = ImGui::GetIO().MousePos;
    handle_pointer(app, mouse.x - origin.x, mouse.y - origin.y, ImGui::IsItemHovered());

    if (ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) {
        if (ImGui::IsKeyPressed(ImGuiKey_Space)) app.sim.running = !app.sim.running;
        if (ImGui::IsKeyPressed(ImGuiKey_R)) app.sim.reset();
    }
}

static void draw_toast(Toast& toast) {
    if (toast.remaining <= 0.0f) return;
    const ImGuiIO& io = ImGui::GetIO();
    toast.remaining -= io.DeltaTime;
    ImGui::SetNextWindowBgAlpha(0.85f);
    ImGui::SetNextWindowPos(ImVec2(16.0f, io.DisplaySize.y - 24.0f), ImGuiCond_Always, ImVec2(0.0f, 1.0f));
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing |
                                   ImGuiWindowFlags_NoNav;
    if (ImGui::Begin("##toast", nullptr, flags)) ImGui::TextUnformatted(toast.text.c_str());
    ImGui::End();
}

// Returns the menu bar height.
static float draw_menu_bar(AppState& app, GLFWwindow* window) {
    if (!ImGui::BeginMainMenuBar()) return 0.0f;
    const float height = ImGui::GetWindowSize().y;

    if (ImGui::BeginMenu("File")) {
        if (ImGui::MenuItem("Screenshot", "Ctrl+S")) take_screenshot(app);
        ImGui::Separator();
        if (ImGui::MenuItem("Quit")) glfwSetWindowShouldClose(window, GLFW_TRUE);
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("Presets")) {
        struct Entry { const char* name; void (*load)(sim::Simulation&); };
        static const Entry entries[] = {
            {"Hot quench", ui::presets::load_hot_quench_scene},
            {"Single vortex", ui::presets::load_single_vortex_scene},
            {"Vortex dipole", ui::presets::load_vortex_dipole_scene},
            {"Vortex quadrupole", ui::presets::load_vortex_quadrupole_scene},
            {"Thermal bath", ui::presets::load_thermal_bath_scene},
        };
        for (const Entry& e : entries) {
            if (ImGui::MenuItem(e.name)) apply_preset(app, e.load, e.name);
        }
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("Theme")) {
        if (ImGui::MenuItem("Vortex")) StyleColorsVortex();
        if (ImGui::MenuItem("Dark")) ImGui::StyleColorsDark();
        if (ImGui::MenuItem("Light")) ImGui::StyleColorsLight();
        ImGui::EndMenu();
    }
    ImGui::EndMainMenuBar();
    return height;
}

static void draw_workspace(AppState& app, float top) {
    const ImGuiIO& io = ImGui::GetIO();
    ImGui::SetNextWindowPos(ImVec2(0.0f, top), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(io.DisplaySize.x, std::max(0.0f, io.DisplaySize.y - top)), ImGuiCond_Always);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoSavedSettings |
                                   ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoNavFocus;
    ImGui::Begin("##workspace", nullptr, flags);

    ImGui::BeginChild("Settings", ImVec2(330.0f, 0.0f), true);
    draw_settings(app);
    ImGui::EndChild();
    ImGui::SameLine();
    ImGui::BeginChild("Field", ImVec2(0.0f, 0.0f), true,
                      ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
    draw_field_view(app);
    ImGui::EndChild();

    ImGui::End();
}

static void present(GLFWwindow* window) {
    ImGui::Render();
    int fbW = 0, fbH = 0;
    glfwGetFramebufferSize(window, &fbW, &fbH);
    glViewport(0, 0, fbW, fbH);
    glClearColor(0.04f, 0.05f, 0.06f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

} // namespace

int run_gui(GLFWwindow* window) {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    StyleColorsVortex();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL2_Init();

    AppState app;
    ui::presets::load_hot_quench_scene(app.sim);

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();
        ImGui_ImplOpenGL2_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        // Physics for this tick runs before the field is drawn.
        app.sim.advance_frame();

        const float top = draw_menu_bar(app, window);
        const ImGuiIO& io = ImGui::GetIO();
        if ((io.KeyCtrl || io.KeySuper) && ImGui::IsKeyPressed(ImGuiKey_S)) take_screenshot(app);

        draw_workspace(app, top);
        draw_toast(app.toast);
        present(window);
    }

    if (app.tex.id) glDeleteTextures(1, &app.tex.id);
    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    return 0;
}

#endif // BUILD_GUI
