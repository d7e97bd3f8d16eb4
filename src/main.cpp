// GinzburgLandau2D entry point.
//   no arguments      interactive vortex playground (ImGui + GLFW + OpenGL2)
//   --example [path]  run a scene file headless and print diagnostics

#include <exception>
#include <iostream>
#include <string>

#include "io/scene.hpp"

#if BUILD_GUI
#include <GLFW/glfw3.h>
#include "ui/gui.hpp"
#endif

namespace {

const char* const kDefaultExample = "examples/smoke_example.json";

struct CliOptions {
    bool help{false};
    bool headless{false};
    std::string scenePath;
};

void print_usage(std::ostream& os) {
    os << "GinzburgLandau2D\n"
       << "Usage:\n"
       << "  GinzburgLandau2D                   open the interactive view\n"
       << "  GinzburgLandau2D --example [path]  run a scene headless (default " << kDefaultExample << ")\n"
       << "  GinzburgLandau2D -h | --help       show this text\n";
}

// Returns false on an unrecognised argument.
bool parse_args(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--example") {
            opts.headless = true;
            const bool hasPath = i + 1 < argc && argv[i + 1][0] != '-';
            opts.scenePath = hasPath ? argv[++i] : kDefaultExample;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

#if BUILD_GUI
int launch_gui() {
    if (!glfwInit()) {
        std::cerr << "GLFW initialisation failed; use --example to run headless.\n";
        return 1;
    }
    // The ImGui OpenGL2 backend needs a legacy context.
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_MAXIMIZED, GLFW_TRUE);
    GLFWwindow* window = glfwCreateWindow(1280, 800, "GinzburgLandau2D", nullptr, nullptr);
    if (!window) {
        std::cerr << "Could not create a window.\n";
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    const int rc = run_gui(window);
    glfwDestroyWindow(window);
    glfwTerminate();
    return rc;
}
#endif

int run(int argc, char** argv) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(std::cerr);
        return 1;
    }
    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }
    if (opts.headless) return io::run_example_cli(opts.scenePath);

#if BUILD_GUI
    return launch_gui();
#else
    std::cerr << "Built without the GUI; use --example to run a scene headless.\n";
    print_usage(std::cerr);
    return 1;
#endif
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Unrepresentable grid sizes from a scene file end up here.
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
