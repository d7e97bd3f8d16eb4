#pragma once

#if BUILD_GUI

struct GLFWwindow;

// Runs the interactive front-end until the window is closed.
int run_gui(GLFWwindow* window);

#endif
