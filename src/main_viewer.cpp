#include "ViewerApp.hpp"
#include "config.hpp"
#include "style.hpp"

#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <GLFW/glfw3.h>

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace
{
    void glfwErrorCallback(int error, const char* description)
    {
        spdlog::error("glfw error {}: {}", error, description);
    }
} // namespace

int main(int argc, char** argv)
{
    AppConfig cfg;
    std::string err;
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!apply_command_line(args, cfg, &err) || !apply_log_level(cfg.logLevel, &err))
    {
        spdlog::error("{}", err);
        return 2;
    }

    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit())
        return 1;

    const char* glslVersion = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1600, 900, "TaskLens", nullptr, nullptr);
    if (!window)
    {
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    SetupTaskLensStyle();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glslVersion);

    {
        ViewerApp app(cfg);
        if (!cfg.tracePath.empty())
            app.loadFiles(false);

        while (!glfwWindowShouldClose(window))
        {
            glfwPollEvents();
            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            app.drawUI();

            ImGui::Render();
            int w = 0, h = 0;
            glfwGetFramebufferSize(window, &w, &h);
            glViewport(0, 0, w, h);
            glClearColor(0.06f, 0.07f, 0.09f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            glfwSwapBuffers(window);
        }
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
