#include "solo/gui.hpp"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"
#include "imgui.h"
#include "solo/confirm.hpp"
#include "solo/logger.hpp"
#include "solo/signals.hpp"
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>

namespace solo {

static void glfw_error_callback(int error, const char *description) {
  if (error == 65548)
    return;
  LOG_ERROR("GLFW Error " + std::to_string(error) + ": " +
            std::string(description));
}

static const char *headline(Classification c) {
  switch (c) {
  case Classification::LiveSameBuild:
    return "Already running";
  case Classification::LiveDifferentBuild:
    return "Another build is running";
  default:
    return "Instance conflict";
  }
}

GuiConfirmer::~GuiConfirmer() { shutdown(); }

bool GuiConfirmer::init(int width, int height, const std::string &title) {
  glfwSetErrorCallback(glfw_error_callback);
  if (!glfwInit()) {
    LOG_ERROR("Failed to initialize GLFW");
    return false;
  }

  const char *glsl_version = "#version 130";
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
  glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
  glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER,
                 GLFW_FALSE); // Prevent invisible window on Xwayland
  glfwWindowHint(GLFW_DOUBLEBUFFER, GLFW_TRUE);
  glfwWindowHint(GLFW_FLOATING, GLFW_TRUE);
  glfwWindowHint(GLFW_FOCUS_ON_SHOW, GLFW_TRUE);

  GLFWwindow *window =
      glfwCreateWindow(width, height, title.c_str(), NULL, NULL);
  if (window == nullptr) {
    LOG_ERROR("Failed to create GLFW window");
    glfwTerminate();
    return false;
  }

  glfwSetWindowSizeLimits(window, width, height, width, height);
  glfwMakeContextCurrent(window);
  glfwSwapInterval(0); // vsync blocks on Xwayland
  glfwShowWindow(window);
  glfwFocusWindow(window);

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = nullptr;

  ImGui::StyleColorsDark();
  ImGuiStyle &style = ImGui::GetStyle();
  style.WindowRounding = 10.0f;
  style.FrameRounding = 6.0f;
  style.PopupRounding = 6.0f;
  style.WindowPadding = ImVec2(16, 16);
  style.FramePadding = ImVec2(12, 6);
  style.ItemSpacing = ImVec2(10, 8);

  ImVec4 *colors = style.Colors;
  colors[ImGuiCol_WindowBg] = ImVec4(0.02f, 0.02f, 0.02f, 1.00f);
  colors[ImGuiCol_Border] = ImVec4(0.20f, 0.20f, 0.20f, 0.50f);
  colors[ImGuiCol_Button] = ImVec4(0.86f, 0.08f, 0.24f, 1.00f);
  colors[ImGuiCol_ButtonHovered] = ImVec4(0.96f, 0.18f, 0.34f, 1.00f);
  colors[ImGuiCol_ButtonActive] = ImVec4(0.76f, 0.02f, 0.18f, 1.00f);
  colors[ImGuiCol_PlotHistogram] = ImVec4(0.86f, 0.08f, 0.24f, 1.00f);

  ImGui_ImplGlfw_InitForOpenGL(window, true);
  ImGui_ImplOpenGL3_Init(glsl_version);

  window_ = window;
  initialized_ = true;
  return true;
}

void GuiConfirmer::shutdown() {
  if (!initialized_)
    return;

  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  if (window_) {
    glfwDestroyWindow((GLFWwindow *)window_);
    window_ = nullptr;
  }
  glfwTerminate();
  initialized_ = false;
}

std::optional<Choice>
GuiConfirmer::confirm(const ConfirmRequest &request,
                      std::chrono::milliseconds timeout) {
  if (!init(520, 260, "Solo")) {
    if (terminalFallback_) {
      LOG_WARN("No usable display, asking on the terminal instead");
      TerminalConfirmer terminal;
      return terminal.confirm(request, timeout);
    }
    return std::nullopt;
  }

  GLFWwindow *window = (GLFWwindow *)window_;
  const auto start = std::chrono::steady_clock::now();
  const std::string details = formatRequest(request);
  std::optional<Choice> answer;
  bool timedOut = false;

  while (!answer && !timedOut) {
    if (glfwWindowShouldClose(window) || ShutdownSignal::requested()) {
      answer = Choice::Abort;
      break;
    }

    glfwWaitEventsTimeout(0.1);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (elapsed >= timeout) {
      timedOut = true;
      break;
    }
    float remaining = (float)(timeout - elapsed).count() / 1000.0f;

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const ImGuiViewport *viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    ImGuiWindowFlags windowFlags =
        ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoSavedSettings;
    ImGui::Begin("Solo_Conflict", nullptr, windowFlags);

    ImGui::Text("%s", headline(request.classification));
    ImGui::Separator();
    ImGui::TextWrapped("%s", details.c_str());
    ImGui::Spacing();

    float fraction = std::clamp(
        remaining / std::max(1.0f, (float)timeout.count() / 1000.0f), 0.0f,
        1.0f);
    std::string overlay = "Keeping the running instance in " +
                          std::to_string((int)std::ceil(remaining)) + "s";
    ImGui::ProgressBar(fraction, ImVec2(-1, 0), overlay.c_str());
    ImGui::Spacing();

    if (ImGui::Button("Replace"))
      answer = Choice::Replace;
    ImGui::SameLine();
    if (ImGui::Button("Keep Existing"))
      answer = Choice::KeepExisting;
    ImGui::SameLine();
    if (ImGui::Button("Cancel Launch"))
      answer = Choice::Abort;

    ImGui::End();
    ImGui::PopStyleVar();

    ImGui::Render();
    int fb_width, fb_height;
    glfwGetFramebufferSize(window, &fb_width, &fb_height);
    glViewport(0, 0, fb_width, fb_height);
    glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
  }

  shutdown();

  if (timedOut)
    return std::nullopt;
  return answer;
}

} // namespace solo
