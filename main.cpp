/*
 * Serial Relay Gateway
 *
 * Architecture:
 * 1. Main Thread: Runs the Dear ImGui loop (local status display).
 * 2. GatewayLoop: One worker thread with a private Asio io_context.
 * - Discovery (every discovery_interval): sysfs enumeration -> DeviceMatcher
 *   -> ConnectionRegistry::Reconcile (Asio serial ports).
 * - Polling (every poll_interval): HttpCommandSource (Beast, kept-alive connection).
 * - Broadcast: BroadcastDispatcher writes "<command>\n" to every device,
 *   dropping only the devices whose write failed.
 * 3. Event Path (Worker -> UI):
 * - ZmqEventSink PUSHes status/log/stats events to "inproc://gateway_events".
 * - DashboardModel PULLs them on its aggregator thread; the UI only reads snapshots.
 */

#include <cstdio>
#include <exception>
#include <string>

#include <zmq.hpp>

#include "GatewayUI.h"
#include "GatewayLog.h"
#include "GatewayConfig.h"
#include "GatewayLoop.h"
#include "DeviceEnumerator.h"
#include "SerialConnection.h"
#include "CommandSourceClient.h"
#include "EventBus.h"

// =================================================================================
//
// Main Function
//
// =================================================================================

static void glfw_error_callback(int error, const char* description) {
    fprintf(stderr, "Glfw Error %d: %s\n", error, description);
    AddLog(std::string("Glfw Error: ") + description, LogType::FAILURE);
}

int main(int argc, char** argv) {
    // --- 1. Configuration ---
    GatewayConfig config;
    try {
        const std::string config_path = (argc > 1) ? argv[1] : "gateway_config.json";
        config = LoadConfig(config_path);
        ApplyEnvironmentOverrides(config);
        ValidateConfig(config);
    }
    catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 2;
    }
    InitErrorLog(config.error_log_file);

    // --- 2. Setup GLFW ---
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
        return 1;

    // --- 3. Setup Window + OpenGL + GLEW ---
    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

    GLFWwindow* window = glfwCreateWindow(640, 720, "Serial Relay Gateway", NULL, NULL);
    if (window == NULL) {
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // Enable vsync

    if (glewInit() != GLEW_OK) {
        fprintf(stderr, "Failed to initialize GLEW\n");
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // --- 4. Setup Dear ImGui ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO(); (void)io;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    // --- 5. Start the Gateway ---
    int exit_code = 0;
    try {
        zmq::context_t zmq_context(1);
        DashboardModel dashboard(zmq_context);
        dashboard.Start();

        ZmqEventSink sink(zmq_context);
        SysfsDeviceEnumerator enumerator;
        AsioSerialPortFactory port_factory(config.serial_read_timeout, config.serial_write_timeout);
        HttpCommandSource command_source(config.api_url, config.request_timeout);

        CancellationToken stop_token;
        GatewayLoop gateway(config, stop_token, enumerator, port_factory, command_source, sink);
        gateway.Start();

        // --- 6. Main Render Loop ---
        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            if (DrawGatewayUI(dashboard, config)) { // Render our UI
                glfwSetWindowShouldClose(window, GLFW_TRUE);
            }

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.96f, 0.97f, 0.98f, 1.00f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        // --- 7. Stop the Gateway ---
        stop_token.Cancel();
        gateway.Stop();
        dashboard.Stop();
    }
    catch (const std::exception& e) {
        LogError("STARTUP", e.what());
        exit_code = 1;
    }

    // --- 8. Cleanup ---
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();

    return exit_code;
}
