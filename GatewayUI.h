// GatewayUI.h
#pragma once
// --- Dear ImGui Includes ---
#include <GL/glew.h>
#include <GL/gl.h>
#include <GLFW/glfw3.h>
#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

class DashboardModel; // Forward declaration
struct GatewayConfig;

// Renders one frame. Returns true once the operator confirmed "Shut Down Gateway".
bool DrawGatewayUI(DashboardModel& model, const GatewayConfig& config);
