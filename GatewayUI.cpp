#include "GatewayUI.h"
#include "EventBus.h"
#include "GatewayConfig.h"
#include "GatewayLog.h"

#include <string>
#include <vector>

// =================================================================================
//
// Dear ImGui UI Rendering
//
// =================================================================================

namespace {

ImVec4 ToImColor(StatusColor color) {
    switch (color) {
    case StatusColor::SUCCESS: return ImVec4(0.153f, 0.682f, 0.376f, 1.0f); // #27ae60
    case StatusColor::WARNING: return ImVec4(0.953f, 0.612f, 0.071f, 1.0f); // #f39c12
    case StatusColor::ERROR:   return ImVec4(0.906f, 0.298f, 0.235f, 1.0f); // #e74c3c
    }
    return ImVec4(1, 1, 1, 1);
}

void DrawStatusRow(const char* label, const DashboardSnapshot& snapshot, const char* key) {
    StatusEntry entry;
    auto it = snapshot.statuses.find(key);
    if (it != snapshot.statuses.end()) entry = it->second;

    ImGui::TableNextRow();
    ImGui::TableSetColumnIndex(0);
    ImGui::TextUnformatted(label);
    ImGui::TableSetColumnIndex(1);

    // Indicator dot
    ImVec2 pos = ImGui::GetCursorScreenPos();
    float radius = ImGui::GetTextLineHeight() * 0.3f;
    ImGui::GetWindowDrawList()->AddCircleFilled(
        ImVec2(pos.x + radius, pos.y + ImGui::GetTextLineHeight() * 0.5f), radius,
        ImGui::ColorConvertFloat4ToU32(ToImColor(entry.color)));
    ImGui::Dummy(ImVec2(radius * 2.0f + 6.0f, ImGui::GetTextLineHeight()));
    ImGui::SameLine();
    ImGui::TextColored(ToImColor(entry.color), "%s", entry.value.c_str());
}

void DrawStatBox(const char* label, unsigned long long value) {
    ImGui::BeginGroup();
    ImGui::SetWindowFontScale(1.6f);
    ImGui::Text("%llu", value);
    ImGui::SetWindowFontScale(1.0f);
    ImGui::TextDisabled("%s", label);
    ImGui::EndGroup();
}

// `sequence` counts lines ever appended, so capped logs still scroll on new lines
void DrawLogLines(const char* child_id, const std::vector<std::string>& lines, uint64_t sequence, uint64_t& last_sequence) {
    bool scroll_to_bottom = (sequence != last_sequence);
    last_sequence = sequence;
    ImGui::BeginChild(child_id, ImVec2(0, 0), false, ImGuiWindowFlags_HorizontalScrollbar);
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(4, 1));
    for (const auto& line : lines) {
        ImGui::TextUnformatted(line.c_str());
    }
    if (scroll_to_bottom) {
        ImGui::SetScrollHereY(1.0f);
    }
    ImGui::PopStyleVar();
    ImGui::EndChild();
}

} // namespace

bool DrawGatewayUI(DashboardModel& model, const GatewayConfig& config) {
    bool exit_confirmed = false;
    const DashboardSnapshot snapshot = model.GetSnapshot();

    ImGui::SetNextWindowSize(ImVec2(600, 650), ImGuiCond_FirstUseEver);
    ImGui::Begin("Serial Relay Gateway");

    ImGui::Text("Command source: %s", config.api_url.c_str());
    ImGui::SameLine();
    float button_width = ImGui::CalcTextSize("Shut Down Gateway").x + ImGui::GetStyle().FramePadding.x * 2;
    float right_edge = ImGui::GetWindowContentRegionMax().x;
    ImGui::SetCursorPosX(right_edge - button_width);
    if (ImGui::Button("Shut Down Gateway")) {
        ImGui::OpenPopup("Exit Confirmation");
    }
    if (ImGui::BeginPopupModal("Exit Confirmation", NULL, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Stop relaying commands and close every device?");
        ImGui::Separator();
        if (ImGui::Button("Yes", ImVec2(120, 0))) {
            exit_confirmed = true;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("No", ImVec2(120, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
    ImGui::Separator();

    // --- System Status ---
    ImGui::SeparatorText("System Status");
    if (ImGui::BeginTable("StatusTable", 2)) {
        ImGui::TableSetupColumn("Component", ImGuiTableColumnFlags_WidthFixed, 160.0f);
        ImGui::TableSetupColumn("State");
        DrawStatusRow("Gateway Engine:", snapshot, kStatusGateway);
        DrawStatusRow("Serial Devices:", snapshot, kStatusSerial);
        DrawStatusRow("API Connection:", snapshot, kStatusApi);
        ImGui::EndTable();
    }

    // --- Statistics ---
    ImGui::SeparatorText("Statistics");
    if (ImGui::BeginTable("StatsTable", 3)) {
        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        DrawStatBox("Commands Sent", snapshot.stats.commands_sent);
        ImGui::TableSetColumnIndex(1);
        DrawStatBox("System Errors", snapshot.stats.errors);
        ImGui::TableSetColumnIndex(2);
        DrawStatBox("Active Devices", snapshot.stats.device_count);
        ImGui::EndTable();
    }

    if (ImGui::BeginTabBar("MainTabs")) {
        // --- Tab 1: Activity Log ---
        if (ImGui::BeginTabItem("Activity Log")) {
            if (ImGui::Button("Clear Log")) {
                model.ClearActivityLog();
            }
            static uint64_t last_activity_sequence = 0;
            DrawLogLines("ActivityScroll", snapshot.activity_log, snapshot.activity_log_sequence, last_activity_sequence);
            ImGui::EndTabItem();
        }

        // --- Tab 2: Diagnostics ---
        if (ImGui::BeginTabItem("Diagnostics")) {
            if (ImGui::Button("Clear Diagnostics")) {
                ClearLogs();
            }
            ImGui::SameLine();
            ImGui::TextDisabled("Errors are also written to %s", config.error_log_file.c_str());
            static std::vector<std::string> logs;
            static uint64_t last_log_sequence = 0;
            const uint64_t log_sequence = GetLogs(logs);
            DrawLogLines("DiagnosticsScroll", logs, log_sequence, last_log_sequence);
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }

    ImGui::End();
    return exit_confirmed;
}
