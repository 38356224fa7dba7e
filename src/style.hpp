#pragma once
#include <imgui.h>

// Call this once after ImGui::CreateContext() and before your first frame.
inline void SetupTaskLensStyle()
{
    ImGui::StyleColorsDark();
    ImGuiStyle& s = ImGui::GetStyle();
    s.WindowRounding = 6.0f;
    s.FrameRounding  = 4.0f;
    s.ChildRounding  = 6.0f;
    s.ScrollbarRounding = 6.0f;
    s.GrabRounding = 4.0f;
    s.PopupRounding = 6.0f;
    s.TabRounding = 6.0f;

    s.FramePadding = ImVec2(8, 6);
    s.ItemSpacing  = ImVec2(8, 6);
    s.WindowPadding= ImVec2(12, 10);
    s.CellPadding  = ImVec2(6, 4);

    s.WindowBorderSize = 1.0f;
    s.FrameBorderSize  = 0.0f;
    s.PopupBorderSize  = 1.0f;

    // dark slate, long-task red as the accent
    ImVec4* c = s.Colors;
    c[ImGuiCol_Text]           = ImVec4(0.90f, 0.92f, 0.94f, 1.00f);
    c[ImGuiCol_TextDisabled]   = ImVec4(0.52f, 0.57f, 0.62f, 1.00f);
    c[ImGuiCol_WindowBg]       = ImVec4(0.08f, 0.09f, 0.11f, 1.00f);
    c[ImGuiCol_ChildBg]        = ImVec4(0.07f, 0.08f, 0.10f, 0.70f);
    c[ImGuiCol_PopupBg]        = ImVec4(0.10f, 0.11f, 0.14f, 0.98f);
    c[ImGuiCol_Border]         = ImVec4(0.18f, 0.20f, 0.24f, 0.60f);
    c[ImGuiCol_FrameBg]        = ImVec4(0.13f, 0.15f, 0.18f, 0.85f);
    c[ImGuiCol_FrameBgHovered] = ImVec4(0.18f, 0.20f, 0.24f, 0.85f);
    c[ImGuiCol_FrameBgActive]  = ImVec4(0.21f, 0.23f, 0.28f, 0.90f);
    c[ImGuiCol_TitleBg]        = ImVec4(0.06f, 0.07f, 0.09f, 1.00f);
    c[ImGuiCol_TitleBgActive]  = ImVec4(0.11f, 0.12f, 0.15f, 1.00f);
    c[ImGuiCol_CheckMark]      = ImVec4(0.93f, 0.33f, 0.31f, 1.00f);
    c[ImGuiCol_SliderGrab]     = ImVec4(0.93f, 0.33f, 0.31f, 1.00f);
    c[ImGuiCol_SliderGrabActive]=ImVec4(0.98f, 0.45f, 0.42f, 1.00f);
    c[ImGuiCol_Button]         = ImVec4(0.19f, 0.21f, 0.26f, 1.00f);
    c[ImGuiCol_ButtonHovered]  = ImVec4(0.25f, 0.27f, 0.33f, 1.00f);
    c[ImGuiCol_ButtonActive]   = ImVec4(0.30f, 0.32f, 0.39f, 1.00f);
    c[ImGuiCol_Header]         = ImVec4(0.55f, 0.20f, 0.20f, 0.55f);
    c[ImGuiCol_HeaderHovered]  = ImVec4(0.65f, 0.25f, 0.25f, 0.70f);
    c[ImGuiCol_HeaderActive]   = ImVec4(0.72f, 0.28f, 0.28f, 0.85f);
    c[ImGuiCol_TableHeaderBg]  = ImVec4(0.12f, 0.13f, 0.16f, 1.00f);
    c[ImGuiCol_TableRowBg]     = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);
    c[ImGuiCol_TableRowBgAlt]  = ImVec4(1.00f, 1.00f, 1.00f, 0.03f);
}
