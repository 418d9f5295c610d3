#pragma once

// Centralized ImGui includes for the flowart viewer.

#include <imgui.h>

// ---- flowart ImGui extensions ----

namespace ImGui {

// Dear ImGui doesn't provide a SliderDouble() helper, but every Configuration
// knob is a double.
//
// Compatibility: older ImGui versions used a `power` parameter instead of
// ImGuiSliderFlags (the change landed around v1.78).
#if defined(IMGUI_VERSION_NUM) && (IMGUI_VERSION_NUM >= 17800)
inline bool SliderDouble(const char* label, double* v, double v_min, double v_max, const char* format = "%.3f",
                         ImGuiSliderFlags flags = 0) {
  return SliderScalar(label, ImGuiDataType_Double, v, &v_min, &v_max, format, flags);
}
#else
inline bool SliderDouble(const char* label, double* v, double v_min, double v_max, const char* format = "%.3f",
                         float power = 1.0f) {
  return SliderScalar(label, ImGuiDataType_Double, v, &v_min, &v_max, format, power);
}
#endif

}  // namespace ImGui
