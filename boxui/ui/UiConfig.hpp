#pragma once

#include <string>
#include <vector>

#include <glm/vec4.hpp>

namespace boxui::ui
{
// Runtime tuning for one UiContext. Key, button and modifier values are GLFW codes;
// the constructor fills in the GLFW defaults.
struct UiConfig
{
    UiConfig();

    int assetVersion = 1;

    float dragThreshold = 4.0F;
    int dragButton = 0;
    bool rubberBandOnEmptySpace = true;
    bool blurOnEmptyClick = true;
    int additiveSelectionModifiers = 0;

    int focusNextKey = 0;
    std::vector<int> activateKeys;
    std::vector<int> confirmKeys;
    std::vector<int> cancelKeys;

    glm::vec4 modalOverlayColor{0.0F, 0.0F, 0.0F, 0.45F};
    bool logDiagnostics = true;
};

// Missing keys keep their current values.
[[nodiscard]] bool LoadUiConfigFromJson(const std::string& path, UiConfig& config, std::string* outError = nullptr);
[[nodiscard]] bool SaveUiConfigToJson(const std::string& path, const UiConfig& config, std::string* outError = nullptr);
} // namespace boxui::ui
