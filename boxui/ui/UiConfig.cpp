#include "boxui/ui/UiConfig.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

namespace boxui::ui
{
using json = nlohmann::json;

namespace
{
void ReadKeyList(const json& root, const char* key, std::vector<int>& out)
{
    if (!root.contains(key) || !root[key].is_array())
    {
        return;
    }
    std::vector<int> keys;
    for (const json& value : root[key])
    {
        if (value.is_number_integer())
        {
            keys.push_back(value.get<int>());
        }
    }
    out = std::move(keys);
}
} // namespace

UiConfig::UiConfig()
    : dragButton(GLFW_MOUSE_BUTTON_LEFT)
    , additiveSelectionModifiers(GLFW_MOD_SHIFT)
    , focusNextKey(GLFW_KEY_TAB)
    , activateKeys{GLFW_KEY_ENTER, GLFW_KEY_SPACE}
    , confirmKeys{GLFW_KEY_ENTER, GLFW_KEY_KP_ENTER}
    , cancelKeys{GLFW_KEY_ESCAPE}
{
}

bool LoadUiConfigFromJson(const std::string& path, UiConfig& config, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot open ui config file: " + path;
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid ui config JSON: "} + ex.what();
        }
        return false;
    }

    if (!root.is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Ui config root must be an object";
        }
        return false;
    }

    UiConfig loaded = config;
    if (root.contains("asset_version") && root["asset_version"].is_number_integer())
    {
        loaded.assetVersion = root["asset_version"].get<int>();
    }
    if (root.contains("drag_threshold") && root["drag_threshold"].is_number())
    {
        loaded.dragThreshold = std::max(0.0F, root["drag_threshold"].get<float>());
    }
    if (root.contains("drag_button") && root["drag_button"].is_number_integer())
    {
        loaded.dragButton = root["drag_button"].get<int>();
    }
    if (root.contains("rubber_band_on_empty_space") && root["rubber_band_on_empty_space"].is_boolean())
    {
        loaded.rubberBandOnEmptySpace = root["rubber_band_on_empty_space"].get<bool>();
    }
    if (root.contains("blur_on_empty_click") && root["blur_on_empty_click"].is_boolean())
    {
        loaded.blurOnEmptyClick = root["blur_on_empty_click"].get<bool>();
    }
    if (root.contains("additive_selection_modifiers") && root["additive_selection_modifiers"].is_number_integer())
    {
        loaded.additiveSelectionModifiers = root["additive_selection_modifiers"].get<int>();
    }
    if (root.contains("focus_next_key") && root["focus_next_key"].is_number_integer())
    {
        loaded.focusNextKey = root["focus_next_key"].get<int>();
    }
    ReadKeyList(root, "activate_keys", loaded.activateKeys);
    ReadKeyList(root, "confirm_keys", loaded.confirmKeys);
    ReadKeyList(root, "cancel_keys", loaded.cancelKeys);
    if (root.contains("modal_overlay_color") && root["modal_overlay_color"].is_array() && root["modal_overlay_color"].size() == 4)
    {
        const json& color = root["modal_overlay_color"];
        for (std::size_t i = 0; i < 4; ++i)
        {
            if (color[i].is_number())
            {
                loaded.modalOverlayColor[static_cast<int>(i)] = color[i].get<float>();
            }
        }
    }
    if (root.contains("log_diagnostics") && root["log_diagnostics"].is_boolean())
    {
        loaded.logDiagnostics = root["log_diagnostics"].get<bool>();
    }

    config = std::move(loaded);
    return true;
}

bool SaveUiConfigToJson(const std::string& path, const UiConfig& config, std::string* outError)
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    json root;
    root["asset_version"] = config.assetVersion;
    root["drag_threshold"] = config.dragThreshold;
    root["drag_button"] = config.dragButton;
    root["rubber_band_on_empty_space"] = config.rubberBandOnEmptySpace;
    root["blur_on_empty_click"] = config.blurOnEmptyClick;
    root["additive_selection_modifiers"] = config.additiveSelectionModifiers;
    root["focus_next_key"] = config.focusNextKey;
    root["activate_keys"] = config.activateKeys;
    root["confirm_keys"] = config.confirmKeys;
    root["cancel_keys"] = config.cancelKeys;
    root["modal_overlay_color"] = {
        config.modalOverlayColor.r,
        config.modalOverlayColor.g,
        config.modalOverlayColor.b,
        config.modalOverlayColor.a,
    };
    root["log_diagnostics"] = config.logDiagnostics;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write ui config file: " + path;
        }
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}
} // namespace boxui::ui
