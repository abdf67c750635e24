#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

enum class EPlatform { XAU, MS, GH, ZS };

std::optional<EPlatform> ParsePlatform(std::string_view id);

struct SSettings {
    bool show_xau = true;
    bool show_ms = true;
    bool show_gh = true;
    bool show_zs = true;
    std::string bg_color = "#2c3e50";

    bool& Flag(EPlatform platform);
    bool Flag(EPlatform platform) const;

    nlohmann::json ToJson() const;
    // Throws nlohmann::json::exception unless all five fields are present and well typed.
    static SSettings FromJson(const nlohmann::json& j);

    bool operator==(const SSettings& other) const;
    bool operator!=(const SSettings& other) const { return !(*this == other); }
};

SSettings DefaultSettings();
