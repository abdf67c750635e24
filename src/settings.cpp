#include "settings.hpp"

std::optional<EPlatform> ParsePlatform(std::string_view id) {
    if (id == "xau") return EPlatform::XAU;
    if (id == "ms") return EPlatform::MS;
    if (id == "gh") return EPlatform::GH;
    if (id == "zs") return EPlatform::ZS;
    return std::nullopt;
}

bool& SSettings::Flag(EPlatform platform) {
    switch (platform) {
    case EPlatform::XAU:
        return show_xau;
    case EPlatform::MS:
        return show_ms;
    case EPlatform::GH:
        return show_gh;
    case EPlatform::ZS:
        break;
    }
    return show_zs;
}

bool SSettings::Flag(EPlatform platform) const {
    return const_cast<SSettings*>(this)->Flag(platform);
}

nlohmann::json SSettings::ToJson() const {
    return nlohmann::json{
        {"show_xau", show_xau},
        {"show_ms", show_ms},
        {"show_gh", show_gh},
        {"show_zs", show_zs},
        {"bg_color", bg_color}
    };
}

SSettings SSettings::FromJson(const nlohmann::json& j) {
    SSettings s;
    s.show_xau = j.at("show_xau").get<bool>();
    s.show_ms = j.at("show_ms").get<bool>();
    s.show_gh = j.at("show_gh").get<bool>();
    s.show_zs = j.at("show_zs").get<bool>();
    s.bg_color = j.at("bg_color").get<std::string>();
    return s;
}

bool SSettings::operator==(const SSettings& other) const {
    return show_xau == other.show_xau && show_ms == other.show_ms &&
           show_gh == other.show_gh && show_zs == other.show_zs &&
           bg_color == other.bg_color;
}

SSettings DefaultSettings() {
    return SSettings{};
}
