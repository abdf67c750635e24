#include <gtest/gtest.h>
#include "settings.hpp"

TEST(SettingsTest, Defaults) {
    SSettings s = DefaultSettings();
    EXPECT_TRUE(s.show_xau);
    EXPECT_TRUE(s.show_ms);
    EXPECT_TRUE(s.show_gh);
    EXPECT_TRUE(s.show_zs);
    EXPECT_EQ(s.bg_color, "#2c3e50");
}

TEST(SettingsTest, JsonLayout) {
    SSettings s;
    s.show_gh = false;
    s.bg_color = "#000000";
    auto j = s.ToJson();
    EXPECT_EQ(j["show_xau"], true);
    EXPECT_EQ(j["show_gh"], false);
    EXPECT_EQ(j["bg_color"], "#000000");
    EXPECT_EQ(SSettings::FromJson(j), s);
}

TEST(SettingsTest, FromJsonIgnoresExtraKeys) {
    auto j = DefaultSettings().ToJson();
    j["theme"] = "dark";
    EXPECT_EQ(SSettings::FromJson(j), DefaultSettings());
}

TEST(SettingsTest, FromJsonMissingFieldThrows) {
    auto j = DefaultSettings().ToJson();
    j.erase("show_zs");
    EXPECT_THROW(SSettings::FromJson(j), nlohmann::json::exception);
}

TEST(SettingsTest, FromJsonWrongTypeThrows) {
    auto j = DefaultSettings().ToJson();
    j["show_ms"] = "yes";
    EXPECT_THROW(SSettings::FromJson(j), nlohmann::json::exception);
    EXPECT_THROW(SSettings::FromJson(nlohmann::json::array()), nlohmann::json::exception);
}

TEST(SettingsTest, ParsePlatform) {
    EXPECT_TRUE(ParsePlatform("xau") == EPlatform::XAU);
    EXPECT_TRUE(ParsePlatform("ms") == EPlatform::MS);
    EXPECT_TRUE(ParsePlatform("gh") == EPlatform::GH);
    EXPECT_TRUE(ParsePlatform("zs") == EPlatform::ZS);
    EXPECT_FALSE(ParsePlatform("XAU").has_value());
    EXPECT_FALSE(ParsePlatform("unknown").has_value());
}

TEST(SettingsTest, FlagAccess) {
    SSettings s;
    s.Flag(EPlatform::ZS) = false;
    EXPECT_FALSE(s.show_zs);
    EXPECT_TRUE(s.Flag(EPlatform::XAU));
}
