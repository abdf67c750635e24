#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct SFeedConfig {
    std::string host = "quote.goldfeed.cn";
    std::string port = "443";
    std::string target = "/ws";
    std::vector<std::string> instruments{"XAUUSD", "MS_AU", "ICBC_AU", "CZB_AU"};
    int handshake_timeout_sec = 10;
    int idle_timeout_sec = 30;
};

struct SRetryConfig {
    uint64_t backoff_ms = 3000;
};

struct SStorageConfig {
    std::string path = "settings.json";
    std::string key = "settings";
};

struct SHttpConfig {
    int timeout_sec = 15;
};

struct SLogConfig {
    std::string filename;  // empty: temp directory default
    uint64_t max_file_mb = 5;
    uint64_t max_files = 3;
};

struct SUiConfig {
    bool console_commands = true;
};

struct SAppConfig {
    SFeedConfig feed;
    SRetryConfig retry;
    SStorageConfig storage;
    SHttpConfig http;
    SLogConfig log;
    SUiConfig ui;
};

SAppConfig LoadConfig(int argc, char** argv);
bool ValidateConfig(const SAppConfig& cfg);
std::string BuildSubscriptionMessage(const std::vector<std::string>& instruments);
