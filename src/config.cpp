#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "logger.hpp"

namespace {
std::vector<std::string> SplitList(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(), ::isspace), item.end());
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

bool ParseBool(const std::string& val) {
    return val == "1" || val == "true" || val == "TRUE";
}

void ApplyJsonConfig(SAppConfig& cfg, const nlohmann::json& j) {
    // Feed config
    if (j.contains("feed") && j["feed"].is_object()) {
        auto& feed = j["feed"];
        if (feed.contains("host") && feed["host"].is_string()) cfg.feed.host = feed["host"];
        if (feed.contains("port") && feed["port"].is_string()) cfg.feed.port = feed["port"];
        if (feed.contains("target") && feed["target"].is_string()) cfg.feed.target = feed["target"];
        if (feed.contains("handshake_timeout_sec") && feed["handshake_timeout_sec"].is_number_integer()) cfg.feed.handshake_timeout_sec = feed["handshake_timeout_sec"];
        if (feed.contains("idle_timeout_sec") && feed["idle_timeout_sec"].is_number_integer()) cfg.feed.idle_timeout_sec = feed["idle_timeout_sec"];
        if (feed.contains("instruments") && feed["instruments"].is_array()) {
            std::vector<std::string> instruments;
            for (const auto& i : feed["instruments"]) {
                if (i.is_string() && !i.get<std::string>().empty()) {
                    instruments.push_back(i.get<std::string>());
                }
            }
            if (!instruments.empty()) {
                cfg.feed.instruments = std::move(instruments);
            }
        }
    }

    // Retry config
    if (j.contains("retry") && j["retry"].is_object()) {
        auto& retry = j["retry"];
        if (retry.contains("backoff_ms") && retry["backoff_ms"].is_number_unsigned()) cfg.retry.backoff_ms = retry["backoff_ms"];
    }

    // Storage config
    if (j.contains("storage") && j["storage"].is_object()) {
        auto& storage = j["storage"];
        if (storage.contains("path") && storage["path"].is_string()) cfg.storage.path = storage["path"];
        if (storage.contains("key") && storage["key"].is_string()) cfg.storage.key = storage["key"];
    }

    if (j.contains("http") && j["http"].is_object()) {
        auto& http = j["http"];
        if (http.contains("timeout_sec") && http["timeout_sec"].is_number_integer()) cfg.http.timeout_sec = http["timeout_sec"];
    }

    // Log config
    if (j.contains("log") && j["log"].is_object()) {
        auto& log = j["log"];
        if (log.contains("filename") && log["filename"].is_string()) cfg.log.filename = log["filename"];
        if (log.contains("max_file_mb") && log["max_file_mb"].is_number_unsigned()) cfg.log.max_file_mb = log["max_file_mb"];
        if (log.contains("max_files") && log["max_files"].is_number_unsigned()) cfg.log.max_files = log["max_files"];
    }

    if (j.contains("ui") && j["ui"].is_object()) {
        auto& ui = j["ui"];
        if (ui.contains("console_commands") && ui["console_commands"].is_boolean()) cfg.ui.console_commands = ui["console_commands"];
    }
}

void ApplyCliOverrides(SAppConfig& cfg, int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            continue;
        }
        if (arg.rfind("--feed-host=", 0) == 0) {
            cfg.feed.host = arg.substr(12);
        } else if (arg.rfind("--feed-port=", 0) == 0) {
            cfg.feed.port = arg.substr(12);
        } else if (arg.rfind("--feed-target=", 0) == 0) {
            cfg.feed.target = arg.substr(14);
        } else if (arg.rfind("--feed-instruments=", 0) == 0) {
            cfg.feed.instruments = SplitList(arg.substr(19));
        } else if (arg.rfind("--retry-backoff-ms=", 0) == 0) {
            cfg.retry.backoff_ms = std::stoull(arg.substr(19));
        } else if (arg.rfind("--storage-path=", 0) == 0) {
            cfg.storage.path = arg.substr(15);
        } else if (arg.rfind("--http-timeout-sec=", 0) == 0) {
            cfg.http.timeout_sec = std::stoi(arg.substr(19));
        } else if (arg.rfind("--log-filename=", 0) == 0) {
            cfg.log.filename = arg.substr(15);
        } else if (arg.rfind("--console-commands=", 0) == 0) {
            cfg.ui.console_commands = ParseBool(arg.substr(19));
        }
    }
}
}

SAppConfig LoadConfig(int argc, char** argv) {
    std::string config_path = "config.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
            break;
        }
    }
    SAppConfig cfg;
    std::ifstream in(config_path);
    if (in) {
        try {
            nlohmann::json j;
            in >> j;
            ApplyJsonConfig(cfg, j);
        } catch (const std::exception& e) {
            Log(LogLevel::ERROR, "Config", "Failed to parse config file: " + std::string(e.what()));
        }
    }
    try {
        ApplyCliOverrides(cfg, argc, argv);
    } catch (const std::exception& e) {
        Log(LogLevel::ERROR, "Config", "Invalid CLI overrides: " + std::string(e.what()));
        throw;
    }
    if (cfg.log.filename.empty()) {
        cfg.log.filename = DefaultLogPath();
    }
    return cfg;
}

bool ValidateConfig(const SAppConfig& cfg) {
    if (cfg.feed.host.empty()) {
        Log(LogLevel::ERROR, "Config", "feed.host must not be empty.");
        return false;
    }
    if (cfg.feed.port.empty()) {
        Log(LogLevel::ERROR, "Config", "feed.port must not be empty.");
        return false;
    }
    if (cfg.feed.target.empty() || cfg.feed.target.front() != '/') {
        Log(LogLevel::ERROR, "Config", "feed.target must start with '/'.");
        return false;
    }
    if (cfg.feed.instruments.empty()) {
        Log(LogLevel::ERROR, "Config", "feed.instruments list is empty.");
        return false;
    }
    if (cfg.feed.handshake_timeout_sec <= 0) {
        Log(LogLevel::ERROR, "Config", "feed.handshake_timeout_sec must be > 0.");
        return false;
    }
    if (cfg.feed.idle_timeout_sec < 0) {  // 0 allowed to disable
        Log(LogLevel::ERROR, "Config", "feed.idle_timeout_sec must be >= 0.");
        return false;
    }
    if (cfg.retry.backoff_ms == 0) {
        Log(LogLevel::ERROR, "Config", "retry.backoff_ms must be > 0.");
        return false;
    }
    if (cfg.storage.path.empty()) {
        Log(LogLevel::ERROR, "Config", "storage.path is empty.");
        return false;
    }
    if (cfg.storage.key.empty()) {
        Log(LogLevel::ERROR, "Config", "storage.key is empty.");
        return false;
    }
    if (cfg.http.timeout_sec <= 0) {
        Log(LogLevel::ERROR, "Config", "http.timeout_sec must be > 0.");
        return false;
    }
    if (cfg.log.max_file_mb == 0) {
        Log(LogLevel::ERROR, "Config", "log.max_file_mb must be > 0.");
        return false;
    }
    if (cfg.log.max_files == 0) {
        Log(LogLevel::ERROR, "Config", "log.max_files must be > 0.");
        return false;
    }
    return true;
}

std::string BuildSubscriptionMessage(const std::vector<std::string>& instruments) {
    nlohmann::json msg;
    msg["action"] = "subscribe";
    msg["keys"] = instruments;
    return msg.dump();
}
