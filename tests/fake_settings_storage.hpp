#pragma once

#include "errors.hpp"
#include "settings_storage.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>

// In-memory ISettingsStorage with switchable save failures.
class CFakeSettingsStorage : public ISettingsStorage {
public:
    std::optional<nlohmann::json> Get(const std::string& key) const override {
        std::optional<nlohmann::json> value;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_values.find(key);
            if (it != m_values.end()) {
                value = it->second;
            }
        }
        // Delays the caller after the lookup, as a slow read would.
        if (get_delay.count() > 0) {
            std::this_thread::sleep_for(get_delay);
        }
        return value;
    }

    void Set(const std::string& key, nlohmann::json value) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values[key] = std::move(value);
    }

    void Save() override {
        if (save_delay.count() > 0) {
            std::this_thread::sleep_for(save_delay);
        }
        if (fail_save.load()) {
            throw CTickerError(EErrorCode::PersistenceError, "disk full");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_saved = m_values;
        ++save_count;
    }

    std::optional<nlohmann::json> Saved(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_saved.find(key);
        if (it == m_saved.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::atomic<bool> fail_save{false};
    std::atomic<int> save_count{0};
    std::chrono::milliseconds save_delay{0};
    std::chrono::milliseconds get_delay{0};

private:
    mutable std::mutex m_mutex;
    std::map<std::string, nlohmann::json> m_values;
    std::map<std::string, nlohmann::json> m_saved;
};
