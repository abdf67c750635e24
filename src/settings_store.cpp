#include "settings_store.hpp"

#include <system_error>

#include "errors.hpp"
#include "logger.hpp"

CSettingsStore::CSettingsStore(std::shared_ptr<ISettingsStorage> storage,
                               std::shared_ptr<CEventBroadcaster> broadcaster,
                               std::string key)
    : m_storage(std::move(storage)),
      m_broadcaster(std::move(broadcaster)),
      m_key(std::move(key)),
      m_value(DefaultSettings()) {}

void CSettingsStore::Load() {
    auto writer = AcquireWriter("load");
    SSettings loaded = DefaultSettings();
    if (!m_storage) {
        Log(LogLevel::ERROR, "Settings", "No storage available, using defaults.");
    } else if (auto value = m_storage->Get(m_key)) {
        try {
            loaded = SSettings::FromJson(*value);
        } catch (const nlohmann::json::exception& e) {
            Log(LogLevel::ERROR, "Settings", "Decode failed, using defaults: " + std::string(e.what()));
        }
    }

    std::lock_guard<std::mutex> lock(m_value_mutex);
    m_value = loaded;
}

SSettings CSettingsStore::Get() const {
    std::lock_guard<std::mutex> lock(m_value_mutex);
    return m_value;
}

void CSettingsStore::Replace(const SSettings& settings) {
    auto writer = AcquireWriter("replace");
    ReplaceLocked(settings);
}

template <typename Mutate>
SSettings CSettingsStore::Update(std::string_view operation, Mutate&& mutate) {
    auto writer = AcquireWriter(operation);
    SSettings next = Get();
    mutate(next);
    ReplaceLocked(next);
    return next;
}

SSettings CSettingsStore::Toggle(std::string_view field_id) {
    const auto platform = ParsePlatform(field_id);
    if (!platform) {
        throw CTickerError(EErrorCode::UnknownField, "unknown platform '" + std::string(field_id) + "'");
    }
    return Update("toggle", [platform](SSettings& s) {
        s.Flag(*platform) = !s.Flag(*platform);
    });
}

SSettings CSettingsStore::SetBackground(const std::string& color) {
    return Update("set_background", [&color](SSettings& s) {
        s.bg_color = color;
    });
}

std::unique_lock<std::mutex> CSettingsStore::AcquireWriter(std::string_view operation) {
    try {
        return std::unique_lock<std::mutex>(m_writer_mutex);
    } catch (const std::system_error& e) {
        Log(LogLevel::ERROR, "Settings", std::string(operation) + ": settings lock failed: " + e.what());
        throw CTickerError(EErrorCode::LockFailure, "settings lock failed");
    }
}

void CSettingsStore::ReplaceLocked(const SSettings& settings) {
    if (!m_storage) {
        throw CTickerError(EErrorCode::PersistenceError, "settings storage is not available");
    }
    // On failure the storage cache is put back to the value still in force.
    auto rollback = [this](const char* what) {
        Log(LogLevel::ERROR, "Settings", std::string("Persist failed: ") + what);
        m_storage->Set(m_key, Get().ToJson());
    };
    try {
        m_storage->Set(m_key, settings.ToJson());
        m_storage->Save();
    } catch (const CTickerError& e) {
        rollback(e.what());
        throw;
    } catch (const std::exception& e) {
        rollback(e.what());
        throw CTickerError(EErrorCode::PersistenceError, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(m_value_mutex);
        m_value = settings;
    }

    if (m_broadcaster) {
        m_broadcaster->Publish(kSettingsUpdatedTopic, settings.ToJson().dump());
    }
}
