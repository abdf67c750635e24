#pragma once

#include "event_broadcaster.hpp"
#include "settings.hpp"
#include "settings_storage.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// Owns the process-wide settings value. Every mutation goes through
// Replace(), which persists first and swaps the in-memory copy only on success.
class CSettingsStore {
public:
    // storage may be null when the backing file could not be opened; the store
    // then serves defaults and every mutation fails with PersistenceError.
    CSettingsStore(std::shared_ptr<ISettingsStorage> storage,
                   std::shared_ptr<CEventBroadcaster> broadcaster,
                   std::string key = "settings");

    void Load();

    SSettings Get() const;
    void Replace(const SSettings& settings);
    SSettings Toggle(std::string_view field_id);
    SSettings SetBackground(const std::string& color);

private:
    template <typename Mutate>
    SSettings Update(std::string_view operation, Mutate&& mutate);

    std::unique_lock<std::mutex> AcquireWriter(std::string_view operation);
    void ReplaceLocked(const SSettings& settings);

    std::shared_ptr<ISettingsStorage> m_storage;
    std::shared_ptr<CEventBroadcaster> m_broadcaster;
    std::string m_key;

    // m_writer_mutex serializes read-modify-write cycles including the durable
    // write; m_value_mutex only guards the copy in and out of m_value.
    std::mutex m_writer_mutex;
    mutable std::mutex m_value_mutex;
    SSettings m_value;
};
