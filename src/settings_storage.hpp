#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

class ISettingsStorage {
public:
    virtual ~ISettingsStorage() = default;

    virtual std::optional<nlohmann::json> Get(const std::string& key) const = 0;
    virtual void Set(const std::string& key, nlohmann::json value) = 0;
    // Throws CTickerError(PersistenceError).
    virtual void Save() = 0;
};

// Key/value pairs kept as one JSON object document on disk.
class CJsonFileStorage : public ISettingsStorage {
public:
    // A missing file opens as an empty store; an unreadable or malformed one throws.
    static std::shared_ptr<CJsonFileStorage> Open(const std::string& path);

    std::optional<nlohmann::json> Get(const std::string& key) const override;
    void Set(const std::string& key, nlohmann::json value) override;
    void Save() override;

    const std::string& Path() const { return m_path; }

private:
    explicit CJsonFileStorage(std::string path);

    std::string m_path;
    std::map<std::string, nlohmann::json> m_values;
};
