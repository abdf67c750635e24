#include "settings_storage.hpp"

#include <filesystem>
#include <fstream>

#include "errors.hpp"

CJsonFileStorage::CJsonFileStorage(std::string path)
    : m_path(std::move(path)) {}

std::shared_ptr<CJsonFileStorage> CJsonFileStorage::Open(const std::string& path) {
    std::shared_ptr<CJsonFileStorage> storage(new CJsonFileStorage(path));
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return storage;
    }
    std::ifstream in(path);
    if (!in) {
        throw CTickerError(EErrorCode::PersistenceError, "cannot open " + path);
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw CTickerError(EErrorCode::PersistenceError, "malformed store " + path + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw CTickerError(EErrorCode::PersistenceError, "store " + path + " is not a JSON object");
    }
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        storage->m_values[it.key()] = it.value();
    }
    return storage;
}

std::optional<nlohmann::json> CJsonFileStorage::Get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CJsonFileStorage::Set(const std::string& key, nlohmann::json value) {
    m_values[key] = std::move(value);
}

void CJsonFileStorage::Save() {
    namespace fs = std::filesystem;
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& entry : m_values) {
        doc[entry.first] = entry.second;
    }
    const std::string tmp_path = m_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw CTickerError(EErrorCode::PersistenceError, "cannot write " + tmp_path);
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            throw CTickerError(EErrorCode::PersistenceError, "write failed for " + tmp_path);
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, m_path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw CTickerError(EErrorCode::PersistenceError, "cannot replace " + m_path);
    }
}
