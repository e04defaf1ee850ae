#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include "codetap/common/noncopyable.h"

namespace codetap {
namespace common {

// INI store: [section] headers, key = value lines, '#' and ';' comments.
// Keys before the first section land in "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);
    void Clear();

    std::optional<std::string> LoadedFilename() const;

    bool Has(const std::string& section, const std::string& key) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Get value as int, return default if missing or not a number
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    using Settings = std::map<std::string, std::map<std::string, std::string>>;

    Config() = default;
    static std::string Trim(const std::string& s);
    static Settings Parse(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace codetap
