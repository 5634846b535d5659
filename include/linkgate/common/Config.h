#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <utility>
#include <optional>
#include <iosfwd>
#include "linkgate/common/noncopyable.h"

namespace linkgate {
namespace common {

// INI-style settings: "[section]" headers, "key = value" lines,
// '#' or ';' comments. Keys before the first header land in [global].
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "");
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0);
    long long GetInt64(const std::string& section, const std::string& key, long long defaultVal = 0);
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0);
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false);

    // One backend session per [session:<id>] section.
    struct SessionConf {
        int id{0};
        std::string type{"local"};
        std::string root;
    };
    std::vector<SessionConf> GetSessions();

    // Sections whose name starts with prefix, as (section_name, key->value) pairs.
    std::vector<std::pair<std::string, std::map<std::string, std::string>>> GetSectionsWithPrefix(const std::string& prefix);

private:
    Config() = default;

    using Settings = std::map<std::string, std::map<std::string, std::string>>;
    static Settings Parse(std::istream& in);
    static std::string Trim(const std::string& s);

    mutable std::mutex mutex_;
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace linkgate
