#include "util/config_json_utils.hpp"

#include <fstream>

namespace staticfs::config::detail {

namespace {

// The Get*IfPresent helpers return false only for a key of the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetPortIfPresent(const nlohmann::json& j, const char* key, int& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v <= 0 || v > 65535) {
        err = std::string("'") + key + "' out of range: " + std::to_string(v);
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ServerConfig& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "listen_address", cfg.listen_address, err) ||
        !GetPortIfPresent(j, "port", cfg.port, err) ||
        !GetStringIfPresent(j, "prefix", cfg.prefix, err) ||
        !GetStringIfPresent(j, "root", cfg.root, err) ||
        !GetStringIfPresent(j, "package", cfg.package, err) ||
        !GetStringIfPresent(j, "package_sha256", cfg.package_sha256, err)) {
        return false;
    }

    std::string source;
    if (!GetStringIfPresent(j, "source", source, err))
        return false;
    if (!source.empty() && !ParseSourceType(source, cfg.source)) {
        err = "unknown source '" + source + "' (expected directory, package or embedded)";
        return false;
    }

    std::string level;
    if (!GetStringIfPresent(j, "log_level", level, err))
        return false;
    if (!level.empty() && !ParseLogLevel(level, cfg.log_level)) {
        err = "unknown log_level '" + level + "'";
        return false;
    }

    return true;
}

} // namespace staticfs::config::detail
