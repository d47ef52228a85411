#include "util/server_config.hpp"

#include "util/config_json_utils.hpp"

namespace staticfs {

bool ParseSourceType(const std::string& name, SourceType& out) {
    if (name == "directory") { out = SourceType::Directory; return true; }
    if (name == "package")   { out = SourceType::Package;   return true; }
    if (name == "embedded")  { out = SourceType::Embedded;  return true; }
    return false;
}

const char* SourceTypeName(SourceType t) {
    switch (t) {
        case SourceType::Directory: return "directory";
        case SourceType::Package:   return "package";
        case SourceType::Embedded:  return "embedded";
    }
    return "unknown";
}

Result ServerConfig::LoadFromFile(const std::string& path, ServerConfig& out) {
    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(Errc::InvalidArgument, "config: " + err);
    }

    if (!config::detail::FillConfigFromJson(json, out, err)) {
        return Result::Fail(Errc::InvalidArgument, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

Result ServerConfig::Validate() const {
    if (port <= 0 || port > 65535) {
        return Result::Fail(Errc::InvalidArgument, "port out of range: " + std::to_string(port));
    }
    if (source == SourceType::Directory && root.empty()) {
        return Result::Fail(Errc::InvalidArgument, "directory source needs a root");
    }
    if (source == SourceType::Package && package.empty()) {
        return Result::Fail(Errc::InvalidArgument, "package source needs a package path");
    }
    if (!package_sha256.empty() && package_sha256.size() != 64) {
        return Result::Fail(Errc::InvalidArgument, "package_sha256 must be 64 hex digits");
    }
    return Result::Ok();
}

} // namespace staticfs
