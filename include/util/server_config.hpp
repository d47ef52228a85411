#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace staticfs {

enum class SourceType { Directory, Package, Embedded };

bool ParseSourceType(const std::string& name, SourceType& out);
const char* SourceTypeName(SourceType t);

struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    int port = 8080;
    std::string prefix = "/";
    SourceType source = SourceType::Directory;
    std::string root = ".";
    std::string package;
    std::string package_sha256;
    LogLevel log_level = LogLevel::Info;

    // Keys missing from the file keep their current value.
    static Result LoadFromFile(const std::string& path, ServerConfig& out);

    Result Validate() const;
};

} // namespace staticfs
