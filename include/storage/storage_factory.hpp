#pragma once

#include "storage/storage.hpp"
#include "util/result.hpp"
#include "util/server_config.hpp"

#include <cstdint>
#include <memory>
#include <span>

namespace staticfs {

// Builds the storage selected by `cfg.source`. `embedded` holds the package
// compiled into the binary; it is only consulted for SourceType::Embedded.
// A configured package_sha256 must match the package bytes.
Result OpenStorage(const ServerConfig& cfg, std::span<const std::uint8_t> embedded,
                   std::shared_ptr<const IStorage>& out);

} // namespace staticfs
