#pragma once

#include <cstdint>
#include <span>

namespace staticfs::embedded {

// Package built from assets/ at compile time. Defined in a generated source.
std::span<const std::uint8_t> PackageBytes();

} // namespace staticfs::embedded
