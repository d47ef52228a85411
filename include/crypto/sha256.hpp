#pragma once

#include "io/io.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace staticfs {

// Incremental SHA-256 over OpenSSL EVP.
class Sha256 {
public:
    using Digest = std::array<std::uint8_t, 32>;

    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    bool Update(std::span<const std::uint8_t> data);
    // The hasher cannot be updated afterwards.
    bool Final(Digest& out);

private:
    struct Ctx;
    std::unique_ptr<Ctx> ctx_;
    bool ok_ = false;
};

std::string HexEncode(std::span<const std::uint8_t> bytes);

// Lowercase hex digests; an empty string signals a hashing failure.
std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(IReader& reader);

// Case-insensitive comparison of two hex digests.
bool Sha256Equal(const std::string& a, const std::string& b);

} // namespace staticfs
