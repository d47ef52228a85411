#include "crypto/sha256.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <vector>

namespace staticfs {

struct Sha256::Ctx {
    EVP_MD_CTX* md = EVP_MD_CTX_new();
    ~Ctx() { EVP_MD_CTX_free(md); }
};

Sha256::Sha256() : ctx_(std::make_unique<Ctx>()) {
    ok_ = ctx_->md && EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) == 1;
}

Sha256::~Sha256() = default;

bool Sha256::Update(std::span<const std::uint8_t> data) {
    if (!ok_) return false;
    if (data.empty()) return true;
    ok_ = EVP_DigestUpdate(ctx_->md, data.data(), data.size()) == 1;
    return ok_;
}

bool Sha256::Final(Digest& out) {
    if (!ok_) return false;
    ok_ = false;
    unsigned int len = 0;
    return EVP_DigestFinal_ex(ctx_->md, out.data(), &len) == 1 && len == out.size();
}

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0xF]);
    }
    return out;
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    Sha256::Digest digest{};
    if (!hasher.Update(data) || !hasher.Final(digest)) return {};
    return HexEncode(digest);
}

std::string Sha256Hex(IReader& reader) {
    Sha256 hasher;
    std::vector<std::uint8_t> buf(64 * 1024);
    for (;;) {
        const ssize_t n = reader.Read(buf);
        if (n < 0) return {};
        if (n == 0) break;
        if (!hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) return {};
    }

    Sha256::Digest digest{};
    if (!hasher.Final(digest)) return {};
    return HexEncode(digest);
}

bool Sha256Equal(const std::string& a, const std::string& b) {
    if (a.empty() || a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace staticfs
