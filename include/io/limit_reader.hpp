#pragma once
#include "io/io.hpp"
#include <algorithm>
#include <cstdint>
#include <memory>

namespace staticfs {

// Delivers at most `limit` bytes of the inner stream, then reports EOF.
// Only the remaining allowance is ever requested from the inner reader and
// nothing is buffered, so Release() hands back a stream positioned exactly
// after the delivered bytes.
class LimitReader final : public IReader {
public:
    LimitReader(std::unique_ptr<IReader> inner, std::uint64_t limit)
        : inner_(std::move(inner)), limit_(limit) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (!inner_ || read_ >= limit_) return 0;

        const std::uint64_t left = limit_ - read_;
        if (left < out.size()) {
            out = out.first(static_cast<size_t>(left));
        }

        const ssize_t n = inner_->Read(out);
        if (n > 0) {
            read_ += static_cast<std::uint64_t>(n);
        }
        return n;
    }

    // The limit, or the inner stream's size when that is known and shorter.
    std::optional<std::uint64_t> TotalSize() const override {
        if (inner_) {
            if (auto inner_size = inner_->TotalSize()) return std::min(limit_, *inner_size);
        }
        return limit_;
    }

    std::uint64_t BytesRead() const { return read_; }
    std::uint64_t Limit() const { return limit_; }

    std::unique_ptr<IReader> Release() { return std::move(inner_); }

private:
    std::unique_ptr<IReader> inner_;
    std::uint64_t limit_ = 0;
    std::uint64_t read_ = 0;
};

} // namespace staticfs
