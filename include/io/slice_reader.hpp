#pragma once
#include "io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>

namespace staticfs {

// Cursor over a borrowed byte range. `keepalive` pins the owner of the bytes
// (may be null when they have static storage duration).
class SliceReader final : public ISeekableReader {
public:
    SliceReader(std::span<const std::uint8_t> bytes, std::shared_ptr<const void> keepalive = nullptr)
        : bytes_(bytes), keepalive_(std::move(keepalive)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= bytes_.size()) return 0;
        const size_t n = std::min(out.size(), bytes_.size() - pos_);
        std::memcpy(out.data(), bytes_.data() + pos_, n);
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    Result Seek(std::uint64_t offset) override {
        if (offset > bytes_.size()) {
            return Result::Fail(Errc::IoFailure, "seek to " + std::to_string(offset) +
                                                     " past end of " + std::to_string(bytes_.size()) +
                                                     "-byte slice");
        }
        pos_ = static_cast<size_t>(offset);
        return Result::Ok();
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(bytes_.size());
    }

    std::uint64_t Position() const { return pos_; }

private:
    std::span<const std::uint8_t> bytes_;
    std::shared_ptr<const void> keepalive_;
    size_t pos_ = 0;
};

} // namespace staticfs
