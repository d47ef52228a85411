#include "io/fd.hpp"

#include <unistd.h>
#include <utility>

namespace staticfs {

Fd::Fd(Fd&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), owned_(std::exchange(other.owned_, false)) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = std::exchange(other.fd_, -1);
        owned_ = std::exchange(other.owned_, false);
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Release() {
    owned_ = false;
    return std::exchange(fd_, -1);
}

void Fd::Close() {
    if (fd_ >= 0 && owned_) {
        ::close(fd_);
    }
    fd_ = -1;
    owned_ = false;
}

} // namespace staticfs
