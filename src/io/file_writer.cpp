#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace staticfs {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_ = Fd::Borrow(STDOUT_FILENO);
        return Result::Ok();
    }

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result::Fail(Errc::IoFailure, errno,
                            "Failed to open output: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_ = Fd(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(Errc::IoFailure, errno,
                            "Write failed: " + path_ + " (" + std::string(std::strerror(errno)) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (!fd_.Owned()) {
        return Result::Ok();
    }
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(Errc::IoFailure, errno,
                            "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

} // namespace staticfs
