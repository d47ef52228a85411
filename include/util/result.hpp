#pragma once
#include <string>
#include <utility>

namespace staticfs {

enum class Errc : int {
    Ok = 0,
    NotFound,
    PathOutsideRoot,
    MalformedPackage,
    UnsupportedRange,
    InvalidRange,
    IoFailure,
    InvalidArgument,
};

const char* ErrcName(Errc c);

struct Result {
    bool ok{true};
    Errc code{Errc::Ok};
    int err{0}; // errno, when the failure came from a syscall
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(Errc c, std::string m) {
        return {.ok = false, .code = c, .err = 0, .msg = std::move(m)};
    }
    static Result Fail(Errc c, int e, std::string m) {
        return {.ok = false, .code = c, .err = e, .msg = std::move(m)};
    }
};

} // namespace staticfs
