#pragma once

#include "io/io.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace staticfs {

inline constexpr int kStatusOk = 200;
inline constexpr int kStatusPartialContent = 206;
inline constexpr int kStatusNotModified = 304;
inline constexpr int kStatusForbidden = 403;
inline constexpr int kStatusNotFound = 404;

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

enum class Method { Get, Head, Other };

Method ParseMethod(std::string_view name);

// What the pipeline reads from the host's request.
struct Request {
    Method method = Method::Get;
    std::string path; // percent-decoded, without query string
    HeaderMap headers;

    const std::string* Header(const std::string& name) const;
};

// What the pipeline writes. A 404 status means "not handled yet".
struct Response {
    int status = kStatusNotFound;
    HeaderMap headers;
    std::unique_ptr<IReader> body;

    const std::string* Header(const std::string& name) const;
};

} // namespace staticfs
