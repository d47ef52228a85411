#include "server/host_response.hpp"

#include <charconv>

namespace staticfs {

namespace {

std::optional<std::uint64_t> ParseLength(const std::string& s) {
    std::uint64_t v = 0;
    const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || end != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace

int PipelineStartStatus(int host_status, const Request& req) {
    if (host_status == kStatusRangeNotSatisfiable && req.Header("Range")) {
        return kStatusNotFound;
    }
    return host_status;
}

HostResponse PlanHostResponse(const Request& req, const Response& res) {
    HostResponse out;
    out.status = res.status;

    for (const auto& [name, value] : res.headers) {
        if (name == "Content-Type" || name == "Content-Length") continue;
        out.headers.emplace_back(name, value);
    }

    if (const std::string* type = res.Header("Content-Type")) out.content_type = *type;

    const std::string* length = res.Header("Content-Length");
    if (!res.body || req.method != Method::Get) {
        if (length) out.headers.emplace_back("Content-Length", *length);
        return out;
    }

    if (!length) {
        out.body = BodyMode::Chunked;
        return out;
    }

    const auto n = ParseLength(*length);
    if (!n) {
        out.body = BodyMode::Chunked;
    } else if (*n == 0) {
        out.headers.emplace_back("Content-Length", *length);
    } else {
        out.body = BodyMode::Sized;
        out.length = *n;
    }
    return out;
}

} // namespace staticfs
