#pragma once

/**
 * Mapping between the pipeline's Request/Response and what the HTTP host
 * puts on the wire. Kept free of httplib so it can be tested on its own.
 */

#include "serve/http_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace staticfs {

inline constexpr int kStatusRangeNotSatisfiable = 416;

// Status the pipeline starts from for a request no route answered.
// httplib answers 416 on its own for any Range value outside its grammar;
// such a request is offered to the pipeline as unhandled so that the Range
// header is ignored there and the whole file is served.
int PipelineStartStatus(int host_status, const Request& req);

enum class BodyMode {
    None,    // headers only (HEAD, 304, empty file)
    Sized,   // Content-Length known, streamed from the body reader
    Chunked, // length unknown, chunked transfer encoding
};

struct HostResponse {
    int status = kStatusNotFound;
    // Everything except Content-Type, which the host's body calls own.
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<std::string> content_type;
    BodyMode body = BodyMode::None;
    std::uint64_t length = 0; // for BodyMode::Sized
};

HostResponse PlanHostResponse(const Request& req, const Response& res);

} // namespace staticfs
