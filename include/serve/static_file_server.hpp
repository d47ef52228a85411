#pragma once

#include "serve/http_types.hpp"
#include "storage/storage.hpp"

#include <memory>
#include <string>

namespace staticfs {

// Serves GET and HEAD requests below a URL prefix from an IStorage, with
// If-Modified-Since, single byte ranges and gzip content encoding.
class StaticFileServer {
public:
    StaticFileServer(std::shared_ptr<const IStorage> storage, std::string prefix);

    // Returns false, leaving `res` untouched, when the request is not for
    // this server: already handled, not GET/HEAD, or outside the prefix.
    bool Handle(const Request& req, Response& res) const;

    const std::string& Prefix() const { return prefix_; }

    // Ensures a leading and a trailing '/'.
    static std::string NormalizePrefix(std::string prefix);

private:
    std::shared_ptr<const IStorage> storage_;
    std::string prefix_;
};

} // namespace staticfs
