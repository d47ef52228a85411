#include "serve/static_file_server.hpp"

#include "io/gzip_reader.hpp"
#include "io/limit_reader.hpp"
#include "serve/mime_types.hpp"
#include "serve/range.hpp"
#include "util/http_date.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <optional>
#include <stdexcept>

namespace staticfs {

StaticFileServer::StaticFileServer(std::shared_ptr<const IStorage> storage, std::string prefix)
    : storage_(std::move(storage)), prefix_(NormalizePrefix(std::move(prefix))) {}

std::string StaticFileServer::NormalizePrefix(std::string prefix) {
    if (prefix.empty() || prefix.front() != '/') prefix.insert(prefix.begin(), '/');
    if (prefix.back() != '/') prefix.push_back('/');
    return prefix;
}

bool StaticFileServer::Handle(const Request& req, Response& res) const {
    if (res.status != kStatusNotFound) return false;
    if (req.method != Method::Get && req.method != Method::Head) return false;
    if (req.path.rfind(prefix_, 0) != 0) return false;

    const std::string path = req.path.substr(prefix_.size());
    const bool is_get = req.method == Method::Get;

    if (!storage_->PathIsWithinRoot(path)) {
        LogDebug("403 %s: outside of served root", req.path.c_str());
        res.status = kStatusForbidden;
        return true;
    }

    if (!storage_->Exists(path)) {
        LogDebug("404 %s", req.path.c_str());
        res.status = kStatusNotFound;
        return true;
    }

    if (const std::string_view ext = FileExtension(path); !ext.empty()) {
        res.headers["Content-Type"] = MimeTypeForExtension(ext);
    }

    FileMetadata meta;
    if (auto r = storage_->Metadata(path, meta); !r.ok) {
        LogWarn("403 %s: %s", req.path.c_str(), r.msg.c_str());
        res.status = kStatusForbidden;
        return true;
    }
    const std::string last_modified = FormatHttpDate(meta.last_modified);

    if (is_get) {
        if (const std::string* since = req.Header("If-Modified-Since")) {
            if (auto t = ParseHttpDate(*since); t && *t == meta.last_modified) {
                LogDebug("304 %s", req.path.c_str());
                res.status = kStatusNotModified;
                return true;
            }
        }
    }

    const std::uint64_t size = meta.length;

    if (!is_get) {
        res.headers["Accept-Ranges"] = "bytes";
        res.headers["Content-Length"] = std::to_string(size);
        res.status = kStatusOk;
        return true;
    }

    // Multiple, malformed or unsatisfiable ranges fall back to the whole file.
    std::optional<ByteRange> range;
    if (const std::string* value = req.Header("Range")) {
        auto parsed = ParseRangeHeader(*value);
        if (parsed) {
            range = FitRange(*parsed, size);
        }
        if (!range) {
            LogDebug("ignoring range '%s' for %s (%s)", value->c_str(), req.path.c_str(),
                     parsed ? "unsatisfiable" : ErrcName(parsed.error()));
        }
    }
    const std::uint64_t start = range ? range->start : 0;

    std::unique_ptr<IReader> body;
    if (auto r = storage_->Open(path, start, body); !r.ok) {
        LogWarn("403 %s: %s", req.path.c_str(), r.msg.c_str());
        res.status = kStatusForbidden;
        return true;
    }

    if (range) {
        body = std::make_unique<LimitReader>(std::move(body), range->Length());
    }

    const std::string* accept = req.Header("Accept-Encoding");
    const bool gzip = accept && accept->find("gzip") != std::string::npos;
    if (gzip) {
        try {
            body = std::make_unique<GzipEncoder>(std::move(body));
        } catch (const std::runtime_error& e) {
            LogError("403 %s: %s", req.path.c_str(), e.what());
            res.status = kStatusForbidden;
            return true;
        }
    }

    res.headers["Accept-Ranges"] = "bytes";
    res.headers["Last-Modified"] = last_modified;

    if (range) {
        res.headers["Content-Range"] = FormatContentRange(*range, size);
        res.status = kStatusPartialContent;
    } else {
        res.status = kStatusOk;
    }

    // The compressed length is only known once the body has been streamed.
    if (gzip) {
        res.headers["Content-Encoding"] = "gzip";
    } else {
        res.headers["Content-Length"] = std::to_string(range ? range->Length() : size);
    }

    LogDebug("%d %s", res.status, req.path.c_str());
    res.body = std::move(body);
    return true;
}

} // namespace staticfs
