#include "server/http_host.hpp"

#include "server/host_response.hpp"
#include "util/logger.hpp"

#include <httplib.h>

#include <algorithm>
#include <array>
#include <thread>

namespace staticfs {

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

Request ToRequest(const httplib::Request& in) {
    Request out;
    out.method = ParseMethod(in.method);
    out.path = in.path;
    for (const auto& [name, value] : in.headers) {
        out.headers.emplace(name, value); // first value of a repeated header wins
    }
    return out;
}

// Streams exactly `length` bytes; a short source aborts the connection.
httplib::ContentProvider SizedProvider(std::shared_ptr<IReader> body) {
    return [body](size_t offset, size_t length, httplib::DataSink& sink) {
        std::array<std::uint8_t, kChunkSize> buf;
        const size_t want = std::min(length - offset, buf.size());
        const ssize_t n = body->Read(std::span<std::uint8_t>(buf.data(), want));
        if (n <= 0) {
            LogWarn("body ended early at offset %zu of %zu", offset, length);
            return false;
        }
        return sink.write(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    };
}

httplib::ContentProviderWithoutLength ChunkedProvider(std::shared_ptr<IReader> body) {
    return [body](size_t, httplib::DataSink& sink) {
        std::array<std::uint8_t, kChunkSize> buf;
        const ssize_t n = body->Read(buf);
        if (n < 0) {
            LogWarn("body read failed");
            return false;
        }
        if (n == 0) {
            sink.done();
            return true;
        }
        return sink.write(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    };
}

void WriteResponse(const HostResponse& plan, std::unique_ptr<IReader> body, httplib::Response& out) {
    out.status = plan.status;
    for (const auto& [name, value] : plan.headers) {
        out.set_header(name, value);
    }

    const std::string content_type = plan.content_type.value_or(std::string());
    switch (plan.body) {
        case BodyMode::None:
            if (plan.content_type) out.set_header("Content-Type", content_type);
            return;
        case BodyMode::Sized:
            out.set_content_provider(static_cast<size_t>(plan.length), content_type,
                                     SizedProvider(std::shared_ptr<IReader>(std::move(body))));
            break;
        case BodyMode::Chunked:
            out.set_chunked_content_provider(content_type,
                                             ChunkedProvider(std::shared_ptr<IReader>(std::move(body))));
            break;
    }
    // The content provider setters always write a Content-Type field.
    if (!plan.content_type) out.headers.erase("Content-Type");
}

} // namespace

HttpHost::HttpHost(std::shared_ptr<const StaticFileServer> files)
    : files_(std::move(files)), svr_(std::make_unique<httplib::Server>()) {
    // Runs once routing found nothing, so any routes registered later take
    // precedence over the static files.
    svr_->set_error_handler([this](const httplib::Request& hreq, httplib::Response& hres) {
        Request req = ToRequest(hreq);
        Response res;
        res.status = PipelineStartStatus(hres.status, req);
        if (!files_->Handle(req, res)) return;

        // httplib slices provider bodies by req.ranges after this handler
        // returns and only hands handlers a const Request. The pipeline has
        // already applied the Range header, so the parsed ranges are dropped.
        const_cast<httplib::Request&>(hreq).ranges.clear();

        const HostResponse plan = PlanHostResponse(req, res);
        WriteResponse(plan, std::move(res.body), hres);
    });

    svr_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug("%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });
}

HttpHost::~HttpHost() = default;

bool HttpHost::Listen(const std::string& address, int port) {
    if (port == 0) {
        port = svr_->bind_to_any_port(address);
    } else if (!svr_->bind_to_port(address, port)) {
        port = -1;
    }
    if (port < 0) {
        LogError("cannot bind %s", address.c_str());
        return false;
    }
    port_ = port;

    listening_ = true;
    if (stop_requested_) {
        listening_ = false;
        LogInfo("stop requested before listening on %s:%d", address.c_str(), port);
        return true;
    }
    LogInfo("listening on %s:%d, prefix %s", address.c_str(), port, files_->Prefix().c_str());
    const bool ok = svr_->listen_after_bind();
    listening_ = false;
    return ok;
}

void HttpHost::Stop() {
    stop_requested_ = true;
    // httplib ignores stop() until its accept loop runs; a Listen() that
    // already passed the stop check is about to start it.
    while (listening_ && !svr_->is_running()) {
        std::this_thread::yield();
    }
    svr_->stop();
}

} // namespace staticfs
