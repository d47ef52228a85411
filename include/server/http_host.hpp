#pragma once

/**
 * HTTP transport for StaticFileServer.
 *
 * Requests no route answered are offered to the static file server; its
 * response headers and body reader are written back through httplib.
 */

#include "serve/static_file_server.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace staticfs {

class HttpHost {
public:
    explicit HttpHost(std::shared_ptr<const StaticFileServer> files);
    ~HttpHost();

    HttpHost(const HttpHost&) = delete;
    HttpHost& operator=(const HttpHost&) = delete;

    // Blocks until Stop() is called. Returns false if the socket could not
    // be bound. Returns at once if Stop() came first. Port 0 picks a free
    // port.
    bool Listen(const std::string& address, int port);

    // The bound port, or 0 before Listen() has bound one.
    int Port() const { return port_; }

    // Safe to call from another thread, before or during Listen().
    void Stop();

private:
    std::shared_ptr<const StaticFileServer> files_;
    std::unique_ptr<httplib::Server> svr_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> listening_{false};
    std::atomic<int> port_{0};
};

} // namespace staticfs
