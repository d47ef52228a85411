#include "serve/static_file_server.hpp"
#include "server/embedded_package.hpp"
#include "server/http_host.hpp"
#include "storage/storage_factory.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/server_config.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-d <dir> | -p <package> | -e] [-P <prefix>] [-a <address>] [-n <port>]\n"
        "\n"
        "Options:\n"
        "  -c, --config     JSON configuration file\n"
        "  -d, --dir        Serve files below a directory\n"
        "  -p, --package    Serve the entries of a package file\n"
        "  -e, --embedded   Serve the package compiled into this binary\n"
        "  -P, --prefix     URL prefix the files are served under (default '/')\n"
        "  -a, --address    Listen address (default 0.0.0.0)\n"
        "  -n, --port       Listen port (default 8080)\n"
        "  -v, --verbose    Debug logging\n"
        "  -h, --help       Show this help\n"
        "\n"
        "Command line options override the configuration file.\n",
        argv);
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path;
    std::optional<staticfs::SourceType> source;
    std::optional<std::string> root;
    std::optional<std::string> package;
    std::optional<std::string> prefix;
    std::optional<std::string> address;
    std::optional<int> port;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"dir", required_argument, nullptr, 'd'},
        {"package", required_argument, nullptr, 'p'},
        {"embedded", no_argument, nullptr, 'e'},
        {"prefix", required_argument, nullptr, 'P'},
        {"address", required_argument, nullptr, 'a'},
        {"port", required_argument, nullptr, 'n'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:d:p:eP:a:n:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'd':
                source = staticfs::SourceType::Directory;
                root = optarg;
                break;

            case 'p':
                source = staticfs::SourceType::Package;
                package = optarg;
                break;

            case 'e':
                source = staticfs::SourceType::Embedded;
                break;

            case 'P':
                prefix = optarg;
                break;

            case 'a':
                address = optarg;
                break;

            case 'n': {
                char *end = nullptr;
                long v = std::strtol(optarg, &end, 10);
                if (!end || *end != '\0') {
                    std::fprintf(stderr, "Invalid --port: %s\n", optarg);
                    return 2;
                }
                port = static_cast<int>(v);
                break;
            }

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind != argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    staticfs::ServerConfig cfg;
    if (!config_path.empty()) {
        if (auto r = staticfs::ServerConfig::LoadFromFile(config_path, cfg); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    }
    if (source) cfg.source = *source;
    if (root) cfg.root = *root;
    if (package) cfg.package = *package;
    if (prefix) cfg.prefix = *prefix;
    if (address) cfg.listen_address = *address;
    if (port) cfg.port = *port;
    if (verbose) cfg.log_level = staticfs::LogLevel::Debug;

    if (auto r = cfg.Validate(); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 2;
    }

    staticfs::Logger::Instance().SetLevel(cfg.log_level);

    std::shared_ptr<const staticfs::IStorage> storage;
    if (auto r = staticfs::OpenStorage(cfg, staticfs::embedded::PackageBytes(), storage); !r.ok) {
        LogError("cannot open %s source: %s", staticfs::SourceTypeName(cfg.source), r.msg.c_str());
        return 1;
    }

    auto files = std::make_shared<staticfs::StaticFileServer>(storage, cfg.prefix);
    staticfs::HttpHost host(files);

    staticfs::BlockTerminationSignals();
    std::thread waiter([&host] {
        const int sig = staticfs::WaitForTerminationSignal();
        LogInfo("signal %d, shutting down", sig);
        host.Stop();
    });

    const bool ok = host.Listen(cfg.listen_address, cfg.port);
    if (!ok) {
        // Wake the waiter so it can be joined.
        ::kill(::getpid(), SIGTERM);
    }
    waiter.join();

    return ok ? 0 : 1;
}
