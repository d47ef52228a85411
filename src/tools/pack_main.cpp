#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "pack/package.hpp"
#include "pack/package_writer.hpp"
#include "pack/tar_import.hpp"
#include "util/http_date.hpp"
#include "util/logger.hpp"

#include <cinttypes>
#include <cstdio>
#include <getopt.h>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -o <out.pack> [-C <root>] [files...]\n"
        "   %s -o <out.pack> -t <bundle.tar|->\n"
        "   %s -l <package>\n"
        "\n"
        "Options:\n"
        "  -o, --output    Package to write ('-' for stdout)\n"
        "  -C, --root      Directory the files are relative to (default '.').\n"
        "                  Without files, every regular file below it is packed\n"
        "  -t, --tar       Import the regular files of a tar bundle ('-' for stdin)\n"
        "  -l, --list      List the entries of a package and its sha256\n"
        "  -v, --verbose   Debug logging\n"
        "  -h, --help      Show this help\n",
        argv, argv, argv);
}

int ListPackage(const std::string &path) {
    staticfs::Package package;
    if (auto r = staticfs::Package::LoadFile(path, package); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    for (const auto &[name, entry] : package.Entries()) {
        std::printf("%12" PRIu64 "  %12" PRIu64 "  %s  %s\n", entry.start_offset, entry.length,
                    staticfs::FormatHttpDate(entry.last_modified).c_str(), name.c_str());
    }
    std::printf("%zu entries, %" PRIu64 " metadata bytes, %" PRIu64 " data bytes\n",
                package.Entries().size(), package.MetadataSize(), package.DataSize());
    std::printf("sha256 %s\n", staticfs::Sha256Hex(package.Bytes()).c_str());
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    std::string out_path;
    std::string root = ".";
    std::string tar_path;
    std::string list_path;

    static option long_opts[] = {
        {"output", required_argument, nullptr, 'o'},
        {"root", required_argument, nullptr, 'C'},
        {"tar", required_argument, nullptr, 't'},
        {"list", required_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "ho:C:t:l:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'o':
                out_path = optarg;
                break;

            case 'C':
                root = optarg;
                break;

            case 't':
                tar_path = optarg;
                break;

            case 'l':
                list_path = optarg;
                break;

            case 'v':
                staticfs::Logger::Instance().SetLevel(staticfs::LogLevel::Debug);
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!list_path.empty()) {
        return ListPackage(list_path);
    }

    if (out_path.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    std::vector<std::string> files(argv + optind, argv + argc);
    if (!tar_path.empty() && !files.empty()) {
        std::fprintf(stderr, "ERROR: --tar cannot be combined with a file list\n");
        return 2;
    }

    staticfs::PackageWriter writer;
    if (!tar_path.empty()) {
        staticfs::FileReader reader;
        if (auto r = staticfs::FileReader::Open(tar_path, reader); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
        if (auto r = staticfs::ImportTarBundle(reader, writer); !r.ok) {
            LogError("%s: %s", tar_path.c_str(), r.msg.c_str());
            return 1;
        }
    } else if (files.empty()) {
        if (auto r = writer.AddDirectory(root); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
    } else {
        for (const auto &f : files) {
            if (auto r = writer.AddFile(root, f); !r.ok) {
                LogError("%s", r.msg.c_str());
                return 1;
            }
        }
    }

    staticfs::FileWriter out;
    if (auto r = staticfs::FileWriter::Open(out_path, out); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    if (auto r = writer.Write(out); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    if (auto r = out.FsyncNow(); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    LogInfo("packed %zu entries into %s", writer.EntryCount(), out_path.c_str());
    return 0;
}
