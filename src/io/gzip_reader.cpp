#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace staticfs {

namespace {

constexpr size_t kChunk = 16384;
// 16 + MAX_WBITS selects the gzip wrapper instead of raw zlib.
constexpr int kGzipWindowBits = 16 + MAX_WBITS;
constexpr int kMemLevel = 8;

// Refills an empty input window from `source`. Returns the bytes read, 0 at
// end of input, -1 on error.
ssize_t Refill(IReader& source, std::vector<std::uint8_t>& buf, z_stream& strm) {
    const ssize_t n = source.Read(buf);
    if (n > 0) {
        strm.next_in = buf.data();
        strm.avail_in = static_cast<uInt>(n);
    }
    return n;
}

} // namespace

GzipReader::GzipReader(std::unique_ptr<IReader> source)
    : source_(std::move(source)), in_buffer_(kChunk) {
    if (inflateInit2(&strm_, kGzipWindowBits) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }
}

GzipReader::~GzipReader() { inflateEnd(&strm_); }

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0 && !eof_reached_) {
        if (strm_.avail_in == 0) {
            const ssize_t n = Refill(*source_, in_buffer_, strm_);
            if (n < 0) return -1;
            if (n == 0) {
                // Input ended before the gzip trailer.
                if (strm_.avail_out == out.size()) return -1;
                break;
            }
        }

        switch (inflate(&strm_, Z_NO_FLUSH)) {
            case Z_STREAM_END:
                eof_reached_ = true;
                break;
            case Z_OK:
            case Z_BUF_ERROR:
                break;
            default:
                return -1;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

GzipEncoder::GzipEncoder(std::unique_ptr<IReader> source, int level)
    : source_(std::move(source)), in_buffer_(kChunk) {
    if (deflateInit2(&strm_, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
}

GzipEncoder::~GzipEncoder() { deflateEnd(&strm_); }

ssize_t GzipEncoder::Read(std::span<std::uint8_t> out) {
    if (finished_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0 && !finished_) {
        if (strm_.avail_in == 0 && !source_drained_) {
            const ssize_t n = Refill(*source_, in_buffer_, strm_);
            if (n < 0) return -1;
            source_drained_ = (n == 0);
        }

        const int ret = deflate(&strm_, source_drained_ ? Z_FINISH : Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            finished_ = true;
        } else if (ret == Z_STREAM_ERROR) {
            return -1;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace staticfs
