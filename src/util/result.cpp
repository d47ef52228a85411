#include "util/result.hpp"

namespace staticfs {

const char* ErrcName(Errc c) {
    switch (c) {
        case Errc::Ok:               return "ok";
        case Errc::NotFound:         return "not found";
        case Errc::PathOutsideRoot:  return "path outside root";
        case Errc::MalformedPackage: return "malformed package";
        case Errc::UnsupportedRange: return "unsupported range";
        case Errc::InvalidRange:     return "invalid range";
        case Errc::IoFailure:        return "i/o failure";
        case Errc::InvalidArgument:  return "invalid argument";
    }
    return "unknown";
}

} // namespace staticfs
