#include "serve/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace staticfs {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
}

Method ParseMethod(std::string_view name) {
    if (name == "GET") return Method::Get;
    if (name == "HEAD") return Method::Head;
    return Method::Other;
}

namespace {
const std::string* FindHeader(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(name);
    return it == headers.end() ? nullptr : &it->second;
}
} // namespace

const std::string* Request::Header(const std::string& name) const {
    return FindHeader(headers, name);
}

const std::string* Response::Header(const std::string& name) const {
    return FindHeader(headers, name);
}

} // namespace staticfs
