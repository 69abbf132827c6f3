#include "models.hpp"

#include <algorithm>
#include <cctype>

namespace memclient {

bool CaseInsensitiveLess::operator()(const std::string& lhs,
                                     const std::string& rhs) const
{
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) {
            return std::tolower(a) < std::tolower(b);
        });
}

const char* toString(Method method) {
    switch (method) {
        case Method::Get:    return "GET";
        case Method::Post:   return "POST";
        case Method::Put:    return "PUT";
        case Method::Patch:  return "PATCH";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

std::optional<std::string> HttpResponse::text() const {
    if (body.is_string()) {
        return body.get<std::string>();
    }
    return std::nullopt;
}

} // namespace memclient
