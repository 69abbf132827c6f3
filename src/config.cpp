#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace memclient {

BaseUrl::BaseUrl(std::string url)
    : mUrl(trim(url))
{
    parseUrl(mUrl);   // throws std::invalid_argument
}

ApiKey::ApiKey(std::string key)
    : mKey(std::move(key))
{
    if (mKey.empty()) {
        throw std::invalid_argument("API key must not be empty");
    }
    // Anything that could split or fold the Authorization header is rejected.
    const bool clean = std::all_of(mKey.begin(), mKey.end(), [](unsigned char c) {
        return std::isgraph(c) != 0;
    });
    if (!clean) {
        throw std::invalid_argument("API key contains whitespace or control characters");
    }
}

std::ostream& operator<<(std::ostream& os, const ApiKey& key) {
    return os << key.redacted();
}

Namespace::Namespace(std::string name)
    : mName(std::move(name))
{
    if (mName.empty()) {
        throw std::invalid_argument("Namespace must be a non-empty string");
    }
    if (mName.size() > 64) {
        throw std::invalid_argument("Namespace must be 64 characters or less");
    }
    const bool valid = std::all_of(mName.begin(), mName.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
    if (!valid) {
        throw std::invalid_argument(
            "Namespace can only contain letters, numbers, underscores, and hyphens");
    }
}

HeaderMap redactHeaders(const HeaderMap& headers) {
    HeaderMap out = headers;
    auto it = out.find("Authorization");
    if (it != out.end()) {
        it->second = "Bearer <redacted>";
    }
    return out;
}

} // namespace memclient
