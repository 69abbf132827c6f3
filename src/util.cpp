#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <stdexcept>

namespace memclient {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target[0] != '/') {
            parts.target.insert(0, "/");
        }
    }

    // Fragments never go on the wire.
    auto fragment = parts.target.find('#');
    if (fragment != std::string::npos) {
        parts.target.erase(fragment);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (!isAllDigits(parts.port)) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string resolveUrl(const std::string& base, const std::string& path) {
    // Already absolute.
    auto schemeEnd = path.find("://");
    if (schemeEnd != std::string::npos &&
        path.find_first_of("/?#") > schemeEnd) {
        return path;
    }

    const auto parts = parseUrl(base);
    const bool defaultPort = (parts.scheme == "http"  && parts.port == "80") ||
                             (parts.scheme == "https" && parts.port == "443");
    const std::string origin = parts.scheme + "://" + parts.host
                             + (defaultPort ? "" : ":" + parts.port);

    if (path.rfind("//", 0) == 0) {
        return parts.scheme + ":" + path;
    }

    std::string basePath = parts.target;
    auto query = basePath.find('?');
    if (query != std::string::npos) {
        basePath.erase(query);
    }

    if (path.empty()) {
        return origin + parts.target;
    }
    if (path[0] == '/') {
        return origin + path;
    }
    if (path[0] == '?') {
        return origin + basePath + path;
    }

    auto lastSlash = basePath.rfind('/');
    return origin + basePath.substr(0, lastSlash + 1) + path;
}

std::string appendQuery(const std::string& url, const QueryParams& params) {
    if (params.empty()) return url;

    std::string out = url;
    std::string sep;
    if (out.find('?') == std::string::npos) {
        sep = "?";
    } else if (out.back() != '?' && out.back() != '&') {
        sep = "&";
    }

    for (const auto& [key, value] : params) {
        out += sep + percentEncode(key) + "=" + percentEncode(value);
        sep = "&";
    }
    return out;
}

std::string percentEncode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs, int64_t maxMs) {
    // Exponential: base * 2^attempt, clamped to maxMs.
    int64_t backoff = maxMs;
    if (attempt < 32) {
        backoff = std::min(baseMs * (int64_t{1} << attempt), maxMs);
    }

    // Jitter: uniform random in [0, 100] ms.
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> jitter(0, 100);
    backoff += jitter(rng);

    return std::chrono::milliseconds(backoff);
}

// ---------------------------------------------------------------------------
// HTTP-date
// ---------------------------------------------------------------------------

namespace {

std::optional<std::tm> parseWithFormat(const std::string& value, const char* format) {
    std::tm tm{};
    std::istringstream in(value);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, format);
    if (in.fail()) {
        return std::nullopt;
    }
    in >> std::ws;
    if (!in.eof()) {
        return std::nullopt;   // trailing garbage
    }
    return tm;
}

std::time_t toUtcTime(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

} // namespace

std::optional<std::chrono::system_clock::time_point>
parseHttpDate(const std::string& value) {
    static constexpr const char* kFormats[] = {
        "%a, %d %b %Y %H:%M:%S GMT",   // IMF-fixdate: Sun, 06 Nov 1994 08:49:37 GMT
        "%A, %d-%b-%y %H:%M:%S GMT",   // RFC 850:     Sunday, 06-Nov-94 08:49:37 GMT
        "%a %b %d %H:%M:%S %Y",        // asctime:     Sun Nov  6 08:49:37 1994
    };

    const std::string text = trim(value);
    if (text.empty()) return std::nullopt;

    for (const char* format : kFormats) {
        auto tm = parseWithFormat(text, format);
        if (!tm) continue;

        const std::time_t t = toUtcTime(*tm);
        if (t == static_cast<std::time_t>(-1)) continue;
        return std::chrono::system_clock::from_time_t(t);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Strings
// ---------------------------------------------------------------------------

std::string trim(std::string_view text) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end   = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool isAllDigits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

// ---------------------------------------------------------------------------
// Base64 (memory values travel base64-encoded)
// ---------------------------------------------------------------------------

namespace {
constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

std::string base64Encode(std::string_view bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                           (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                            static_cast<unsigned char>(bytes[i + 2]);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += kBase64Alphabet[n & 0x3F];
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const uint32_t n = static_cast<unsigned char>(bytes[i]) << 16;
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const uint32_t n = (static_cast<unsigned char>(bytes[i]) << 16) |
                           (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string base64Decode(std::string_view text) {
    auto sextet = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+' || c == '-') return 62;
        if (c == '/' || c == '_') return 63;
        return -1;
    };

    std::string out;
    uint32_t acc  = 0;
    int      bits = 0;
    for (char c : text) {
        if (c == '=') break;
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        const int v = sextet(c);
        if (v < 0) {
            throw std::invalid_argument("Invalid base64 character");
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((acc >> bits) & 0xFF);
        }
    }
    return out;
}

} // namespace memclient
