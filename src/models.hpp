#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace memclient {

/// Orders header names without regard to ASCII case ("content-type" == "Content-Type").
struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

enum class Method { Get, Post, Put, Patch, Delete };

const char* toString(Method method);

/// Fully built request, ready for the transport. Built fresh per call.
struct HttpRequest {
    Method                                   method = Method::Get;
    std::string                              url;       // absolute, query included
    HeaderMap                                headers;
    std::optional<std::string>               body;      // serialized bytes
    std::optional<std::chrono::milliseconds> timeout;
};

/// Successful (non-error) response.
struct HttpResponse {
    unsigned int   status = 0;
    HeaderMap      headers;
    nlohmann::json body;   // JSON value, raw text (string) for text/NDJSON, null otherwise

    bool hasBody() const { return !body.is_null(); }

    /// Raw text of a text/* or NDJSON body.
    std::optional<std::string> text() const;
};

} // namespace memclient
