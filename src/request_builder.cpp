#include "request_builder.hpp"

#include <stdexcept>

namespace memclient {

Result<HttpRequest> buildRequest(const std::string& baseUrl,
                                 Method method,
                                 const std::string& path,
                                 const RequestOptions& options,
                                 const HeaderMap& defaultHeaders)
{
    HttpRequest request;
    request.method  = method;
    request.timeout = options.timeout;

    // --- URL ---
    try {
        request.url = appendQuery(resolveUrl(baseUrl, path), options.queryParams);
        parseUrl(request.url);
    } catch (const std::invalid_argument& e) {
        return RequestError{"Invalid request URL", std::string(e.what())};
    }

    // --- headers: per-call wins ---
    request.headers = defaultHeaders;
    for (const auto& [name, value] : options.headers) {
        request.headers[name] = value;
    }

    // --- body ---
    if (const auto* text = std::get_if<std::string>(&options.body)) {
        request.body = *text;
    } else if (const auto* value = std::get_if<nlohmann::json>(&options.body)) {
        try {
            request.body = value->dump();
        } catch (const nlohmann::json::exception& e) {
            return RequestError{"Failed to serialize request body", std::string(e.what())};
        }
    }

    if (request.body && request.headers.find("Content-Type") == request.headers.end()) {
        request.headers["Content-Type"] = "application/json";
    }

    return request;
}

} // namespace memclient
