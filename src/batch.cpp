#include "batch.hpp"

#include <map>
#include <stdexcept>

namespace memclient {

namespace {

std::string itemMessage(const nlohmann::json& row, int status) {
    if (row.contains("error")) {
        const auto& error = row["error"];
        if (error.is_string()) {
            return error.get<std::string>();
        }
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
    }
    return "Item failed with status " + std::to_string(status);
}

bool hasError(const nlohmann::json& row) {
    return row.contains("error") && !row["error"].is_null();
}

} // namespace

std::string describe(const BatchPartialFailure& failure) {
    std::string out = std::to_string(failure.successes) + " succeeded, "
                    + std::to_string(failure.failures.size()) + " failed";
    if (failure.correlationId) {
        out += " (correlation id " + *failure.correlationId + ")";
    }
    for (const auto& item : failure.failures) {
        out += "\n  " + item.key + ": " + describe(item.error);
    }
    return out;
}

BatchAggregator::BatchAggregator(std::size_t concurrency)
    : mConcurrency(concurrency)
{
    if (mConcurrency == 0) {
        throw std::invalid_argument("BatchAggregator concurrency must be >= 1");
    }
}

// ---------------------------------------------------------------------------
// Server-side batch bodies
// ---------------------------------------------------------------------------

std::optional<std::string> batchCorrelationId(const nlohmann::json& body) {
    if (body.is_object() && body.contains("correlationId") && body["correlationId"].is_string()) {
        return body["correlationId"].get<std::string>();
    }
    return std::nullopt;
}

std::vector<BatchItemOutcome<nlohmann::json>>
batchResponseOutcomes(const nlohmann::json& body,
                      const std::vector<std::string>& keys,
                      const std::string& url)
{
    std::vector<BatchItemOutcome<nlohmann::json>> outcomes;
    outcomes.reserve(keys.size());

    if (!body.is_object() || !body.contains("results") || !body["results"].is_array()) {
        for (const auto& key : keys) {
            outcomes.push_back({key, Result<nlohmann::json>(ClientError(
                RequestError{"Malformed batch response", std::string("missing 'results' array")}))});
        }
        return outcomes;
    }

    // --- index rows by id (first occurrence wins) ---
    std::map<std::string, const nlohmann::json*> rows;
    for (const auto& row : body["results"]) {
        if (!row.is_object() || !row.contains("id") || !row["id"].is_string()) {
            std::cerr << "[Batch] WARNING: discarding unparseable batch row: "
                      << row.dump() << "\n";
            continue;
        }
        rows.emplace(row["id"].get<std::string>(), &row);
    }

    for (const auto& key : keys) {
        auto it = rows.find(key);
        if (it == rows.end()) {
            outcomes.push_back({key, Result<nlohmann::json>(ClientError(
                RequestError{"Item " + key + " not processed by backend", std::nullopt}))});
            continue;
        }

        const nlohmann::json& row = *it->second;
        const int status = row.contains("status") && row["status"].is_number_integer()
                         ? row["status"].get<int>()
                         : 200;

        if (status == 401 || status == 403) {
            outcomes.push_back({key, Result<nlohmann::json>(ClientError(AuthorizationError{
                "Unauthorized: " + itemMessage(row, status), url, static_cast<unsigned int>(status)}))});
        } else if (status == 429) {
            outcomes.push_back({key, Result<nlohmann::json>(ClientError(
                RateLimitError{std::nullopt, url}))});
        } else if (status >= 400 || hasError(row)) {
            outcomes.push_back({key, Result<nlohmann::json>(ClientError(HttpError{
                static_cast<unsigned int>(status), itemMessage(row, status), url, row}))});
        } else {
            outcomes.push_back({key, Result<nlohmann::json>(
                row.contains("value") ? row["value"] : nlohmann::json())});
        }
    }
    return outcomes;
}

BatchResult<nlohmann::json> aggregateBatchResponse(const nlohmann::json& body,
                                                   const std::vector<std::string>& keys,
                                                   const std::string& url)
{
    return aggregateOutcomes(batchResponseOutcomes(body, keys, url), batchCorrelationId(body));
}

} // namespace memclient
