#include "memory_client.hpp"
#include "util.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <stdexcept>

namespace memclient {

namespace {

constexpr const char* kMemoriesPath = "/api/v1/memories";
constexpr const char* kBatchPath    = "/api/v1/memories/batch";

std::string memoryPath(const std::string& key) {
    return std::string(kMemoriesPath) + "/" + percentEncode(key);
}

std::string newCorrelationId() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace

const char* toString(DeleteOutcome outcome) {
    switch (outcome) {
        case DeleteOutcome::Deleted:     return "deleted";
        case DeleteOutcome::AlreadyGone: return "already gone";
    }
    return "unknown";
}

std::optional<ClientError> validateKey(const std::string& key) {
    if (key.empty() || key.size() > MemoryClient::kMaxKeyLength) {
        return ClientError(RequestError{
            "Invalid memory key",
            "key must be 1.." + std::to_string(MemoryClient::kMaxKeyLength)
                + " characters, got " + std::to_string(key.size())});
    }
    return std::nullopt;
}

std::optional<ClientError> validateValue(const std::string& value) {
    if (value.size() > MemoryClient::kMaxValueBytes) {
        return ClientError(RequestError{
            "Memory value too large",
            std::to_string(value.size()) + " bytes exceeds the "
                + std::to_string(MemoryClient::kMaxValueBytes) + " byte limit"});
    }
    return std::nullopt;
}

bool isNotFound(const ClientError& error) {
    const auto* http = std::get_if<HttpError>(&error);
    return http != nullptr && http->status == 404;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

MemoryClient::MemoryClient(Client client, Namespace ns, std::size_t batchConcurrency)
    : mClient(std::move(client))
    , mNamespace(std::move(ns))
    , mAggregator(batchConcurrency)
{
    mAggregator.setVerbose(mClient.config().verbose);
}

RequestOptions MemoryClient::baseOptions(const std::optional<std::string>& correlationId) const {
    RequestOptions options;
    options.headers["X-Memory-Namespace"] = mNamespace.str();
    if (correlationId) {
        options.headers["X-Correlation-Id"] = *correlationId;
    }
    return options;
}

/// A 404 on a single-key lookup is an answer, not a transient failure.
RequestOptions MemoryClient::lookupOptions(const std::optional<std::string>& correlationId) const {
    RequestOptions options = baseOptions(correlationId);
    options.retryIf = [classifier = mClient.config().retry.classifier](const ClientError& e) {
        return !isNotFound(e) && classifier && classifier(e);
    };
    return options;
}

// ---------------------------------------------------------------------------
// Single-key operations
// ---------------------------------------------------------------------------

Result<void> MemoryClient::put(const std::string& key, const std::string& value) const {
    return putOne(key, value, std::nullopt);
}

Result<std::optional<std::string>> MemoryClient::get(const std::string& key) const {
    return getOne(key, std::nullopt);
}

Result<DeleteOutcome> MemoryClient::remove(const std::string& key) const {
    return removeOne(key, std::nullopt);
}

Result<void> MemoryClient::putOne(const std::string& key,
                                  const std::string& value,
                                  const std::optional<std::string>& correlationId) const
{
    if (auto invalid = validateKey(key)) {
        return *invalid;
    }
    if (auto invalid = validateValue(value)) {
        return *invalid;
    }

    RequestOptions options = baseOptions(correlationId);
    options.body.emplace<nlohmann::json>(nlohmann::json{
        {"id",        key},
        {"value",     base64Encode(value)},
        {"namespace", mNamespace.str()},
    });

    auto response = mClient.request(Method::Post, kMemoriesPath, options);
    if (!response.ok()) {
        return response.error();
    }
    return Result<void>();
}

Result<std::optional<std::string>>
MemoryClient::getOne(const std::string& key, const std::optional<std::string>& correlationId) const
{
    if (auto invalid = validateKey(key)) {
        return *invalid;
    }

    auto response = mClient.request(Method::Get, memoryPath(key), lookupOptions(correlationId));
    if (!response.ok()) {
        if (isNotFound(response.error())) {
            return std::optional<std::string>{};
        }
        return response.error();
    }

    nlohmann::json node = response->body;
    if (node.is_object() && !node.contains("key") && !node.contains("id")) {
        node["key"] = key;
    }
    try {
        return std::optional<std::string>(parseMemory(node).value);
    } catch (const std::runtime_error& e) {
        return ClientError(RequestError{"Unexpected memory response", std::string(e.what())});
    }
}

Result<bool> MemoryClient::exists(const std::string& key) const {
    if (auto invalid = validateKey(key)) {
        return *invalid;
    }

    auto response = mClient.request(Method::Get, memoryPath(key), lookupOptions(std::nullopt));
    if (!response.ok()) {
        if (isNotFound(response.error())) {
            return false;
        }
        return response.error();
    }
    return true;
}

Result<DeleteOutcome>
MemoryClient::removeOne(const std::string& key, const std::optional<std::string>& correlationId) const
{
    if (auto invalid = validateKey(key)) {
        return *invalid;
    }

    auto response = mClient.request(Method::Delete, memoryPath(key), lookupOptions(correlationId));
    if (!response.ok()) {
        if (isNotFound(response.error())) {
            return DeleteOutcome::AlreadyGone;
        }
        return response.error();
    }
    return DeleteOutcome::Deleted;
}

Result<void> MemoryClient::clear() const {
    RequestOptions options = baseOptions(std::nullopt);
    options.queryParams = {{"namespace", mNamespace.str()}};

    auto response = mClient.request(Method::Delete, kMemoriesPath, options);
    if (!response.ok()) {
        return response.error();
    }
    return Result<void>();
}

// ---------------------------------------------------------------------------
// Batches
// ---------------------------------------------------------------------------

BatchResult<void> MemoryClient::putMany(const MemoryItems& items) const {
    const std::string correlationId = newCorrelationId();

    std::vector<BatchOperation<void>> operations;
    operations.reserve(items.size());
    for (const auto& item : items) {
        operations.push_back({item.first, [this, item, correlationId] {
            return putOne(item.first, item.second, correlationId);
        }});
    }
    return mAggregator.run(operations, correlationId);
}

BatchResult<std::optional<std::string>>
MemoryClient::getMany(const std::vector<std::string>& keys) const {
    const std::string correlationId = newCorrelationId();

    std::vector<BatchOperation<std::optional<std::string>>> operations;
    operations.reserve(keys.size());
    for (const auto& key : keys) {
        operations.push_back({key, [this, key, correlationId] {
            return getOne(key, correlationId);
        }});
    }
    return mAggregator.run(operations, correlationId);
}

BatchResult<DeleteOutcome> MemoryClient::deleteMany(const std::vector<std::string>& keys) const {
    const std::string correlationId = newCorrelationId();

    std::vector<BatchOperation<DeleteOutcome>> operations;
    operations.reserve(keys.size());
    for (const auto& key : keys) {
        operations.push_back({key, [this, key, correlationId] {
            return removeOne(key, correlationId);
        }});
    }
    return mAggregator.run(operations, correlationId);
}

BatchResult<nlohmann::json> MemoryClient::putManyBulk(const MemoryItems& items) const {
    const std::string correlationId = newCorrelationId();

    std::vector<std::optional<BatchItemOutcome<nlohmann::json>>> slots(items.size());
    std::vector<std::string> sentKeys;
    std::vector<std::size_t> sentIndex;
    nlohmann::json payload = nlohmann::json::array();

    // --- local validation; invalid items are never sent ---
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& [key, value] = items[i];
        auto invalid = validateKey(key);
        if (!invalid) {
            invalid = validateValue(value);
        }
        if (invalid) {
            slots[i].emplace(BatchItemOutcome<nlohmann::json>{key, Result<nlohmann::json>(*invalid)});
            continue;
        }
        payload.push_back(nlohmann::json{{"id", key}, {"value", base64Encode(value)}});
        sentKeys.push_back(key);
        sentIndex.push_back(i);
    }

    std::optional<std::string> reportedId = correlationId;

    if (!sentKeys.empty()) {
        RequestOptions options = baseOptions(correlationId);
        options.body.emplace<nlohmann::json>(nlohmann::json{
            {"namespace",     mNamespace.str()},
            {"correlationId", correlationId},
            {"items",         payload},
        });

        auto response = mClient.request(Method::Post, kBatchPath, options);

        std::vector<BatchItemOutcome<nlohmann::json>> sent;
        if (!response.ok()) {
            for (const auto& key : sentKeys) {
                sent.push_back({key, Result<nlohmann::json>(response.error())});
            }
        } else {
            const std::string url = resolveUrl(mClient.config().baseUrl.str(), kBatchPath);
            sent = batchResponseOutcomes(response->body, sentKeys, url);
            if (auto serverId = batchCorrelationId(response->body)) {
                reportedId = std::move(serverId);
            }
        }

        for (std::size_t j = 0; j < sent.size(); ++j) {
            slots[sentIndex[j]].emplace(std::move(sent[j]));
        }
    }

    std::vector<BatchItemOutcome<nlohmann::json>> outcomes;
    outcomes.reserve(slots.size());
    for (auto& slot : slots) {
        outcomes.push_back(std::move(*slot));
    }
    return aggregateOutcomes(std::move(outcomes), std::move(reportedId));
}

// ---------------------------------------------------------------------------
// Streams
// ---------------------------------------------------------------------------

Result<RecordStream<std::string>>
MemoryClient::listKeys(const std::optional<CancellationToken>& cancel) const {
    RequestOptions options = baseOptions(std::nullopt);
    options.headers["Accept"] = "application/x-ndjson";
    options.cancel = cancel;

    return mClient.streamRecords<std::string>(
        Method::Get, "/v1/keys/" + percentEncode(mNamespace.str()), parseKeyLine, options);
}

Result<RecordStream<SearchResult>>
MemoryClient::streamSearch(const std::string& query,
                           const SearchOptions& search,
                           const std::optional<CancellationToken>& cancel) const
{
    if (isBlank(query)) {
        return ClientError(RequestError{"Search query must not be empty", std::nullopt});
    }
    if (search.limit && *search.limit <= 0) {
        return ClientError(RequestError{"Search limit must be positive", std::nullopt});
    }
    if (search.minRelevanceScore &&
        (*search.minRelevanceScore < 0.0 || *search.minRelevanceScore > 1.0)) {
        return ClientError(RequestError{"minRelevanceScore must be within [0, 1]", std::nullopt});
    }

    nlohmann::json body{{"query", query}};
    if (search.limit)             body["limit"]             = *search.limit;
    if (search.offset)            body["offset"]            = *search.offset;
    if (search.minRelevanceScore) body["minRelevanceScore"] = *search.minRelevanceScore;
    if (search.maxAgeHours)       body["maxAgeHours"]       = *search.maxAgeHours;
    if (!search.filters.is_null()) body["filters"]          = search.filters;

    RequestOptions options = baseOptions(std::nullopt);
    options.headers["Accept"] = "application/x-ndjson";
    options.body.emplace<nlohmann::json>(std::move(body));
    options.cancel = cancel;

    return mClient.streamRecords<SearchResult>(
        Method::Post, "/v1/search/" + percentEncode(mNamespace.str()) + "/stream",
        parseSearchResultLine, options);
}

} // namespace memclient
