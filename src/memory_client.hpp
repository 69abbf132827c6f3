#pragma once

#include "batch.hpp"
#include "cancellation.hpp"
#include "client.hpp"
#include "config.hpp"
#include "ndjson.hpp"
#include "records.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace memclient {

enum class DeleteOutcome {
    Deleted,
    AlreadyGone,   // the key did not exist (404); still a success
};

const char* toString(DeleteOutcome outcome);

struct SearchOptions {
    std::optional<int>    limit;
    std::optional<int>    offset;
    std::optional<double> minRelevanceScore;
    std::optional<int>    maxAgeHours;
    nlohmann::json        filters;   // null = no filters
};

using MemoryItems = std::vector<std::pair<std::string, std::string>>;

/// Namespaced memory store on top of Client.
///
/// Keys are 1..255 characters; values at most 1 MiB and travel base64
/// encoded. Invalid keys or values fail with RequestError before any I/O.
class MemoryClient {
public:
    static constexpr std::size_t kMaxKeyLength  = 255;
    static constexpr std::size_t kMaxValueBytes = 1024 * 1024;

    MemoryClient(Client client, Namespace ns, std::size_t batchConcurrency = 4);

    Result<void>                       put(const std::string& key, const std::string& value) const;
    Result<std::optional<std::string>> get(const std::string& key) const;
    Result<bool>                       exists(const std::string& key) const;
    Result<DeleteOutcome>              remove(const std::string& key) const;
    Result<void>                       clear() const;

    // --- batches: one round trip per key, tagged with one correlation id ---
    BatchResult<void>                       putMany(const MemoryItems& items) const;
    BatchResult<std::optional<std::string>> getMany(const std::vector<std::string>& keys) const;
    BatchResult<DeleteOutcome>              deleteMany(const std::vector<std::string>& keys) const;

    /// Single round trip to the server-side batch endpoint.
    BatchResult<nlohmann::json> putManyBulk(const MemoryItems& items) const;

    // --- streams ---
    Result<RecordStream<std::string>>  listKeys(const std::optional<CancellationToken>& cancel = std::nullopt) const;
    Result<RecordStream<SearchResult>> streamSearch(const std::string& query,
                                                    const SearchOptions& options = {},
                                                    const std::optional<CancellationToken>& cancel = std::nullopt) const;

    const Namespace& ns() const { return mNamespace; }

private:
    RequestOptions baseOptions(const std::optional<std::string>& correlationId) const;
    RequestOptions lookupOptions(const std::optional<std::string>& correlationId) const;

    Result<void>                       putOne(const std::string& key, const std::string& value,
                                              const std::optional<std::string>& correlationId) const;
    Result<std::optional<std::string>> getOne(const std::string& key,
                                              const std::optional<std::string>& correlationId) const;
    Result<DeleteOutcome>              removeOne(const std::string& key,
                                                 const std::optional<std::string>& correlationId) const;

    Client          mClient;
    Namespace       mNamespace;
    BatchAggregator mAggregator;
};

/// RequestError when @p key is empty or longer than MemoryClient::kMaxKeyLength.
std::optional<ClientError> validateKey(const std::string& key);

/// RequestError when @p value exceeds MemoryClient::kMaxValueBytes.
std::optional<ClientError> validateValue(const std::string& value);

/// HttpError with status 404.
bool isNotFound(const ClientError& error);

} // namespace memclient
