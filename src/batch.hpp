#pragma once

#include "errors.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>

namespace memclient {

/// One keyed sub-operation of a batch.
template <typename T>
struct BatchOperation {
    std::string                 key;
    std::function<Result<T>()>  run;
};

template <typename T>
struct BatchItemOutcome {
    std::string key;
    Result<T>   result;
};

struct BatchFailure {
    std::string key;
    ClientError error;
};

/// Outcome of a batch in which at least one item failed. Items that
/// succeeded were applied; nothing is rolled back.
struct BatchPartialFailure {
    std::size_t                successes = 0;
    std::vector<std::string>   succeededKeys;   // input order
    std::vector<BatchFailure>  failures;        // input order
    std::optional<std::string> correlationId;
};

std::string describe(const BatchPartialFailure& failure);

template <typename T>
struct BatchValues { using type = std::vector<std::pair<std::string, T>>; };

template <>
struct BatchValues<void> { using type = void; };

/// Per-key values in input order (nothing for T = void).
template <typename T>
using BatchValuesOf = typename BatchValues<T>::type;

template <typename T>
using BatchResult = Result<BatchValuesOf<T>, BatchPartialFailure>;

// ---------------------------------------------------------------------------
// BatchAggregator
// ---------------------------------------------------------------------------

/// Runs keyed sub-operations on a bounded worker pool. Every operation runs
/// to completion regardless of its siblings' outcome; results come back in
/// input order.
class BatchAggregator {
public:
    /// @throws std::invalid_argument if concurrency is 0.
    explicit BatchAggregator(std::size_t concurrency = 4);

    template <typename T>
    std::vector<BatchItemOutcome<T>> runAll(const std::vector<BatchOperation<T>>& operations) const;

    template <typename T>
    BatchResult<T> run(const std::vector<BatchOperation<T>>& operations,
                       std::optional<std::string> correlationId = std::nullopt) const;

    std::size_t concurrency() const { return mConcurrency; }
    void        setVerbose(bool v) { mVerbose = v; }

private:
    std::size_t mConcurrency;
    bool        mVerbose = false;
};

/// Fold per-item outcomes into a BatchResult.
template <typename T>
BatchResult<T> aggregateOutcomes(std::vector<BatchItemOutcome<T>> outcomes,
                                 std::optional<std::string> correlationId = std::nullopt);

/// Per-key outcomes of a server-side batch body
/// {"correlationId"?, "results": [{"id", "status", "value"?, "error"?}]},
/// one per entry of @p keys and in that order.
std::vector<BatchItemOutcome<nlohmann::json>>
batchResponseOutcomes(const nlohmann::json& body,
                      const std::vector<std::string>& keys,
                      const std::string& url);

std::optional<std::string> batchCorrelationId(const nlohmann::json& body);

/// batchResponseOutcomes folded into a BatchResult carrying the server's correlation id.
BatchResult<nlohmann::json> aggregateBatchResponse(const nlohmann::json& body,
                                                   const std::vector<std::string>& keys,
                                                   const std::string& url);

// ---------------------------------------------------------------------------
// Template implementation
// ---------------------------------------------------------------------------

namespace detail {

template <typename T>
Result<T> invokeBatchOperation(const BatchOperation<T>& operation) {
    try {
        return operation.run();
    } catch (const std::exception& e) {
        return Result<T>(ClientError(RequestError{"Batch operation threw", std::string(e.what())}));
    } catch (...) {
        return Result<T>(ClientError(RequestError{"Batch operation threw", std::nullopt}));
    }
}

} // namespace detail

template <typename T>
std::vector<BatchItemOutcome<T>>
BatchAggregator::runAll(const std::vector<BatchOperation<T>>& operations) const {
    std::vector<std::optional<Result<T>>> slots(operations.size());

    if (!operations.empty()) {
        boost::asio::thread_pool pool(std::min(mConcurrency, operations.size()));
        for (std::size_t i = 0; i < operations.size(); ++i) {
            boost::asio::post(pool, [&operations, &slots, i] {
                slots[i].emplace(detail::invokeBatchOperation(operations[i]));
            });
        }
        pool.join();
    }

    std::vector<BatchItemOutcome<T>> outcomes;
    outcomes.reserve(operations.size());
    for (std::size_t i = 0; i < operations.size(); ++i) {
        if (mVerbose && !slots[i]->ok()) {
            std::cerr << "[Batch] " << operations[i].key << " failed: "
                      << describe(slots[i]->error()) << "\n";
        }
        outcomes.push_back(BatchItemOutcome<T>{operations[i].key, std::move(*slots[i])});
    }
    return outcomes;
}

template <typename T>
BatchResult<T> BatchAggregator::run(const std::vector<BatchOperation<T>>& operations,
                                    std::optional<std::string> correlationId) const {
    return aggregateOutcomes<T>(runAll(operations), std::move(correlationId));
}

template <typename T>
BatchResult<T> aggregateOutcomes(std::vector<BatchItemOutcome<T>> outcomes,
                                 std::optional<std::string> correlationId) {
    BatchPartialFailure failure;
    failure.correlationId = std::move(correlationId);

    std::conditional_t<std::is_void_v<T>, std::monostate, BatchValuesOf<T>> values;

    for (auto& outcome : outcomes) {
        if (outcome.result.ok()) {
            ++failure.successes;
            failure.succeededKeys.push_back(outcome.key);
            if constexpr (!std::is_void_v<T>) {
                values.emplace_back(outcome.key, std::move(outcome.result).value());
            }
        } else {
            failure.failures.push_back(BatchFailure{outcome.key, outcome.result.error()});
        }
    }

    if (!failure.failures.empty()) {
        return BatchResult<T>(std::move(failure));
    }
    if constexpr (std::is_void_v<T>) {
        return BatchResult<T>();
    } else {
        return BatchResult<T>(std::move(values));
    }
}

} // namespace memclient
