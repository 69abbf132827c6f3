#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace memclient {

/// A stored memory. value holds the decoded bytes.
struct Memory {
    std::string key;
    std::string value;
};

struct SearchResult {
    Memory memory;
    double relevanceScore = 0.0;   // 0.0 .. 1.0
};

/// Map a memory JSON node ({"key"|"id", "value": base64}) into a Memory.
/// Throws std::runtime_error if the expected shape is missing.
Memory parseMemory(const nlohmann::json& node);

// ---------------------------------------------------------------------------
// NDJSON line parsers for RecordStream. Each throws on an unexpected shape.
// ---------------------------------------------------------------------------

/// Passes the parsed line through unchanged.
nlohmann::json parseRawLine(const nlohmann::json& line);

/// {"key": "..."} -> key.
std::string parseKeyLine(const nlohmann::json& line);

/// {"memory": {...}, "relevanceScore": n} -> SearchResult.
SearchResult parseSearchResultLine(const nlohmann::json& line);

} // namespace memclient
