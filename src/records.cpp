#include "records.hpp"
#include "util.hpp"

#include <stdexcept>

namespace memclient {

Memory parseMemory(const nlohmann::json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("Memory must be a JSON object");
    }

    Memory m;
    if (node.contains("key") && node["key"].is_string()) {
        m.key = node["key"].get<std::string>();
    } else if (node.contains("id") && node["id"].is_string()) {
        m.key = node["id"].get<std::string>();
    } else {
        throw std::runtime_error("Memory missing 'key' field");
    }

    if (!node.contains("value") || !node["value"].is_string()) {
        throw std::runtime_error("Memory '" + m.key + "' missing 'value' field");
    }
    try {
        m.value = base64Decode(node["value"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Memory '" + m.key + "' value is not base64: " + e.what());
    }
    return m;
}

nlohmann::json parseRawLine(const nlohmann::json& line) {
    return line;
}

std::string parseKeyLine(const nlohmann::json& line) {
    if (!line.is_object() || !line.contains("key") || !line["key"].is_string()) {
        throw std::runtime_error("Key record missing 'key' field");
    }
    return line["key"].get<std::string>();
}

SearchResult parseSearchResultLine(const nlohmann::json& line) {
    if (!line.is_object() || !line.contains("memory")) {
        throw std::runtime_error("Search result missing 'memory' field");
    }

    SearchResult result;
    result.memory = parseMemory(line["memory"]);

    // --- relevanceScore ---
    if (!line.contains("relevanceScore") || !line["relevanceScore"].is_number()) {
        throw std::runtime_error("Search result missing 'relevanceScore' field");
    }
    result.relevanceScore = line["relevanceScore"].get<double>();
    if (result.relevanceScore < 0.0 || result.relevanceScore > 1.0) {
        throw std::runtime_error("relevanceScore out of range [0, 1]");
    }
    return result;
}

} // namespace memclient
