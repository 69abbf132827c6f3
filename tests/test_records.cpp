/// @file test_records.cpp
/// Unit tests for the JSON -> record mapping functions.

#include "records.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace memclient;
using json = nlohmann::json;

// ============================================================================
// parseMemory
// ============================================================================

TEST(ParseMemory, KeyAndBase64Value) {
    auto m = parseMemory(json{{"key", "greeting"}, {"value", "aGVsbG8gd29ybGQ="}});
    EXPECT_EQ(m.key, "greeting");
    EXPECT_EQ(m.value, "hello world");
}

TEST(ParseMemory, IdIsAcceptedForKey) {
    auto m = parseMemory(json{{"id", "k1"}, {"value", "dg=="}});
    EXPECT_EQ(m.key, "k1");
    EXPECT_EQ(m.value, "v");
}

TEST(ParseMemory, KeyTakesPrecedenceOverId) {
    auto m = parseMemory(json{{"id", "old"}, {"key", "new"}, {"value", ""}});
    EXPECT_EQ(m.key, "new");
    EXPECT_EQ(m.value, "");
}

TEST(ParseMemory, MissingKeyThrows) {
    EXPECT_THROW(parseMemory(json{{"value", "dg=="}}), std::runtime_error);
}

TEST(ParseMemory, MissingValueThrows) {
    EXPECT_THROW(parseMemory(json{{"key", "k"}}), std::runtime_error);
    EXPECT_THROW(parseMemory(json{{"key", "k"}, {"value", 5}}), std::runtime_error);
}

TEST(ParseMemory, NonBase64ValueThrows) {
    EXPECT_THROW(parseMemory(json{{"key", "k"}, {"value", "not base64!"}}), std::runtime_error);
}

TEST(ParseMemory, NonObjectThrows) {
    EXPECT_THROW(parseMemory(json::array()), std::runtime_error);
    EXPECT_THROW(parseMemory(json("k")), std::runtime_error);
}

// ============================================================================
// Line parsers
// ============================================================================

TEST(ParseKeyLine, ExtractsKey) {
    EXPECT_EQ(parseKeyLine(json{{"key", "user:42"}}), "user:42");
}

TEST(ParseKeyLine, RejectsOtherShapes) {
    EXPECT_THROW(parseKeyLine(json{{"id", "x"}}), std::runtime_error);
    EXPECT_THROW(parseKeyLine(json{{"key", 1}}), std::runtime_error);
    EXPECT_THROW(parseKeyLine(json("x")), std::runtime_error);
}

TEST(ParseRawLine, PassesThrough) {
    json line = {{"anything", json::array({1, 2})}};
    EXPECT_EQ(parseRawLine(line), line);
}

TEST(ParseSearchResultLine, MapsMemoryAndScore) {
    auto r = parseSearchResultLine(json{
        {"memory", {{"key", "doc"}, {"value", "Zm9v"}}},
        {"relevanceScore", 0.75},
    });
    EXPECT_EQ(r.memory.key, "doc");
    EXPECT_EQ(r.memory.value, "foo");
    EXPECT_DOUBLE_EQ(r.relevanceScore, 0.75);
}

TEST(ParseSearchResultLine, IntegerScoresAreAccepted) {
    auto r = parseSearchResultLine(json{
        {"memory", {{"key", "doc"}, {"value", ""}}},
        {"relevanceScore", 1},
    });
    EXPECT_DOUBLE_EQ(r.relevanceScore, 1.0);
}

TEST(ParseSearchResultLine, ScoreOutOfRangeThrows) {
    EXPECT_THROW(parseSearchResultLine(json{
                     {"memory", {{"key", "doc"}, {"value", ""}}},
                     {"relevanceScore", 1.5},
                 }),
                 std::runtime_error);
    EXPECT_THROW(parseSearchResultLine(json{
                     {"memory", {{"key", "doc"}, {"value", ""}}},
                     {"relevanceScore", -0.1},
                 }),
                 std::runtime_error);
}

TEST(ParseSearchResultLine, MissingFieldsThrow) {
    EXPECT_THROW(parseSearchResultLine(json{{"relevanceScore", 0.5}}), std::runtime_error);
    EXPECT_THROW(parseSearchResultLine(json{{"memory", {{"key", "doc"}, {"value", ""}}}}),
                 std::runtime_error);
    EXPECT_THROW(parseSearchResultLine(json{
                     {"memory", {{"key", "doc"}, {"value", ""}}},
                     {"relevanceScore", "high"},
                 }),
                 std::runtime_error);
}
