#include "protocol/types.hpp"

#include <gtest/gtest.h>

#include <vector>

#include <nlohmann/json.hpp>

using namespace mlld::protocol;
using json = nlohmann::json;

namespace {

StateWrite make_write(const std::string &path, json value) {
    StateWrite write;
    write.path = path;
    write.value = std::move(value);
    return write;
}

}  // namespace

/******************************************************************************
 * merge_state_writes
 ******************************************************************************/

TEST(StateWriteMergeTest, KeepsPrimaryOrderThenAppendsNewSecondaryWrites) {
    std::vector<StateWrite> primary = {make_write("count", 2), make_write("done", true)};
    std::vector<StateWrite> secondary = {make_write("count", 2), make_write("extra", "x")};

    auto merged = merge_state_writes(primary, secondary);

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].path, "count");
    EXPECT_EQ(merged[1].path, "done");
    EXPECT_EQ(merged[2].path, "extra");
}

TEST(StateWriteMergeTest, SamePathWithDifferentValuesIsKept) {
    std::vector<StateWrite> primary = {make_write("count", 1)};
    std::vector<StateWrite> secondary = {make_write("count", 2)};

    auto merged = merge_state_writes(primary, secondary);

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].value, 1);
    EXPECT_EQ(merged[1].value, 2);
}

TEST(StateWriteMergeTest, FirstSeenWinsWhenTimestampsDiffer) {
    StateWrite embedded = make_write("count", 2);
    embedded.timestamp = "2026-01-01T00:00:00.000Z";
    StateWrite from_event = make_write("count", 2);
    from_event.timestamp = "2026-01-01T00:00:01.000Z";

    auto merged = merge_state_writes({embedded}, {from_event});

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].timestamp, embedded.timestamp);
}

TEST(StateWriteMergeTest, EmptySideReturnsOtherUnchanged) {
    std::vector<StateWrite> writes = {make_write("a", 1), make_write("a", 1)};

    EXPECT_EQ(merge_state_writes(writes, {}), writes);
    EXPECT_EQ(merge_state_writes({}, writes), writes);
    EXPECT_TRUE(merge_state_writes({}, {}).empty());
}

TEST(StateWriteMergeTest, KeyUsesSerializedValue) {
    EXPECT_EQ(state_write_key(make_write("user", json{{"name", "ada"}})), "user|{\"name\":\"ada\"}");
    EXPECT_NE(state_write_key(make_write("n", 1)), state_write_key(make_write("n", "1")));
}

/******************************************************************************
 * Result decoding
 ******************************************************************************/

TEST(ResultShapeTest, ExecuteResultDecodesCamelCaseFields) {
    json payload = {{"output", "count=2\n"},
                    {"stateWrites", {{{"path", "count"}, {"value", 2}}}},
                    {"exports", {{"greet", "fn"}}},
                    {"effects", {{{"type", "doc"}, {"content", "count=2\n"}}}},
                    {"metrics", {{"totalMs", 3.5}, {"parseMs", 1.0}, {"evaluateMs", 2.5}}}};

    auto result = payload.get<ExecuteResult>();

    EXPECT_EQ(result.output, "count=2\n");
    ASSERT_EQ(result.state_writes.size(), 1u);
    EXPECT_EQ(result.state_writes[0].path, "count");
    EXPECT_EQ(result.exports["greet"], "fn");
    ASSERT_EQ(result.effects.size(), 1u);
    EXPECT_EQ(result.effects[0].type, "doc");
    EXPECT_EQ(result.effects[0].content, std::optional<std::string>("count=2\n"));
    ASSERT_TRUE(result.metrics.has_value());
    EXPECT_DOUBLE_EQ(result.metrics->total_ms, 3.5);
    EXPECT_DOUBLE_EQ(result.metrics->evaluate_ms, 2.5);
}

TEST(ResultShapeTest, ExecuteResultDefaultsOptionalFields) {
    auto result = json{{"output", "hi"}}.get<ExecuteResult>();

    EXPECT_EQ(result.output, "hi");
    EXPECT_TRUE(result.state_writes.empty());
    EXPECT_TRUE(result.exports.is_null());
    EXPECT_TRUE(result.effects.empty());
    EXPECT_FALSE(result.metrics.has_value());
}

TEST(ResultShapeTest, ExecuteResultWithoutOutputThrows) {
    EXPECT_THROW(json({{"value", 1}}).get<ExecuteResult>(), nlohmann::json::exception);
    EXPECT_THROW(json({{"output", 42}}).get<ExecuteResult>(), nlohmann::json::exception);
}

TEST(ResultShapeTest, AnalyzeResultDecodes) {
    json payload = {{"filepath", "/tmp/mod.mld"},
                    {"valid", false},
                    {"errors", {{{"message", "Unexpected token"}, {"line", 3}, {"column", 7}}}},
                    {"executables", {{{"name", "greet"}, {"params", {"name"}}, {"labels", {"net:r"}}}}},
                    {"exports", {"greet"}},
                    {"imports", {{{"from", "@alice/utils"}, {"names", {"slug"}}}}},
                    {"guards", {{{"name", "secret"}, {"timing", "before"}, {"label", "secret"}}}},
                    {"needs", {{"cmd", {"git"}}, {"node", json::array()}}}};

    auto result = payload.get<AnalyzeResult>();

    EXPECT_EQ(result.filepath, "/tmp/mod.mld");
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].line, std::optional<uint32_t>(3));
    ASSERT_EQ(result.executables.size(), 1u);
    EXPECT_EQ(result.executables[0].params, std::vector<std::string>{"name"});
    EXPECT_EQ(result.exports, std::vector<std::string>{"greet"});
    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_EQ(result.imports[0].from, "@alice/utils");
    ASSERT_EQ(result.guards.size(), 1u);
    EXPECT_EQ(result.guards[0].label, std::optional<std::string>("secret"));
    ASSERT_TRUE(result.needs.has_value());
    EXPECT_EQ(result.needs->cmd, std::vector<std::string>{"git"});
    EXPECT_TRUE(result.needs->py.empty());
}

TEST(ResultShapeTest, AnalyzeResultRequiresValidFlag) {
    EXPECT_THROW(json({{"filepath", "x"}, {"valid", "yes"}}).get<AnalyzeResult>(), nlohmann::json::exception);
    EXPECT_THROW(json({{"valid", true}}).get<AnalyzeResult>(), nlohmann::json::exception);
}

TEST(ResultShapeTest, StateWriteSerializesTimestampOnlyWhenPresent) {
    json plain = make_write("count", 2);
    EXPECT_FALSE(plain.contains("timestamp"));

    StateWrite stamped = make_write("count", 2);
    stamped.timestamp = "2026-01-01T00:00:00.000Z";
    json with_time = stamped;
    EXPECT_EQ(with_time["timestamp"], "2026-01-01T00:00:00.000Z");
}
