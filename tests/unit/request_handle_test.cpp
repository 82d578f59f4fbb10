/**
 * request_handle_test.cpp - Handle caching and result decoding
 *
 * Uses MockRequestIssuer so the handle logic is tested without a worker.
 */

#include "client/request_handle.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "mocks/mock_request_issuer.hpp"

using namespace mlld;
using namespace mlld::client;
using namespace mlld::tests;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

protocol::StateWrite make_write(const std::string &path, json value) {
    protocol::StateWrite write;
    write.path = path;
    write.value = std::move(value);
    return write;
}

}  // namespace

class RequestHandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        issuer = std::make_shared<StrictMock<MockRequestIssuer>>();
        auto [sender, receiver] = transport::make_channel();
        sender_ = std::move(sender);
        pending.id = 7;
        pending.session_generation = 3;
        pending.receiver = std::move(receiver);
    }

    RequestHandle MakeHandle(OptionalTimeout timeout = 250ms) {
        return RequestHandle(issuer, std::move(pending), timeout);
    }

    // Resolves await_request with the given payload and event writes
    static auto Resolve(json payload, std::vector<protocol::StateWrite> writes = {}) {
        return [payload, writes](PendingRequest &, OptionalTimeout, RawResult &result, Error &) {
            result.payload = payload;
            result.state_writes = writes;
            return true;
        };
    }

    std::shared_ptr<StrictMock<MockRequestIssuer>> issuer;
    PendingRequest pending;
    transport::ChannelSender sender_;
};

TEST_F(RequestHandleTest, SecondWaitReturnsCachedResult) {
    EXPECT_CALL(*issuer, await_request(_, OptionalTimeout(250ms), _, _))
        .Times(1)
        .WillOnce(Invoke(Resolve({{"id", 7}, {"output", "hello\n"}})));

    ProcessHandle handle(MakeHandle());
    std::string first;
    std::string second;
    Error error;

    ASSERT_TRUE(handle.wait(first, error));
    ASSERT_TRUE(handle.result(second, error));
    EXPECT_EQ(first, "hello\n");
    EXPECT_EQ(second, first);
}

TEST_F(RequestHandleTest, FailedWaitConsumesReceiver) {
    EXPECT_CALL(*issuer, await_request(_, _, _, _))
        .WillOnce(Invoke([](PendingRequest &, OptionalTimeout timeout, RawResult &, Error &error) {
            error = Error::timed_out(*timeout);
            return false;
        }));

    ProcessHandle handle(MakeHandle());
    std::string output;
    Error error;

    EXPECT_FALSE(handle.wait(output, error));
    EXPECT_EQ(error.kind, ErrorKind::TIMEOUT);

    Error again;
    EXPECT_FALSE(handle.wait(output, again));
    EXPECT_EQ(again.kind, ErrorKind::USAGE);
    EXPECT_EQ(again.message, "request handle already awaited");
}

TEST_F(RequestHandleTest, UnboundHandleReportsUsageError) {
    ProcessHandle handle;
    std::string output;
    Error error;

    EXPECT_FALSE(handle.wait(output, error));
    EXPECT_EQ(error.kind, ErrorKind::USAGE);
    EXPECT_EQ(error.message, "request handle is not bound to a request");

    EXPECT_FALSE(handle.update_state("flag", true, error));
    EXPECT_EQ(error.kind, ErrorKind::USAGE);
    EXPECT_NO_THROW(handle.cancel());
}

TEST_F(RequestHandleTest, CancelTargetsRequestOnItsSession) {
    EXPECT_CALL(*issuer, cancel_request(7u, 3u)).Times(2);

    RequestHandle handle = MakeHandle();
    handle.cancel();
    handle.cancel();
}

TEST_F(RequestHandleTest, UpdateStatePassesHandleTimeout) {
    EXPECT_CALL(*issuer, update_state_request(7u, "exit", json(true), OptionalTimeout(1000ms), _))
        .WillOnce(Return(true));

    ExecuteHandle handle(MakeHandle(1000ms));
    Error error;
    EXPECT_TRUE(handle.update_state("exit", true, error));
}

TEST_F(RequestHandleTest, UpdateStateErrorIsForwarded) {
    EXPECT_CALL(*issuer, update_state_request(_, _, _, OptionalTimeout(), _))
        .WillOnce(Invoke([](protocol::RequestId id, const std::string &, const json &, OptionalTimeout, Error &error) {
            error = Error::worker("No active request for id " + std::to_string(id), "REQUEST_NOT_FOUND");
            return false;
        }));

    RequestHandle handle = MakeHandle(std::nullopt);
    Error error;
    EXPECT_FALSE(handle.update_state("exit", true, error));
    EXPECT_EQ(error.message, "No active request for id 7");
    EXPECT_TRUE(error.has_code("REQUEST_NOT_FOUND"));
}

TEST_F(RequestHandleTest, MovedHandleKeepsRequest) {
    EXPECT_CALL(*issuer, await_request(_, _, _, _)).WillOnce(Invoke(Resolve({{"output", "moved"}})));

    ProcessHandle original(MakeHandle());
    ProcessHandle moved = std::move(original);
    std::string output;
    Error error;

    EXPECT_EQ(moved.request_id(), 7u);
    ASSERT_TRUE(moved.wait(output, error));
    EXPECT_EQ(output, "moved");
}

TEST_F(RequestHandleTest, ExecuteWaitTwiceReturnsSameWrites) {
    json payload = {{"id", 7},
                    {"output", "count=2\n"},
                    {"stateWrites", {{{"path", "count"}, {"value", 2}}}}};
    EXPECT_CALL(*issuer, await_request(_, _, _, _))
        .WillOnce(Invoke(Resolve(payload, {make_write("count", 2), make_write("other", "x")})));

    ExecuteHandle handle(MakeHandle());
    protocol::ExecuteResult first;
    protocol::ExecuteResult second;
    Error error;

    ASSERT_TRUE(handle.wait(first, error));
    ASSERT_TRUE(handle.wait(second, error));
    ASSERT_EQ(first.state_writes.size(), 2u);
    EXPECT_EQ(first.state_writes, second.state_writes);
    EXPECT_EQ(first.output, second.output);
}

/******************************************************************************
 * Result decoding
 ******************************************************************************/

TEST(ProcessOutputTest, PrefersOutputThenValue) {
    EXPECT_EQ(extract_process_output({{"output", "text"}, {"value", "ignored"}}), "text");
    EXPECT_EQ(extract_process_output({{"value", "plain"}}), "plain");
    EXPECT_EQ(extract_process_output({{"value", {1, 2}}}), "[1,2]");
    EXPECT_EQ(extract_process_output({{"value", nullptr}}), "null");
    EXPECT_EQ(extract_process_output({{"id", 1}}), "");
    EXPECT_EQ(extract_process_output(json("not an object")), "");
}

TEST(ExecuteDecodeTest, StripsIdAndFallsBackToSerializedPayload) {
    auto result = decode_execute_result({{"id", 4}, {"answer", 42}}, {make_write("seen", true)});

    EXPECT_EQ(json::parse(result.output), json({{"answer", 42}}));
    ASSERT_EQ(result.state_writes.size(), 1u);
    EXPECT_EQ(result.state_writes[0].path, "seen");
}

TEST(ExecuteDecodeTest, EmbeddedWritesComeBeforeEventWrites) {
    json payload = {{"output", ""},
                    {"stateWrites", {{{"path", "b"}, {"value", 1}}, {{"path", "a"}, {"value", 1}}}}};

    auto result = decode_execute_result(payload, {make_write("a", 1), make_write("c", 1)});

    ASSERT_EQ(result.state_writes.size(), 3u);
    EXPECT_EQ(result.state_writes[0].path, "b");
    EXPECT_EQ(result.state_writes[1].path, "a");
    EXPECT_EQ(result.state_writes[2].path, "c");
}
