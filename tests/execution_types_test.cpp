#include <gtest/gtest.h>

#include "snipbox/core/execution_types.hpp"
#include "snipbox/core/worker.hpp"

#include <limits>
#include <stdexcept>

using namespace snipbox::core;
using json = nlohmann::ordered_json;

TEST(ExecutionTypes, StatusNamesRoundTrip) {
    for (auto status : {OutcomeStatus::COMPLETED, OutcomeStatus::SNIPPET_ERROR,
                        OutcomeStatus::STORE_UNAVAILABLE, OutcomeStatus::TIMEOUT,
                        OutcomeStatus::WORKER_CRASH}) {
        auto parsed = OutcomeStatusFromString(OutcomeStatusToString(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(status, *parsed);
    }
    EXPECT_STREQ("timeout", OutcomeStatusToString(OutcomeStatus::TIMEOUT));
    EXPECT_FALSE(OutcomeStatusFromString("exploded").has_value());
}

TEST(ExecutionTypes, RequestFromJson) {
    auto request = json::parse(R"({"code": "result = 1", "db_path": "/tmp/x.sqlite3", "args": {"n": 3}})")
                       .get<ExecutionRequest>();

    EXPECT_EQ("result = 1", request.code);
    ASSERT_TRUE(request.db_path.has_value());
    EXPECT_EQ("/tmp/x.sqlite3", request.db_path->string());
    EXPECT_EQ(3, request.args["n"].get<int>());
}

TEST(ExecutionTypes, RequestOptionalFields) {
    auto minimal = json::parse(R"({"code": "pass"})").get<ExecutionRequest>();
    EXPECT_FALSE(minimal.db_path.has_value());
    EXPECT_TRUE(minimal.args.is_object());
    EXPECT_TRUE(minimal.args.empty());

    auto nulls = json::parse(R"({"code": "pass", "db_path": null, "args": null})").get<ExecutionRequest>();
    EXPECT_FALSE(nulls.db_path.has_value());
    EXPECT_TRUE(nulls.args.is_object());

    auto empty_path = json::parse(R"({"code": "pass", "db_path": ""})").get<ExecutionRequest>();
    EXPECT_FALSE(empty_path.db_path.has_value());
}

TEST(ExecutionTypes, RequestRejectsBadFields) {
    EXPECT_THROW(json::parse(R"({"args": {}})").get<ExecutionRequest>(), nlohmann::json::exception);
    EXPECT_THROW(json::parse(R"({"code": 5})").get<ExecutionRequest>(), nlohmann::json::exception);
    EXPECT_THROW(json::parse(R"({"code": "x", "args": [1, 2]})").get<ExecutionRequest>(),
                 std::invalid_argument);
}

TEST(ExecutionTypes, OutcomeToJsonOmitsAbsentError) {
    ExecutionOutcome outcome;
    outcome.result = 2;

    const json j = outcome;
    EXPECT_EQ(R"({"result":2,"stdout":""})", j.dump());
}

TEST(ExecutionTypes, FailureOutcomeToJson) {
    const json j = ExecutionOutcome::Failure(OutcomeStatus::TIMEOUT, "timeout after 1s");
    EXPECT_EQ(R"({"result":null,"stdout":"","error":"timeout after 1s"})", j.dump());
}

// ============================================================================
// Worker message codec
// ============================================================================

TEST(WorkerMessage, SuccessKeepsResultKeyOrder) {
    json result = json::object();
    result["zeta"] = 1;
    result["alpha"] = json::array({true, nullptr, "x"});

    const auto outcome = DecodeWorkerMessage(EncodeSuccess(result, "hi\n"));

    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(OutcomeStatus::COMPLETED, outcome.status);
    EXPECT_EQ("hi\n", outcome.stdout_output);
    EXPECT_EQ(R"({"zeta":1,"alpha":[true,null,"x"]})", outcome.result.dump());
}

TEST(WorkerMessage, FailureCarriesStatusAndText) {
    const auto outcome = DecodeWorkerMessage(
        EncodeFailure(OutcomeStatus::STORE_UNAVAILABLE, "store unavailable: unable to open database file"));

    EXPECT_FALSE(outcome.Succeeded());
    EXPECT_EQ(OutcomeStatus::STORE_UNAVAILABLE, outcome.status);
    EXPECT_EQ("store unavailable: unable to open database file", *outcome.error);
    EXPECT_TRUE(outcome.result.is_null());
    EXPECT_TRUE(outcome.stdout_output.empty());
}

TEST(WorkerMessage, InvalidUtf8IsReplacedNotFatal) {
    const std::string message = EncodeSuccess(json("ok"), std::string("bad \xFF byte"));
    const auto outcome = DecodeWorkerMessage(message);
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ("bad \xEF\xBF\xBD byte", outcome.stdout_output);
}

TEST(WorkerMessage, MalformedMessagesThrow) {
    EXPECT_THROW(DecodeWorkerMessage("not json"), nlohmann::json::exception);
    EXPECT_THROW(DecodeWorkerMessage("[]"), std::runtime_error);
    EXPECT_THROW(DecodeWorkerMessage(R"({"ok": "yes"})"), std::runtime_error);
    EXPECT_THROW(DecodeWorkerMessage(R"({"ok": true})"), nlohmann::json::exception);
    EXPECT_THROW(DecodeWorkerMessage(R"({"ok": false, "error": "x", "status": "exploded"})"),
                 std::runtime_error);
}

TEST(ExecutionTypes, TimeoutFromSeconds) {
    EXPECT_EQ(std::chrono::milliseconds(1000), TimeoutFromSeconds(1.0));
    EXPECT_EQ(std::chrono::milliseconds(250), TimeoutFromSeconds(0.25));
    EXPECT_EQ(std::chrono::milliseconds(1), TimeoutFromSeconds(0.001));
    EXPECT_EQ(kMaxTimeout, TimeoutFromSeconds(86400.0));
}

TEST(ExecutionTypes, TimeoutFromSecondsRejectsOutOfRange) {
    EXPECT_THROW(TimeoutFromSeconds(0.0), std::invalid_argument);
    EXPECT_THROW(TimeoutFromSeconds(1e-4), std::invalid_argument);
    EXPECT_THROW(TimeoutFromSeconds(-1.0), std::invalid_argument);
    EXPECT_THROW(TimeoutFromSeconds(86400.5), std::invalid_argument);
    EXPECT_THROW(TimeoutFromSeconds(1e300), std::invalid_argument);
    EXPECT_THROW(TimeoutFromSeconds(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(TimeoutFromSeconds(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

TEST(ExecutionTypes, TimeoutBounds) {
    EXPECT_FALSE(IsValidTimeout(std::chrono::milliseconds(0)));
    EXPECT_TRUE(IsValidTimeout(kMinTimeout));
    EXPECT_TRUE(IsValidTimeout(kMaxTimeout));
    EXPECT_FALSE(IsValidTimeout(kMaxTimeout + std::chrono::milliseconds(1)));
}
