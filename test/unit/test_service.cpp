// JSON request decoding, response rendering and method dispatch.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "redaction/parallel_batch_redactor.hpp"
#include "redaction/redaction_cache.hpp"
#include "redaction/redactor.hpp"
#include "service/redaction_service.hpp"
#include "service/request.hpp"
#include "service/response.hpp"

using namespace phiscrub::service;
using phiscrub::redaction::RedactionResult;
using phiscrub::redaction::Redactor;

namespace {

TEST(RequestTest, ParsesStringData) {
    Request req = parseRequest(R"({"method":"redact","data":"line\n\"quoted\" é"})");
    EXPECT_EQ(req.method, "redact");
    EXPECT_EQ(req.data, "line\n\"quoted\" \xC3\xA9");
    EXPECT_FALSE(req.hasItems);
}

TEST(RequestTest, ParsesArrayDataAndIgnoresUnknownKeys) {
    Request req = parseRequest(R"( { "id" : "42", "data" : ["a", "b"], "method" : "batchRedact", "n": 7 } )");
    EXPECT_EQ(req.method, "batchRedact");
    ASSERT_TRUE(req.hasItems);
    EXPECT_EQ(req.items, (std::vector<std::string>{"a", "b"}));
}

TEST(RequestTest, SurrogatePairDecodesToUtf8) {
    Request req = parseRequest(R"({"method":"redact","data":"\uD83D\uDE00"})");
    EXPECT_EQ(req.data, "\xF0\x9F\x98\x80");
}

TEST(RequestTest, MalformedRequestsThrow) {
    EXPECT_THROW(parseRequest(R"({"data":"x"})"), std::runtime_error);
    EXPECT_THROW(parseRequest(R"({"method":"redact")"), std::runtime_error);
    EXPECT_THROW(parseRequest(R"({"method":"redact"} extra)"), std::runtime_error);
    EXPECT_THROW(parseRequest(R"({"method":"redact","data":"\q"})"), std::runtime_error);
    EXPECT_THROW(parseRequest(R"({"method":"redact","data":12})"), std::runtime_error);
    EXPECT_THROW(parseRequest("not json"), std::runtime_error);
}

TEST(RequestTest, BatchEnvelope) {
    EXPECT_EQ(parseBatchEnvelope(R"(["x", "y"])"), (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(parseBatchEnvelope("[]").empty());
    EXPECT_TRUE(parseBatchEnvelope("[oops").empty());
    EXPECT_TRUE(parseBatchEnvelope("").empty());
    EXPECT_TRUE(parseBatchEnvelope(R"(["a"] junk)").empty());
}

TEST(ResponseTest, RendersEnvelope) {
    EXPECT_EQ(Response(200, "OK", jsonString("a\"b")).toJson(),
              R"({"status":200,"message":"OK","data":"a\"b"})");
    EXPECT_EQ(Response(400, "bad").toJson(), R"({"status":400,"message":"bad","data":null})");
    EXPECT_FALSE(Response(400, "bad").ok());
    EXPECT_EQ(jsonStringArray({}), "[]");
    EXPECT_EQ(escapeString(std::string("\x01", 1)), "\\u0001");
}

TEST(ResponseTest, RendersResult) {
    RedactionResult empty;
    EXPECT_EQ(resultToJson(empty),
              R"({"redacted_text":"","processing_time_ms":0.000,"patterns_applied":0})");
}

class RedactionServiceTest : public ::testing::Test {
  protected:
    Redactor redactor;
    RedactionService service{redactor};
};

TEST_F(RedactionServiceTest, Redact) {
    EXPECT_EQ(service.HandleLine(R"({"method":"redact","data":"Contact: jane.doe@example.com"})"),
              R"({"status":200,"message":"OK","data":"Contact: [REDACTED_EMAIL]"})");
}

TEST_F(RedactionServiceTest, RedactWithStats) {
    Response resp = service.HandleRequest(parseRequest(R"({"method":"redactWithStats","data":"SSN: 123-45-6789"})"));
    ASSERT_TRUE(resp.ok());
    EXPECT_EQ(resp.data.find(R"({"redacted_text":"SSN: [REDACTED_SSN]","processing_time_ms":)"), 0u);
    EXPECT_NE(resp.data.find(R"("patterns_applied":1})"), std::string::npos);
}

TEST_F(RedactionServiceTest, PatternIntrospection) {
    EXPECT_EQ(service.HandleLine(R"({"method":"getPatternCount"})"),
              R"({"status":200,"message":"OK","data":6})");
    EXPECT_EQ(service.HandleLine(R"({"method":"getPatternNames"})"),
              R"({"status":200,"message":"OK","data":["SSN","Phone Numbers","Email Addresses",)"
              R"("Full Name","Date Patterns","Medical Record Numbers"]})");
}

TEST_F(RedactionServiceTest, BatchRedactAcceptsArrayOrEncodedString) {
    EXPECT_EQ(service.HandleLine(R"({"method":"batchRedact","data":["SSN: 123-45-6789","hi"]})"),
              R"({"status":200,"message":"OK","data":["SSN: [REDACTED_SSN]","hi"]})");
    EXPECT_EQ(service.HandleLine(R"({"method":"batchRedact","data":"[\"SSN: 123-45-6789\"]"})"),
              R"({"status":200,"message":"OK","data":["SSN: [REDACTED_SSN]"]})");
}

TEST_F(RedactionServiceTest, MalformedBatchIsEmpty) {
    EXPECT_EQ(service.HandleLine(R"({"method":"batchRedact","data":"[oops"})"),
              R"({"status":200,"message":"OK","data":[]})");
}

TEST_F(RedactionServiceTest, OneShotRedactText) {
    EXPECT_EQ(service.HandleLine(R"({"method":"redactText","data":"Call me at 555-123-4567"})"),
              R"({"status":200,"message":"OK","data":"Call me at [REDACTED_PHONE]"})");
}

TEST_F(RedactionServiceTest, UnknownMethodAndBadLine) {
    EXPECT_EQ(service.HandleLine(R"({"method":"nope"})"),
              R"({"status":400,"message":"Unknown method: nope","data":null})");

    std::string bad = service.HandleLine(R"({"data":"x"})");
    EXPECT_EQ(bad.find(R"({"status":400,)"), 0u);
    EXPECT_NE(bad.find("missing 'method'"), std::string::npos);
}

TEST_F(RedactionServiceTest, RegisteredCollaboratorsGiveSameAnswers) {
    phiscrub::redaction::CachingRedactor cached(redactor, 8);
    phiscrub::redaction::ParallelBatchRedactor batch(redactor, 2, 1);
    service.RegisterCache(&cached);
    service.RegisterBatchRedactor(&batch);

    const std::string line = R"({"method":"redact","data":"SSN: 123-45-6789"})";
    EXPECT_EQ(service.HandleLine(line), R"({"status":200,"message":"OK","data":"SSN: [REDACTED_SSN]"})");
    EXPECT_EQ(service.HandleLine(line), R"({"status":200,"message":"OK","data":"SSN: [REDACTED_SSN]"})");
    EXPECT_EQ(cached.cache().hits(), 1u);

    EXPECT_EQ(service.HandleLine(R"({"method":"batchRedact","data":["SSN: 123-45-6789","hi"]})"),
              R"({"status":200,"message":"OK","data":["SSN: [REDACTED_SSN]","hi"]})");
}

} // anonymous namespace
