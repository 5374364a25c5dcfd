// ============================================================================
// Result Decoder Tests
// ============================================================================

#include "offload/protocol/result_decoder.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>

using namespace offload;
using nlohmann::json;

// ============================================================================
// Success Payloads
// ============================================================================

TEST(ResultDecoderTest, OkStripsStatus) {
    auto decoded = DecodeResult(R"({"status":"ok","answer":"world"})");
    ASSERT_TRUE(decoded.IsOk());
    EXPECT_EQ(decoded.Value(), (json{{"answer", "world"}}));
}

TEST(ResultDecoderTest, OkWithoutFields) {
    auto decoded = DecodeResult(R"({"status":"ok"})");
    ASSERT_TRUE(decoded.IsOk());
    EXPECT_TRUE(decoded.Value().is_object());
    EXPECT_TRUE(decoded.Value().empty());
}

TEST(ResultDecoderTest, OkWithNestedValue) {
    auto decoded = DecodeResult(R"(  {"status":"ok","result":[1,2,3],"meta":{"ms":12}}
)");
    ASSERT_TRUE(decoded.IsOk());
    EXPECT_EQ(decoded.Value()["result"], (json{1, 2, 3}));
    EXPECT_EQ(decoded.Value()["meta"]["ms"], 12);
}

// ============================================================================
// Worker-Reported Errors
// ============================================================================

TEST(ResultDecoderTest, ErrorPayload) {
    auto decoded = DecodeResult(R"({"status":"error","error":"model failed to load"})");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::WorkerReportedError);
    EXPECT_EQ(decoded.Error().reason, "model failed to load");
    EXPECT_FALSE(decoded.Error().IsTransient());
}

TEST(ResultDecoderTest, ErrorPayloadWithoutReason) {
    auto decoded = DecodeResult(R"({"status":"error"})");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::WorkerReportedError);
    EXPECT_EQ(decoded.Error().reason, "worker reported an error without a reason");
}

TEST(ResultDecoderTest, ErrorPayloadWithStructuredReason) {
    auto decoded = DecodeResult(R"({"status":"error","error":{"code":42}})");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::WorkerReportedError);
    EXPECT_EQ(decoded.Error().reason, R"({"code":42})");
}

// ============================================================================
// Incomplete Content
// ============================================================================

TEST(ResultDecoderTest, EmptyIsIncomplete) {
    auto decoded = DecodeResult("");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::ResultIncomplete);
    EXPECT_TRUE(decoded.Error().IsTransient());
}

TEST(ResultDecoderTest, WhitespaceIsIncomplete) {
    auto decoded = DecodeResult(" \n\t ");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_TRUE(decoded.Error().IsTransient());
}

TEST(ResultDecoderTest, TruncatedIsIncomplete) {
    for (const char* partial : {R"({"status":)", R"({"status":"ok","answer":"wor)", R"({"status":"ok")"}) {
        auto decoded = DecodeResult(partial);
        ASSERT_TRUE(decoded.IsErr()) << partial;
        EXPECT_EQ(decoded.Error().code, Errc::ResultIncomplete) << partial;
    }
}

TEST(ResultDecoderTest, PreSizedFileIsIncomplete) {
    // A writer that allocated the file before filling it
    auto decoded = DecodeResult(std::string(32, '\0'));
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::ResultIncomplete);
    EXPECT_TRUE(decoded.Error().IsTransient());
}

TEST(ResultDecoderTest, UnparseableIsRetried) {
    for (const char* bytes : {"definitely not json", R"({"status":"ok"} trailing)", R"({"status" "ok"})"}) {
        auto decoded = DecodeResult(bytes);
        ASSERT_TRUE(decoded.IsErr()) << bytes;
        EXPECT_EQ(decoded.Error().code, Errc::ResultIncomplete) << bytes;
        EXPECT_NE(decoded.Error().reason.find("not valid JSON"), std::string::npos) << bytes;
    }
}

// ============================================================================
// Malformed Content
// ============================================================================

TEST(ResultDecoderTest, NumberOutOfRangeIsMalformed) {
    std::optional<Result<json, DecodeError>> decoded;
    EXPECT_NO_THROW(decoded.emplace(DecodeResult(R"({"status":"ok","logit":1e999})")));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->IsErr());
    EXPECT_EQ(decoded->Error().code, Errc::MalformedResult);
    EXPECT_FALSE(decoded->Error().IsTransient());
}

TEST(ResultDecoderTest, NonObjectIsMalformed) {
    for (const char* doc : {"[1,2]", "42", R"("ok")", "null"}) {
        auto decoded = DecodeResult(doc);
        ASSERT_TRUE(decoded.IsErr()) << doc;
        EXPECT_EQ(decoded.Error().code, Errc::MalformedResult) << doc;
    }
}

TEST(ResultDecoderTest, MissingStatusIsMalformed) {
    auto decoded = DecodeResult(R"({"answer":"world"})");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::MalformedResult);
    EXPECT_EQ(decoded.Error().reason, "result has no status");
}

TEST(ResultDecoderTest, NonStringStatusIsMalformed) {
    auto decoded = DecodeResult(R"({"status":1})");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::MalformedResult);
}

TEST(ResultDecoderTest, UnknownStatusIsMalformed) {
    auto decoded = DecodeResult(R"({"status":"maybe"})");
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::MalformedResult);
    EXPECT_EQ(decoded.Error().reason, "unknown result status 'maybe'");
}

// ============================================================================
// Encoding (worker side)
// ============================================================================

TEST(ResultEncoderTest, SuccessObjectKeepsFields) {
    auto decoded = DecodeResult(EncodeSuccess(json{{"answer", "world"}}));
    ASSERT_TRUE(decoded.IsOk());
    EXPECT_EQ(decoded.Value(), (json{{"answer", "world"}}));
}

TEST(ResultEncoderTest, SuccessScalarIsWrapped) {
    auto encoded = json::parse(EncodeSuccess(json(42)));
    EXPECT_EQ(encoded["status"], "ok");
    EXPECT_EQ(encoded["result"], 42);
}

TEST(ResultEncoderTest, SuccessNullHasNoFields) {
    EXPECT_EQ(json::parse(EncodeSuccess(json())), (json{{"status", "ok"}}));
}

TEST(ResultEncoderTest, ErrorReason) {
    auto encoded = json::parse(EncodeError("out of memory"));
    EXPECT_EQ(encoded["status"], "error");
    EXPECT_EQ(encoded["error"], "out of memory");
}

TEST(ResultEncoderTest, InvalidUtf8IsReplaced) {
    auto encoded = EncodeError("bad \xff byte");
    auto decoded = DecodeResult(encoded);
    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::WorkerReportedError);
}
