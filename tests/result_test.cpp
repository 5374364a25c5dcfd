// ============================================================================
// Result Type Tests
// ============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"
#include "offload/protocol/result_decoder.hpp"
#include "offload/supervisor/task.hpp"

using namespace offload;
using nlohmann::json;

namespace {

Result<TaskHandle, Error> Accept(bool busy) {
    if (busy) return Err(make_error_code(Errc::TaskInFlight));
    return Ok(TaskHandle{"a1b2"});
}

Result<void, Error> Stop(bool known) {
    if (!known) return Err(make_error_code(Errc::UnknownTask));
    return Ok();
}

}  // namespace

// ============================================================================
// Error Codes
// ============================================================================

TEST(ResultTest, CarriesHandleOnSuccess) {
    auto handle = Accept(false);

    ASSERT_TRUE(handle.IsOk());
    EXPECT_FALSE(handle.IsErr());
    EXPECT_EQ(handle.Value().id, "a1b2");
}

TEST(ResultTest, CarriesErrorCodeOnFailure) {
    auto handle = Accept(true);

    ASSERT_TRUE(handle.IsErr());
    EXPECT_EQ(handle.Error(), Errc::TaskInFlight);
    EXPECT_EQ(handle.Error().category().name(), std::string("offload"));
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(Stop(true).IsOk());

    auto stopped = Stop(false);
    ASSERT_TRUE(stopped.IsErr());
    EXPECT_EQ(stopped.Error(), Errc::UnknownTask);
}

// ============================================================================
// Payloads
// ============================================================================

TEST(ResultTest, DecodeErrorPayload) {
    Result<json, DecodeError> decoded = Err(DecodeError{make_error_code(Errc::WorkerReportedError), "OOM"});

    ASSERT_TRUE(decoded.IsErr());
    EXPECT_EQ(decoded.Error().code, Errc::WorkerReportedError);
    EXPECT_EQ(decoded.Error().reason, "OOM");
    EXPECT_FALSE(decoded.Error().IsTransient());
}

TEST(ResultTest, HandlerMessagePayload) {
    Result<json, std::string> ok = Ok(json{{"answer", "world"}});
    Result<json, std::string> err = Err(std::string("model failed to load"));

    EXPECT_EQ(ok.Value()["answer"], "world");
    EXPECT_EQ(err.Error(), "model failed to load");
}

TEST(ResultTest, MovesOwnedValueOut) {
    Result<std::unique_ptr<int>, Error> created = Ok(std::make_unique<int>(7));

    auto owned = std::move(created).Value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, MovesErrorOut) {
    Result<json, DecodeError> decoded = Err(DecodeError{make_error_code(Errc::MalformedResult), "not JSON"});

    DecodeError error = std::move(decoded).Error();
    EXPECT_EQ(error.reason, "not JSON");
}

TEST(ResultTest, ForwardsErrorAcrossTypes) {
    auto inner = Accept(true);
    auto outer = [&]() -> Result<std::string, Error> {
        if (inner.IsErr()) return Err(inner.Error());
        return Ok(inner.Value().id);
    }();

    ASSERT_TRUE(outer.IsErr());
    EXPECT_EQ(outer.Error(), Errc::TaskInFlight);
}
