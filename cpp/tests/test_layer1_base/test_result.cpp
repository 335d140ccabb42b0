/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the transfer error aliases.
 */
#include "test_patterns.h"
#include "utils/result.hpp"
#include "transfer/errors.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using federator::utils::Result;
using federator::utils::VoidResult;
using namespace federator::transfer;

enum class TestError
{
    NotFound,
    InvalidInput,
    Timeout
};

class ResultTest : public federator::tests::PureApiTest
{
};

TEST_F(ResultTest, ConstructionOk)
{
    auto result = Result<int, TestError>::ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.content(), 42);
}

TEST_F(ResultTest, ConstructionErrorCarriesMessageAndCode)
{
    auto result = Result<int, TestError>::error(TestError::NotFound, "no such topic", 123);
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::NotFound);
    EXPECT_EQ(result.error_message(), "no such topic");
    EXPECT_EQ(result.error_code(), 123);
}

TEST_F(ResultTest, ErrorDefaultsToEmptyMessageAndZeroCode)
{
    auto result = Result<int, TestError>::error(TestError::Timeout);
    EXPECT_EQ(result.error_message(), "");
    EXPECT_EQ(result.error_code(), 0);
}

TEST_F(ResultTest, DefaultConstructedIsError)
{
    Result<int, TestError> result;
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), TestError::NotFound);
}

TEST_F(ResultTest, WrongAccessorThrowsLogicError)
{
    auto ok = Result<int, TestError>::ok(1);
    auto err = Result<int, TestError>::error(TestError::InvalidInput);
    EXPECT_THROW((void)ok.error(), std::logic_error);
    EXPECT_THROW((void)ok.error_message(), std::logic_error);
    EXPECT_THROW((void)err.content(), std::logic_error);
}

TEST_F(ResultTest, ValueOr)
{
    auto ok = Result<std::string, TestError>::ok("value");
    auto err = Result<std::string, TestError>::error(TestError::Timeout);
    EXPECT_EQ(ok.value_or("fallback"), "value");
    EXPECT_EQ(err.value_or("fallback"), "fallback");
}

TEST_F(ResultTest, MoveOnlyContentCanBeMovedOut)
{
    auto result = Result<std::unique_ptr<int>, TestError>::ok(std::make_unique<int>(7));
    std::unique_ptr<int> owned = std::move(result).content();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST_F(ResultTest, ForwardErrorKeepsKindMessageAndCode)
{
    auto source = Result<int, TestError>::error(TestError::InvalidInput, "bad offset", 22);
    auto forwarded = source.forward_error<std::string>();
    EXPECT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error(), TestError::InvalidInput);
    EXPECT_EQ(forwarded.error_message(), "bad offset");
    EXPECT_EQ(forwarded.error_code(), 22);
}

TEST_F(ResultTest, VoidResult)
{
    auto ok = federator::utils::ok_void<TestError>();
    EXPECT_TRUE(ok.is_ok());
    auto err = VoidResult<TestError>::error(TestError::Timeout, "late");
    EXPECT_EQ(err.error_message(), "late");
}

TEST_F(ResultTest, TransferErrorCodesRoundTrip)
{
    for (auto kind : {TransferError::LabelParse, TransferError::SourceUnavailable,
                      TransferError::StreamTransport, TransferError::FileIO,
                      TransferError::Configuration, TransferError::InvalidRequest,
                      TransferError::Unauthorized, TransferError::Cancelled,
                      TransferError::OffsetStore})
    {
        EXPECT_EQ(transfer_error_from_string(to_string(kind)), kind) << to_string(kind);
    }
    EXPECT_EQ(to_string(TransferError::Unauthorized), "UNAUTHORIZED");
    EXPECT_EQ(transfer_error_from_string("SESSION_NOT_FOUND"), TransferError::StreamTransport);
    EXPECT_TRUE(transfer_ok().is_ok());
}
