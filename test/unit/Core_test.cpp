#include "ryuri/core/ErrorCode.hpp"
#include "ryuri/core/Exception.hpp"
#include "ryuri/core/ExceptionBridge.hpp"
#include "ryuri/core/Expected.hpp"
#include "ryuri/core/ThreadPool.hpp"
#include "ryuri/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <string>
#include <vector>

namespace ryuri {
namespace core {

class CoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/core_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }
};

// 测试1: 错误码名称
TEST_F(CoreTest, ErrorCodeNames) {
    EXPECT_STREQ(codeName(ErrorCode::NotFound), "NotFound");
    EXPECT_STREQ(codeName(ErrorCode::FilterFailure), "FilterFailure");
    EXPECT_STREQ(codeName(ErrorCode::AuthenticationFailure), "AuthenticationFailure");

    Error ok_error;
    EXPECT_TRUE(ok_error.isOk());
    EXPECT_FALSE(static_cast<bool>(ok_error));

    Error error = makeError(ErrorCode::IOFailure, "disk full", "OEBPS/a.css");
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.context, "OEBPS/a.css");
    EXPECT_NE(error.fullMessage().find("disk full"), std::string::npos);
}

// 测试2: 过滤器失败包装保留原始错误码
TEST_F(CoreTest, FilterFailureKeepsCause) {
    const Error cause = makeError(ErrorCode::MalformedMarkup, "bad tag", "OEBPS/c1.xhtml");
    const Error wrapped = makeFilterFailure("layout", cause);
    EXPECT_EQ(wrapped.code, ErrorCode::FilterFailure);
    EXPECT_EQ(wrapped.context, "layout");
    EXPECT_EQ(wrapped.cause, ErrorCode::MalformedMarkup);

    const Error rewrapped = makeFilterFailure("outer", wrapped);
    EXPECT_EQ(rewrapped.cause, ErrorCode::MalformedMarkup);
}

// 测试3: Expected 值与错误
TEST_F(CoreTest, ExpectedValueAndError) {
    Result<int> good(42);
    ASSERT_TRUE(good);
    EXPECT_EQ(good.value(), 42);
    EXPECT_EQ(good.valueOr(0), 42);

    Result<int> bad(makeError(ErrorCode::NotFound, "missing"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::NotFound);
    EXPECT_EQ(bad.valueOr(7), 7);
    EXPECT_THROW(bad.valueOrThrow(), PackageException);

    Result<int> chained = good.andThen([](int v) { return Result<int>(v + 1); });
    ASSERT_TRUE(chained);
    EXPECT_EQ(chained.value(), 43);

    VoidResult done = ok();
    EXPECT_TRUE(done);
}

// 测试4: 异常与 Result 的互相转换
TEST_F(CoreTest, ExceptionBridgeConversions) {
    VoidResult from_package = ExceptionBridge::wrapVoidCall([]() {
        RYURI_THROW_PACKAGE(ErrorCode::CorruptArchive, "bad central directory", "book.epub");
    });
    ASSERT_FALSE(from_package);
    EXPECT_EQ(from_package.error().code, ErrorCode::CorruptArchive);
    EXPECT_EQ(from_package.error().context, "book.epub");

    Result<std::string> from_param = ExceptionBridge::wrapCall([]() -> std::string {
        RYURI_THROW_PARAM("unknown platform", "platform");
    });
    ASSERT_FALSE(from_param);
    EXPECT_EQ(from_param.error().code, ErrorCode::InvalidArgument);

    Result<int> value = ExceptionBridge::wrapCall([]() { return 5; });
    EXPECT_EQ(ExceptionBridge::unwrap(std::move(value)), 5);

    EXPECT_THROW(ExceptionBridge::unwrap(VoidResult(makeError(ErrorCode::MalformedMarkup, "x"))), XMLException);
}

// 测试5: 线程池按 future 返回结果
TEST_F(CoreTest, ThreadPoolRunsTasks) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.size(), 3u);

    std::atomic<int> counter{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.enqueue([i, &counter]() {
            ++counter;
            return i * i;
        }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
    pool.wait_for_all_tasks();
    EXPECT_EQ(counter.load(), 20);
}

}} // namespace ryuri::core
