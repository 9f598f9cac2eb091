/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接存储层异常和链路层Result
 */

#pragma once

#include "ryuri/core/Expected.hpp"
#include "ryuri/core/ErrorCode.hpp"
#include "ryuri/core/Exception.hpp"
#include <new>
#include <type_traits>

namespace ryuri {
namespace core {

/**
 * @brief 异常转换层
 *
 * PackageStore / DocumentCache 以异常报告错误；
 * FilterChain / ProtectionCodec / BatchOrchestrator 以Result返回错误。
 */
class ExceptionBridge {
public:
    template<typename T>
    static T unwrap(Result<T>&& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
        return std::move(result.value());
    }

    static void unwrap(const VoidResult& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
    }

    static void unwrap(VoidResult&& result) {
        unwrap(static_cast<const VoidResult&>(result));
    }

    /**
     * @brief 捕获异常并转换为Result
     */
    template<typename F>
    static auto wrapCall(F&& func) -> Result<std::decay_t<decltype(func())>> {
        using ReturnType = std::decay_t<decltype(func())>;
        try {
            return Result<ReturnType>(func());
        } catch (const RyuriException& e) {
            return Result<ReturnType>(e.toError());
        } catch (const std::bad_alloc&) {
            return Result<ReturnType>(makeError(ErrorCode::InternalError, "Memory allocation failed"));
        } catch (const std::exception& e) {
            return Result<ReturnType>(makeError(ErrorCode::InternalError, e.what()));
        }
    }

    /**
     * @brief 捕获异常并转换为VoidResult
     */
    template<typename F>
    static VoidResult wrapVoidCall(F&& func) {
        try {
            func();
            return ok();
        } catch (const RyuriException& e) {
            return e.toError();
        } catch (const std::bad_alloc&) {
            return makeError(ErrorCode::InternalError, "Memory allocation failed");
        } catch (const std::exception& e) {
            return makeError(ErrorCode::InternalError, e.what());
        }
    }
};

}} // namespace ryuri::core
