// include/options_ngin/core/call_with_timeout.hpp
#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include "options_ngin/core/error.hpp"

namespace options_ngin {

/**
 * @brief Run a collaborator call with a deadline
 *
 * The call runs on its own detached thread. If it has not finished within
 * timeout the caller gets TIMEOUT_ERROR and the call is abandoned: it keeps
 * running and its result is discarded, so fn must own (or share ownership
 * of) everything it touches. Exceptions thrown by fn are returned as
 * UNKNOWN_ERROR.
 *
 * @param operation Short description used in error messages
 */
template <typename T>
Result<T> call_with_timeout(std::function<Result<T>()> fn, std::chrono::milliseconds timeout,
                            const std::string& operation) {
    auto task = std::make_shared<std::packaged_task<Result<T>()>>(std::move(fn));
    std::future<Result<T>> future = task->get_future();

    try {
        std::thread([task]() { (*task)(); }).detach();
    } catch (const std::system_error& e) {
        return make_error<T>(ErrorCode::UNKNOWN_ERROR,
                             operation + ": failed to start thread: " + e.what(),
                             "CallWithTimeout");
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return make_error<T>(ErrorCode::TIMEOUT_ERROR,
                             operation + " timed out after " + std::to_string(timeout.count()) +
                                 "ms",
                             "CallWithTimeout");
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return make_error<T>(ErrorCode::UNKNOWN_ERROR, operation + " threw: " + e.what(),
                             "CallWithTimeout");
    }
}

}  // namespace options_ngin
