#pragma once

#include "domain/errors/DependencyErrors.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>

namespace matchmaking::resilience {

/**
 * @brief Ограничение времени ожидания одного удалённого вызова
 *
 * Вызов выполняется на пуле потоков владельца (boost::asio::thread_pool).
 * Если ответа нет за timeout (включая ожидание свободного потока),
 * вызывающий получает TransientDependencyError, а сам вызов НЕ прерывается
 * и завершается на пуле (вызовы идемпотентны или терпимы к повтору).
 * Число одновременно зависших вызовов ограничено размером пула.
 *
 * timeout <= 0 - вызов в текущем потоке без ограничения.
 */
class CallTimeout {
public:
    using Executor = boost::asio::thread_pool::executor_type;

    CallTimeout(std::string dependency, std::chrono::milliseconds timeout, Executor executor)
        : dependency_(std::move(dependency))
        , timeout_(timeout)
        , executor_(executor)
    {}

    template <typename F>
    std::invoke_result_t<F&> run(F operation) {
        using Result = std::invoke_result_t<F&>;

        if (timeout_.count() <= 0) {
            return operation();
        }

        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(operation));
        auto future = task->get_future();
        boost::asio::post(executor_, [task]() { (*task)(); });

        if (future.wait_for(timeout_) == std::future_status::timeout) {
            std::cerr << "[CallTimeout:" << dependency_ << "] No response in "
                      << timeout_.count() << "ms, giving up waiting" << std::endl;
            throw domain::TransientDependencyError(
                dependency_, "call timed out after " + std::to_string(timeout_.count()) + "ms");
        }

        return future.get();
    }

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string dependency_;
    std::chrono::milliseconds timeout_;
    Executor executor_;
};

} // namespace matchmaking::resilience
