#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <thread>

namespace rescuecp::infra {
/*

int failures = 0;
auto res = infra::with_retry([&]() {
    return stream.read_at(offset, buffer);
}, infra::RetryPolicy{ .max_retries = 5 },
   [&](int attempt, const infra::Error&) { failures = attempt; });


*/
struct RetryPolicy {
    int max_retries = 0; // дополнительные попытки после первой
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(0);
    double backoff_factor = 2.0; // exponential backoff
};

/// Runs `operation` until it succeeds, fails with a non-transient error, or
/// `policy.max_retries` extra attempts are spent. `on_failure(attempt, error)`
/// is called for every failed attempt, 1-based.
template<typename F, typename OnFailure>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy, OnFailure&& on_failure)
    -> decltype(operation())
{
    const int attempts = policy.max_retries < 0 ? 1 : policy.max_retries + 1;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result; // успех
        }

        const auto& err = result.error();
        on_failure(attempt + 1, err);
        if (!err.is_transient() || attempt == attempts - 1) {
            return result; // фатальная ошибка или последняя попытка
        }

        // Экспоненциальная задержка
        if (policy.initial_delay.count() > 0) {
            auto delay = std::chrono::milliseconds(static_cast<long long>(
                policy.initial_delay.count() * std::pow(policy.backoff_factor, attempt)));
            std::this_thread::sleep_for(delay);
        }
    }

    // Управление сюда не дойдёт, но компилятор требует
    return operation();
}

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation())
{
    return with_retry(std::forward<F>(operation), policy, [](int, const Error&) {});
}

} // namespace rescuecp::infra
