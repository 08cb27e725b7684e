#include "forced_reader.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace rescuecp::core {

ForcedReader::ForcedReader(std::uint32_t block_size, infra::RetryPolicy pacing)
    : buffer_(block_size), pacing_(pacing) {}

auto ForcedReader::read(adapters::fs::ByteStream& stream,
                        std::uint64_t offset,
                        std::uint32_t block_size,
                        int max_retries) -> infra::Result<ReadOutcome>
{
    if (buffer_.size() < block_size) {
        buffer_.resize(block_size);
    }
    const std::span<char> target{buffer_.data(), block_size};

    auto policy = pacing_;
    policy.max_retries = max_retries;

    ReadOutcome outcome{};
    auto res = infra::with_retry([&]() {
        return stream.read_at(offset, target);
    }, policy, [&](int attempt, const infra::Error& err) {
        if (err.is_transient()) {
            outcome.failures = attempt;
            spdlog::debug("Read at {} failed (attempt {}): {}", offset, attempt, err.message);
        }
    });

    if (res) {
        outcome.bytes = static_cast<std::uint32_t>(*res);
        outcome.success = true;
        if (outcome.failures > 0) {
            spdlog::info("Block at {} recovered after {} tries", offset, outcome.failures + 1);
        }
        return outcome;
    }

    if (!res.error().is_transient()) {
        return std::unexpected(std::move(res.error()));
    }

    // Попытки исчерпаны: блок считается плохим
    auto length = stream.length();
    if (!length) {
        return std::unexpected(std::move(length.error()));
    }
    const std::uint64_t remaining = *length > offset ? *length - offset : 0;
    const auto should_have_read = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(block_size, remaining));

    std::fill_n(buffer_.begin(), should_have_read, '\0');
    outcome.bytes = should_have_read;
    outcome.success = false;

    spdlog::warn("Giving up on block at {} after {} tries: {}",
                 offset, outcome.failures, res.error().message);
    return outcome;
}

} // namespace rescuecp::core
