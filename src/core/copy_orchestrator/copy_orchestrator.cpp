#include "copy_orchestrator.hpp"

#include <algorithm>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "../forced_reader/forced_reader.hpp"
#include "../../extensions/metadata.hpp"
#include "../../infra/retry.hpp"

namespace rescuecp::core {

namespace {

auto path_exists(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

// Другой файл с тем же именем, меченым или нет: прошлая копия того же источника
auto find_other_copy(const std::filesystem::path& destination,
                     const std::vector<std::filesystem::path>& own)
    -> infra::Result<std::optional<std::filesystem::path>>
{
    const auto plain = extensions::unmarked_path(destination).filename();
    const auto dir = destination.has_parent_path() ? destination.parent_path()
                                                   : std::filesystem::path(".");

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (extensions::unmarked_path(it->path().filename()) != plain) continue;

        const bool ours = std::any_of(own.begin(), own.end(), [&](const auto& path) {
            std::error_code ignored;
            return std::filesystem::equivalent(it->path(), path, ignored);
        });
        if (!ours) {
            return std::optional<std::filesystem::path>{it->path()};
        }
    }
    if (ec) {
        return std::unexpected(infra::make_errno_error(ec.value(),
            fmt::format("Cannot list {}", dir.string())));
    }
    return std::optional<std::filesystem::path>{};
}

auto source_name(ReadFrom from) -> std::string_view {
    switch (from) {
        case ReadFrom::Source:  return "source";
        case ReadFrom::Partial: return "partial copy";
        case ReadFrom::Skip:    return "existing copy (skipped)";
    }
    return "unknown";
}

} // namespace

std::string_view to_string(CopyOrchestrator::State state) {
    switch (state) {
        case CopyOrchestrator::State::Initializing: return "initializing";
        case CopyOrchestrator::State::Copying:      return "copying";
        case CopyOrchestrator::State::Finalizing:   return "finalizing";
        case CopyOrchestrator::State::Done:         return "done";
        case CopyOrchestrator::State::Failed:       return "failed";
    }
    return "unknown";
}

CopyOrchestrator::CopyOrchestrator(const infra::Config& config,
                                   infra::ProgressMonitor& monitor,
                                   adapters::fs::StreamOpener opener)
    : config_(config), monitor_(monitor), opener_(std::move(opener)) {}

auto CopyOrchestrator::fail(infra::Error err) -> infra::Error {
    state_ = State::Failed;
    return err;
}

auto CopyOrchestrator::run(const CopyJob& job) -> infra::Result<CopyReport>
{
    state_ = State::Initializing;

    auto plan = initialize(job);
    if (!plan) {
        return std::unexpected(fail(std::move(plan.error())));
    }

    CopyReport report{};
    report.mode = plan->mode;
    report.total_bytes = plan->length;

    spdlog::info("Copying {} -> {} ({} bytes, mode: {})",
                 job.source.string(), plan->target.string(), plan->length, to_string(plan->mode));

    {
        // Потоки закрываются в конце этого блока на любом пути выхода
        auto streams = open_streams(*plan, job);
        if (!streams) {
            return std::unexpected(fail(std::move(streams.error())));
        }

        state_ = State::Copying;
        auto copied = copy_blocks(*plan, *streams, report);
        monitor_.finish();
        if (!copied) {
            return std::unexpected(fail(std::move(copied.error())));
        }
    }

    state_ = State::Finalizing;
    auto finalized = finalize(job, *plan, report);
    if (!finalized) {
        return std::unexpected(fail(std::move(finalized.error())));
    }

    state_ = State::Done;
    return report;
}

auto CopyOrchestrator::initialize(const CopyJob& job) -> infra::Result<Plan>
{
    Plan plan{};

    if (!path_exists(job.source)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Source does not exist: {}", job.source.string())));
    }
    auto length = adapters::fs::file_length(job.source);
    if (!length) {
        return std::unexpected(std::move(length.error()));
    }
    plan.length = *length;

    // Выбор режима: один раз на запуск
    const bool destination_exists = path_exists(job.destination);
    if (job.auxiliary) {
        if (!path_exists(*job.auxiliary)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                fmt::format("Auxiliary file does not exist: {}", job.auxiliary->string())));
        }
        if (config_.overwrite) {
            plan.mode = CopyMode::OverwriteBadOnly;
            plan.target = *job.auxiliary;
        } else {
            if (destination_exists) {
                return std::unexpected(infra::make_error(infra::ErrorCode::DestinationExists,
                    fmt::format("Destination already exists: {} (use --overwrite to repair it)",
                                job.destination.string())));
            }
            plan.mode = CopyMode::MergeFromPartial;
            plan.target = job.destination;
            plan.partial = *job.auxiliary;
        }
    } else if (destination_exists) {
        if (!config_.overwrite) {
            return std::unexpected(infra::make_error(infra::ErrorCode::DestinationExists,
                fmt::format("Destination already exists: {} (use --overwrite to repair it)",
                            job.destination.string())));
        }
        plan.mode = CopyMode::OverwriteBadOnly;
        plan.target = job.destination;
    } else {
        plan.mode = CopyMode::Fresh;
        plan.target = job.destination;
    }

    std::error_code ec;
    if (path_exists(plan.target) && std::filesystem::equivalent(job.source, plan.target, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Source and destination are the same file: {}", job.source.string())));
    }

    // Переименование в конце не должно затереть другую копию
    std::vector<std::filesystem::path> own{job.source, plan.target};
    auto other = find_other_copy(job.destination, own);
    if (!other) {
        return std::unexpected(std::move(other.error()));
    }
    if (*other) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DestinationExists,
            fmt::format("Another copy of {} already exists: {} (repair it with --overwrite)",
                        job.destination.string(), (*other)->string())));
    }

    // Пока поддерживается только весь файл целиком
    if (config_.range_offset.value_or(0) != 0 ||
        config_.range_length.value_or(plan.length) != plan.length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedRange,
            fmt::format("Copying a partial byte range ({} + {}) is not supported; "
                        "only the whole file [0, {}) can be copied",
                        config_.range_offset.value_or(0),
                        config_.range_length.value_or(plan.length), plan.length)));
    }

    if (plan.mode == CopyMode::Fresh) {
        return plan;
    }

    // Overwrite / merge: вспомогательный файл и его ledger должны совпадать с источником
    const auto& auxiliary = plan.mode == CopyMode::OverwriteBadOnly ? plan.target : *plan.partial;
    const auto ledger_path = ledger_path_for(auxiliary);

    auto ledger = load_ledger(ledger_path);
    if (!ledger) {
        return std::unexpected(std::move(ledger.error()));
    }
    if (!*ledger) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerMissing,
            fmt::format("No bad-block ledger found for {} (expected {}); refusing to "
                        "touch a file that is believed to be good",
                        auxiliary.string(), ledger_path.string())));
    }
    if (plan.mode == CopyMode::OverwriteBadOnly && (*ledger)->empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerMissing,
            fmt::format("Ledger {} lists no bad blocks; nothing to repair in {}",
                        ledger_path.string(), auxiliary.string())));
    }

    auto aux_length = adapters::fs::file_length(auxiliary);
    if (!aux_length) {
        return std::unexpected(std::move(aux_length.error()));
    }
    if (*aux_length != plan.length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch,
            fmt::format("{} is {} bytes but the source is {} bytes",
                        auxiliary.string(), *aux_length, plan.length)));
    }

    const auto active_block_size = config_.effective_block_size();
    if (auto recorded = (*ledger)->block_size(); recorded && *recorded != active_block_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::BlockSizeMismatch,
            fmt::format("Ledger {} was recorded with block size {} but the active block size is {}",
                        ledger_path.string(), *recorded, active_block_size)));
    }

    spdlog::info("Loaded {} known bad blocks ({} bytes) from {}",
                 (*ledger)->size(), (*ledger)->total_bytes(), ledger_path.string());
    plan.ledger = std::move(**ledger);
    return plan;
}

auto CopyOrchestrator::open_streams(const Plan& plan, const CopyJob& job) -> infra::Result<Streams>
{
    Streams streams{};

    auto source = opener_(job.source, adapters::fs::OpenMode::Read);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }
    streams.source = std::move(*source);

    if (plan.mode == CopyMode::OverwriteBadOnly) {
        // Прошлый запуск мог унаследовать флаг "только чтение" от источника
        auto read_only = adapters::fs::is_read_only(plan.target);
        if (!read_only) {
            return std::unexpected(std::move(read_only.error()));
        }
        if (*read_only) {
            auto writable = adapters::fs::set_read_only(plan.target, false);
            if (!writable) {
                return std::unexpected(std::move(writable.error()));
            }
        }
    }

    const auto target_mode = plan.mode == CopyMode::OverwriteBadOnly
        ? adapters::fs::OpenMode::ReadWrite
        : adapters::fs::OpenMode::Create;
    auto target = opener_(plan.target, target_mode);
    if (!target) {
        return std::unexpected(std::move(target.error()));
    }
    streams.target = std::move(*target);

    if (plan.partial) {
        auto partial = opener_(*plan.partial, adapters::fs::OpenMode::Read);
        if (!partial) {
            return std::unexpected(std::move(partial.error()));
        }
        streams.partial = std::move(*partial);
    }

    return streams;
}

auto CopyOrchestrator::copy_blocks(const Plan& plan, Streams& streams, CopyReport& report)
    -> infra::VoidResult
{
    const auto block_size = config_.effective_block_size();
    const infra::RetryPolicy pacing{
        .max_retries = config_.effective_max_retries(),
        .initial_delay = std::chrono::milliseconds(config_.retry_delay_ms.value_or(0)),
        .backoff_factor = config_.retry_backoff.value_or(2.0)
    };

    ForcedReader reader{block_size, pacing};
    const SourceSelector selector{plan.mode, plan.ledger ? &*plan.ledger : nullptr,
                                  config_.effective_max_retries()};
    std::vector<char> partial_buffer(streams.partial ? block_size : 0);

    monitor_.set_total(plan.length);

    // Откуда читали предыдущий блок: только для сообщений о переключении
    std::optional<ReadFrom> last_from;

    std::uint64_t position = 0;
    while (position < plan.length) {
        const auto expected = static_cast<std::uint32_t>(
            std::min<std::uint64_t>(block_size, plan.length - position));
        const auto selection = selector.select(position);

        if (selection.from != last_from) {
            spdlog::debug("Reading from {} at offset {}", source_name(selection.from), position);
            last_from = selection.from;
        }

        if (selection.from == ReadFrom::Skip) {
            report.bytes_skipped += expected;
            monitor_.update(expected);
            position += expected;
            continue;
        }

        std::span<const char> data;
        bool good = true;

        if (selection.from == ReadFrom::Partial) {
            const std::span<char> target{partial_buffer.data(), expected};
            auto n = streams.partial->read_at(position, target);
            if (!n) {
                return std::unexpected(infra::make_error(infra::ErrorCode::PartialReadFailure,
                    fmt::format("Block at {} of partial copy {} is not listed as bad but cannot be read: {}",
                                position, streams.partial->path().string(), n.error().message)));
            }
            if (*n != expected) {
                return std::unexpected(infra::make_error(infra::ErrorCode::PartialReadFailure,
                    fmt::format("Partial copy {} ended early at {} ({} of {} bytes)",
                                streams.partial->path().string(), position, *n, expected)));
            }
            data = target;
            report.bytes_from_partial += expected;
        } else {
            auto outcome = reader.read(*streams.source, position, block_size, selection.max_retries);
            if (!outcome) {
                return std::unexpected(std::move(outcome.error()));
            }
            if (outcome->bytes == 0) {
                return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailure,
                    fmt::format("Source {} ended at {}, expected {} bytes",
                                streams.source->path().string(), position, plan.length)));
            }
            outcome->bytes = std::min(outcome->bytes, expected);
            data = reader.data(*outcome);
            good = outcome->success;
            if (good) {
                report.bytes_from_source += outcome->bytes;
            }
        }

        auto written = streams.target->write_at(position, data);
        if (!written) {
            return std::unexpected(std::move(written.error()));
        }

        if (!good) {
            report.bad_blocks.append(Block{
                .offset = position,
                .size = static_cast<std::uint32_t>(data.size())
            });
        }
        monitor_.update(data.size(), good ? 0 : data.size());
        position += data.size();
    }

    return streams.target->sync();
}

auto CopyOrchestrator::finalize(const CopyJob& job, const Plan& plan, CopyReport& report)
    -> infra::VoidResult
{
    const auto stale_ledger = ledger_path_for(plan.target);
    const auto final_path = report.clean()
        ? extensions::unmarked_path(job.destination)
        : extensions::marked_path(job.destination, report.bad_bytes());

    if (final_path != plan.target) {
        std::error_code ec;
        std::filesystem::rename(plan.target, final_path, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailure,
                fmt::format("Cannot rename {} to {}: {}",
                            plan.target.string(), final_path.string(), ec.message())));
        }
        spdlog::debug("Renamed {} to {}", plan.target.string(), final_path.string());
    }
    report.final_path = final_path;

    if (!report.clean()) {
        report.bad_blocks.set_block_size(config_.effective_block_size());
        const auto ledger_path = ledger_path_for(final_path);
        auto saved = save_ledger(report.bad_blocks, ledger_path);
        if (!saved) {
            return saved;
        }
        report.ledger_path = ledger_path;

        if (stale_ledger != ledger_path && path_exists(stale_ledger)) {
            auto removed = remove_ledger(stale_ledger);
            if (!removed) {
                return removed;
            }
        }
        spdlog::warn("{} bad blocks ({} bytes) zero-filled in {}; ledger written to {}",
                     report.bad_blocks.size(), report.bad_bytes(),
                     final_path.string(), ledger_path.string());
    } else {
        // Ledger цели и ledger под итоговым именем больше ничего не описывают
        for (const auto& stale : {stale_ledger, ledger_path_for(final_path)}) {
            if (!path_exists(stale)) continue;
            auto removed = remove_ledger(stale);
            if (!removed) {
                return removed;
            }
            spdlog::info("All blocks read; removed stale ledger {}", stale.string());
        }
    }

    // Атрибуты копируются при любом исходе
    auto metadata_res = extensions::copy_metadata(job.source, final_path);
    if (!metadata_res) {
        spdlog::warn("Failed to copy metadata for {}: {}",
                     final_path.string(), metadata_res.error().message);
    }

    if (report.clean() && config_.delete_source) {
        std::error_code ec;
        std::filesystem::remove(job.source, ec);
        if (ec) {
            spdlog::warn("Copy is complete but the source {} could not be deleted: {}",
                         job.source.string(), ec.message());
        } else {
            report.source_deleted = true;
            spdlog::info("Deleted source {}", job.source.string());
        }
    }

    return {};
}

} // namespace rescuecp::core
