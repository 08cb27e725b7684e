#pragma once

#include <filesystem>
#include <optional>
#include <cstdint>
#include "../../adapters/fs.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../ledger/ledger.hpp"
#include "../source_selector/source_selector.hpp"

namespace rescuecp::core {

struct CopyJob {
    std::filesystem::path source;
    std::filesystem::path destination;
    // С --overwrite: копия, которую чиним; без него: частичная копия
    std::optional<std::filesystem::path> auxiliary;
};

struct CopyReport {
    CopyMode mode = CopyMode::Fresh;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_from_source = 0;
    std::uint64_t bytes_from_partial = 0;
    std::uint64_t bytes_skipped = 0;
    Ledger bad_blocks;                                // найденные в этом запуске
    std::filesystem::path final_path;
    std::optional<std::filesystem::path> ledger_path; // если ledger сохранён
    bool source_deleted = false;

    [[nodiscard]] auto bad_bytes() const -> std::uint64_t { return bad_blocks.total_bytes(); }
    [[nodiscard]] auto clean() const -> bool { return bad_blocks.empty(); }
    [[nodiscard]] auto exit_code() const -> int {
        return clean() ? infra::exit_code::Clean : infra::exit_code::BadBlocks;
    }
};

/// Copies one file block by block, tolerating unreadable blocks.
///
/// The mode is chosen from the job: a missing destination is a fresh copy;
/// an existing one with --overwrite is repaired in place from its ledger;
/// an auxiliary file without --overwrite is a partial copy whose good blocks
/// are reused. Streams live only for the copy phase. Renaming, ledger upkeep
/// and attribute copying happen after they are closed.
///
/// Two runs against the same destination at the same time are not supported.
class CopyOrchestrator {
public:
    enum class State {
        Initializing,
        Copying,
        Finalizing,
        Done,
        Failed
    };

    explicit CopyOrchestrator(const infra::Config& config,
                              infra::ProgressMonitor& monitor,
                              adapters::fs::StreamOpener opener = adapters::fs::open_stream);

    [[nodiscard]] auto run(const CopyJob& job) -> infra::Result<CopyReport>;

    [[nodiscard]] auto state() const -> State { return state_; }

private:
    // Всё, что решено до копирования первого байта
    struct Plan {
        CopyMode mode = CopyMode::Fresh;
        std::uint64_t length = 0;
        std::filesystem::path target;                 // файл, в который пишем
        std::optional<std::filesystem::path> partial; // источник хороших блоков
        std::optional<Ledger> ledger;                 // ledger цели или частичной копии
    };

    struct Streams {
        adapters::fs::StreamPtr source;
        adapters::fs::StreamPtr target;
        adapters::fs::StreamPtr partial;
    };

    [[nodiscard]] auto initialize(const CopyJob& job) -> infra::Result<Plan>;
    [[nodiscard]] auto open_streams(const Plan& plan, const CopyJob& job) -> infra::Result<Streams>;
    [[nodiscard]] auto copy_blocks(const Plan& plan, Streams& streams, CopyReport& report)
        -> infra::VoidResult;
    [[nodiscard]] auto finalize(const CopyJob& job, const Plan& plan, CopyReport& report)
        -> infra::VoidResult;

    auto fail(infra::Error err) -> infra::Error;

    const infra::Config& config_;
    infra::ProgressMonitor& monitor_;
    adapters::fs::StreamOpener opener_;
    State state_ = State::Initializing;
};

[[nodiscard]] auto to_string(CopyOrchestrator::State state) -> std::string_view;

} // namespace rescuecp::core
