#pragma once

#include <cstdint>
#include <string_view>
#include "../ledger/ledger.hpp"

namespace rescuecp::core {

enum class CopyMode {
    Fresh,             // назначения нет, копируем всё из источника
    OverwriteBadOnly,  // перечитываем только плохие блоки существующей копии
    MergeFromPartial   // хорошие блоки берём из частичной копии
};

[[nodiscard]] auto to_string(CopyMode mode) -> std::string_view;

enum class ReadFrom {
    Source,
    Partial,
    Skip
};

struct Selection {
    ReadFrom from = ReadFrom::Source;
    int max_retries = 0;
};

/// Per-offset decision of where the next block comes from.
///
/// The ledger is the destination's own ledger in OverwriteBadOnly and the
/// partial copy's ledger in MergeFromPartial; Fresh ignores it.
class SourceSelector {
public:
    SourceSelector(CopyMode mode, const Ledger* ledger, int max_retries)
        : mode_(mode), ledger_(ledger), max_retries_(max_retries) {}

    [[nodiscard]] auto select(std::uint64_t position) const -> Selection;
    [[nodiscard]] auto mode() const -> CopyMode { return mode_; }

private:
    CopyMode mode_;
    const Ledger* ledger_;
    int max_retries_;
};

} // namespace rescuecp::core
