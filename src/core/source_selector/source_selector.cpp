#include "source_selector.hpp"

namespace rescuecp::core {

std::string_view to_string(CopyMode mode) {
    switch (mode) {
        case CopyMode::Fresh:            return "fresh";
        case CopyMode::OverwriteBadOnly: return "overwrite-bad-only";
        case CopyMode::MergeFromPartial: return "merge-from-partial";
    }
    return "unknown";
}

auto SourceSelector::select(std::uint64_t position) const -> Selection {
    const bool known_bad = ledger_ != nullptr && ledger_->covers(position);

    switch (mode_) {
        case CopyMode::OverwriteBadOnly:
            if (known_bad) return {ReadFrom::Source, max_retries_};
            return {ReadFrom::Skip, 0};

        case CopyMode::MergeFromPartial:
            // Частичная копия в этом месте уже хорошая: читаем без повторов
            if (!known_bad) return {ReadFrom::Partial, 0};
            return {ReadFrom::Source, max_retries_};

        case CopyMode::Fresh:
        default:
            return {ReadFrom::Source, max_retries_};
    }
}

} // namespace rescuecp::core
