// =============================================================================
// journal.cpp - Compensating-action journal
// =============================================================================

#include "nftamm/journal.hpp"
#include "nftamm/logger.hpp"
#include "nftamm/types.hpp"

namespace nftamm {

TransferJournal::~TransferJournal() {
    if (!committed_) {
        rollback();
    }
}

void TransferJournal::record(std::string step, Undo undo) {
    entries_.push_back(Entry{std::move(step), std::move(undo)});
}

void TransferJournal::commit() {
    committed_ = true;
    entries_.clear();
}

size_t TransferJournal::rollback() {
    size_t failures = 0;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        int32_t status = it->undo();
        if (status != errors::OK) {
            ++failures;
            NFTAMM_LOG_ERROR() << "rollback of '" << it->step << "' failed: "
                               << error_name(status);
        }
    }
    entries_.clear();
    return failures;
}

} // namespace nftamm
