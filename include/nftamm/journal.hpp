#ifndef NFTAMM_JOURNAL_HPP
#define NFTAMM_JOURNAL_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace nftamm {

// =============================================================================
// TransferJournal - all-or-nothing boundary around a multi-step operation
//
// Each completed step records a compensating action. commit() keeps the steps;
// rollback(), or destruction before commit(), runs the compensations in reverse
// order.
// =============================================================================

class TransferJournal {
public:
    using Undo = std::function<int32_t()>;

    TransferJournal() = default;
    ~TransferJournal();

    TransferJournal(const TransferJournal&) = delete;
    TransferJournal& operator=(const TransferJournal&) = delete;

    void record(std::string step, Undo undo);
    void commit();

    // Returns the number of compensations that failed
    size_t rollback();

    size_t size() const { return entries_.size(); }
    bool committed() const { return committed_; }

private:
    struct Entry {
        std::string step;
        Undo undo;
    };

    std::vector<Entry> entries_;
    bool committed_{false};
};

} // namespace nftamm

#endif // NFTAMM_JOURNAL_HPP
