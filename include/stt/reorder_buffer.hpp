#ifndef REORDER_BUFFER_HPP
#define REORDER_BUFFER_HPP

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

// Holds results that completed out of order and releases them strictly by
// sequence number. Not thread-safe; the owner serialises access.
class ReorderBuffer {
public:
    explicit ReorderBuffer(uint64_t firstSequence = 0) : nextExpected_(firstSequence) {}

    // Stores the result under `sequence` and returns every result that can now
    // be released, in order. Sequences already released or already held are
    // ignored.
    std::vector<TranscriptionResult> insert(uint64_t sequence, TranscriptionResult result);

    uint64_t nextExpected() const { return nextExpected_; }
    std::size_t pending() const { return held_.size(); }

    // Drops everything held. Returns how many results were discarded.
    std::size_t clear();

private:
    uint64_t nextExpected_;
    std::map<uint64_t, TranscriptionResult> held_;
};

#endif
