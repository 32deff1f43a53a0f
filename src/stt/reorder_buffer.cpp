#include "stt/reorder_buffer.hpp"

#include <iostream>
#include <utility>

std::vector<TranscriptionResult> ReorderBuffer::insert(uint64_t sequence, TranscriptionResult result) {
    std::vector<TranscriptionResult> released;

    if (sequence < nextExpected_ || held_.count(sequence)) {
        std::cerr << "[Reorder] [WARN] Ignoring duplicate result for sequence " << sequence << std::endl;
        return released;
    }
    held_.emplace(sequence, std::move(result));

    auto it = held_.begin();
    while (it != held_.end() && it->first == nextExpected_) {
        released.push_back(std::move(it->second));
        it = held_.erase(it);
        ++nextExpected_;
    }
    return released;
}

std::size_t ReorderBuffer::clear() {
    const std::size_t n = held_.size();
    held_.clear();
    return n;
}
