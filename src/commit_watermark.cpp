#include "stockledger/commit_watermark.hpp"

namespace stockledger {

void CommitWatermark::complete(const std::vector<int64_t>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int64_t id : ids) {
        if (id > watermark_) {
            completed_ahead_.insert(id);
        }
    }
    while (!completed_ahead_.empty() && *completed_ahead_.begin() == watermark_ + 1) {
        ++watermark_;
        completed_ahead_.erase(completed_ahead_.begin());
    }
}

void CommitWatermark::reset(int64_t committed) {
    std::lock_guard<std::mutex> lock(mutex_);
    watermark_ = committed;
    completed_ahead_.clear();
}

} // namespace stockledger
