#pragma once

#include <cstdint>
#include <mutex>
#include <set>
#include <vector>

namespace stockledger {

/**
 * Tracks the largest event id W such that every event with id <= W has
 * been both appended to the ledger and applied to the projection.
 *
 * Writers on different keys finish out of id order; a reader pinned at W
 * sees every admission up to W in full and nothing after it.
 */
class CommitWatermark {
public:
    explicit CommitWatermark(int64_t initial = 0) : watermark_(initial) {}

    /**
     * Mark ids as committed. The ids of one admission are published
     * together, so a reader never observes half a batch.
     */
    void complete(const std::vector<int64_t>& ids);

    /**
     * Restart tracking at a known-committed id (after recovery).
     */
    void reset(int64_t committed);

    int64_t watermark() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return watermark_;
    }

private:
    mutable std::mutex mutex_;
    int64_t watermark_;
    std::set<int64_t> completed_ahead_;
};

/**
 * Completes a set of ids when it goes out of scope, whether the
 * admission finished normally or unwound after the append.
 */
class CommitGuard {
public:
    CommitGuard(CommitWatermark& watermark, std::vector<int64_t> ids)
        : watermark_(watermark), ids_(std::move(ids)) {}

    ~CommitGuard() {
        watermark_.complete(ids_);
    }

    CommitGuard(const CommitGuard&) = delete;
    CommitGuard& operator=(const CommitGuard&) = delete;

private:
    CommitWatermark& watermark_;
    std::vector<int64_t> ids_;
};

} // namespace stockledger
