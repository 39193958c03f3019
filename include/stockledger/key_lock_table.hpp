#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "helpers.hpp"

namespace stockledger {

/**
 * Per-key write serialization point. One writer per inventory key at a
 * time; distinct keys never contend except on slot lookup.
 */
class KeyLockTable {
public:
    /**
     * State guarded by the slot mutex.
     */
    struct Slot {
        std::mutex mutex;
        // Set when a divergence was detected; cleared by reconcile.
        bool blocked = false;
        std::string blocked_reason;
    };

    /**
     * Get (or create) the slot for a key. The reference stays valid for
     * the life of the table.
     */
    Slot& slot(const KeyRef& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slots_[key];
        if (!entry) {
            entry = std::make_unique<Slot>();
        }
        return *entry;
    }

    /**
     * Slot for a key if one exists. Read-only paths use this so that
     * looking at a key never grows the table.
     */
    Slot* find(const KeyRef& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(key);
        return it == slots_.end() ? nullptr : it->second.get();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    /**
     * Lock the slots of several keys in key order. Callers must pass
     * sorted, de-duplicated keys.
     */
    std::vector<std::unique_lock<std::mutex>> lock_all(const std::vector<KeyRef>& sorted_keys) {
        std::vector<std::unique_lock<std::mutex>> locks;
        locks.reserve(sorted_keys.size());
        for (const auto& key : sorted_keys) {
            locks.emplace_back(slot(key).mutex);
        }
        return locks;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<KeyRef, std::unique_ptr<Slot>, KeyRefHash> slots_;
};

} // namespace stockledger
