#pragma once

#include "core/types.hh"
#include <cstddef>
#include <unordered_set>
#include <vector>

namespace tourney {

// ============================================================================
// Idempotency Guard - append-only record of keys already acted upon
// ============================================================================

// Keeps insertion order for persistence and a hashed index for lookup.
// Capacity is fixed at construction; a full guard refuses new keys.
template<typename Key>
class IdempotencyGuard {
public:
    enum class RecordResult {
        RECORDED,
        DUPLICATE,
        FULL,
    };

    explicit IdempotencyGuard(std::size_t capacity)
        : capacity_(capacity) {}

    [[nodiscard]] bool contains(const Key& key) const {
        return index_.find(key) != index_.end();
    }

    // Would record() succeed for this key?
    [[nodiscard]] RecordResult check(const Key& key) const {
        if (contains(key)) {
            return RecordResult::DUPLICATE;
        }
        if (order_.size() >= capacity_) {
            return RecordResult::FULL;
        }
        return RecordResult::RECORDED;
    }

    RecordResult record(const Key& key) {
        RecordResult result = check(key);
        if (result == RecordResult::RECORDED) {
            order_.push_back(key);
            index_.insert(key);
        }
        return result;
    }

    [[nodiscard]] const std::vector<Key>& entries() const { return order_; }
    [[nodiscard]] std::size_t size() const { return order_.size(); }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] bool empty() const { return order_.empty(); }

    bool operator==(const IdempotencyGuard& other) const {
        return capacity_ == other.capacity_ && order_ == other.order_;
    }

private:
    std::vector<Key> order_;
    std::unordered_set<Key> index_;
    std::size_t capacity_;
};

// Matches whose rewards were paid
using PaidMatchGuard = IdempotencyGuard<match_id_t>;

// Participants whose entry fee was returned
using RefundGuard = IdempotencyGuard<Address>;

}  // namespace tourney
