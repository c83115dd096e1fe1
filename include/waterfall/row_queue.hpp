#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace waterfall {

// Bounded FIFO with drop-oldest overflow. Producer and drainer run on the
// same thread of control, so there is no synchronisation here.
template<typename T>
class RowQueue {
public:
    static constexpr std::size_t default_capacity = 10000;

    explicit RowQueue(std::size_t capacity = default_capacity)
        : slots_(capacity > 0 ? capacity : 1) {}

    // Appends item; when full the oldest entry is evicted first.
    // Returns true if an entry was evicted.
    bool push(T item) {
        bool evicted = false;
        if (count_ == slots_.size()) {
            head_ = (head_ + 1) % slots_.size();
            --count_;
            ++dropped_;
            evicted = true;
        }
        const std::size_t tail = (head_ + count_) % slots_.size();
        slots_[tail] = std::move(item);
        ++count_;
        return evicted;
    }

    bool pop(T& item) {
        if (count_ == 0) return false;
        item = std::move(slots_[head_]);
        slots_[head_] = T{};
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return true;
    }

    // Delivers every queued entry to sink in push order, leaving the queue empty
    template<typename Sink>
    std::size_t drain(Sink&& sink) {
        std::size_t delivered = 0;
        T item;
        while (pop(item)) {
            sink(std::move(item));
            ++delivered;
        }
        return delivered;
    }

    void clear() {
        for (auto& s : slots_) s = T{};
        head_ = 0;
        count_ = 0;
    }

    std::size_t size() const { return count_; }
    std::size_t capacity() const { return slots_.size(); }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == slots_.size(); }
    // Total evictions since construction
    std::size_t dropped() const { return dropped_; }

private:
    std::vector<T> slots_;
    std::size_t head_ = 0;
    std::size_t count_ = 0;
    std::size_t dropped_ = 0;
};

} // namespace waterfall
