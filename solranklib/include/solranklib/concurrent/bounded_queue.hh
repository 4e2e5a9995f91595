#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <mutex>
#include <optional>

namespace concurrent {

// Multi-producer multi-consumer FIFO queue holding at most max_size elements
template <class Elem>
class BoundedQueue {
private:
    std::mutex mtx_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_or_closed_;
    std::deque<Elem> elems_;
    size_t max_size_;
    bool no_more_elems_ = false;

public:
    explicit BoundedQueue(size_t max_size = std::numeric_limits<size_t>::max())
    : max_size_(max_size == 0 ? 1 : max_size) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    ~BoundedQueue() = default;

    // Returns std::nullopt iff there are no more elements and
    // signal_no_more_elems() was called. Remaining elements are still handed
    // out after the signal.
    std::optional<Elem> pop_opt() {
        std::unique_lock lock{mtx_};
        not_empty_or_closed_.wait(lock, [&] { return not elems_.empty() or no_more_elems_; });
        if (elems_.empty()) {
            return std::nullopt;
        }

        std::optional<Elem> elem{std::move(elems_.front())};
        elems_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return elem;
    }

    // Blocks while the queue is full
    void push(Elem elem) {
        std::unique_lock lock{mtx_};
        not_full_.wait(lock, [&] { return elems_.size() < max_size_; });
        elems_.emplace_back(std::move(elem));
        lock.unlock();
        not_empty_or_closed_.notify_one();
    }

    // Calling push() after this method is forbidden. This method may be called
    // more than once
    void signal_no_more_elems() {
        {
            std::lock_guard lock{mtx_};
            no_more_elems_ = true;
        }
        not_empty_or_closed_.notify_all();
    }
};

} // namespace concurrent
