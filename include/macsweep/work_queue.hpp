#ifndef MACSWEEP_WORK_QUEUE_HPP
#define MACSWEEP_WORK_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// Multiple consumer queue that is filled before the consumers start. Popping
// never blocks: an empty queue means the work is done.
template <typename T>
class WorkQueue {
  private:
    std::deque<T> items_;
    mutable std::mutex mut_;

  public:
    WorkQueue() = default;
    explicit WorkQueue(const std::vector<T>& items) : items_(items.begin(), items.end()) {}
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue(WorkQueue&&) = delete;
    ~WorkQueue() = default;
    WorkQueue& operator=(const WorkQueue&) = delete;
    WorkQueue& operator=(WorkQueue&&) = delete;

    void push(T item) {
        std::lock_guard<std::mutex> lock{mut_};
        items_.push_back(std::move(item));
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock{mut_};
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock{mut_};
        return items_.size();
    }
};

#endif
