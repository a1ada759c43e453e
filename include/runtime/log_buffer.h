#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace lswitch {

/// Most recent backend output lines, oldest first. Not synchronised on its
/// own; it lives inside ServiceData and is guarded by the service lock.
class LogBuffer {
public:
    static constexpr size_t kDefaultCapacity = 2000;

    explicit LogBuffer(size_t capacity = kDefaultCapacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    void append(std::string line) {
        while (lines_.size() >= capacity_) {
            lines_.pop_front();
        }
        lines_.push_back(std::move(line));
    }

    std::vector<std::string> snapshot() const {
        return std::vector<std::string>(lines_.begin(), lines_.end());
    }

    size_t size() const { return lines_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return lines_.empty(); }
    void clear() { lines_.clear(); }

private:
    size_t capacity_;
    std::deque<std::string> lines_;
};

}  // namespace lswitch
