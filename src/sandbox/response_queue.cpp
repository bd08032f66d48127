#include "sandbox/response_queue.hpp"

#include <utility>

namespace rlm::sandbox {

void ResponseQueue::Push(std::string line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::move(line));
    }
    cv_.notify_one();
}

bool ResponseQueue::TryPop(std::string& line, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !lines_.empty() || closed_; })) {
        return false;
    }
    if (lines_.empty()) {
        return false;
    }
    line = std::move(lines_.front());
    lines_.pop_front();
    return true;
}

void ResponseQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void ResponseQueue::Reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
    closed_ = false;
}

bool ResponseQueue::Closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ResponseQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

}  // namespace rlm::sandbox
