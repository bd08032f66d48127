#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace rlm::sandbox {

// Lines read from the sandbox's stdout, handed to the requesting thread in
// arrival order. Waits are always bounded; Close() wakes every waiter.
class ResponseQueue {
public:
    void Push(std::string line);
    bool TryPop(std::string& line, std::chrono::milliseconds timeout);
    void Close();
    void Reopen();
    bool Closed() const;
    std::size_t Size() const;

private:
    std::deque<std::string> lines_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

}  // namespace rlm::sandbox
