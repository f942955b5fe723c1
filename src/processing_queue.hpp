#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "transfer_types.hpp"

// Unbounded FIFO shared by the watcher, the startup scan and the processing
// loop. Producers may call enqueue from any thread.
class ProcessingQueue {
public:
    void enqueue(QueuedFile item);
    std::optional<QueuedFile> try_dequeue();
    std::size_t count() const;
    std::vector<QueuedFile> drain();
    std::vector<QueuedFile> snapshot() const;
private:
    mutable std::mutex m_;
    std::deque<QueuedFile> items_;
};
