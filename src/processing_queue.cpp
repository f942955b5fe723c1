#include "processing_queue.hpp"
#include <iterator>

void ProcessingQueue::enqueue(QueuedFile item){
    std::lock_guard lg(m_);
    items_.push_back(std::move(item));
}

std::optional<QueuedFile> ProcessingQueue::try_dequeue(){
    std::lock_guard lg(m_);
    if(items_.empty()) return std::nullopt;
    QueuedFile front = std::move(items_.front());
    items_.pop_front();
    return front;
}

std::size_t ProcessingQueue::count() const {
    std::lock_guard lg(m_);
    return items_.size();
}

std::vector<QueuedFile> ProcessingQueue::drain(){
    std::lock_guard lg(m_);
    std::vector<QueuedFile> out(std::make_move_iterator(items_.begin()),
                                std::make_move_iterator(items_.end()));
    items_.clear();
    return out;
}

std::vector<QueuedFile> ProcessingQueue::snapshot() const {
    std::lock_guard lg(m_);
    return std::vector<QueuedFile>(items_.begin(), items_.end());
}
