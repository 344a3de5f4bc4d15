#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace snapmatch {

// Bounded blocking FIFO. Producers block while full; consumers block while
// empty until the sentinel is set, after which pop() drains and then
// returns nullopt.
template <typename T>
class WorkQueue {
private:
    std::deque<T> m_items;
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::atomic<bool> m_sentinel{ false };
    size_t m_maxCapacity;
    std::string m_name;

public:
    WorkQueue(size_t maxCapacity, std::string name)
        : m_maxCapacity(std::max<size_t>(1, maxCapacity)), m_name(std::move(name)) {
    }

    const std::string& name() const { return m_name; }

    void push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return m_items.size() < m_maxCapacity; });
        m_items.push_back(std::move(item));
        m_cond.notify_all();
    }

    // Waits until the whole batch fits; a batch larger than capacity waits for an empty queue.
    void pushMany(const std::vector<T>& items) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this, &items] {
            return m_items.empty() || m_items.size() + items.size() <= m_maxCapacity;
        });
        m_items.insert(m_items.end(), items.begin(), items.end());
        m_cond.notify_all();
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return !m_items.empty() || m_sentinel.load(std::memory_order_acquire); });
        if (m_items.empty()) { return std::nullopt; }
        T result = std::move(m_items.front());
        m_items.pop_front();
        m_cond.notify_all();
        return result;
    }

    std::vector<T> popMax(size_t maxItems) {
        std::vector<T> items;
        items.reserve(maxItems);
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this, maxItems]() { return m_sentinel.load(std::memory_order_acquire) || m_items.size() >= maxItems; });
        size_t count = std::min(m_items.size(), maxItems);
        for (size_t i = 0; i < count; ++i) {
            items.push_back(std::move(m_items.front()));
            m_items.pop_front();
        }
        m_cond.notify_all();
        return items;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.empty();
    }

    bool isSentinel() const {
        return m_sentinel.load(std::memory_order_acquire);
    }

    void setSentinel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sentinel.store(true, std::memory_order_release);
        }
        m_cond.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }
};

} // namespace snapmatch
