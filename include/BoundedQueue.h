#pragma once
// BoundedQueue.h — очередь продюсер → воркеры с ограниченной ёмкостью
//
// Полная очередь блокирует push (backpressure на обход каталогов).
// close() будит всех: push больше не принимает, pop дочитывает остаток
// и затем возвращает nullopt.

#include <deque>
#include <mutex>
#include <chrono>
#include <optional>
#include <condition_variable>

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // false — очередь закрыта
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });
        if (m_closed) return false;
        m_items.push_back(std::move(item));
        m_not_empty.notify_one();
        return true;
    }

    // Waits at most `timeout` for a free slot. false on timeout or when closed.
    template <typename Rep, typename Period>
    bool push_for(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_not_full.wait_for(lock, timeout, [this] { return m_closed || m_items.size() < m_capacity; }))
            return false;
        if (m_closed) return false;
        m_items.push_back(std::move(item));
        m_not_empty.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this] { return m_closed || !m_items.empty(); });
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        m_not_full.notify_one();
        return item;
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_not_full.notify_all();
        m_not_empty.notify_all();
    }

    // Отбросить непрочитанное (отмена)
    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_items.clear();
        m_not_full.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_full;
    std::condition_variable m_not_empty;
    std::deque<T> m_items;
    bool m_closed = false;
};
