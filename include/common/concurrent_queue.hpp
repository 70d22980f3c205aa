#pragma once

#include <condition_variable>
#include <limits>
#include <mutex>
#include <queue>

namespace grader {

/**
 * @brief 有界并发队列，写者读者模型
 * 写者在队列满时阻塞，读者在队列空时阻塞。写者写完所有元素后调用 close，
 * 读者在队列关闭且为空时退出。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity 队列最多能容纳的元素个数，默认不限
     */
    explicit concurrent_queue(size_t capacity = std::numeric_limits<size_t>::max())
        : capacity(capacity == 0 ? 1 : capacity) {}

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @param element 保存队头元素
     * @return 队列关闭且没有剩余元素时返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty() && !closed) not_empty.wait(mlock);
        if (q.empty()) return false;
        element = q.front();
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素，如果队列已满则阻塞等待
     * @return 队列已经被关闭时返回 false，元素不会被插入
     */
    bool push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.size() >= capacity && !closed) not_full.wait(mlock);
        if (closed) return false;
        q.push(value);
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者和写者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        not_empty.notify_all();
        not_full.notify_all();
    }

private:
    std::queue<T> q;
    size_t capacity;
    bool closed = false;
    std::mutex mut;
    std::condition_variable not_empty, not_full;
};

}  // namespace grader
