#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace coderun {

/**
 * @brief 并发队列，写者读者模型
 * 队列关闭后不再接受新元素，已有元素仍然可以被取出，
 * 用于 dispatcher 停止时让 worker 处理完剩余的执行后退出。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，队列为空时最多等待 timeout
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素，超时或者队列已关闭且为空时返回 false
     */
    template <typename Rep, typename Period>
    bool pop_for(T &element, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!cond.wait_for(mlock, timeout, [this] { return !q.empty() || closed; }))
            return false;
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 队列已经关闭时返回 false，元素不会入队
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列并唤醒所有等待的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    bool is_closed() const {
        std::unique_lock<std::mutex> mlock(mut);
        return closed;
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    mutable std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace coderun
