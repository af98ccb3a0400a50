#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace codejudge {

/**
 * @brief 有界的 worker 池，限制同时评测的提交数量
 * 这是 dispatcher 唯一的共享可变状态，获取和归还槽位都是原子的。
 * worker 池由构造函数注入 dispatcher，测试可以创建互相独立的池。
 */
struct worker_pool {
    /**
     * @brief worker 池中的一个槽位
     * 离开作用域时自动归还，只能移动不能复制
     */
    struct slot {
        slot(slot &&other) noexcept;
        slot &operator=(slot &&other) noexcept;
        slot(const slot &) = delete;
        slot &operator=(const slot &) = delete;
        ~slot();

        /**
         * @brief 提前归还槽位，可以重复调用
         */
        void release();

    private:
        friend struct worker_pool;
        explicit slot(worker_pool *pool);

        worker_pool *pool;
    };

    explicit worker_pool(std::size_t capacity);

    /**
     * @brief 获取一个槽位，若没有空闲槽位则阻塞等待
     * @param timeout 最长等待时间
     * @throws overloaded 若等待超时
     */
    slot acquire(std::chrono::milliseconds timeout);

    std::size_t capacity() const;

    /**
     * @brief 当前空闲的槽位数
     */
    std::size_t available() const;

private:
    void give_back();

    const std::size_t total;
    std::size_t free_slots;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace codejudge
