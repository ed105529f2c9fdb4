#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace codejudge {

struct slot_pool;

/**
 * @brief 一个被占用的沙箱槽位
 * 析构时将槽位归还给 slot_pool
 */
struct sandbox_slot {
    sandbox_slot(slot_pool &pool, std::size_t core_id);
    sandbox_slot(sandbox_slot &&other) noexcept;
    sandbox_slot(const sandbox_slot &) = delete;
    sandbox_slot &operator=(const sandbox_slot &) = delete;
    ~sandbox_slot();

    std::size_t core_id() const;

    /**
     * @brief 沙箱上下文使用的 cpuset，比如 "3"
     */
    std::string cpuset() const;

private:
    slot_pool *pool;
    std::size_t id;
};

/**
 * @brief 沙箱槽位池
 * 每个槽位对应一个 CPU 核心，一个执行请求在整个生命周期内独占一个槽位，
 * 它的所有沙箱上下文都只运行在这个核心上，使得时间统计不受其他请求影响。
 * 槽位数量决定了能同时处理的执行请求数量。
 */
struct slot_pool {
    /**
     * @param core_ids 可以使用的 CPU 核心编号
     */
    explicit slot_pool(const std::vector<std::size_t> &core_ids);

    /**
     * @brief 获取一个槽位，没有空闲槽位时阻塞等待
     */
    sandbox_slot acquire();

    std::size_t capacity() const;

    std::size_t available() const;

private:
    friend struct sandbox_slot;

    void release(std::size_t core_id);

    std::size_t total;
    concurrent_queue<std::size_t> cores;
};

}  // namespace codejudge
