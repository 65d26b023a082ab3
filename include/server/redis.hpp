#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <vector>
#include "config.hpp"

namespace orbit::server {

/**
 * @brief 表示一个 Redis 连接
 * 同一时刻只有一个线程能通过 execute 使用该连接。
 * 阻塞操作（比如 BLPOP）会占用整个连接，因此需要阻塞的线程应该使用独立的连接。
 */
struct redis_conn {
    /**
     * @brief 根据 Redis 配置初始化 Redis 服务器连接，此时不会真正建立连接
     */
    explicit redis_conn(const redis_config &config);

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接并重新发送操作，
     * 如果重试次数过多则抛出异常。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并把 future 放进第二个参数
     * @return 按顺序排列的所有操作的结果
     * @throw store_error 若无法连接服务器，或者操作重试多次仍然失败
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     * @throw store_error 若重连多次仍然失败
     */
    void reconnect(bool force = false);

private:
    redis_config config;
    cpp_redis::client client;
    std::mutex mut;
};

}  // namespace orbit::server
