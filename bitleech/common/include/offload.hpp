#pragma once
#include <type_traits>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>


namespace bitleech {

    // Runs fn on the pool and resumes the caller on its own executor with the result.
    template <typename Fn>
    boost::asio::awaitable<std::invoke_result_t<Fn>> offload(boost::asio::thread_pool& pool, Fn fn) {
        using R = std::invoke_result_t<Fn>;
        co_return co_await boost::asio::co_spawn(pool,
            [fn = std::move(fn)]() mutable -> boost::asio::awaitable<R> { co_return fn(); },
            boost::asio::use_awaitable);
    }

} // namespace bitleech
