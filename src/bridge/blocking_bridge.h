#pragma once

#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "worker_pool.h"

namespace SalKafka {

/**
 * Runs blocking calls on a worker pool and delivers their outcome back on
 * the thread that runs the io_context (the driver).
 *
 * The driver never blocks: Dispatch returns immediately and the handler is
 * posted to the io_context once the call finishes. An exception thrown by
 * the call is captured and handed to the handler as a std::exception_ptr;
 * the handler decides whether to rethrow it. While a call is in flight the
 * io_context is kept from running out of work.
 */
class BlockingBridge {
public:
    BlockingBridge(boost::asio::io_context& io, WorkerPool& pool) : io_(io), pool_(pool) {}

    boost::asio::io_context& io_context() { return io_; }

    /**
     * @param fn Blocking call, executed on a worker thread; its result type
     *        must be default constructible
     * @param handler Invoked on the driver as handler(std::exception_ptr, Result);
     *        the result is default constructed when the exception is set
     */
    template <typename Fn, typename Handler>
    void Dispatch(Fn&& fn, Handler&& handler) {
        using Result = std::decay_t<std::invoke_result_t<std::decay_t<Fn>&>>;

        struct State {
            std::decay_t<Fn> fn;
            std::decay_t<Handler> handler;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
            std::exception_ptr error;
            Result result{};
        };
        auto state = std::make_shared<State>(State{
            std::forward<Fn>(fn),
            std::forward<Handler>(handler),
            boost::asio::make_work_guard(io_),
            nullptr,
            Result{}});

        pool_.Submit([this, state]() {
            try {
                state->result = state->fn();
            } catch (...) {
                // Re-raised on the driver by the handler
                state->error = std::current_exception();
            }
            boost::asio::post(io_, [state]() {
                auto work = std::move(state->work);
                state->handler(state->error, std::move(state->result));
            });
        });
    }

private:
    boost::asio::io_context& io_;
    WorkerPool& pool_;
};

} // namespace SalKafka
