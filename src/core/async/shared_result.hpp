#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <functional>
#include <memory>

namespace Tether {
namespace Core {

// Once-only asynchronous initialization cell.
//
// The first start() spawns the producer on the cell's executor; later calls
// are ignored. Every get(), before or after settlement, observes the same
// value or the same exception. The cell may be shared between owners: all of
// them see the one computation.
template <typename T>
class SharedResult : public std::enable_shared_from_this<SharedResult<T>> {
public:
    using Producer = std::function<boost::asio::awaitable<T>()>;

    static std::shared_ptr<SharedResult> create(boost::asio::any_io_executor executor) {
        return std::shared_ptr<SharedResult>(new SharedResult(std::move(executor)));
    }

    bool start(Producer producer) {
        if (started_)
            return false;
        started_ = true;
        auto self = this->shared_from_this();
        boost::asio::co_spawn(
            executor_, std::move(producer), [self](std::exception_ptr error, T value) {
                self->settle(std::move(error), std::move(value));
            });
        return true;
    }

    boost::asio::awaitable<T> get() {
        auto self = this->shared_from_this();
        while (!settled_) {
            boost::system::error_code ec;
            co_await signal_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        if (error_)
            std::rethrow_exception(error_);
        co_return value_;
    }

    bool started() const {
        return started_;
    }
    bool settled() const {
        return settled_;
    }

private:
    explicit SharedResult(boost::asio::any_io_executor executor)
        : executor_(executor), signal_(executor) {
        signal_.expires_at(boost::asio::steady_timer::time_point::max());
    }

    void settle(std::exception_ptr error, T value) {
        error_   = std::move(error);
        value_   = std::move(value);
        settled_ = true;
        signal_.cancel();
    }

    boost::asio::any_io_executor executor_;
    boost::asio::steady_timer    signal_;
    bool                         started_ = false;
    bool                         settled_ = false;
    std::exception_ptr           error_;
    T                            value_{};
};

}  // namespace Core
}  // namespace Tether
