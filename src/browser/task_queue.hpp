#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <functional>

namespace Tether {
namespace Browser {

// Runs tasks strictly one after another. Supplied by the embedder and handed
// to page layers for operations that must not overlap (screenshots).
class TaskQueue {
public:
    using Task = std::function<boost::asio::awaitable<void>()>;

    virtual ~TaskQueue() = default;

    virtual boost::asio::awaitable<void> post_task(Task task) = 0;
};

}  // namespace Browser
}  // namespace Tether
