#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <optional>

#include "../protocol/connection.hpp"
#include "task_queue.hpp"

namespace Tether {
namespace Browser {

class Target;

struct Viewport {
    int    width               = 800;
    int    height              = 600;
    double device_scale_factor = 1.0;
    bool   is_mobile           = false;
};

// Caller-facing automation handle. Only the parts the lifecycle layer drives
// are declared here; concrete pages live in the layers above.
class Page {
public:
    virtual ~Page() = default;

    // Called once the browser confirms a provisional navigation: the page must
    // continue on |session|, which is bound to |target|.
    virtual void swap_target_on_navigation(std::shared_ptr<Protocol::Session> session,
                                           std::shared_ptr<Target>            target) = 0;
};

// Builds the Page of a freshly requested target. The viewport and the
// screenshot queue are the Browser's; either may be unset.
using PageFactory = std::function<boost::asio::awaitable<std::shared_ptr<Page>>(
    std::shared_ptr<Protocol::Session>,
    std::shared_ptr<Target>,
    const std::optional<Viewport>&,
    std::shared_ptr<TaskQueue>)>;

}  // namespace Browser
}  // namespace Tether
