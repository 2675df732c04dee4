#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../core/async/shared_result.hpp"
#include "../core/events/event_bus.hpp"
#include "../protocol/lifecycle_events.hpp"
#include "page.hpp"

namespace Tether {
namespace Browser {

class BrowserContext;
class Target;

using TargetPredicate = std::function<bool(const Target&)>;
using TargetEvent     = Core::EventBus<const std::shared_ptr<Target>&>;

struct WaitForTargetOptions {
    // Unset uses the browser default; zero waits forever.
    std::optional<std::chrono::milliseconds> timeout;
};

class Target : public std::enable_shared_from_this<Target> {
public:
    using PageCell         = Core::SharedResult<std::shared_ptr<Page>>;
    using PageMaterializer =
        std::function<boost::asio::awaitable<std::shared_ptr<Page>>(std::shared_ptr<Target>)>;

    Target(const Protocol::TargetInfo&     info,
           std::shared_ptr<BrowserContext> context,
           boost::asio::any_io_executor    executor,
           PageMaterializer                materializer);

    const std::string& target_id() const {
        return target_id_;
    }
    const std::string& type() const {
        return type_;
    }
    const std::string& url() const {
        return url_;
    }
    void set_url(const std::string& url) {
        url_ = url;
    }
    bool is_page() const;

    std::shared_ptr<BrowserContext> browser_context() const {
        return context_;
    }

    // Resolves to the one Page of this target, materializing it on first use.
    // Non-page targets resolve to null.
    boost::asio::awaitable<std::shared_ptr<Page>> page();

    // Starts materialization without waiting for it. Null for non-page targets.
    std::shared_ptr<PageCell> ensure_page();

    // Null until the page was first requested.
    std::shared_ptr<PageCell> page_cell() const {
        return page_cell_;
    }

    Core::EventBus<>& on_closed() {
        return closed_;
    }
    bool is_closed() const {
        return is_closed_;
    }

    // Fires the closed hook. Only the first call has an effect.
    void closed_callback();

private:
    friend class Browser;

    void adopt_page_cell(std::shared_ptr<PageCell> cell) {
        page_cell_ = std::move(cell);
    }

    std::string                     target_id_;
    std::string                     type_;
    std::string                     url_;
    std::shared_ptr<BrowserContext> context_;
    boost::asio::any_io_executor    executor_;
    PageMaterializer                materializer_;
    std::shared_ptr<PageCell>       page_cell_;
    Core::EventBus<>                closed_;
    bool                            is_closed_ = false;
};

}  // namespace Browser
}  // namespace Tether
