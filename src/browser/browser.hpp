#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/types/constants.hpp"
#include "../protocol/connection.hpp"
#include "../protocol/lifecycle_events.hpp"
#include "browser_context.hpp"
#include "page.hpp"
#include "target.hpp"
#include "task_queue.hpp"

namespace Tether {
namespace Browser {

struct BrowserOptions {
    std::optional<Viewport>    default_viewport;
    std::chrono::milliseconds  default_timeout = Core::default_timeout();
    std::shared_ptr<TaskQueue> screenshot_task_queue;
};

// Registry of every target and context of one browser process. Routes the
// connection's lifecycle notifications into registry changes and events.
// Contexts and targets refer back to it weakly; once the Browser is released
// they report an empty registry and refuse to build pages.
class Browser : public std::enable_shared_from_this<Browser> {
public:
    using CloseCallback = std::function<boost::asio::awaitable<void>()>;

    static std::shared_ptr<Browser> create(Protocol::Connection& connection,
                                           BrowserOptions        options,
                                           PageFactory           page_factory,
                                           CloseCallback         close_callback = nullptr);
    ~Browser();

    Browser(const Browser&)            = delete;
    Browser& operator=(const Browser&) = delete;

    boost::asio::awaitable<std::shared_ptr<BrowserContext>> create_incognito_browser_context();
    std::vector<std::shared_ptr<BrowserContext>>            browser_contexts() const;
    std::shared_ptr<BrowserContext>                         default_browser_context() const {
        return default_context_;
    }

    boost::asio::awaitable<std::shared_ptr<Page>> new_page();
    boost::asio::awaitable<std::shared_ptr<Page>>
    create_page_in_context(std::optional<std::string> context_id);
    boost::asio::awaitable<void> dispose_context(const std::string& context_id);

    std::vector<std::shared_ptr<Target>> targets() const {
        return targets_;
    }

    boost::asio::awaitable<std::shared_ptr<Target>>
    wait_for_target(TargetPredicate predicate, WaitForTargetOptions options = {});

    boost::asio::awaitable<std::vector<std::shared_ptr<Page>>> pages();

    // Reported by navigation tracking when a target's url changed in place.
    void target_changed(const std::shared_ptr<Target>& target);

    boost::asio::awaitable<void> close();

    // Always throws: a browser cannot be left running detached.
    void disconnect();
    bool is_connected() const {
        return true;
    }

    const std::optional<Viewport>& default_viewport() const {
        return options_.default_viewport;
    }
    std::shared_ptr<TaskQueue> screenshot_task_queue() const {
        return options_.screenshot_task_queue;
    }

    TargetEvent& on_target_created() {
        return target_created_;
    }
    TargetEvent& on_target_destroyed() {
        return target_destroyed_;
    }
    TargetEvent& on_target_changed() {
        return target_changed_;
    }

private:
    Browser(Protocol::Connection& connection,
            BrowserOptions        options,
            PageFactory           page_factory,
            CloseCallback         close_callback);

    void dispatch(const Protocol::LifecycleEvent& event);
    void handle_target_created(const Protocol::TargetCreated& event);
    void handle_target_destroyed(const Protocol::TargetDestroyed& event);
    void handle_provisional_target_committed(const Protocol::ProvisionalTargetCommitted& event);

    static boost::asio::awaitable<void> swap_page_target(std::weak_ptr<Browser>            browser,
                                                         std::shared_ptr<Target::PageCell> cell,
                                                         std::shared_ptr<Target> new_target);
    static boost::asio::awaitable<std::shared_ptr<Page>>
    materialize_page(std::weak_ptr<Browser> browser, std::shared_ptr<Target> target);

    std::shared_ptr<Target> find_target(const std::string& target_id) const;
    void                    detach_listeners();

    Protocol::Connection& connection_;
    BrowserOptions        options_;
    PageFactory           page_factory_;
    CloseCallback         close_callback_;
    bool                  closed_ = false;

    std::shared_ptr<BrowserContext>                        default_context_;
    std::map<std::string, std::shared_ptr<BrowserContext>> contexts_;
    std::vector<std::shared_ptr<Target>>                   targets_;  // creation order

    std::vector<Core::ListenerId> listeners_;
    TargetEvent                   target_created_;
    TargetEvent                   target_destroyed_;
    TargetEvent                   target_changed_;
};

}  // namespace Browser
}  // namespace Tether
