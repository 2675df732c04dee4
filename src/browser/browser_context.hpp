#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "target.hpp"

namespace Tether {
namespace Browser {

class Browser;

// Isolation scope. Holds no target state of its own: it is a filtered view of
// the Browser registry plus the capability to close itself. A context whose
// Browser was released has no targets and refuses every command.
class BrowserContext : public std::enable_shared_from_this<BrowserContext> {
public:
    // An absent or empty id denotes the default context.
    explicit BrowserContext(std::weak_ptr<Browser>     browser,
                            std::optional<std::string> id = std::nullopt);

    const std::optional<std::string>& id() const {
        return id_;
    }

    std::vector<std::shared_ptr<Target>> targets() const;

    // Pages of every page-type target in target order, skipping targets whose
    // page could not be materialized.
    boost::asio::awaitable<std::vector<std::shared_ptr<Page>>> pages();

    boost::asio::awaitable<std::shared_ptr<Target>>
    wait_for_target(TargetPredicate predicate, WaitForTargetOptions options = {});

    bool is_incognito() const {
        return id_.has_value();
    }

    boost::asio::awaitable<std::shared_ptr<Page>> new_page();

    // Throws Core::PreconditionError for the default context.
    boost::asio::awaitable<void> close();

    // Throws Core::PreconditionError once the Browser was released.
    std::shared_ptr<Browser> browser() const;

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
    friend class Browser;

    std::vector<std::shared_ptr<Target::PageCell>> start_pages() const;

    static boost::asio::awaitable<std::vector<std::shared_ptr<Page>>>
    collect_pages(std::vector<std::shared_ptr<Target::PageCell>> cells);

    std::weak_ptr<Browser>     browser_;
    std::optional<std::string> id_;
    TargetEvent                target_created_;
    TargetEvent                target_destroyed_;
    TargetEvent                target_changed_;
};

}  // namespace Browser
}  // namespace Tether
