#include "browser.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"

namespace Tether {
namespace Browser {

using namespace Tether::Core;

Browser::Browser(Protocol::Connection& connection,
                 BrowserOptions        options,
                 PageFactory           page_factory,
                 CloseCallback         close_callback)
    : connection_(connection),
      options_(std::move(options)),
      page_factory_(std::move(page_factory)),
      close_callback_(std::move(close_callback)) {
    for (const char* method : {Methods::TARGET_CREATED,
                               Methods::TARGET_DESTROYED,
                               Methods::DID_COMMIT_PROVISIONAL_TARGET}) {
        std::string name = method;
        listeners_.push_back(connection_.on(name, [this, name](const nlohmann::json& params) {
            dispatch(Protocol::parse_lifecycle_event(name, params));
        }));
    }
}

std::shared_ptr<Browser> Browser::create(Protocol::Connection& connection,
                                         BrowserOptions        options,
                                         PageFactory           page_factory,
                                         CloseCallback         close_callback) {
    std::shared_ptr<Browser> browser(new Browser(
        connection, std::move(options), std::move(page_factory), std::move(close_callback)));
    browser->default_context_ = std::make_shared<BrowserContext>(browser);
    return browser;
}

Browser::~Browser() {
    detach_listeners();
}

void Browser::detach_listeners() {
    for (auto id : listeners_)
        connection_.remove_listener(id);
    listeners_.clear();
}

boost::asio::awaitable<std::shared_ptr<BrowserContext>>
Browser::create_incognito_browser_context() {
    auto result = co_await connection_.send(Methods::CREATE_CONTEXT);

    auto id = result.find("browserContextId");
    if (id == result.end() || !id->is_string() || id->get_ref<const std::string&>().empty())
        throw ProtocolError(Methods::CREATE_CONTEXT, "response carries no browserContextId");

    auto context_id = id->get<std::string>();
    auto context    = std::make_shared<BrowserContext>(weak_from_this(), context_id);
    contexts_[context_id] = context;
    Logger::info("Browser: created context " + context_id);
    co_return context;
}

std::vector<std::shared_ptr<BrowserContext>> Browser::browser_contexts() const {
    std::vector<std::shared_ptr<BrowserContext>> result{default_context_};
    for (const auto& [id, context] : contexts_)
        result.push_back(context);
    return result;
}

boost::asio::awaitable<void> Browser::dispose_context(const std::string& context_id) {
    nlohmann::json params = {{"browserContextId", context_id}};
    co_await connection_.send(Methods::DELETE_CONTEXT, params);
    contexts_.erase(context_id);
    Logger::info("Browser: disposed context " + context_id);
}

boost::asio::awaitable<std::shared_ptr<Page>> Browser::new_page() {
    co_return co_await create_page_in_context(default_context_->id());
}

boost::asio::awaitable<std::shared_ptr<Page>>
Browser::create_page_in_context(std::optional<std::string> context_id) {
    nlohmann::json params = nlohmann::json::object();
    if (context_id)
        params["browserContextId"] = *context_id;

    auto result = co_await connection_.send(Methods::CREATE_PAGE, params);

    auto id = result.find("targetId");
    if (id == result.end() || !id->is_string())
        throw ProtocolError(Methods::CREATE_PAGE, "response carries no targetId");

    auto target = find_target(id->get<std::string>());
    if (!target) {
        std::string message = "Target " + id->get<std::string>() + " was not announced before "
                              + Methods::CREATE_PAGE + " returned";
        Logger::error("Browser: " + message);
        throw InternalError(message);
    }
    co_return co_await target->page();
}

boost::asio::awaitable<std::shared_ptr<Target>>
Browser::wait_for_target(TargetPredicate predicate, WaitForTargetOptions options) {
    auto timeout = options.timeout.value_or(options_.default_timeout);

    for (const auto& target : targets_) {
        if (predicate(*target))
            co_return target;
    }

    boost::asio::steady_timer signal(co_await boost::asio::this_coro::executor);
    if (timeout.count() > 0)
        signal.expires_after(timeout);
    else
        signal.expires_at(boost::asio::steady_timer::time_point::max());

    std::shared_ptr<Target> found;
    auto check = [&found, &signal, &predicate](const std::shared_ptr<Target>& target) {
        if (found || !predicate(*target))
            return;
        found = target;
        signal.cancel();
    };
    ScopedListener<const std::shared_ptr<Target>&> on_created(target_created_, check);
    ScopedListener<const std::shared_ptr<Target>&> on_changed(target_changed_, check);

    while (!found) {
        boost::system::error_code ec;
        co_await signal.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (!found && ec != boost::asio::error::operation_aborted)
            throw TimeoutError("target", timeout);
    }
    co_return found;
}

boost::asio::awaitable<std::vector<std::shared_ptr<Page>>> Browser::pages() {
    std::vector<std::shared_ptr<Target::PageCell>> cells;
    for (const auto& context : browser_contexts()) {
        auto context_cells = context->start_pages();
        cells.insert(cells.end(), context_cells.begin(), context_cells.end());
    }
    co_return co_await BrowserContext::collect_pages(std::move(cells));
}

void Browser::target_changed(const std::shared_ptr<Target>& target) {
    target_changed_.emit(target);
    target->browser_context()->target_changed_.emit(target);
}

boost::asio::awaitable<void> Browser::close() {
    detach_listeners();
    if (closed_)
        co_return;
    closed_ = true;
    if (close_callback_)
        co_await close_callback_();
}

void Browser::disconnect() {
    throw PreconditionError("Unsupported operation");
}

void Browser::dispatch(const Protocol::LifecycleEvent& event) {
    if (auto created = std::get_if<Protocol::TargetCreated>(&event))
        handle_target_created(*created);
    else if (auto destroyed = std::get_if<Protocol::TargetDestroyed>(&event))
        handle_target_destroyed(*destroyed);
    else
        handle_provisional_target_committed(std::get<Protocol::ProvisionalTargetCommitted>(event));
}

void Browser::handle_target_created(const Protocol::TargetCreated& event) {
    const auto& info = event.target_info;
    if (find_target(info.target_id)) {
        std::string message = "Target " + info.target_id + " was announced twice";
        Logger::error("Browser: " + message);
        throw InternalError(message);
    }

    // There is no context lifecycle event, so the default context id is unknown
    // and targets of unrecognized contexts are attributed to the default one.
    std::shared_ptr<BrowserContext> context;
    if (info.browser_context_id) {
        auto it = contexts_.find(*info.browser_context_id);
        if (it != contexts_.end())
            context = it->second;
    }
    if (!context)
        context = default_context_;

    auto target = std::make_shared<Target>(
        info, context, connection_.get_executor(),
        [browser = weak_from_this()](std::shared_ptr<Target> t) {
            return materialize_page(browser, std::move(t));
        });
    targets_.push_back(target);
    Logger::debug("Browser: target " + info.target_id + " (" + info.type + ") created");

    target_created_.emit(target);
    context->target_created_.emit(target);
}

void Browser::handle_target_destroyed(const Protocol::TargetDestroyed& event) {
    auto it = std::find_if(targets_.begin(), targets_.end(), [&](const auto& target) {
        return target->target_id() == event.target_id;
    });
    if (it == targets_.end()) {
        std::string message = "Destroyed target " + event.target_id + " is not registered";
        Logger::error("Browser: " + message);
        throw InternalError(message);
    }

    auto target = *it;
    targets_.erase(it);
    target->closed_callback();
    Logger::debug("Browser: target " + event.target_id + " destroyed");

    target_destroyed_.emit(target);
    target->browser_context()->target_destroyed_.emit(target);
}

void Browser::handle_provisional_target_committed(
    const Protocol::ProvisionalTargetCommitted& event) {
    auto old_target = find_target(event.old_target_id);
    if (!old_target) {
        Logger::warn("Browser: provisional commit from unknown target " + event.old_target_id);
        return;
    }
    auto cell = old_target->page_cell();
    if (!cell)
        return;

    auto new_target = find_target(event.new_target_id);
    if (!new_target) {
        std::string message =
            "Provisional target " + event.new_target_id + " committed before it was announced";
        Logger::error("Browser: " + message);
        throw InternalError(message);
    }

    // Share the cell right away so a page() call on the new target cannot
    // start a second materialization while the old one is still pending.
    new_target->adopt_page_cell(cell);
    Logger::debug("Browser: page moves from " + event.old_target_id + " to "
                  + event.new_target_id);

    boost::asio::co_spawn(connection_.get_executor(),
                          swap_page_target(weak_from_this(), std::move(cell), std::move(new_target)),
                          [](std::exception_ptr error) {
                              if (error)
                                  std::rethrow_exception(error);
                          });
}

boost::asio::awaitable<void> Browser::swap_page_target(std::weak_ptr<Browser>            browser,
                                                       std::shared_ptr<Target::PageCell> cell,
                                                       std::shared_ptr<Target>           new_target) {
    auto page = co_await cell->get();
    auto self = browser.lock();
    if (!page || !self)
        co_return;
    page->swap_target_on_navigation(self->connection_.session(new_target->target_id()), new_target);
}

boost::asio::awaitable<std::shared_ptr<Page>>
Browser::materialize_page(std::weak_ptr<Browser> browser, std::shared_ptr<Target> target) {
    auto self = browser.lock();
    if (!self)
        throw PreconditionError("Target " + target->target_id()
                                + " outlived its browser and has no page");
    auto session = self->connection_.session(target->target_id());
    co_return co_await self->page_factory_(std::move(session),
                                           std::move(target),
                                           self->options_.default_viewport,
                                           self->options_.screenshot_task_queue);
}

std::shared_ptr<Target> Browser::find_target(const std::string& target_id) const {
    auto it = std::find_if(targets_.begin(), targets_.end(), [&](const auto& target) {
        return target->target_id() == target_id;
    });
    return it == targets_.end() ? nullptr : *it;
}

}  // namespace Browser
}  // namespace Tether
