#pragma once
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "../../src/browser/browser.hpp"
#include "../../src/core/errors/errors.hpp"
#include "../../src/core/types/constants.hpp"

namespace Tether {
namespace Testing {

namespace Methods = Core::Methods;

// Runs |task| on |ioc| until the context runs out of work.
template <typename T>
T await_result(boost::asio::io_context& ioc, boost::asio::awaitable<T> task) {
    std::optional<T>   result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e, T value) {
        error  = e;
        result = std::move(value);
    });
    ioc.restart();
    ioc.run();
    if (error)
        std::rethrow_exception(error);
    return std::move(*result);
}

inline void await_result(boost::asio::io_context& ioc, boost::asio::awaitable<void> task) {
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e) { error = e; });
    ioc.restart();
    ioc.run();
    if (error)
        std::rethrow_exception(error);
}

class FakeSession : public Protocol::Session {
public:
    explicit FakeSession(std::string target_id) : target_id_(std::move(target_id)) {
    }

    const std::string& target_id() const override {
        return target_id_;
    }

    boost::asio::awaitable<nlohmann::json> send(const std::string& /*method*/,
                                                const nlohmann::json& /*params*/) override {
        co_return nlohmann::json::object();
    }

private:
    std::string target_id_;
};

// Scripted connection: commands are answered by per-method handlers, events
// are delivered synchronously by emit().
class FakeConnection : public Protocol::Connection {
public:
    using CommandHandler = std::function<nlohmann::json(const nlohmann::json& params)>;

    explicit FakeConnection(boost::asio::io_context& ioc) : executor_(ioc.get_executor()) {
    }

    void handle(const std::string& method, CommandHandler handler) {
        handlers_[method] = std::move(handler);
    }

    void fail(const std::string& method, const std::string& message) {
        handlers_[method] = [method, message](const nlohmann::json&) -> nlohmann::json {
            throw Core::ProtocolError(method, message);
        };
    }

    boost::asio::awaitable<nlohmann::json> send(const std::string&    method,
                                                const nlohmann::json& params) override {
        sent.emplace_back(method, params);
        auto it = handlers_.find(method);
        if (it == handlers_.end())
            throw Core::ProtocolError(method, "'" + method + "' wasn't found");
        co_return it->second(params);
    }

    Core::ListenerId on(const std::string& event, EventHandler handler) override {
        Core::ListenerId id = next_id_++;
        listeners_[id]      = {event, buses_[event].subscribe(std::move(handler))};
        return id;
    }

    void remove_listener(Core::ListenerId id) override {
        auto it = listeners_.find(id);
        if (it == listeners_.end())
            return;
        buses_[it->second.first].unsubscribe(it->second.second);
        listeners_.erase(it);
    }

    std::shared_ptr<Protocol::Session> session(const std::string& target_id) override {
        sessions.push_back(target_id);
        return std::make_shared<FakeSession>(target_id);
    }

    boost::asio::any_io_executor get_executor() override {
        return executor_;
    }

    void emit(const std::string& event, const nlohmann::json& params) {
        auto it = buses_.find(event);
        if (it != buses_.end())
            it->second.emit(params);
    }

    void create_target(const std::string&         target_id,
                       const std::string&         type       = "page",
                       std::optional<std::string> context_id = std::nullopt,
                       const std::string&         url        = "about:blank") {
        nlohmann::json info = {{"targetId", target_id}, {"type", type}, {"url", url}};
        if (context_id)
            info["browserContextId"] = *context_id;
        emit(Methods::TARGET_CREATED, {{"targetInfo", info}});
    }

    void destroy_target(const std::string& target_id) {
        emit(Methods::TARGET_DESTROYED, {{"targetId", target_id}});
    }

    void commit(const std::string& old_target_id, const std::string& new_target_id) {
        emit(Methods::DID_COMMIT_PROVISIONAL_TARGET,
             {{"oldTargetId", old_target_id}, {"newTargetId", new_target_id}});
    }

    // Browser.createPage announces the new target before answering.
    void serve_pages(const std::string& prefix = "page-") {
        handle(Methods::CREATE_PAGE, [this, prefix](const nlohmann::json& params) {
            std::string id = prefix + std::to_string(++pages_served_);
            std::optional<std::string> context;
            if (params.contains("browserContextId"))
                context = params["browserContextId"].get<std::string>();
            create_target(id, "page", context);
            return nlohmann::json{{"targetId", id}};
        });
    }

    size_t listener_count() const {
        return listeners_.size();
    }

    std::vector<std::pair<std::string, nlohmann::json>> sent;
    std::vector<std::string>                            sessions;

private:
    using Bus = Core::EventBus<const nlohmann::json&>;

    boost::asio::any_io_executor                                        executor_;
    std::map<std::string, CommandHandler>                               handlers_;
    std::map<std::string, Bus>                                          buses_;
    std::map<Core::ListenerId, std::pair<std::string, Core::ListenerId>> listeners_;
    Core::ListenerId                                                    next_id_      = 1;
    int                                                                 pages_served_ = 0;
};

// Holds coroutines until open() is called.
class Gate {
public:
    explicit Gate(boost::asio::io_context& ioc) : timer_(ioc) {
        timer_.expires_at(boost::asio::steady_timer::time_point::max());
    }

    boost::asio::awaitable<void> wait() {
        while (!open_) {
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

    void open() {
        open_ = true;
        timer_.cancel();
    }

private:
    boost::asio::steady_timer timer_;
    bool                      open_ = false;
};

class FakePage : public Browser::Page {
public:
    explicit FakePage(std::shared_ptr<Browser::Target> target) : target_(target) {
    }

    void swap_target_on_navigation(std::shared_ptr<Protocol::Session> session,
                                   std::shared_ptr<Browser::Target>   target) override {
        session_ = std::move(session);
        target_  = target;
        ++swaps;
    }

    std::shared_ptr<Browser::Target> target() const {
        return target_.lock();
    }
    std::shared_ptr<Protocol::Session> session() const {
        return session_;
    }

    int swaps = 0;

private:
    std::weak_ptr<Browser::Target>     target_;
    std::shared_ptr<Protocol::Session> session_;
};

// Page factory that counts what it builds. Targets listed in |refuse| get no
// page, targets listed in |broken| fail, and |gate| holds every build.
struct PageFactoryProbe {
    int                               created = 0;
    std::set<std::string>             refuse;
    std::set<std::string>             broken;
    Gate*                             gate = nullptr;
    std::optional<Browser::Viewport>     last_viewport;
    std::shared_ptr<Browser::TaskQueue>  last_task_queue;

    Browser::PageFactory factory() {
        return [this](std::shared_ptr<Protocol::Session>      session,
                      std::shared_ptr<Browser::Target>        target,
                      const std::optional<Browser::Viewport>& viewport,
                      std::shared_ptr<Browser::TaskQueue>     task_queue) {
            return make(std::move(session), std::move(target), viewport, std::move(task_queue));
        };
    }

    boost::asio::awaitable<std::shared_ptr<Browser::Page>>
    make(std::shared_ptr<Protocol::Session> /*session*/,
         std::shared_ptr<Browser::Target> target,
         std::optional<Browser::Viewport> viewport,
         std::shared_ptr<Browser::TaskQueue> task_queue) {
        last_viewport   = viewport;
        last_task_queue = std::move(task_queue);
        if (gate)
            co_await gate->wait();
        if (broken.count(target->target_id()))
            throw Core::ProtocolError("Page.enable", "target crashed");
        if (refuse.count(target->target_id()))
            co_return nullptr;
        ++created;
        co_return std::make_shared<FakePage>(std::move(target));
    }
};

inline std::shared_ptr<FakePage> as_fake(const std::shared_ptr<Browser::Page>& page) {
    return std::dynamic_pointer_cast<FakePage>(page);
}

}  // namespace Testing
}  // namespace Tether
