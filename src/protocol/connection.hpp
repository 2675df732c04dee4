#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "../core/events/event_bus.hpp"

namespace Tether {
namespace Protocol {

// Command channel bound to one target.
class Session {
public:
    virtual ~Session() = default;

    virtual const std::string& target_id() const = 0;

    virtual boost::asio::awaitable<nlohmann::json>
    send(const std::string& method, const nlohmann::json& params = nlohmann::json::object()) = 0;
};

// Browser-level transport. Implementations deliver events on the executor
// returned by get_executor(), in the order the browser emitted them, and
// throw Core::ProtocolError from send() when a command fails.
class Connection {
public:
    using EventHandler = std::function<void(const nlohmann::json& params)>;

    virtual ~Connection() = default;

    virtual boost::asio::awaitable<nlohmann::json>
    send(const std::string& method, const nlohmann::json& params = nlohmann::json::object()) = 0;

    virtual Core::ListenerId on(const std::string& event, EventHandler handler) = 0;
    virtual void             remove_listener(Core::ListenerId id)               = 0;

    virtual std::shared_ptr<Session> session(const std::string& target_id) = 0;

    virtual boost::asio::any_io_executor get_executor() = 0;
};

}  // namespace Protocol
}  // namespace Tether
