#include "replay_connection.hpp"
#include "../core/errors/errors.hpp"

namespace Tether {
namespace Replay {

using Core::ProtocolError;

namespace {

// Recorded traces carry no per-target traffic.
class ReplaySession : public Protocol::Session {
public:
    explicit ReplaySession(std::string target_id) : target_id_(std::move(target_id)) {
    }

    const std::string& target_id() const override {
        return target_id_;
    }

    boost::asio::awaitable<nlohmann::json> send(const std::string& method,
                                                const nlohmann::json& /*params*/) override {
        throw ProtocolError(method, "target " + target_id_ + " is replayed and takes no commands");
        co_return nlohmann::json();
    }

private:
    std::string target_id_;
};

}  // namespace

ReplayConnection::ReplayConnection(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)) {
}

boost::asio::awaitable<nlohmann::json> ReplayConnection::send(const std::string& method,
                                                              const nlohmann::json& /*params*/) {
    if (expected_.empty())
        throw ProtocolError(method, "no recorded result");
    if (expected_.front().first != method)
        throw ProtocolError(method, "trace expects " + expected_.front().first + " next");

    auto result = std::move(expected_.front().second);
    expected_.pop_front();
    co_return result;
}

Core::ListenerId ReplayConnection::on(const std::string& event, EventHandler handler) {
    Core::ListenerId id = next_id_++;
    listeners_[id]      = {event, buses_[event].subscribe(std::move(handler))};
    return id;
}

void ReplayConnection::remove_listener(Core::ListenerId id) {
    auto it = listeners_.find(id);
    if (it == listeners_.end())
        return;
    buses_[it->second.first].unsubscribe(it->second.second);
    listeners_.erase(it);
}

std::shared_ptr<Protocol::Session> ReplayConnection::session(const std::string& target_id) {
    return std::make_shared<ReplaySession>(target_id);
}

void ReplayConnection::expect_command(const std::string& method, nlohmann::json result) {
    expected_.emplace_back(method, std::move(result));
}

void ReplayConnection::emit(const std::string& event, const nlohmann::json& params) {
    auto it = buses_.find(event);
    if (it != buses_.end())
        it->second.emit(params);
}

}  // namespace Replay
}  // namespace Tether
