#pragma once
#include <boost/asio/any_io_executor.hpp>
#include <deque>
#include <map>
#include <string>
#include <utility>

#include "../protocol/connection.hpp"

namespace Tether {
namespace Replay {

// In-process connection fed from a recorded trace. Commands are answered
// from results queued with expect_command(), strictly in order; events are
// delivered synchronously by emit().
class ReplayConnection : public Protocol::Connection {
public:
    explicit ReplayConnection(boost::asio::any_io_executor executor);

    boost::asio::awaitable<nlohmann::json> send(const std::string&    method,
                                                const nlohmann::json& params) override;

    Core::ListenerId on(const std::string& event, EventHandler handler) override;
    void             remove_listener(Core::ListenerId id) override;

    std::shared_ptr<Protocol::Session> session(const std::string& target_id) override;

    boost::asio::any_io_executor get_executor() override {
        return executor_;
    }

    void expect_command(const std::string& method, nlohmann::json result);
    void emit(const std::string& event, const nlohmann::json& params);

    size_t pending_commands() const {
        return expected_.size();
    }
    size_t listener_count() const {
        return listeners_.size();
    }

private:
    using Bus = Core::EventBus<const nlohmann::json&>;

    boost::asio::any_io_executor                                 executor_;
    std::deque<std::pair<std::string, nlohmann::json>>           expected_;
    std::map<std::string, Bus>                                   buses_;
    std::map<Core::ListenerId, std::pair<std::string, Core::ListenerId>> listeners_;
    Core::ListenerId                                             next_id_ = 1;
};

}  // namespace Replay
}  // namespace Tether
