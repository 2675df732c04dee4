#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <istream>
#include <string>
#include <vector>

#include "../browser/browser.hpp"
#include "replay_connection.hpp"

namespace Tether {
namespace Replay {

struct ReplaySummary {
    size_t                   lines    = 0;
    size_t                   events   = 0;
    size_t                   commands = 0;
    std::vector<std::string> folded_targets;  // announced with a context id we never created
};

// Drives a Browser from a JSON-lines trace. Each line is either an event
//   {"method": "Target.targetCreated", "params": {...}}
// or a recorded command
//   {"method": "Browser.createContext", "result": {"browserContextId": "..."}}
//   {"method": "Browser.deleteContext", "params": {"browserContextId": "..."}}
// Blank lines and lines starting with '#' are skipped. Any other method is
// rejected.
class TraceReplayer {
public:
    TraceReplayer(Browser::Browser& browser, ReplayConnection& connection);

    // Throws Core::ProtocolError for a malformed line and lets the Browser's
    // own errors (Core::InternalError on an out-of-order stream) escape.
    boost::asio::awaitable<ReplaySummary> replay(std::istream& trace);

private:
    boost::asio::awaitable<void> replay_command(const std::string&    method,
                                                const nlohmann::json& line);
    void                         note_context(const nlohmann::json& params, ReplaySummary& summary);

    Browser::Browser& browser_;
    ReplayConnection& connection_;
};

}  // namespace Replay
}  // namespace Tether
