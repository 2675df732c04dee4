#include "trace_replayer.hpp"
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"

namespace Tether {
namespace Replay {

using namespace Tether::Core;

namespace {
const char* TRACE = "trace";
}

TraceReplayer::TraceReplayer(Browser::Browser& browser, ReplayConnection& connection)
    : browser_(browser), connection_(connection) {
}

boost::asio::awaitable<ReplaySummary> TraceReplayer::replay(std::istream& trace) {
    ReplaySummary summary;
    std::string   text;
    while (std::getline(trace, text)) {
        ++summary.lines;
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos || text[first] == '#')
            continue;

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw ProtocolError(TRACE,
                                "line " + std::to_string(summary.lines) + ": " + e.what());
        }

        auto method = line.find("method");
        if (!line.is_object() || method == line.end() || !method->is_string())
            throw ProtocolError(TRACE, "line " + std::to_string(summary.lines) + ": no method");
        std::string name   = method->get<std::string>();
        nlohmann::json params = line.value("params", nlohmann::json::object());

        if (name == Methods::CREATE_CONTEXT || name == Methods::DELETE_CONTEXT) {
            co_await replay_command(name, line);
            ++summary.commands;
            continue;
        }

        if (!Protocol::is_lifecycle_event(name))
            throw ProtocolError(TRACE, "line " + std::to_string(summary.lines)
                                           + ": unsupported method " + name);
        if (name == Methods::TARGET_CREATED)
            note_context(params, summary);
        Logger::debug("Replay: " + name);
        connection_.emit(name, params);
        ++summary.events;
    }
    co_return summary;
}

boost::asio::awaitable<void> TraceReplayer::replay_command(const std::string&    method,
                                                           const nlohmann::json& line) {
    if (method == Methods::CREATE_CONTEXT) {
        connection_.expect_command(method, line.value("result", nlohmann::json::object()));
        co_await browser_.create_incognito_browser_context();
        co_return;
    }

    auto params = line.value("params", nlohmann::json::object());
    auto id     = params.find("browserContextId");
    if (id == params.end() || !id->is_string())
        throw ProtocolError(method, "recorded command carries no browserContextId");
    connection_.expect_command(method, nlohmann::json::object());
    co_await browser_.dispose_context(id->get<std::string>());
}

void TraceReplayer::note_context(const nlohmann::json& params, ReplaySummary& summary) {
    if (!params.is_object())
        return;
    auto info = Protocol::parse_target_info(params.value("targetInfo", nlohmann::json()));
    if (!info.browser_context_id)
        return;
    for (const auto& context : browser_.browser_contexts()) {
        if (context->id() == info.browser_context_id)
            return;
    }
    Logger::warn("Replay: target " + info.target_id + " belongs to unknown context "
                 + *info.browser_context_id + ", attributing it to the default context");
    summary.folded_targets.push_back(info.target_id);
}

}  // namespace Replay
}  // namespace Tether
