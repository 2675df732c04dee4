#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "browser/browser.hpp"
#include "core/config/config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "replay/trace_replayer.hpp"

using namespace Tether;
using namespace Tether::Core;

namespace {

// Replayed targets never take commands, so no page is ever built for them.
boost::asio::awaitable<std::shared_ptr<Browser::Page>>
refuse_page(std::shared_ptr<Protocol::Session>, std::shared_ptr<Browser::Target> target,
            const std::optional<Browser::Viewport>&, std::shared_ptr<Browser::TaskQueue>) {
    throw PreconditionError("replayed target " + target->target_id() + " has no page");
    co_return nullptr;
}

nlohmann::json describe(const Browser::Browser& browser, const Replay::ReplaySummary& summary) {
    nlohmann::json contexts = nlohmann::json::array();
    for (const auto& context : browser.browser_contexts()) {
        nlohmann::json targets = nlohmann::json::array();
        for (const auto& target : context->targets()) {
            targets.push_back(
                {{"targetId", target->target_id()}, {"type", target->type()}, {"url", target->url()}});
        }
        contexts.push_back({{"browserContextId", context->id().value_or("")},
                            {"incognito", context->is_incognito()},
                            {"targets", targets}});
    }
    return {{"lines", summary.lines},
            {"events", summary.events},
            {"commands", summary.commands},
            {"foldedTargets", summary.folded_targets},
            {"contexts", contexts}};
}

void print_summary(const nlohmann::json& report) {
    std::cout << report["events"].get<size_t>() << " events, " << report["commands"].get<size_t>()
              << " commands replayed" << std::endl;
    for (const auto& context : report["contexts"]) {
        auto id = context["browserContextId"].get<std::string>();
        std::cout << (id.empty() ? "default context" : "context " + id) << std::endl;
        for (const auto& target : context["targets"]) {
            std::cout << "  " << target["targetId"].get<std::string>() << " ["
                      << target["type"].get<std::string>() << "] "
                      << target["url"].get<std::string>() << std::endl;
        }
    }
}

int run(const Config& config) {
    std::ifstream trace(config.trace_path);
    if (!trace) {
        Logger::error("Cannot open trace " + config.trace_path);
        return 1;
    }

    boost::asio::io_context    ioc;
    Replay::ReplayConnection   connection(ioc.get_executor());
    auto browser = Browser::Browser::create(connection, Browser::BrowserOptions{}, refuse_page);
    Replay::TraceReplayer      replayer(*browser, connection);
    Replay::ReplaySummary      summary;
    bool                       done = false;

    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            summary = co_await replayer.replay(trace);
            co_await browser->close();
            done = true;
        },
        [](std::exception_ptr error) {
            if (error)
                std::rethrow_exception(error);
        });

    try {
        ioc.run();
    } catch (const Error& e) {
        Logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Replay failed: ") + e.what());
        return 1;
    }
    if (!done) {
        Logger::error("Replay stalled before the end of the trace");
        return 1;
    }

    auto report = describe(*browser, summary);
    if (config.json_output)
        std::cout << report.dump(2) << std::endl;
    else
        print_summary(report);

    if (config.strict && !summary.folded_targets.empty()) {
        Logger::error(std::to_string(summary.folded_targets.size())
                      + " targets belong to unknown contexts");
        return 2;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.trace_path.empty()) {
        Logger::error("No trace provided.");
        return 1;
    }
    if (auto level = Logger::parse_level(config.log_level))
        Logger::set_level(*level);

    return run(config);
}
