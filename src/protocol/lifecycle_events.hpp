#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace Tether {
namespace Protocol {

struct TargetInfo {
    std::string                target_id;
    std::string                type;
    std::optional<std::string> browser_context_id;
    std::string                url;
};

struct TargetCreated {
    TargetInfo target_info;
};

struct TargetDestroyed {
    std::string target_id;
};

struct ProvisionalTargetCommitted {
    std::string old_target_id;
    std::string new_target_id;
};

using LifecycleEvent = std::variant<TargetCreated, TargetDestroyed, ProvisionalTargetCommitted>;

// Throws Core::ProtocolError for an unknown method or a payload missing a
// required field. An empty browserContextId is read as absent.
LifecycleEvent parse_lifecycle_event(const std::string& method, const nlohmann::json& params);

TargetInfo parse_target_info(const nlohmann::json& info);

// True for the three notification names parse_lifecycle_event() accepts.
bool is_lifecycle_event(const std::string& method);

}  // namespace Protocol
}  // namespace Tether
