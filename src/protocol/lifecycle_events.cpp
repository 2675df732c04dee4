#include "lifecycle_events.hpp"
#include "../core/errors/errors.hpp"
#include "../core/types/constants.hpp"

namespace Tether {
namespace Protocol {

using Core::ProtocolError;
namespace Methods = Core::Methods;

namespace {

std::string required_string(const std::string&    method,
                            const nlohmann::json& object,
                            const char*           field) {
    if (!object.is_object())
        throw ProtocolError(method, "payload is not an object");
    auto it = object.find(field);
    if (it == object.end())
        throw ProtocolError(method, std::string("missing field '") + field + "'");
    if (!it->is_string())
        throw ProtocolError(method, std::string("field '") + field + "' is not a string");
    return it->get<std::string>();
}

}  // namespace

TargetInfo parse_target_info(const nlohmann::json& info) {
    const std::string method = Methods::TARGET_CREATED;

    TargetInfo result;
    result.target_id = required_string(method, info, "targetId");
    result.type      = required_string(method, info, "type");

    auto ctx = info.find("browserContextId");
    if (ctx != info.end() && !ctx->is_null()) {
        if (!ctx->is_string())
            throw ProtocolError(method, "field 'browserContextId' is not a string");
        if (!ctx->get_ref<const std::string&>().empty())
            result.browser_context_id = ctx->get<std::string>();
    }

    auto url = info.find("url");
    if (url != info.end() && url->is_string())
        result.url = url->get<std::string>();
    return result;
}

LifecycleEvent parse_lifecycle_event(const std::string& method, const nlohmann::json& params) {
    if (method == Methods::TARGET_CREATED) {
        if (!params.is_object() || !params.contains("targetInfo"))
            throw ProtocolError(method, "missing field 'targetInfo'");
        return TargetCreated{parse_target_info(params["targetInfo"])};
    }
    if (method == Methods::TARGET_DESTROYED)
        return TargetDestroyed{required_string(method, params, "targetId")};
    if (method == Methods::DID_COMMIT_PROVISIONAL_TARGET) {
        return ProvisionalTargetCommitted{required_string(method, params, "oldTargetId"),
                                          required_string(method, params, "newTargetId")};
    }
    throw ProtocolError(method, "not a target lifecycle event");
}

bool is_lifecycle_event(const std::string& method) {
    return method == Methods::TARGET_CREATED || method == Methods::TARGET_DESTROYED
           || method == Methods::DID_COMMIT_PROVISIONAL_TARGET;
}

}  // namespace Protocol
}  // namespace Tether
