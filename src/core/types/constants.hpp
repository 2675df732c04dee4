#pragma once
#include <chrono>

namespace Tether {
namespace Core {

struct Constants {
    static constexpr const char* VERSION = "0.1.0";

    static constexpr int DEFAULT_TIMEOUT_MS = 30000;  // 0 disables the timer

    static constexpr const char* PAGE_TARGET_TYPE = "page";
};

namespace Methods {

inline constexpr const char* CREATE_CONTEXT = "Browser.createContext";
inline constexpr const char* DELETE_CONTEXT = "Browser.deleteContext";
inline constexpr const char* CREATE_PAGE    = "Browser.createPage";

inline constexpr const char* TARGET_CREATED                = "Target.targetCreated";
inline constexpr const char* TARGET_DESTROYED              = "Target.targetDestroyed";
inline constexpr const char* DID_COMMIT_PROVISIONAL_TARGET = "Target.didCommitProvisionalTarget";

}  // namespace Methods

inline std::chrono::milliseconds default_timeout() {
    return std::chrono::milliseconds(Constants::DEFAULT_TIMEOUT_MS);
}

}  // namespace Core
}  // namespace Tether
