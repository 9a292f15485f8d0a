#pragma once
#include <string>
#include "types.hpp"

// Shared with the host build so both ends agree on the token.
#ifndef CRASHBUS_MODULE_VERSION_VERIFY
#define CRASHBUS_MODULE_VERSION_VERIFY "crashbus-1"
#endif

namespace crashbus::protocol {

// Requests (module -> host, on the host_handler channel)
inline constexpr const char* kActivationCheck = "activation-check";
inline constexpr const char* kFetchList = "fetch-list";
inline constexpr const char* kRemoveOne = "remove-one";
inline constexpr const char* kClearAll = "clear-all";

// Replies (host -> module, on the module_handler channel)
inline constexpr const char* kActivationReply = "activation-reply";
inline constexpr const char* kFetchListReply = "fetch-list-reply";
inline constexpr const char* kRemoveOneReply = "remove-one-reply";
inline constexpr const char* kClearAllReply = "clear-all-reply";

// Payload keys
inline constexpr const char* kKeyVersionVerify = "module_version_verify";
inline constexpr const char* kKeyRecordList = "app_errors_data_get_content";
inline constexpr const char* kKeyRemoveRecord = "app_errors_data_remove_content";

inline constexpr const char* kModuleVersionVerify = CRASHBUS_MODULE_VERSION_VERIFY;

/// Fixed payload contract of one discriminant.
struct MessageShape {
    const char* discriminant;
    const char* payload_key; // nullptr when the message carries no payload
    PayloadKind kind;
};

/// Looks up the shape for a discriminant. Returns false for names outside the protocol.
bool FindShape(const std::string& discriminant, MessageShape& out);

/// Reply discriminant paired with a request, or an empty string.
std::string ReplyFor(const std::string& request_discriminant);

} // namespace crashbus::protocol
