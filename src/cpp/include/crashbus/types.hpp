#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <variant>
#include <type_traits>

namespace crashbus {

/// Wire tag of an envelope payload. Values are part of the protocol.
enum class PayloadKind : uint8_t {
    None = 0x00,
    String = 0x01,
    Int32 = 0x02,
    Bool = 0x03,
    Record = 0x04,
    RecordList = 0x05
};

const char* to_string(PayloadKind kind);

/// One captured application crash, as stored by the host and shown by the module UI.
struct AppErrorsRecord {
    int32_t pid = 0;
    int32_t user_id = 0;
    std::string package_name;
    bool is_native_crash = false;
    std::string exception_class_name;
    std::string exception_message;
    std::string throw_file_name;
    std::string throw_class_name;
    std::string throw_method_name;
    int32_t throw_line_number = -1;
    std::string stack_trace;
    int64_t timestamp = 0; // epoch ms

    /// Identity used by the host when removing a single record.
    bool same_identity(const AppErrorsRecord& other) const {
        return package_name == other.package_name && timestamp == other.timestamp;
    }

    bool operator==(const AppErrorsRecord& other) const = default;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const uint8_t*& data, size_t& len, AppErrorsRecord& out);
};

using AppErrorsRecordList = std::vector<AppErrorsRecord>;

/// Closed set of payload shapes an envelope may carry.
using Payload = std::variant<std::string, int32_t, bool, AppErrorsRecord, AppErrorsRecordList>;

PayloadKind payload_kind_of(const Payload& payload);

/// Encodes the payload body (without key, kind or length prefix).
std::vector<uint8_t> encode_payload_body(const Payload& payload);

template <typename T>
Payload MakePayload(T&& value) {
    using V = std::decay_t<T>;
    static_assert(std::is_same_v<V, std::string> || std::is_same_v<V, int32_t> || std::is_same_v<V, bool> ||
                  std::is_same_v<V, AppErrorsRecord> || std::is_same_v<V, AppErrorsRecordList>,
                  "payload must be string, int32_t, bool, AppErrorsRecord or AppErrorsRecordList");
    return Payload(std::in_place_type<V>, std::forward<T>(value));
}

inline Payload MakePayload(const char* value) {
    return Payload(std::in_place_type<std::string>, value);
}

} // namespace crashbus
