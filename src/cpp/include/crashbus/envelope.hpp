#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include "types.hpp"

namespace crashbus {

/// Frame prefix: 'C' 'B' + version
inline constexpr uint8_t kEnvelopeMagic0 = 0x43;
inline constexpr uint8_t kEnvelopeMagic1 = 0x42;
inline constexpr uint8_t kEnvelopeVersion = 0x01;

/// The unit exchanged over a broadcast channel.
///
/// The payload body is kept encoded; it is decoded on demand by the typed
/// getters so a corrupt body never prevents the discriminant from being read.
struct Envelope {
    std::string action;
    std::string discriminant;
    std::string payload_key;
    PayloadKind payload_kind = PayloadKind::None;
    std::vector<uint8_t> payload_body;

    bool has_payload() const { return payload_kind != PayloadKind::None; }

    void set_payload(const std::string& key, const Payload& payload);
    void clear_payload();

    // Typed getters: false when the key is absent, the kind differs or the body is malformed.
    bool get_string(const std::string& key, std::string& out) const;
    bool get_int32(const std::string& key, int32_t& out) const;
    bool get_bool(const std::string& key, bool& out) const;
    bool get_record(const std::string& key, AppErrorsRecord& out) const;
    bool get_record_list(const std::string& key, AppErrorsRecordList& out) const;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& frame, Envelope& out);

private:
    bool body_for(const std::string& key, PayloadKind kind) const;
};

} // namespace crashbus
