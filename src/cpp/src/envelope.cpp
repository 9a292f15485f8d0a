#include "crashbus/envelope.hpp"
#include "crashbus/wire.hpp"
#include <utility>

namespace crashbus {

void Envelope::set_payload(const std::string& key, const Payload& payload) {
    payload_key = key;
    payload_kind = payload_kind_of(payload);
    payload_body = encode_payload_body(payload);
}

void Envelope::clear_payload() {
    payload_key.clear();
    payload_kind = PayloadKind::None;
    payload_body.clear();
}

bool Envelope::body_for(const std::string& key, PayloadKind kind) const {
    return has_payload() && payload_key == key && payload_kind == kind;
}

bool Envelope::get_string(const std::string& key, std::string& out) const {
    if (!body_for(key, PayloadKind::String)) return false;
    out.assign(payload_body.begin(), payload_body.end());
    return true;
}

bool Envelope::get_int32(const std::string& key, int32_t& out) const {
    if (!body_for(key, PayloadKind::Int32) || payload_body.size() != 4) return false;
    const uint8_t* ptr = payload_body.data();
    size_t len = payload_body.size();
    uint32_t v = 0;
    if (!read_u32_be(ptr, len, v)) return false;
    out = static_cast<int32_t>(v);
    return true;
}

bool Envelope::get_bool(const std::string& key, bool& out) const {
    if (!body_for(key, PayloadKind::Bool) || payload_body.size() != 1 || payload_body[0] > 1) return false;
    out = payload_body[0] == 1;
    return true;
}

bool Envelope::get_record(const std::string& key, AppErrorsRecord& out) const {
    if (!body_for(key, PayloadKind::Record)) return false;
    const uint8_t* ptr = payload_body.data();
    size_t len = payload_body.size();
    AppErrorsRecord rec;
    if (!AppErrorsRecord::deserialize(ptr, len, rec) || len != 0) return false;
    out = std::move(rec);
    return true;
}

bool Envelope::get_record_list(const std::string& key, AppErrorsRecordList& out) const {
    if (!body_for(key, PayloadKind::RecordList)) return false;
    const uint8_t* ptr = payload_body.data();
    size_t len = payload_body.size();

    uint32_t count = 0;
    if (!read_u32_be(ptr, len, count)) return false;
    // Every element carries at least its own length prefix
    if (count > len / 4) return false;

    AppErrorsRecordList list;
    list.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        uint32_t rec_len = 0;
        if (!read_u32_be(ptr, len, rec_len) || rec_len > len) return false;
        const uint8_t* rec_ptr = ptr;
        size_t rec_remaining = rec_len;
        AppErrorsRecord rec;
        if (!AppErrorsRecord::deserialize(rec_ptr, rec_remaining, rec) || rec_remaining != 0) return false;
        list.push_back(std::move(rec));
        ptr += rec_len; len -= rec_len;
    }
    if (len != 0) return false;

    out = std::move(list);
    return true;
}

std::vector<uint8_t> Envelope::serialize() const {
    std::vector<uint8_t> buffer;
    buffer.push_back(kEnvelopeMagic0); buffer.push_back(kEnvelopeMagic1); buffer.push_back(kEnvelopeVersion);
    write_short_string(buffer, action);
    write_short_string(buffer, discriminant);
    if (!has_payload()) {
        write_u8(buffer, 0);
        return buffer;
    }
    write_u8(buffer, 1);
    write_short_string(buffer, payload_key);
    write_u8(buffer, static_cast<uint8_t>(payload_kind));
    write_u32_be(buffer, static_cast<uint32_t>(payload_body.size()));
    buffer.insert(buffer.end(), payload_body.begin(), payload_body.end());
    return buffer;
}

bool Envelope::deserialize(const std::vector<uint8_t>& frame, Envelope& out) {
    const uint8_t* ptr = frame.data();
    size_t len = frame.size();
    if (len < 3 || ptr[0] != kEnvelopeMagic0 || ptr[1] != kEnvelopeMagic1 || ptr[2] != kEnvelopeVersion) return false;
    ptr += 3; len -= 3;

    Envelope env;
    if (!read_short_string(ptr, len, env.action)) return false;
    if (!read_short_string(ptr, len, env.discriminant)) return false;

    uint8_t has_payload = 0;
    if (!read_u8(ptr, len, has_payload) || has_payload > 1) return false;
    if (has_payload == 1) {
        uint8_t kind = 0;
        uint32_t body_len = 0;
        if (!read_short_string(ptr, len, env.payload_key)) return false;
        if (!read_u8(ptr, len, kind)) return false;
        if (kind < static_cast<uint8_t>(PayloadKind::String) || kind > static_cast<uint8_t>(PayloadKind::RecordList)) return false;
        if (!read_u32_be(ptr, len, body_len) || body_len > len) return false;
        env.payload_kind = static_cast<PayloadKind>(kind);
        env.payload_body.assign(ptr, ptr + body_len);
        ptr += body_len; len -= body_len;
    }
    if (len != 0) return false;

    out = std::move(env);
    return true;
}

} // namespace crashbus
