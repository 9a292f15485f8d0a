#include "crashbus/types.hpp"
#include "crashbus/wire.hpp"
#include <utility>

namespace crashbus {

const char* to_string(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::None: return "none";
        case PayloadKind::String: return "string";
        case PayloadKind::Int32: return "int32";
        case PayloadKind::Bool: return "bool";
        case PayloadKind::Record: return "record";
        case PayloadKind::RecordList: return "record-list";
    }
    return "unknown";
}

std::vector<uint8_t> AppErrorsRecord::serialize() const {
    std::vector<uint8_t> buffer;
    write_u32_be(buffer, static_cast<uint32_t>(pid));
    write_u32_be(buffer, static_cast<uint32_t>(user_id));
    write_string(buffer, package_name);
    write_u8(buffer, is_native_crash ? 1 : 0);
    write_string(buffer, exception_class_name);
    write_string(buffer, exception_message);
    write_string(buffer, throw_file_name);
    write_string(buffer, throw_class_name);
    write_string(buffer, throw_method_name);
    write_u32_be(buffer, static_cast<uint32_t>(throw_line_number));
    write_string(buffer, stack_trace);
    write_u64_be(buffer, static_cast<uint64_t>(timestamp));
    return buffer;
}

bool AppErrorsRecord::deserialize(const uint8_t*& data, size_t& len, AppErrorsRecord& out) {
    AppErrorsRecord obj;
    uint32_t u32 = 0;
    uint64_t u64 = 0;
    uint8_t flag = 0;

    if (!read_u32_be(data, len, u32)) return false;
    obj.pid = static_cast<int32_t>(u32);
    if (!read_u32_be(data, len, u32)) return false;
    obj.user_id = static_cast<int32_t>(u32);
    if (!read_string(data, len, obj.package_name)) return false;
    if (!read_u8(data, len, flag) || flag > 1) return false;
    obj.is_native_crash = flag == 1;
    if (!read_string(data, len, obj.exception_class_name)) return false;
    if (!read_string(data, len, obj.exception_message)) return false;
    if (!read_string(data, len, obj.throw_file_name)) return false;
    if (!read_string(data, len, obj.throw_class_name)) return false;
    if (!read_string(data, len, obj.throw_method_name)) return false;
    if (!read_u32_be(data, len, u32)) return false;
    obj.throw_line_number = static_cast<int32_t>(u32);
    if (!read_string(data, len, obj.stack_trace)) return false;
    if (!read_u64_be(data, len, u64)) return false;
    obj.timestamp = static_cast<int64_t>(u64);

    out = std::move(obj);
    return true;
}

PayloadKind payload_kind_of(const Payload& payload) {
    switch (payload.index()) {
        case 0: return PayloadKind::String;
        case 1: return PayloadKind::Int32;
        case 2: return PayloadKind::Bool;
        case 3: return PayloadKind::Record;
        case 4: return PayloadKind::RecordList;
    }
    return PayloadKind::None;
}

std::vector<uint8_t> encode_payload_body(const Payload& payload) {
    std::vector<uint8_t> body;
    if (auto s = std::get_if<std::string>(&payload)) {
        body.assign(s->begin(), s->end());
    } else if (auto i = std::get_if<int32_t>(&payload)) {
        write_u32_be(body, static_cast<uint32_t>(*i));
    } else if (auto b = std::get_if<bool>(&payload)) {
        write_u8(body, *b ? 1 : 0);
    } else if (auto r = std::get_if<AppErrorsRecord>(&payload)) {
        body = r->serialize();
    } else if (auto list = std::get_if<AppErrorsRecordList>(&payload)) {
        write_u32_be(body, static_cast<uint32_t>(list->size()));
        for (const auto& rec : *list) {
            auto bytes = rec.serialize();
            write_u32_be(body, static_cast<uint32_t>(bytes.size()));
            body.insert(body.end(), bytes.begin(), bytes.end());
        }
    }
    return body;
}

} // namespace crashbus
