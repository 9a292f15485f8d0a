#include "crashbus/protocol.hpp"
#include <utility>

namespace crashbus::protocol {

namespace {

const MessageShape kShapes[] = {
    {kActivationCheck, nullptr, PayloadKind::None},
    {kFetchList, nullptr, PayloadKind::None},
    {kRemoveOne, kKeyRemoveRecord, PayloadKind::Record},
    {kClearAll, nullptr, PayloadKind::None},
    {kActivationReply, kKeyVersionVerify, PayloadKind::String},
    {kFetchListReply, kKeyRecordList, PayloadKind::RecordList},
    {kRemoveOneReply, nullptr, PayloadKind::None},
    {kClearAllReply, nullptr, PayloadKind::None},
};

const std::pair<const char*, const char*> kPairs[] = {
    {kActivationCheck, kActivationReply},
    {kFetchList, kFetchListReply},
    {kRemoveOne, kRemoveOneReply},
    {kClearAll, kClearAllReply},
};

} // namespace

bool FindShape(const std::string& discriminant, MessageShape& out) {
    for (const auto& shape : kShapes) {
        if (discriminant == shape.discriminant) {
            out = shape;
            return true;
        }
    }
    return false;
}

std::string ReplyFor(const std::string& request_discriminant) {
    for (const auto& [req, rep] : kPairs) {
        if (request_discriminant == req) return rep;
    }
    return "";
}

} // namespace crashbus::protocol
