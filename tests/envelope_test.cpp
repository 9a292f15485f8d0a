#include <iostream>
#include <vector>
#include <string>
#include <cassert>
#include <stdexcept>
#include "crashbus/envelope.hpp"
#include "crashbus/protocol.hpp"
#include "crashbus/message_bus.hpp"
#include "loopback_transport.hpp"

using namespace crashbus;

int main() {
    std::cout << "Running C++ Envelope Tests..." << std::endl;

    // 1. Header layout of a payload-less request
    {
        Envelope env;
        env.action = "A";
        env.discriminant = "clear-all";
        std::vector<uint8_t> frame = env.serialize();

        // magic(2) version(1) action(2+1) discriminant(2+9) has_payload(1)
        assert(frame.size() == 18);
        assert(frame[0] == 'C' && frame[1] == 'B' && frame[2] == 0x01);
        assert(frame[3] == 0x00 && frame[4] == 0x01 && frame[5] == 'A');
        assert(frame[6] == 0x00 && frame[7] == 0x09);
        assert(frame[17] == 0x00);

        Envelope back;
        assert(Envelope::deserialize(frame, back));
        assert(back.action == "A");
        assert(back.discriminant == "clear-all");
        assert(!back.has_payload());
        std::cout << "Request header layout: OK" << std::endl;
    }

    // 2. Scalar payloads are big-endian and typed
    {
        Envelope env;
        env.action = "A";
        env.discriminant = "d";
        env.set_payload("count", MakePayload(int32_t(-2)));
        std::vector<uint8_t> frame = env.serialize();
        // ... has_payload(1) key(2+5) kind(1) body_len(4) body(4)
        size_t kind_pos = frame.size() - 9;
        assert(frame[kind_pos] == static_cast<uint8_t>(PayloadKind::Int32));
        assert(frame[kind_pos + 4] == 0x04);
        assert(frame[frame.size() - 4] == 0xFF && frame[frame.size() - 1] == 0xFE);

        Envelope back;
        assert(Envelope::deserialize(frame, back));
        int32_t v = 0;
        assert(back.get_int32("count", v));
        assert(v == -2);

        // Typed getters refuse the wrong kind or key
        bool b = true;
        std::string s;
        assert(!back.get_bool("count", b));
        assert(!back.get_string("count", s));
        assert(!back.get_int32("other", v));

        env.set_payload("flag", MakePayload(false));
        assert(Envelope::deserialize(env.serialize(), back));
        assert(back.get_bool("flag", b));
        assert(b == false);
        std::cout << "Scalar payloads: OK" << std::endl;
    }

    // 3. Record payload keeps every field, including empty and unicode strings
    {
        AppErrorsRecord rec;
        rec.pid = 31337;
        rec.user_id = 10;
        rec.package_name = "com.example.app";
        rec.is_native_crash = true;
        rec.exception_class_name = "SIGSEGV";
        rec.exception_message = "";
        rec.throw_file_name = "libnative.so";
        rec.throw_class_name = "";
        rec.throw_method_name = "\xE5\xB4\xA9\xE6\xBA\x83";
        rec.throw_line_number = -1;
        rec.stack_trace = "#00 pc 0000000000012345 libnative.so";
        rec.timestamp = 1700000000999LL;

        Envelope env;
        env.action = "A";
        env.discriminant = protocol::kRemoveOne;
        env.set_payload(protocol::kKeyRemoveRecord, MakePayload(rec));

        Envelope back;
        assert(Envelope::deserialize(env.serialize(), back));
        AppErrorsRecord got;
        assert(back.get_record(protocol::kKeyRemoveRecord, got));
        assert(got == rec);
        assert(got.same_identity(rec));

        AppErrorsRecord other = rec;
        other.pid = 1;
        other.stack_trace = "different";
        assert(other.same_identity(rec));
        other.timestamp += 1;
        assert(!other.same_identity(rec));
        std::cout << "Record payload: OK" << std::endl;
    }

    // 4. Framing errors reject the whole frame
    {
        Envelope env;
        env.action = "A";
        env.discriminant = "d";
        env.set_payload("k", MakePayload(std::string("value")));
        std::vector<uint8_t> frame = env.serialize();
        Envelope out;

        std::vector<uint8_t> truncated(frame.begin(), frame.end() - 1);
        assert(!Envelope::deserialize(truncated, out));

        std::vector<uint8_t> trailing = frame;
        trailing.push_back(0x00);
        assert(!Envelope::deserialize(trailing, out));

        std::vector<uint8_t> bad_magic = frame;
        bad_magic[0] = 'X';
        assert(!Envelope::deserialize(bad_magic, out));

        std::vector<uint8_t> bad_version = frame;
        bad_version[2] = 0x02;
        assert(!Envelope::deserialize(bad_version, out));

        std::vector<uint8_t> bad_kind = frame;
        bad_kind[frame.size() - 5 - 4 - 1] = 0x09; // kind byte precedes u32 length and 5-byte body
        assert(!Envelope::deserialize(bad_kind, out));

        assert(!Envelope::deserialize({}, out));
        std::cout << "Framing errors rejected: OK" << std::endl;
    }

    // 5. A corrupt body still yields a readable discriminant
    {
        Envelope env;
        env.action = "A";
        env.discriminant = protocol::kFetchListReply;
        env.payload_key = protocol::kKeyRecordList;
        env.payload_kind = PayloadKind::RecordList;
        env.payload_body = {0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x03, 0x01, 0x02, 0x03};

        Envelope back;
        assert(Envelope::deserialize(env.serialize(), back));
        assert(back.discriminant == protocol::kFetchListReply);
        AppErrorsRecordList list;
        assert(!back.get_record_list(protocol::kKeyRecordList, list));
        assert(!ReplyDemultiplexer::DecodeRecordList(back, list));
        assert(list.empty());

        // Record shorter than its declared length
        AppErrorsRecord rec;
        rec.package_name = "com.example.app";
        std::vector<uint8_t> bytes = rec.serialize();
        bytes.pop_back();
        const uint8_t* ptr = bytes.data();
        size_t len = bytes.size();
        AppErrorsRecord partial;
        assert(!AppErrorsRecord::deserialize(ptr, len, partial));
        std::cout << "Corrupt body isolated: OK" << std::endl;
    }

    // 6. Publishing outside the protocol table is a programming error
    {
        testing::LoopbackTransport transport;
        ChannelConfig channel = ConfigLoader::Defaults("module_app").publish;
        RequestEncoder encoder(transport, channel, std::make_shared<ConsoleLogger>(LogLevel::WARN));

        bool threw = false;
        try { encoder.Publish("format-disk"); } catch (const std::logic_error&) { threw = true; }
        assert(threw);

        threw = false;
        try { encoder.Publish(protocol::kRemoveOne); } catch (const std::logic_error&) { threw = true; }
        assert(threw);

        threw = false;
        try { encoder.Publish(protocol::kFetchList, protocol::kKeyRecordList, MakePayload(int32_t(1))); } catch (const std::logic_error&) { threw = true; }
        assert(threw);

        threw = false;
        try { encoder.Publish(protocol::kRemoveOne, "wrong_key", MakePayload(AppErrorsRecord{})); } catch (const std::logic_error&) { threw = true; }
        assert(threw);

        threw = false;
        try { encoder.Publish(protocol::kRemoveOne, protocol::kKeyRemoveRecord, MakePayload(std::string("id"))); } catch (const std::logic_error&) { threw = true; }
        assert(threw);
        assert(transport.sent.empty());

        encoder.Publish(protocol::kFetchListReply, protocol::kKeyRecordList, MakePayload(AppErrorsRecordList{}));
        assert(transport.sent.size() == 1);
        Envelope env = transport.LastEnvelope();
        assert(env.action == channel.action);
        AppErrorsRecordList list = {AppErrorsRecord{}};
        assert(env.get_record_list(protocol::kKeyRecordList, list));
        assert(list.empty());
        std::cout << "Protocol contract enforced: OK" << std::endl;
    }

    // 7. Request/reply pairing
    {
        assert(protocol::ReplyFor(protocol::kActivationCheck) == protocol::kActivationReply);
        assert(protocol::ReplyFor(protocol::kFetchList) == protocol::kFetchListReply);
        assert(protocol::ReplyFor(protocol::kRemoveOne) == protocol::kRemoveOneReply);
        assert(protocol::ReplyFor(protocol::kClearAll) == protocol::kClearAllReply);
        assert(protocol::ReplyFor(protocol::kClearAllReply).empty());
        std::cout << "Reply pairing: OK" << std::endl;
    }

    std::cout << "All Envelope tests passed!" << std::endl;
    return 0;
}
