#include "crashbus/message_bus.hpp"
#include "crashbus/protocol.hpp"
#include <stdexcept>

namespace crashbus {

const char* to_string(Operation op) {
    switch (op) {
        case Operation::ActivationCheck: return protocol::kActivationCheck;
        case Operation::FetchList: return protocol::kFetchList;
        case Operation::RemoveOne: return protocol::kRemoveOne;
        case Operation::ClearAll: return protocol::kClearAll;
    }
    return "unknown";
}

// --- RequestEncoder ---

RequestEncoder::RequestEncoder(ITransport& transport, ChannelConfig channel, std::shared_ptr<ILogger> logger)
    : transport(transport), publish_channel(std::move(channel)) {
    if (logger) this->logger = logger;
    else this->logger = std::make_shared<ConsoleLogger>();
}

void RequestEncoder::Publish(const std::string& discriminant) {
    protocol::MessageShape shape;
    if (!protocol::FindShape(discriminant, shape)) {
        throw std::logic_error("Unknown discriminant '" + discriminant + "'");
    }
    if (shape.kind != PayloadKind::None) {
        throw std::logic_error("'" + discriminant + "' requires a " + to_string(shape.kind) + " payload");
    }

    Envelope env;
    env.action = publish_channel.action;
    env.discriminant = discriminant;
    Emit(env);
}

void RequestEncoder::Publish(const std::string& discriminant, const std::string& payload_key, const Payload& payload) {
    protocol::MessageShape shape;
    if (!protocol::FindShape(discriminant, shape)) {
        throw std::logic_error("Unknown discriminant '" + discriminant + "'");
    }
    PayloadKind kind = payload_kind_of(payload);
    if (shape.kind != kind) {
        throw std::logic_error("'" + discriminant + "' carries " + to_string(shape.kind) + ", got " + to_string(kind));
    }
    if (payload_key != shape.payload_key) {
        throw std::logic_error("'" + discriminant + "' payload key must be '" + shape.payload_key + "'");
    }

    Envelope env;
    env.action = publish_channel.action;
    env.discriminant = discriminant;
    env.set_payload(payload_key, payload);
    Emit(env);
}

void RequestEncoder::Emit(const Envelope& env) {
    if (!transport.Send(publish_channel, env.serialize())) {
        logger->Log(LogLevel::WARN, "Encoder", "'" + env.discriminant + "' was not handed to the transport");
        return;
    }
    logger->Log(LogLevel::DEBUG, "Encoder", "Published '" + env.discriminant + "' on " + publish_channel.action);
}

// --- ReplyDemultiplexer ---

ReplyDemultiplexer::ReplyDemultiplexer(std::string listen_action, CallbackSlots& slots, std::shared_ptr<ILogger> logger)
    : listen_action(std::move(listen_action)), slots(slots) {
    if (logger) this->logger = logger;
    else this->logger = std::make_shared<ConsoleLogger>();
}

void ReplyDemultiplexer::OnFrame(const std::vector<uint8_t>& frame) {
    Envelope env;
    if (!Envelope::deserialize(frame, env)) {
        logger->Log(LogLevel::DEBUG, "Demux", "Dropping undecodable frame (" + std::to_string(frame.size()) + " bytes)");
        return;
    }
    if (env.action != listen_action) {
        logger->Log(LogLevel::DEBUG, "Demux", "Ignoring envelope for action '" + env.action + "'");
        return;
    }
    Dispatch(env);
}

void ReplyDemultiplexer::Dispatch(const Envelope& env) {
    if (env.discriminant.find_first_not_of(" \t\r\n") == std::string::npos) return;

    if (env.discriminant == protocol::kActivationReply) {
        HandleActivation(env);
    } else if (env.discriminant == protocol::kFetchListReply) {
        HandleFetchList(env);
    } else if (env.discriminant == protocol::kRemoveOneReply) {
        HandleAck(slots.remove_one, env.discriminant);
    } else if (env.discriminant == protocol::kClearAllReply) {
        HandleAck(slots.clear_all, env.discriminant);
    }
    // Anything else belongs to a newer peer
}

bool ReplyDemultiplexer::DecodeActivation(const Envelope& env) {
    std::string token;
    if (!env.get_string(protocol::kKeyVersionVerify, token)) return false;
    return token == protocol::kModuleVersionVerify;
}

bool ReplyDemultiplexer::DecodeRecordList(const Envelope& env, AppErrorsRecordList& out) {
    return env.get_record_list(protocol::kKeyRecordList, out);
}

void ReplyDemultiplexer::HandleActivation(const Envelope& env) {
    CallbackSlot<bool>::Callback callback;
    if (!slots.activation.Peek(callback)) return;
    bool activated = DecodeActivation(env);
    try {
        callback(activated);
    } catch (const std::exception& e) {
        logger->Log(LogLevel::ERR, "Demux", std::string("Activation callback threw: ") + e.what());
    }
}

void ReplyDemultiplexer::HandleFetchList(const Envelope& env) {
    CallbackSlot<AppErrorsRecordList>::Callback callback;
    if (!slots.fetch_list.Take(callback)) return;
    AppErrorsRecordList records;
    if (!DecodeRecordList(env, records)) {
        logger->Log(LogLevel::WARN, "Demux", "Malformed record list, delivering an empty list");
        records.clear();
    }
    try {
        callback(std::move(records));
    } catch (const std::exception& e) {
        logger->Log(LogLevel::ERR, "Demux", std::string("Fetch callback threw: ") + e.what());
    }
}

void ReplyDemultiplexer::HandleAck(CallbackSlot<>& slot, const std::string& discriminant) {
    CallbackSlot<>::Callback callback;
    if (!slot.Take(callback)) {
        logger->Log(LogLevel::DEBUG, "Demux", "No pending callback for '" + discriminant + "'");
        return;
    }
    try {
        callback();
    } catch (const std::exception& e) {
        logger->Log(LogLevel::ERR, "Demux", "Callback for '" + discriminant + "' threw: " + e.what());
    }
}

// --- MessageBus ---

MessageBus::MessageBus(ITransport& transport, const InstanceConfig& config, std::shared_ptr<ILogger> logger)
    : transport(transport), config(config),
      logger(logger ? logger : std::make_shared<ConsoleLogger>()),
      encoder(transport, config.publish, this->logger) {}

MessageBus::~MessageBus() {
    Unregister();
}

bool MessageBus::Register() {
    std::lock_guard<std::mutex> lock(registration_mutex);
    if (unregistering) {
        logger->Log(LogLevel::DEBUG, "Bus", "Register ignored: unregister in progress");
        return false;
    }
    if (registered) {
        logger->Log(LogLevel::DEBUG, "Bus", "Register ignored: already registered");
        return false;
    }
    if (!demux) demux = std::make_unique<ReplyDemultiplexer>(config.listen.action, slots, logger);

    ReplyDemultiplexer* receiver = demux.get();
    if (!transport.Subscribe(config.listen, [receiver](const std::vector<uint8_t>& frame) { receiver->OnFrame(frame); })) {
        logger->Log(LogLevel::WARN, "Bus", "Cannot register receiver on '" + config.listen.action + "'");
        return false;
    }
    registered = true;

    if (config.bus.request_timeout_ms > 0) {
        sweeper = std::jthread([this](std::stop_token stop) { SweepLoop(stop); });
    }
    logger->Log(LogLevel::INFO, "Bus", "Registered receiver for '" + config.listen.action + "'");
    return true;
}

bool MessageBus::Unregister() {
    {
        std::lock_guard<std::mutex> lock(registration_mutex);
        if (!registered || unregistering) return false;
        unregistering = true;
    }
    // Not under registration_mutex: Unsubscribe waits for a running callback, which may itself call Register
    transport.Unsubscribe(config.listen);

    if (sweeper.joinable()) {
        sweeper.request_stop();
        if (sweeper.get_id() != std::this_thread::get_id()) sweeper.join();
        else sweeper.detach();
    }
    {
        std::lock_guard<std::mutex> lock(registration_mutex);
        registered = false;
        unregistering = false;
    }
    logger->Log(LogLevel::INFO, "Bus", "Unregistered receiver for '" + config.listen.action + "'");
    return true;
}

bool MessageBus::IsRegistered() const {
    std::lock_guard<std::mutex> lock(registration_mutex);
    return registered && !unregistering;
}

void MessageBus::WarnIfUnregistered(Operation op) const {
    if (!IsRegistered()) {
        logger->Log(LogLevel::WARN, "Bus", std::string("'") + to_string(op) + "' issued while unregistered, its reply will be missed");
    }
}

std::chrono::steady_clock::duration MessageBus::RequestTimeout() const {
    return std::chrono::milliseconds(config.bus.request_timeout_ms);
}

void MessageBus::CheckActivation(ActivationCallback callback) {
    WarnIfUnregistered(Operation::ActivationCheck);
    // Status slot: no deadline, the host may push updates at any time
    slots.activation.Arm(std::move(callback));
    encoder.Publish(protocol::kActivationCheck);
}

void MessageBus::FetchList(FetchListCallback callback) {
    WarnIfUnregistered(Operation::FetchList);
    if (slots.fetch_list.Arm(std::move(callback), RequestTimeout())) {
        logger->Log(LogLevel::DEBUG, "Bus", "Replaced pending fetch-list callback");
    }
    encoder.Publish(protocol::kFetchList);
}

void MessageBus::RemoveOne(const AppErrorsRecord& record, AckCallback callback) {
    WarnIfUnregistered(Operation::RemoveOne);
    if (slots.remove_one.Arm(std::move(callback), RequestTimeout())) {
        logger->Log(LogLevel::DEBUG, "Bus", "Replaced pending remove-one callback");
    }
    encoder.Publish(protocol::kRemoveOne, protocol::kKeyRemoveRecord, MakePayload(record));
}

void MessageBus::ClearAll(AckCallback callback) {
    WarnIfUnregistered(Operation::ClearAll);
    if (slots.clear_all.Arm(std::move(callback), RequestTimeout())) {
        logger->Log(LogLevel::DEBUG, "Bus", "Replaced pending clear-all callback");
    }
    encoder.Publish(protocol::kClearAll);
}

void MessageBus::SetTimeoutHandler(TimeoutHandler handler) {
    std::lock_guard<std::mutex> lock(timeout_handler_mutex);
    on_timeout = std::move(handler);
}

size_t MessageBus::ExpirePending(std::chrono::steady_clock::time_point now) {
    std::vector<Operation> expired;
    if (slots.fetch_list.ExpireIfDue(now)) expired.push_back(Operation::FetchList);
    if (slots.remove_one.ExpireIfDue(now)) expired.push_back(Operation::RemoveOne);
    if (slots.clear_all.ExpireIfDue(now)) expired.push_back(Operation::ClearAll);
    if (expired.empty()) return 0;

    TimeoutHandler handler;
    {
        std::lock_guard<std::mutex> lock(timeout_handler_mutex);
        handler = on_timeout;
    }
    for (Operation op : expired) {
        logger->Log(LogLevel::WARN, "Bus", std::string("No reply to '") + to_string(op) + "' within " + std::to_string(config.bus.request_timeout_ms) + "ms");
    }
    size_t count = expired.size();
    if (!handler) return count;

    // The handler may destroy this bus: from here on only locals are touched
    std::shared_ptr<ILogger> log = logger;
    for (Operation op : expired) {
        try {
            handler(op);
        } catch (const std::exception& e) {
            log->Log(LogLevel::ERR, "Bus", std::string("Timeout handler threw: ") + e.what());
        }
    }
    return count;
}

bool MessageBus::IsPending(Operation op) const {
    switch (op) {
        case Operation::ActivationCheck: return slots.activation.pending();
        case Operation::FetchList: return slots.fetch_list.pending();
        case Operation::RemoveOne: return slots.remove_one.pending();
        case Operation::ClearAll: return slots.clear_all.pending();
    }
    return false;
}

void MessageBus::SweepLoop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ExpirePending(std::chrono::steady_clock::now());
    }
}

} // namespace crashbus
