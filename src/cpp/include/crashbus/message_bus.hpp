#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <stop_token>
#include <chrono>
#include <functional>
#include "types.hpp"
#include "envelope.hpp"
#include "callback_slot.hpp"
#include "transport.hpp"
#include "config.hpp"
#include "logger.hpp"

namespace crashbus {

enum class Operation {
    ActivationCheck,
    FetchList,
    RemoveOne,
    ClearAll
};

const char* to_string(Operation op);

/// One slot per operation kind. Only MessageBus and its ReplyDemultiplexer touch these.
struct CallbackSlots {
    CallbackSlot<bool> activation;
    CallbackSlot<AppErrorsRecordList> fetch_list;
    CallbackSlot<> remove_one;
    CallbackSlot<> clear_all;
};

/// Builds envelopes for one channel and hands them to the transport.
class RequestEncoder {
public:
    RequestEncoder(ITransport& transport, ChannelConfig channel, std::shared_ptr<ILogger> logger = nullptr);

    /// Throws std::logic_error if the discriminant is unknown or expects a payload.
    void Publish(const std::string& discriminant);

    /// Throws std::logic_error if the key or payload shape differs from the protocol table.
    void Publish(const std::string& discriminant, const std::string& payload_key, const Payload& payload);

    const ChannelConfig& channel() const { return publish_channel; }

private:
    void Emit(const Envelope& env);

    ITransport& transport;
    ChannelConfig publish_channel;
    std::shared_ptr<ILogger> logger;
};

/// Routes inbound reply envelopes to the matching callback slot.
class ReplyDemultiplexer {
public:
    ReplyDemultiplexer(std::string listen_action, CallbackSlots& slots, std::shared_ptr<ILogger> logger = nullptr);

    /// Never throws. Frames that do not decode, or carry another action, are dropped.
    void OnFrame(const std::vector<uint8_t>& frame);
    void Dispatch(const Envelope& env);

    /// Activation status carried by an activation reply. Missing or mistyped payload is "not activated".
    static bool DecodeActivation(const Envelope& env);
    /// False when the record list payload is missing or malformed.
    static bool DecodeRecordList(const Envelope& env, AppErrorsRecordList& out);

private:
    void HandleActivation(const Envelope& env);
    void HandleFetchList(const Envelope& env);
    void HandleAck(CallbackSlot<>& slot, const std::string& discriminant);

    std::string listen_action;
    CallbackSlots& slots;
    std::shared_ptr<ILogger> logger;
};

/// Typed request/reply bus between the module UI and the host.
///
/// Requests are fire-and-forget; their results arrive later on the transport's
/// dispatch thread through the callback stored for that operation.
class MessageBus {
public:
    using ActivationCallback = std::function<void(bool activated)>;
    using FetchListCallback = std::function<void(AppErrorsRecordList records)>;
    using AckCallback = std::function<void()>;
    using TimeoutHandler = std::function<void(Operation op)>;

    MessageBus(ITransport& transport, const InstanceConfig& config, std::shared_ptr<ILogger> logger = nullptr);
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /// Subscribes the reply receiver. Returns false if already registered or the channel cannot be opened.
    bool Register();
    /// Returns false if not registered.
    bool Unregister();
    bool IsRegistered() const;

    void CheckActivation(ActivationCallback callback);
    void FetchList(FetchListCallback callback);
    void RemoveOne(const AppErrorsRecord& record, AckCallback callback);
    void ClearAll(AckCallback callback);

    /// Called once per expired operation, on the sweeper thread or the ExpirePending caller.
    /// The handler may unregister or destroy the bus; remaining handler calls of the same sweep still run.
    void SetTimeoutHandler(TimeoutHandler handler);

    /// Drops data callbacks whose request_timeout_ms elapsed. Returns how many expired.
    size_t ExpirePending(std::chrono::steady_clock::time_point now);

    bool IsPending(Operation op) const;

private:
    void SweepLoop(std::stop_token stop);
    std::chrono::steady_clock::duration RequestTimeout() const;
    void WarnIfUnregistered(Operation op) const;

    ITransport& transport;
    InstanceConfig config;
    std::shared_ptr<ILogger> logger;

    CallbackSlots slots;
    RequestEncoder encoder;
    std::unique_ptr<ReplyDemultiplexer> demux;

    mutable std::mutex registration_mutex;
    bool registered = false;
    // Set while Unregister waits for the transport; Register is refused meanwhile
    bool unregistering = false;

    std::mutex timeout_handler_mutex;
    TimeoutHandler on_timeout;
    std::jthread sweeper;
};

} // namespace crashbus
