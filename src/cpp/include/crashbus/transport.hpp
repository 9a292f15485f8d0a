#pragma once
#include <string>
#include <vector>
#include <map>
#include <thread>
#include <atomic>
#include <mutex>
#include <memory>
#include <functional>
#include "config.hpp"
#include "logger.hpp"
#include "segment.hpp"

#ifdef _WIN32
#include <winsock2.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#define SOCKET int
#define INVALID_SOCKET -1
#define SOCKET_ERROR -1
#endif

namespace crashbus {

/// Device-local, unordered, at-most-once broadcast primitive.
class ITransport {
public:
    using FrameHandler = std::function<void(const std::vector<uint8_t>& frame)>;

    virtual ~ITransport() = default;

    /// Fire-and-forget. Returns false only if the frame could not be handed to the OS.
    virtual bool Send(const ChannelConfig& channel, const std::vector<uint8_t>& frame) = 0;

    /// Frames arriving on the channel are delivered to handler on a single dispatch thread.
    virtual bool Subscribe(const ChannelConfig& channel, FrameHandler handler) = 0;

    /// After this returns (from any thread but the dispatch thread) the handler is no longer running.
    virtual bool Unsubscribe(const ChannelConfig& channel) = 0;
};

/// ITransport over UDP multicast with loopback enabled.
/// Frames above BusConfig::segment_size travel as several datagrams and are reassembled before dispatch.
class UdpBroadcastTransport : public ITransport {
public:
    explicit UdpBroadcastTransport(const BusConfig& config, std::shared_ptr<ILogger> logger = nullptr);
    ~UdpBroadcastTransport() override;

    UdpBroadcastTransport(const UdpBroadcastTransport&) = delete;
    UdpBroadcastTransport& operator=(const UdpBroadcastTransport&) = delete;

    bool Send(const ChannelConfig& channel, const std::vector<uint8_t>& frame) override;
    bool Subscribe(const ChannelConfig& channel, FrameHandler handler) override;
    bool Unsubscribe(const ChannelConfig& channel) override;

private:
    struct Subscription {
        ChannelConfig channel;
        SOCKET sock = INVALID_SOCKET;
        FrameHandler handler;
        SegmentReassembler reassembler; // reactor thread only
        ~Subscription();
    };

    void Run();
    SOCKET OpenChannelSocket(const ChannelConfig& channel);
    bool ResolveGroup(const ChannelConfig& channel, sockaddr_in& out) const;
    void Receive(Subscription& sub, const char* data, size_t len, const sockaddr_storage& src);

    SOCKET send_sock = INVALID_SOCKET;
    BusConfig config;
    size_t segment_size;
    std::atomic<uint32_t> next_message_id{1};
    std::shared_ptr<ILogger> logger;

    // Keyed by channel action
    std::map<std::string, std::shared_ptr<Subscription>> subscriptions;
    std::mutex subscriptions_mutex;
    // Held by the reactor while handlers run
    std::mutex dispatch_mutex;

    std::atomic<bool> running;
    std::jthread reactor_thread;
};

} // namespace crashbus
