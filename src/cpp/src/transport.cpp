#include "crashbus/transport.hpp"
#include <cstring>
#include <chrono>
#include <stdexcept>
#include <algorithm>

#ifdef _WIN32
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#define SOCKLEN_T int
#define closesocket closesocket
#define GET_SOCKET_ERROR() WSAGetLastError()
#else
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <sys/select.h>
#define closesocket close
#define SOCKLEN_T socklen_t
#define GET_SOCKET_ERROR() errno
#endif

namespace crashbus {

// Largest UDP payload
static constexpr size_t kMaxDatagram = 65507;
// Partial frames older than this are discarded
static constexpr auto kReassemblyTimeout = std::chrono::seconds(2);

UdpBroadcastTransport::Subscription::~Subscription() {
    if (sock != INVALID_SOCKET) closesocket(sock);
}

UdpBroadcastTransport::UdpBroadcastTransport(const BusConfig& config, std::shared_ptr<ILogger> logger)
    : config(config), running(false) {
    if (logger) this->logger = logger;
    else this->logger = std::make_shared<ConsoleLogger>();

    segment_size = std::clamp<size_t>(config.segment_size, 16, kMaxDatagram - SegmentHeader::kSize);
    segment_size -= segment_size % 16;

#ifdef _WIN32
    WSADATA wsaData;
    WSAStartup(MAKEWORD(2, 2), &wsaData);
#endif

    send_sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (send_sock == INVALID_SOCKET) {
        this->logger->Log(LogLevel::ERR, "Transport", "Cannot create send socket, error " + std::to_string(GET_SOCKET_ERROR()));
        throw std::runtime_error("Cannot create broadcast send socket");
    }

    int loop = 1;
    setsockopt(send_sock, IPPROTO_IP, IP_MULTICAST_LOOP, (const char*)&loop, sizeof(loop));
    int ttl = (int)config.multicast_hops;
    if (setsockopt(send_sock, IPPROTO_IP, IP_MULTICAST_TTL, (const char*)&ttl, sizeof(ttl)) < 0) {
        this->logger->Log(LogLevel::WARN, "Transport", "Failed to set multicast TTL " + std::to_string(ttl));
    }

    running = true;
    reactor_thread = std::jthread(&UdpBroadcastTransport::Run, this);
}

UdpBroadcastTransport::~UdpBroadcastTransport() {
    running = false;
    if (reactor_thread.joinable()) reactor_thread.join();
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex);
        subscriptions.clear(); // Subscription destructors close the sockets
    }
    if (send_sock != INVALID_SOCKET) closesocket(send_sock);
#ifdef _WIN32
    WSACleanup();
#endif
}

bool UdpBroadcastTransport::ResolveGroup(const ChannelConfig& channel, sockaddr_in& out) const {
    if (channel.group.empty() || channel.port == 0) return false;
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(channel.port);
    return inet_pton(AF_INET, channel.group.c_str(), &out.sin_addr) == 1;
}

bool UdpBroadcastTransport::Send(const ChannelConfig& channel, const std::vector<uint8_t>& frame) {
    sockaddr_in target;
    if (!ResolveGroup(channel, target)) {
        logger->Log(LogLevel::WARN, "Transport", "Cannot send on '" + channel.name + "': invalid group " + channel.group + ":" + std::to_string(channel.port));
        return false;
    }
    if (frame.size() > kMaxFrameSize) {
        logger->Log(LogLevel::WARN, "Transport", "Dropping " + std::to_string(frame.size()) + " byte frame on '" + channel.name + "': exceeds frame limit");
        return false;
    }

    if (channel.iface != "0.0.0.0") {
        in_addr if_addr;
        if (inet_pton(AF_INET, channel.iface.c_str(), &if_addr) == 1) {
            setsockopt(send_sock, IPPROTO_IP, IP_MULTICAST_IF, (const char*)&if_addr, sizeof(if_addr));
        }
    }

    auto segments = segment_frame(frame, next_message_id++, segment_size);
    std::vector<uint8_t> datagram;
    for (auto const& [header, chunk] : segments) {
        datagram = header.serialize();
        datagram.insert(datagram.end(), chunk.begin(), chunk.end());
        int sent = sendto(send_sock, (const char*)datagram.data(), (int)datagram.size(), 0, (struct sockaddr*)&target, sizeof(target));
        if (sent == SOCKET_ERROR) {
            logger->Log(LogLevel::WARN, "Transport", "sendto failed on '" + channel.name + "', error " + std::to_string(GET_SOCKET_ERROR()));
            return false;
        }
    }
    logger->Log(LogLevel::DEBUG, "Transport", "Sent " + std::to_string(frame.size()) + " bytes in " + std::to_string(segments.size()) +
                " datagram(s) to " + channel.group + ":" + std::to_string(channel.port));
    return true;
}

SOCKET UdpBroadcastTransport::OpenChannelSocket(const ChannelConfig& channel) {
    sockaddr_in group_addr;
    if (!ResolveGroup(channel, group_addr)) return INVALID_SOCKET;

    SOCKET s = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (s == INVALID_SOCKET) return INVALID_SOCKET;

    int reuse = 1;
    setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    setsockopt(s, SOL_SOCKET, SO_REUSEPORT, (const char*)&reuse, sizeof(reuse));
#endif
    // Room for a burst of segments; the OS may cap it
    int rcvbuf = 1024 * 1024;
    if (setsockopt(s, SOL_SOCKET, SO_RCVBUF, (const char*)&rcvbuf, sizeof(rcvbuf)) < 0) {
        logger->Log(LogLevel::DEBUG, "Transport", "Cannot raise receive buffer for '" + channel.name + "'");
    }

    sockaddr_in bind_addr = group_addr;
#ifdef _WIN32
    // Windows: multicast receivers bind the wildcard address
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
#endif
    // Linux: binding the group address filters out other groups on the same port
    if (bind(s, (struct sockaddr*)&bind_addr, sizeof(bind_addr)) == SOCKET_ERROR) {
        logger->Log(LogLevel::WARN, "Transport", "Failed to bind channel '" + channel.name + "' on port " + std::to_string(channel.port));
    }

    ip_mreq mreq;
    mreq.imr_multiaddr = group_addr.sin_addr;
    if (inet_pton(AF_INET, channel.iface.c_str(), &mreq.imr_interface) != 1) {
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    }
    if (setsockopt(s, IPPROTO_IP, IP_ADD_MEMBERSHIP, (const char*)&mreq, sizeof(mreq)) < 0) {
        logger->Log(LogLevel::WARN, "Transport", "Failed to join group " + channel.group + " for '" + channel.name + "'");
    }

#ifdef _WIN32
    unsigned long n_mode = 1;
    ioctlsocket(s, FIONBIO, &n_mode);
#else
    fcntl(s, F_SETFL, fcntl(s, F_GETFL, 0) | O_NONBLOCK);
#endif
    return s;
}

bool UdpBroadcastTransport::Subscribe(const ChannelConfig& channel, FrameHandler handler) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex);
        if (subscriptions.count(channel.action)) {
            logger->Log(LogLevel::DEBUG, "Transport", "Already subscribed to '" + channel.action + "'");
            return false;
        }
    }

    SOCKET s = OpenChannelSocket(channel);
    if (s == INVALID_SOCKET) {
        logger->Log(LogLevel::ERR, "Transport", "Cannot open channel '" + channel.name + "' (" + channel.group + ":" + std::to_string(channel.port) + ")");
        return false;
    }

    auto sub = std::make_shared<Subscription>();
    sub->channel = channel;
    sub->sock = s;
    sub->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(subscriptions_mutex);
    // Lost a race with another Subscribe for the same action; sub closes its socket
    if (subscriptions.count(channel.action)) return false;
    subscriptions[channel.action] = sub;
    logger->Log(LogLevel::INFO, "Transport", "Listening for '" + channel.action + "' on " + channel.group + ":" + std::to_string(channel.port));
    return true;
}

bool UdpBroadcastTransport::Unsubscribe(const ChannelConfig& channel) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex);
        auto it = subscriptions.find(channel.action);
        if (it == subscriptions.end()) return false;
        subscriptions.erase(it);
    }
    // Wait out an in-flight dispatch unless we are that dispatch
    if (std::this_thread::get_id() != reactor_thread.get_id()) {
        std::lock_guard<std::mutex> wait(dispatch_mutex);
    }
    logger->Log(LogLevel::INFO, "Transport", "Stopped listening for '" + channel.action + "'");
    return true;
}

void UdpBroadcastTransport::Run() {
    std::vector<char> buf(kMaxDatagram);
    while (running) {
        std::vector<std::shared_ptr<Subscription>> active;
        {
            std::lock_guard<std::mutex> lock(subscriptions_mutex);
            for (auto const& [action, sub] : subscriptions) active.push_back(sub);
        }

        fd_set readfds;
        FD_ZERO(&readfds);
        SOCKET max_fd = 0;
        for (auto const& sub : active) {
            FD_SET(sub->sock, &readfds);
            if ((int)sub->sock > (int)max_fd) max_fd = sub->sock;
        }

        timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 100000;
        if (active.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        int activity = select((int)max_fd + 1, &readfds, NULL, NULL, &timeout);
        if (activity <= 0) continue;

        std::lock_guard<std::mutex> dispatching(dispatch_mutex);
        for (auto const& sub : active) {
            if (!FD_ISSET(sub->sock, &readfds)) continue;
            {
                // Skip channels dropped while we were in select
                std::lock_guard<std::mutex> lock(subscriptions_mutex);
                auto it = subscriptions.find(sub->channel.action);
                if (it == subscriptions.end() || it->second != sub) continue;
            }
            sockaddr_storage src; SOCKLEN_T sl = sizeof(src);
            int bytes = recvfrom(sub->sock, buf.data(), (int)buf.size(), 0, (struct sockaddr*)&src, &sl);
            if (bytes <= 0) continue;
            Receive(*sub, buf.data(), (size_t)bytes, src);
        }

        auto now = std::chrono::steady_clock::now();
        for (auto const& sub : active) {
            size_t dropped = sub->reassembler.expire(now, kReassemblyTimeout);
            if (dropped > 0) {
                logger->Log(LogLevel::WARN, "Transport", "Discarded " + std::to_string(dropped) + " incomplete frame(s) on '" + sub->channel.action + "'");
            }
        }
    }
}

void UdpBroadcastTransport::Receive(Subscription& sub, const char* data, size_t len, const sockaddr_storage& src) {
    const uint8_t* bytes = (const uint8_t*)data;
    SegmentHeader header;
    if (!SegmentHeader::deserialize(bytes, len, header)) {
        logger->Log(LogLevel::DEBUG, "Transport", "Dropping runt datagram (" + std::to_string(len) + " bytes)");
        return;
    }
    std::vector<uint8_t> chunk(bytes + SegmentHeader::kSize, bytes + len);

    // Message ids are only unique per sender
    std::string source = "?";
    if (src.ss_family == AF_INET) {
        const sockaddr_in* sin = (const sockaddr_in*)&src;
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
        source = std::string(ip) + ":" + std::to_string(ntohs(sin->sin_port));
    }

    std::vector<uint8_t> frame;
    if (!sub.reassembler.process_segment(source, header, chunk, frame)) return;
    try {
        sub.handler(frame);
    } catch (const std::exception& e) {
        logger->Log(LogLevel::ERR, "Transport", "Handler for '" + sub.channel.action + "' threw: " + e.what());
    }
}

} // namespace crashbus
