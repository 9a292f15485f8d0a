#include <iostream>
#include <vector>
#include <string>
#include <cassert>
#include <chrono>
#include <thread>
#include <mutex>
#include <atomic>
#include "crashbus/transport.hpp"
#include "crashbus/message_bus.hpp"
#include "crashbus/protocol.hpp"

using namespace crashbus;

// CTest reports this exit code as skipped
static constexpr int kSkip = 77;

template <typename Pred>
static bool WaitUntil(Pred pred, int timeout_ms = 3000) {
    for (int waited = 0; waited < timeout_ms; waited += 10) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Default channel on the loopback interface, on a port running examples do not use
static ChannelConfig OnLoopback(ChannelConfig channel, uint16_t port) {
    channel.iface = "127.0.0.1";
    channel.port = port;
    return channel;
}

int main() {
    std::cout << "Running C++ Transport Tests..." << std::endl;

    auto logger = std::make_shared<ConsoleLogger>(LogLevel::WARN);
    auto defaults = ConfigLoader::DefaultChannels();
    ChannelConfig host = OnLoopback(defaults[kHostHandlerChannel], 31601);
    ChannelConfig module = OnLoopback(defaults[kModuleHandlerChannel], 31602);
    ChannelConfig slow = OnLoopback(defaults[kModuleHandlerChannel], 31603);
    slow.name = "slow";
    slow.action = "crashbus.test.SLOW";
    slow.group = "239.255.77.3";

    UdpBroadcastTransport transport(BusConfig{}, logger);

    std::mutex mtx;
    std::vector<std::vector<uint8_t>> received;
    auto received_count = [&] {
        std::lock_guard<std::mutex> lock(mtx);
        return received.size();
    };

    // 1. A frame sent on a channel reaches its subscriber
    {
        assert(transport.Subscribe(module, [&](const std::vector<uint8_t>& frame) {
            std::lock_guard<std::mutex> lock(mtx);
            received.push_back(frame);
        }));
        std::vector<uint8_t> hello = {'h', 'e', 'l', 'l', 'o'};
        if (!transport.Send(module, hello)) {
            std::cout << "No multicast route on 127.0.0.1, skipping" << std::endl;
            return kSkip;
        }
        assert(WaitUntil([&] { return received_count() == 1; }));
        {
            std::lock_guard<std::mutex> lock(mtx);
            assert(received[0] == hello);
        }
        std::cout << "Loopback delivery: OK" << std::endl;
    }

    // 2. A frame larger than one datagram arrives whole, in one call
    {
        std::vector<uint8_t> big(100000);
        for (size_t i = 0; i < big.size(); i++) big[i] = (uint8_t)(i % 251);
        assert(transport.Send(module, big));
        assert(WaitUntil([&] { return received_count() == 2; }));
        {
            std::lock_guard<std::mutex> lock(mtx);
            assert(received[1] == big);
        }
        std::cout << "Segmented frame reassembled: OK" << std::endl;
    }

    // 3. Bad or duplicate subscriptions are refused
    {
        assert(!transport.Subscribe(module, [](const std::vector<uint8_t>&) {}));

        ChannelConfig bad = module;
        bad.action = "crashbus.test.BAD";
        bad.group = "not-a-group";
        assert(!transport.Subscribe(bad, [](const std::vector<uint8_t>&) {}));
        assert(!transport.Send(bad, {1, 2, 3}));

        ChannelConfig no_port = module;
        no_port.action = "crashbus.test.NOPORT";
        no_port.port = 0;
        assert(!transport.Subscribe(no_port, [](const std::vector<uint8_t>&) {}));
        std::cout << "Invalid subscriptions refused: OK" << std::endl;
    }

    // 4. Unsubscribe returns only after a running handler finished
    {
        std::atomic<int> calls(0);
        std::atomic<bool> started(false), finished(false);
        assert(transport.Subscribe(slow, [&](const std::vector<uint8_t>&) {
            calls++;
            started = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            finished = true;
        }));
        assert(transport.Send(slow, {0x01}));
        assert(WaitUntil([&] { return started.load(); }));
        assert(transport.Unsubscribe(slow));
        assert(finished);

        assert(transport.Send(slow, {0x02}));
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        assert(calls == 1);
        std::cout << "Unsubscribe waits for handler: OK" << std::endl;
    }

    // 5. Nothing is delivered after Unsubscribe
    {
        assert(transport.Unsubscribe(module));
        assert(!transport.Unsubscribe(module));
        assert(transport.Send(module, {'l', 'a', 't', 'e'}));
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        assert(received_count() == 2);
        std::cout << "No delivery after Unsubscribe: OK" << std::endl;
    }

    // 6. A record list above the datagram limit reaches the bus
    {
        InstanceConfig cfg = ConfigLoader::Defaults("module_app");
        cfg.publish = host;
        cfg.listen = module;
        MessageBus bus(transport, cfg, logger);
        assert(bus.Register());

        AppErrorsRecordList list;
        for (int i = 0; i < 30; i++) {
            AppErrorsRecord r;
            r.pid = 1000 + i;
            r.package_name = "com.example.app" + std::to_string(i);
            r.exception_class_name = "java.lang.IllegalStateException";
            r.stack_trace = std::string(3000, (char)('a' + i % 26));
            r.timestamp = 1700000000000LL + i;
            list.push_back(r);
        }

        std::mutex got_mtx;
        AppErrorsRecordList got;
        std::atomic<int> calls(0);
        bus.FetchList([&](AppErrorsRecordList records) {
            std::lock_guard<std::mutex> lock(got_mtx);
            got = std::move(records);
            calls++;
        });

        RequestEncoder responder(transport, module, logger);
        responder.Publish(protocol::kFetchListReply, protocol::kKeyRecordList, MakePayload(list));
        assert(WaitUntil([&] { return calls.load() == 1; }));
        {
            std::lock_guard<std::mutex> lock(got_mtx);
            assert(got == list);
        }
        assert(!bus.IsPending(Operation::FetchList));
        assert(bus.Unregister());
        std::cout << "Large fetch-list end to end: OK" << std::endl;
    }

    std::cout << "All Transport tests passed!" << std::endl;
    return 0;
}
