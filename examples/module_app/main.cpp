/**
 * Module App
 *
 * The consumer side of the bus: checks activation, lists captured crashes,
 * removes the newest one, then clears the rest. Run host_sim first.
 *
 * SPDX-License-Identifier: MIT
 */

#include <iostream>
#include <string>
#include <chrono>
#include <memory>
#include <mutex>
#include <condition_variable>

#include <crashbus/message_bus.hpp>
#include <crashbus/transport.hpp>

using namespace crashbus;

// Owned jointly by main and the callback: a reply may land after main gave up waiting
struct Outcome {
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    bool activated = false;
    AppErrorsRecordList records;

    template <typename Fill>
    void Complete(Fill fill) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            fill(*this);
            done = true;
        }
        cv.notify_all();
    }

    bool WaitFor(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return done; });
    }
};

int main(int argc, char** argv) {
    auto logger = std::make_shared<ConsoleLogger>(LogLevel::INFO);
    std::string config_path = argc > 1 ? argv[1] : "config/crashbus.json";
    InstanceConfig config = ConfigLoader::Load(config_path, "module_app", logger);
    int wait_ms = config.bus.request_timeout_ms > 0 ? (int)config.bus.request_timeout_ms : 3000;

    UdpBroadcastTransport transport(config.bus, logger);
    MessageBus bus(transport, config, logger);
    bus.SetTimeoutHandler([logger](Operation op) {
        logger->Log(LogLevel::WARN, "App", std::string("Host did not answer '") + to_string(op) + "'");
    });
    if (!bus.Register()) {
        logger->Log(LogLevel::ERR, "App", "Cannot register receiver");
        return 1;
    }

    auto activation = std::make_shared<Outcome>();
    bus.CheckActivation([activation](bool activated) {
        activation->Complete([activated](Outcome& o) { o.activated = activated; });
    });
    if (!activation->WaitFor(wait_ms)) {
        logger->Log(LogLevel::WARN, "App", "No activation reply; is the host running?");
        return 2;
    }
    {
        std::lock_guard<std::mutex> lock(activation->mtx);
        logger->Log(LogLevel::INFO, "App", activation->activated ? "Module is activated" : "Module is NOT activated (version mismatch)");
    }

    auto fetch = std::make_shared<Outcome>();
    bus.FetchList([fetch](AppErrorsRecordList list) {
        fetch->Complete([&list](Outcome& o) { o.records = std::move(list); });
    });
    AppErrorsRecordList records;
    if (fetch->WaitFor(wait_ms)) {
        std::lock_guard<std::mutex> lock(fetch->mtx);
        records = fetch->records;
    } else {
        logger->Log(LogLevel::WARN, "App", "Fetch not answered");
    }
    logger->Log(LogLevel::INFO, "App", "Host reports " + std::to_string(records.size()) + " crash record(s)");
    for (const auto& r : records) {
        logger->Log(LogLevel::INFO, "App", "  " + r.package_name + (r.is_native_crash ? " [native] " : " ") + r.exception_class_name + " @ " + std::to_string(r.timestamp));
    }

    if (!records.empty()) {
        auto removed = std::make_shared<Outcome>();
        bus.RemoveOne(records.front(), [removed] { removed->Complete([](Outcome&) {}); });
        logger->Log(LogLevel::INFO, "App", removed->WaitFor(wait_ms) ? "Newest record removed" : "Remove not acknowledged");
    }

    auto cleared = std::make_shared<Outcome>();
    bus.ClearAll([cleared] { cleared->Complete([](Outcome&) {}); });
    logger->Log(LogLevel::INFO, "App", cleared->WaitFor(wait_ms) ? "All records cleared" : "Clear not acknowledged");

    bus.Unregister();
    return 0;
}
