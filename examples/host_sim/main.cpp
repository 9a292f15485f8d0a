/**
 * Host Simulator
 *
 * Stands in for the privileged host side: keeps an in-memory list of captured
 * crashes and answers module requests on the reply channel.
 * Pattern: Pure Responder - every request gets its paired reply, no callbacks.
 *
 * SPDX-License-Identifier: MIT
 */

#include <iostream>
#include <vector>
#include <string>
#include <thread>
#include <chrono>
#include <mutex>
#include <memory>
#include <algorithm>

#include <crashbus/transport.hpp>
#include <crashbus/envelope.hpp>
#include <crashbus/message_bus.hpp>
#include <crashbus/protocol.hpp>

using namespace crashbus;

class RecordStore {
public:
    void Add(AppErrorsRecord rec) {
        std::lock_guard<std::mutex> lock(mtx);
        records.insert(records.begin(), std::move(rec)); // newest first
    }

    AppErrorsRecordList Snapshot() {
        std::lock_guard<std::mutex> lock(mtx);
        return records;
    }

    size_t Remove(const AppErrorsRecord& target) {
        std::lock_guard<std::mutex> lock(mtx);
        auto before = records.size();
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const AppErrorsRecord& r) { return r.same_identity(target); }),
                      records.end());
        return before - records.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mtx);
        records.clear();
    }

private:
    std::mutex mtx;
    AppErrorsRecordList records;
};

static AppErrorsRecord SampleCrash(const std::string& pkg, bool native, int64_t ts) {
    AppErrorsRecord r;
    r.pid = 1000 + (int32_t)(ts % 1000);
    r.package_name = pkg;
    r.is_native_crash = native;
    r.exception_class_name = native ? "SIGSEGV" : "java.lang.IllegalStateException";
    r.exception_message = native ? "Segmentation fault" : "Fragment not attached to a context";
    r.throw_file_name = native ? "libgame.so" : "SettingsFragment.kt";
    r.throw_class_name = native ? "" : pkg + ".SettingsFragment";
    r.throw_method_name = native ? "render_frame" : "onResume";
    r.throw_line_number = native ? -1 : 88;
    r.stack_trace = r.exception_class_name + ": " + r.exception_message;
    r.timestamp = ts;
    return r;
}

class HostResponder {
public:
    HostResponder(ITransport& transport, const InstanceConfig& config, RecordStore& store, std::shared_ptr<ILogger> logger)
        : transport(transport), config(config), store(store), logger(logger), replies(transport, config.publish, logger) {}

    bool Start() {
        return transport.Subscribe(config.listen, [this](const std::vector<uint8_t>& frame) { OnFrame(frame); });
    }

    void Stop() { transport.Unsubscribe(config.listen); }

private:
    void OnFrame(const std::vector<uint8_t>& frame) {
        Envelope env;
        if (!Envelope::deserialize(frame, env) || env.action != config.listen.action) return;
        logger->Log(LogLevel::INFO, "Host", "Request '" + env.discriminant + "'");

        if (env.discriminant == protocol::kActivationCheck) {
            replies.Publish(protocol::kActivationReply, protocol::kKeyVersionVerify, MakePayload(std::string(protocol::kModuleVersionVerify)));
        } else if (env.discriminant == protocol::kFetchList) {
            replies.Publish(protocol::kFetchListReply, protocol::kKeyRecordList, MakePayload(store.Snapshot()));
        } else if (env.discriminant == protocol::kRemoveOne) {
            AppErrorsRecord target;
            if (env.get_record(protocol::kKeyRemoveRecord, target)) {
                size_t n = store.Remove(target);
                logger->Log(LogLevel::INFO, "Host", "Removed " + std::to_string(n) + " record(s) of " + target.package_name);
            }
            replies.Publish(protocol::kRemoveOneReply);
        } else if (env.discriminant == protocol::kClearAll) {
            store.Clear();
            replies.Publish(protocol::kClearAllReply);
        }
    }

    ITransport& transport;
    InstanceConfig config;
    RecordStore& store;
    std::shared_ptr<ILogger> logger;
    RequestEncoder replies;
};

int main(int argc, char** argv) {
    auto logger = std::make_shared<ConsoleLogger>(LogLevel::INFO);
    std::string config_path = argc > 1 ? argv[1] : "config/crashbus.json";
    InstanceConfig config = ConfigLoader::Load(config_path, "host_sim", logger);

    RecordStore store;
    int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    store.Add(SampleCrash("com.example.notes", false, now - 60000));
    store.Add(SampleCrash("com.example.game", true, now - 30000));
    store.Add(SampleCrash("com.example.notes", false, now - 5000));

    UdpBroadcastTransport transport(config.bus, logger);
    HostResponder responder(transport, config, store, logger);
    if (!responder.Start()) {
        logger->Log(LogLevel::ERR, "Main", "Cannot listen on '" + config.listen.action + "'");
        return 1;
    }

    logger->Log(LogLevel::INFO, "Main", "Host simulator ready with 3 records.");
    while (true) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    return 0;
}
