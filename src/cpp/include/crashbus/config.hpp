#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include "logger.hpp"

namespace crashbus {

inline constexpr const char* kHostHandlerChannel = "host_handler";
inline constexpr const char* kModuleHandlerChannel = "module_handler";

struct ChannelConfig {
    std::string name;
    std::string action;          // filter key carried in every envelope
    std::string group;           // multicast group
    uint16_t port = 0;
    std::string iface = "0.0.0.0"; // local interface address used to join the group
};

struct BusConfig {
    uint16_t multicast_hops = 0; // 0 keeps datagrams on this host
    uint32_t request_timeout_ms = 0; // 0 disables the pending-request timeout
    uint32_t segment_size = 15360; // payload bytes per datagram; larger frames are split
};

struct InstanceConfig {
    std::string name;
    ChannelConfig publish;
    ChannelConfig listen;
    BusConfig bus;
    std::map<std::string, ChannelConfig> channels;
};

class ConfigLoader {
public:
    static std::map<std::string, ChannelConfig> DefaultChannels() {
        std::map<std::string, ChannelConfig> channels;
        channels[kHostHandlerChannel] = {kHostHandlerChannel, "crashbus.action.HOST_HANDLER", "239.255.77.1", 30601, "0.0.0.0"};
        channels[kModuleHandlerChannel] = {kModuleHandlerChannel, "crashbus.action.MODULE_HANDLER", "239.255.77.2", 30602, "0.0.0.0"};
        return channels;
    }

    /// Module-side defaults: requests out on host_handler, replies in on module_handler.
    static InstanceConfig Defaults(const std::string& instance_name) {
        InstanceConfig config;
        config.name = instance_name;
        config.channels = DefaultChannels();
        config.publish = config.channels.at(kHostHandlerChannel);
        config.listen = config.channels.at(kModuleHandlerChannel);
        return config;
    }

    static InstanceConfig Load(const std::string& path, const std::string& instance_name, std::shared_ptr<ILogger> logger = nullptr) {
        InstanceConfig config = Defaults(instance_name);
        std::ifstream f(path);
        if (!f.is_open()) {
            if (logger) logger->Log(LogLevel::WARN, "Config", "Cannot open " + path + ", using built-in channels");
            return config;
        }

        std::stringstream buffer;
        buffer << f.rdbuf();
        return Parse(buffer.str(), instance_name, logger);
    }

    static InstanceConfig Parse(const std::string& json, const std::string& instance_name, std::shared_ptr<ILogger> logger = nullptr) {
        InstanceConfig config = Defaults(instance_name);

        // 1. Channels (Global)
        std::string channels_block = ExtractObject(json, "channels");
        if (!channels_block.empty()) ParseChannels(channels_block, config.channels);

        // 2. Bus settings (Global)
        std::string bus_block = ExtractObject(json, "bus");
        if (!bus_block.empty()) {
            int hops = ExtractInt(bus_block, "multicast_hops"); if (hops > 0) config.bus.multicast_hops = (uint16_t)hops;
            int timeout = ExtractInt(bus_block, "request_timeout_ms"); if (timeout > 0) config.bus.request_timeout_ms = (uint32_t)timeout;
            int segment = ExtractInt(bus_block, "segment_size"); if (segment > 0) config.bus.segment_size = (uint32_t)segment;
        }

        config.publish = config.channels.at(kHostHandlerChannel);
        config.listen = config.channels.at(kModuleHandlerChannel);

        // 3. Instance roles
        std::string instances_block = ExtractObject(json, "instances");
        std::string block = instances_block.empty() ? "" : ExtractObject(instances_block, instance_name);
        if (block.empty()) {
            if (logger) logger->Log(LogLevel::WARN, "Config", "No instance '" + instance_name + "', using module-side roles");
            return config;
        }

        std::string publish = ExtractString(block, "publish");
        std::string listen = ExtractString(block, "listen");
        if (!publish.empty()) {
            if (config.channels.count(publish)) config.publish = config.channels.at(publish);
            else if (logger) logger->Log(LogLevel::WARN, "Config", "Unknown publish channel '" + publish + "' for " + instance_name);
        }
        if (!listen.empty()) {
            if (config.channels.count(listen)) config.listen = config.channels.at(listen);
            else if (logger) logger->Log(LogLevel::WARN, "Config", "Unknown listen channel '" + listen + "' for " + instance_name);
        }

        if (logger) {
            logger->Log(LogLevel::INFO, "Config", instance_name + ": publish=" + config.publish.action + " listen=" + config.listen.action);
        }
        return config;
    }

private:
    /// Returns the {...} value of the first occurrence of "key", or an empty string.
    static std::string ExtractObject(const std::string& json, const std::string& key) {
        size_t key_pos = json.find("\"" + key + "\"");
        if (key_pos == std::string::npos) return "";
        size_t colon = json.find(":", key_pos + key.size() + 2);
        if (colon == std::string::npos) return "";
        size_t start = json.find_first_not_of(" \t\n\r", colon + 1);
        if (start == std::string::npos || json[start] != '{') return "";
        size_t end = start + 1; int depth = 1;
        while (depth > 0 && end < json.length()) {
            if (json[end] == '{') depth++;
            else if (json[end] == '}') depth--;
            end++;
        }
        if (depth != 0) return "";
        return json.substr(start, end - start);
    }

    static void ParseChannels(const std::string& json, std::map<std::string, ChannelConfig>& map) {
        // Skip the opening brace of the channels object itself
        size_t pos = 1;
        while ((pos = json.find("\"", pos)) != std::string::npos) {
            size_t key_end = json.find("\"", pos + 1);
            if (key_end == std::string::npos) break;
            std::string key = json.substr(pos + 1, key_end - pos - 1);

            size_t obj_start = json.find("{", key_end);
            if (obj_start == std::string::npos) break;
            size_t obj_end = obj_start + 1; int depth = 1;
            while (depth > 0 && obj_end < json.length()) {
                if (json[obj_end] == '{') depth++;
                else if (json[obj_end] == '}') depth--;
                obj_end++;
            }

            std::string val = json.substr(obj_start, obj_end - obj_start);
            ChannelConfig cfg = map.count(key) ? map.at(key) : ChannelConfig{};
            cfg.name = key;
            std::string action = ExtractString(val, "action"); if (!action.empty()) cfg.action = action;
            std::string group = ExtractString(val, "group"); if (!group.empty()) cfg.group = group;
            std::string iface = ExtractString(val, "interface"); if (!iface.empty()) cfg.iface = iface;
            int port = ExtractInt(val, "port"); if (port > 0 && port <= 0xFFFF) cfg.port = (uint16_t)port;
            map[key] = cfg;
            pos = obj_end;
        }
    }

    static int ExtractInt(const std::string& json, const std::string& key) {
        size_t pos = json.find("\"" + key + "\"");
        if (pos == std::string::npos) return 0;
        size_t colon = json.find(":", pos);
        if (colon == std::string::npos) return 0;
        size_t val_start = json.find_first_not_of(" \t\n\r\"", colon + 1);
        if (val_start == std::string::npos) return 0;
        size_t val_end = json.find_first_of(",} \t\n\r\"", val_start);
        if (val_end == std::string::npos) val_end = json.length();
        std::string num = json.substr(val_start, val_end - val_start);
        try { return std::stoi(num, nullptr, 0); } catch (const std::exception&) { return 0; }
    }

    static std::string ExtractString(const std::string& json, const std::string& key) {
        size_t pos = json.find("\"" + key + "\"");
        if (pos == std::string::npos) return "";
        size_t colon = json.find(":", pos);
        if (colon == std::string::npos) return "";
        size_t quote_start = json.find("\"", colon);
        if (quote_start == std::string::npos) return "";
        size_t quote_end = json.find("\"", quote_start + 1);
        if (quote_end == std::string::npos) return "";
        return json.substr(quote_start + 1, quote_end - quote_start - 1);
    }
};

} // namespace crashbus
