#include <iostream>
#include <fstream>
#include <string>
#include <cassert>
#include <cstdio>
#include "crashbus/config.hpp"

using namespace crashbus;

int main() {
    std::cout << "Running C++ Config Tests..." << std::endl;
    auto logger = std::make_shared<ConsoleLogger>(LogLevel::ERR);

    // 1. Missing file keeps the well-known channels
    {
        InstanceConfig cfg = ConfigLoader::Load("does/not/exist.json", "module_app", logger);
        assert(cfg.name == "module_app");
        assert(cfg.publish.name == kHostHandlerChannel);
        assert(cfg.listen.name == kModuleHandlerChannel);
        assert(cfg.publish.action == "crashbus.action.HOST_HANDLER");
        assert(cfg.listen.action == "crashbus.action.MODULE_HANDLER");
        assert(cfg.publish.port == 30601);
        assert(cfg.listen.group == "239.255.77.2");
        assert(cfg.bus.multicast_hops == 0);
        assert(cfg.bus.request_timeout_ms == 0);
        assert(cfg.bus.segment_size == 15360);
        std::cout << "Defaults: OK" << std::endl;
    }

    const std::string json = R"({
        "channels": {
            "host_handler":   { "action": "test.HOST", "group": "239.1.2.3", "port": 40001, "interface": "127.0.0.1" },
            "module_handler": { "action": "test.MODULE", "port": 40002 }
        },
        "bus": { "multicast_hops": 1, "request_timeout_ms": 1500, "segment_size": 1400 },
        "instances": {
            "module_app": { "publish": "host_handler", "listen": "module_handler" },
            "host_sim":   { "publish": "module_handler", "listen": "host_handler" },
            "confused":   { "publish": "nowhere", "listen": "host_handler" }
        }
    })";

    // 2. Overrides and roles
    {
        const std::string path = "crashbus_config_test.json";
        {
            std::ofstream f(path);
            f << json;
        }
        InstanceConfig module = ConfigLoader::Load(path, "module_app", logger);
        assert(module.publish.action == "test.HOST");
        assert(module.publish.group == "239.1.2.3");
        assert(module.publish.port == 40001);
        assert(module.publish.iface == "127.0.0.1");
        assert(module.listen.action == "test.MODULE");
        assert(module.listen.port == 40002);
        // Unset keys keep their defaults
        assert(module.listen.group == "239.255.77.2");
        assert(module.listen.iface == "0.0.0.0");
        assert(module.bus.multicast_hops == 1);
        assert(module.bus.request_timeout_ms == 1500);
        assert(module.bus.segment_size == 1400);

        InstanceConfig host = ConfigLoader::Load(path, "host_sim", logger);
        assert(host.publish.action == "test.MODULE");
        assert(host.listen.action == "test.HOST");
        std::remove(path.c_str());
        std::cout << "Overrides and roles: OK" << std::endl;
    }

    // 3. Unknown channel names and instances fall back to module-side roles
    {
        InstanceConfig confused = ConfigLoader::Parse(json, "confused", logger);
        assert(confused.publish.action == "test.HOST");
        assert(confused.listen.action == "test.HOST");

        InstanceConfig stranger = ConfigLoader::Parse(json, "stranger", logger);
        assert(stranger.publish.action == "test.HOST");
        assert(stranger.listen.action == "test.MODULE");
        assert(stranger.bus.request_timeout_ms == 1500);
        std::cout << "Fallbacks: OK" << std::endl;
    }

    // 4. Extra channels are kept for lookup
    {
        InstanceConfig cfg = ConfigLoader::Parse(R"({ "channels": { "diagnostics": { "action": "test.DIAG", "group": "239.9.9.9", "port": 40009 } } })", "module_app", logger);
        assert(cfg.channels.size() == 3);
        assert(cfg.channels.at("diagnostics").port == 40009);
        assert(cfg.publish.action == "crashbus.action.HOST_HANDLER");
        std::cout << "Extra channels: OK" << std::endl;
    }

    std::cout << "All Config tests passed!" << std::endl;
    return 0;
}
