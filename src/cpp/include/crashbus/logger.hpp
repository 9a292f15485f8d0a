#pragma once
#include <string>
#include <iostream>
#include <memory>
#include <mutex>
#include <chrono>
#include <iomanip>

namespace crashbus {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERR
};

class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void Log(LogLevel level, const std::string& component, const std::string& msg) = 0;
};

class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::DEBUG) : min_level(min_level) {}

    void Log(LogLevel level, const std::string& component, const std::string& msg) override {
        if (level < min_level) return;
        std::string levelStr;
        switch (level) {
            case LogLevel::DEBUG: levelStr = "DEBUG"; break;
            case LogLevel::INFO:  levelStr = "INFO "; break;
            case LogLevel::WARN:  levelStr = "WARN "; break;
            case LogLevel::ERR:   levelStr = "ERROR"; break;
        }
        // Timestamp
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif
        // Reactor and caller threads both log
        std::lock_guard<std::mutex> lock(mtx);
        std::cout << "[" << std::put_time(&tm_buf, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count()
                  << "] [" << levelStr << "] [" << component << "] " << msg << std::endl;
    }

private:
    LogLevel min_level;
    std::mutex mtx;
};

} // namespace crashbus
