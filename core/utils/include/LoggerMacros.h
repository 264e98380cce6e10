/**
 * @file LoggerMacros.h
 * @brief Conditional logging macros for hot paths
 *
 * Probe and packet handling run hundreds of times per scan; these macros skip
 * message construction entirely when the level is disabled.
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("probe " + host + " refused", "TcpProber");
 */

#pragma once

#include "Logger.h"

#include <chrono>
#include <string>

namespace LanScout {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::LanScout::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::LanScout::Logger::instance().warn(msg, component)

// Scoped performance timer (logs elapsed time on destruction)
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::LanScout::ScopedTimer timer__(name, component)

} // namespace LanScout
