#include "simplemcp/logger.hpp"
#include "simplemcp/error.hpp"
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace simplemcp {
namespace logging {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> build(const LogOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    if (opts.file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                *opts.file, opts.max_file_size, opts.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            throw McpError(std::string("Cannot open log file: ") + e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(parse_level(opts.level));
    logger->set_pattern(opts.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw McpError("Unknown log level: " + name);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = build(LogOptions{});
    }
    return g_logger;
}

void configure(const LogOptions& opts) {
    auto logger = build(opts);
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = std::move(logger);
}

void set_level(const std::string& name) {
    get()->set_level(parse_level(name));
}

} // namespace logging
} // namespace simplemcp
