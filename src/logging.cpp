#include "davbridge/logging.hpp"
#include "davbridge/spd_log_extensions.hpp"

#include <algorithm>
#include <mutex>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

static std::mutex loggingMtx;
static std::vector<spdlog::sink_ptr> configuredSinks;
static spdlog::level::level_enum configuredLevel = spdlog::level::info;

static const char * LOGGER_NAMES[] = {"logger", "sync", "caldav", "http", "kodbox"};

spdlog::level::level_enum Logging::levelFromString(const std::string & level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    auto result = spdlog::level::from_str(lower);
    if (result == spdlog::level::off && lower != "off") {
        return spdlog::level::info;
    }
    return result;
}

void Logging::configure(const LoggingSettings & settings) {
    std::lock_guard<std::mutex> lock(loggingMtx);

    std::vector<spdlog::sink_ptr> sinks;

    if (settings.filePath != "") {
        // Running as a service: log everything to a rotating log file with
        // the full format.
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(settings.filePath, settings.maxBytes, settings.backupCount);
        fileSink->set_formatter(SPDFormatterWithThreadNames("[%Y-%m-%d %H:%M:%S.%e] [%n] [%*] %l: %v"));
        sinks.push_back(fileSink);
    } else {
        // Attached to a console: abbreviated format on stdout.
        auto consoleSink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
        consoleSink->set_formatter(SPDFormatterWithThreadNames("%H:%M:%S [%n/%*] %^%l%$: %v"));
        sinks.push_back(consoleSink);
    }

    // Always log critical errors to stderr as well as the log file / stdout.
    auto stderrSink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderrSink->set_level(spdlog::level::critical);
    stderrSink->set_formatter(SPDFormatterWithThreadNames("%l: %v"));
    sinks.push_back(stderrSink);

    configuredSinks = sinks;
    configuredLevel = levelFromString(settings.level);

    spdlog::drop_all();
    for (auto name : LOGGER_NAMES) {
        auto logger = std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
        logger->set_level(configuredLevel);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
    spdlog::flush_every(std::chrono::seconds(30));
}

std::shared_ptr<spdlog::logger> Logging::get(const std::string & name) {
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(loggingMtx);
    logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    auto sinks = configuredSinks;
    auto level = configuredLevel;
    if (sinks.empty()) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
        consoleSink->set_formatter(SPDFormatterWithThreadNames("[%n/%*] %l: %v"));
        sinks.push_back(consoleSink);
        level = spdlog::level::warn;
    }
    logger = std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
    logger->set_level(level);
    spdlog::register_logger(logger);
    return logger;
}

void Logging::shutdown() {
    std::lock_guard<std::mutex> lock(loggingMtx);
    spdlog::shutdown();
    configuredSinks.clear();
}
