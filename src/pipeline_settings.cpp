#include "pipeline_settings.h"
#include "config.h"

#include <algorithm>
#include <cctype>

namespace {

size_t readCapacity(const Config& config, const char* key, size_t defaultValue) {
    int value = config.getInt("Pools", key, static_cast<int>(defaultValue));
    if (value < 0) {
        Logger::warning("Config") << "[Pools]:" << key << " must not be negative; using " << defaultValue;
        return defaultValue;
    }
    return static_cast<size_t>(value);
}

} // namespace

std::optional<ThreadingMode> threadingModeFromString(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "inline" || lower == "single") {
        return ThreadingMode::INLINE;
    }
    if (lower == "fixed" || lower == "fixed_pool" || lower == "multi") {
        return ThreadingMode::FIXED_POOL;
    }
    if (lower == "adaptive") {
        return ThreadingMode::ADAPTIVE;
    }
    return std::nullopt;
}

PipelineSettings PipelineSettings::fromConfig(const Config& config) {
    PipelineSettings settings;

    // [Scheduler]
    if (config.hasKey("Scheduler", "threading_mode")) {
        std::string modeText = config.getString("Scheduler", "threading_mode");
        std::optional<ThreadingMode> mode = threadingModeFromString(modeText);
        if (mode) {
            settings.scheduler.mode = *mode;
        } else {
            Logger::warning("Config") << "Unknown threading_mode '" << modeText << "'; using "
                                      << threadingModeToString(settings.scheduler.mode);
        }
    }
    settings.scheduler.workers = config.getInt("Scheduler", "workers", settings.scheduler.workers);

    int maxQueued = config.getInt("Scheduler", "max_queued_jobs", static_cast<int>(settings.scheduler.maxQueuedJobs));
    if (maxQueued >= 0) {
        settings.scheduler.maxQueuedJobs = static_cast<size_t>(maxQueued);
    } else {
        Logger::warning("Config") << "[Scheduler]:max_queued_jobs must not be negative";
    }

    int timeoutMs = config.getInt("Scheduler", "wait_timeout_ms", static_cast<int>(settings.scheduler.waitTimeout.count()));
    settings.scheduler.waitTimeout = std::chrono::milliseconds(std::max(1, timeoutMs));

    // [Meshing]
    settings.meshing.greedyExtension = config.getBool("Meshing", "greedy_extension", settings.meshing.greedyExtension);

    // [Pools]
    settings.scratchCapacity = readCapacity(config, "scratch_capacity", settings.scratchCapacity);
    settings.meshCapacity = readCapacity(config, "mesh_capacity", settings.meshCapacity);
    settings.volumeCapacity = readCapacity(config, "volume_capacity", settings.volumeCapacity);

    // [Logging]
    settings.logLevel = logLevelFromString(config.getString("Logging", "level", logLevelToString(settings.logLevel)),
                                           settings.logLevel);
    settings.logColors = config.getBool("Logging", "colors", settings.logColors);

    return settings;
}

void PipelineSettings::writeTo(Config& config) const {
    config.setString("Scheduler", "threading_mode", threadingModeToString(scheduler.mode));
    config.setInt("Scheduler", "workers", scheduler.workers);
    config.setInt("Scheduler", "max_queued_jobs", static_cast<int>(scheduler.maxQueuedJobs));
    config.setInt("Scheduler", "wait_timeout_ms", static_cast<int>(scheduler.waitTimeout.count()));

    config.setBool("Meshing", "greedy_extension", meshing.greedyExtension);

    config.setInt("Pools", "scratch_capacity", static_cast<int>(scratchCapacity));
    config.setInt("Pools", "mesh_capacity", static_cast<int>(meshCapacity));
    config.setInt("Pools", "volume_capacity", static_cast<int>(volumeCapacity));

    config.setString("Logging", "level", logLevelToString(logLevel));
    config.setBool("Logging", "colors", logColors);
}

void PipelineSettings::applyLogging() const {
    Logger::setMinLevel(logLevel);
    Logger::setUseColors(logColors);
}
