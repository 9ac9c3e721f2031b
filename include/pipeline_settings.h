/**
 * @file pipeline_settings.h
 * @brief Typed view of the configuration keys used by the meshing core
 *
 * Example config.ini:
 * @code
 *   [Scheduler]
 *   threading_mode = adaptive   # inline | fixed | adaptive
 *   workers = 4
 *   max_queued_jobs = 256       # 0 = unbounded
 *   wait_timeout_ms = 10
 *
 *   [Meshing]
 *   greedy_extension = 1
 *
 *   [Pools]
 *   scratch_capacity = 16
 *   mesh_capacity = 64
 *   volume_capacity = 128
 *
 *   [Logging]
 *   level = info
 *   colors = 1
 * @endcode
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "greedy_mesher.h"
#include "job_scheduler.h"
#include "logger.h"

class Config;

std::optional<ThreadingMode> threadingModeFromString(const std::string& text);

struct PipelineSettings {
    SchedulerOptions scheduler;
    MeshingOptions meshing;

    size_t scratchCapacity = 16;
    size_t meshCapacity = 64;
    size_t volumeCapacity = 128;

    LogLevel logLevel = LogLevel::INFO;
    bool logColors = true;

    /**
     * @brief Reads settings, keeping defaults for missing or invalid keys
     */
    static PipelineSettings fromConfig(const Config& config);

    /// Writes every setting back (for generating a default config file)
    void writeTo(Config& config) const;

    /// Applies the logging settings to Logger
    void applyLogging() const;
};
