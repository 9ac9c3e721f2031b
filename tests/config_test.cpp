/**
 * @file config_test.cpp
 * @brief Tests for INI parsing and the typed pipeline settings
 */

#include "test_utils.h"
#include "config.h"
#include "pipeline_settings.h"

#include <cstdio>

// ============================================================
// Config
// ============================================================

TEST(ParsesSectionsAndComments) {
    Config config;
    config.loadFromString(R"(
# comment
[Scheduler]
threading_mode = fixed   ; trailing comment
workers=3

[Meshing]
greedy_extension = off
scale = 0.5
)");

    ASSERT_EQ(config.getString("Scheduler", "threading_mode"), "fixed");
    ASSERT_EQ(config.getInt("Scheduler", "workers"), 3);
    ASSERT_FALSE(config.getBool("Meshing", "greedy_extension", true));
    ASSERT_TRUE(config.getFloat("Meshing", "scale") > 0.49f && config.getFloat("Meshing", "scale") < 0.51f);
    ASSERT_FALSE(config.hasKey("Meshing", "workers"));
}

TEST(MissingOrInvalidValuesFallBack) {
    LogCapture capture(LogLevel::WARNING);
    Config config;
    config.loadFromString("[A]\ncount = many\nflag = maybe\nbroken line\n");

    ASSERT_EQ(config.getInt("A", "count", 7), 7);
    ASSERT_TRUE(config.getBool("A", "flag", true));
    ASSERT_EQ(config.getInt("A", "absent", 11), 11);
    ASSERT_EQ(config.getString("B", "absent", "x"), "x");
    ASSERT_GE(capture.count(LogLevel::WARNING, "malformed"), 1u);
    ASSERT_GE(capture.count(LogLevel::WARNING, "[A]:count"), 1u);
}

TEST(SaveAndReload) {
    LogCapture capture(LogLevel::WARNING);
    const std::string path = "config_test_roundtrip.ini";

    Config config;
    config.setInt("Pools", "mesh_capacity", 12);
    config.setBool("Logging", "colors", false);
    config.setString("Scheduler", "threading_mode", "inline");
    config.setFloat("Meshing", "scale", 0.25f);
    ASSERT_TRUE(config.saveToFile(path));

    Config reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path));
    std::remove(path.c_str());

    ASSERT_EQ(reloaded.getInt("Pools", "mesh_capacity"), 12);
    ASSERT_FALSE(reloaded.getBool("Logging", "colors", true));
    ASSERT_EQ(reloaded.getString("Scheduler", "threading_mode"), "inline");
    ASSERT_TRUE(reloaded.getFloat("Meshing", "scale") > 0.249f && reloaded.getFloat("Meshing", "scale") < 0.251f);

    Config missing;
    ASSERT_FALSE(missing.loadFromFile("no_such_config.ini"));
}

// ============================================================
// PipelineSettings
// ============================================================

TEST(ThreadingModeNames) {
    ASSERT_TRUE(threadingModeFromString("inline") == ThreadingMode::INLINE);
    ASSERT_TRUE(threadingModeFromString("FIXED") == ThreadingMode::FIXED_POOL);
    ASSERT_TRUE(threadingModeFromString("fixed_pool") == ThreadingMode::FIXED_POOL);
    ASSERT_TRUE(threadingModeFromString("Adaptive") == ThreadingMode::ADAPTIVE);
    ASSERT_FALSE(threadingModeFromString("turbo").has_value());
}

TEST(DefaultsWhenConfigEmpty) {
    Config config;
    PipelineSettings settings = PipelineSettings::fromConfig(config);

    ASSERT_TRUE(settings.scheduler.mode == ThreadingMode::ADAPTIVE);
    ASSERT_EQ(settings.scheduler.maxQueuedJobs, 256u);
    ASSERT_TRUE(settings.meshing.greedyExtension);
    ASSERT_EQ(settings.scratchCapacity, 16u);
    ASSERT_EQ(settings.meshCapacity, 64u);
    ASSERT_EQ(settings.volumeCapacity, 128u);
    ASSERT_TRUE(settings.logLevel == LogLevel::INFO);
}

TEST(ReadsEverySection) {
    Config config;
    config.loadFromString(R"(
[Scheduler]
threading_mode = inline
workers = 6
max_queued_jobs = 32
wait_timeout_ms = 25

[Meshing]
greedy_extension = 0

[Pools]
scratch_capacity = 2
mesh_capacity = 3
volume_capacity = 4

[Logging]
level = warning
colors = no
)");

    PipelineSettings settings = PipelineSettings::fromConfig(config);
    ASSERT_TRUE(settings.scheduler.mode == ThreadingMode::INLINE);
    ASSERT_EQ(settings.scheduler.workers, 6);
    ASSERT_EQ(settings.scheduler.maxQueuedJobs, 32u);
    ASSERT_EQ(settings.scheduler.waitTimeout.count(), 25);
    ASSERT_FALSE(settings.meshing.greedyExtension);
    ASSERT_EQ(settings.scratchCapacity, 2u);
    ASSERT_EQ(settings.meshCapacity, 3u);
    ASSERT_EQ(settings.volumeCapacity, 4u);
    ASSERT_TRUE(settings.logLevel == LogLevel::WARNING);
    ASSERT_FALSE(settings.logColors);
}

TEST(InvalidSettingsKeepDefaults) {
    LogCapture capture(LogLevel::WARNING);
    Config config;
    config.loadFromString("[Scheduler]\nthreading_mode = turbo\nmax_queued_jobs = -5\n[Pools]\nmesh_capacity = -1\n");

    PipelineSettings settings = PipelineSettings::fromConfig(config);
    ASSERT_TRUE(settings.scheduler.mode == ThreadingMode::ADAPTIVE);
    ASSERT_EQ(settings.scheduler.maxQueuedJobs, 256u);
    ASSERT_EQ(settings.meshCapacity, 64u);
    ASSERT_GE(capture.count(LogLevel::WARNING, "turbo"), 1u);
}

TEST(WriteToRoundTrips) {
    PipelineSettings original;
    original.scheduler.mode = ThreadingMode::FIXED_POOL;
    original.scheduler.workers = 5;
    original.meshing.greedyExtension = false;
    original.volumeCapacity = 9;
    original.logLevel = LogLevel::DEBUG;

    Config config;
    original.writeTo(config);
    PipelineSettings copy = PipelineSettings::fromConfig(config);

    ASSERT_TRUE(copy.scheduler.mode == ThreadingMode::FIXED_POOL);
    ASSERT_EQ(copy.scheduler.workers, 5);
    ASSERT_FALSE(copy.meshing.greedyExtension);
    ASSERT_EQ(copy.volumeCapacity, 9u);
    ASSERT_TRUE(copy.logLevel == LogLevel::DEBUG);
}

TEST(ApplyLoggingSetsMinimumLevel) {
    LogLevel previous = Logger::minLevel();

    PipelineSettings settings;
    settings.logLevel = LogLevel::ERROR;
    settings.applyLogging();
    ASSERT_FALSE(Logger::enabled(LogLevel::WARNING));
    ASSERT_TRUE(Logger::enabled(LogLevel::ERROR));

    Logger::setMinLevel(previous);
    Logger::setUseColors(true);
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
