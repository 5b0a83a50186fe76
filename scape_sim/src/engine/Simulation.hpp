#pragma once

#include "ScapeEngine.hpp"
#include "MetricsCollector.hpp"
#include "core/RuntimeConfig.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <shared_mutex>
#include <chrono>
#include <nlohmann/json.hpp>

namespace scape {

    class Simulation {
    public:
        Simulation();
        ~Simulation();

        // Load configuration; on failure the current values are kept
        void loadConfig(const std::string& configPath);
        void loadConfig(const nlohmann::json& config);

        // Build a fresh engine from the current RuntimeConfig and populate it
        void initialize(ScapeEngine::DecisionMakerFactory factory = nullptr);

        // Control (background loop)
        void start();
        void pause();
        void resume();
        void stop();

        // Step mode: run `count` ticks on the calling thread.
        // Returns the number of ticks that completed.
        int step(int count = 1);

        // Run maxTicks ticks on the calling thread (unbounded is rejected)
        int run();

        // Status
        bool isRunning() const { return running_.load(); }
        bool isPaused() const { return paused_.load(); }
        uint64_t getCurrentTick() const { return currentTick_.load(); }
        // Ticks cut short by stop(); they advanced the engine step but emitted no metrics
        uint64_t getAbortedTicks() const { return abortedTicks_.load(); }

        // RuntimeConfig access
        RuntimeConfig& getRuntimeConfig() { return rtConfig_; }
        const RuntimeConfig& getRuntimeConfig() const { return rtConfig_; }

        // Throws std::logic_error before initialize()
        ScapeEngine& getEngine();
        const ScapeEngine& getEngine() const;

        const MetricsCollector& getMetrics() const { return metrics_; }

        std::shared_mutex& getEngineMutex() { return engineMutex_; }

        // Get state as JSON
        nlohmann::json getStateJson() const;
        nlohmann::json getMetricsJson() const;

        // Writes getMetricsJson() to `path`; returns false if the file cannot be opened
        bool exportMetrics(const std::string& path) const;

    private:
        std::unique_ptr<ScapeEngine> engine_;
        RuntimeConfig rtConfig_;
        MetricsCollector metrics_;
        mutable std::shared_mutex engineMutex_;  // protects all engine state

        std::atomic<bool> running_{ false };
        std::atomic<bool> paused_{ false };
        std::atomic<uint64_t> currentTick_{ 0 };
        std::atomic<uint64_t> abortedTicks_{ 0 };

        std::thread simThread_;

        void runLoop();
        bool tickOnce();
    };

} // namespace scape
