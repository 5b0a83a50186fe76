#include "engine/Simulation.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <csignal>
#include <optional>

using namespace scape;

static Simulation* g_sim = nullptr;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;

    if (g_sim) {
        g_sim->getEngine().requestAbort();
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configPath;
    std::string metricsOut;
    std::optional<uint64_t> seed;
    std::optional<int> ticks;
    bool parallel = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            }
            else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            }
            else if (arg == "--ticks" && i + 1 < argc) {
                ticks = std::stoi(argv[++i]);
            }
            else if (arg == "--metrics-out" && i + 1 < argc) {
                metricsOut = argv[++i];
            }
            else if (arg == "--parallel") {
                parallel = true;
            }
            else if (arg == "--help") {
                std::cout << "Sugarscape Trading Simulation\n"
                    << "Usage: scape_sim [options]\n"
                    << "Options:\n"
                    << "  --config <path>         Path to JSON config (default: built-in defaults)\n"
                    << "  --seed <n>              Random seed (overrides config)\n"
                    << "  --ticks <n>             Number of ticks to run (overrides config)\n"
                    << "  --metrics-out <path>    Write collected metrics as JSON\n"
                    << "  --parallel              Run agent decisions concurrently\n"
                    << "  --help                  Show this help\n";
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << " (see --help)\n";
                return 2;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 2;
    }

    try {
        Logger::init("scape_sim.log", "info", true);

        Logger::info("=== Sugarscape Trading Simulation ===");

        Simulation sim;

        if (!configPath.empty()) {
            Logger::info("Config: {}", configPath);
            sim.loadConfig(configPath);
        }

        auto& cfg = sim.getRuntimeConfig();
        if (seed) cfg.simulation.seed = *seed;
        if (ticks) cfg.simulation.maxTicks = *ticks;
        if (parallel) cfg.simulation.parallelDecisions = true;

        sim.initialize();
        g_sim = &sim;

        int completed = sim.run();

        const auto* latest = sim.getMetrics().latest();
        if (latest) {
            Logger::info("Final step {}: {} traders, sugar {}, spice {}, trade volume {}, price {}",
                latest->step, latest->traderCount, latest->totalSugar, latest->totalSpice,
                latest->tradeVolume, latest->price ? fmt::format("{:.4f}", *latest->price) : "n/a");
        }

        if (!metricsOut.empty() && !sim.exportMetrics(metricsOut)) {
            g_sim = nullptr;
            return 1;
        }

        g_sim = nullptr;
        if (completed < cfg.simulation.maxTicks) {
            Logger::warn("Stopped early after {} of {} ticks", completed, cfg.simulation.maxTicks);
        }
    }
    catch (const std::exception& e) {
        g_sim = nullptr;
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    Logger::info("Shutdown complete");
    return 0;
}
