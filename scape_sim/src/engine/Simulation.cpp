#include "Simulation.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <shared_mutex>
#include <stdexcept>

namespace scape {

    Simulation::Simulation() {}

    Simulation::~Simulation() {
        stop();
    }

    void Simulation::loadConfig(const std::string& configPath) {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", configPath);
            return;
        }

        try {
            loadConfig(nlohmann::json::parse(file));
        }
        catch (const std::exception& e) {
            Logger::error("Failed to parse config: {}", e.what());
        }
    }

    void Simulation::loadConfig(const nlohmann::json& config) {
        RuntimeConfig updated = rtConfig_;
        updated.fromJson(config);

        auto problems = updated.validate();
        if (!problems.empty()) {
            for (const auto& p : problems) {
                Logger::error("Invalid config: {}", p);
            }
            Logger::warn("Config rejected, keeping the previous values");
            return;
        }
        rtConfig_ = updated;

        if (config.contains("logging")) {
            Logger::init(rtConfig_.logging.file, rtConfig_.logging.level, rtConfig_.logging.console);
        }

        Logger::info("Configuration loaded (seed {}, {}x{} grid, {} traders)",
            rtConfig_.simulation.seed, rtConfig_.world.width, rtConfig_.world.height,
            rtConfig_.traders.initialTraders);
    }

    void Simulation::initialize(ScapeEngine::DecisionMakerFactory factory) {
        stop();

        std::unique_lock<std::shared_mutex> lock(engineMutex_);
        Logger::info("Initializing simulation...");

        metrics_.clear();
        currentTick_ = 0;
        abortedTicks_ = 0;

        engine_ = std::make_unique<ScapeEngine>(rtConfig_);
        engine_->addMetricsSink(&metrics_);
        engine_->populate(std::move(factory));

        Logger::info("Simulation initialized with {} traders and {} resources (seed {})",
            engine_->getTraders().size(), engine_->getResources().size(), rtConfig_.simulation.seed);
    }

    ScapeEngine& Simulation::getEngine() {
        if (!engine_) throw std::logic_error("Simulation not initialized");
        return *engine_;
    }

    const ScapeEngine& Simulation::getEngine() const {
        if (!engine_) throw std::logic_error("Simulation not initialized");
        return *engine_;
    }

    void Simulation::start() {
        if (running_.load()) {
            Logger::warn("Simulation already running");
            return;
        }
        getEngine().clearAbort();

        // A loop that ran out of ticks has exited but was never joined
        if (simThread_.joinable()) {
            simThread_.join();
        }

        running_ = true;
        paused_ = false;

        simThread_ = std::thread(&Simulation::runLoop, this);

        Logger::info("Simulation started (tick rate: {}ms)", rtConfig_.simulation.tickRateMs);
    }

    void Simulation::pause() {
        paused_ = true;
        Logger::info("Simulation paused at tick {}", currentTick_.load());
    }

    void Simulation::resume() {
        paused_ = false;
        Logger::info("Simulation resumed");
    }

    void Simulation::stop() {
        bool wasRunning = running_.exchange(false);
        if (engine_ && wasRunning) {
            engine_->requestAbort();
        }

        if (simThread_.joinable()) {
            simThread_.join();
        }

        if (wasRunning) {
            engine_->clearAbort();
            Logger::info("Simulation stopped at tick {}", currentTick_.load());
        }
    }

    bool Simulation::tickOnce() {
        std::unique_lock<std::shared_mutex> lock(engineMutex_);
        if (getEngine().tick() == TickStatus::ABORTED) {
            abortedTicks_++;
            return false;
        }
        currentTick_++;
        return true;
    }

    int Simulation::step(int count) {
        int completed = 0;
        for (int i = 0; i < count; ++i) {
            if (!tickOnce()) break;
            completed++;
        }
        return completed;
    }

    int Simulation::run() {
        int maxTicks = rtConfig_.simulation.maxTicks;
        if (maxTicks <= 0) {
            throw std::invalid_argument("run() needs simulation.maxTicks > 0");
        }

        Logger::info("Running {} ticks", maxTicks);
        int completed = step(maxTicks);
        Logger::info("Run finished after {} ticks", completed);
        return completed;
    }

    void Simulation::runLoop() {
        int maxTicks = rtConfig_.simulation.maxTicks;
        int tickRateMs = rtConfig_.simulation.tickRateMs;

        while (running_.load()) {
            if (!paused_.load()) {
                if (!tickOnce()) break;

                if (maxTicks > 0 && currentTick_.load() >= static_cast<uint64_t>(maxTicks)) {
                    Logger::info("Reached max ticks ({}), stopping", maxTicks);
                    running_ = false;
                    break;
                }
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(tickRateMs));
        }
    }

    nlohmann::json Simulation::getStateJson() const {
        std::shared_lock<std::shared_mutex> lock(engineMutex_);
        nlohmann::json state;
        // "tick" counts completed ticks (each reported to the metrics sink).
        // The engine's "step" also counts aborted ticks, so
        // step == tick + abortedTicks for the current engine.
        state["tick"] = currentTick_.load();
        state["abortedTicks"] = abortedTicks_.load();
        state["running"] = running_.load();
        state["paused"] = paused_.load();
        state["config"] = rtConfig_.toJson();

        if (!engine_) return state;

        ModelSnapshot snap = engine_->snapshot();
        state["step"] = snap.step;
        state["grid"] = { {"width", snap.width}, {"height", snap.height} };
        state["harvest"] = {
            {"stepSugar", snap.stepHarvest.sugar},
            {"stepSpice", snap.stepHarvest.spice},
            {"totalSugar", snap.totalHarvest.sugar},
            {"totalSpice", snap.totalHarvest.spice}
        };

        nlohmann::json traders = nlohmann::json::array();
        for (const auto& t : snap.traders) {
            traders.push_back({
                {"id", t.id},
                {"x", t.location.x},
                {"y", t.location.y},
                {"sugar", t.sugar},
                {"spice", t.spice},
                {"mrs", t.mrs ? nlohmann::json(*t.mrs) : nlohmann::json(nullptr)},
                {"trades", t.trades}
            });
        }
        state["traders"] = traders;

        nlohmann::json resources = nlohmann::json::array();
        for (const auto& r : snap.resources) {
            resources.push_back({
                {"id", r.id},
                {"x", r.location.x},
                {"y", r.location.y},
                {"kind", toString(r.kind)},
                {"amount", r.amount},
                {"capacity", r.capacity}
            });
        }
        state["resources"] = resources;

        const auto& stats = engine_->getStats();
        state["stats"] = {
            {"ticks", stats.ticks},
            {"activations", stats.activations},
            {"invalidActions", stats.invalidActions},
            {"noDecisions", stats.noDecisions},
            {"failures", stats.failures},
            {"trades", stats.trades}
        };

        return state;
    }

    nlohmann::json Simulation::getMetricsJson() const {
        std::shared_lock<std::shared_mutex> lock(engineMutex_);
        return metrics_.toJson();
    }

    bool Simulation::exportMetrics(const std::string& path) const {
        std::ofstream out(path);
        if (!out.is_open()) {
            Logger::error("Could not open metrics file: {}", path);
            return false;
        }
        out << std::setw(2) << getMetricsJson() << '\n';
        Logger::info("Metrics written to {}", path);
        return true;
    }

} // namespace scape
