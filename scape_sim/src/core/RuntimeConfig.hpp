#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace scape {

    /// Central, JSON-serialisable configuration for every tunable knob in the
    /// simulation.  Every sub-struct carries defaults matching the classic
    /// two-good Sugarscape set-up so the sim works out-of-the-box.

    struct RuntimeConfig {

        // ---- Simulation lifecycle ------------------------------------------------
        struct SimulationParams {
            uint64_t seed = 42;
            int    maxTicks = 5;            // 0 = unlimited (background loop only)
            int    tickRateMs = 0;          // sleep between background ticks
            bool   parallelDecisions = false;
            int    metricsLogEvery = 10;    // info-level tick summary cadence
        } simulation;

        // ---- World / resources ---------------------------------------------------
        struct WorldParams {
            int    width = 10;
            int    height = 10;
            int    initialResources = 20;
            int    capacityMin = 2;
            int    capacityMax = 5;
            int    growback = 1;
        } world;

        // ---- Trader population ---------------------------------------------------
        struct TraderParams {
            int    initialTraders = 5;
            int    vision = 2;
            int    sugarMin = 50;
            int    sugarMax = 100;
            int    spiceMin = 50;
            int    spiceMax = 100;
            int    metabolismMin = 1;
            int    metabolismMax = 4;
            std::string memoryKind = "short_term";   // or "episodic"
            int    shortTermCapacity = 20;
            int    dialogueMessages = 5;
            std::string stepPrompt =
                "Observe your inventory and MRS. Move to the best resource or propose a trade.";
        } traders;

        // ---- Bilateral trade -----------------------------------------------------
        struct TradeParams {
            double mrsTolerance = 1e-3;     // |MRS_a - MRS_b| at or below this ends negotiation
            int    maxIterations = 200;     // increments per pair per activation
            int    quantum = 1;             // units of the dearer good per increment
        } trade;

        // ---- Logging (read by Simulation, not by the engine) ---------------------
        struct LoggingParams {
            std::string file = "scape_sim.log";
            std::string level = "info";
            bool   console = true;
        } logging;

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["simulation"] = {
                {"seed",              simulation.seed},
                {"maxTicks",          simulation.maxTicks},
                {"tickRateMs",        simulation.tickRateMs},
                {"parallelDecisions", simulation.parallelDecisions},
                {"metricsLogEvery",   simulation.metricsLogEvery}
            };

            j["world"] = {
                {"width",            world.width},
                {"height",           world.height},
                {"initialResources", world.initialResources},
                {"capacityMin",      world.capacityMin},
                {"capacityMax",      world.capacityMax},
                {"growback",         world.growback}
            };

            j["traders"] = {
                {"initialTraders",    traders.initialTraders},
                {"vision",            traders.vision},
                {"sugarMin",          traders.sugarMin},
                {"sugarMax",          traders.sugarMax},
                {"spiceMin",          traders.spiceMin},
                {"spiceMax",          traders.spiceMax},
                {"metabolismMin",     traders.metabolismMin},
                {"metabolismMax",     traders.metabolismMax},
                {"memoryKind",        traders.memoryKind},
                {"shortTermCapacity", traders.shortTermCapacity},
                {"dialogueMessages",  traders.dialogueMessages},
                {"stepPrompt",        traders.stepPrompt}
            };

            j["trade"] = {
                {"mrsTolerance",  trade.mrsTolerance},
                {"maxIterations", trade.maxIterations},
                {"quantum",       trade.quantum}
            };

            j["logging"] = {
                {"file",    logging.file},
                {"level",   logging.level},
                {"console", logging.console}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("simulation")) {
                auto& s = j["simulation"];
                get(s, "seed", simulation.seed);
                get(s, "maxTicks", simulation.maxTicks);
                get(s, "tickRateMs", simulation.tickRateMs);
                get(s, "parallelDecisions", simulation.parallelDecisions);
                get(s, "metricsLogEvery", simulation.metricsLogEvery);
            }

            if (j.contains("world")) {
                auto& w = j["world"];
                get(w, "width", world.width);
                get(w, "height", world.height);
                get(w, "initialResources", world.initialResources);
                get(w, "capacityMin", world.capacityMin);
                get(w, "capacityMax", world.capacityMax);
                get(w, "growback", world.growback);
            }

            if (j.contains("traders")) {
                auto& t = j["traders"];
                get(t, "initialTraders", traders.initialTraders);
                get(t, "vision", traders.vision);
                get(t, "sugarMin", traders.sugarMin);
                get(t, "sugarMax", traders.sugarMax);
                get(t, "spiceMin", traders.spiceMin);
                get(t, "spiceMax", traders.spiceMax);
                get(t, "metabolismMin", traders.metabolismMin);
                get(t, "metabolismMax", traders.metabolismMax);
                get(t, "memoryKind", traders.memoryKind);
                get(t, "shortTermCapacity", traders.shortTermCapacity);
                get(t, "dialogueMessages", traders.dialogueMessages);
                get(t, "stepPrompt", traders.stepPrompt);
            }

            if (j.contains("trade")) {
                auto& t = j["trade"];
                get(t, "mrsTolerance", trade.mrsTolerance);
                get(t, "maxIterations", trade.maxIterations);
                get(t, "quantum", trade.quantum);
            }

            if (j.contains("logging")) {
                auto& l = j["logging"];
                get(l, "file", logging.file);
                get(l, "level", logging.level);
                get(l, "console", logging.console);
            }
        }

        /// Problems that would make populate() misbehave (inverted ranges,
        /// empty grid). Empty when the config is usable.
        std::vector<std::string> validate() const {
            std::vector<std::string> problems;
            auto range = [&problems](const char* name, int lo, int hi, int floor) {
                if (lo < floor) {
                    problems.push_back(std::string(name) + "Min must be at least " + std::to_string(floor));
                }
                if (lo > hi) {
                    problems.push_back(std::string(name) + "Min (" + std::to_string(lo) +
                        ") exceeds " + name + "Max (" + std::to_string(hi) + ")");
                }
            };

            if (world.width <= 0 || world.height <= 0) {
                problems.push_back("world.width and world.height must be positive");
            }
            if (world.initialResources < 0 || traders.initialTraders < 0) {
                problems.push_back("initialResources and initialTraders must not be negative");
            }
            range("world.capacity", world.capacityMin, world.capacityMax, 0);
            range("traders.sugar", traders.sugarMin, traders.sugarMax, 0);
            range("traders.spice", traders.spiceMin, traders.spiceMax, 0);
            range("traders.metabolism", traders.metabolismMin, traders.metabolismMax, 1);
            return problems;
        }
    };

} // namespace scape
