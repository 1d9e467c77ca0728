#pragma once

#include "core/evolution/EngineConfig.h"

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace GenEvo {
namespace Client {

/**
 * Results from a completed OneMax run.
 */
struct EvolveResults {
    int generations = 0;
    int populationSize = 0;
    double durationSec = 0.0;

    double bestFitness = 0.0;
    double averageFitness = 0.0;
    std::string bestGenotype;

    bool reachedTarget = false;
    bool completed = false;
};

void to_json(nlohmann::json& j, const EvolveResults& results);

struct EvolveOptions {
    int printEvery = 0;           // Print the population every N generations; 0 = never.
    bool printProgress = true;    // One summary line per generation.
    std::optional<int> generationsOverride;
    std::optional<uint32_t> seedOverride;
};

/**
 * Runs OneMax evolution locally: start, then evaluate + breed until
 * maxGenerations or targetFitness. Progress goes to the given stream.
 */
class EvolveRunner {
public:
    EvolveResults run(const EngineConfig& config, const EvolveOptions& options, std::ostream& out);

    /**
     * Request stop of the current run (from signal handler). Takes effect
     * between generations and is cleared when run() returns.
     */
    void requestStop();

private:
    std::atomic<bool> stopRequested_{ false };

    void displayProgress(
        std::ostream& out, int generation, int maxGenerations, double best, double average);
};

} // namespace Client
} // namespace GenEvo
