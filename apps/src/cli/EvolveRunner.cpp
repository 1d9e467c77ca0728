#include "EvolveRunner.h"
#include "core/LoggingChannels.h"
#include "core/problems/OneMax.h"

#include <chrono>
#include <iomanip>
#include <ostream>

namespace GenEvo {
namespace Client {

void to_json(nlohmann::json& j, const EvolveResults& results)
{
    j = nlohmann::json{
        { "generations", results.generations },
        { "populationSize", results.populationSize },
        { "durationSec", results.durationSec },
        { "bestFitness", results.bestFitness },
        { "averageFitness", results.averageFitness },
        { "bestGenotype", results.bestGenotype },
        { "reachedTarget", results.reachedTarget },
        { "completed", results.completed },
    };
}

void EvolveRunner::requestStop()
{
    stopRequested_ = true;
}

EvolveResults EvolveRunner::run(
    const EngineConfig& baseConfig, const EvolveOptions& options, std::ostream& out)
{
    EngineConfig config = baseConfig;
    if (options.generationsOverride.has_value()) {
        config.maxGenerations = *options.generationsOverride;
    }
    if (options.seedOverride.has_value()) {
        config.seed = *options.seedOverride;
    }

    EvolveResults results;
    results.populationSize = config.populationSize;

    auto engine = makeOneMaxEngine(config);
    SLOG_INFO(
        "OneMax: {} bits, population {}, {} generations",
        config.genotypeLength,
        config.populationSize,
        config.maxGenerations);

    const auto startTime = std::chrono::steady_clock::now();

    engine.start();
    engine.evaluate();

    auto recordGeneration = [&]() {
        const GenerationStats stats = engine.getStats();
        results.generations = stats.generation;
        results.bestFitness = stats.bestFitness.value_or(0.0);
        results.averageFitness = stats.averageFitness.value_or(0.0);
        if (const auto* best = engine.population()->best()) {
            results.bestGenotype = best->genotype().toString();
        }

        if (options.printProgress) {
            displayProgress(
                out,
                stats.generation,
                config.maxGenerations,
                results.bestFitness,
                results.averageFitness);
        }
        if (options.printEvery > 0 && stats.generation % options.printEvery == 0) {
            out << engine.toString() << "\n";
        }
    };

    recordGeneration();

    while (engine.generation() < config.maxGenerations) {
        if (config.targetFitness.has_value() && results.bestFitness >= *config.targetFitness) {
            break;
        }
        if (stopRequested_) {
            SLOG_WARN("Stop requested at generation {}", engine.generation());
            break;
        }

        engine.breed();
        engine.evaluate();
        recordGeneration();
    }

    const auto endTime = std::chrono::steady_clock::now();
    results.durationSec = std::chrono::duration<double>(endTime - startTime).count();
    results.reachedTarget =
        config.targetFitness.has_value() && results.bestFitness >= *config.targetFitness;
    results.completed = !stopRequested_;
    // A stop applies to this run only.
    stopRequested_ = false;

    SLOG_INFO(
        "OneMax finished after {} generations: best = {}, avg. = {}",
        results.generations,
        results.bestFitness,
        results.averageFitness);

    return results;
}

void EvolveRunner::displayProgress(
    std::ostream& out, int generation, int maxGenerations, double best, double average)
{
    out << "Gen " << std::setw(4) << generation << "/" << maxGenerations << " | best "
        << std::fixed << std::setprecision(4) << best << " | avg. " << average
        << std::defaultfloat << "\n";
}

} // namespace Client
} // namespace GenEvo
