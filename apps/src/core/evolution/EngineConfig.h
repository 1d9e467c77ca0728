#pragma once

#include "core/Result.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace GenEvo {

/**
 * Run parameters for a binary-genotype evolution run.
 */
struct EngineConfig {
    int populationSize = 20;
    int genotypeLength = 32;
    double recombinationProbability = 0.8; // Chance a child comes from two parents.
    double mutationProbability = 0.8;      // Chance a child is mutated at all.
    double bitFlipProbability = 0.02;      // Per-bit flip chance once mutated. Must be in (0, 1).
    int crossoverPoints = 1;
    int tournamentSize = 2;
    int maxGenerations = 100;
    int64_t seed = 0; // 0 = seed from std::random_device. Must fit in uint32_t.

    // Caller-side stop condition; the engine itself never stops on its own.
    std::optional<double> targetFitness;

    Result<std::monostate, std::string> validate() const;
};

void to_json(nlohmann::json& j, const EngineConfig& config);
void from_json(const nlohmann::json& j, EngineConfig& config);

} // namespace GenEvo
