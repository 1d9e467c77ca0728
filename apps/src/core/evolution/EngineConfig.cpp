#include "EngineConfig.h"

#include <limits>

namespace GenEvo {

Result<std::monostate, std::string> EngineConfig::validate() const
{
    using R = Result<std::monostate, std::string>;

    if (populationSize < 1) {
        return R::error("populationSize must be at least 1");
    }
    if (genotypeLength < 2) {
        return R::error("genotypeLength must be at least 2");
    }
    if (recombinationProbability < 0.0 || recombinationProbability > 1.0) {
        return R::error("recombinationProbability must be in [0, 1]");
    }
    if (mutationProbability < 0.0 || mutationProbability > 1.0) {
        return R::error("mutationProbability must be in [0, 1]");
    }
    if (bitFlipProbability <= 0.0 || bitFlipProbability >= 1.0) {
        return R::error("bitFlipProbability must be in (0, 1)");
    }
    if (crossoverPoints < 0) {
        return R::error("crossoverPoints must not be negative");
    }
    if (tournamentSize < 1) {
        return R::error("tournamentSize must be at least 1");
    }
    if (maxGenerations < 0) {
        return R::error("maxGenerations must not be negative");
    }
    if (seed < 0 || seed > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return R::error("seed must be in [0, 4294967295]");
    }

    return R::okay(std::monostate{});
}

void to_json(nlohmann::json& j, const EngineConfig& config)
{
    j = nlohmann::json{
        { "populationSize", config.populationSize },
        { "genotypeLength", config.genotypeLength },
        { "recombinationProbability", config.recombinationProbability },
        { "mutationProbability", config.mutationProbability },
        { "bitFlipProbability", config.bitFlipProbability },
        { "crossoverPoints", config.crossoverPoints },
        { "tournamentSize", config.tournamentSize },
        { "maxGenerations", config.maxGenerations },
        { "seed", config.seed },
    };
    if (config.targetFitness.has_value()) {
        j["targetFitness"] = *config.targetFitness;
    }
}

// Missing keys keep their defaults; present keys with the wrong type throw.
void from_json(const nlohmann::json& j, EngineConfig& config)
{
    const EngineConfig defaults;
    config.populationSize = j.value("populationSize", defaults.populationSize);
    config.genotypeLength = j.value("genotypeLength", defaults.genotypeLength);
    config.recombinationProbability =
        j.value("recombinationProbability", defaults.recombinationProbability);
    config.mutationProbability = j.value("mutationProbability", defaults.mutationProbability);
    config.bitFlipProbability = j.value("bitFlipProbability", defaults.bitFlipProbability);
    config.crossoverPoints = j.value("crossoverPoints", defaults.crossoverPoints);
    config.tournamentSize = j.value("tournamentSize", defaults.tournamentSize);
    config.maxGenerations = j.value("maxGenerations", defaults.maxGenerations);
    config.seed = j.value("seed", defaults.seed);

    if (j.contains("targetFitness") && !j["targetFitness"].is_null()) {
        config.targetFitness = j["targetFitness"].get<double>();
    }
    else {
        config.targetFitness = std::nullopt;
    }
}

} // namespace GenEvo
