#include "OneMax.h"

#include "core/Assert.h"
#include "core/evolution/BitFlipMutation.h"
#include "core/evolution/NPointCrossover.h"

namespace GenEvo {

double oneMaxFitness(const BinaryGenotype& genotype)
{
    if (genotype.size() == 0) {
        return 0.0;
    }
    return static_cast<double>(genotype.countOnes()) / static_cast<double>(genotype.size());
}

std::unique_ptr<EvolutionConfig<BinaryGenotype>> makeOneMaxConfig(const EngineConfig& config)
{
    const size_t length = static_cast<size_t>(config.genotypeLength);

    return std::make_unique<OperatorEvolutionConfig<BinaryGenotype>>(
        [length](std::mt19937& rng) { return BinaryGenotype::random(length, rng); },
        std::make_unique<BitFlipMutation>(config.bitFlipProbability),
        std::make_unique<NPointCrossover>(static_cast<size_t>(config.crossoverPoints)),
        oneMaxFitness);
}

EvolutionEngine<BinaryGenotype> makeOneMaxEngine(const EngineConfig& config)
{
    GENEVO_ASSERT(config.validate().isValue(), "OneMax engine config must be valid");

    auto engine = EvolutionEngine<BinaryGenotype>::withTournament(
        static_cast<size_t>(config.populationSize),
        makeOneMaxConfig(config),
        static_cast<size_t>(config.tournamentSize),
        static_cast<uint32_t>(config.seed));
    engine.setRecombinationProbability(config.recombinationProbability);
    engine.setMutationProbability(config.mutationProbability);
    return engine;
}

} // namespace GenEvo
