#pragma once

#include "core/evolution/BinaryGenotype.h"
#include "core/evolution/EngineConfig.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/EvolutionEngine.h"

#include <memory>

namespace GenEvo {

/**
 * OneMax benchmark: fitness is the fraction of set bits, so the all-ones
 * genotype is the unique optimum with fitness 1.0.
 */
double oneMaxFitness(const BinaryGenotype& genotype);

/**
 * Random genotypes of config.genotypeLength, BitFlipMutation(bitFlipProbability),
 * NPointCrossover(crossoverPoints) and oneMaxFitness.
 */
std::unique_ptr<EvolutionConfig<BinaryGenotype>> makeOneMaxConfig(const EngineConfig& config);

/**
 * Engine with tournament selection and the probabilities from config.
 * The config must already have passed validate().
 */
EvolutionEngine<BinaryGenotype> makeOneMaxEngine(const EngineConfig& config);

} // namespace GenEvo
