#pragma once

#include "core/evolution/BinaryGenotype.h"
#include "core/evolution/BitFlipMutation.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/NPointCrossover.h"

#include <cstddef>
#include <random>

namespace GenEvo {

/**
 * OneMax-style config that counts how often the engine calls into it.
 */
class CountingEvolutionConfig : public EvolutionConfig<BinaryGenotype> {
public:
    explicit CountingEvolutionConfig(size_t length = 16, double bitFlipProbability = 0.1)
        : length_(length), mutation_(bitFlipProbability), crossover_(1)
    {}

    BinaryGenotype create(std::mt19937& rng) const override
    {
        createCalls++;
        return BinaryGenotype::random(length_, rng);
    }

    void mutate(BinaryGenotype& target, std::mt19937& rng) const override
    {
        mutateCalls++;
        mutation_.mutate(target, rng);
    }

    BinaryGenotype recombine(
        const BinaryGenotype& parent1,
        const BinaryGenotype& parent2,
        std::mt19937& rng) const override
    {
        recombineCalls++;
        return crossover_.recombine(parent1, parent2, rng);
    }

    double evaluate(const BinaryGenotype& subject) const override
    {
        evaluateCalls++;
        return static_cast<double>(subject.countOnes()) / static_cast<double>(subject.size());
    }

    mutable int createCalls = 0;
    mutable int mutateCalls = 0;
    mutable int recombineCalls = 0;
    mutable int evaluateCalls = 0;

private:
    size_t length_;
    BitFlipMutation mutation_;
    NPointCrossover crossover_;
};

} // namespace GenEvo
