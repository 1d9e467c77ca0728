#pragma once

#include "Genotype.h"

#include <random>

namespace GenEvo {

/**
 * In-place stochastic perturbation of a genotype.
 */
template <Genotype T>
class MutationOperator {
public:
    virtual ~MutationOperator() = default;

    virtual void mutate(T& target, std::mt19937& rng) const = 0;
};

/**
 * Produces one child genotype from two parents. Parents are left untouched.
 */
template <Genotype T>
class RecombinationOperator {
public:
    virtual ~RecombinationOperator() = default;

    virtual T recombine(const T& parent1, const T& parent2, std::mt19937& rng) const = 0;
};

} // namespace GenEvo
