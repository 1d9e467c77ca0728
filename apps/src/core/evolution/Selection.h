#pragma once

#include "Genotype.h"
#include "Individual.h"
#include "Population.h"

#include <memory>
#include <random>

namespace GenEvo {

/**
 * Picks parents from a population it owns. The population is frozen for the
 * selector's lifetime: nothing can modify the old generation while the next
 * one is being bred from it.
 */
template <Genotype T>
class Selector {
public:
    virtual ~Selector() = default;

    virtual const Individual<T>& select(std::mt19937& rng) const = 0;

    virtual const Population<T>& population() const = 0;
};

/**
 * Builds a Selector bound to one generation. Takes the population by value so
 * callers must move it in.
 */
template <Genotype T>
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    virtual std::unique_ptr<Selector<T>> selectFrom(Population<T> population) const = 0;
};

} // namespace GenEvo
