#pragma once

#include "Selection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <cstddef>
#include <memory>
#include <random>
#include <utility>

namespace GenEvo {

/**
 * Tournament selection: sample groupSize individuals uniformly with
 * replacement, return the fittest. Only a strictly fitter sample replaces the
 * current winner, so ties keep the first one drawn.
 *
 * Unknown fitness never wins against known fitness and never beats another
 * unknown, so on an unevaluated population every tournament returns its first
 * draw (plain uniform selection). groupSize 1 gives the same, without pressure.
 */
template <Genotype T>
class TournamentSelector final : public Selector<T> {
public:
    TournamentSelector(size_t groupSize, Population<T> population)
        : groupSize_(groupSize), population_(std::move(population))
    {
        GENEVO_ASSERT(groupSize_ > 0, "Tournament group size must be at least 1");
        GENEVO_ASSERT(!population_.empty(), "Cannot select from an empty population");
    }

    const Individual<T>& select(std::mt19937& rng) const override
    {
        std::uniform_int_distribution<size_t> dist(0, population_.size() - 1);

        size_t bestIdx = dist(rng);
        for (size_t i = 1; i < groupSize_; i++) {
            const size_t idx = dist(rng);
            if (isFitter(population_[idx].fitness(), population_[bestIdx].fitness())) {
                bestIdx = idx;
            }
        }

        LOG_TRACE(Selection, "Tournament of {} picked index {}", groupSize_, bestIdx);
        return population_[bestIdx];
    }

    const Population<T>& population() const override { return population_; }

    size_t getGroupSize() const { return groupSize_; }

private:
    size_t groupSize_;
    Population<T> population_;
};

template <Genotype T>
class TournamentSelection final : public SelectionStrategy<T> {
public:
    explicit TournamentSelection(size_t groupSize) : groupSize_(groupSize)
    {
        GENEVO_ASSERT(groupSize_ > 0, "Tournament group size must be at least 1");
    }

    std::unique_ptr<Selector<T>> selectFrom(Population<T> population) const override
    {
        return std::make_unique<TournamentSelector<T>>(groupSize_, std::move(population));
    }

    size_t getGroupSize() const { return groupSize_; }

private:
    size_t groupSize_;
};

} // namespace GenEvo
