#pragma once

#include "EvolutionConfig.h"
#include "Genotype.h"
#include "Individual.h"
#include "core/Assert.h"

#include <cstddef>
#include <optional>
#include <random>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>
#include <vector>

namespace GenEvo {

/**
 * Ordered collection of Individuals. Order carries no meaning for selection
 * but is kept for iteration and printing.
 */
template <Genotype T>
class Population {
public:
    using Container = std::vector<Individual<T>>;

    Population() = default;

    Population(const Population&) = delete;
    Population& operator=(const Population&) = delete;
    Population(Population&&) noexcept = default;
    Population& operator=(Population&&) noexcept = default;

    static Population withCapacity(size_t capacity)
    {
        Population population;
        population.individuals_.reserve(capacity);
        return population;
    }

    // Grows to targetSize with fresh, unevaluated individuals. Never shrinks.
    void populate(size_t targetSize, const EvolutionConfig<T>& config, std::mt19937& rng)
    {
        while (individuals_.size() < targetSize) {
            individuals_.emplace_back(config.create(rng));
        }
    }

    void add(Individual<T> individual) { individuals_.push_back(std::move(individual)); }

    size_t size() const { return individuals_.size(); }
    bool empty() const { return individuals_.empty(); }

    const Individual<T>& operator[](size_t index) const
    {
        GENEVO_ASSERT(index < individuals_.size(), "Individual index out of range");
        return individuals_[index];
    }

    Individual<T>& operator[](size_t index)
    {
        GENEVO_ASSERT(index < individuals_.size(), "Individual index out of range");
        return individuals_[index];
    }

    typename Container::iterator begin() { return individuals_.begin(); }
    typename Container::iterator end() { return individuals_.end(); }
    typename Container::const_iterator begin() const { return individuals_.begin(); }
    typename Container::const_iterator end() const { return individuals_.end(); }

    size_t evaluatedCount() const
    {
        size_t count = 0;
        for (const auto& individual : individuals_) {
            if (individual.hasFitness()) {
                count++;
            }
        }
        return count;
    }

    // Fittest individual with known fitness, or nullptr if none is evaluated.
    const Individual<T>* best() const
    {
        const Individual<T>* best = nullptr;
        for (const auto& individual : individuals_) {
            if (!individual.hasFitness()) {
                continue;
            }
            if (!best || isFitter(individual.fitness(), best->fitness())) {
                best = &individual;
            }
        }
        return best;
    }

    std::optional<double> bestFitness() const
    {
        const Individual<T>* fittest = best();
        if (!fittest) {
            return std::nullopt;
        }
        return fittest->fitness();
    }

    std::optional<double> averageFitness() const
    {
        double sum = 0.0;
        size_t count = 0;
        for (const auto& individual : individuals_) {
            if (individual.hasFitness()) {
                sum += *individual.fitness();
                count++;
            }
        }
        if (count == 0) {
            return std::nullopt;
        }
        return sum / static_cast<double>(count);
    }

    /**
     * One line per individual, then "best = <max>, avg. = <mean>" over the
     * evaluated ones. The summary is omitted while nothing is evaluated.
     */
    std::string toString() const
    {
        std::string text;
        for (const auto& individual : individuals_) {
            text += individual.toString();
            text += '\n';
        }

        const auto bestValue = bestFitness();
        const auto averageValue = averageFitness();
        if (bestValue.has_value() && averageValue.has_value()) {
            text += fmt::format("best = {}, avg. = {}", *bestValue, *averageValue);
        }
        return text;
    }

private:
    Container individuals_;
};

} // namespace GenEvo
