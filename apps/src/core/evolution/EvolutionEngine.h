#pragma once

#include "EvolutionConfig.h"
#include "Genotype.h"
#include "Individual.h"
#include "Population.h"
#include "Selection.h"
#include "TournamentSelection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>

namespace GenEvo {

enum class EngineState {
    Uninitialized,
    Started,
    Evaluated,
    Bred,
};

inline const char* toString(EngineState state)
{
    switch (state) {
        case EngineState::Uninitialized:
            return "Uninitialized";
        case EngineState::Started:
            return "Started";
        case EngineState::Evaluated:
            return "Evaluated";
        case EngineState::Bred:
            return "Bred";
    }
    return "";
}

/**
 * Snapshot of the current generation, over evaluated individuals only.
 */
struct GenerationStats {
    int generation = 0;
    size_t populationSize = 0;
    size_t evaluatedCount = 0;
    std::optional<double> bestFitness;
    std::optional<double> averageFitness;
};

/**
 * Generational genetic algorithm.
 *
 * Lifecycle: start() fills a fresh population, evaluate() fills in missing
 * fitness, breed() replaces the whole population with offspring. The caller
 * decides how many generations to run.
 *
 * breed() moves the current population into a Selector from the configured
 * SelectionStrategy and builds the next generation from it: with
 * recombinationProbability two selected parents are recombined, otherwise one
 * selected parent is copied; independently, with mutationProbability the child
 * is mutated. Offspring always start with unknown fitness.
 */
template <Genotype T>
class EvolutionEngine {
public:
    static constexpr double DEFAULT_RECOMBINATION_PROBABILITY = 0.8;
    static constexpr double DEFAULT_MUTATION_PROBABILITY = 0.8;

    /**
     * @param seed RNG seed; 0 draws one from std::random_device.
     */
    EvolutionEngine(
        size_t populationSize,
        std::unique_ptr<EvolutionConfig<T>> config,
        std::unique_ptr<SelectionStrategy<T>> selection,
        uint32_t seed = 0)
        : populationSize_(populationSize),
          config_(std::move(config)),
          selection_(std::move(selection)),
          rng_(seed != 0 ? seed : std::random_device{}())
    {
        GENEVO_ASSERT(populationSize_ > 0, "Population size must be at least 1");
        GENEVO_ASSERT(config_, "EvolutionConfig is required");
        GENEVO_ASSERT(selection_, "SelectionStrategy is required");
    }

    static EvolutionEngine withTournament(
        size_t populationSize,
        std::unique_ptr<EvolutionConfig<T>> config,
        size_t tournamentSize,
        uint32_t seed = 0)
    {
        return EvolutionEngine(
            populationSize,
            std::move(config),
            std::make_unique<TournamentSelection<T>>(tournamentSize),
            seed);
    }

    EvolutionEngine(const EvolutionEngine&) = delete;
    EvolutionEngine& operator=(const EvolutionEngine&) = delete;
    EvolutionEngine(EvolutionEngine&&) noexcept = default;
    EvolutionEngine& operator=(EvolutionEngine&&) noexcept = default;

    void setRecombinationProbability(double probability)
    {
        GENEVO_ASSERT(
            probability >= 0.0 && probability <= 1.0,
            "Recombination probability must be in [0, 1]");
        recombinationProbability_ = probability;
    }

    void setMutationProbability(double probability)
    {
        GENEVO_ASSERT(
            probability >= 0.0 && probability <= 1.0, "Mutation probability must be in [0, 1]");
        mutationProbability_ = probability;
    }

    double getRecombinationProbability() const { return recombinationProbability_; }
    double getMutationProbability() const { return mutationProbability_; }
    size_t getPopulationSize() const { return populationSize_; }

    EngineState state() const { return state_; }
    int generation() const { return generation_; }

    // Null until start() has been called.
    const Population<T>* population() const
    {
        return population_.has_value() ? &population_.value() : nullptr;
    }

    void start()
    {
        Population<T> population = Population<T>::withCapacity(populationSize_);
        population.populate(populationSize_, *config_, rng_);

        population_ = std::move(population);
        generation_ = 0;
        state_ = EngineState::Started;

        LOG_INFO(Engine, "Started with population of {}", populationSize_);
    }

    // Evaluates only individuals without cached fitness, so repeat calls are cheap.
    void evaluate()
    {
        if (!population_.has_value()) {
            LOG_WARN(Engine, "evaluate() called before start(), nothing to evaluate");
            return;
        }

        size_t evaluated = 0;
        for (auto& individual : *population_) {
            if (!individual.hasFitness()) {
                individual.setFitness(config_->evaluate(individual.genotype()));
                evaluated++;
            }
        }
        state_ = EngineState::Evaluated;

        LOG_TRACE(Engine, "Generation {}: evaluated {} individuals", generation_, evaluated);
        if (evaluated > 0) {
            const GenerationStats stats = getStats();
            LOG_DEBUG(
                Engine,
                "Generation {}: best = {}, avg. = {}",
                generation_,
                stats.bestFitness.value_or(0.0),
                stats.averageFitness.value_or(0.0));
        }
    }

    void breed()
    {
        GENEVO_ASSERT(population_.has_value(), "breed() requires start() to be called first");

        Population<T> old = std::move(*population_);
        population_.reset();
        const std::unique_ptr<Selector<T>> selector = selection_->selectFrom(std::move(old));

        std::uniform_real_distribution<double> coin(0.0, 1.0);
        Population<T> next = Population<T>::withCapacity(populationSize_);
        int recombined = 0;
        int mutated = 0;

        while (next.size() < populationSize_) {
            std::optional<T> child;
            if (coin(rng_) < recombinationProbability_) {
                const Individual<T>& parent1 = selector->select(rng_);
                const Individual<T>& parent2 = selector->select(rng_);
                child.emplace(config_->recombine(parent1.genotype(), parent2.genotype(), rng_));
                recombined++;
            }
            else {
                child.emplace(selector->select(rng_).genotype());
            }

            if (coin(rng_) < mutationProbability_) {
                config_->mutate(*child, rng_);
                mutated++;
            }

            next.add(Individual<T>(std::move(*child)));
        }

        population_ = std::move(next);
        generation_++;
        state_ = EngineState::Bred;

        LOG_TRACE(
            Engine,
            "Generation {}: bred {} offspring ({} recombined, {} mutated)",
            generation_,
            populationSize_,
            recombined,
            mutated);
    }

    GenerationStats getStats() const
    {
        GenerationStats stats;
        stats.generation = generation_;
        if (population_.has_value()) {
            stats.populationSize = population_->size();
            stats.evaluatedCount = population_->evaluatedCount();
            stats.bestFitness = population_->bestFitness();
            stats.averageFitness = population_->averageFitness();
        }
        return stats;
    }

    // "Population:\n" followed by the population text; empty before start().
    std::string toString() const
    {
        if (!population_.has_value()) {
            return "";
        }
        return "Population:\n" + population_->toString();
    }

private:
    size_t populationSize_;
    double recombinationProbability_ = DEFAULT_RECOMBINATION_PROBABILITY;
    double mutationProbability_ = DEFAULT_MUTATION_PROBABILITY;
    std::unique_ptr<EvolutionConfig<T>> config_;
    std::unique_ptr<SelectionStrategy<T>> selection_;
    std::optional<Population<T>> population_;
    std::mt19937 rng_;
    EngineState state_ = EngineState::Uninitialized;
    int generation_ = 0;
};

} // namespace GenEvo
