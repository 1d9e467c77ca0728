#pragma once

#include "Genotype.h"
#include "Operators.h"
#include "core/Assert.h"

#include <functional>
#include <memory>
#include <random>
#include <utility>

namespace GenEvo {

/**
 * Problem-specific capabilities the engine needs for one genotype type.
 *
 * evaluate() must be deterministic and side-effect free: the engine caches its
 * result per Individual and never calls it twice for the same one. Higher
 * fitness is better.
 */
template <Genotype T>
class EvolutionConfig {
public:
    virtual ~EvolutionConfig() = default;

    virtual T create(std::mt19937& rng) const = 0;
    virtual void mutate(T& target, std::mt19937& rng) const = 0;
    virtual T recombine(const T& parent1, const T& parent2, std::mt19937& rng) const = 0;
    virtual double evaluate(const T& subject) const = 0;
};

/**
 * EvolutionConfig assembled from a genotype factory, a mutation operator, a
 * recombination operator and a fitness function.
 */
template <Genotype T>
class OperatorEvolutionConfig final : public EvolutionConfig<T> {
public:
    using Factory = std::function<T(std::mt19937&)>;
    using FitnessFunction = std::function<double(const T&)>;

    OperatorEvolutionConfig(
        Factory factory,
        std::unique_ptr<MutationOperator<T>> mutation,
        std::unique_ptr<RecombinationOperator<T>> recombination,
        FitnessFunction fitness)
        : factory_(std::move(factory)),
          mutation_(std::move(mutation)),
          recombination_(std::move(recombination)),
          fitness_(std::move(fitness))
    {
        GENEVO_ASSERT(factory_, "Genotype factory is required");
        GENEVO_ASSERT(mutation_, "Mutation operator is required");
        GENEVO_ASSERT(recombination_, "Recombination operator is required");
        GENEVO_ASSERT(fitness_, "Fitness function is required");
    }

    T create(std::mt19937& rng) const override { return factory_(rng); }

    void mutate(T& target, std::mt19937& rng) const override { mutation_->mutate(target, rng); }

    T recombine(const T& parent1, const T& parent2, std::mt19937& rng) const override
    {
        return recombination_->recombine(parent1, parent2, rng);
    }

    double evaluate(const T& subject) const override { return fitness_(subject); }

private:
    Factory factory_;
    std::unique_ptr<MutationOperator<T>> mutation_;
    std::unique_ptr<RecombinationOperator<T>> recombination_;
    FitnessFunction fitness_;
};

} // namespace GenEvo
