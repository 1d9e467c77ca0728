#pragma once

#include "Genotype.h"
#include "core/Assert.h"

#include <optional>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>

namespace GenEvo {

/**
 * True when candidate is strictly fitter than incumbent. Unknown fitness ranks
 * below every known value, and unknown never beats unknown.
 */
inline bool isFitter(const std::optional<double>& candidate, const std::optional<double>& incumbent)
{
    return candidate > incumbent;
}

/**
 * One genotype plus its cached fitness. The genotype is owned exclusively.
 * Fitness is computed at most once per instance; breeding always creates new
 * Individuals instead of resetting old ones.
 */
template <Genotype T>
class Individual {
public:
    explicit Individual(T genotype) : genotype_(std::move(genotype)) {}

    Individual(const Individual&) = delete;
    Individual& operator=(const Individual&) = delete;
    Individual(Individual&&) noexcept = default;
    Individual& operator=(Individual&&) noexcept = default;

    const T& genotype() const { return genotype_; }

    const std::optional<double>& fitness() const { return fitness_; }
    bool hasFitness() const { return fitness_.has_value(); }

    void setFitness(double fitness)
    {
        GENEVO_ASSERT(!fitness_.has_value(), "Fitness is already cached for this individual");
        fitness_ = fitness;
    }

    std::string toString() const
    {
        std::string text = genotype_.toString();
        if (fitness_.has_value()) {
            text += fmt::format(" fitness = {}", *fitness_);
        }
        return text;
    }

private:
    T genotype_;
    std::optional<double> fitness_;
};

} // namespace GenEvo
