#pragma once

#include "BinaryGenotype.h"
#include "Operators.h"

#include <cstddef>
#include <random>
#include <vector>

namespace GenEvo {

/**
 * N-point crossover on bit strings.
 *
 * Draws n points uniformly from [1, min(len1, len2)) (repeats allowed), sorts
 * them, and pads an odd count with len(parent1). The child starts as a copy of
 * parent 1 and takes parent 2's bits on [points[0], points[1]),
 * [points[2], points[3]), and so on. The child always has parent 1's length.
 */
class NPointCrossover : public RecombinationOperator<BinaryGenotype> {
public:
    explicit NPointCrossover(size_t points);

    BinaryGenotype recombine(
        const BinaryGenotype& parent1,
        const BinaryGenotype& parent2,
        std::mt19937& rng) const override;

    /**
     * Crossover points for one recombination: sorted, even-length, ready to be
     * consumed pairwise.
     */
    std::vector<size_t> drawPoints(
        const BinaryGenotype& parent1, const BinaryGenotype& parent2, std::mt19937& rng) const;

    size_t getPointCount() const { return points_; }

private:
    size_t points_;
};

} // namespace GenEvo
