#pragma once

#include "BinaryGenotype.h"
#include "Operators.h"

#include <cstddef>
#include <random>

namespace GenEvo {

struct MutationStats {
    int flips = 0;
};

/**
 * Flips each bit independently with a fixed probability.
 *
 * Instead of drawing once per bit, the gap to the next flipped bit is drawn
 * from the geometric distribution:
 *
 *   offset = floor( ln(1 - u) / ln(1 - p) ),  u ~ U[0, 1)
 *
 * which follows from P(next flip within N bits) = 1 - (1 - p)^N. The cost is
 * proportional to the number of flips (L * p on average), not to the length L.
 *
 * Requires 0 < p < 1.
 */
class BitFlipMutation : public MutationOperator<BinaryGenotype> {
public:
    explicit BitFlipMutation(double probability);

    void mutate(BinaryGenotype& target, std::mt19937& rng) const override;
    void mutate(BinaryGenotype& target, std::mt19937& rng, MutationStats* stats) const;

    double getProbability() const { return probability_; }

    /**
     * Truncate a non-negative gap toward zero, saturating at the largest size_t
     * for values that do not fit (including infinity).
     */
    static size_t toStep(double offset);

private:
    double probability_;
    double logComplement_;
};

} // namespace GenEvo
