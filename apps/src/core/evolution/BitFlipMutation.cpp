#include "BitFlipMutation.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <cmath>
#include <limits>

namespace GenEvo {

BitFlipMutation::BitFlipMutation(double probability)
    : probability_(probability), logComplement_(std::log1p(-probability))
{
    GENEVO_ASSERT(
        probability > 0.0 && probability < 1.0, "Bit flip probability must be in (0, 1)");
}

size_t BitFlipMutation::toStep(double offset)
{
    constexpr size_t maxStep = std::numeric_limits<size_t>::max();
    // Also catches NaN.
    if (!(offset < static_cast<double>(maxStep))) {
        return maxStep;
    }
    if (offset <= 0.0) {
        return 0;
    }
    return static_cast<size_t>(offset);
}

void BitFlipMutation::mutate(BinaryGenotype& target, std::mt19937& rng) const
{
    mutate(target, rng, nullptr);
}

void BitFlipMutation::mutate(
    BinaryGenotype& target, std::mt19937& rng, MutationStats* stats) const
{
    int flips = 0;
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const size_t length = target.size();
    size_t i = 0;

    while (true) {
        const double u = unit(rng);
        const size_t step = toStep(std::log1p(-u) / logComplement_);

        // Compared against the remaining length so that a saturated step cannot overflow.
        if (step >= length - i) {
            break;
        }
        i += step;

        target.flip(i);
        flips++;
        i++;
    }

    if (stats) {
        stats->flips = flips;
    }
    LOG_TRACE(Operators, "BitFlipMutation: {} bits, p={}, {} flips", length, probability_, flips);
}

} // namespace GenEvo
