#include "NPointCrossover.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace GenEvo {

NPointCrossover::NPointCrossover(size_t points) : points_(points)
{}

std::vector<size_t> NPointCrossover::drawPoints(
    const BinaryGenotype& parent1, const BinaryGenotype& parent2, std::mt19937& rng) const
{
    std::vector<size_t> points;
    if (points_ == 0) {
        return points;
    }

    const size_t range = std::min(parent1.size(), parent2.size());
    GENEVO_ASSERT(range >= 2, "Crossover parents need at least 2 bits to place a point");

    points.reserve(points_ + 1);
    std::uniform_int_distribution<size_t> dist(1, range - 1);
    for (size_t i = 0; i < points_; i++) {
        points.push_back(dist(rng));
    }
    std::sort(points.begin(), points.end());

    // Odd count: close the last segment at the end of parent 1.
    if (points_ % 2 == 1) {
        points.push_back(parent1.size());
    }

    return points;
}

BinaryGenotype NPointCrossover::recombine(
    const BinaryGenotype& parent1, const BinaryGenotype& parent2, std::mt19937& rng) const
{
    const std::vector<size_t> points = drawPoints(parent1, parent2, rng);

    BinaryGenotype child = parent1;
    for (size_t i = 0; i + 1 < points.size(); i += 2) {
        const size_t from = points[i];
        // Parent 2 may be shorter than the padded end point.
        const size_t to = std::min(points[i + 1], parent2.size());
        for (size_t j = from; j < to; j++) {
            child.set(j, parent2.get(j));
        }
    }

    LOG_TRACE(Operators, "NPointCrossover: {} points over {} bits", points.size(), child.size());
    return child;
}

} // namespace GenEvo
