#pragma once

#include "core/Result.h"

#include <cstddef>
#include <iosfwd>
#include <random>
#include <string>
#include <vector>

namespace GenEvo {

/**
 * Fixed-length bit string genotype. The length is set at construction and
 * never changes; mutation only flips bits in place.
 */
class BinaryGenotype {
public:
    static BinaryGenotype random(size_t size, std::mt19937& rng);
    static BinaryGenotype allZeros(size_t size);
    static BinaryGenotype allOnes(size_t size);

    /**
     * Parse the text rendering produced by toString().
     * Any character other than '0' or '1' is an error.
     */
    static Result<BinaryGenotype, std::string> fromString(const std::string& text);

    size_t size() const { return bits_.size(); }
    bool get(size_t index) const;
    void set(size_t index, bool value);
    void flip(size_t index);
    size_t countOnes() const;

    // One character per bit, '1' for set and '0' for clear.
    std::string toString() const;

    bool operator==(const BinaryGenotype& other) const;

private:
    explicit BinaryGenotype(std::vector<bool> bits);

    std::vector<bool> bits_;
};

std::ostream& operator<<(std::ostream& os, const BinaryGenotype& genotype);

} // namespace GenEvo
