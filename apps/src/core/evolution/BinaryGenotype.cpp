#include "BinaryGenotype.h"

#include "core/Assert.h"

#include <algorithm>
#include <ostream>

namespace GenEvo {

BinaryGenotype::BinaryGenotype(std::vector<bool> bits) : bits_(std::move(bits))
{}

BinaryGenotype BinaryGenotype::random(size_t size, std::mt19937& rng)
{
    std::bernoulli_distribution coin(0.5);
    std::vector<bool> bits(size);
    for (size_t i = 0; i < size; i++) {
        bits[i] = coin(rng);
    }
    return BinaryGenotype(std::move(bits));
}

BinaryGenotype BinaryGenotype::allZeros(size_t size)
{
    return BinaryGenotype(std::vector<bool>(size, false));
}

BinaryGenotype BinaryGenotype::allOnes(size_t size)
{
    return BinaryGenotype(std::vector<bool>(size, true));
}

Result<BinaryGenotype, std::string> BinaryGenotype::fromString(const std::string& text)
{
    std::vector<bool> bits;
    bits.reserve(text.size());

    for (size_t i = 0; i < text.size(); i++) {
        const char c = text[i];
        if (c == '1') {
            bits.push_back(true);
        }
        else if (c == '0') {
            bits.push_back(false);
        }
        else {
            return Result<BinaryGenotype, std::string>::error(
                "Invalid character '" + std::string(1, c) + "' at position "
                + std::to_string(i) + " (expected '0' or '1')");
        }
    }

    return Result<BinaryGenotype, std::string>::okay(BinaryGenotype(std::move(bits)));
}

bool BinaryGenotype::get(size_t index) const
{
    GENEVO_ASSERT(index < bits_.size(), "Bit index out of range");
    return bits_[index];
}

void BinaryGenotype::set(size_t index, bool value)
{
    GENEVO_ASSERT(index < bits_.size(), "Bit index out of range");
    bits_[index] = value;
}

void BinaryGenotype::flip(size_t index)
{
    GENEVO_ASSERT(index < bits_.size(), "Bit index out of range");
    bits_[index] = !bits_[index];
}

size_t BinaryGenotype::countOnes() const
{
    return static_cast<size_t>(std::count(bits_.begin(), bits_.end(), true));
}

std::string BinaryGenotype::toString() const
{
    std::string text;
    text.reserve(bits_.size());
    for (const bool bit : bits_) {
        text.push_back(bit ? '1' : '0');
    }
    return text;
}

bool BinaryGenotype::operator==(const BinaryGenotype& other) const
{
    return bits_ == other.bits_;
}

std::ostream& operator<<(std::ostream& os, const BinaryGenotype& genotype)
{
    return os << genotype.toString();
}

} // namespace GenEvo
