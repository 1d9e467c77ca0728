#include "core/evolution/BinaryGenotype.h"

#include <gtest/gtest.h>
#include <sstream>

using namespace GenEvo;

class BinaryGenotypeTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
};

TEST_F(BinaryGenotypeTest, RandomHasRequestedLength)
{
    const BinaryGenotype genotype = BinaryGenotype::random(37, rng);
    EXPECT_EQ(genotype.size(), 37u);
}

TEST_F(BinaryGenotypeTest, RandomBitsAreRoughlyBalanced)
{
    const BinaryGenotype genotype = BinaryGenotype::random(10000, rng);
    const size_t ones = genotype.countOnes();

    // Bernoulli(0.5): stddev is 50, so 5000 +/- 300 is a six sigma window.
    EXPECT_GT(ones, 4700u);
    EXPECT_LT(ones, 5300u);
}

TEST_F(BinaryGenotypeTest, ZerosAndOnesAreConstant)
{
    const BinaryGenotype zeros = BinaryGenotype::allZeros(8);
    const BinaryGenotype ones = BinaryGenotype::allOnes(8);

    EXPECT_EQ(zeros.toString(), "00000000");
    EXPECT_EQ(ones.toString(), "11111111");
    EXPECT_EQ(zeros.countOnes(), 0u);
    EXPECT_EQ(ones.countOnes(), 8u);
}

TEST_F(BinaryGenotypeTest, RenderingHasNoSeparatorsOrNewline)
{
    BinaryGenotype genotype = BinaryGenotype::allZeros(5);
    genotype.set(1, true);
    genotype.set(4, true);

    EXPECT_EQ(genotype.toString(), "01001");

    std::ostringstream os;
    os << genotype;
    EXPECT_EQ(os.str(), "01001");
}

TEST_F(BinaryGenotypeTest, EmptyGenotypeRendersAsEmptyString)
{
    EXPECT_EQ(BinaryGenotype::allOnes(0).toString(), "");
}

TEST_F(BinaryGenotypeTest, CopyIsIndependentOfOriginal)
{
    const BinaryGenotype original = BinaryGenotype::allZeros(4);
    BinaryGenotype copy = original;

    copy.flip(2);

    EXPECT_EQ(original.toString(), "0000");
    EXPECT_EQ(copy.toString(), "0010");
    EXPECT_FALSE(copy == original);
}

TEST_F(BinaryGenotypeTest, FlipTogglesBit)
{
    BinaryGenotype genotype = BinaryGenotype::allOnes(3);
    genotype.flip(0);
    EXPECT_FALSE(genotype.get(0));
    genotype.flip(0);
    EXPECT_TRUE(genotype.get(0));
}

TEST_F(BinaryGenotypeTest, ParseRoundTripsRendering)
{
    const BinaryGenotype original = BinaryGenotype::random(64, rng);

    auto parsed = BinaryGenotype::fromString(original.toString());

    ASSERT_TRUE(parsed.isValue());
    EXPECT_EQ(parsed.value(), original);
}

TEST_F(BinaryGenotypeTest, ParseRejectsInvalidCharacter)
{
    auto parsed = BinaryGenotype::fromString("0102");

    ASSERT_TRUE(parsed.isError());
    EXPECT_NE(parsed.errorValue().find("position 2"), std::string::npos);
}

TEST_F(BinaryGenotypeTest, ParseAcceptsEmptyString)
{
    auto parsed = BinaryGenotype::fromString("");

    ASSERT_TRUE(parsed.isValue());
    EXPECT_EQ(parsed.value().size(), 0u);
}

TEST_F(BinaryGenotypeTest, OutOfRangeAccessAborts)
{
    BinaryGenotype genotype = BinaryGenotype::allZeros(4);
    EXPECT_DEATH({ genotype.flip(4); }, ".*");
}
