#include <gtest/gtest.h>
#include "phasegraph/common/index_set.hpp"

using namespace phasegraph;

TEST(IndexSetTests, Insert_PreservesInsertionOrder)
{
    IndexSet set;
    EXPECT_TRUE(set.insert(5));
    EXPECT_TRUE(set.insert(1));
    EXPECT_TRUE(set.insert(3));

    std::vector<size_t> expected{5, 1, 3};
    EXPECT_EQ(set.values(), expected);
}

TEST(IndexSetTests, Insert_Duplicate_ReturnsFalse)
{
    IndexSet set{2, 4};
    EXPECT_FALSE(set.insert(2));
    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.contains(4));
    EXPECT_FALSE(set.contains(3));
}

TEST(IndexSetTests, At_OutOfRange_Throws)
{
    IndexSet set{7};
    EXPECT_EQ(set.at(0), 7u);
    EXPECT_THROW(set.at(1), std::out_of_range);
}

TEST(IndexSetTests, PositionalIteration_SeesValuesAddedDuringTraversal)
{
    IndexSet set{0};
    for (size_t pos = 0; pos < set.size(); ++pos)
    {
        size_t value = set.at(pos);
        if (value < 3)
        {
            set.insert(value + 1);
        }
    }
    std::vector<size_t> expected{0, 1, 2, 3};
    EXPECT_EQ(set.values(), expected);
}

TEST(IndexSetTests, Equality_IgnoresOrder)
{
    IndexSet a{1, 2, 3};
    IndexSet b{3, 1, 2};
    IndexSet c{1, 2};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
