#include <gtest/gtest.h>
#include "ramancal/ReferenceTables.hpp"
#include <stdexcept>

namespace ramancal_test {

using namespace ramancal;

TEST(ReferenceTables, NeonLines)
{
    const Vector& ne = neon_peaks_nm();
    ASSERT_EQ(ne.size(), 15);
    EXPECT_DOUBLE_EQ(ne[0], 585.249);
    EXPECT_DOUBLE_EQ(ne[14], 653.288);
    for (Eigen::Index i = 1; i < ne.size(); ++i)
        EXPECT_LT(ne[i - 1], ne[i]);
}

TEST(ReferenceTables, AcetonitrileLines)
{
    const Vector& ac = acetonitrile_peaks_cm1();
    ASSERT_EQ(ac.size(), 5);
    EXPECT_DOUBLE_EQ(ac[0], 918.0);
    EXPECT_DOUBLE_EQ(ac[4], 2999.0);
}

TEST(ReferenceTables, LookupByNameIgnoresCase)
{
    EXPECT_EQ(&reference_table("Neon"), &neon_peaks_nm());
    EXPECT_EQ(&reference_table("ACETONITRILE"), &acetonitrile_peaks_cm1());
}

TEST(ReferenceTables, UnknownNameThrows)
{
    EXPECT_THROW(reference_table("argon"), std::invalid_argument);
}

TEST(ReferenceTables, NamesAreSorted)
{
    EXPECT_EQ(reference_table_names(), (std::vector<std::string>{"acetonitrile", "neon"}));
}

} // namespace ramancal_test
