#include <gtest/gtest.h>

#include <vector>

#include "core/TallyEngine.hpp"

using namespace Tmber;

class TallyEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        variants = {
            make_variant_record("chr1", 150, "A", "T", "."),
            make_variant_record("chr1", 160, "A", "T", "."),
            make_variant_record("chr1", 170, "C", "CAG", "."),
            make_variant_record("chr1", 180, "GTT", "G", "."),
            make_variant_record("chr1", 500, "A", "T", "."),                      // outside
            make_variant_record("chr2", 150, "A", "T", "."),                      // other chrom
            make_variant_record("chr1", 190, "N", "<DEL>", "SVTYPE=DEL"),         // no END
            make_variant_record("chr1", 195, "N", "<DUP>", "SVTYPE=DUP;END=199"),
        };
        deduplicate(variants);
    }

    RegionSet region_set{"panel", {{"chr1", 100, 200}}};
    std::vector<VariantRecord> variants;
};

TEST_F(TallyEngineTest, CountsPerAllelePair) {
    auto tallies = tally_variants(variants, region_set);

    ASSERT_EQ(tallies.size(), 4u);
    // Sorted by class label: SNV < deletion < duplication < insertion
    EXPECT_EQ(tallies[0].mutation_class, MutationClass::SNV);
    EXPECT_EQ(tallies[0].ref, "A");
    EXPECT_EQ(tallies[0].alt, "T");
    EXPECT_EQ(tallies[0].observed_count, 2);
    EXPECT_EQ(tallies[1].mutation_class, MutationClass::DELETION);
    EXPECT_EQ(tallies[1].observed_count, 1);
    EXPECT_EQ(tallies[2].mutation_class, MutationClass::DUPLICATION);
    EXPECT_EQ(tallies[3].mutation_class, MutationClass::INSERTION);

    for (const auto& t : tallies) {
        EXPECT_EQ(t.region_set_name, "panel");
        EXPECT_EQ(t.region_set_size, 100);
    }
}

TEST_F(TallyEngineTest, DuplicatesCountOnce) {
    auto doubled = variants;
    doubled.insert(doubled.end(), variants.begin(), variants.end());
    deduplicate(doubled);

    auto a = tally_variants(variants, region_set);
    auto b = tally_variants(doubled, region_set);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].observed_count, b[i].observed_count);
    }
}

TEST_F(TallyEngineTest, OverlappingInputIntervalsDoNotDoubleCount) {
    RegionSet overlapping("panel", {{"chr1", 100, 200}, {"chr1", 120, 180}, {"chr1", 100, 200}});
    auto tallies = tally_variants(variants, overlapping);
    ASSERT_FALSE(tallies.empty());
    EXPECT_EQ(tallies[0].observed_count, 2);
}

TEST_F(TallyEngineTest, NoVariantsInside) {
    RegionSet far("far", {{"chr9", 0, 10}});
    EXPECT_TRUE(tally_variants(variants, far).empty());
}

TEST(TallyResultOrderTest, OrdersByRegionSetThenLabel) {
    TallyResult a{"a", 10, MutationClass::INSERTION, "A", "AT", 1};
    TallyResult b{"a", 10, MutationClass::SNV, "A", "C", 1};
    TallyResult c{"b", 5, MutationClass::SNV, "A", "C", 1};
    // "SNV" sorts before "insertion" (upper case first)
    EXPECT_TRUE(tally_result_less(b, a));
    EXPECT_TRUE(tally_result_less(a, c));
    EXPECT_FALSE(tally_result_less(a, a));
}
