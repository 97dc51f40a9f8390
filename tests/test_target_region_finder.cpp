#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/TargetRegionFinder.hpp"
#include "core/Types.hpp"
#include "test_utils.hpp"
#include "utils/FastaReader.hpp"

using namespace Tmber;

TEST(FindTargetRunsTest, SplitsOnNonTargetLetters) {
    auto runs = find_target_runs("chr1", "NNACGTNNACNA", "ACGT", false);
    std::vector<GenomicInterval> expected = {{"chr1", 2, 6}, {"chr1", 8, 10}, {"chr1", 11, 12}};
    EXPECT_EQ(runs, expected);
}

TEST(FindTargetRunsTest, CaseHandling) {
    EXPECT_EQ(find_target_runs("c", "acgtNNACGT", "ACGT", false).size(), 1u);

    auto runs = find_target_runs("c", "acgtNNACGT", "ACGT", true);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].start, 6);
    EXPECT_EQ(runs[0].end, 10);
}

TEST(FindTargetRunsTest, EdgesAndEmpty) {
    auto runs = find_target_runs("c", "ACGT", "ACGT", false);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].start, 0);
    EXPECT_EQ(runs[0].end, 4);

    EXPECT_TRUE(find_target_runs("c", "NNNN", "ACGT", false).empty());
    EXPECT_TRUE(find_target_runs("c", "", "ACGT", false).empty());
}

TEST(FindTargetRunsTest, CustomLetters) {
    auto runs = find_target_runs("c", "ANNA", "N", false);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].start, 1);
    EXPECT_EQ(runs[0].end, 3);
}

TEST(HumanAutosomeTest, Names) {
    EXPECT_TRUE(is_human_autosome("chr1"));
    EXPECT_TRUE(is_human_autosome("22"));
    EXPECT_TRUE(is_human_autosome("CHR7"));
    EXPECT_FALSE(is_human_autosome("chr23"));
    EXPECT_FALSE(is_human_autosome("chr0"));
    EXPECT_FALSE(is_human_autosome("chrX"));
    EXPECT_FALSE(is_human_autosome("chr1_KI270706v1_random"));
    EXPECT_FALSE(is_human_autosome("chr01"));
}

class TargetRegionFinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        fasta_path = dir.write("genome.fa",
                               ">chr1\n"
                               "NNNNACGTAC\n"
                               "GTNNacgt\n"
                               ">chrX\n"
                               "ACGTACGT\n"
                               ">2 description\n"
                               "NNNN\n");
        config.command = Command::BED;
        config.fasta_path = fasta_path;
        config.dest_dir = dir.file("out");
        config.threads = 2;
    }

    Test::TempDir dir;
    std::string fasta_path;
    Config config;
};

TEST_F(TargetRegionFinderTest, FastaReaderKeepsCase) {
    FastaReader reader(fasta_path);
    EXPECT_EQ(reader.sequence_names(), (std::vector<std::string>{"chr1", "chrX", "2"}));
    EXPECT_EQ(reader.fetch_sequence("chr1"), "NNNNACGTACGTNNacgt");
    EXPECT_EQ(reader.get_chr_length("chrX"), 8);
    EXPECT_EQ(reader.get_chr_length("chr9"), -1);
}

TEST_F(TargetRegionFinderTest, FindsRunsInEverySequence) {
    TargetRegionFinder finder(config);
    auto runs = finder.run();
    std::vector<GenomicInterval> expected = {{"chr1", 4, 12}, {"chr1", 14, 18}, {"chrX", 0, 8}};
    EXPECT_EQ(runs, expected);
}

TEST_F(TargetRegionFinderTest, CaseSensitiveAndAutosomes) {
    config.case_sensitive = true;
    config.human_autosome = true;
    TargetRegionFinder finder(config);
    auto runs = finder.run();
    std::vector<GenomicInterval> expected = {{"chr1", 4, 12}};
    EXPECT_EQ(runs, expected);
}

TEST_F(TargetRegionFinderTest, WritesBed) {
    TargetRegionFinder finder(config);
    std::string path = finder.run_and_write();
    EXPECT_EQ(path, dir.file("out/genome.bed"));
    EXPECT_EQ(Test::read_file(path), "chr1\t4\t12\nchr1\t14\t18\nchrX\t0\t8\n");
}

TEST(TargetRegionFinderErrorTest, MissingFasta) {
    Config config;
    config.fasta_path = "/nonexistent/genome.fa";
    TargetRegionFinder finder(config);
    EXPECT_THROW(finder.run(), ConfigError);
}
