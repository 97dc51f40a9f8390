/**
 * @file test_tmb_processor.cpp
 * @brief End-to-end tests for TmbProcessor and TmbWriter
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/TmbProcessor.hpp"
#include "io/TmbWriter.hpp"
#include "test_utils.hpp"

using namespace Tmber;

namespace {

const char* kVcfHeader =
    "##fileformat=VCFv4.2\n"
    "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\n";

} // namespace

class TmbProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.command = Command::TMB;
        config.threads = 2;
        config.dest_dir = dir.file("out");
    }

    Test::TempDir dir;
    Config config;
};

TEST_F(TmbProcessorTest, SingleSnvInSmallRegion) {
    config.bed_paths = {dir.write("small.bed", "chr1\t100\t200\n")};
    config.vcf_paths = {dir.write("s1.vcf", std::string(kVcfHeader) +
                                                "chr1\t150\t.\tA\tT\t.\tPASS\t.\n"
                                                "chr1\t150\t.\tA\tT\t.\tPASS\t.\n"   // duplicate
                                                "chr1\t300\t.\tA\tG\t.\tPASS\t.\n")};  // outside

    TmbProcessor processor(config);
    processor.load_region_sets();
    auto results = processor.process_all();

    ASSERT_EQ(results.size(), 1u);
    const auto& r = results[0];
    EXPECT_EQ(r.stem, "s1");
    EXPECT_EQ(r.num_variants, 2u);
    EXPECT_EQ(r.load_stats.duplicates, 1u);

    ASSERT_EQ(r.tallies.size(), 1u);
    EXPECT_EQ(r.tallies[0].region_set_name, "small");
    EXPECT_EQ(r.tallies[0].region_set_size, 100);
    EXPECT_EQ(r.tallies[0].mutation_class, MutationClass::SNV);

    ASSERT_EQ(r.rows.size(), 11u);
    for (const auto& row : r.rows) {
        if (row.variant_type == "SNV" || row.variant_type == "total") {
            EXPECT_EQ(row.observed_count, 1);
            EXPECT_DOUBLE_EQ(row.mutations_per_mb, 10000.0);
        } else {
            EXPECT_EQ(row.observed_count, 0);
            EXPECT_DOUBLE_EQ(row.mutations_per_mb, 0.0);
        }
    }
}

TEST_F(TmbProcessorTest, WritesTables) {
    config.bed_paths = {dir.write("small.bed", "chr1\t99\t199\n")};
    config.vcf_paths = {dir.write("s1.vcf", std::string(kVcfHeader) + "1\t150\t.\tA\tT\t.\tPASS\t.\n")};

    TmbProcessor processor(config);
    processor.load_region_sets();
    auto paths = processor.write_results(processor.process_all());

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(std::filesystem::path(paths[0]).filename().string(), "s1.tally.tsv");
    EXPECT_EQ(std::filesystem::path(paths[1]).filename().string(), "s1.tmb.tsv");

    EXPECT_EQ(Test::read_file(paths[0]), "small\t100\tSNV\tA\tT\t1\n");

    std::string tmb = Test::read_file(paths[1]);
    EXPECT_EQ(tmb.rfind("small\t100\tSNV\t1\t10000.000000\n", 0), 0u);
    EXPECT_NE(tmb.find("small\t100\ttotal\t1\t10000.000000\n"), std::string::npos);
    EXPECT_NE(tmb.find("small\t100\tinversion\t0\t0.000000\n"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(paths[1] + ".tmp"));
}

TEST_F(TmbProcessorTest, MultipleVcfsAndRegionSets) {
    config.bed_paths = {dir.write("a.bed", "chr1\t0\t1000000\n"), dir.write("b.bed", "chr2\t0\t1000\n")};
    config.vcf_paths = {
        dir.write("x.vcf", std::string(kVcfHeader) + "chr1\t10\t.\tA\tT\t.\tPASS\t.\n"
                                                     "chr1\t20\t.\tC\tG\t.\tPASS\t.\n"
                                                     "chr1\t30\t.\tG\tA\t.\tPASS\t.\n"),
        dir.write("y.vcf", std::string(kVcfHeader) + "chr2\t500\t.\tAT\tA\t.\tPASS\t.\n"),
    };

    TmbProcessor processor(config);
    processor.load_region_sets();
    ASSERT_EQ(processor.region_sets().size(), 2u);
    auto results = processor.process_all();
    ASSERT_EQ(results.size(), 2u);

    // Both region sets appear in every VCF's table
    EXPECT_EQ(results[0].rows.size(), 22u);
    EXPECT_EQ(results[1].rows.size(), 22u);

    for (const auto& row : results[0].rows) {
        if (row.region_set_name == "a" && row.variant_type == "total") {
            EXPECT_EQ(row.observed_count, 3);
            EXPECT_DOUBLE_EQ(row.mutations_per_mb, 3.0);
        }
        if (row.region_set_name == "b") {
            EXPECT_EQ(row.observed_count, 0);
        }
    }
    for (const auto& row : results[1].rows) {
        if (row.region_set_name == "b" && row.variant_type == "deletion") {
            EXPECT_EQ(row.observed_count, 1);
            EXPECT_DOUBLE_EQ(row.mutations_per_mb, 1000.0);
        }
    }
}

TEST_F(TmbProcessorTest, FailingVcfFailsTheRun) {
    config.bed_paths = {dir.write("small.bed", "chr1\t99\t199\n")};
    config.vcf_paths = {
        dir.write("good.vcf", std::string(kVcfHeader) + "1\t150\t.\tA\tT\t.\tPASS\t.\n"),
        dir.write("bad.vcf", std::string(kVcfHeader) + "1\tNaN\t.\tA\tT\t.\tPASS\t.\n"),
    };

    TmbProcessor processor(config);
    processor.load_region_sets();
    EXPECT_THROW(processor.process_all(), ParseError);
    EXPECT_FALSE(std::filesystem::exists(config.dest_dir));
}

TEST_F(TmbProcessorTest, DuplicateRegionSetNames) {
    std::filesystem::create_directories(dir.file("other"));
    config.bed_paths = {dir.write("panel.bed", "chr1\t0\t10\n"), dir.write("other/panel.bed", "chr1\t0\t20\n")};
    TmbProcessor processor(config);
    EXPECT_THROW(processor.load_region_sets(), ConfigError);
}

TEST_F(TmbProcessorTest, ZeroSizeRegionSet) {
    config.bed_paths = {dir.write("zero.bed", "chr1\t10\t10\n")};
    TmbProcessor processor(config);
    EXPECT_THROW(processor.load_region_sets(), ConfigError);
}

TEST_F(TmbProcessorTest, CollidingVcfStems) {
    std::filesystem::create_directories(dir.file("run2"));
    config.vcf_paths = {dir.write("s.vcf", kVcfHeader), dir.write("run2/s.vcf", kVcfHeader)};
    TmbProcessor processor(config);
    processor.set_region_sets({RegionSet("r", {{"chr1", 0, 10}})});
    EXPECT_THROW(processor.process_all(), ConfigError);
}

TEST_F(TmbProcessorTest, ProcessWithoutRegionSets) {
    config.vcf_paths = {dir.write("s.vcf", kVcfHeader)};
    TmbProcessor processor(config);
    EXPECT_THROW(processor.process_all(), ConfigError);
}

TEST_F(TmbProcessorTest, MissingBedtools) {
    config.bedtools_path = "/nonexistent/bin/bedtools";
    EXPECT_THROW(TmbProcessor processor(config), ConfigError);
}

TEST_F(TmbProcessorTest, FailedWriteLeavesNoTables) {
    config.bed_paths = {dir.write("small.bed", "chr1\t100\t200\n")};
    config.vcf_paths = {
        dir.write("s1.vcf", std::string(kVcfHeader) + "chr1\t150\t.\tA\tT\t.\tPASS\t.\n"),
        dir.write("s2.vcf", std::string(kVcfHeader) + "chr1\t160\t.\tC\tG\t.\tPASS\t.\n"),
    };
    // A directory in the way of the second VCF's staging file makes its write fail
    std::filesystem::create_directories(config.dest_dir + "/s2.tmb.tsv.tmp");

    TmbProcessor processor(config);
    processor.load_region_sets();
    auto results = processor.process_all();
    EXPECT_THROW(processor.write_results(results), std::runtime_error);

    EXPECT_FALSE(std::filesystem::exists(config.dest_dir + "/s1.tally.tsv"));
    EXPECT_FALSE(std::filesystem::exists(config.dest_dir + "/s1.tmb.tsv"));
    EXPECT_FALSE(std::filesystem::exists(config.dest_dir + "/s1.tally.tsv.tmp"));
    EXPECT_FALSE(std::filesystem::exists(config.dest_dir + "/s2.tally.tsv.tmp"));
}

TEST(TmbWriterTest, FilesAppearOnlyOnCommit) {
    Test::TempDir dir;
    std::vector<GenomicInterval> ivs = {{"chr1", 0, 10}};
    {
        TmbWriter writer(dir.file("out"));
        std::string path = writer.write_bed("a", ivs);
        EXPECT_FALSE(std::filesystem::exists(path));
        EXPECT_TRUE(std::filesystem::exists(path + ".tmp"));

        auto committed = writer.commit();
        ASSERT_EQ(committed.size(), 1u);
        EXPECT_EQ(committed[0], path);
        EXPECT_EQ(Test::read_file(path), "chr1\t0\t10\n");
        EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
    }
    {
        TmbWriter writer(dir.file("out"));
        writer.write_bed("b", ivs);
    }
    // Uncommitted staging files are removed
    EXPECT_FALSE(std::filesystem::exists(dir.file("out/b.bed")));
    EXPECT_FALSE(std::filesystem::exists(dir.file("out/b.bed.tmp")));
}

TEST(TmbWriterTest, Stems) {
    EXPECT_EQ(TmbWriter::vcf_stem("/x/s1.vcf.gz"), "s1");
    EXPECT_EQ(TmbWriter::vcf_stem("s1.vcf.bz2"), "s1");
    EXPECT_EQ(TmbWriter::vcf_stem("calls.vcf"), "calls");
    EXPECT_EQ(TmbWriter::fasta_stem("/ref/hg38.fa.gz"), "hg38");
    EXPECT_EQ(TmbWriter::fasta_stem("genome.fasta"), "genome");
}
