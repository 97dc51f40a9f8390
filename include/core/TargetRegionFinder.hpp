#pragma once

#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/RegionSet.hpp"

namespace Tmber {

/**
 * @brief Finds maximal runs of target letters in one sequence.
 *
 * @param chrom Name written to each interval (kept as given).
 * @param sequence Sequence to scan.
 * @param target_letters Letters that make up target regions (e.g. "ACGT").
 * @param case_sensitive If false, upper and lower case of each letter match.
 * @return 0-based half-open runs in increasing order.
 */
std::vector<GenomicInterval> find_target_runs(const std::string& chrom, const std::string& sequence,
                                              const std::string& target_letters, bool case_sensitive);

/**
 * @brief True for chr1..chr22 (with or without the "chr" prefix).
 */
bool is_human_autosome(const std::string& chrom);

/**
 * @brief Scans a FASTA for target-letter runs, one OpenMP task per sequence.
 *
 * Each worker thread opens its own FastaReader.
 */
class TargetRegionFinder {
public:
    explicit TargetRegionFinder(const Config& config);

    /**
     * @brief Scans all selected sequences.
     * @return Runs sorted by (chrom, start, end).
     * @throws ConfigError if the FASTA cannot be indexed.
     */
    std::vector<GenomicInterval> run() const;

    /**
     * @brief Runs the scan and writes <dest_dir>/<fasta stem>.bed.
     * @return Path of the written BED file.
     */
    std::string run_and_write() const;

private:
    std::string fasta_path_;
    std::string target_letters_;
    bool case_sensitive_;
    bool human_autosome_;
    std::string dest_dir_;
    int num_threads_;
};

} // namespace Tmber
