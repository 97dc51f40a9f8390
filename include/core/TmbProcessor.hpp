#pragma once

#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/RegionSet.hpp"
#include "core/TallyEngine.hpp"
#include "core/TmbAggregator.hpp"
#include "core/VariantTable.hpp"

namespace Tmber {

/**
 * @brief TMB result of one input VCF across all region sets.
 */
struct VcfTmbResult {
    std::string vcf_path;
    std::string stem;                  ///< Output file stem derived from the VCF name
    VcfLoadStats load_stats;
    size_t num_variants = 0;           ///< Variants after filtering and deduplication
    std::vector<TallyResult> tallies;  ///< Raw tally, sorted
    std::vector<TmbRow> rows;          ///< Final TMB table, sorted and zero-filled
};

/**
 * @brief Runs the TMB pipeline with OpenMP fan-out/fan-in.
 *
 * 1. Loads and merges every BED into a RegionSet (one task per BED).
 * 2. Loads and deduplicates every VCF (one task per VCF).
 * 3. Tallies each (VCF, region set) pair as an independent task against the
 *    shared, read-only variant table.
 * 4. After all tasks joined, aggregates each VCF's tallies into its TMB table.
 *
 * A task failure is rethrown at the join, so the run either yields every
 * result or throws; nothing is written by this class until write_results().
 */
class TmbProcessor {
public:
    /**
     * @brief Resolves the external bedtools path if one is configured.
     * @throws ConfigError if the configured bedtools cannot be found.
     */
    explicit TmbProcessor(const Config& config);

    /**
     * @brief Loads config.bed_paths into region sets.
     * @throws ConfigError for empty/zero-size sets or duplicate set names.
     */
    void load_region_sets();

    /**
     * @brief Uses already built region sets instead of reading BED files.
     * @throws ConfigError for duplicate set names.
     */
    void set_region_sets(std::vector<RegionSet> region_sets);

    const std::vector<RegionSet>& region_sets() const {
        return region_sets_;
    }

    /**
     * @brief Loads every configured VCF and computes its TMB table.
     * @return One result per VCF, in input order.
     */
    std::vector<VcfTmbResult> process_all();

    /**
     * @brief Writes <stem>.tally.tsv and <stem>.tmb.tsv for every result.
     *
     * All tables are staged first and renamed into place together; if any
     * table fails to write, none of them appear.
     *
     * @return Paths of the written files.
     */
    std::vector<std::string> write_results(const std::vector<VcfTmbResult>& results) const;

    /**
     * @brief Logs a per-VCF summary (variants, totals per region set).
     */
    void print_summary(const std::vector<VcfTmbResult>& results) const;

private:
    Config config_;
    std::string bedtools_path_;
    int num_threads_;
    std::vector<RegionSet> region_sets_;

    VcfFilterOptions filter_options() const;
    void check_unique_region_set_names() const;
};

}  // namespace Tmber
