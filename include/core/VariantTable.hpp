#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/VariantRecord.hpp"
#include "io/LineReader.hpp"

namespace Tmber {

/**
 * @brief Record-level filters applied while loading a VCF.
 */
struct VcfFilterOptions {
    bool exclude_filtered = true;  ///< Keep only FILTER == PASS or "."
    std::string sample_name;       ///< Sample column holding FORMAT/AF
    std::optional<double> min_af;  ///< Inclusive lower AF bound
    std::optional<double> max_af;  ///< Inclusive upper AF bound

    bool af_filter_enabled() const { return min_af.has_value() || max_af.has_value(); }
};

/**
 * @brief Counters collected while loading a VCF.
 */
struct VcfLoadStats {
    size_t data_lines = 0;      ///< Non-header lines read
    size_t filtered_out = 0;    ///< Dropped by FILTER
    size_t af_excluded = 0;     ///< Dropped by the AF window (incl. missing AF)
    size_t unresolved_end = 0;  ///< Symbolic alleles without a usable END
    size_t duplicates = 0;      ///< Exact duplicates collapsed
};

/**
 * @brief Deduplicated variant records of one VCF file.
 */
class VariantTable {
public:
    /**
     * @brief Adds one record; call deduplicate() before querying.
     */
    void add(VariantRecord record);

    /**
     * @brief Sorts records and collapses exact duplicates.
     * @return Number of records removed.
     */
    size_t deduplicate();

    size_t size() const { return records_.size(); }

    const std::vector<VariantRecord>& all() const { return records_; }

    /**
     * @brief Loads and deduplicates the variants of a VCF file.
     *
     * The "#CHROM" header line names the sample columns. Data lines need at
     * least the 8 fixed VCF columns.
     *
     * @throws ConfigError if an AF window is requested without a sample name,
     *         or the sample column is absent from the header.
     * @throws ParseError on a line with too few columns or a bad POS.
     */
    const VcfLoadStats& load_from_vcf(const std::string& vcf_path, const VcfFilterOptions& filters,
                                      const LineReaderOptions& reader_options = {});

    const VcfLoadStats& stats() const { return stats_; }

private:
    std::vector<VariantRecord> records_;
    VcfLoadStats stats_;
};

} // namespace Tmber
