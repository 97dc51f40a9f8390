#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/RegionSet.hpp"
#include "core/TallyEngine.hpp"
#include "core/TmbAggregator.hpp"

namespace Tmber {

/**
 * @brief Writes tmber result tables into an output directory.
 *
 * Output layout:
 * ```
 * dest_dir/
 *   <vcf stem>.tally.tsv   # bed_name bed_size variant_type ref alt observed_count
 *   <vcf stem>.tmb.tsv     # bed_name bed_size variant_type observed_count mutations_per_mb
 *   <fasta stem>.bed       # chrom start end (tmber bed)
 * ```
 * Tables are tab-separated without a header. write_*() only stages a
 * temporary sibling ("<name>.tmp"); commit() renames every staged file into
 * place once all of them were written. Staged files that were never committed
 * are removed by the destructor, so a failed run leaves no tables behind.
 */
class TmbWriter {
public:
    /**
     * @brief Creates the output directory if needed.
     */
    explicit TmbWriter(const std::string& output_dir);

    /**
     * @brief Removes staged files that were not committed.
     */
    ~TmbWriter();

    TmbWriter(const TmbWriter&) = delete;
    TmbWriter& operator=(const TmbWriter&) = delete;

    /**
     * @brief Writes the raw per-(class, ref, alt) tally.
     * @return Final path the file gets on commit().
     */
    std::string write_tally(const std::string& stem, const std::vector<TallyResult>& tallies);

    /**
     * @brief Writes the final TMB table.
     * @return Final path the file gets on commit().
     */
    std::string write_tmb(const std::string& stem, const std::vector<TmbRow>& rows);

    /**
     * @brief Writes BED3 intervals.
     * @return Final path the file gets on commit().
     */
    std::string write_bed(const std::string& stem, const std::vector<GenomicInterval>& intervals);

    /**
     * @brief Renames every staged file to its final path.
     * @return Final paths, in staging order.
     */
    std::vector<std::string> commit();

    /**
     * @brief Output stem for a VCF path ("/x/s1.vcf.gz" -> "s1").
     */
    static std::string vcf_stem(const std::string& vcf_path);

    /**
     * @brief Output stem for a FASTA path ("/x/hg38.fa.gz" -> "hg38").
     */
    static std::string fasta_stem(const std::string& fasta_path);

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string output_dir_;
    std::vector<std::pair<std::string, std::string>> staged_;  ///< (tmp path, final path)

    template <typename WriteFn>
    std::string stage(const std::string& file_name, WriteFn&& write_rows);
};

}  // namespace Tmber
