#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

namespace Tmber {

/**
 * @brief Subcommand selected on the command line.
 */
enum class Command {
    NONE,
    TMB,  ///< Count variants in region sets and compute mutations per Mb
    BED   ///< Derive a target-region BED from a FASTA
};

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Populated by Utils::ArgParser (CLI11 handles basic checks such as file
 * existence and numeric ranges) and checked by validate() for cross-field
 * logic and input file formats.
 */
struct Config {
    Command command = Command::NONE;

    // Common
    std::string dest_dir = ".";                  ///< Output directory
    int threads = 0;                             ///< Worker threads (0 = all cores)
    LogLevel log_level = LogLevel::LOG_WARN;     ///< Logging verbosity level
    std::string log_file;                        ///< Optional log file (appended)

    // tmber tmb
    std::vector<std::string> bed_paths;          ///< Region set BED files (Required)
    std::vector<std::string> vcf_paths;          ///< Variant call files (Required)
    bool include_filtered = false;               ///< Keep records whose FILTER is not PASS/"."
    std::string sample_name;                     ///< Sample column used for FORMAT/AF
    std::optional<double> min_af;                ///< Inclusive lower AF bound
    std::optional<double> max_af;                ///< Inclusive upper AF bound
    std::string bedtools_path;                   ///< "", an executable path, or "auto" (search PATH)

    // tmber bed
    std::string fasta_path;                      ///< Genome FASTA (Required)
    std::string target_letters = "ACGT";         ///< Nucleic acid codes forming target regions
    bool case_sensitive = false;                 ///< Match target letters with their exact case
    bool human_autosome = false;                 ///< Restrict to chr1-chr22

    /**
     * @brief Validates configuration logic and input files.
     *
     * Checks that CLI11 cannot handle, such as:
     * - Logical relationships (AF window order, AF filter needs a sample)
     * - Opening VCF inputs with htslib and the FASTA index with faidx
     *
     * Problems are logged; nothing is thrown.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Logs the current configuration at INFO level.
     */
    void print() const;

    /**
     * @brief Worker thread count with 0 resolved to the available cores.
     */
    int effective_threads() const;

    bool af_filter_enabled() const {
        return min_af.has_value() || max_af.has_value();
    }

    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace Tmber
