#pragma once

#include <CLI/CLI.hpp>

#include <string>

#include "core/Config.hpp"
#include "utils/Logger.hpp"

#ifndef TMBER_VERSION
#define TMBER_VERSION "0.0.0"
#endif

namespace Tmber {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 *
 *   tmber bed [options] <fa_path>
 *   tmber tmb [options] -b <bed_path>... <vcf_path>...
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @param exit_code If not null, receives the exit status when parsing stops (0 for help/version).
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help/version was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config, int* exit_code = nullptr) {
        CLI::App app{"tmber - Tumor Mutational Burden Analyzer"};
        app.set_version_flag("--version", std::string(TMBER_VERSION));
        app.require_subcommand(1);

        std::string log_level_str = "warn";

        // Options shared by both subcommands
        auto add_common = [&](CLI::App* sub) {
            sub->add_option("-j,--cpus", config.threads, "Limit CPU cores to use (Default: all)")
                ->check(CLI::NonNegativeNumber);
            sub->add_option("-o,--dest-dir", config.dest_dir, "Output directory (Default: .)");
            sub->add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: warn)")
                ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));
            sub->add_option("--log-file", config.log_file, "Append log messages to a file");
        };

        // tmber bed
        CLI::App* bed = app.add_subcommand("bed", "Identify regions consisting of target letters in FASTA");
        add_common(bed);
        bed->add_option("fa_path", config.fasta_path, "Path to a genome FASTA file")
            ->required()
            ->check(CLI::ExistingFile);
        bed->add_flag("--human-autosome", config.human_autosome, "Extract only human autosomes (chr1-22)");
        bed->add_option("--target-letters", config.target_letters,
            "Nucleic acid codes to include (Default: ACGT)");
        bed->add_flag("--case-sensitive", config.case_sensitive,
            "Match target letters with their exact case (Default: ignore case)");

        // tmber tmb
        CLI::App* tmb = app.add_subcommand("tmb", "Calculate variant counts and TMB on BED regions");
        add_common(tmb);
        // One path per -b so that trailing positionals stay VCFs: -b a.bed -b b.bed x.vcf y.vcf
        tmb->add_option("-b,--bed", config.bed_paths, "Path to a BED file for TMB (repeatable)")
            ->required()
            ->expected(1)
            ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll)
            ->check(CLI::ExistingFile);
        tmb->add_option("vcf_path", config.vcf_paths, "Path to a VCF file")
            ->required()
            ->check(CLI::ExistingFile);
        tmb->add_flag("--include-filtered", config.include_filtered,
            "Include filtered variants (Default: only PASS or .)");
        tmb->add_option("--sample", config.sample_name, "Sample column used for FORMAT/AF filtering");
        double min_af = 0.0;
        double max_af = 1.0;
        CLI::Option* min_af_opt = tmb->add_option("--min-af", min_af, "Minimum allele frequency (inclusive)")
            ->check(CLI::Range(0.0, 1.0));
        CLI::Option* max_af_opt = tmb->add_option("--max-af", max_af, "Maximum allele frequency (inclusive)")
            ->check(CLI::Range(0.0, 1.0));
        tmb->add_option("--bedtools", config.bedtools_path,
            "Merge regions with `bedtools merge` (path, or 'auto' to search PATH)");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help/version (ret=0) or error (ret>0): message printed, stop here
            int ret = app.exit(e);
            if (exit_code) {
                *exit_code = ret;
            }
            return false;
        }

        if (bed->parsed()) {
            config.command = Command::BED;
        } else if (tmb->parsed()) {
            config.command = Command::TMB;
        }

        if (min_af_opt->count() > 0) {
            config.min_af = min_af;
        }
        if (max_af_opt->count() > 0) {
            config.max_af = max_af;
        }

        if (auto level = Logger::parse_log_level(log_level_str)) {
            config.log_level = *level;
        }

        return true;
    }
};

} // namespace Utils
} // namespace Tmber
