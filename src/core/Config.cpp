#include "core/Config.hpp"

#include <filesystem>
#include <sstream>

#include <htslib/faidx.h>
#include <htslib/hts.h>

#include "io/LineReader.hpp"
#include "utils/Logger.hpp"
#include "utils/ParallelDispatch.hpp"

namespace Tmber {

namespace {

bool check_text_input(const std::string& path, const std::string& label) {
    if (!std::filesystem::exists(path)) {
        LOG_ERROR("Cannot find " + label + " file: " + path);
        return false;
    }
    // bzip2 inputs go through an external decompressor; htslib cannot detect them
    if (LineReader::is_bzip2(path)) {
        return true;
    }
    htsFile* fp = hts_open(path.c_str(), "r");
    if (fp == NULL) {
        LOG_ERROR("Cannot open " + label + " file: " + path);
        return false;
    }
    hts_close(fp);
    return true;
}

} // namespace

bool Config::validate() const {
    bool valid = true;

    if (threads < 0) {
        LOG_ERROR("Number of threads must not be negative.");
        valid = false;
    }

    if (command == Command::TMB) {
        if (bed_paths.empty()) {
            LOG_ERROR("At least one BED file is required.");
            valid = false;
        }
        if (vcf_paths.empty()) {
            LOG_ERROR("At least one VCF file is required.");
            valid = false;
        }
        for (const auto& p : bed_paths) {
            valid = check_text_input(p, "BED") && valid;
        }
        for (const auto& p : vcf_paths) {
            valid = check_text_input(p, "VCF") && valid;
        }

        if (af_filter_enabled() && sample_name.empty()) {
            LOG_ERROR("An AF filter (--min-af/--max-af) requires --sample.");
            valid = false;
        }
        if ((min_af && (*min_af < 0.0 || *min_af > 1.0)) || (max_af && (*max_af < 0.0 || *max_af > 1.0))) {
            LOG_ERROR("AF bounds must be between 0.0 and 1.0.");
            valid = false;
        }
        if (min_af && max_af && *min_af > *max_af) {
            LOG_ERROR("--min-af must not be greater than --max-af.");
            valid = false;
        }
    } else if (command == Command::BED) {
        if (fasta_path.empty()) {
            LOG_ERROR("FASTA path is required.");
            valid = false;
        } else {
            // Verify FASTA index (.fai is built when missing)
            faidx_t* fai = fai_load(fasta_path.c_str());
            if (fai == NULL) {
                LOG_ERROR("Cannot load FASTA (or build its .fai index): " + fasta_path);
                valid = false;
            } else {
                fai_destroy(fai);
            }
        }
        if (target_letters.empty()) {
            LOG_ERROR("Target letters must not be empty.");
            valid = false;
        }
    } else {
        LOG_ERROR("No command given.");
        valid = false;
    }

    return valid;
}

void Config::print() const {
    std::ostringstream ss;
    ss << "--- Configuration ---\n";
    ss << "n_cpu: " << effective_threads() << "\n";
    ss << "dest_dir: " << dest_dir << "\n";
    if (command == Command::TMB) {
        ss << "bed:\n";
        for (const auto& p : bed_paths) ss << "  - " << p << "\n";
        ss << "vcf:\n";
        for (const auto& p : vcf_paths) ss << "  - " << p << "\n";
        ss << "include_filtered: " << (include_filtered ? "true" : "false") << "\n";
        if (!sample_name.empty()) ss << "sample: " << sample_name << "\n";
        if (min_af) ss << "min_af: " << *min_af << "\n";
        if (max_af) ss << "max_af: " << *max_af << "\n";
        ss << "region_merge: " << (bedtools_path.empty() ? "in-process" : bedtools_path) << "\n";
    } else if (command == Command::BED) {
        ss << "fa: " << fasta_path << "\n";
        ss << "target_letters: " << target_letters << (case_sensitive ? " (case-sensitive)" : "") << "\n";
        ss << "human_autosome: " << (human_autosome ? "true" : "false") << "\n";
    }
    ss << "---------------------";
    LOG_INFO(ss.str());
}

int Config::effective_threads() const {
    return Utils::resolve_threads(threads);
}

} // namespace Tmber
