#include "io/TmbWriter.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Tmber {

namespace {

std::string strip_extensions(const std::string& path, const std::vector<std::string>& exts) {
    std::string name = std::filesystem::path(path).filename().string();
    for (const char* comp : {".gz", ".bgz", ".bz2"}) {
        if (Utils::ends_with(name, comp)) {
            name.erase(name.size() - std::string(comp).size());
            break;
        }
    }
    for (const auto& ext : exts) {
        if (Utils::ends_with(name, ext)) {
            name.erase(name.size() - ext.size());
            break;
        }
    }
    return name;
}

} // namespace

TmbWriter::TmbWriter(const std::string& output_dir) : output_dir_(output_dir) {
    std::filesystem::create_directories(output_dir_);
}

std::string TmbWriter::vcf_stem(const std::string& vcf_path) {
    return strip_extensions(vcf_path, {".vcf"});
}

std::string TmbWriter::fasta_stem(const std::string& fasta_path) {
    return strip_extensions(fasta_path, {".fasta", ".fa", ".fna"});
}

TmbWriter::~TmbWriter() {
    for (const auto& [tmp_path, final_path] : staged_) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
    }
}

template <typename WriteFn>
std::string TmbWriter::stage(const std::string& file_name, WriteFn&& write_rows) {
    const std::filesystem::path final_path = std::filesystem::path(output_dir_) / file_name;
    const std::string tmp_path = final_path.string() + ".tmp";

    // Registered before writing so that a failed write is cleaned up too
    staged_.emplace_back(tmp_path, final_path.string());
    std::ofstream ofs(tmp_path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + tmp_path);
    }
    write_rows(ofs);
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed to write: " + tmp_path);
    }
    return final_path.string();
}

std::vector<std::string> TmbWriter::commit() {
    std::vector<std::string> committed;
    committed.reserve(staged_.size());
    for (const auto& [tmp_path, final_path] : staged_) {
        std::filesystem::rename(tmp_path, final_path);
        LOG_INFO("Write a file: " + final_path);
        committed.push_back(final_path);
    }
    staged_.clear();
    return committed;
}

std::string TmbWriter::write_tally(const std::string& stem, const std::vector<TallyResult>& tallies) {
    return stage(stem + ".tally.tsv", [&](std::ofstream& ofs) {
        for (const auto& t : tallies) {
            ofs << t.region_set_name << "\t" << t.region_set_size << "\t"
                << mutation_class_to_string(t.mutation_class) << "\t" << t.ref << "\t" << t.alt << "\t"
                << t.observed_count << "\n";
        }
    });
}

std::string TmbWriter::write_tmb(const std::string& stem, const std::vector<TmbRow>& rows) {
    return stage(stem + ".tmb.tsv", [&](std::ofstream& ofs) {
        ofs << std::fixed << std::setprecision(6);
        for (const auto& r : rows) {
            ofs << r.region_set_name << "\t" << r.region_set_size << "\t" << r.variant_type << "\t"
                << r.observed_count << "\t" << r.mutations_per_mb << "\n";
        }
    });
}

std::string TmbWriter::write_bed(const std::string& stem, const std::vector<GenomicInterval>& intervals) {
    return stage(stem + ".bed", [&](std::ofstream& ofs) {
        for (const auto& iv : intervals) {
            ofs << iv.chrom << "\t" << iv.start << "\t" << iv.end << "\n";
        }
    });
}

}  // namespace Tmber
