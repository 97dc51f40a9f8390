#include "core/TargetRegionFinder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <memory>
#include <tuple>

#include "core/VariantRecord.hpp"
#include "io/TmbWriter.hpp"
#include "utils/FastaReader.hpp"
#include "utils/Logger.hpp"
#include "utils/ParallelDispatch.hpp"
#include "utils/StringUtils.hpp"

namespace Tmber {

std::vector<GenomicInterval> find_target_runs(const std::string& chrom, const std::string& sequence,
                                              const std::string& target_letters, bool case_sensitive) {
    std::array<bool, 256> is_target{};
    for (unsigned char c : target_letters) {
        is_target[c] = true;
        if (!case_sensitive) {
            is_target[std::toupper(c)] = true;
            is_target[std::tolower(c)] = true;
        }
    }

    std::vector<GenomicInterval> runs;
    const int64_t n = static_cast<int64_t>(sequence.size());
    int64_t i = 0;
    while (i < n) {
        if (!is_target[static_cast<unsigned char>(sequence[i])]) {
            ++i;
            continue;
        }
        int64_t start = i;
        while (i < n && is_target[static_cast<unsigned char>(sequence[i])]) {
            ++i;
        }
        runs.push_back({chrom, start, i});
    }
    return runs;
}

bool is_human_autosome(const std::string& chrom) {
    const std::string normalized = normalize_chrom(chrom);
    auto num = Utils::parse_int64(normalized.substr(3));
    return num && *num >= 1 && *num <= 22 && normalized.substr(3) == std::to_string(*num);
}

TargetRegionFinder::TargetRegionFinder(const Config& config)
    : fasta_path_(config.fasta_path),
      target_letters_(config.target_letters),
      case_sensitive_(config.case_sensitive),
      human_autosome_(config.human_autosome),
      dest_dir_(config.dest_dir),
      num_threads_(config.effective_threads()) {
}

std::vector<GenomicInterval> TargetRegionFinder::run() const {
    Utils::ScopedLogger scope("Identify target regions in " + fasta_path_);

    std::vector<std::string> names;
    for (const auto& name : FastaReader(fasta_path_).sequence_names()) {
        if (!human_autosome_ || is_human_autosome(name)) {
            names.push_back(name);
        }
    }

    const int num_seqs = static_cast<int>(names.size());
    std::vector<std::vector<GenomicInterval>> per_seq(num_seqs);
    std::vector<std::exception_ptr> errors(num_seqs);

#pragma omp parallel num_threads(num_threads_)
    {
        // One faidx handle per thread
        std::unique_ptr<FastaReader> reader;
        std::exception_ptr open_error;
        try {
            reader = std::make_unique<FastaReader>(fasta_path_);
        } catch (...) {
            open_error = std::current_exception();
        }

#pragma omp for schedule(dynamic)
        for (int i = 0; i < num_seqs; ++i) {
            if (open_error) {
                errors[i] = open_error;
                continue;
            }
            try {
                per_seq[i] = find_target_runs(names[i], reader->fetch_sequence(names[i]), target_letters_,
                                              case_sensitive_);
                if (per_seq[i].empty()) {
                    LOG_INFO("No region to extract: " + names[i]);
                } else {
                    LOG_INFO("Identify regions to extract: " + names[i]);
                }
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    }
    Utils::rethrow_first_error(errors);

    std::vector<GenomicInterval> all;
    for (auto& runs : per_seq) {
        all.insert(all.end(), runs.begin(), runs.end());
    }
    std::sort(all.begin(), all.end(), [](const GenomicInterval& a, const GenomicInterval& b) {
        return std::tie(a.chrom, a.start, a.end) < std::tie(b.chrom, b.start, b.end);
    });
    return all;
}

std::string TargetRegionFinder::run_and_write() const {
    auto intervals = run();
    LOG_INFO("Found " + std::to_string(intervals.size()) + " target region(s)");
    TmbWriter writer(dest_dir_);
    std::string path = writer.write_bed(TmbWriter::fasta_stem(fasta_path_), intervals);
    writer.commit();
    return path;
}

} // namespace Tmber
