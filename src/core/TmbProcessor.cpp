#include "core/TmbProcessor.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>

#include "io/BedReader.hpp"
#include "io/TmbWriter.hpp"
#include "utils/Logger.hpp"
#include "utils/ParallelDispatch.hpp"
#include "utils/Subprocess.hpp"

namespace Tmber {

TmbProcessor::TmbProcessor(const Config& config) : config_(config), num_threads_(config.effective_threads()) {
    if (config_.bedtools_path == "auto") {
        bedtools_path_ = Utils::fetch_executable("bedtools");
    } else if (!config_.bedtools_path.empty()) {
        bedtools_path_ = Utils::fetch_executable(config_.bedtools_path);
    }

    std::stringstream ss;
    ss << "TmbProcessor initialized:\n"
       << "  Threads: " << num_threads_ << "\n"
       << "  Region sets: " << config_.bed_paths.size() << "\n"
       << "  VCFs: " << config_.vcf_paths.size() << "\n"
       << "  FILTER: " << (config_.include_filtered ? "all records" : "PASS or . only");
    if (config_.af_filter_enabled()) {
        ss << "\n  AF window (" << config_.sample_name << "): [" << (config_.min_af ? *config_.min_af : 0.0) << ", "
           << (config_.max_af ? *config_.max_af : 1.0) << "]";
    }
    if (!bedtools_path_.empty()) {
        ss << "\n  Region merge: " << bedtools_path_ << " merge";
    }
    LOG_INFO(ss.str());
}

VcfFilterOptions TmbProcessor::filter_options() const {
    VcfFilterOptions opts;
    opts.exclude_filtered = !config_.include_filtered;
    opts.sample_name = config_.sample_name;
    opts.min_af = config_.min_af;
    opts.max_af = config_.max_af;
    return opts;
}

void TmbProcessor::check_unique_region_set_names() const {
    std::set<std::string> seen;
    for (const auto& rs : region_sets_) {
        if (!seen.insert(rs.name()).second) {
            throw ConfigError("Duplicate region set name: " + rs.name());
        }
    }
}

void TmbProcessor::load_region_sets() {
    Utils::ScopedLogger scope("Load region sets");
    const auto& paths = config_.bed_paths;
    std::vector<std::optional<RegionSet>> loaded(paths.size());

    const int num_beds = static_cast<int>(paths.size());
    const LineReaderOptions reader_options{Utils::threads_per_task(num_threads_, num_beds)};
    Utils::parallel_for_each(num_beds, num_threads_, [&](int i) {
        loaded[i].emplace(load_region_set(paths[i], bedtools_path_, reader_options));
    });

    region_sets_.clear();
    for (auto& rs : loaded) {
        region_sets_.push_back(std::move(*rs));
    }
    check_unique_region_set_names();
}

void TmbProcessor::set_region_sets(std::vector<RegionSet> region_sets) {
    region_sets_ = std::move(region_sets);
    check_unique_region_set_names();
}

std::vector<VcfTmbResult> TmbProcessor::process_all() {
    if (region_sets_.empty()) {
        throw ConfigError("No region sets loaded");
    }

    const auto& paths = config_.vcf_paths;
    const int num_vcfs = static_cast<int>(paths.size());
    const int num_sets = static_cast<int>(region_sets_.size());

    std::vector<VcfTmbResult> results(num_vcfs);
    std::set<std::string> stems;
    for (int i = 0; i < num_vcfs; ++i) {
        results[i].vcf_path = paths[i];
        results[i].stem = TmbWriter::vcf_stem(paths[i]);
        if (!stems.insert(results[i].stem).second) {
            throw ConfigError("Two VCF inputs share the output name " + results[i].stem + ": " + paths[i]);
        }
    }

    auto t_start = std::chrono::steady_clock::now();

    // Fan-out 1: one task per VCF
    std::vector<VariantTable> tables(num_vcfs);
    const VcfFilterOptions filters = filter_options();
    const LineReaderOptions reader_options{Utils::threads_per_task(num_threads_, num_vcfs)};
    Utils::parallel_for_each(num_vcfs, num_threads_, [&](int i) {
        results[i].load_stats = tables[i].load_from_vcf(paths[i], filters, reader_options);
        results[i].num_variants = tables[i].size();
    });

    // Fan-out 2: one task per (VCF, region set); each writes its own slot
    const int num_tasks = num_vcfs * num_sets;
    std::vector<std::vector<TallyResult>> task_tallies(num_tasks);
    Utils::parallel_for_each(num_tasks, num_threads_, [&](int task) {
        const int vcf_idx = task / num_sets;
        const int set_idx = task % num_sets;
        task_tallies[task] = tally_variants(tables[vcf_idx].all(), region_sets_[set_idx]);
        LOG_DEBUG("Tallied " + paths[vcf_idx] + " on " + region_sets_[set_idx].name() + ": " +
                  std::to_string(task_tallies[task].size()) + " allele pair(s)");
    });

    // Fan-in
    std::vector<std::pair<std::string, int64_t>> set_keys;
    for (const auto& rs : region_sets_) {
        set_keys.emplace_back(rs.name(), rs.size());
    }
    for (int vcf_idx = 0; vcf_idx < num_vcfs; ++vcf_idx) {
        auto& tallies = results[vcf_idx].tallies;
        for (int set_idx = 0; set_idx < num_sets; ++set_idx) {
            auto& part = task_tallies[vcf_idx * num_sets + set_idx];
            tallies.insert(tallies.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
        }
        std::sort(tallies.begin(), tallies.end(), tally_result_less);
        results[vcf_idx].rows = aggregate_tmb(tallies, set_keys);
    }

    double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t_start).count();
    LOG_INFO("Processed " + std::to_string(num_tasks) + " tally task(s) in " + std::to_string(elapsed) + " ms");

    return results;
}

std::vector<std::string> TmbProcessor::write_results(const std::vector<VcfTmbResult>& results) const {
    TmbWriter writer(config_.dest_dir);
    for (const auto& r : results) {
        writer.write_tally(r.stem, r.tallies);
        writer.write_tmb(r.stem, r.rows);
    }
    // Nothing becomes visible unless every table was staged
    return writer.commit();
}

void TmbProcessor::print_summary(const std::vector<VcfTmbResult>& results) const {
    std::stringstream ss;
    ss << "\n=== TMB Summary ===\n";
    for (const auto& r : results) {
        ss << r.vcf_path << ": " << r.num_variants << " variants\n";
        for (const auto& row : r.rows) {
            if (row.variant_type == kTotalLabel) {
                ss << "  " << row.region_set_name << " (" << row.region_set_size << " bp): " << row.observed_count
                   << " mutations, " << std::fixed << std::setprecision(3) << row.mutations_per_mb << " /Mb\n";
            }
        }
    }
    LOG_INFO(ss.str());
}

}  // namespace Tmber
