#include "core/VariantTable.hpp"

#include <algorithm>

#include "core/Types.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Tmber {

namespace {

// Fixed VCF columns
constexpr size_t kChromCol = 0;
constexpr size_t kPosCol = 1;
constexpr size_t kRefCol = 3;
constexpr size_t kAltCol = 4;
constexpr size_t kFilterCol = 6;
constexpr size_t kInfoCol = 7;
constexpr size_t kFormatCol = 8;
constexpr size_t kMinColumns = 8;

} // namespace

void VariantTable::add(VariantRecord record) {
    records_.push_back(std::move(record));
}

size_t VariantTable::deduplicate() {
    size_t before = records_.size();
    Tmber::deduplicate(records_);
    return before - records_.size();
}

const VcfLoadStats& VariantTable::load_from_vcf(const std::string& vcf_path, const VcfFilterOptions& filters,
                                                const LineReaderOptions& reader_options) {
    Utils::ScopedLogger scope("Load VCF " + vcf_path, LogLevel::LOG_DEBUG);

    if (filters.af_filter_enabled() && filters.sample_name.empty()) {
        throw ConfigError("An AF filter requires a sample column name");
    }

    LineReader reader(vcf_path, reader_options);
    std::string line;
    size_t line_no = 0;
    // Column index of the AF sample; only set once the header is seen
    std::optional<size_t> sample_col;

    while (reader.next(line)) {
        ++line_no;
        if (line.empty()) continue;

        if (line[0] == '#') {
            if (Utils::starts_with(line, "#CHROM") && !filters.sample_name.empty()) {
                auto header = Utils::split(line, '\t');
                auto it = std::find(header.begin() + std::min(header.size(), kFormatCol + 1), header.end(),
                                    filters.sample_name);
                if (it == header.end()) {
                    throw ConfigError("Sample column '" + filters.sample_name + "' not found in " + vcf_path);
                }
                sample_col = static_cast<size_t>(it - header.begin());
            }
            continue;
        }

        ++stats_.data_lines;
        auto fields = Utils::split(line, '\t');
        if (fields.size() < kMinColumns) {
            throw ParseError("Expected at least " + std::to_string(kMinColumns) + " VCF columns at " + vcf_path + ":" +
                             std::to_string(line_no));
        }

        if (filters.exclude_filtered && !is_pass_filter(fields[kFilterCol])) {
            ++stats_.filtered_out;
            continue;
        }

        if (filters.af_filter_enabled()) {
            if (!sample_col) {
                throw ConfigError("Sample column '" + filters.sample_name + "' not found in " + vcf_path);
            }
            std::optional<double> af;
            if (fields.size() > *sample_col) {
                af = extract_sample_af(fields[kFormatCol], fields[*sample_col]);
            }
            if (!af || (filters.min_af && *af < *filters.min_af) || (filters.max_af && *af > *filters.max_af)) {
                ++stats_.af_excluded;
                continue;
            }
        }

        auto pos = Utils::parse_int64(fields[kPosCol]);
        if (!pos) {
            throw ParseError("Non-integer POS '" + fields[kPosCol] + "' at " + vcf_path + ":" +
                             std::to_string(line_no));
        }

        VariantRecord rec =
            make_variant_record(fields[kChromCol], *pos, fields[kRefCol], fields[kAltCol], fields[kInfoCol]);
        if (!rec.has_span()) {
            ++stats_.unresolved_end;
            LOG_DEBUG("No usable END for symbolic allele at " + vcf_path + ":" + std::to_string(line_no));
        }
        add(std::move(rec));
    }
    reader.close();

    stats_.duplicates = deduplicate();

    LOG_INFO("Loaded " + std::to_string(records_.size()) + " variants from " + vcf_path + " (lines: " +
             std::to_string(stats_.data_lines) + ", filtered: " + std::to_string(stats_.filtered_out) +
             ", AF-excluded: " + std::to_string(stats_.af_excluded) +
             ", duplicates: " + std::to_string(stats_.duplicates) + ")");
    if (stats_.unresolved_end > 0) {
        LOG_WARNING(std::to_string(stats_.unresolved_end) + " symbolic variant(s) in " + vcf_path +
                    " have no usable END and will not match any region");
    }
    return stats_;
}

} // namespace Tmber
