#include "io/BedReader.hpp"

#include "core/Types.hpp"
#include "core/VariantRecord.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/Subprocess.hpp"

namespace Tmber {

std::optional<GenomicInterval> parse_bed_line(const std::string& line, const std::string& source, size_t line_no) {
    if (line.empty() || line[0] == '#' || Utils::starts_with(line, "browser") || Utils::starts_with(line, "track")) {
        return std::nullopt;
    }

    auto fields = Utils::split(line, '\t');
    const std::string where = source + ":" + std::to_string(line_no);
    if (fields.size() < 3) {
        throw ParseError("Expected at least 3 BED columns at " + where);
    }

    auto start = Utils::parse_int64(fields[1]);
    auto end = Utils::parse_int64(fields[2]);
    if (!start || !end) {
        throw ParseError("Non-integer BED coordinates at " + where);
    }
    if (*start < 0 || *end < *start) {
        throw ParseError("Invalid BED interval [" + fields[1] + ", " + fields[2] + ") at " + where);
    }

    return GenomicInterval{normalize_chrom(fields[0]), *start, *end};
}

std::vector<GenomicInterval> read_bed_intervals(const std::string& path, const LineReaderOptions& options) {
    LineReader reader(path, options);
    std::vector<GenomicInterval> intervals;
    std::string line;
    size_t line_no = 0;
    while (reader.next(line)) {
        ++line_no;
        if (auto iv = parse_bed_line(line, path, line_no)) {
            intervals.push_back(std::move(*iv));
        }
    }
    reader.close();
    return intervals;
}

RegionSet load_region_set(const std::string& path, const std::string& bedtools_path,
                          const LineReaderOptions& options) {
    const std::string name = region_set_name_from_path(path);
    std::vector<GenomicInterval> intervals;

    if (bedtools_path.empty()) {
        intervals = read_bed_intervals(path, options);
    } else {
        Utils::PipeReader pipe({bedtools_path, "merge", "-i", path});
        std::string line;
        size_t line_no = 0;
        while (pipe.getline(line)) {
            ++line_no;
            if (auto iv = parse_bed_line(line, "bedtools merge " + path, line_no)) {
                intervals.push_back(std::move(*iv));
            }
        }
        pipe.close();
    }

    RegionSet region_set(name, std::move(intervals));
    LOG_INFO("Region set " + region_set.name() + ": " + std::to_string(region_set.num_intervals()) +
             " merged intervals, " + std::to_string(region_set.size()) + " bp");
    return region_set;
}

} // namespace Tmber
