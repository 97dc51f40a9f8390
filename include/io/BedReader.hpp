#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/RegionSet.hpp"
#include "io/LineReader.hpp"

namespace Tmber {

/**
 * @brief Parses one BED data line into an interval with a normalized chrom.
 *
 * Only the first three columns are used. Blank, "#", "browser" and "track"
 * lines yield nullopt.
 *
 * @throws ParseError on fewer than 3 columns, non-integer coordinates,
 *         a negative start or end < start.
 */
std::optional<GenomicInterval> parse_bed_line(const std::string& line, const std::string& source, size_t line_no);

/**
 * @brief Reads every interval of a (possibly compressed) BED file.
 */
std::vector<GenomicInterval> read_bed_intervals(const std::string& path, const LineReaderOptions& options = {});

/**
 * @brief Reads and merges a BED file into a named RegionSet.
 *
 * With an empty @p bedtools_path the intervals are merged in-process.
 * Otherwise `bedtools merge -i <path>` produces the merged intervals (the
 * input must then be sorted, as bedtools requires); its output is normalized
 * and merged again in-process, which is a no-op on already merged input.
 *
 * @throws ConfigError for an empty or zero-size region set.
 * @throws SubprocessError if bedtools fails.
 */
RegionSet load_region_set(const std::string& path, const std::string& bedtools_path = "",
                          const LineReaderOptions& options = {});

} // namespace Tmber
