#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace Tmber {

/**
 * @brief One variant call with a normalized chromosome and a derived span.
 *
 * The span is 1-based and closed: [pos_start, pos_end]. For sequence alleles
 * pos_end = pos_start + len(ref) - 1; for symbolic alleles (<DEL>, <DUP:TANDEM>,
 * ...) pos_end is the VCF INFO END value, which uses the same convention.
 * An unresolvable END leaves pos_end empty and the record never matches a
 * region.
 */
struct VariantRecord {
    std::string chrom;               ///< Always "chr"-prefixed
    int64_t pos_start = 0;           ///< 1-based position as read
    std::optional<int64_t> pos_end;  ///< 1-based inclusive end, if resolvable
    std::string ref;                 ///< Reference allele
    std::string alt;                 ///< Alternate allele(s), comma-delimited

    bool has_span() const { return pos_end.has_value(); }

    bool operator==(const VariantRecord& o) const {
        return std::tie(chrom, pos_start, pos_end, ref, alt) == std::tie(o.chrom, o.pos_start, o.pos_end, o.ref, o.alt);
    }
    bool operator<(const VariantRecord& o) const {
        return std::tie(chrom, pos_start, pos_end, ref, alt) < std::tie(o.chrom, o.pos_start, o.pos_end, o.ref, o.alt);
    }
};

/**
 * @brief Strips any leading "chr" (case-insensitive) and prepends "chr" once.
 *
 * "1" -> "chr1", "CHR1" -> "chr1", "chrX" -> "chrX".
 */
std::string normalize_chrom(const std::string& chrom);

/**
 * @brief Looks up a key in a semicolon-delimited INFO string.
 * @return The value after "key=", an empty string for a bare flag, or nullopt.
 */
std::optional<std::string> find_info_value(const std::string& info, const std::string& key);

/**
 * @brief Derives the inclusive end of a variant.
 *
 * Symbolic alleles (alt beginning with '<') read END from INFO; nullopt if
 * END is missing or not an integer. Other alleles use the reference length.
 */
std::optional<int64_t> derive_end(int64_t pos_start, const std::string& ref, const std::string& alt,
                                  const std::string& info);

/**
 * @brief Builds a VariantRecord from raw VCF column values.
 */
VariantRecord make_variant_record(const std::string& chrom, int64_t pos, const std::string& ref,
                                  const std::string& alt, const std::string& info);

/**
 * @brief True for FILTER values "PASS" and ".".
 */
bool is_pass_filter(const std::string& filter);

/**
 * @brief Extracts AF from a FORMAT/sample column pair.
 *
 * FORMAT keys and sample values are zipped on ':'. A multi-valued AF uses its
 * first value. Returns nullopt if AF is absent, empty, "." or not numeric.
 */
std::optional<double> extract_sample_af(const std::string& format, const std::string& sample_value);

/**
 * @brief Sorts records and drops exact duplicates in place.
 */
void deduplicate(std::vector<VariantRecord>& records);

} // namespace Tmber
