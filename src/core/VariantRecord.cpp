#include "core/VariantRecord.hpp"

#include <algorithm>
#include <cctype>

#include "utils/StringUtils.hpp"

namespace Tmber {

std::string normalize_chrom(const std::string& chrom) {
    if (chrom.size() >= 3 && std::tolower(static_cast<unsigned char>(chrom[0])) == 'c' &&
        std::tolower(static_cast<unsigned char>(chrom[1])) == 'h' &&
        std::tolower(static_cast<unsigned char>(chrom[2])) == 'r') {
        return "chr" + chrom.substr(3);
    }
    return "chr" + chrom;
}

std::optional<std::string> find_info_value(const std::string& info, const std::string& key) {
    if (info.empty() || info == ".") {
        return std::nullopt;
    }
    for (const auto& entry : Utils::split(info, ';')) {
        size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            if (entry == key) return std::string();
            continue;
        }
        if (entry.compare(0, eq, key) == 0 && eq == key.size()) {
            return entry.substr(eq + 1);
        }
    }
    return std::nullopt;
}

std::optional<int64_t> derive_end(int64_t pos_start, const std::string& ref, const std::string& alt,
                                  const std::string& info) {
    if (!alt.empty() && alt[0] == '<') {
        auto end_value = find_info_value(info, "END");
        if (!end_value) {
            return std::nullopt;
        }
        return Utils::parse_int64(*end_value);
    }
    return pos_start + static_cast<int64_t>(ref.size()) - 1;
}

VariantRecord make_variant_record(const std::string& chrom, int64_t pos, const std::string& ref,
                                  const std::string& alt, const std::string& info) {
    VariantRecord rec;
    rec.chrom = normalize_chrom(chrom);
    rec.pos_start = pos;
    rec.pos_end = derive_end(pos, ref, alt, info);
    rec.ref = ref;
    rec.alt = alt;
    return rec;
}

bool is_pass_filter(const std::string& filter) {
    return filter == "PASS" || filter == ".";
}

std::optional<double> extract_sample_af(const std::string& format, const std::string& sample_value) {
    auto keys = Utils::split(format, ':');
    auto values = Utils::split(sample_value, ':');
    size_t n = std::min(keys.size(), values.size());
    for (size_t i = 0; i < n; ++i) {
        if (keys[i] != "AF") continue;
        const std::string first = Utils::split(values[i], ',').front();
        if (first.empty() || first == ".") {
            return std::nullopt;
        }
        return Utils::parse_double(first);
    }
    return std::nullopt;
}

void deduplicate(std::vector<VariantRecord>& records) {
    std::sort(records.begin(), records.end());
    records.erase(std::unique(records.begin(), records.end()), records.end());
}

} // namespace Tmber
