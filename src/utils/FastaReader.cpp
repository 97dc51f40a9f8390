#include "utils/FastaReader.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "core/Types.hpp"

namespace Tmber {

FastaReader::FastaReader(const std::string& fasta_path)
    : fasta_path_(fasta_path), fai_(nullptr) {
    fai_ = fai_load(fasta_path.c_str());
    if (!fai_) {
        throw ConfigError("Failed to load FASTA index: " + fasta_path + ".fai");
    }
}

FastaReader::~FastaReader() {
    if (fai_) {
        fai_destroy(fai_);
    }
}

FastaReader::FastaReader(FastaReader&& other) noexcept
    : fasta_path_(std::move(other.fasta_path_)),
      fai_(other.fai_) {
    other.fai_ = nullptr;
}

FastaReader& FastaReader::operator=(FastaReader&& other) noexcept {
    if (this != &other) {
        if (fai_) {
            fai_destroy(fai_);
        }
        fasta_path_ = std::move(other.fasta_path_);
        fai_ = other.fai_;
        other.fai_ = nullptr;
    }
    return *this;
}

std::vector<std::string> FastaReader::sequence_names() const {
    std::vector<std::string> names;
    if (!fai_) {
        return names;
    }
    int n = faidx_nseq(fai_);
    names.reserve(n);
    for (int i = 0; i < n; ++i) {
        names.emplace_back(faidx_iseq(fai_, i));
    }
    return names;
}

std::string FastaReader::fetch_sequence(const std::string& chr) const {
    int64_t chr_len = get_chr_length(chr);
    if (chr_len < 0) {
        throw std::runtime_error("Sequence not found in " + fasta_path_ + ": " + chr);
    }
    if (chr_len == 0) {
        return "";
    }

    // faidx_fetch_seq64 takes 0-based inclusive coordinates
    hts_pos_t len = 0;
    char* seq = faidx_fetch_seq64(fai_, chr.c_str(), 0, chr_len - 1, &len);
    if (!seq || len < 0) {
        if (seq) free(seq);
        throw std::runtime_error("Failed to fetch sequence " + chr + " from " + fasta_path_);
    }

    std::string result(seq, static_cast<size_t>(len));
    free(seq);
    return result;
}

int64_t FastaReader::get_chr_length(const std::string& chr) const {
    if (!fai_ || !faidx_has_seq(fai_, chr.c_str())) {
        return -1;
    }
    return faidx_seq_len(fai_, chr.c_str());
}

} // namespace Tmber
