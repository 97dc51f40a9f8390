#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <htslib/faidx.h>

namespace Tmber {

/**
 * @brief RAII wrapper for FASTA file reading with HTSlib.
 *
 * Sequences are fetched on demand through faidx. A missing .fai index is
 * built by htslib on first load (for plain or BGZF-compressed FASTA).
 *
 * Thread-safety: each thread should hold its own FastaReader instance.
 *
 * Usage:
 *   FastaReader fasta("hg38.fa");
 *   for (const auto& name : fasta.sequence_names()) {
 *       std::string seq = fasta.fetch_sequence(name);
 *   }
 */
class FastaReader {
public:
    /**
     * @brief Constructs a FASTA reader for the specified file.
     * @throws ConfigError if the file cannot be opened or indexed.
     */
    explicit FastaReader(const std::string& fasta_path);

    ~FastaReader();

    // Disable copy, allow move
    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&&) noexcept;
    FastaReader& operator=(FastaReader&&) noexcept;

    /**
     * @brief Names of all sequences, in index order.
     */
    std::vector<std::string> sequence_names() const;

    /**
     * @brief Fetches a whole sequence with its original letter case.
     * @throws std::runtime_error if the sequence cannot be fetched.
     */
    std::string fetch_sequence(const std::string& chr) const;

    /**
     * @brief Gets the length of a sequence.
     * @return Length in bp, or -1 if not found.
     */
    int64_t get_chr_length(const std::string& chr) const;

    const std::string& get_path() const { return fasta_path_; }

private:
    std::string fasta_path_;
    faidx_t* fai_;
};

} // namespace Tmber
