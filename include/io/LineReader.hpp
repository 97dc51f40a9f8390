#pragma once

#include <memory>
#include <string>

#include <htslib/hts.h>
#include <htslib/kstring.h>

#include "utils/Subprocess.hpp"

namespace Tmber {

/**
 * @brief Options for opening a text input.
 */
struct LineReaderOptions {
    int threads = 1;  ///< Decompression threads (BGZF via htslib, or pbzip2 -p)
};

/**
 * @brief RAII line reader over plain, gzip/BGZF and bzip2 text files.
 *
 * Plain, .gz and .bgz inputs are streamed with htslib (hts_open/hts_getline),
 * which detects the compression itself. .bz2 inputs are decompressed by an
 * external `pbzip2` (preferred) or `bzip2` found on PATH.
 *
 * Usage:
 *   LineReader reader("calls.vcf.gz");
 *   std::string line;
 *   while (reader.next(line)) { ... }
 *   reader.close();
 */
class LineReader {
public:
    /**
     * @brief Opens the file for reading.
     * @throws ConfigError if the file cannot be opened or no bzip2 tool exists.
     */
    explicit LineReader(const std::string& path, const LineReaderOptions& options = {});

    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * @brief Reads the next line without its line terminator.
     * @return false at end of file.
     * @throws std::runtime_error on a read error.
     */
    bool next(std::string& line);

    /**
     * @brief Releases the input; surfaces decompressor failures.
     * @throws SubprocessError if the external decompressor failed.
     */
    void close();

    const std::string& path() const { return path_; }

    /**
     * @brief True if the path has a bzip2 extension.
     */
    static bool is_bzip2(const std::string& path);

private:
    std::string path_;
    htsFile* fp_ = nullptr;
    kstring_t ks_ = {0, 0, nullptr};
    std::unique_ptr<Utils::PipeReader> pipe_;
};

} // namespace Tmber
