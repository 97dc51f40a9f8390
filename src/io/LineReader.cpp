#include "io/LineReader.hpp"

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "core/Types.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Tmber {

bool LineReader::is_bzip2(const std::string& path) {
    return Utils::ends_with(path, ".bz2");
}

LineReader::LineReader(const std::string& path, const LineReaderOptions& options) : path_(path) {
    if (is_bzip2(path_)) {
        std::vector<std::string> args;
        std::string pbzip2 = Utils::fetch_executable("pbzip2", true);
        if (!pbzip2.empty()) {
            args = {pbzip2, "-p" + std::to_string(options.threads), "-dc", path_};
        } else {
            args = {Utils::fetch_executable("bzip2"), "-dc", path_};
        }
        pipe_ = std::make_unique<Utils::PipeReader>(args);
        return;
    }

    fp_ = hts_open(path_.c_str(), "r");
    if (!fp_) {
        throw ConfigError("Failed to open file: " + path_);
    }
    if (options.threads > 1 && hts_get_format(fp_)->compression == bgzf) {
        if (hts_set_threads(fp_, options.threads) != 0) {
            LOG_WARNING("Could not enable " + std::to_string(options.threads) + " decompression threads for " + path_);
        }
    }
}

LineReader::~LineReader() {
    if (fp_) {
        hts_close(fp_);
        fp_ = nullptr;
    }
    free(ks_.s);
}

bool LineReader::next(std::string& line) {
    if (pipe_) {
        return pipe_->getline(line);
    }
    if (!fp_) {
        return false;
    }

    int ret = hts_getline(fp_, KS_SEP_LINE, &ks_);
    if (ret == -1) {
        return false;
    }
    if (ret < -1) {
        throw std::runtime_error("Error while reading " + path_);
    }
    line.assign(ks_.s, ks_.l);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

void LineReader::close() {
    if (pipe_) {
        pipe_->close();
        pipe_.reset();
    }
    if (fp_) {
        int ret = hts_close(fp_);
        fp_ = nullptr;
        if (ret != 0) {
            throw std::runtime_error("Error while closing " + path_);
        }
    }
}

} // namespace Tmber
