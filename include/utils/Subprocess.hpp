#pragma once

#include <cstdio>
#include <string>
#include <vector>

namespace Tmber {
namespace Utils {

/**
 * @brief Finds an executable on PATH.
 *
 * @param cmd Command name (e.g. "bedtools"). A name containing '/' is checked
 *            as a path directly.
 * @param ignore_errors Return an empty string instead of throwing.
 * @return Absolute path of the first executable match.
 * @throws ConfigError if not found and ignore_errors is false.
 */
std::string fetch_executable(const std::string& cmd, bool ignore_errors = false);

/**
 * @brief Quotes one argument for /bin/sh.
 */
std::string shell_quote(const std::string& arg);

/**
 * @brief Line-oriented reader over the stdout of an external command.
 *
 * stderr is redirected to a temporary file so that it can be reported when the
 * command exits with a non-zero status.
 *
 * Usage:
 *   PipeReader pipe({"bedtools", "merge", "-i", "regions.bed"});
 *   std::string line;
 *   while (pipe.getline(line)) { ... }
 *   pipe.close();  // throws SubprocessError on failure
 */
class PipeReader {
public:
    /**
     * @brief Starts the command.
     * @throws SubprocessError if the process cannot be started.
     */
    explicit PipeReader(const std::vector<std::string>& args);

    /**
     * @brief Reaps the process if close() was not called; never throws.
     */
    ~PipeReader();

    PipeReader(const PipeReader&) = delete;
    PipeReader& operator=(const PipeReader&) = delete;

    /**
     * @brief Reads the next line without its trailing newline.
     * @return false at end of output.
     */
    bool getline(std::string& line);

    /**
     * @brief Waits for the command to exit.
     * @throws SubprocessError with the captured stderr on non-zero exit.
     */
    void close();

    const std::string& command() const { return command_; }

private:
    std::string command_;
    std::string stderr_path_;
    FILE* fp_ = nullptr;

    std::string read_stderr() const;
    void remove_stderr_file();
};

} // namespace Utils
} // namespace Tmber
