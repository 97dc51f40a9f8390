#include "utils/Subprocess.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/Types.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Tmber {
namespace Utils {

std::string fetch_executable(const std::string& cmd, bool ignore_errors) {
    if (cmd.find('/') != std::string::npos) {
        if (access(cmd.c_str(), X_OK) == 0) {
            return std::filesystem::absolute(cmd).string();
        }
    } else {
        const char* path_env = std::getenv("PATH");
        for (const auto& dir : split(path_env ? path_env : "", ':')) {
            if (dir.empty()) continue;
            std::filesystem::path candidate = std::filesystem::path(dir) / cmd;
            if (access(candidate.c_str(), X_OK) == 0 && !std::filesystem::is_directory(candidate)) {
                return candidate.string();
            }
        }
    }
    if (ignore_errors) {
        return "";
    }
    throw ConfigError("command not found: " + cmd);
}

std::string shell_quote(const std::string& arg) {
    std::string esc = arg;
    size_t p = 0;
    while ((p = esc.find('\'', p)) != std::string::npos) {
        esc.replace(p, 1, "'\\''");
        p += 4;
    }
    return "'" + esc + "'";
}

PipeReader::PipeReader(const std::vector<std::string>& args) {
    std::ostringstream cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        cmd << (i > 0 ? " " : "") << shell_quote(args[i]);
    }
    command_ = cmd.str();

    std::string tmpl = (std::filesystem::temp_directory_path() / "tmber_stderr_XXXXXX").string();
    int fd = mkstemp(tmpl.data());
    if (fd < 0) {
        throw SubprocessError("Cannot create temporary file for stderr of: " + command_, -1, "");
    }
    ::close(fd);
    stderr_path_ = tmpl;

    LOG_DEBUG("args: " + command_);
    fp_ = popen((command_ + " 2> " + shell_quote(stderr_path_)).c_str(), "r");
    if (!fp_) {
        remove_stderr_file();
        throw SubprocessError("Failed to start subprocess: " + command_, -1, "");
    }
}

PipeReader::~PipeReader() {
    if (fp_) {
        pclose(fp_);
        fp_ = nullptr;
    }
    remove_stderr_file();
}

bool PipeReader::getline(std::string& line) {
    if (!fp_) {
        return false;
    }
    line.clear();
    int c;
    bool got_any = false;
    while ((c = std::fgetc(fp_)) != EOF) {
        got_any = true;
        if (c == '\n') {
            break;
        }
        line.push_back(static_cast<char>(c));
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return got_any;
}

void PipeReader::close() {
    if (!fp_) {
        return;
    }
    int status = pclose(fp_);
    fp_ = nullptr;

    int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    if (exit_code != 0) {
        std::string err = read_stderr();
        remove_stderr_file();
        LOG_ERROR("STDERR from subprocess `" + command_ + "`:\n" + err);
        throw SubprocessError("Command exited with status " + std::to_string(exit_code) + ": " + command_, exit_code,
                              err);
    }
    remove_stderr_file();
}

std::string PipeReader::read_stderr() const {
    std::ifstream ifs(stderr_path_);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

void PipeReader::remove_stderr_file() {
    if (!stderr_path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(stderr_path_, ec);
        stderr_path_.clear();
    }
}

} // namespace Utils
} // namespace Tmber
