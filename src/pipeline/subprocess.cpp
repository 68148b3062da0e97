#include "vault/pipeline/subprocess.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace vault::pipeline {
namespace fs = std::filesystem;

namespace {

// Exit codes of coreutils timeout(1)
constexpr int kTimedOut = 124;
constexpr int kKilled = 128 + 9;

bool executable(const fs::path& path) {
    std::error_code ec;
    return ::access(path.c_str(), X_OK) == 0 && !fs::is_directory(path, ec);
}

struct PipeCloser {
    int* status;
    void operator()(FILE* pipe) const {
        const int rc = pclose(pipe);
        if (status != nullptr) {
            *status = rc;
        }
    }
};

} // namespace

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string program_of(const std::string& command) {
    std::istringstream iss(command);
    std::string program;
    iss >> program;
    return program;
}

bool resolvable(const std::string& program) {
    if (program.empty()) {
        return false;
    }
    if (program.find('/') != std::string::npos) {
        return executable(program);
    }
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (!dir.empty() && executable(fs::path(dir) / program)) {
            return true;
        }
    }
    return false;
}

Result<std::string> run_command(const std::string& command, std::chrono::seconds limit) {
    std::string line = command;
    if (limit.count() > 0) {
        line = "timeout -k 5 " + std::to_string(limit.count()) + " /bin/sh -c " + shell_quote(command);
    }
    line += " 2>/dev/null";
    spdlog::debug("Running: {}", line);

    std::string output;
    int status = -1;
    {
        std::unique_ptr<FILE, PipeCloser> pipe(popen(line.c_str(), "r"), PipeCloser{&status});
        if (!pipe) {
            return fail<std::string>(ErrorCode::Io, "cannot start " + program_of(command));
        }
        char buffer[4096];
        size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), pipe.get())) > 0) {
            output.append(buffer, n);
        }
    }

    if (status == -1 || !WIFEXITED(status)) {
        return fail<std::string>(ErrorCode::Io, program_of(command) + " did not exit normally");
    }
    const int code = WEXITSTATUS(status);
    if (limit.count() > 0 && (code == kTimedOut || code == kKilled)) {
        return fail<std::string>(ErrorCode::Transient, program_of(command) + " timed out after " +
                                                       std::to_string(limit.count()) + "s");
    }
    if (code != 0) {
        return fail<std::string>(ErrorCode::Io, program_of(command) + " exited with status " +
                                                std::to_string(code));
    }
    return Ok(output);
}

} // namespace vault::pipeline
