/**
 * @file process.cpp
 * @brief Implementation of external tool helpers
 */

#include <clipxfer/core/process.h>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace clipxfer {

auto find_executable(const std::string& name) -> std::optional<std::filesystem::path> {
    const char* path_env = std::getenv("PATH");
    if (!path_env || name.empty()) {
        return std::nullopt;
    }

    std::istringstream dirs{std::string(path_env)};
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto run_process(const std::vector<std::string>& argv) -> result<int> {
    if (argv.empty()) {
        return unexpected(error{error_code::invalid_configuration, "empty command line"});
    }

    std::vector<std::string> argv_storage(argv);
    std::vector<char*> argv_ptrs;
    argv_ptrs.reserve(argv_storage.size() + 1);
    for (auto& value : argv_storage) {
        argv_ptrs.push_back(value.data());
    }
    argv_ptrs.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        return unexpected(error{error_code::internal_error,
                                std::string("fork failed: ") + std::strerror(errno)});
    }

    if (child == 0) {
        const int dev_null = ::open("/dev/null", O_RDWR);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
            ::dup2(dev_null, STDOUT_FILENO);
            ::dup2(dev_null, STDERR_FILENO);
            if (dev_null > STDERR_FILENO) {
                ::close(dev_null);
            }
        }
        ::execvp(argv_ptrs.front(), argv_ptrs.data());
        _exit(127);
    }

    int status = 0;
    while (::waitpid(child, &status, 0) < 0) {
        if (errno != EINTR) {
            return unexpected(error{error_code::internal_error,
                                    std::string("waitpid failed: ") + std::strerror(errno)});
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

}  // namespace clipxfer
