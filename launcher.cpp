#include "launcher.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

#ifdef __APPLE__
const char* FILE_MANAGER = "open";
#else
const char* FILE_MANAGER = "xdg-open";
#endif

// Forks and execs `args`. Returns the child's exit status, or -1 with `error` set.
int spawn_and_wait(const std::vector<std::string>& args, bool quiet, std::string& error) {
    std::vector<char*> argv {};
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::strerror(errno);
        return -1;
    }

    if (pid == 0) {
        if (quiet) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
                ::close(devnull);
            }
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    int status {};
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::strerror(errno);
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        if (WEXITSTATUS(status) == 127) {
            error = "cannot run " + args.front();
            return -1;
        }
        return WEXITSTATUS(status);
    }
    error = args.front() + " terminated by a signal";
    return -1;
}

}

std::vector<std::string> editor_command() {
    std::vector<std::string> cmd {};

    const char* env = std::getenv("EDITOR");
    if (env) {
        std::istringstream in {env};
        std::string word;
        while (in >> word) {
            cmd.push_back(word);
        }
    }

    if (cmd.empty()) {
        cmd.push_back("vim");
    }
    return cmd;
}

bool run_editor(const std::filesystem::path& file, std::string& error) {
    std::vector<std::string> args = editor_command();
    args.push_back(file.string());

    spdlog::info("launching {} on {}", args.front(), file.string());
    const int rc = spawn_and_wait(args, false, error);
    if (rc < 0) {
        spdlog::warn("editor failed: {}", error);
        return false;
    }
    if (rc != 0) {
        error = args.front() + " exited with status " + std::to_string(rc);
        spdlog::warn("{}", error);
        return false;
    }
    return true;
}

bool open_in_file_manager(const std::filesystem::path& dir, std::string& error) {
    const std::vector<std::string> args {FILE_MANAGER, dir.string()};

    spdlog::info("opening {} with {}", dir.string(), FILE_MANAGER);
    const int rc = spawn_and_wait(args, true, error);
    if (rc < 0) {
        spdlog::warn("file manager failed: {}", error);
        return false;
    }
    if (rc != 0) {
        error = std::string(FILE_MANAGER) + " exited with status " + std::to_string(rc);
        return false;
    }
    return true;
}
