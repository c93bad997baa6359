#include "../include/process.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
struct Pipe {
    int fd[2]{-1, -1};
    ~Pipe() { close_read(); close_write(); }
    void close_read() { if (fd[0] >= 0) { ::close(fd[0]); fd[0] = -1; } }
    void close_write() { if (fd[1] >= 0) { ::close(fd[1]); fd[1] = -1; } }
};
}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv, const fs::path& workdir) {
    if (argv.empty()) throw FetchError(ErrorKind::process, "empty command line");

    Pipe p;
    if (::pipe(p.fd) != 0) {
        throw FetchError(ErrorKind::process, std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw FetchError(ErrorKind::process, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::dup2(p.fd[1], STDOUT_FILENO);
        ::dup2(p.fd[1], STDERR_FILENO);
        ::close(p.fd[0]);
        ::close(p.fd[1]);
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            std::fprintf(stderr, "chdir %s: %s\n", workdir.c_str(), std::strerror(errno));
            ::_exit(126);
        }
        ::execvp(args[0], args.data());
        std::fprintf(stderr, "exec %s: %s\n", args[0], std::strerror(errno));
        ::_exit(127);
    }

    p.close_write();
    ProcessResult result;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(p.fd[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buf, (size_t)n);
        if (echo_) std::cerr.write(buf, n);
    }
    p.close_read();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw FetchError(ErrorKind::process, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

std::optional<fs::path> find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return fs::path(name);
        return std::nullopt;
    }
    std::string path = getenv_or("PATH", "/usr/local/bin:/usr/bin:/bin");
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find(':', pos);
        std::string dir = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) return candidate;
        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return std::nullopt;
}

bool have_executable(const std::string& name) {
    return find_executable(name).has_value();
}
