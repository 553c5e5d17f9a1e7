#include "GuardDog/CommandRunner.hpp"

#include <array>
#include <cstdlib>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace guarddog {

namespace {

constexpr std::size_t kMaxCapturedOutput = 1024 * 1024;

void appendBounded(std::string &output, const char *data, std::size_t length) {
    const std::size_t room = kMaxCapturedOutput > output.size() ? kMaxCapturedOutput - output.size() : 0;
    output.append(data, length < room ? length : room);
}

#ifdef _WIN32

std::string quoteArgument(const std::string &argument) {
    if (!argument.empty() && argument.find_first_of(" \t\"") == std::string::npos) {
        return argument;
    }
    std::string quoted = "\"";
    std::size_t backslashes = 0;
    for (char ch : argument) {
        if (ch == '\\') {
            ++backslashes;
            continue;
        }
        if (ch == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted.push_back(ch);
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

CommandResult runWindows(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) {
    CommandResult result;
    SECURITY_ATTRIBUTES attributes{};
    attributes.nLength = sizeof(attributes);
    attributes.bInheritHandle = TRUE;

    HANDLE readEnd = nullptr;
    HANDLE writeEnd = nullptr;
    if (!CreatePipe(&readEnd, &writeEnd, &attributes, 0)) {
        result.error = "CreatePipe failed";
        return result;
    }
    SetHandleInformation(readEnd, HANDLE_FLAG_INHERIT, 0);

    std::ostringstream commandLine;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            commandLine << ' ';
        }
        commandLine << quoteArgument(argv[i]);
    }
    std::string mutableCommand = commandLine.str();

    STARTUPINFOA startup{};
    startup.cb = sizeof(startup);
    startup.dwFlags = STARTF_USESTDHANDLES;
    startup.hStdOutput = writeEnd;
    startup.hStdError = writeEnd;
    startup.hStdInput = nullptr;
    PROCESS_INFORMATION process{};
    if (!CreateProcessA(argv[0].c_str(), mutableCommand.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr,
                        nullptr, &startup, &process)) {
        CloseHandle(readEnd);
        CloseHandle(writeEnd);
        result.error = "CreateProcess failed for " + argv[0];
        return result;
    }
    CloseHandle(writeEnd);
    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    bool exited = false;
    while (true) {
        DWORD available = 0;
        while (PeekNamedPipe(readEnd, nullptr, 0, nullptr, &available, nullptr) && available > 0) {
            DWORD bytesRead = 0;
            if (!ReadFile(readEnd, buffer.data(), static_cast<DWORD>(buffer.size()), &bytesRead, nullptr) ||
                bytesRead == 0) {
                break;
            }
            appendBounded(result.output, buffer.data(), bytesRead);
        }
        if (exited) {
            break;
        }
        if (WaitForSingleObject(process.hProcess, 50) == WAIT_OBJECT_0) {
            exited = true;
            continue;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            TerminateProcess(process.hProcess, 1);
            WaitForSingleObject(process.hProcess, 1000);
            result.timedOut = true;
            break;
        }
    }

    DWORD exitCode = 1;
    GetExitCodeProcess(process.hProcess, &exitCode);
    result.exitCode = static_cast<int>(exitCode);
    CloseHandle(process.hThread);
    CloseHandle(process.hProcess);
    CloseHandle(readEnd);
    return result;
}

#else

CommandResult runPosix(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) {
    CommandResult result;
    int fds[2];
    if (pipe(fds) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        const int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        execv(args[0], args.data());
        _exit(127);
    }

    close(fds[1]);
    result.launched = true;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    while (true) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            kill(pid, SIGKILL);
            result.timedOut = true;
            break;
        }
        pollfd descriptor{fds[0], POLLIN, 0};
        const int ready = poll(&descriptor, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill(pid, SIGKILL);
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) {
            continue;
        }
        const ssize_t count = read(fds[0], buffer.data(), buffer.size());
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        appendBounded(result.output, buffer.data(), static_cast<std::size_t>(count));
    }
    close(fds[0]);

    // stdout may close before the child exits; keep honouring the deadline.
    int status = 0;
    while (true) {
        const pid_t waited = waitpid(pid, &status, result.timedOut ? 0 : WNOHANG);
        if (waited == pid || (waited < 0 && errno != EINTR)) {
            break;
        }
        if (waited == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                kill(pid, SIGKILL);
                result.timedOut = true;
            } else {
                usleep(10 * 1000);
            }
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = status;
    }
    if (result.exitCode == 127 && result.output.empty() && !result.timedOut) {
        result.error = "unable to execute " + argv[0];
    }
    return result;
}

#endif

} // namespace

CommandResult ProcessCommandRunner::run(const std::vector<std::string> &argv,
                                        std::chrono::milliseconds timeout) const {
    if (argv.empty()) {
        CommandResult result;
        result.error = "empty command line";
        return result;
    }
#ifdef _WIN32
    return runWindows(argv, timeout);
#else
    return runPosix(argv, timeout);
#endif
}

std::string systemDirectory() {
    const char *windir = std::getenv("WINDIR");
    std::string base = (windir != nullptr && *windir != '\0') ? windir : "C:\\Windows";
    return base + "\\System32";
}

} // namespace guarddog
