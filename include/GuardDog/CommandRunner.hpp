#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace guarddog {

struct CommandResult {
    bool launched{false};
    bool timedOut{false};
    int exitCode{0};
    std::string output;
    std::string error; // launch failure description

    bool succeeded() const { return launched && !timedOut && exitCode == 0; }
};

// Runs an external utility without a shell. argv[0] is an absolute path to
// the executable. Implementations must return once the timeout elapses,
// killing the child if needed.
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) const = 0;
};

class ProcessCommandRunner : public CommandRunner {
  public:
    CommandResult run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) const override;
};

// %WINDIR%\System32 on Windows hosts, with C:\Windows as the fallback.
std::string systemDirectory();

} // namespace guarddog
