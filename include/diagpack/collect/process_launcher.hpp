#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace diagpack {

struct ProcessOutput {
    int exit_code = -1;      // 128 + signal number when the child was killed
    bool timed_out = false;
    bool truncated = false;  // output went past the launcher's capture limit
    std::string output;      // stdout and stderr, interleaved as written
};

// Spawns a process, captures its combined output and bounds its run time.
// The unexpected value describes a failure to start the process at all.
class IProcessLauncher {
  public:
    virtual ~IProcessLauncher() = default;
    virtual std::expected<ProcessOutput, std::string> Run(const std::vector<std::string>& argv,
                                                          std::chrono::milliseconds timeout) const = 0;
};

// fork/execv with a pipe for output and poll() for the deadline. The child
// gets its own process group; on timeout the whole group receives SIGKILL.
// Output past max_output_bytes is read and dropped so the child never blocks.
// The run ends when the direct child exits, even if a background process it
// left behind still holds the pipe open.
class PosixProcessLauncher final : public IProcessLauncher {
  public:
    static constexpr std::size_t kDefaultMaxOutputBytes = 64u * 1024 * 1024;

    explicit PosixProcessLauncher(std::size_t max_output_bytes = kDefaultMaxOutputBytes)
        : max_output_bytes_(max_output_bytes) {}

    std::expected<ProcessOutput, std::string> Run(const std::vector<std::string>& argv,
                                                  std::chrono::milliseconds timeout) const override;

    // PATH lookup for names without a '/'. Empty when nothing executable is found.
    static std::string ResolveExecutable(const std::string& name);

    std::size_t MaxOutputBytes() const { return max_output_bytes_; }

  private:
    std::size_t max_output_bytes_;
};

std::shared_ptr<const IProcessLauncher> DefaultProcessLauncher();

} // namespace diagpack
