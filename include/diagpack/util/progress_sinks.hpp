#pragma once

#include "diagpack/util/progress.hpp"

#include <string>

namespace diagpack {

// Atomically replaces a small JSON document at `path` on every update so an
// external front-end can poll it.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    int last_percent_ = -1;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace diagpack
