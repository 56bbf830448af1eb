#pragma once
#include <string_view>

namespace diagpack {

struct ProgressEvent {
    std::string_view stage;
    int percent = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace diagpack
