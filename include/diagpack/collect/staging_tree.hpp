#pragma once

#include "diagpack/util/result.hpp"

#include <string>

namespace diagpack {

// Owns the run's staging directory: created (or emptied) by Create(), removed
// recursively by Remove() or, failing that, by the destructor.
class StagingTree {
  public:
    StagingTree() = default;
    StagingTree(const StagingTree&) = delete;
    StagingTree& operator=(const StagingTree&) = delete;
    StagingTree(StagingTree&& other) noexcept;
    StagingTree& operator=(StagingTree&& other) noexcept;
    ~StagingTree();

    // Empty `dir` means a fresh mkdtemp() directory under $TMPDIR or /tmp.
    static Result Create(const std::string& dir, StagingTree& out);

    Result Remove();
    const std::string& Dir() const { return dir_; }

  private:
    std::string dir_;
};

} // namespace diagpack
