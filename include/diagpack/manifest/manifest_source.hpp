#pragma once

#include <expected>
#include <string>

namespace diagpack {

// Supplies raw manifest bytes. Retrieval and caching policy belong to the
// implementation; the collector only needs the bytes.
class IManifestSource {
  public:
    virtual ~IManifestSource() = default;
    virtual std::string Describe() const = 0;
    virtual std::expected<std::string, std::string> Fetch() = 0;
};

// Reads a local file, or standard input when the path is "-".
class FileManifestSource final : public IManifestSource {
  public:
    explicit FileManifestSource(std::string path);

    std::string Describe() const override;
    std::expected<std::string, std::string> Fetch() override;

  private:
    std::string path_;
};

// Bytes already held in memory (embedded manifests, tests).
class MemoryManifestSource final : public IManifestSource {
  public:
    explicit MemoryManifestSource(std::string bytes) : bytes_(std::move(bytes)) {}

    std::string Describe() const override { return "<memory>"; }
    std::expected<std::string, std::string> Fetch() override { return bytes_; }

  private:
    std::string bytes_;
};

} // namespace diagpack
