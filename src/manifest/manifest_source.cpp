#include "diagpack/manifest/manifest_source.hpp"

#include "diagpack/io/file_reader.hpp"

namespace diagpack {

FileManifestSource::FileManifestSource(std::string path) : path_(std::move(path)) {}

std::string FileManifestSource::Describe() const {
    return path_ == "-" ? std::string("<stdin>") : path_;
}

std::expected<std::string, std::string> FileManifestSource::Fetch() {
    FileOrStdinReader reader;
    auto open_result = FileOrStdinReader::Open(path_, reader);
    if (!open_result.is_ok())
        return std::unexpected(open_result.msg);

    std::string bytes;
    auto read_result = reader.ReadAll(bytes);
    if (!read_result.is_ok())
        return std::unexpected(read_result.msg);
    return bytes;
}

} // namespace diagpack
