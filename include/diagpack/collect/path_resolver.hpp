#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diagpack {

// Turns a manifest path pattern into the regular files it names right now.
class PathResolver {
  public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    PathResolver();
    explicit PathResolver(EnvLookup lookup);

    // Expands $NAME, ${NAME} and %NAME%. Unknown references stay verbatim.
    std::string ExpandEnvironment(std::string_view text) const;

    // Expansion, quote stripping, '\' -> '/', then glob(3) when the pattern
    // holds a '*'. Only existing regular files are returned, as absolute paths.
    std::vector<std::string> Resolve(std::string_view pattern) const;

    static std::optional<std::string> ProcessEnvironment(const std::string& name);

  private:
    EnvLookup lookup_;
};

} // namespace diagpack
