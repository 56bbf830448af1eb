#pragma once

#include <pugixml.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace diagpack {

// Namespace-tolerant child lookup. Hand-maintained manifests drift between
// namespaced and plain forms, so every lookup tries, in order:
//   1. direct children with the local name, bound to the document namespace;
//   2. direct children with exactly that name and no namespace;
//   3. any descendant whose local name matches, namespace ignored.
// The first tier that yields at least one element wins.
class ElementLookup {
  public:
    enum class Tier {
        None,
        Namespaced,
        Unqualified,
        LocalNameScan,
    };

    struct Match {
        std::vector<pugi::xml_node> nodes;
        Tier tier = Tier::None;
    };

    ElementLookup() = default;
    explicit ElementLookup(std::string namespace_uri);

    // Uses the namespace the root element itself is bound to (default or prefixed).
    static ElementLookup ForRoot(pugi::xml_node root);

    Match Find(pugi::xml_node parent, std::string_view local_name) const;

    const std::string& NamespaceUri() const { return ns_; }

    static std::string_view LocalName(pugi::xml_node node);
    static std::string NamespaceOf(pugi::xml_node node);

  private:
    std::string ns_;
};

const char* LookupTierName(ElementLookup::Tier tier);

} // namespace diagpack
