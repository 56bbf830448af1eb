#include "diagpack/manifest/element_lookup.hpp"

namespace diagpack {

namespace {

std::string_view Prefix(pugi::xml_node node) {
    const std::string_view name(node.name());
    const auto colon = name.find(':');
    if (colon == std::string_view::npos)
        return {};
    return name.substr(0, colon);
}

void CollectDescendants(pugi::xml_node parent,
                        std::string_view local_name,
                        std::vector<pugi::xml_node>& out) {
    for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
        if (child.type() != pugi::node_element)
            continue;
        if (ElementLookup::LocalName(child) == local_name)
            out.push_back(child);
        CollectDescendants(child, local_name, out);
    }
}

} // namespace

ElementLookup::ElementLookup(std::string namespace_uri) : ns_(std::move(namespace_uri)) {}

ElementLookup ElementLookup::ForRoot(pugi::xml_node root) {
    return ElementLookup(NamespaceOf(root));
}

std::string_view ElementLookup::LocalName(pugi::xml_node node) {
    const std::string_view name(node.name());
    const auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string ElementLookup::NamespaceOf(pugi::xml_node node) {
    const std::string_view prefix = Prefix(node);
    const std::string attr_name =
        prefix.empty() ? std::string("xmlns") : "xmlns:" + std::string(prefix);

    for (pugi::xml_node n = node; n && n.type() == pugi::node_element; n = n.parent()) {
        if (pugi::xml_attribute attr = n.attribute(attr_name.c_str()))
            return attr.value();
    }
    return {};
}

ElementLookup::Match ElementLookup::Find(pugi::xml_node parent, std::string_view local_name) const {
    Match match;
    if (!parent)
        return match;

    if (!ns_.empty()) {
        for (pugi::xml_node child : parent.children()) {
            if (child.type() == pugi::node_element && LocalName(child) == local_name &&
                NamespaceOf(child) == ns_) {
                match.nodes.push_back(child);
            }
        }
        if (!match.nodes.empty()) {
            match.tier = Tier::Namespaced;
            return match;
        }
    }

    for (pugi::xml_node child : parent.children()) {
        if (child.type() == pugi::node_element && std::string_view(child.name()) == local_name &&
            NamespaceOf(child).empty()) {
            match.nodes.push_back(child);
        }
    }
    if (!match.nodes.empty()) {
        match.tier = Tier::Unqualified;
        return match;
    }

    CollectDescendants(parent, local_name, match.nodes);
    if (!match.nodes.empty())
        match.tier = Tier::LocalNameScan;
    return match;
}

const char* LookupTierName(ElementLookup::Tier tier) {
    switch (tier) {
        case ElementLookup::Tier::Namespaced:    return "namespaced";
        case ElementLookup::Tier::Unqualified:   return "unqualified";
        case ElementLookup::Tier::LocalNameScan: return "local-name scan";
        case ElementLookup::Tier::None:          break;
    }
    return "none";
}

} // namespace diagpack
