#include "diagpack/manifest/manifest_parser.hpp"

#include "diagpack/manifest/element_lookup.hpp"
#include "diagpack/util/logger.hpp"

#include <cctype>
#include <initializer_list>
#include <pugixml.hpp>

namespace diagpack {

namespace {

std::string Trimmed(const char* s) {
    std::string_view v(s ? s : "");
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.remove_prefix(1);
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
    return std::string(v);
}

std::string AttributeValue(pugi::xml_node node, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (pugi::xml_attribute attr = node.attribute(name))
            return Trimmed(attr.value());
    }
    return {};
}

std::string TeamOf(pugi::xml_node node) {
    std::string team = AttributeValue(node, {"Team", "team"});
    return team.empty() ? std::string(kDefaultTeam) : team;
}

std::string OutputNameOf(pugi::xml_node node) {
    return AttributeValue(node, {"OutputFileName", "OutputFilename", "OutputName", "outputFileName"});
}

// Collects the item elements of every group element (e.g. all <File> under all <Files>).
std::vector<pugi::xml_node> FindItems(const ElementLookup& lookup,
                                      pugi::xml_node package,
                                      const char* package_id,
                                      const char* group_name,
                                      const char* item_name) {
    std::vector<pugi::xml_node> items;
    const auto groups = lookup.Find(package, group_name);
    if (groups.nodes.empty())
        return items;

    for (pugi::xml_node group : groups.nodes) {
        auto found = lookup.Find(group, item_name);
        items.insert(items.end(), found.nodes.begin(), found.nodes.end());
    }
    LogDebug("Package %s: %zu <%s> group(s) via %s lookup, %zu <%s> item(s)",
             package_id,
             groups.nodes.size(),
             group_name,
             LookupTierName(groups.tier),
             items.size(),
             item_name);
    return items;
}

std::expected<ActionSet, std::string> ParseActions(const ElementLookup& lookup,
                                                   pugi::xml_node package,
                                                   const std::string& package_id) {
    ActionSet actions;
    const char* id = package_id.c_str();

    for (pugi::xml_node item : FindItems(lookup, package, id, "Files", "File")) {
        FileAction a;
        a.path_pattern = Trimmed(item.text().get());
        a.team = TeamOf(item);
        if (a.path_pattern.empty()) {
            LogWarn("Package %s: ignoring <File> without a path", id);
            continue;
        }
        actions.files.push_back(std::move(a));
    }

    for (pugi::xml_node item : FindItems(lookup, package, id, "Registries", "Registry")) {
        RegistryAction a;
        a.key_path = StripTrailingWildcard(Trimmed(item.text().get()));
        a.team = TeamOf(item);
        if (a.key_path.empty()) {
            LogWarn("Package %s: ignoring <Registry> without a key", id);
            continue;
        }
        a.output_name = OutputNameOf(item);
        if (a.output_name.empty())
            a.output_name = DeriveRegistryOutputName(a.key_path);
        actions.registries.push_back(std::move(a));
    }

    for (pugi::xml_node item : FindItems(lookup, package, id, "EventLogs", "EventLog")) {
        EventLogAction a;
        a.path_pattern = Trimmed(item.text().get());
        a.team = TeamOf(item);
        if (a.path_pattern.empty()) {
            LogWarn("Package %s: ignoring <EventLog> without a path", id);
            continue;
        }
        actions.event_logs.push_back(std::move(a));
    }

    for (pugi::xml_node item : FindItems(lookup, package, id, "Commands", "Command")) {
        CommandAction a;
        a.text = Trimmed(item.text().get());
        a.team = TeamOf(item);
        if (a.text.empty()) {
            LogWarn("Package %s: ignoring <Command> without text", id);
            continue;
        }

        const std::string type = AttributeValue(item, {"Type", "type"});
        if (!type.empty()) {
            auto kind = ParseCommandKind(type);
            if (!kind) {
                return std::unexpected("package " + package_id + ": unknown command type '" +
                                       type + "' for command: " + a.text);
            }
            a.kind = *kind;
        }

        a.output_name = OutputNameOf(item);
        if (a.output_name.empty())
            a.output_name = DeriveCommandOutputName(a.text);
        actions.commands.push_back(std::move(a));
    }

    return actions;
}

} // namespace

std::expected<Manifest, std::string> ManifestParser::Parse(std::string_view markup) const {
    if (markup.find_first_not_of(" \t\n\r") == std::string_view::npos) {
        return std::unexpected("Empty manifest");
    }

    pugi::xml_document doc;
    const pugi::xml_parse_result parsed =
        doc.load_buffer(markup.data(), markup.size(), pugi::parse_default, pugi::encoding_auto);
    if (!parsed) {
        return std::unexpected(std::string("Syntax Error: ") + parsed.description() +
                               " at offset " + std::to_string(parsed.offset));
    }

    const pugi::xml_node root = doc.document_element();
    if (!root) {
        return std::unexpected("Manifest has no root element");
    }

    const ElementLookup lookup = ElementLookup::ForRoot(root);
    LogInfo("Manifest root <%s> namespace='%s'", root.name(), lookup.NamespaceUri().c_str());

    Manifest m;
    const auto packages = lookup.Find(root, "Package");
    if (packages.nodes.empty()) {
        LogWarn("Manifest contains no Package elements");
        return m;
    }
    LogInfo("Found %zu Package element(s) via %s lookup",
            packages.nodes.size(),
            LookupTierName(packages.tier));

    m.packages.reserve(packages.nodes.size());
    for (pugi::xml_node node : packages.nodes) {
        Package pkg;
        pkg.id = AttributeValue(node, {"ID", "Id", "id"});
        if (pkg.id.empty()) {
            LogWarn("Skipping Package element without an ID attribute");
            continue;
        }

        auto actions = ParseActions(lookup, node, pkg.id);
        if (!actions)
            return std::unexpected(actions.error());
        pkg.actions = std::move(*actions);

        LogInfo("Package %s: files=%zu registries=%zu eventlogs=%zu commands=%zu",
                pkg.id.c_str(),
                pkg.actions.files.size(),
                pkg.actions.registries.size(),
                pkg.actions.event_logs.size(),
                pkg.actions.commands.size());
        m.packages.push_back(std::move(pkg));
    }

    return m;
}

} // namespace diagpack
