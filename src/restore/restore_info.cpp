#include <restorenom/restore/restore_info.hpp>
#include <toml++/toml.hpp>
#include <sstream>

namespace restorenom {

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

static void describe_properties(std::ostringstream& out, const PropertyBag& props,
                                const std::string& indent) {
    for (const auto& [name, value] : props) {
        out << indent << name << " = " << value << "\n";
    }
}

static void describe_references(std::ostringstream& out, const char* kind,
                                const ReferenceItems& items,
                                const std::string& indent) {
    for (const auto& [name, item] : items) {
        out << indent << kind << " " << name << "\n";
        describe_properties(out, item.properties, indent + "  ");
    }
}

std::string describe(const ProjectRestoreInfo& info) {
    std::ostringstream out;
    out << "restore info\n";
    out << "  base intermediate path: " << info.base_intermediate_path << "\n";
    out << "  original target frameworks: " << info.original_target_frameworks << "\n";

    for (const auto& [moniker, tfm] : info.target_frameworks) {
        out << "  target framework " << moniker << "\n";
        for (const auto& [name, value] : tfm.properties) {
            out << "    property " << name << " = " << value << "\n";
        }
        describe_references(out, "project reference", tfm.project_references, "    ");
        describe_references(out, "package reference", tfm.package_references, "    ");
    }

    describe_references(out, "tool reference", info.tool_references, "  ");
    return out.str();
}

// ---------------------------------------------------------------------------
// TOML
// ---------------------------------------------------------------------------

static toml::table properties_table(const PropertyBag& props) {
    toml::table tbl;
    for (const auto& [name, value] : props) {
        tbl.insert_or_assign(name, value);
    }
    return tbl;
}

static toml::array references_array(const ReferenceItems& items) {
    toml::array arr;
    for (const auto& [name, item] : items) {
        toml::table ref;
        ref.insert("name", item.name);
        ref.insert("properties", properties_table(item.properties));
        arr.push_back(std::move(ref));
    }
    return arr;
}

std::string to_toml(const ProjectRestoreInfo& info) {
    toml::table doc;
    doc.insert("base_intermediate_path", info.base_intermediate_path);
    doc.insert("original_target_frameworks", info.original_target_frameworks);

    toml::array frameworks;
    for (const auto& [moniker, tfm] : info.target_frameworks) {
        toml::table entry;
        entry.insert("moniker", tfm.target_framework_moniker);
        entry.insert("properties", properties_table(tfm.properties));
        entry.insert("project_references", references_array(tfm.project_references));
        entry.insert("package_references", references_array(tfm.package_references));
        frameworks.push_back(std::move(entry));
    }
    doc.insert("target_frameworks", std::move(frameworks));
    doc.insert("tool_references", references_array(info.tool_references));

    std::ostringstream out;
    out << doc << "\n";
    return out.str();
}

} // namespace restorenom
