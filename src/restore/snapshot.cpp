#include <restorenom/restore/snapshot.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace restorenom {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Scalars are kept as MSBuild sees them: strings
static std::optional<std::string> scalar_string(const toml::node& node) {
    if (auto s = node.value<std::string>()) return *s;
    if (auto b = node.value<bool>()) return std::string(*b ? "true" : "false");
    if (node.is_integer()) return std::to_string(*node.value<int64_t>());
    return std::nullopt;
}

static Result<PropertyBag> parse_properties(const toml::table& tbl,
                                            const std::string& where) {
    PropertyBag props;
    for (const auto& [key, val] : tbl) {
        auto s = scalar_string(val);
        if (!s) {
            return RestoreError{RestoreError::Snapshot,
                where + ": property '" + std::string(key.str()) + "' is not a scalar"};
        }
        props.insert_or_assign(std::string(key.str()), std::move(*s));
    }
    return Result<PropertyBag>::ok(std::move(props));
}

static Result<ItemList> parse_items(const toml::array& arr, const std::string& where) {
    ItemList items;
    for (const auto& elem : arr) {
        auto tbl = elem.as_table();
        if (!tbl) {
            return RestoreError{RestoreError::Snapshot,
                where + ": items must be tables"};
        }
        auto name = (*tbl)["name"].value<std::string>();
        if (!name || name->empty()) {
            return RestoreError{RestoreError::Snapshot,
                where + ": item has no name",
                "write items as { name = \"...\", metadata = { ... } }"};
        }

        PropertyBag metadata;
        if (auto meta = (*tbl)["metadata"].as_table()) {
            auto parsed = parse_properties(*meta, where + " item '" + *name + "'");
            RESTORENOM_TRY(parsed);
            metadata = std::move(parsed).value();
        }
        // Evaluated item lists have one entry per name; keep the first
        items.insert(std::string(*name), std::move(metadata));
    }
    return Result<ItemList>::ok(std::move(items));
}

static Result<ProjectSnapshot> parse_side(const toml::table& change,
                                          const char* side,
                                          const std::string& where) {
    ProjectSnapshot snap;
    auto tbl = change[side].as_table();
    if (!tbl) return Result<ProjectSnapshot>::ok(std::move(snap));

    std::string side_where = where + " " + side;
    if (auto props = (*tbl)["properties"].as_table()) {
        auto parsed = parse_properties(*props, side_where);
        RESTORENOM_TRY(parsed);
        snap.properties = std::move(parsed).value();
    }
    if (auto items = (*tbl)["items"].as_array()) {
        auto parsed = parse_items(*items, side_where);
        RESTORENOM_TRY(parsed);
        snap.items = std::move(parsed).value();
    }
    return Result<ProjectSnapshot>::ok(std::move(snap));
}

static Result<ProjectUpdate> parse_update(const toml::table& tbl, size_t index) {
    ProjectUpdate update;
    std::string where = "updates[" + std::to_string(index) + "]";

    if (auto v = tbl["version"].value<int64_t>()) {
        if (*v < 0) {
            return RestoreError{RestoreError::Snapshot,
                where + ": version must not be negative"};
        }
        update.version = static_cast<uint64_t>(*v);
    }
    if (auto v = tbl["configuration"].value<std::string>()) {
        update.configuration.name = *v;
    }
    if (auto dims = tbl["dimensions"].as_table()) {
        auto parsed = parse_properties(*dims, where + " dimensions");
        RESTORENOM_TRY(parsed);
        update.configuration.dimensions = std::move(parsed).value();
    }

    if (auto changes = tbl["changes"].as_array()) {
        for (const auto& elem : *changes) {
            auto change_tbl = elem.as_table();
            if (!change_tbl) {
                return RestoreError{RestoreError::Snapshot,
                    where + ": changes must be tables"};
            }
            auto schema_name = (*change_tbl)["schema"].value<std::string>();
            if (!schema_name || schema_name->empty()) {
                return RestoreError{RestoreError::Snapshot,
                    where + ": change has no schema"};
            }
            std::string change_where = where + " " + *schema_name;

            auto before = parse_side(*change_tbl, "before", change_where);
            RESTORENOM_TRY(before);
            auto after = parse_side(*change_tbl, "after", change_where);
            RESTORENOM_TRY(after);

            auto change = ProjectChangeDescription::between(std::move(before).value(),
                                                            std::move(after).value());
            if (!update.changes.insert(std::string(*schema_name), std::move(change))) {
                return RestoreError{RestoreError::Duplicate,
                    where + ": schema '" + *schema_name + "' appears twice"};
            }
        }
    }

    return Result<ProjectUpdate>::ok(std::move(update));
}

// ---------------------------------------------------------------------------
// UpdateSnapshot
// ---------------------------------------------------------------------------

Result<UpdateSnapshot> UpdateSnapshot::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return RestoreError{RestoreError::Parse,
            std::string("snapshot TOML parse error: ") + e.what(),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    auto project_path = doc["project"]["path"].value<std::string>();
    if (!project_path) {
        return RestoreError{RestoreError::Snapshot,
            "snapshot has no project path",
            "add a [project] table with path = \"<full path of the project file>\""};
    }
    auto project = ProjectContext::from_path(*project_path);
    RESTORENOM_TRY(project);

    UpdateSnapshot snapshot;
    snapshot.project = std::move(project).value();

    if (auto arr = doc["updates"].as_array()) {
        size_t index = 0;
        for (const auto& elem : *arr) {
            auto tbl = elem.as_table();
            if (!tbl) {
                return RestoreError{RestoreError::Snapshot,
                    "updates must be an array of tables"};
            }
            auto update = parse_update(*tbl, index++);
            RESTORENOM_TRY(update);
            snapshot.updates.push_back(std::move(update).value());
        }
    }

    return Result<UpdateSnapshot>::ok(std::move(snapshot));
}

Result<UpdateSnapshot> UpdateSnapshot::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RestoreError{RestoreError::IO,
            "cannot open update snapshot: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto snapshot = UpdateSnapshot::parse(ss.str());
    if (snapshot.is_err()) {
        auto err = std::move(snapshot).error();
        err.file = path;
        return err;
    }
    return snapshot;
}

} // namespace restorenom
