#include "digen/snapshot.hpp"
#include "digen/exceptions.hpp"
#include "digen/log.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <utility>

namespace digen {

namespace {

class snapshot_reader {
public:
    explicit snapshot_reader(std::string source) : source_(std::move(source)) {}

    declaration_set read(const YAML::Node& root) {
        declaration_set set;
        if (root.IsNull()) return set;
        if (!root.IsMap()) fail("", "top level must be a mapping");
        auto types = root["types"];
        if (!types) return set;
        if (!types.IsSequence()) fail("types", "expected a list");
        for (std::size_t i = 0; i < types.size(); ++i) {
            const auto path = "types[" + std::to_string(i) + "]";
            try {
                set.types.push_back(read_type(types[i], path));
            } catch (const snapshot_error& e) {
                DIGEN_LOG_WARN << e.what();
                set.rejected.push_back({optional_scalar(types[i], "name"),
                                        optional_scalar(types[i], "location"),
                                        e.what()});
            }
        }
        return set;
    }

private:
    std::string source_;

    [[noreturn]] void fail(const std::string& path, const std::string& reason) const {
        throw snapshot_error(source_, path.empty() ? reason : path + ": " + reason);
    }

    // Best-effort read of a rejected entry's name or location.
    static std::string optional_scalar(const YAML::Node& node, const char* key) {
        if (!node.IsMap()) return {};
        auto value = node[key];
        return value && value.IsScalar() ? value.Scalar() : std::string{};
    }

    std::string scalar(const YAML::Node& node, const std::string& path) const {
        if (!node.IsScalar()) fail(path, "expected a scalar");
        return node.Scalar();
    }

    bool boolean(const YAML::Node& node, const std::string& path) const {
        if (!node.IsScalar()) fail(path, "expected a boolean");
        try {
            return node.as<bool>();
        } catch (const YAML::Exception&) {
            fail(path, "expected a boolean, got '" + node.Scalar() + "'");
        }
    }

    std::vector<std::string> scalars(const YAML::Node& node, const std::string& path) const {
        if (node.IsScalar()) return {node.Scalar()};
        if (!node.IsSequence()) fail(path, "expected a list");
        std::vector<std::string> out;
        for (std::size_t i = 0; i < node.size(); ++i) {
            out.push_back(scalar(node[i], path + "[" + std::to_string(i) + "]"));
        }
        return out;
    }

    std::map<std::string, std::string> scalar_map(const YAML::Node& node,
                                                  const std::string& path) const {
        if (!node.IsMap()) fail(path, "expected a mapping");
        std::map<std::string, std::string> out;
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto key = scalar(it->first, path);
            out[key] = scalar(it->second, path + "." + key);
        }
        return out;
    }

    marker read_marker(const YAML::Node& node, const std::string& path) const {
        marker m;
        if (node.IsScalar()) {
            m.name = node.Scalar();
            return m;
        }
        if (!node.IsMap()) fail(path, "expected a marker name or mapping");
        if (!node["name"]) fail(path, "marker without name");
        m.name = scalar(node["name"], path + ".name");
        if (node["types"]) m.types = scalars(node["types"], path + ".types");
        if (node["args"]) m.args = scalar_map(node["args"], path + ".args");
        return m;
    }

    std::vector<marker> read_markers(const YAML::Node& node, const std::string& path) const {
        if (!node.IsSequence()) fail(path, "expected a list");
        std::vector<marker> out;
        for (std::size_t i = 0; i < node.size(); ++i) {
            out.push_back(read_marker(node[i], path + "[" + std::to_string(i) + "]"));
        }
        return out;
    }

    field_declaration read_field(const YAML::Node& node, const std::string& path) const {
        if (!node.IsMap()) fail(path, "expected a mapping");
        field_declaration field;
        if (node["name"]) field.name = scalar(node["name"], path + ".name");
        if (!node["type"]) fail(path, "field without type");
        field.type = scalar(node["type"], path + ".type");
        if (node["markers"]) field.markers = read_markers(node["markers"], path + ".markers");
        return field;
    }

    type_declaration read_type(const YAML::Node& node, const std::string& path) const {
        if (!node.IsMap()) fail(path, "expected a mapping");
        type_declaration decl;
        if (!node["name"]) fail(path, "type without name");
        decl.name = scalar(node["name"], path + ".name");

        if (node["kind"]) {
            auto kind = scalar(node["kind"], path + ".kind");
            if (kind == "class") {
                decl.kind = type_kind::class_type;
            } else if (kind == "interface") {
                decl.kind = type_kind::interface_type;
            } else {
                fail(path + ".kind", "expected 'class' or 'interface', got '" + kind + "'");
            }
        }
        if (node["abstract"]) decl.is_abstract = boolean(node["abstract"], path + ".abstract");
        if (node["generic_parameters"])
            decl.generic_parameters = scalars(node["generic_parameters"], path + ".generic_parameters");
        if (node["constraints"])
            decl.constraints = scalar_map(node["constraints"], path + ".constraints");
        if (node["base"]) decl.base = scalar(node["base"], path + ".base");
        if (node["interfaces"]) decl.interfaces = scalars(node["interfaces"], path + ".interfaces");
        if (node["location"]) decl.location = scalar(node["location"], path + ".location");
        if (node["markers"]) decl.markers = read_markers(node["markers"], path + ".markers");
        if (auto fields = node["fields"]) {
            if (!fields.IsSequence()) fail(path + ".fields", "expected a list");
            for (std::size_t i = 0; i < fields.size(); ++i) {
                decl.fields.push_back(
                    read_field(fields[i], path + ".fields[" + std::to_string(i) + "]"));
            }
        }
        return decl;
    }
};

} // anonymous namespace

declaration_set load_snapshot(const std::filesystem::path& path) {
    DIGEN_LOG_INFO << "Loading declaration snapshot " << path.string();
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        DIGEN_LOG_ERROR << "Failed to load snapshot: " << path.string()
                        << ", Error: " << e.what();
        throw snapshot_error(path.string(), e.what());
    }
    return snapshot_reader(path.string()).read(root);
}

declaration_set parse_snapshot(std::string_view yaml_text, std::string_view source) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        throw snapshot_error(source, e.what());
    }
    return snapshot_reader(std::string(source)).read(root);
}

} // namespace digen
