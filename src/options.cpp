#include "digen/options.hpp"
#include "digen/exceptions.hpp"
#include "digen/log.hpp"
#include "string_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace digen {

namespace {

template <typename T>
T scalar_as(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw config_error(key, "expected a scalar value");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw config_error(key, e.what());
    }
}

std::vector<std::string> string_list(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence()) {
        throw config_error(key, "expected a list");
    }
    std::vector<std::string> out;
    for (std::size_t i = 0; i < node.size(); ++i) {
        out.push_back(scalar_as<std::string>(node[i], key + "[" + std::to_string(i) + "]"));
    }
    return out;
}

void read_diagnostics(const YAML::Node& node, analysis_options& options) {
    if (!node.IsMap()) throw config_error("diagnostics", "expected a mapping");
    if (node["enabled"])
        options.diagnostics.enabled = scalar_as<bool>(node["enabled"], "diagnostics.enabled");
    if (node["lifetime_validation"])
        options.lifetime_validation =
            scalar_as<bool>(node["lifetime_validation"], "diagnostics.lifetime_validation");
    if (auto sev = node["severity"]) {
        if (!sev.IsMap()) throw config_error("diagnostics.severity", "expected a mapping");
        for (auto it = sev.begin(); it != sev.end(); ++it) {
            auto code_text = scalar_as<std::string>(it->first, "diagnostics.severity");
            auto key = "diagnostics.severity." + code_text;
            auto code = find_code(code_text);
            if (!code) throw config_error(key, "unknown diagnostic '" + code_text + "'");
            auto level_text = scalar_as<std::string>(it->second, key);
            auto level = parse_severity(level_text);
            if (!level) throw config_error(key, "unknown severity '" + level_text + "'");
            options.diagnostics.overrides[*code] = *level;
        }
    }
}

void read_sections(const YAML::Node& root, analysis_options& options) {
    if (root.IsNull()) return;
    if (!root.IsMap()) throw config_error("", "top level must be a mapping");

    if (auto node = root["diagnostics"]) read_diagnostics(node, options);

    if (auto node = root["defaults"]) {
        if (node["lifetime"]) {
            auto text = scalar_as<std::string>(node["lifetime"], "defaults.lifetime");
            auto lt = parse_lifetime(text);
            if (!lt) throw config_error("defaults.lifetime", "unknown lifetime '" + text + "'");
            options.default_lifetime = *lt;
        }
    }

    if (auto node = root["naming"]) {
        if (node["leading_marker"]) {
            auto text = scalar_as<std::string>(node["leading_marker"], "naming.leading_marker");
            if (text.size() != 1)
                throw config_error("naming.leading_marker", "expected a single character");
            options.leading_marker = text.front();
        }
    }

    if (auto node = root["analysis"]) {
        if (node["collection_wrappers"])
            options.collection_wrappers =
                string_list(node["collection_wrappers"], "analysis.collection_wrappers");
        if (node["external_prefixes"])
            options.external_prefixes =
                string_list(node["external_prefixes"], "analysis.external_prefixes");
    }

    if (auto node = root["generation"]) {
        auto& gen = options.generation;
        if (node["unit"]) gen.unit = scalar_as<std::string>(node["unit"], "generation.unit");
        if (node["namespace"])
            gen.namespace_name = scalar_as<std::string>(node["namespace"], "generation.namespace");
        if (node["environment_variable"])
            gen.environment_variable = scalar_as<std::string>(
                node["environment_variable"], "generation.environment_variable");
        if (node["configuration_type"])
            gen.configuration_type = scalar_as<std::string>(
                node["configuration_type"], "generation.configuration_type");
        auto valid_identifier = [](const std::string& s) {
            return !s.empty()
                && (std::isalpha(static_cast<unsigned char>(s.front())) || s.front() == '_')
                && std::all_of(s.begin(), s.end(), [](char c) {
                       return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
                   });
        };
        if (!valid_identifier(gen.unit))
            throw config_error("generation.unit", "'" + gen.unit + "' is not an identifier");
        if (gen.environment_variable.empty())
            throw config_error("generation.environment_variable", "must not be empty");
        if (internal::is_blank(gen.configuration_type))
            throw config_error("generation.configuration_type", "must not be empty");
    }
}

} // anonymous namespace

bool analysis_options::is_collection_wrapper(const type_ref& type) const {
    if (type.arity() != 1) return false;
    return std::any_of(collection_wrappers.begin(), collection_wrappers.end(),
                       [&](const std::string& w) {
                           return type.name == w || type.simple_name() == w;
                       });
}

bool analysis_options::is_assumed_external(const type_ref& type) const {
    return std::any_of(external_prefixes.begin(), external_prefixes.end(),
                       [&](const std::string& prefix) {
                           return !prefix.empty() && internal::starts_with(type.name, prefix);
                       });
}

analysis_options load_options(const std::filesystem::path& path) {
    DIGEN_LOG_INFO << "Loading options from " << path.string();
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        DIGEN_LOG_ERROR << "Failed to load options file: " << path.string()
                        << ", Error: " << e.what();
        throw config_error(path.string(), e.what());
    }
    analysis_options options;
    read_sections(root, options);
    return options;
}

analysis_options parse_options(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::Exception& e) {
        throw config_error("", e.what());
    }
    analysis_options options;
    read_sections(root, options);
    return options;
}

} // namespace digen
