#include "rfc3986/scheme-policy.hpp"
#include "rfc3986/log.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>

#include "fmt/format.h"
#include "yaml-cpp/yaml.h"

using namespace rfc3986;

namespace YAML
{

template <>
struct convert<SchemePolicy>
{
    static Node encode(const SchemePolicy& p)
    {
        Node node;
        node["alphabetic-only"] = p.alphabeticOnly;
        if (p.allowedSchemes) {
            Node schemes(NodeType::Sequence);
            for (auto const& scheme : *p.allowedSchemes)
                schemes.push_back(scheme);
            node["allowed-schemes"] = schemes;
        }

        return node;
    }

    static bool decode(const Node& node, SchemePolicy& p)
    {
        if (node.IsNull()) {
            p = SchemePolicy();
            return true;
        }

        if (!node.IsMap())
            return false;

        for (auto const& entry : node) {
            auto key = entry.first.as<std::string>();
            if (key != "alphabetic-only" && key != "allowed-schemes")
                rfc3986::log().warn("[SchemePolicy] Ignoring unknown key '{}'", key);
        }

        if (auto alphabeticOnly = node["alphabetic-only"])
            p.alphabeticOnly = alphabeticOnly.as<bool>();

        if (auto allowedSchemes = node["allowed-schemes"]) {
            if (!allowedSchemes.IsSequence())
                return false;

            p.allowedSchemes.emplace();
            for (auto const& scheme : allowedSchemes)
                p.allowedSchemes->insert(scheme.as<std::string>());
        }

        return true;
    }
};

}

namespace
{

SchemePolicy policyFromNode(YAML::Node const& document, std::string const& origin)
{
    // Empty document
    if (document.IsNull())
        return {};

    try {
        YAML::Node const node = (document.IsMap() && document["scheme-policy"])
            ? document["scheme-policy"]
            : document;

        return node.as<SchemePolicy>();
    }
    catch (const YAML::Exception& e) {
        throw logRuntimeError<SchemePolicyError>(
            fmt::format("[SchemePolicy] Invalid scheme policy in {}: {}", origin, e.what()));
    }
}

}

SchemePolicy::SchemePolicy(std::string const& yamlConf)
{
    YAML::Node parsedYaml;
    try {
        parsedYaml = YAML::Load(yamlConf);
    }
    catch (const YAML::Exception& e) {
        throw logRuntimeError<SchemePolicyError>(
            fmt::format("[SchemePolicy] Failed to parse YAML: {}", e.what()));
    }

    *this = policyFromNode(parsedYaml, "YAML string");
}

SchemePolicy SchemePolicy::fromFile(std::string const& path)
{
    YAML::Node document;
    try {
        log().debug("Loading scheme policy from '{}'...", path);
        document = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e) {
        throw logRuntimeError<SchemePolicyError>(
            fmt::format("[SchemePolicy::fromFile] Failed to read '{}': {}", path, e.what()));
    }

    auto result = policyFromNode(document, fmt::format("'{}'", path));
    log().debug("  ...Done.");
    return result;
}

SchemePolicy SchemePolicy::load()
{
    auto settingsFile = std::getenv("RFC3986_SETTINGS_FILE");
    if (!settingsFile || std::strcmp(settingsFile, "") == 0) {
        log().debug("RFC3986_SETTINGS_FILE environment variable is empty.");
        return {};
    }

    if (!std::filesystem::is_regular_file(settingsFile)) {
        log().debug("The RFC3986_SETTINGS_FILE path '{}' is not a file.", settingsFile);
        return {};
    }

    return fromFile(settingsFile);
}

Uri const& SchemePolicy::apply(Uri const& uri) const
{
    if (alphabeticOnly)
        uri.validateScheme();

    if (allowedSchemes)
        uri.validateSchemeOneOf(*allowedSchemes);

    return uri;
}

std::string SchemePolicy::toYaml() const
{
    YAML::Node document;
    document["scheme-policy"] = *this;
    return YAML::Dump(document);
}
