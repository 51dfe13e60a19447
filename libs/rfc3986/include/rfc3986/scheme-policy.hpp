#pragma once

#include <set>
#include <string>
#include <optional>

#include "rfc3986/uri.hpp"

namespace rfc3986
{

struct SchemePolicyError : URIError {
    using URIError::URIError;
};

/**
 * Declarative set of scheme checks, read from YAML:
 *
 *   scheme-policy:
 *     alphabetic-only: true
 *     allowed-schemes: [https, git]
 *
 * The `scheme-policy` key may be omitted, in which case the
 * document root holds the policy fields.
 */
struct SchemePolicy
{
    /**
     * Default policy: alphabetic-only, any scheme allowed.
     */
    SchemePolicy() = default;

    /**
     * Parse a policy from a YAML string.
     *
     * Throws SchemePolicyError.
     */
    explicit SchemePolicy(std::string const& yamlConf);

    /**
     * Parse a policy from a YAML file.
     *
     * Throws SchemePolicyError.
     */
    static SchemePolicy fromFile(std::string const& path);

    /**
     * Load the policy from the file named by RFC3986_SETTINGS_FILE.
     * Returns the default policy if the variable is unset or does
     * not name a regular file.
     *
     * Throws SchemePolicyError.
     */
    static SchemePolicy load();

    /** Run Uri::validateScheme. */
    bool alphabeticOnly = true;

    /** Run Uri::validateSchemeOneOf with this set, if present. */
    std::optional<std::set<std::string>> allowedSchemes;

    /**
     * Apply the enabled checks to the URI, charset check first.
     *
     * Throws InvalidSchemeCharacter, DisallowedScheme.
     */
    Uri const& apply(Uri const& uri) const;

    /**
     * Convert this policy to a YAML string, which may be
     * passed to the `SchemePolicy(yamlConf)` constructor.
     */
    std::string toYaml() const;
};

}
