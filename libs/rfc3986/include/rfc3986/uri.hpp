#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>

namespace rfc3986
{

struct URIError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/** Port text is not a decimal number in [0, 65535]. */
struct MalformedPort : URIError {
    using URIError::URIError;
};

/** Scheme contains a character outside of ALPHA. */
struct InvalidSchemeCharacter : URIError {
    using URIError::URIError;
};

/** Scheme is not a member of the accepted scheme set. */
struct DisallowedScheme : URIError {
    using URIError::URIError;
};

/**
 * Decomposed URI.
 *
 * Per RFC 3986, there are five parts to a URI: scheme, authority,
 * path, query and fragment. The authority (userinfo@host:port) is
 * split into its components and may be re-generated via authority().
 *
 * An absent optional means the component did not occur in the source
 * text, which is different from an empty component.
 *
 * See https://tools.ietf.org/html/rfc3986
 */
struct Uri
{
    std::optional<std::string> scheme;
    std::optional<std::string> userinfo;
    std::string host;
    std::optional<std::uint16_t> port;
    std::optional<std::string> path; /* Without the leading '/' */
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    /**
     * Split a URI string into its components by searching the
     * delimiters "://", "@", ":" and "/" from the left, then "#"
     * and "?" from the right.
     *
     * A host followed by ":" without any later "/" is read as
     * host:port with no path.
     *
     * Throws MalformedPort.
     */
    static Uri fromStr(std::string const& uri);

    /**
     * Generate the authority "userinfo@host:port". Separators of
     * absent components are not emitted. No encoding is applied.
     */
    std::string authority() const;

    /**
     * Recompose the full URI string. Without scheme, a non-empty
     * authority is introduced by "//" (network-path reference).
     */
    std::string build() const;

    /**
     * Check that the scheme (if any) consists of ALPHA only.
     * Digits, "+", "-" and "." are rejected as well.
     *
     * Throws InvalidSchemeCharacter.
     */
    Uri const& validateScheme() const;

    /**
     * Check that the scheme (if any) is one of the given schemes.
     * Comparison is case sensitive.
     *
     * Throws DisallowedScheme.
     */
    Uri const& validateSchemeOneOf(std::set<std::string> const& allowedSchemes) const;

    bool operator==(Uri const& other) const;
    bool operator!=(Uri const& other) const;
};

std::ostream& operator<<(std::ostream& os, Uri const& uri);

}
