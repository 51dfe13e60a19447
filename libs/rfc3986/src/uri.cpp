#include "rfc3986/uri.hpp"

#include <charconv>
#include <string_view>

#include "rfc3986/abnf.hpp"
#include "rfc3986/log.hpp"
#include "fmt/format.h"

namespace rfc3986
{

namespace
{

std::optional<std::string> nonEmpty(std::string_view str)
{
    if (str.empty())
        return {};
    return std::string(str);
}

std::uint16_t parsePort(std::string_view portStr, std::string const& uri)
{
    std::uint16_t port = 0u;
    auto const* begin = portStr.data();
    auto const* end = portStr.data() + portStr.size();

    auto [ptr, ec] = std::from_chars(begin, end, port);
    // Leading zeros would not survive authority()
    bool leadingZero = portStr.size() > 1u && portStr.front() == '0';
    if (portStr.empty() || leadingZero || ec != std::errc() || ptr != end)
        throw logRuntimeError<MalformedPort>(
            fmt::format("[Uri::fromStr] Invalid port '{}' in URI '{}'", portStr, uri));

    return port;
}

/**
 * Cut the fragment off the end of `rest`, searching for the last '#'.
 */
std::optional<std::string> cutFragment(std::string_view& rest)
{
    auto pos = rest.rfind('#');
    if (pos == std::string_view::npos)
        return {};

    std::string fragment(rest.substr(pos + 1u));
    rest = rest.substr(0u, pos);
    return fragment;
}

/**
 * Cut the query off the end of `rest`, searching for the last '?'.
 * Must run after cutFragment.
 */
std::optional<std::string> cutQuery(std::string_view& rest)
{
    auto pos = rest.rfind('?');
    if (pos == std::string_view::npos)
        return {};

    std::string query(rest.substr(pos + 1u));
    rest = rest.substr(0u, pos);
    return query;
}

void printOptional(std::ostream& os, char const* name, std::optional<std::string> const& value)
{
    os << name << '=';
    if (value)
        os << '"' << *value << '"';
    else
        os << "<none>";
}

}

Uri Uri::fromStr(std::string const& uri)
{
    Uri result;
    std::string_view rest = uri;

    /* Scheme */
    if (auto pos = rest.find("://"); pos != std::string_view::npos) {
        result.scheme = std::string(rest.substr(0u, pos));
        rest = rest.substr(pos + 3u);
    }

    /* Network-path reference, https://tools.ietf.org/html/rfc3986#section-4.2 */
    if (!result.scheme && rest.substr(0u, 2u) == "//")
        rest = rest.substr(2u);

    /* User information, only the first '@' counts */
    if (auto pos = rest.find('@'); pos != std::string_view::npos) {
        result.userinfo = std::string(rest.substr(0u, pos));
        rest = rest.substr(pos + 1u);
    }

    /* Host + port */
    if (auto colon = rest.find(':'); colon != std::string_view::npos) {
        result.host = std::string(rest.substr(0u, colon));
        auto afterColon = rest.substr(colon + 1u);

        auto slash = afterColon.find('/');
        if (slash != std::string_view::npos) {
            result.port = parsePort(afterColon.substr(0u, slash), uri);
            rest = afterColon.substr(slash + 1u);
        } else {
            result.port = parsePort(afterColon, uri);
            rest = {};
        }
    } else if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        result.host = std::string(rest.substr(0u, slash));
        rest = rest.substr(slash + 1u);
    } else {
        result.host = std::string(rest);
        rest = {};
    }

    /* Fragment and query, both searched from the right */
    if (!rest.empty()) {
        result.fragment = cutFragment(rest);
        result.query = cutQuery(rest);
    }

    result.path = nonEmpty(rest);

    if (log().should_log(spdlog::level::trace))
        log().trace("[Uri::fromStr] '{}' -> host '{}', authority '{}'",
                    uri, result.host, result.authority());
    return result;
}

std::string Uri::authority() const
{
    std::string result;

    if (userinfo) {
        result += *userinfo;
        result.push_back('@');
    }

    result += host;

    if (port) {
        result.push_back(':');
        result += std::to_string(*port);
    }

    return result;
}

std::string Uri::build() const
{
    std::string result;
    auto auth = authority();

    if (scheme)
        result += *scheme + "://";
    else if (!auth.empty())
        result += "//";

    result += auth;

    /* Without '/', query and fragment would be read as part of the host */
    if (path)
        result += "/" + *path;
    else if (query || fragment)
        result.push_back('/');
    if (query)
        result += "?" + *query;
    if (fragment)
        result += "#" + *fragment;

    return result;
}

Uri const& Uri::validateScheme() const
{
    if (!scheme)
        return *this;

    for (auto c : *scheme) {
        if (!isAlpha(c))
            throw logRuntimeError<InvalidSchemeCharacter>(
                fmt::format("[Uri::validateScheme] '{}' is not valid in URI scheme '{}'", c, *scheme));
    }

    return *this;
}

Uri const& Uri::validateSchemeOneOf(std::set<std::string> const& allowedSchemes) const
{
    if (!scheme)
        return *this;

    if (allowedSchemes.find(*scheme) == allowedSchemes.end())
        throw logRuntimeError<DisallowedScheme>(
            fmt::format("[Uri::validateSchemeOneOf] '{}' is not in the set of allowed schemes", *scheme));

    return *this;
}

bool Uri::operator==(Uri const& other) const
{
    return scheme == other.scheme &&
        userinfo == other.userinfo &&
        host == other.host &&
        port == other.port &&
        path == other.path &&
        query == other.query &&
        fragment == other.fragment;
}

bool Uri::operator!=(Uri const& other) const
{
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, Uri const& uri)
{
    os << "Uri{";
    printOptional(os, "scheme", uri.scheme);
    os << ", ";
    printOptional(os, "userinfo", uri.userinfo);
    os << ", host=\"" << uri.host << "\", port=";
    if (uri.port)
        os << *uri.port;
    else
        os << "<none>";
    os << ", ";
    printOptional(os, "path", uri.path);
    os << ", ";
    printOptional(os, "query", uri.query);
    os << ", ";
    printOptional(os, "fragment", uri.fragment);
    return os << '}';
}

}
