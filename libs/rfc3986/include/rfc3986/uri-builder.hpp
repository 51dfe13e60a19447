#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rfc3986/uri.hpp"

namespace rfc3986
{

/**
 * Mutable accumulator for Uri records.
 *
 * Each setter stores its value and returns the builder for chaining.
 * No percent-encoding or host validation is performed.
 * A builder instance is not synchronized; use one per call sequence.
 */
class UriBuilder
{
public:
    /** Unordered key-value query parameters. */
    using QueryMap = std::unordered_map<std::string, std::string>;

    /** Ordered key-value query parameters. */
    using QueryList = std::vector<std::pair<std::string, std::string>>;

    UriBuilder() = default;

    UriBuilder& addScheme(std::string scheme);

    /**
     * Store "username" or "username:password" as userinfo.
     */
    UriBuilder& addUserinfo(std::string const& username,
                            std::optional<std::string> const& password = {});

    UriBuilder& addHost(std::string host);
    UriBuilder& addPort(std::uint16_t port);

    /**
     * Store the path, with exactly one leading '/' removed.
     */
    UriBuilder& addPath(std::string path);

    /**
     * Store a raw query string. Replaces any previous query.
     */
    UriBuilder& addQueryString(std::string query);

    /**
     * Generate the query as "k=v&k=v..." from a map.
     *
     * The pair order of the generated query follows the map's
     * iteration order and is thus unspecified. Use addQueryList()
     * if a deterministic query string is required.
     */
    UriBuilder& addQueryMap(QueryMap const& query);

    /**
     * Generate the query as "k=v&k=v..." in the given order.
     */
    UriBuilder& addQueryList(QueryList const& query);

    UriBuilder& addFragment(std::string fragment);

    /**
     * Create the Uri record. The host defaults to an empty string,
     * components which were never added are absent.
     */
    Uri finalize() const;

private:
    template <class _Iter>
    UriBuilder& addQueryPairs(_Iter begin, _Iter end);

    Uri uri_;
};

}
