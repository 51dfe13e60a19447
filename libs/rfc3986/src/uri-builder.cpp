#include "rfc3986/uri-builder.hpp"

#include "rfc3986/log.hpp"

namespace rfc3986
{

UriBuilder& UriBuilder::addScheme(std::string scheme)
{
    uri_.scheme = std::move(scheme);
    return *this;
}

UriBuilder& UriBuilder::addUserinfo(std::string const& username,
                                    std::optional<std::string> const& password)
{
    uri_.userinfo = password ? username + ":" + *password : username;
    return *this;
}

UriBuilder& UriBuilder::addHost(std::string host)
{
    uri_.host = std::move(host);
    return *this;
}

UriBuilder& UriBuilder::addPort(std::uint16_t port)
{
    uri_.port = port;
    return *this;
}

UriBuilder& UriBuilder::addPath(std::string path)
{
    if (!path.empty() && path.front() == '/')
        path.erase(0u, 1u);

    uri_.path = std::move(path);
    return *this;
}

UriBuilder& UriBuilder::addQueryString(std::string query)
{
    uri_.query = std::move(query);
    return *this;
}

template <class _Iter>
UriBuilder& UriBuilder::addQueryPairs(_Iter begin, _Iter end)
{
    std::string query;
    for (auto it = begin; it != end; ++it) {
        if (it != begin)
            query.push_back('&');
        query += it->first + "=" + it->second;
    }

    log().trace("[UriBuilder::addQuery] Generated query '{}'", query);
    uri_.query = std::move(query);
    return *this;
}

UriBuilder& UriBuilder::addQueryMap(QueryMap const& query)
{
    return addQueryPairs(query.begin(), query.end());
}

UriBuilder& UriBuilder::addQueryList(QueryList const& query)
{
    return addQueryPairs(query.begin(), query.end());
}

UriBuilder& UriBuilder::addFragment(std::string fragment)
{
    uri_.fragment = std::move(fragment);
    return *this;
}

Uri UriBuilder::finalize() const
{
    return uri_;
}

}
