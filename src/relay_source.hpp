/*
 * File: src/relay_source.hpp
 * Project: Battle Relay
 * Purpose: Map page event source: HTTP(S) fetch and map-cell extraction
 * Notes:
 *  - poll() throws FetchError (network, non-2xx) or FormatError (bad URL)
 *  - extract_cells() parses with gumbo (HTML5 tree rules) and keeps raw
 *    text; sanitizing happens in the scheduler
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <gumbo.h>
#include <openssl/ssl.h>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/log.hpp"

// -------- snapshot model --------

struct CellObservation
{
    std::string marker_text;  // .bottom-left-text
    std::string bottom_right; // .bottom-right-text
    std::string top_right;    // .top-right-text
};

using Snapshot = std::vector<CellObservation>;

struct FetchError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct FormatError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

class EventSource
{
public:
    virtual ~EventSource() = default;
    virtual Snapshot poll() = 0;
};

// -------- html scanning --------

namespace html_detail
{

inline bool is_element(const GumboNode *node)
{
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

// Whitespace-separated class list match.
inline bool has_class(const GumboNode *node, std::string_view wanted)
{
    const GumboAttribute *attr = gumbo_get_attribute(&node->v.element.attributes, "class");
    if (!attr)
        return false;
    std::string_view classes(attr->value);
    std::size_t i = 0;
    while (i < classes.size())
    {
        while (i < classes.size() && std::isspace(static_cast<unsigned char>(classes[i])))
            ++i;
        std::size_t j = i;
        while (j < classes.size() && !std::isspace(static_cast<unsigned char>(classes[j])))
            ++j;
        if (j > i && classes.substr(i, j - i) == wanted)
            return true;
        i = j;
    }
    return false;
}

// Concatenated text of the subtree, entities already decoded by the parser.
inline void append_text(const GumboNode *node, std::string &out)
{
    switch (node->type)
    {
    case GUMBO_NODE_TEXT:
    case GUMBO_NODE_WHITESPACE:
    case GUMBO_NODE_CDATA:
        out += node->v.text.text;
        return;
    case GUMBO_NODE_ELEMENT:
    case GUMBO_NODE_TEMPLATE:
        break;
    default:
        return;
    }
    const GumboVector &children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i)
        append_text(static_cast<const GumboNode *>(children.data[i]), out);
}

// First descendant in document order carrying `cls`.
inline const GumboNode *find_descendant(const GumboNode *node, std::string_view cls)
{
    const GumboVector &children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i)
    {
        auto *child = static_cast<const GumboNode *>(children.data[i]);
        if (!is_element(child))
            continue;
        if (has_class(child, cls))
            return child;
        if (auto *hit = find_descendant(child, cls))
            return hit;
    }
    return nullptr;
}

inline std::string text_of(const GumboNode *cell, std::string_view cls)
{
    std::string out;
    if (auto *node = find_descendant(cell, cls))
        append_text(node, out);
    return out;
}

inline void collect_cells(const GumboNode *node, Snapshot &cells)
{
    if (!is_element(node))
        return;
    if (has_class(node, "map-cell"))
        cells.push_back(CellObservation{text_of(node, "bottom-left-text"),
                                        text_of(node, "bottom-right-text"),
                                        text_of(node, "top-right-text")});
    const GumboVector &children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i)
        collect_cells(static_cast<const GumboNode *>(children.data[i]), cells);
}

struct GumboOutputDeleter
{
    void operator()(GumboOutput *out) const { gumbo_destroy_output(&kGumboDefaultOptions, out); }
};

} // namespace html_detail

// One observation per element with class "map-cell", in document order.
// Missing fields come back empty.
inline Snapshot extract_cells(std::string_view html)
{
    Snapshot cells;
    if (html.empty())
        return cells;
    std::unique_ptr<GumboOutput, html_detail::GumboOutputDeleter> doc(
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    html_detail::collect_cells(doc->root, cells);
    return cells;
}

// -------- url / fetch --------

struct ParsedUrl
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Accepts http://host[:port][/path] and https://...
inline ParsedUrl parse_url(const std::string &url)
{
    ParsedUrl u;
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw FormatError("URL without scheme: " + url);
    u.scheme = url.substr(0, scheme_pos);
    for (auto &c : u.scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (u.scheme != "http" && u.scheme != "https")
        throw FormatError("unsupported URL scheme: " + u.scheme);

    auto rest = url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    u.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hp.rfind(':');
    if (colon == std::string::npos)
    {
        u.host = hp;
        u.port = (u.scheme == "https") ? "443" : "80";
    }
    else
    {
        u.host = hp.substr(0, colon);
        u.port = hp.substr(colon + 1);
    }
    if (u.host.empty() || u.port.empty())
        throw FormatError("malformed URL: " + url);
    return u;
}

class MapPageSource : public EventSource
{
    std::string url_;
    std::chrono::seconds timeout_;
    boost::asio::ssl::context tls_{boost::asio::ssl::context::tls_client};

    static constexpr int kMaxRedirects = 5;

    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    // Drives write+read on an already connected stream.
    template <class Stream>
    static void exchange(Stream &stream, const ParsedUrl &u, Response &res, std::string &err, bool &done)
    {
        namespace http = boost::beast::http;
        auto req = std::make_shared<http::request<http::empty_body>>(http::verb::get, u.target, 11);
        req->set(http::field::host, u.host);
        req->set(http::field::user_agent, "battle-relay " BOOST_BEAST_VERSION_STRING);
        req->set(http::field::accept, "text/html,*/*");
        auto buffer = std::make_shared<boost::beast::flat_buffer>();
        http::async_write(stream, *req, [&stream, &res, &err, &done, req, buffer](boost::beast::error_code ec, std::size_t)
                          {
            if (ec) { err = "write: " + ec.message(); return; }
            http::async_read(stream, *buffer, res, [&err, &done, buffer](boost::beast::error_code ec, std::size_t)
                             {
                if (ec) { err = "read: " + ec.message(); return; }
                done = true; }); });
    }

    Response fetch_once(const ParsedUrl &u)
    {
        namespace beast = boost::beast;
        namespace ssl = boost::asio::ssl;
        using tcp = boost::asio::ip::tcp;

        boost::asio::io_context ioc;
        tcp::resolver resolver{ioc};
        Response res;
        std::string err;
        bool done = false;

        beast::tcp_stream plain{ioc};
        beast::ssl_stream<beast::tcp_stream> secure{ioc, tls_};
        const bool tls = (u.scheme == "https");
        if (tls)
        {
            if (!SSL_set_tlsext_host_name(secure.native_handle(), u.host.c_str()))
                throw FetchError("failed to set SNI host name");
            secure.set_verify_callback(ssl::host_name_verification(u.host));
        }

        resolver.async_resolve(u.host, u.port, [&](beast::error_code ec, tcp::resolver::results_type results)
                               {
            if (ec) { err = "resolve: " + ec.message(); return; }
            auto &lowest = tls ? beast::get_lowest_layer(secure) : plain;
            lowest.expires_after(timeout_);
            lowest.async_connect(results, [&](beast::error_code ec, tcp::endpoint)
                                 {
                if (ec) { err = "connect: " + ec.message(); return; }
                if (!tls)
                    return exchange(plain, u, res, err, done);
                secure.async_handshake(ssl::stream_base::client, [&](beast::error_code ec)
                                       {
                    if (ec) { err = "tls handshake: " + ec.message(); return; }
                    exchange(secure, u, res, err, done); }); }); });

        ioc.run_for(timeout_);
        if (!done)
            throw FetchError(u.host + u.target + ": " + (err.empty() ? std::string("timed out") : err));

        beast::error_code ignored;
        if (!tls)
            plain.socket().shutdown(tcp::socket::shutdown_both, ignored);
        return res;
    }

public:
    explicit MapPageSource(std::string url, std::chrono::seconds timeout = std::chrono::seconds(30))
        : url_(std::move(url)), timeout_(timeout)
    {
        tls_.set_default_verify_paths();
        tls_.set_verify_mode(boost::asio::ssl::verify_peer);
        parse_url(url_); // reject bad URLs at start-up
    }

    const std::string &url() const { return url_; }

    std::string fetch_body()
    {
        namespace http = boost::beast::http;
        std::string url = url_;
        for (int hop = 0; hop <= kMaxRedirects; ++hop)
        {
            ParsedUrl u = parse_url(url);
            log_debug("source", "GET ", url);
            Response res = fetch_once(u);
            auto code = res.result_int();
            log_info("source", "received response from ", url, " with status ", code);

            if (code >= 300 && code < 400 && res.count(http::field::location))
            {
                auto lv = res[http::field::location];
                std::string loc(lv.data(), lv.size());
                url = (loc.rfind("http", 0) == 0) ? loc : u.scheme + "://" + u.host + ":" + u.port + loc;
                continue;
            }
            if (code < 200 || code >= 300)
                throw FetchError("HTTP error: " + std::to_string(code));
            return std::move(res.body());
        }
        throw FetchError("too many redirects fetching " + url_);
    }

    Snapshot poll() override
    {
        auto body = fetch_body();
        log_debug("source", "response body ", body.size(), " bytes");
        return extract_cells(body);
    }
};
