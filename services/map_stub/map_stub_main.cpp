/*
 * File: services/map_stub/map_stub_main.cpp
 * Project: Battle Relay
 * Purpose: Local stand-in for the map page, for running the relay offline
 * Notes:
 *  - --file serves an HTML file, re-read on every request
 *  - Without --file a built-in 3x3 map is served whose centre cell toggles
 *    its marker every --toggle seconds
 * Last updated: 2026-10-18
 */

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace http = boost::beast::http;

static std::string demo_page(bool marked)
{
    static const char *cols[] = {"A", "B", "C"};
    std::ostringstream html;
    html << "<html><body><div class=\"map\">\n";
    for (int r = 1; r <= 3; ++r)
    {
        for (auto *c : cols)
        {
            bool centre = (r == 2 && std::string(c) == "B");
            html << "  <div class=\"map-cell\">"
                 << "<span class=\"bottom-left-text\">" << ((centre && marked) ? "&#9876;" : "") << "</span>"
                 << "<span class=\"bottom-right-text\">" << c << "</span>"
                 << "<span class=\"top-right-text\">#" << r << "</span>"
                 << "</div>\n";
        }
    }
    html << "</div></body></html>\n";
    return html.str();
}

static bool read_file_all(const std::string &p, std::string &out)
{
    std::ifstream f(p);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char **argv)
{
    std::string bind = "127.0.0.1:8081";
    std::string file;
    long toggle_s = 120;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--bind" && i + 1 < argc)
            bind = argv[++i];
        else if (a == "--file" && i + 1 < argc)
            file = argv[++i];
        else if (a == "--toggle" && i + 1 < argc)
            toggle_s = std::stol(argv[++i]);
    }
    if (toggle_s <= 0)
        toggle_s = 1;

    try
    {
        auto p = bind.find(':');
        boost::asio::io_context ioc{1};
        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address(bind.substr(0, p)),
                                          static_cast<unsigned short>(std::stoi(bind.substr(p + 1)))};
        boost::asio::ip::tcp::acceptor acceptor{ioc, ep};
        const auto start = std::chrono::steady_clock::now();
        std::cout << "map_stub listening on " << bind << (file.empty() ? " (demo map)" : " file=" + file) << "\n";

        for (;;)
        {
            boost::asio::ip::tcp::socket sock{ioc};
            acceptor.accept(sock);
            boost::beast::flat_buffer buf;
            http::request<http::string_body> req;
            boost::beast::error_code ec;
            http::read(sock, buf, req, ec);
            if (ec)
                continue;

            http::response<http::string_body> res{http::status::ok, req.version()};
            res.set(http::field::server, "map-stub");
            res.set(http::field::content_type, "text/html; charset=utf-8");
            if (!file.empty())
            {
                std::string body;
                if (read_file_all(file, body))
                    res.body() = body;
                else
                {
                    res.result(http::status::internal_server_error);
                    res.body() = "cannot read " + file;
                }
            }
            else
            {
                auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start).count();
                res.body() = demo_page((elapsed / toggle_s) % 2 == 0);
            }
            res.prepare_payload();
            http::write(sock, res, ec);
            sock.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
            std::cout << "map_stub: " << req.method_string() << " " << req.target() << " -> " << res.result_int() << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "map_stub error: " << e.what() << "\n";
        return 1;
    }
}
