/*
 * File: clients/watch_client/watch_client_main.cpp
 * Project: Battle Relay
 * Purpose: Example WebSocket subscriber that prints relay notifications
 * Notes:
 *  - Token is sent as Sec-WebSocket-Protocol "token-<value>"
 *  - --json prints one JSON object per notification
 * Last updated: 2026-10-18
 */

#include <chrono>
#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    std::string ws_url = "ws://127.0.0.1:8080/ws";
    std::string token = "test_token";
    bool as_json = false;
    int ping_count = 0;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--token" && i + 1 < argc)
            token = argv[++i];
        else if (a == "--send" && i + 1 < argc)
            ping_count = std::stoi(argv[++i]);
        else if (a == "--json")
            as_json = true;
    }

    try
    {
        // expect ws://host:port/path
        auto pos = ws_url.find("//");
        auto hp = (pos == std::string::npos) ? ws_url : ws_url.substr(pos + 2);
        auto slash = hp.find('/');
        auto hostport = (slash == std::string::npos) ? hp : hp.substr(0, slash);
        auto target = (slash == std::string::npos) ? std::string("/ws") : hp.substr(slash);
        auto colon = hostport.find(':');
        auto host = hostport.substr(0, colon);
        auto port = (colon == std::string::npos) ? std::string("80") : hostport.substr(colon + 1);

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.set_option(websocket::stream_base::decorator(
            [&token](websocket::request_type &req)
            { req.set(boost::beast::http::field::sec_websocket_protocol, "token-" + token); }));
        ws.handshake(hostport, target);
        std::cerr << "watch: connected to " << ws_url << "\n";

        // optional chatter, e.g. to observe the per-session quota
        for (int k = 0; k < ping_count; ++k)
        {
            ws.text(true);
            ws.write(boost::asio::buffer(std::string("ping ") + std::to_string(k)));
        }

        boost::beast::flat_buffer buf;
        while (true)
        {
            boost::beast::error_code ec;
            ws.read(buf, ec);
            if (ec == websocket::error::closed)
            {
                std::cerr << "watch: closed by server (" << ws.reason().reason << ")\n";
                return 0;
            }
            if (ec)
                throw boost::system::system_error(ec);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            if (as_json)
            {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
                std::cout << json{{"t_ms", ms}, {"text", s}}.dump() << std::endl;
            }
            else
            {
                std::cout << s << std::endl;
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "watch error: " << e.what() << "\n";
        return 1;
    }
}
