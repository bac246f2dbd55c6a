/*
 * File: tests/test_http_endpoints.cpp
 * Project: Battle Relay
 * Purpose: HTTP routing, WebSocket auth gate, fan-out and session quota over
 *          a loopback listener
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

#include "relay_http.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;
using WsClient = websocket::stream<tcp::socket>;

static const std::string kSwords = "\xE2\x9A\x94";

struct RelayFixture
{
    RelayState state{"test_token"};
    net::io_context ioc;
    HttpServer server{ioc, {net::ip::make_address("127.0.0.1"), 0}, state};
    std::thread th;

    RelayFixture()
    {
        th = std::thread([this]
                         { ioc.run(); });
    }
    ~RelayFixture()
    {
        server.stop();
        ioc.stop();
        th.join();
    }

    std::string port() const { return std::to_string(server.local_endpoint().port()); }

    http::response<http::string_body> get(const std::string &target)
    {
        net::io_context c;
        tcp::resolver r{c};
        tcp::socket sock{c};
        net::connect(sock, r.resolve("127.0.0.1", port()));
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "127.0.0.1");
        http::write(sock, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> res;
        http::read(sock, buf, res);
        return res;
    }

    // Performs the upgrade; on refusal returns nullptr with the server reply in `res`.
    std::unique_ptr<WsClient> connect(net::io_context &c, std::optional<std::string> protocol,
                                      websocket::response_type &res, const std::string &target = "/ws")
    {
        tcp::resolver r{c};
        tcp::socket sock{c};
        net::connect(sock, r.resolve("127.0.0.1", port()));
        auto ws = std::make_unique<WsClient>(std::move(sock));
        if (protocol)
            ws->set_option(websocket::stream_base::decorator(
                [p = *protocol](websocket::request_type &req)
                { req.set(http::field::sec_websocket_protocol, p); }));
        boost::beast::error_code ec;
        ws->handshake(res, "127.0.0.1", target, ec);
        if (ec)
            return nullptr;
        return ws;
    }

    std::unique_ptr<WsClient> connect(net::io_context &c)
    {
        websocket::response_type res;
        auto ws = connect(c, std::string("token-test_token"), res);
        REQUIRE(ws.get() != nullptr);
        return ws;
    }
};

static std::string read_text(WsClient &ws)
{
    boost::beast::flat_buffer buf;
    ws.read(buf);
    return boost::beast::buffers_to_string(buf.data());
}

static void send_text(WsClient &ws, const std::string &s)
{
    ws.text(true);
    ws.write(net::buffer(s));
}

static bool eventually(const std::function<bool()> &pred)
{
    for (int i = 0; i < 500; ++i)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

static MarkerEvent event_at(const char *br, const char *tr) { return MarkerEvent{*Location::make(br, tr)}; }

TEST_CASE("health endpoints answer ok")
{
    RelayFixture f;
    for (auto *target : {"/", "/health"})
    {
        auto res = f.get(target);
        REQUIRE(res.result() == http::status::ok);
        auto j = nlohmann::json::parse(res.body());
        REQUIRE(j["status"] == "ok");
    }
}

TEST_CASE("status endpoint reports counters and unknown routes are 404")
{
    RelayFixture f;
    f.state.markers.mark_active(*Location::make("X1", "Y2"));
    auto res = f.get("/v1/status");
    REQUIRE(res.result() == http::status::ok);
    auto j = nlohmann::json::parse(res.body());
    REQUIRE(j["active_sessions"] == 0);
    REQUIRE(j["active_markers"] == 1);

    REQUIRE(f.get("/nope").result() == http::status::not_found);
}

TEST_CASE("handshake without a valid token is refused before registration")
{
    RelayFixture f;
    net::io_context c;

    websocket::response_type missing;
    REQUIRE(!f.connect(c, std::nullopt, missing));
    REQUIRE(missing.result() == http::status::unauthorized);

    websocket::response_type wrong;
    REQUIRE(!f.connect(c, std::string("token-nope"), wrong));
    REQUIRE(wrong.result() == http::status::unauthorized);

    websocket::response_type bare;
    REQUIRE(!f.connect(c, std::string("test_token"), bare));
    REQUIRE(bare.result() == http::status::unauthorized);

    REQUIRE(f.state.clients.size() == 0);
    REQUIRE(f.state.events.subscriber_count() == 0);
}

TEST_CASE("upgrade on another path is not found")
{
    RelayFixture f;
    net::io_context c;
    websocket::response_type res;
    REQUIRE(!f.connect(c, std::string("token-test_token"), res, "/chat"));
    REQUIRE(res.result() == http::status::not_found);
}

TEST_CASE("valid token gets the welcome text first and is cleaned up on close")
{
    RelayFixture f;
    net::io_context c;
    websocket::response_type res;
    auto ws = f.connect(c, std::string("token-test_token"), res);
    REQUIRE(ws.get() != nullptr);
    REQUIRE(res[http::field::sec_websocket_protocol] == "token-test_token");

    REQUIRE(read_text(*ws) == kWelcomeText);
    REQUIRE(f.state.clients.size() == 1);

    ws->close(websocket::close_code::normal);
    REQUIRE(eventually([&]
                       { return f.state.clients.size() == 0; }));
    REQUIRE(eventually([&]
                       { return f.state.events.subscriber_count() == 0; }));
}

TEST_CASE("dropped transport without a close frame is cleaned up")
{
    RelayFixture f;
    net::io_context c;
    auto ws = f.connect(c);
    REQUIRE(read_text(*ws) == kWelcomeText);
    REQUIRE(f.state.clients.size() == 1);
    REQUIRE(eventually([&]
                       { return f.state.events.subscriber_count() == 1; }));

    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(*ws).close(ignored);

    REQUIRE(eventually([&]
                       { return f.state.clients.size() == 0 && f.state.events.subscriber_count() == 0; }));
    REQUIRE(f.state.events.publish(event_at("X1", "Y2")) == 0);
}

TEST_CASE("events reach every connected session and not later ones")
{
    RelayFixture f;
    net::io_context c;
    auto a = f.connect(c);
    auto b = f.connect(c);
    REQUIRE(read_text(*a) == kWelcomeText);
    REQUIRE(read_text(*b) == kWelcomeText);
    REQUIRE(eventually([&]
                       { return f.state.events.subscriber_count() == 2; }));

    REQUIRE(f.state.events.publish(event_at("X1", "Y2")) == 2);
    REQUIRE(read_text(*a) == "New " + kSwords + " detected at location: X1Y2");
    REQUIRE(read_text(*b) == "New " + kSwords + " detected at location: X1Y2");

    auto late = f.connect(c);
    REQUIRE(read_text(*late) == kWelcomeText);
    REQUIRE(eventually([&]
                       { return f.state.events.subscriber_count() == 3; }));

    f.state.events.publish(event_at("A", "#3"));
    REQUIRE(read_text(*late) == "New " + kSwords + " detected at location: A#3");
    REQUIRE(read_text(*a) == "New " + kSwords + " detected at location: A#3");
}

TEST_CASE("101st inbound message gets a warning and ends the session")
{
    RelayFixture f;
    net::io_context c;
    auto ws = f.connect(c);
    auto other = f.connect(c);
    REQUIRE(read_text(*ws) == kWelcomeText);
    REQUIRE(read_text(*other) == kWelcomeText);

    for (int i = 0; i < 100; ++i)
        send_text(*ws, "hello " + std::to_string(i));

    // still subscribed after 100 messages
    REQUIRE(eventually([&]
                       { return f.state.events.subscriber_count() == 2; }));
    f.state.events.publish(event_at("X1", "Y2"));
    REQUIRE(read_text(*ws) == "New " + kSwords + " detected at location: X1Y2");
    REQUIRE(read_text(*other) == "New " + kSwords + " detected at location: X1Y2");

    send_text(*ws, "one too many");
    REQUIRE(read_text(*ws) == kRateLimitText);

    boost::beast::flat_buffer buf;
    boost::beast::error_code ec;
    ws->read(buf, ec);
    REQUIRE(ec == boost::beast::error_code(websocket::error::closed));
    REQUIRE(ws->reason().code == websocket::close_code::policy_error);

    REQUIRE(eventually([&]
                       { return f.state.clients.size() == 1; }));

    // the other session is unaffected
    f.state.events.publish(event_at("B", "2"));
    REQUIRE(read_text(*other) == "New " + kSwords + " detected at location: B2");
}
