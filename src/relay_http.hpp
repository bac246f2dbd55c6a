/*
 * File: src/relay_http.hpp
 * Project: Battle Relay
 * Purpose: HTTP listener: health/status routes and the /ws upgrade gate
 * Notes:
 *  - Every request first takes a token from the global RequestGovernor
 *  - Upgrade requests are authenticated here; failures get 401 and never
 *    reach relay_ws.hpp
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common/log.hpp"
#include "relay_auth.hpp"
#include "relay_scheduler.hpp"
#include "relay_state.hpp"
#include "relay_ws.hpp"

namespace http = boost::beast::http;

inline std::string_view path_of(boost::beast::string_view target)
{
    std::string_view t(target.data(), target.size());
    auto q = t.find('?');
    return q == std::string_view::npos ? t : t.substr(0, q);
}

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    RelayState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
        : ioc_(ioc), acceptor_(ioc), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("failed to listen on " + ep.address().to_string() + ":" +
                                     std::to_string(ep.port()) + ": " + ec.message());
        do_accept();
    }

    // Actual bound endpoint (port 0 resolves here).
    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

    void stop()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (ec)
                log_warn("http", "accept: ", ec.message());
            else
                std::make_shared<Session>(std::move(socket), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::beast::tcp_stream stream;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        RelayState &state;

        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : stream(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            stream.expires_after(std::chrono::seconds(30));
            http::async_read(stream, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec)
                    self->handle();
                else if (ec != http::error::end_of_stream)
                    log_debug("http", "read: ", ec.message()); });
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            sp->set(http::field::server, "battle-relay");

            http::async_write(stream, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        http::response<http::string_body> json_response(http::status status, const nlohmann::json &body)
        {
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = body.dump();
            res.prepare_payload();
            return res;
        }

        double uptime_s() const
        {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
        }

        void handle()
        {
            using nlohmann::json;

            if (!state.governor.try_acquire())
            {
                auto after = std::to_string(state.governor.retry_after_s());
                log_warn("http", "request governor rejected ", req.method_string(), " ", req.target());
                auto res = json_response(http::status::too_many_requests, json{{"error", "too many requests"}});
                res.set(http::field::retry_after, after);
                res.set("x-ratelimit-after", after);
                res.set("x-ratelimit-limit", std::to_string(state.governor.limit()));
                return respond(std::move(res));
            }

            const auto path = path_of(req.target());

            if (websocket::is_upgrade(req))
            {
                if (path != "/ws")
                    return respond(json_response(http::status::not_found, json{{"error", "not found"}}));
                return upgrade();
            }

            // GET / and GET /health
            if (req.method() == http::verb::get && (path == "/" || path == "/health"))
            {
                log_info("http", "health check requested");
                return respond(json_response(http::status::ok, json{{"status", "ok"}, {"uptime_s", uptime_s()}}));
            }

            // GET /v1/status
            if (req.method() == http::verb::get && path == "/v1/status")
            {
                json body{
                    {"active_sessions", state.clients.size()},
                    {"subscribers", state.events.subscriber_count()},
                    {"active_markers", state.markers.size()},
                    {"uptime_s", uptime_s()}};
                if (state.scheduler)
                {
                    body["poll_cycles"] = state.scheduler->cycles();
                    body["poll_failures"] = state.scheduler->failures();
                }
                return respond(json_response(http::status::ok, body));
            }

            // 404 fallback
            return respond(json_response(http::status::not_found, json{{"error", "not found"}}));
        }

        void upgrade()
        {
            auto header = req[http::field::sec_websocket_protocol];
            auto cred = extract_credential(std::string_view(header.data(), header.size()));
            log_debug("http", "WebSocket connection attempt, token ", cred ? "present" : "absent");

            std::optional<std::string> presented;
            if (cred)
                presented = cred->value;
            if (!state.auth.validate(presented))
            {
                log_warn("http", "unauthorized WebSocket connection");
                http::response<http::string_body> res{http::status::unauthorized, req.version()};
                res.set(http::field::content_type, "text/plain");
                res.body() = "Invalid client authentication";
                res.prepare_payload();
                return respond(std::move(res));
            }

            std::make_shared<WsSession>(stream.release_socket(), state, cred->protocol)->run(std::move(req));
        }
    };
};
