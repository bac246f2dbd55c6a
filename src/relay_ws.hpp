/*
 * File: src/relay_ws.hpp
 * Project: Battle Relay
 * Purpose: Authenticated WebSocket subscriber session
 * Notes:
 *  - Created by relay_http.hpp after the token check passed
 *  - All handlers run on the socket's strand; inbound frames and broadcast
 *    wake-ups are served in arrival order
 *  - Registry entry lives in a RegistrationGuard and goes away on every exit
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <deque>
#include <memory>
#include <string>
#include <utility>

#include "common/location.hpp"
#include "common/log.hpp"
#include "relay_state.hpp"

namespace websocket = boost::beast::websocket;

inline constexpr const char *kWelcomeText = "Connected to the notification service!";
inline constexpr const char *kRateLimitText = "Rate limit exceeded. Try again later.";

inline std::string new_session_id()
{
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

class WsSession : public std::enable_shared_from_this<WsSession>
{
public:
    enum class State
    {
        connecting,
        authenticated,
        active,
        closed
    };

    WsSession(boost::asio::ip::tcp::socket &&socket, RelayState &st, std::string protocol)
        : ws_(std::move(socket)), state_(st), id_(new_session_id()), protocol_(std::move(protocol)) {}

    const std::string &id() const { return id_; }

    // Completes the upgrade for a request that already passed authentication.
    void run(boost::beast::http::request<boost::beast::http::string_body> req)
    {
        phase_ = State::authenticated;
        boost::beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [proto = protocol_](websocket::response_type &res)
            {
                res.set(boost::beast::http::field::server, "battle-relay");
                if (!proto.empty())
                    res.set(boost::beast::http::field::sec_websocket_protocol, proto);
            }));
        ws_.async_accept(req, boost::beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
    }

private:
    websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    RelayState &state_;
    std::string id_;
    std::string protocol_;
    State phase_ = State::connecting;

    RegistrationGuard guard_;
    std::shared_ptr<Subscription> sub_;
    std::deque<std::string> write_queue_;
    bool closing_ = false;

    void on_accept(boost::beast::error_code ec)
    {
        if (ec)
        {
            log_warn("ws", "handshake failed: ", ec.message());
            return finish();
        }

        guard_ = RegistrationGuard(state_.clients, id_);
        phase_ = State::active;
        log_info("ws", "new WebSocket client connected: ", id_);

        send(kWelcomeText);

        sub_ = state_.events.subscribe();
        sub_->set_notify([weak = weak_from_this()]
                         {
            if (auto self = weak.lock())
                boost::asio::post(self->ws_.get_executor(), [self] { self->drain_events(); }); });
        log_debug("ws", "client ", id_, " subscribed to event channel");

        do_read();
    }

    void do_read()
    {
        ws_.async_read(buffer_, boost::beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
    }

    void on_read(boost::beast::error_code ec, std::size_t)
    {
        if (ec == websocket::error::closed)
        {
            log_info("ws", "client ", id_, " disconnected");
            return finish();
        }
        if (ec)
        {
            if (phase_ != State::closed)
                log_error("ws", "error receiving message for client ", id_, ": ", ec.message());
            return finish();
        }
        if (phase_ != State::active)
            return;

        std::string msg = boost::beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (!ws_.got_text())
        {
            log_debug("ws", "client ", id_, " sent unhandled binary frame (", msg.size(), " bytes)");
            return do_read();
        }

        log_info("ws", "client ", id_, " sent message: ", sanitize(msg));
        if (state_.clients.check_and_record(id_))
        {
            log_warn("ws", "client ", id_, " rate limit exceeded");
            closing_ = true;
            send(kRateLimitText);
            return;
        }
        do_read();
    }

    void drain_events()
    {
        if (phase_ != State::active || closing_ || !sub_)
            return;
        if (auto lost = sub_->take_lagged())
            log_warn("ws", "client ", id_, " lagged, ", lost, " events dropped");
        while (auto ev = sub_->try_recv())
        {
            auto text = format_notification(*ev);
            log_debug("ws", "sending event to client ", id_, ": ", text);
            send(std::move(text));
        }
    }

    void send(std::string msg)
    {
        write_queue_.push_back(std::move(msg));
        if (write_queue_.size() > 1)
            return;
        do_write();
    }

    void do_write()
    {
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(write_queue_.front()),
                        boost::beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
    }

    void on_write(boost::beast::error_code ec, std::size_t)
    {
        if (phase_ == State::closed)
            return;
        if (ec)
        {
            log_error("ws", "failed to send to client ", id_, ": ", ec.message());
            return finish();
        }
        write_queue_.pop_front();
        if (!write_queue_.empty())
            return do_write();
        if (closing_)
            do_close();
    }

    void do_close()
    {
        ws_.async_close(websocket::close_reason(websocket::close_code::policy_error, "rate limit exceeded"),
                        [self = shared_from_this()](boost::beast::error_code ec)
                        {
                            if (ec)
                                log_debug("ws", "close for client ", self->id_, ": ", ec.message());
                            self->finish();
                        });
    }

    // Terminal transition; safe to reach from several handlers.
    void finish()
    {
        if (phase_ == State::closed)
            return;
        const bool was_active = guard_.active();
        phase_ = State::closed;
        sub_.reset();
        guard_.release();

        boost::beast::error_code ignored;
        boost::beast::get_lowest_layer(ws_).socket().close(ignored);
        if (was_active)
            log_info("ws", "cleaning up client ", id_);
    }
};
