/*
 * File: src/relay_main.cpp
 * Project: Battle Relay
 * Purpose: Server binary: map poller, HTTP health/status and WS notifications
 * Notes:
 *  - Configuration from environment / .env (see src/relay_config.hpp)
 *  - Single listener on HOST:PORT, WebSocket endpoint at /ws
 * Last updated: 2026-10-18
 */

#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>

#include "common/log.hpp"
#include "relay_config.hpp"
#include "relay_http.hpp"
#include "relay_scheduler.hpp"
#include "relay_source.hpp"
#include "relay_state.hpp"

int main(int argc, char **argv)
{
    std::string env_file = ".env";
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--env-file" && i + 1 < argc)
            env_file = argv[++i];
    }
    load_dotenv(env_file);

    log_info("main", "starting battle relay...");

    RelayConfig cfg;
    try
    {
        cfg = load_config();
    }
    catch (const ConfigError &e)
    {
        log_error("main", e.what());
        return 1;
    }
    set_log_level(cfg.log_level);
    log_debug("main", "log level ", log_level_name(cfg.log_level));

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(cfg.host, ec);
    if (ec)
    {
        log_error("main", "failed to parse address ", cfg.host, ":", cfg.port, " ", ec.message());
        return 1;
    }

    try
    {
        // state outlives ioc: handlers destroyed with ioc still release registry entries
        RelayState state{cfg.auth_token};
        boost::asio::io_context ioc{static_cast<int>(cfg.worker_threads)};

        MapPageSource source{cfg.map_url};
        Scheduler scheduler{source, state.markers, state.events, cfg.poll_interval};
        state.scheduler = &scheduler;

        log_info("main", "binding server to ", address.to_string(), ":", cfg.port);
        HttpServer http{ioc, {address, cfg.port}, state};

        scheduler.start();
        log_info("main", "scheduler started, polling ", source.url(), " every ", cfg.poll_interval.count(), "s");

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &, int)
                           {
            log_info("main", "shutting down...");
            http.stop();
            ioc.stop(); });

        std::vector<std::thread> workers;
        for (unsigned i = 1; i < cfg.worker_threads; ++i)
            workers.emplace_back([&ioc]
                                 { ioc.run(); });
        ioc.run();
        for (auto &t : workers)
            t.join();

        scheduler.stop();
        state.scheduler = nullptr;
    }
    catch (const std::exception &e)
    {
        log_error("main", e.what());
        return 1;
    }
    log_info("main", "exit.");
    return 0;
}
