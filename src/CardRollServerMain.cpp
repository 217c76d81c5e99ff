// File: src/CardRollServerMain.cpp
//
// HTTP front for the roll engine on WebSocket++ (no TLS) + standalone Asio.
// Only the plain HTTP handler is used; a pool of threads runs the io context
// and every request is answered synchronously by HttpService.

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <print>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "config/ConfigLoader.hpp"
#include "core/Exception.hpp"
#include "core/PityStore.hpp"
#include "core/PityTracker.hpp"
#include "core/Random.hpp"
#include "core/Reconciler.hpp"
#include "core/RollEngine.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "net/HttpService.hpp"
#include "store/FilePityStore.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using namespace cardroll::core;

    struct CmdLine
    {
        std::filesystem::path config{"config/default_config.json"};
        std::optional<std::uint16_t> port;
        std::optional<std::uint32_t> threads;
        std::optional<std::uint64_t> seed;
        std::optional<std::string> audit;
        std::optional<std::chrono::milliseconds> timeout;
    };

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        CmdLine c{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                if (res.ec != std::errc{})
                {
                    std::print(stderr, "[Server] ignoring {} {}: not a number\n", arg, s);
                    return false;
                }
                return true;
            };

            if (arg == "--config")
            {
                if (i + 1 < argc) { c.config = argv[++i]; }
            }
            else if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0 && v <= 65535) { c.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--threads")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { c.threads = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { c.seed = v; }
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { c.audit = argv[++i]; }
            }
            else if (arg == "--timeout-ms")
            {
                std::uint64_t v{};
                if (next_uint(v) && v > 0) { c.timeout = std::chrono::milliseconds(v); }
            }
            else
            {
                std::print(stderr, "[Server] unknown argument '{}'\n", arg);
            }
        }
        return c;
    }

    // Splits "/path?query" into its two parts.
    auto SplitResource(std::string const& uri) -> std::pair<std::string, std::string>
    {
        std::size_t const q = uri.find('?');
        if (q == std::string::npos) return {uri, {}};
        return {uri.substr(0, q), uri.substr(q + 1)};
    }
}

int main(int argc, char** argv)
{
    CmdLine const cmd = ParseArgs(argc, argv);

    config::EngineConfig cfg{};
    try
    {
        cfg = config::LoadConfigFile(cmd.config);
    }
    catch (error::ConfigurationError const& e)
    {
        std::print(stderr, "[Server] {}\n", e.what());
        return 2;
    }

    if (cmd.port) { cfg.server.port = *cmd.port; }
    if (cmd.threads) { cfg.server.threads = *cmd.threads; }
    if (cmd.audit) { cfg.server.audit_path = *cmd.audit; }
    if (cmd.timeout) { cfg.server.request_timeout = *cmd.timeout; }

    std::uint64_t const seed = cmd.seed ? *cmd.seed
                                        : cfg.seed ? *cfg.seed
                                                   : (static_cast<std::uint64_t>(std::random_device{}()) << 32) |
                                                     std::random_device{}();

    if (auto const broken = debug::CheckInvariants(*cfg.catalog))
    {
        std::print(stderr, "[Server] catalog rejected: {}\n", *broken);
        return 2;
    }

    std::shared_ptr<PityStore> pity_store;
    try
    {
        if (cfg.persistence.directory.empty())
        {
            pity_store = std::make_shared<InMemoryPityStore>();
        }
        else
        {
            pity_store = std::make_shared<store::FilePityStore>(cfg.persistence.directory);
        }
    }
    catch (error::ConfigurationError const& e)
    {
        std::print(stderr, "[Server] {}\n", e.what());
        return 2;
    }

    auto tracker = std::make_shared<PityTracker>(pity_store);
    auto reconciler = std::make_shared<Reconciler>(tracker, cfg.persistence.reconciler);
    auto engine = std::make_shared<RollEngine>(cfg.catalog, tracker, MakeSeededFactory(seed));

    std::shared_ptr<debug::AuditLogger> audit;
    if (!cfg.server.audit_path.empty())
    {
        audit = std::make_shared<debug::AuditLogger>(cfg.server.audit_path);
        if (!audit->is_open())
        {
            std::print(stderr, "[Server] cannot open audit log '{}'\n", cfg.server.audit_path);
            return 2;
        }
        audit->start(seed, *cfg.catalog);
    }

    std::unique_ptr<net::HttpService> service;
    try
    {
        service = std::make_unique<net::HttpService>(engine, cfg.deck, cfg.server.request_timeout, audit);
    }
    catch (error::ConfigurationError const& e)
    {
        std::print(stderr, "[Server] {}\n", e.what());
        return 2;
    }

    std::print("[Server] Booting on port {} | {} thread(s) | {} card(s) | {} pack(s) | seed {}\n",
               cfg.server.port, cfg.server.threads, cfg.catalog->Size(), cfg.catalog->Packs().size(), seed);
    std::print("[Server] Pity store: {}\n",
               cfg.persistence.directory.empty() ? std::string{"in memory"} : cfg.persistence.directory.string());

    WsServer server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_access_channels(websocketpp::log::alevel::http);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_http_handler([&server, &service](websocketpp::connection_hdl hdl)
    {
        WsServer::connection_ptr con = server.get_con_from_hdl(hdl);
        websocketpp::http::parser::request const& http = con->get_request();

        net::HttpRequest req{};
        req.method = http.get_method();
        std::tie(req.path, req.query) = SplitResource(con->get_resource());
        req.body = http.get_body();
        if (std::string const id = http.get_header(std::string{net::PlayerHeader}); !id.empty())
        {
            req.player = id;
        }

        net::HttpResponse res{};
        try
        {
            res = service->Handle(req);
        }
        catch (std::exception const& e)
        {
            std::print(stderr, "[Server] {} {} failed: {}\n", req.method, req.path, e.what());
            res = net::HttpResponse{.status = 500, .body = R"({"error":"InternalError","message":"internal error"})"};
        }

        con->set_status(static_cast<websocketpp::http::status_code::value>(res.status));
        con->append_header("Content-Type", "application/json");
        con->set_body(res.body);
    });

    asio::signal_set signals(server.get_io_service(), SIGINT, SIGTERM);
    signals.async_wait([&server](std::error_code const&, int sig)
    {
        std::print("[Server] signal {} -> shutting down\n", sig);
        server.stop_listening();
        server.stop();
    });

    try
    {
        server.listen(cfg.server.port);
        server.start_accept();
    }
    catch (websocketpp::exception const& e)
    {
        std::print(stderr, "[Server] cannot listen on port {}: {}\n", cfg.server.port, e.what());
        return 1;
    }

    std::vector<std::thread> pool;
    pool.reserve(cfg.server.threads);
    for (std::uint32_t i = 0; i < cfg.server.threads; ++i)
    {
        pool.emplace_back([&server]()
        {
            server.run();
        });
    }
    for (std::thread& t : pool)
    {
        t.join();
    }

    if (!reconciler->WaitIdle(std::chrono::seconds(5)))
    {
        std::print(stderr, "[Server] {} pity record(s) still unsaved at shutdown\n", reconciler->Pending());
    }
    if (audit) { audit->flush(); }

    std::print("[Server] stopped | reconciled {} | exhausted {}\n", reconciler->Recovered(),
               reconciler->Exhausted());
    return 0;
}
