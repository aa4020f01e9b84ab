#include "wireload/core/runner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <system_error>

#include "wireload/core/filter/address_pool.hpp"
#include "wireload/core/filter/generator.hpp"
#include "wireload/core/protocol/pusher/codec.hpp"
#include "wireload/core/ramp/controller.hpp"
#include "wireload/core/session/client.hpp"
#include "wireload/core/session/config.hpp"
#include "wireload/core/transport/beast/io_pool.hpp"
#include "wireload/core/transport/beast/websocket.hpp"
#include "lcr/log/logger.hpp"


namespace wireload::core {

namespace {

using Session = session::Client<transport::beast::WebSocket, protocol::pusher::Codec>;

// Spread consecutive client ids over the seed space
[[nodiscard]]
std::uint64_t session_seed(std::uint64_t base, std::uint64_t id) noexcept {
    std::uint64_t z = base + (id + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

[[nodiscard]]
config::Error load_pool(const config::Run& cfg, filter::AddressPool& out) {
    std::error_code ec;
    if (cfg.token_file.empty() || !std::filesystem::exists(cfg.token_file, ec)) {
        WL_WARN("[RUNNER] Token file not found: '" << cfg.token_file << "', generating "
                << filter::SYNTHETIC_POOL_SIZE << " fake tokens");
        out = filter::AddressPool::make_synthetic(filter::SYNTHETIC_POOL_SIZE);
        return config::Error::None;
    }
    return filter::AddressPool::load_file(cfg.token_file, out);
}

void copy_transport_totals(const transport::telemetry::WebSocket& t, metrics::TransportTotals& out) noexcept {
    out.bytes_rx       = t.bytes_rx_total.load();
    out.bytes_tx       = t.bytes_tx_total.load();
    out.messages_rx    = t.messages_rx_total.load();
    out.messages_tx    = t.messages_tx_total.load();
    out.handshakes     = t.handshakes_total.load();
    out.connect_errors = t.connect_errors_total.load();
    out.receive_errors = t.receive_errors_total.load();
    out.close_events   = t.close_events_total.load();
    out.backpressure   = t.backpressure_total.load();
}

} // namespace


config::Error ScenarioRunner::run(metrics::Summary& out) {
    // -------------------------------------------------------------------------
    // Fatal checks, before any session exists
    // -------------------------------------------------------------------------
    config::Error err = config_.validate();
    if (err != config::Error::None) {
        return err;
    }
    const config::Scenario& scenario = config_.scenario_def();

    if (transport::beast::resolve(config_.host, std::to_string(config_.port)) != transport::Error::None) {
        return config::Error::UnresolvableHost;
    }

    filter::AddressPool pool;
    err = load_pool(config_, pool);
    if (err != config::Error::None) {
        return err;
    }
    if (pool.size() < scenario.cardinality) {
        WL_ERROR("[RUNNER] Address pool holds " << pool.size() << " distinct values, scenario "
                 << scenario.number() << " needs " << scenario.cardinality);
        return config::Error::PoolTooSmall;
    }
    const filter::Generator generator(pool);

    session::Config session_config;
    session_config.endpoint = config_.endpoint();
    session_config.app_key = config_.app_key;
    session_config.channel = config_.channel;
    session_config.subscribe_timeout = config_.subscribe_timeout;
    session_config.update_interval = config_.update_interval;
    session_config.close_timeout = config_.close_timeout;

    std::uint64_t base_seed = config_.seed;
    if (base_seed == 0) {
        base_seed = (static_cast<std::uint64_t>(std::random_device{}()) << 32) ^
                    static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    }

    WL_INFO("[RUNNER] Scenario " << scenario.number() << " (" << scenario.label << "), "
            << config_.client_count << " clients (ids " << config_.client_id_offset << "-"
            << (config_.client_id_offset + config_.client_count - 1) << ") against "
            << session_config.endpoint.url());

    metrics_.reset();
    stop_.store(false, std::memory_order_relaxed);

    // -------------------------------------------------------------------------
    // Run
    // -------------------------------------------------------------------------
    transport::beast::IoPool::Options io_options;
    io_options.threads = config_.io_threads;
    io_options.verify_peer = config_.verify_peer;
    io_options.connect_timeout = config_.connect_timeout;
    transport::beast::IoPool io(io_options);

    ramp::Options ramp_options;
    ramp_options.workers = config_.workers;
    ramp_options.warmup = config_.warmup;
    ramp_options.grace = config_.grace;
    ramp_options.stop = &stop_;
    ramp_options.interrupt = interrupt_;

    ramp::RunResult result;
    {
        ramp::Controller<Session> controller(ramp_options, metrics_,
            [&](std::uint64_t index, const config::Scenario& sc) {
                const std::uint64_t id = config_.client_id_offset + index;
                auto session = std::make_shared<Session>(
                    id, sc, session_config, generator, metrics_,
                    std::make_unique<transport::beast::WebSocket>(io),
                    protocol::pusher::Codec(config_.schema, config_.channel),
                    session_seed(base_seed, id));
                session->start(std::chrono::steady_clock::now());
                return session;
            });

        result = controller.start(scenario, config_.client_count,
                                  config_.ramp_up, config_.hold, config_.ramp_down);
    }
    io.stop();

    // -------------------------------------------------------------------------
    // Report
    // -------------------------------------------------------------------------
    out = metrics_.snapshot();
    out.clients = config_.client_count;
    out.schedule_completed = result.schedule_completed;
    out.elapsed_s = static_cast<double>(result.elapsed.count()) / 1000.0;
    copy_transport_totals(io.telemetry(), out.transport);

    if (out.outcomes() != config_.client_count) {
        WL_WARN("[RUNNER] Outcome total " << out.outcomes() << " differs from client count " << config_.client_count);
    }
    return config::Error::None;
}

} // namespace wireload::core
