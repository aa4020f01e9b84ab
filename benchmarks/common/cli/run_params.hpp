#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "wireload/core/config/run.hpp"
#include "wireload/core/transport/endpoint.hpp"
#include "lcr/log/logger.hpp"

namespace wireload::cli {

// Command line view of config::Run: durations in seconds, as the harness scripts pass them
struct RunParams {
    wireload::core::config::Run run{};

    std::uint64_t ramp_s = 30;
    std::uint64_t hold_s = 60;
    std::uint64_t ramp_down_s = 10;
    std::uint64_t warmup_s = 0;
    std::uint64_t grace_s = 10;
    std::uint64_t subscribe_timeout_s = 10;
    std::uint64_t update_interval_ms = 5000;
    std::string tls = "auto";
    bool insecure = false;
    std::string log_level = "info";
    bool color = false;
};

[[nodiscard]]
inline core::transport::TlsMode tls_mode_from_string(std::string_view s) noexcept {
    if (s == "on")  return core::transport::TlsMode::Enabled;
    if (s == "off") return core::transport::TlsMode::Disabled;
    return core::transport::TlsMode::Auto;
}

[[nodiscard]]
inline RunParams configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    RunParams p{};
    auto& r = p.run;
    r.host = "stream-v2.projectscylla.com";
    r.app_key = "knife-library-likely";

    app.add_option("--ws-host", r.host, "WebSocket host")->envname("WS_HOST")->default_val(r.host);
    app.add_option("--ws-port", r.port, "WebSocket port")->envname("WS_PORT")->check(CLI::Range(1, 65535))->default_val(r.port);
    app.add_option("--app-key", r.app_key, "Application key")->envname("APP_KEY")->default_val(r.app_key);
    app.add_option("--channel", r.channel, "Channel name")->envname("CHANNEL")->default_val(r.channel);
    app.add_option("--scenario", r.scenario, "Scenario (1-5)")->envname("SCENARIO")->check(CLI::Range(1, 5))->default_val(r.scenario);
    app.add_option("--token-file", r.token_file, "Token addresses JSON file")->envname("TOKEN_FILE")->default_val(r.token_file);
    app.add_option("--filter-update-interval", p.update_interval_ms, "Filter update interval in milliseconds (scenario 2)")
        ->envname("FILTER_UPDATE_INTERVAL")->check(CLI::PositiveNumber)->default_val(p.update_interval_ms);
    app.add_option("--num-clients", r.client_count, "Target number of clients")->envname("NUM_CLIENTS")->check(CLI::PositiveNumber)->default_val(r.client_count);
    app.add_option("--ramp-duration", p.ramp_s, "Ramp-up duration in seconds")->envname("RAMP_DURATION")->check(CLI::PositiveNumber)->default_val(p.ramp_s);
    app.add_option("--hold-duration", p.hold_s, "Hold duration in seconds")->envname("HOLD_DURATION")->check(CLI::PositiveNumber)->default_val(p.hold_s);
    app.add_option("--ramp-down-duration", p.ramp_down_s, "Ramp-down duration in seconds")->envname("RAMP_DOWN_DURATION")->check(CLI::PositiveNumber)->default_val(p.ramp_down_s);
    app.add_option("--client-id-offset", r.client_id_offset, "Client id offset for multi-machine runs")->envname("CLIENT_ID_OFFSET")->default_val(r.client_id_offset);
    app.add_option("--warmup-duration", p.warmup_s, "Warm-up in seconds between ramp-up and hold (metrics discarded)")->envname("WARMUP_DURATION")->default_val(p.warmup_s);
    app.add_option("--grace", p.grace_s, "Seconds to wait after ramp-down before forcing sessions closed")->default_val(p.grace_s);
    app.add_option("--subscribe-timeout", p.subscribe_timeout_s, "Subscribe ack timeout in seconds")->check(CLI::PositiveNumber)->default_val(p.subscribe_timeout_s);
    app.add_option("--workers", r.workers, "Session worker threads")->check(CLI::PositiveNumber)->default_val(r.workers);
    app.add_option("--io-threads", r.io_threads, "Network I/O threads")->check(CLI::PositiveNumber)->default_val(r.io_threads);
    app.add_option("--seed", r.seed, "Random seed (0 = from the clock)")->default_val(r.seed);
    app.add_option("--tls", p.tls, "TLS: auto (port 443) | on | off")->check(CLI::IsMember({"auto", "on", "off"}))->default_val(p.tls);
    app.add_flag("--insecure", p.insecure, "Do not verify the server certificate");
    app.add_option("--path", r.schema.path_template, "URL path template")->default_val(r.schema.path_template);
    app.add_option("--filter-key", r.schema.filter_key, "Filter key sent in subscribe requests")->default_val(r.schema.filter_key);
    app.add_option("--app-key-field", r.schema.app_key_field, "Also send the app key in the subscribe payload under this field");
    app.add_option("-l,--log-level", p.log_level, "Log level: trace | debug | info | warn | error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))->default_val(p.log_level);
    app.add_flag("--color", p.color, "Colored log output");

    app.footer(
        "Runs one scenario: ramp-up, hold, ramp-down, then prints the summary.\n"
        "Exit status is 0 when the schedule completed, whatever the sessions did."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    using std::chrono::milliseconds;
    using std::chrono::seconds;
    r.ramp_up = seconds(p.ramp_s);
    r.hold = seconds(p.hold_s);
    r.ramp_down = seconds(p.ramp_down_s);
    r.warmup = seconds(p.warmup_s);
    r.grace = seconds(p.grace_s);
    r.subscribe_timeout = seconds(p.subscribe_timeout_s);
    r.update_interval = milliseconds(p.update_interval_ms);
    r.tls = tls_mode_from_string(p.tls);
    r.verify_peer = !p.insecure;

    lcr::log::Logger::instance().set_level(lcr::log::level_from_string(p.log_level));
    lcr::log::Logger::instance().enable_color(p.color);
    return p;
}

} // namespace wireload::cli
