/*
===============================================================================
 session::Client
===============================================================================

One simulated client: a single WebSocket connection driven through the
subscription protocol of the service under test.

  Connecting → Authenticating → Subscribing → Active ⇄ Updating → Closing → Closed
                                                         any non-terminal → Failed

Design principles:
  - Pollable state machine: no thread, no callbacks, no blocking
  - State is an explicit std::variant; each alternative carries its own data
  - Zero runtime polymorphism: transport and wire codec are template
    parameters checked by C++20 concepts
  - No retries: a failed connect or subscribe is a measured outcome

Threading:
  - poll() and force_terminate() are called by exactly one worker thread
    (the one currently owning the session)
  - request_close() may be called from any thread; it is honored on the
    next poll(), including while waiting for an ack

Accounting:
  - Every session produces exactly one outcome: ConnectionError,
    SubscribeFailed or Subscribed (fixed the first time it is known)
  - Filter update attempts/failures, channel messages, dropped connections
    and latency samples are reported as they happen
  - Every update attempt ends as an ack or a failure, including one still
    pending when the session closes, drops or is forced
  - High-rate data (message counts, end-to-end samples) is batched and
    flushed to the aggregator once per poll()
===============================================================================
*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "wireload/core/config/scenario.hpp"
#include "wireload/core/filter/generator.hpp"
#include "wireload/core/metrics/aggregator.hpp"
#include "wireload/core/protocol/concepts.hpp"
#include "wireload/core/protocol/filter.hpp"
#include "wireload/core/protocol/inbound.hpp"
#include "wireload/core/session/config.hpp"
#include "wireload/core/session/state.hpp"
#include "wireload/core/transport/concepts.hpp"
#include "wireload/core/transport/error.hpp"
#include "wireload/core/transport/websocket/events.hpp"
#include "lcr/log/logger.hpp"


namespace wireload::core::session {

template<
    transport::WebSocketConcept WS,
    protocol::CodecConcept Codec
>
class Client {
public:
    Client(std::uint64_t id,
           const config::Scenario& scenario,
           const Config& config,
           const filter::Generator& generator,
           metrics::Aggregator& metrics,
           std::unique_ptr<WS> ws,
           Codec codec,
           std::uint64_t seed)
        : id_(id)
        , scenario_(&scenario)
        , config_(&config)
        , generator_(&generator)
        , metrics_(&metrics)
        , ws_(std::move(ws))
        , codec_(std::move(codec))
        , rng_(seed)
        , state_(state::Connecting{})
    {}

    ~Client() {
        if (!is_terminal()) {
            ws_->close();
        }
    }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // -------------------------------------------------------------------------
    // Start the connection attempt (no retry on failure)
    // -------------------------------------------------------------------------
    void start(clock::time_point now) {
        metrics_->record_connection_attempt();
        state_ = state::Connecting{now};
        WL_TRACE("[SESSION " << id_ << "] Connecting to " << config_->endpoint.url());

        const transport::Error err = ws_->connect(config_->endpoint);
        if (err != transport::Error::None) {
            WL_ERROR("[SESSION " << id_ << "] Connect failed (" << transport::to_string(err) << ")");
            set_outcome_(Outcome::ConnectionError);
            set_state_(state::Failed{});
        }
    }

    // -------------------------------------------------------------------------
    // Drive the state machine. Returns false once the session is terminal.
    // -------------------------------------------------------------------------
    bool poll(clock::time_point now) {
        if (is_terminal()) {
            return false;
        }

        if (close_requested_.load(std::memory_order_acquire) && !is_closing_()) {
            begin_close_(now);
        }

        websocket_event_loop_(now);

        // Drain whatever the transport delivered, even after a Close event:
        // those messages were already in flight
        std::string msg;
        while (!is_terminal() && ws_->poll_message(msg)) {
            on_message_(msg, now);
        }

        if (!is_terminal()) {
            if (transport_closed_) {
                on_transport_closed_();
            }
            else {
                check_timers_(now);
            }
        }

        flush_();
        return !is_terminal();
    }

    // -------------------------------------------------------------------------
    // Ask the session to close gracefully (thread-safe)
    // -------------------------------------------------------------------------
    void request_close() noexcept {
        close_requested_.store(true, std::memory_order_release);
    }

    // -------------------------------------------------------------------------
    // Terminate immediately (run deadline). Classifies a pending outcome.
    // -------------------------------------------------------------------------
    void force_terminate() {
        if (is_terminal()) {
            return;
        }
        WL_WARN("[SESSION " << id_ << "] Forced termination in state " << to_string(state()));
        metrics_->record_forced_termination();
        if (state() == State::Connecting) {
            set_outcome_(Outcome::ConnectionError);
        }
        else {
            set_outcome_(Outcome::SubscribeFailed);
        }
        if (state() == State::Updating) {
            metrics_->record_update_failure();
        }
        ws_->close();
        flush_();
        set_state_(state::Failed{});
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] State state() const noexcept { return state_of(state_); }
    [[nodiscard]] Outcome outcome() const noexcept { return outcome_; }

    [[nodiscard]]
    bool is_terminal() const noexcept {
        const State s = state();
        return s == State::Closed || s == State::Failed;
    }

    [[nodiscard]] const protocol::SubscriptionFilter& filter() const noexcept { return filter_; }
    [[nodiscard]] std::uint64_t messages_received() const noexcept { return messages_total_; }
    [[nodiscard]] std::uint64_t update_attempts() const noexcept { return update_attempts_; }
    [[nodiscard]] clock::time_point subscribed_at() const noexcept { return subscribed_at_; }

    [[nodiscard]] WS& ws() noexcept { return *ws_; }

private:
    // -------------------------------------------------------------------------
    // Transport control plane
    // -------------------------------------------------------------------------

    void websocket_event_loop_(clock::time_point now) {
        transport::websocket::Event ev;
        while (ws_->poll_event(ev)) {
            switch (ev.type) {
                case transport::websocket::EventType::Connected:
                    on_connected_(now);
                    break;
                case transport::websocket::EventType::Error:
                    last_error_ = ev.error;
                    break;
                case transport::websocket::EventType::Close:
                    transport_closed_ = true;
                    break;
                default:
                    break;
            }
        }
    }

    void on_connected_(clock::time_point now) {
        if (state() != State::Connecting) {
            return; // connected after a close was requested
        }
        opened_ = true;
        metrics_->session_opened();
        WL_TRACE("[SESSION " << id_ << "] Transport open, waiting for handshake");
        set_state_(state::Authenticating{now});
    }

    void on_transport_closed_() {
        switch (state()) {
            case State::Connecting:
                WL_ERROR("[SESSION " << id_ << "] Connection failed (" << transport::to_string(last_error_) << ")");
                set_outcome_(Outcome::ConnectionError);
                set_state_(state::Failed{});
                break;
            case State::Authenticating:
            case State::Subscribing:
                WL_ERROR("[SESSION " << id_ << "] Connection lost before subscribe ack (" << transport::to_string(last_error_) << ")");
                set_outcome_(Outcome::SubscribeFailed);
                set_state_(state::Failed{});
                break;
            case State::Active:
            case State::Updating:
                WL_WARN("[SESSION " << id_ << "] Connection dropped (" << transport::to_string(last_error_) << ")");
                if (state() == State::Updating) {
                    // The pending update can no longer be acknowledged
                    metrics_->record_update_failure();
                }
                metrics_->record_connection_dropped();
                set_state_(state::Failed{});
                break;
            case State::Closing:
                WL_TRACE("[SESSION " << id_ << "] Closed");
                set_state_(state::Closed{});
                break;
            default:
                break;
        }
    }

    // -------------------------------------------------------------------------
    // Data plane
    // -------------------------------------------------------------------------

    void on_message_(const std::string& msg, clock::time_point now) {
        const protocol::Inbound in = codec_.decode(msg);

        switch (in.kind) {
            case protocol::Inbound::Kind::RawPing:
                send_(codec_.encode_raw_pong());
                break;

            case protocol::Inbound::Kind::Ping:
                send_(codec_.encode_pong());
                break;

            case protocol::Inbound::Kind::Handshake:
                on_handshake_(now);
                break;

            case protocol::Inbound::Kind::SubscribeAck:
                on_ack_(now);
                break;

            case protocol::Inbound::Kind::SubscribeRejected:
                on_rejected_(msg);
                break;

            case protocol::Inbound::Kind::ChannelData:
                on_channel_data_(msg, in);
                break;

            default:
                break;
        }
    }

    void on_handshake_(clock::time_point now) {
        const auto* auth = std::get_if<state::Authenticating>(&state_);
        if (auth == nullptr) {
            return;
        }
        const clock::time_point opened = auth->opened;

        filter_ = generator_->generate(*scenario_, rng_);
        WL_TRACE("[SESSION " << id_ << "] Handshake received, subscribing with " << filter_.values.size()
                 << " value(s) (" << protocol::to_string(filter_.mode) << ")");

        if (!send_subscribe_()) {
            WL_ERROR("[SESSION " << id_ << "] Failed to send subscribe request");
            fail_subscribe_();
            return;
        }
        set_state_(state::Subscribing{opened, now});
    }

    void on_ack_(clock::time_point now) {
        if (const auto* sub = std::get_if<state::Subscribing>(&state_)) {
            metrics_->record_latency(metrics::LatencyKind::Subscribe, elapsed_us_(sub->sent, now));
            set_outcome_(Outcome::Subscribed);
            WL_DEBUG("[SESSION " << id_ << "] Subscribed successfully");
            subscribed_at_ = now;
            next_update_at_ = now + config_->update_interval;
            set_state_(state::Active{});
            return;
        }
        if (const auto* upd = std::get_if<state::Updating>(&state_)) {
            metrics_->record_latency(metrics::LatencyKind::Update, elapsed_us_(upd->sent, now));
            WL_TRACE("[SESSION " << id_ << "] Filter update acknowledged");
            set_state_(state::Active{});
            return;
        }
        // Duplicate or late ack: not measured
        WL_TRACE("[SESSION " << id_ << "] Ignoring ack in state " << to_string(state()));
    }

    void on_rejected_(const std::string& msg) {
        switch (state()) {
            case State::Authenticating:
            case State::Subscribing:
                WL_ERROR("[SESSION " << id_ << "] Subscription error: " << msg);
                fail_subscribe_();
                break;
            case State::Updating:
                WL_WARN("[SESSION " << id_ << "] Filter update rejected: " << msg);
                metrics_->record_update_failure();
                set_state_(state::Active{});
                break;
            default:
                WL_DEBUG("[SESSION " << id_ << "] Error event in state " << to_string(state()) << ": " << msg);
                break;
        }
    }

    void on_channel_data_(const std::string& msg, const protocol::Inbound& in) {
        if (outcome_ != Outcome::Subscribed) {
            return;
        }
        ++messages_total_;
        ++pending_messages_;

        if (!first_message_logged_) {
            first_message_logged_ = true;
            WL_DEBUG("[SESSION " << id_ << "] First message: " << msg.substr(0, 256));
        }

        if (in.timestamp_ms.has()) {
            const auto now_ms = static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count());
            const std::uint64_t ts = in.timestamp_ms.value();
            const std::uint64_t latency_ms = now_ms > ts ? now_ms - ts : 0;
            if (latency_ms < static_cast<std::uint64_t>(config_->e2e_limit.count())) {
                pending_e2e_us_.push_back(latency_ms * 1000);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Timers
    // -------------------------------------------------------------------------

    void check_timers_(clock::time_point now) {
        if (const auto* auth = std::get_if<state::Authenticating>(&state_)) {
            if (now - auth->opened >= config_->subscribe_timeout) {
                WL_ERROR("[SESSION " << id_ << "] Subscribe timed out waiting for handshake");
                fail_subscribe_();
            }
            return;
        }
        if (const auto* sub = std::get_if<state::Subscribing>(&state_)) {
            if (now - sub->opened >= config_->subscribe_timeout) {
                WL_ERROR("[SESSION " << id_ << "] Subscribe timed out waiting for ack");
                fail_subscribe_();
            }
            return;
        }
        if (const auto* upd = std::get_if<state::Updating>(&state_)) {
            if (now < upd->deadline) {
                return;
            }
            WL_WARN("[SESSION " << id_ << "] Filter update timed out");
            metrics_->record_update_failure();
            set_state_(state::Active{});
            // fall through: the next update may already be due
        }
        if (const auto* closing = std::get_if<state::Closing>(&state_)) {
            if (now - closing->started >= config_->close_timeout) {
                WL_DEBUG("[SESSION " << id_ << "] Close handshake timed out, releasing");
                set_state_(state::Closed{});
            }
            return;
        }
        if (state() == State::Active && scenario_->periodic_update && now >= next_update_at_) {
            start_update_(now);
        }
    }

    void start_update_(clock::time_point now) {
        // Updates are due at subscribed_at + k * interval; missed slots are skipped
        while (next_update_at_ <= now) {
            next_update_at_ += config_->update_interval;
        }

        filter_ = generator_->generate(*scenario_, rng_);
        ++update_attempts_;
        metrics_->record_update_attempt();

        if (!send_subscribe_()) {
            WL_WARN("[SESSION " << id_ << "] Failed to send filter update");
            metrics_->record_update_failure();
            return;
        }
        set_state_(state::Updating{now, now + config_->update_timeout()});
    }

    // -------------------------------------------------------------------------
    // Closing
    // -------------------------------------------------------------------------

    void begin_close_(clock::time_point now) {
        switch (state()) {
            case State::Connecting:
                WL_DEBUG("[SESSION " << id_ << "] Cancelled while connecting");
                set_outcome_(Outcome::ConnectionError);
                break;
            case State::Authenticating:
            case State::Subscribing:
                WL_DEBUG("[SESSION " << id_ << "] Cancelled while waiting for subscribe ack");
                set_outcome_(Outcome::SubscribeFailed);
                break;
            case State::Updating:
                // The pending update can no longer be acknowledged
                metrics_->record_update_failure();
                break;
            default:
                break;
        }
        ws_->close();
        set_state_(state::Closing{now});
    }

    void fail_subscribe_() {
        set_outcome_(Outcome::SubscribeFailed);
        ws_->close();
        set_state_(state::Failed{});
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    [[nodiscard]]
    bool send_subscribe_() {
        const protocol::SubscribeRequest req{config_->app_key, config_->channel, filter_};
        return send_(codec_.encode_subscribe(req));
    }

    bool send_(std::string msg) {
        if (!ws_->send(std::move(msg))) {
            WL_DEBUG("[SESSION " << id_ << "] send() rejected by transport");
            return false;
        }
        return true;
    }

    void set_outcome_(Outcome o) {
        if (outcome_ != Outcome::Pending) {
            return;
        }
        outcome_ = o;
        switch (o) {
            case Outcome::ConnectionError: metrics_->record_connection_error(); break;
            case Outcome::SubscribeFailed: metrics_->record_subscribe_failure(); break;
            case Outcome::Subscribed:      metrics_->record_subscribe_success(); break;
            default: break;
        }
    }

    template<class S>
    void set_state_(S next) {
        WL_TRACE("[SESSION " << id_ << "] State: " << to_string(state()) << " -> " << to_string(state_of(StateData{next})));
        state_ = std::move(next);
        if (is_terminal() && opened_) {
            opened_ = false;
            metrics_->session_closed();
        }
    }

    [[nodiscard]]
    bool is_closing_() const noexcept {
        const State s = state();
        return s == State::Closing || s == State::Closed || s == State::Failed;
    }

    void flush_() {
        if (pending_messages_ != 0) {
            metrics_->record_message_received(pending_messages_);
            pending_messages_ = 0;
        }
        if (!pending_e2e_us_.empty()) {
            metrics_->record_latencies(metrics::LatencyKind::EndToEnd, pending_e2e_us_);
            pending_e2e_us_.clear();
        }
    }

    [[nodiscard]]
    static std::uint64_t elapsed_us_(clock::time_point from, clock::time_point to) noexcept {
        if (to <= from) return 0;
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(to - from).count());
    }

private:
    std::uint64_t id_;
    const config::Scenario* scenario_;
    const Config* config_;
    const filter::Generator* generator_;
    metrics::Aggregator* metrics_;

    std::unique_ptr<WS> ws_;
    Codec codec_;
    std::mt19937_64 rng_;

    StateData state_;
    Outcome outcome_ = Outcome::Pending;
    protocol::SubscriptionFilter filter_;

    std::atomic<bool> close_requested_{false};
    bool transport_closed_ = false;
    bool opened_ = false;
    bool first_message_logged_ = false;
    transport::Error last_error_ = transport::Error::None;

    clock::time_point subscribed_at_{};
    clock::time_point next_update_at_{};

    std::uint64_t messages_total_ = 0;
    std::uint64_t update_attempts_ = 0;
    std::uint64_t pending_messages_ = 0;
    std::vector<std::uint64_t> pending_e2e_us_;
};

} // namespace wireload::core::session
