#include "wireload/core/transport/beast/websocket.hpp"

#include <cstdint>
#include <deque>
#include <exception>
#include <type_traits>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "lcr/log/logger.hpp"


namespace wireload::core::transport::beast {

namespace net = boost::asio;
namespace bst = boost::beast;
namespace ws  = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace detail {

enum class Stage : std::uint8_t {
    Idle,
    Resolving,
    Connecting,
    TlsHandshake,
    WsHandshake,
    Open,
    Closing,
    Done
};

// -----------------------------------------------------------------------------
// Stream<Secure>
//
// All members below are only touched from handlers running on ws_'s strand.
// -----------------------------------------------------------------------------
template<bool Secure>
class Stream : public std::enable_shared_from_this<Stream<Secure>> {
    using next_layer_type = std::conditional_t<Secure, bst::ssl_stream<bst::tcp_stream>, bst::tcp_stream>;

public:
    Stream(IoPool& pool, std::shared_ptr<Inbox> inbox, Endpoint endpoint) requires (!Secure)
        : pool_(pool)
        , inbox_(std::move(inbox))
        , endpoint_(std::move(endpoint))
        , ws_(net::make_strand(pool.context()))
        , resolver_(ws_.get_executor())
        , resolve_timer_(ws_.get_executor())
    {}

    Stream(IoPool& pool, std::shared_ptr<Inbox> inbox, Endpoint endpoint) requires Secure
        : pool_(pool)
        , inbox_(std::move(inbox))
        , endpoint_(std::move(endpoint))
        , ws_(net::make_strand(pool.context()), pool.tls())
        , resolver_(ws_.get_executor())
        , resolve_timer_(ws_.get_executor())
    {}

    // ---------------------------------------------------------------------
    // Entry points (called from the session thread, hop onto the strand)
    // ---------------------------------------------------------------------

    void start() {
        net::post(ws_.get_executor(), [self = this->shared_from_this()] {
            self->do_resolve_();
        });
    }

    void post_send(std::string msg) {
        net::post(ws_.get_executor(), [self = this->shared_from_this(), m = std::move(msg)]() mutable {
            self->queue_write_(std::move(m));
        });
    }

    void post_close() {
        net::post(ws_.get_executor(), [self = this->shared_from_this()] {
            self->shutdown_();
        });
    }

private:
    // ---------------------------------------------------------------------
    // Connection establishment
    // ---------------------------------------------------------------------

    void do_resolve_() {
        if (stage_ != Stage::Idle) return;
        stage_ = Stage::Resolving;
        // tcp_stream timeouts start at connect: the resolver needs its own timer
        resolve_timer_.expires_after(pool_.connect_timeout());
        resolve_timer_.async_wait(
            bst::bind_front_handler(&Stream::on_resolve_timeout_, this->shared_from_this()));
        resolver_.async_resolve(
            endpoint_.host,
            endpoint_.port,
            bst::bind_front_handler(&Stream::on_resolve_, this->shared_from_this()));
    }

    void on_resolve_timeout_(bst::error_code ec) {
        if (ec || stage_ != Stage::Resolving) return;
        WL_DEBUG("[WS] resolve of " << endpoint_.host << " timed out");
        resolver_.cancel();
        fail_with_(Error::Timeout);
    }

    void on_resolve_(bst::error_code ec, tcp::resolver::results_type results) {
        if (stage_ != Stage::Resolving) return; // cancelled
        resolve_timer_.cancel();
        if (ec) {
            return fail_(ec, "resolve");
        }
        stage_ = Stage::Connecting;
        bst::get_lowest_layer(ws_).expires_after(pool_.connect_timeout());
        bst::get_lowest_layer(ws_).async_connect(
            results,
            bst::bind_front_handler(&Stream::on_connect_, this->shared_from_this()));
    }

    void on_connect_(bst::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (stage_ != Stage::Connecting) return;
        if (ec) {
            return fail_(ec, "connect");
        }
        if constexpr (Secure) {
            stage_ = Stage::TlsHandshake;
            // SNI: most TLS front-ends refuse the handshake without it
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str())) {
                bst::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                return fail_(sni_ec, "sni");
            }
            if (pool_.verify_peer()) {
                ws_.next_layer().set_verify_callback(net::ssl::host_name_verification(endpoint_.host));
            }
            bst::get_lowest_layer(ws_).expires_after(pool_.connect_timeout());
            ws_.next_layer().async_handshake(
                net::ssl::stream_base::client,
                bst::bind_front_handler(&Stream::on_tls_handshake_, this->shared_from_this()));
        }
        else {
            do_ws_handshake_();
        }
    }

    void on_tls_handshake_(bst::error_code ec) {
        if (stage_ != Stage::TlsHandshake) return;
        if (ec) {
            return fail_(ec, "tls handshake");
        }
        do_ws_handshake_();
    }

    void do_ws_handshake_() {
        stage_ = Stage::WsHandshake;
        // The websocket stream applies its own timeouts from here on
        bst::get_lowest_layer(ws_).expires_never();

        auto timeouts = ws::stream_base::timeout::suggested(bst::role_type::client);
        timeouts.handshake_timeout = pool_.connect_timeout();
        ws_.set_option(timeouts);
        ws_.set_option(ws::stream_base::decorator([](ws::request_type& req) {
            req.set(bst::http::field::user_agent, "wireload/1.0");
        }));
        ws_.text(true);

        ws_.async_handshake(
            endpoint_.host + ':' + endpoint_.port,
            endpoint_.path,
            bst::bind_front_handler(&Stream::on_ws_handshake_, this->shared_from_this()));
    }

    void on_ws_handshake_(bst::error_code ec) {
        if (stage_ != Stage::WsHandshake) return;
        if (ec) {
            return fail_(ec, "websocket handshake");
        }
        stage_ = Stage::Open;
        pool_.telemetry().handshakes_total.inc();
        push_event_(websocket::Event::make_connected());
        WL_TRACE("[WS] Connected to " << endpoint_.url());

        do_read_();
        if (!write_queue_.empty()) {
            do_write_();
        }
    }

    // ---------------------------------------------------------------------
    // Data plane
    // ---------------------------------------------------------------------

    void do_read_() {
        ws_.async_read(
            buffer_,
            bst::bind_front_handler(&Stream::on_read_, this->shared_from_this()));
    }

    void on_read_(bst::error_code ec, std::size_t bytes) {
        if (stage_ == Stage::Done) return;
        if (ec) {
            if (stage_ == Stage::Closing) {
                // Expected: our own close handshake completes the read with 'closed'
                return;
            }
            return fail_(ec, "read");
        }
        pool_.telemetry().bytes_rx_total.inc(bytes);
        pool_.telemetry().messages_rx_total.inc();

        std::string msg = bst::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (!inbox_->messages.push(std::move(msg))) {
            pool_.telemetry().backpressure_total.inc();
            WL_WARN("[WS] Inbound ring full (" << inbox_->messages.capacity() << " messages), dropping connection");
            return fail_with_(Error::Backpressure);
        }
        do_read_();
    }

    void queue_write_(std::string msg) {
        if (stage_ == Stage::Closing || stage_ == Stage::Done) {
            return;
        }
        write_queue_.push_back(std::move(msg));
        if (stage_ != Stage::Open) {
            return; // flushed after handshake
        }
        if (write_queue_.size() == 1) {
            do_write_();
        }
    }

    void do_write_() {
        ws_.async_write(
            net::buffer(write_queue_.front()),
            bst::bind_front_handler(&Stream::on_write_, this->shared_from_this()));
    }

    void on_write_(bst::error_code ec, std::size_t bytes) {
        if (stage_ == Stage::Done) return;
        if (ec) {
            return fail_(ec, "write");
        }
        pool_.telemetry().bytes_tx_total.inc(bytes);
        pool_.telemetry().messages_tx_total.inc();
        write_queue_.pop_front();

        if (!write_queue_.empty()) {
            return do_write_();
        }
        if (stage_ == Stage::Closing && !close_started_) {
            do_close_();
        }
    }

    // ---------------------------------------------------------------------
    // Shutdown
    // ---------------------------------------------------------------------

    void shutdown_() {
        switch (stage_) {
            case Stage::Done:
            case Stage::Closing:
                return;
            case Stage::Open:
                stage_ = Stage::Closing;
                // A close frame can't overlap a pending write
                if (write_queue_.empty()) {
                    do_close_();
                }
                return;
            default:
                // Still connecting: abort whatever is in flight
                stage_ = Stage::Done;
                resolve_timer_.cancel();
                resolver_.cancel();
                close_socket_();
                signal_close_();
                return;
        }
    }

    void do_close_() {
        close_started_ = true;
        ws_.async_close(
            ws::close_code::normal,
            bst::bind_front_handler(&Stream::on_close_, this->shared_from_this()));
    }

    void on_close_(bst::error_code ec) {
        if (stage_ == Stage::Done) return;
        if (ec && ec != net::error::operation_aborted && ec != ws::error::closed) {
            WL_DEBUG("[WS] Close handshake ended with: " << ec.message());
        }
        stage_ = Stage::Done;
        close_socket_();
        signal_close_();
    }

    // ---------------------------------------------------------------------
    // Failure handling
    // ---------------------------------------------------------------------

    void fail_(const bst::error_code& ec, const char* what) {
        const Error err = classify_(ec);
        if (err == Error::RemoteClosed) {
            WL_DEBUG("[WS] " << what << ": remote closed (" << ec.message() << ")");
        }
        else {
            WL_DEBUG("[WS] " << what << " failed: " << ec.message() << " (" << to_string(err) << ")");
        }
        fail_with_(err);
    }

    void fail_with_(Error err) {
        if (stage_ == Stage::Done) return;
        if (stage_ < Stage::Open) {
            pool_.telemetry().connect_errors_total.inc();
        }
        else if (err != Error::RemoteClosed) {
            pool_.telemetry().receive_errors_total.inc();
        }
        stage_ = Stage::Done;
        push_event_(websocket::Event::make_error(err));
        close_socket_();
        signal_close_();
    }

    [[nodiscard]]
    Error classify_(const bst::error_code& ec) const noexcept {
        if (ec == bst::error::timeout) {
            return Error::Timeout;
        }
        switch (stage_) {
            case Stage::Resolving:    return Error::ResolveFailed;
            case Stage::Connecting:   return Error::ConnectionFailed;
            case Stage::TlsHandshake:
            case Stage::WsHandshake:  return Error::HandshakeFailed;
            default: break;
        }
        if (ec == ws::error::closed ||
            ec == net::error::eof ||
            ec == net::error::connection_reset ||
            ec == net::ssl::error::stream_truncated) {
            return Error::RemoteClosed;
        }
        if (ec == net::error::operation_aborted) {
            return Error::Cancelled;
        }
        return Error::TransportFailure;
    }

    void close_socket_() noexcept {
        bst::error_code ignored;
        bst::get_lowest_layer(ws_).socket().close(ignored);
    }

    void push_event_(websocket::Event ev) noexcept {
        if (!inbox_->events.push(ev)) {
            // Cannot happen with the bounded event sequence (Connected, Error, Close)
            WL_FATAL("[WS] Control-plane ring overflow");
        }
    }

    void signal_close_() noexcept {
        // Close is always signaled exactly once
        if (close_signaled_) return;
        close_signaled_ = true;
        pool_.telemetry().close_events_total.inc();
        push_event_(websocket::Event::make_close());
    }

private:
    IoPool& pool_;
    std::shared_ptr<Inbox> inbox_;
    Endpoint endpoint_;
    ws::stream<next_layer_type> ws_;
    tcp::resolver resolver_;
    net::steady_timer resolve_timer_;
    bst::flat_buffer buffer_;
    std::deque<std::string> write_queue_;
    Stage stage_ = Stage::Idle;
    bool close_started_ = false;
    bool close_signaled_ = false;
};

} // namespace detail


// -----------------------------------------------------------------------------
// WebSocket
// -----------------------------------------------------------------------------

WebSocket::WebSocket(IoPool& pool) noexcept
    : pool_(pool)
{}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const Endpoint& endpoint) noexcept {
    if (!std::holds_alternative<std::monostate>(stream_)) {
        WL_WARN("[WS] connect() called twice on the same transport");
        return Error::InvalidState;
    }
    const Error err = validate(endpoint);
    if (err != Error::None) {
        WL_ERROR("[WS] Invalid endpoint: " << endpoint.url());
        return err;
    }
    try {
        inbox_ = std::make_shared<detail::Inbox>();
        if (endpoint.secure) {
            auto s = std::make_shared<detail::Stream<true>>(pool_, inbox_, endpoint);
            s->start();
            stream_ = std::move(s);
        }
        else {
            auto s = std::make_shared<detail::Stream<false>>(pool_, inbox_, endpoint);
            s->start();
            stream_ = std::move(s);
        }
    }
    catch (const std::exception& e) {
        WL_ERROR("[WS] Failed to create transport: " << e.what());
        return Error::TransportFailure;
    }
    return Error::None;
}

bool WebSocket::send(std::string msg) noexcept {
    if (close_requested_) {
        return false;
    }
    try {
        return std::visit([&](auto& s) -> bool {
            if constexpr (std::is_same_v<std::decay_t<decltype(s)>, std::monostate>) {
                WL_ERROR("[WS] send() called on unconnected WebSocket");
                return false;
            }
            else {
                s->post_send(std::move(msg));
                return true;
            }
        }, stream_);
    }
    catch (const std::exception& e) {
        WL_ERROR("[WS] send() failed: " << e.what());
        return false;
    }
}

void WebSocket::close() noexcept {
    if (close_requested_) {
        return;
    }
    close_requested_ = true;
    try {
        std::visit([](auto& s) {
            if constexpr (!std::is_same_v<std::decay_t<decltype(s)>, std::monostate>) {
                s->post_close();
            }
        }, stream_);
    }
    catch (const std::exception& e) {
        WL_ERROR("[WS] close() failed: " << e.what());
    }
}

} // namespace wireload::core::transport::beast
