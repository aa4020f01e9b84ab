#include "wireload/core/transport/beast/io_pool.hpp"

#include <exception>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

#include "lcr/log/logger.hpp"


namespace wireload::core::transport::beast {

namespace net = boost::asio;
using tcp = net::ip::tcp;

IoPool::IoPool(const Options& options)
    : options_(options)
    , tls_(net::ssl::context::tls_client)
    , ioc_(static_cast<int>(options.threads == 0 ? 1 : options.threads))
    , guard_(net::make_work_guard(ioc_))
{
    boost::system::error_code ec;
    if (options_.verify_peer) {
        tls_.set_default_verify_paths(ec);
        if (ec) {
            WL_WARN("[IO] Could not load default CA paths: " << ec.message());
        }
        tls_.set_verify_mode(net::ssl::verify_peer, ec);
    }
    else {
        tls_.set_verify_mode(net::ssl::verify_none, ec);
    }
    if (ec) {
        WL_WARN("[IO] Could not set TLS verify mode: " << ec.message());
    }

    const std::size_t n = options.threads == 0 ? 1 : options.threads;
    threads_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        threads_.emplace_back([this] { run_(); });
    }
    WL_DEBUG("[IO] I/O pool started with " << n << " thread(s)");
}

IoPool::~IoPool() {
    stop();
}

void IoPool::stop() noexcept {
    guard_.reset();
    ioc_.stop();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

void IoPool::run_() noexcept {
    // A handler escaping with an exception must not take the whole pool down
    for (;;) {
        try {
            ioc_.run();
            return;
        }
        catch (const std::exception& e) {
            WL_ERROR("[IO] Handler raised: " << e.what());
        }
    }
}

Error resolve(const std::string& host, const std::string& port) noexcept {
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        boost::system::error_code ec;
        const auto results = resolver.resolve(host, port, ec);
        if (ec || results.empty()) {
            WL_ERROR("[IO] Cannot resolve " << host << ":" << port << " (" << ec.message() << ")");
            return Error::ResolveFailed;
        }
        WL_DEBUG("[IO] " << host << ":" << port << " resolved to " << results.size() << " endpoint(s)");
        return Error::None;
    }
    catch (const std::exception& e) {
        WL_ERROR("[IO] Resolver failure for " << host << ": " << e.what());
        return Error::ResolveFailed;
    }
}

} // namespace wireload::core::transport::beast
