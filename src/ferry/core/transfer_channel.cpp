// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/transfer_channel.hpp>
#include <ferry/core/byte_order.hpp>
#include <ferry/log.hpp>
#include <curl/curl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <format>
#include <limits>
#include <new>

namespace ferry::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { reset(); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    void reset() noexcept {
        if (ptr) curl_easy_cleanup(ptr);
        ptr = nullptr;
    }
};

std::error_code map_connect_error(CURLcode rc) noexcept {
    switch (rc) {
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
            return make_error_code(TransferErrc::tls_error);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransferErrc::timeout);
        default:
            return make_error_code(TransferErrc::connection_failed);
    }
}

// Socket-level stream over a CONNECT_ONLY easy handle
class CurlConnection final : public Connection {
public:
    CurlConnection(CurlHandle&& handle, curl_socket_t socket, std::chrono::seconds io_timeout) noexcept
        : curl_(handle.ptr), socket_(socket), io_timeout_(io_timeout) {
        handle.ptr = nullptr;
    }

    ~CurlConnection() override { close(); }

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) noexcept override {
        if (!curl_.ptr) {
            return std::unexpected(make_error_code(TransferErrc::connection_lost));
        }

        for (;;) {
            std::size_t received = 0;
            CURLcode rc = curl_easy_recv(curl_.ptr, buffer.data(), buffer.size(), &received);
            if (rc == CURLE_OK) {
                return received;    // 0 = peer closed
            }
            if (rc == CURLE_AGAIN) {
                if (auto ec = wait_ready(POLLIN, TransferErrc::recv_failed)) {
                    return std::unexpected(ec);
                }
                continue;
            }
            log::get()->debug("curl_easy_recv: {}", curl_easy_strerror(rc));
            return std::unexpected(make_error_code(
                rc == CURLE_RECV_ERROR ? TransferErrc::connection_lost : TransferErrc::recv_failed));
        }
    }

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept override {
        if (!curl_.ptr) {
            return make_error_code(TransferErrc::connection_lost);
        }

        std::size_t offset = 0;
        while (offset < data.size()) {
            std::size_t sent = 0;
            CURLcode rc = curl_easy_send(curl_.ptr, data.data() + offset, data.size() - offset, &sent);
            if (rc == CURLE_OK) {
                offset += sent;
                continue;
            }
            if (rc == CURLE_AGAIN) {
                if (auto ec = wait_ready(POLLOUT, TransferErrc::send_failed)) {
                    return ec;
                }
                continue;
            }
            log::get()->debug("curl_easy_send: {}", curl_easy_strerror(rc));
            return make_error_code(
                rc == CURLE_SEND_ERROR ? TransferErrc::connection_lost : TransferErrc::send_failed);
        }
        return {};
    }

    void close() noexcept override {
        curl_.reset();
        socket_ = CURL_SOCKET_BAD;
    }

private:
    CurlHandle curl_;
    curl_socket_t socket_;
    std::chrono::seconds io_timeout_;

    std::error_code wait_ready(short events, TransferErrc on_error) noexcept {
        pollfd pfd{};
        pfd.fd = socket_;
        pfd.events = events;

        int timeout_ms = io_timeout_.count() > 0
            ? static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(io_timeout_).count())
            : -1;

        for (;;) {
            int rc = ::poll(&pfd, 1, timeout_ms);
            if (rc > 0) {
                return {};
            }
            if (rc == 0) {
                return make_error_code(TransferErrc::timeout);
            }
            if (errno != EINTR) {
                return make_error_code(on_error);
            }
        }
    }
};

} // namespace

//=============================================================================
// Endpoint
//=============================================================================

std::expected<Endpoint, std::error_code> Endpoint::parse(std::string_view text) noexcept {
    auto invalid = std::make_error_code(std::errc::invalid_argument);

    std::string_view host;
    std::string_view port;

    if (text.starts_with('[')) {
        auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return std::unexpected(invalid);
        }
        host = text.substr(1, close - 1);
        port = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string_view::npos || text.find(':') != colon) {
            return std::unexpected(invalid);
        }
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }

    if (host.empty() || port.empty()) {
        return std::unexpected(invalid);
    }

    std::uint16_t port_value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), port_value);
    if (ec != std::errc{} || ptr != port.data() + port.size() || port_value == 0) {
        return std::unexpected(invalid);
    }

    return Endpoint{std::string(host), port_value};
}

std::string Endpoint::to_string() const {
    if (host.find(':') != std::string::npos) {
        return std::format("[{}]:{}", host, port);
    }
    return std::format("{}:{}", host, port);
}

std::expected<Endpoint, std::error_code> transfer_endpoint(const Endpoint& control) {
    if (control.port > std::numeric_limits<std::uint16_t>::max() - TRANSFER_PORT_OFFSET) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return Endpoint{control.host, static_cast<std::uint16_t>(control.port + TRANSFER_PORT_OFFSET)};
}

//=============================================================================
// Handshake
//=============================================================================

RefNum make_ref_num(std::uint32_t value) noexcept {
    RefNum ref{};
    store_be32(ref, value);
    return ref;
}

std::array<std::byte, HANDSHAKE_SIZE> encode_handshake(const RefNum& ref, std::uint32_t total_size) noexcept {
    std::array<std::byte, HANDSHAKE_SIZE> out{};
    std::span<std::byte> view(out);
    store_tag(view, "HTXF");
    std::copy(ref.begin(), ref.end(), out.begin() + 4);
    store_be32(view.subspan(8), total_size);
    // [12:16] reserved, zero
    return out;
}

//=============================================================================
// TransferChannel
//=============================================================================

std::expected<std::unique_ptr<Connection>, std::error_code>
TransferChannel::open(const Endpoint& endpoint, const ChannelOptions& options) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::connection_failed));
    }

    // CONNECT_ONLY gives a raw socket; the scheme only selects TLS or not
    std::string url;
    try {
        url = std::format("{}://{}", options.tls ? "https" : "http", endpoint.to_string());
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_TCP_NODELAY, 1L);
    // The transfer port is dialed directly, whatever *_proxy says
    curl_easy_setopt(curl.ptr, CURLOPT_PROXY, "");

    if (options.tls) {
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, options.verify_peer ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, options.verify_peer ? 2L : 0L);
    }

    log::get()->debug("Dialing {}{}", url, options.tls ? " (TLS)" : "");

    CURLcode rc = curl_easy_perform(curl.ptr);
    if (rc != CURLE_OK) {
        log::get()->error("Connect to {} failed: {}", endpoint.to_string(), curl_easy_strerror(rc));
        return std::unexpected(map_connect_error(rc));
    }

    curl_socket_t socket = CURL_SOCKET_BAD;
    rc = curl_easy_getinfo(curl.ptr, CURLINFO_ACTIVESOCKET, &socket);
    if (rc != CURLE_OK || socket == CURL_SOCKET_BAD) {
        return std::unexpected(make_error_code(TransferErrc::connection_failed));
    }

    try {
        return std::make_unique<CurlConnection>(std::move(curl), socket, options.io_timeout);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::error_code TransferChannel::handshake(Writer& connection, const RefNum& ref, std::uint32_t total_size) noexcept {
    auto preamble = encode_handshake(ref, total_size);
    if (auto ec = connection.write(preamble)) {
        log::get()->error("Handshake write failed: {}", ec.message());
        return make_error_code(TransferErrc::handshake_failed);
    }
    return {};
}

void TransferChannel::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void TransferChannel::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace ferry::core
