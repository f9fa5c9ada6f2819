// TCP/TLS byte stream using POSIX sockets + OpenSSL.
#include "connector.hpp"
#include "errors.hpp"
#include "http_response_stream.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace eventsource {

namespace {

// ── RAII connection (TCP + optional TLS) ──────────────────────

class SocketStream : public ByteStream {
public:
    SocketStream() = default;
    ~SocketStream() override {
        if (ssl) {
            if (!shut_down_.load()) SSL_shutdown(ssl);
            SSL_free(ssl);
        }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    SocketStream(const SocketStream&)            = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    // Returns an empty string on success, otherwise a description of the failure.
    std::string connect(const Endpoint& ep, const ClientOptions& options) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res);
        if (gai != 0)
            return std::string("cannot resolve ") + ep.host + ": " + gai_strerror(gai);

        long timeout_secs = options.connect_timeout_seconds;
        int last_errno = 0;
        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so we can honour the connect timeout.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_errno = err;
                    }
                } else {
                    last_errno = (rc == 0) ? ETIMEDOUT : errno;
                }
            } else {
                last_errno = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected)
            return "cannot connect to " + ep.host + ":" + ep.port + ": " +
                   std::strerror(last_errno);

        if (ep.tls) {
            // Bound the handshake by the connect timeout.
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return "SSL_CTX_new failed";
            SSL_CTX_set_verify(ctx, options.verify_tls ? SSL_VERIFY_PEER : SSL_VERIFY_NONE,
                               nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return "SSL_new failed";
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, ep.host.c_str()); // SNI
            if (options.verify_tls) SSL_set1_host(ssl, ep.host.c_str());

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                return std::string("TLS handshake with ") + ep.host + " failed: " + buf;
            }
        }

        // The event stream is long-lived: no read timeout once established.
        set_socket_timeout(0);
        return {};
    }

    ssize_t read_some(char* buf, size_t len) override {
        while (true) {
            if (shut_down_.load()) return 0;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL && errno == EINTR)
                    continue;
                return shut_down_.load() ? 0 : -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EINTR) continue;
                return shut_down_.load() ? 0 : -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) override {
        while (len > 0) {
            if (shut_down_.load()) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    // Wakes a reader blocked in recv/SSL_read on another thread.
    void shutdown() override {
        if (shut_down_.exchange(true)) return;
        if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    }

    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    std::atomic<bool> shut_down_{false};
};

} // namespace

// ── Request building ───────────────────────────────────────────

std::string build_request(const Endpoint& endpoint, const ClientOptions& options) {
    std::string req;
    req.reserve(256);
    req += "GET " + endpoint.path + " HTTP/1.1\r\n";
    req += "Host: " + host_header(endpoint) + "\r\n";
    req += "Accept: text/event-stream\r\n";
    req += "Cache-Control: no-cache\r\n";
    for (const auto& h : options.headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Connection: keep-alive\r\n\r\n";
    return req;
}

std::unique_ptr<ByteStream> SocketConnector::connect(const Endpoint& endpoint,
                                                     const ClientOptions& options) {
    auto stream = std::make_unique<SocketStream>();
    std::string error = stream->connect(endpoint, options);
    if (!error.empty()) throw ConnectionError(error);

    std::string request = build_request(endpoint, options);
    if (!stream->write_all(request.c_str(), request.size()))
        throw ConnectionError("failed to send request to " + endpoint.host);
    return std::make_unique<HttpResponseStream>(std::move(stream));
}

} // namespace eventsource
