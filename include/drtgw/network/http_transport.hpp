// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (poll/SOCK_NONBLOCK)"
#endif

#include <drtgw/core/logger.hpp>
#include <drtgw/network/transport.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace drtgw
{
namespace network
{

/// \brief Blocking HTTP/1.1 client transport over POSIX sockets and OpenSSL.
/// \details
///   - One deadline per request covers name resolution, connect, TLS
///     handshake, write and read
///   - Keep-alive pool keyed by scheme://host:port, checked before reuse; a
///     pooled connection found closed by the peer is replaced once
///   - Content-Length, chunked and read-until-close response framing
///   - Cancellation is observed while resolving and while waiting on the socket
class HttpTransport : public Transport
{
public:
  /// \brief One TCP endpoint for a host name.
  struct ResolvedAddress
  {
    sockaddr_storage address;
    socklen_t length;
    int family;
    int protocol;
  };

  /// \brief Name lookup used to open connections. Runs on its own thread;
  /// failures are reported by throwing.
  using Resolver =
      std::function<std::vector<ResolvedAddress>(const std::string &host, std::uint16_t port)>;

  struct TlsConfig
  {
    std::string caFile; ///< empty = system default verify paths
    bool verifyPeer;

    TlsConfig() : verifyPeer(true) {}
  };

  struct Config
  {
    std::string userAgent;
    std::size_t maxIdlePerHost;
    std::chrono::seconds idleTimeout;
    std::size_t maxResponseSize;
    TlsConfig tls;
    /// \brief Empty means systemResolve().
    Resolver resolver;

    Config()
        : userAgent("drtgw/1.0"), maxIdlePerHost(4), idleTimeout(60),
          maxResponseSize(32 * 1024 * 1024), tls{}
    {
    }
  };

  /// \brief Monotonic counters.
  struct Stats
  {
    std::uint64_t connectionsOpened{0};
    std::uint64_t connectionsReused{0};
    std::uint64_t requests{0};
    std::uint64_t failures{0};
  };

  explicit HttpTransport(const Config &config = Config{}) : _config(config)
  {
    std::call_once(globalInitFlag(), initGlobal);
  }

  ~HttpTransport() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _idle.clear();
    if (_sslCtx)
    {
      ::SSL_CTX_free(_sslCtx);
      _sslCtx = nullptr;
    }
  }

  HttpTransport(const HttpTransport &) = delete;
  HttpTransport &operator=(const HttpTransport &) = delete;

  using Transport::execute;

  TransportResult execute(const HttpRequest &request) override
  {
    _requests.fetch_add(1);
    if (request.timeout.count() <= 0)
    {
      return fail(TransportError::Config, "timeout must be positive");
    }
    auto url = parseUrl(request.url);
    if (!url)
    {
      return fail(TransportError::Config, "invalid URL: " + request.url);
    }
    if (request.cancel && request.cancel->isCancelled())
    {
      return fail(TransportError::Cancelled, "cancelled before send");
    }

    const MonoTime deadline = MonoClock::now() + request.timeout;
    Waiter waiter{deadline, request.cancel.get()};
    try
    {
      const std::string wire = buildRequest(request, *url);
      ConnectionPtr conn = takeIdle(url->poolKey());
      bool reused = conn != nullptr;
      if (reused)
      {
        _reused.fetch_add(1);
        DRTGW_LOG_DEBUG("HttpTransport: reusing connection to " << conn->key);
      }
      for (;;)
      {
        if (!conn)
        {
          conn = open(*url, waiter);
        }
        conn->sent = 0;
        conn->received = 0;
        try
        {
          writeAll(*conn, wire, waiter);
          bool reusable = false;
          RawResponse response = readResponse(*conn, waiter, reusable);
          if (reusable)
          {
            release(std::move(conn));
          }
          else
          {
            DRTGW_LOG_DEBUG("HttpTransport: closing connection to " << conn->key);
          }
          return TransportResult::success(std::move(response));
        }
        catch (const IoError &e)
        {
          if (!reused || !canResend(e, *conn, request.method))
          {
            throw;
          }
          DRTGW_LOG_DEBUG("HttpTransport: pooled connection to " << conn->key
                                                                << " was closed by the peer, reconnecting");
          conn.reset();
          reused = false;
        }
      }
    }
    catch (const IoError &e)
    {
      _failures.fetch_add(1);
      DRTGW_LOG_DEBUG("HttpTransport: " << toString(request.method) << " " << request.url
                                        << " failed (" << toString(e.cause) << "): " << e.what());
      return TransportResult::failed(e.cause, e.what(), e.sysErrno);
    }
    catch (const std::exception &e)
    {
      _failures.fetch_add(1);
      return TransportResult::failed(TransportError::Protocol, e.what());
    }
  }

  /// \brief Number of pooled idle connections across all hosts.
  std::size_t idleConnectionCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::size_t count = 0;
    for (const auto &entry : _idle)
    {
      count += entry.second.size();
    }
    return count;
  }

  /// \brief Drops every pooled connection.
  void closeIdle()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _idle.clear();
  }

  /// \brief Blocking getaddrinfo() lookup of TCP endpoints.
  /// \throws std::runtime_error with the resolver's message on failure.
  static std::vector<ResolvedAddress> systemResolve(const std::string &host, std::uint16_t port)
  {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    const std::string service = std::to_string(port);
    int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0)
    {
      throw std::runtime_error(::gai_strerror(gai));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    std::vector<ResolvedAddress> addresses;
    for (addrinfo *ai = res; ai; ai = ai->ai_next)
    {
      if (ai->ai_addrlen > sizeof(sockaddr_storage))
      {
        continue;
      }
      ResolvedAddress entry{};
      std::memcpy(&entry.address, ai->ai_addr, ai->ai_addrlen);
      entry.length = ai->ai_addrlen;
      entry.family = ai->ai_family;
      entry.protocol = ai->ai_protocol;
      addresses.push_back(entry);
    }
    return addresses;
  }

  Stats stats() const
  {
    Stats s;
    s.connectionsOpened = _opened.load();
    s.connectionsReused = _reused.load();
    s.requests = _requests.load();
    s.failures = _failures.load();
    return s;
  }

private:
  struct ParsedUrl
  {
    std::string scheme;
    std::string host;
    std::uint16_t port;
    std::string target;
    bool defaultPort;

    bool isHttps() const { return scheme == "https"; }
    std::string poolKey() const { return scheme + "://" + host + ":" + std::to_string(port); }
  };

  struct Connection
  {
    int fd{-1};
    SSL *ssl{nullptr};
    std::string key;
    MonoTime lastUsed{};
    // Per-request byte counts, reset before each write.
    std::size_t sent{0};
    std::size_t received{0};

    ~Connection()
    {
      if (ssl)
      {
        ::SSL_free(ssl);
      }
      if (fd >= 0)
      {
        ::close(fd);
      }
    }
  };
  using ConnectionPtr = std::unique_ptr<Connection>;

  class IoError : public std::runtime_error
  {
  public:
    IoError(TransportError c, const std::string &m, int e = 0)
        : std::runtime_error(m), cause(c), sysErrno(e)
    {
    }
    TransportError cause;
    int sysErrno;
  };

  /// Polls a socket in short slices so that cancellation is noticed.
  struct Waiter
  {
    MonoTime deadline;
    const core::CancellationToken *cancel;

    /// Throws on cancel or an expired deadline, otherwise returns the next
    /// wait slice in milliseconds.
    int nextSlice() const
    {
      if (cancel && cancel->isCancelled())
      {
        throw IoError(TransportError::Cancelled, "request cancelled");
      }
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - MonoClock::now());
      if (remaining.count() <= 0)
      {
        throw IoError(TransportError::Timeout, "request timed out");
      }
      return static_cast<int>(std::min<std::int64_t>(remaining.count(), 50));
    }

    template <typename T> void waitReady(std::future<T> &future) const
    {
      for (;;)
      {
        if (future.wait_for(std::chrono::milliseconds(nextSlice())) == std::future_status::ready)
        {
          return;
        }
      }
    }

    void wait(int fd, short events) const
    {
      for (;;)
      {
        int slice = nextSlice();
        pollfd pfd{fd, events, 0};
        int rc = ::poll(&pfd, 1, slice);
        if (rc < 0)
        {
          if (errno == EINTR)
            continue;
          throw IoError(TransportError::Receive, "poll: " + lastErr(), errno);
        }
        if (rc > 0)
        {
          return;
        }
      }
    }
  };

  Config _config;
  mutable std::mutex _mutex;
  std::map<std::string, std::vector<ConnectionPtr>> _idle;
  SSL_CTX *_sslCtx{nullptr};
  std::string _sslCtxError;
  std::atomic<std::uint64_t> _opened{0};
  std::atomic<std::uint64_t> _reused{0};
  std::atomic<std::uint64_t> _requests{0};
  std::atomic<std::uint64_t> _failures{0};

  static std::once_flag &globalInitFlag()
  {
    static std::once_flag flag;
    return flag;
  }

  static void initGlobal()
  {
    ::OPENSSL_init_ssl(0, nullptr);
    // SSL_write on a reset socket raises SIGPIPE otherwise.
    ::signal(SIGPIPE, SIG_IGN);
  }

  static std::string lastErr() { return std::strerror(errno); }

  static std::string sslErr()
  {
    unsigned long code = ::ERR_get_error();
    if (code == 0)
    {
      return "unknown TLS error";
    }
    char buf[256];
    ::ERR_error_string_n(code, buf, sizeof(buf));
    ::ERR_clear_error();
    return buf;
  }

  TransportResult fail(TransportError cause, const std::string &message)
  {
    _failures.fetch_add(1);
    return TransportResult::failed(cause, message);
  }

  static std::optional<ParsedUrl> parseUrl(const std::string &url)
  {
    static const std::regex urlRegex(
        R"(^(https?):\/\/([^:\/\s?#]+)(?::(\d+))?(\/[^?#\s]*)?(\?[^#\s]*)?(?:#.*)?$)",
        std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex))
    {
      return std::nullopt;
    }
    ParsedUrl parsed;
    parsed.scheme = match[1].str();
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parsed.host = match[2].str();
    parsed.defaultPort = !match[3].matched;
    if (match[3].matched)
    {
      unsigned long port = std::stoul(match[3].str());
      if (port == 0 || port > 65535)
      {
        return std::nullopt;
      }
      parsed.port = static_cast<std::uint16_t>(port);
    }
    else
    {
      parsed.port = parsed.isHttps() ? 443 : 80;
    }
    parsed.target = match[4].matched ? match[4].str() : "/";
    parsed.target += match[5].str();
    return parsed;
  }

  std::string buildRequest(const HttpRequest &request, const ParsedUrl &url) const
  {
    std::ostringstream out;
    out << toString(request.method) << " " << url.target << " HTTP/1.1\r\n";
    out << "Host: " << url.host;
    if (!url.defaultPort)
    {
      out << ":" << url.port;
    }
    out << "\r\n";
    out << "User-Agent: " << _config.userAgent << "\r\n";
    out << "Accept: application/json\r\n";
    out << "Connection: keep-alive\r\n";
    bool hasContentType = false;
    for (const auto &header : request.headers)
    {
      std::string lower = toLower(header.first);
      if (lower == "content-length" || lower == "host" || lower == "connection")
      {
        continue;
      }
      hasContentType = hasContentType || lower == "content-type";
      out << header.first << ": " << header.second << "\r\n";
    }
    if (request.body)
    {
      if (!hasContentType)
      {
        out << "Content-Type: application/json\r\n";
      }
      out << "Content-Length: " << request.body->size() << "\r\n\r\n" << *request.body;
    }
    else
    {
      if (request.method == HttpMethod::Post)
      {
        out << "Content-Length: 0\r\n";
      }
      out << "\r\n";
    }
    return out.str();
  }

  static std::string toLower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  ConnectionPtr takeIdle(const std::string &key)
  {
    auto now = MonoClock::now();
    for (;;)
    {
      ConnectionPtr conn;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _idle.find(key);
        if (it == _idle.end() || it->second.empty())
        {
          return nullptr;
        }
        conn = std::move(it->second.back());
        it->second.pop_back();
      }
      if (now - conn->lastUsed <= _config.idleTimeout && isAlive(*conn))
      {
        return conn;
      }
      DRTGW_LOG_DEBUG("HttpTransport: evicting stale connection to " << key);
    }
  }

  /// An idle keep-alive socket must not be readable: readable means the peer
  /// closed it or sent something unsolicited.
  static bool isAlive(const Connection &conn)
  {
    pollfd pfd{conn.fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, 0);
    return rc == 0;
  }

  /// A pooled socket the peer closed while idle fails before any response
  /// byte arrives. Sending again is safe when nothing was written, or when
  /// the request is a GET.
  static bool canResend(const IoError &e, const Connection &conn, HttpMethod method)
  {
    return e.cause == TransportError::PeerClosed && conn.received == 0 &&
           (conn.sent == 0 || method == HttpMethod::Get);
  }

  void release(ConnectionPtr conn)
  {
    conn->lastUsed = MonoClock::now();
    std::lock_guard<std::mutex> lock(_mutex);
    auto &bucket = _idle[conn->key];
    if (bucket.size() < _config.maxIdlePerHost)
    {
      bucket.push_back(std::move(conn));
    }
  }

  /// getaddrinfo() cannot be interrupted, so the lookup runs on a detached
  /// thread that owns the promise and a copy of the resolver. The caller
  /// stops waiting at the request deadline or on cancel.
  std::vector<ResolvedAddress> resolve(const ParsedUrl &url, const Waiter &waiter) const
  {
    Resolver resolver = _config.resolver ? _config.resolver : Resolver(&HttpTransport::systemResolve);
    auto promise = std::make_shared<std::promise<std::vector<ResolvedAddress>>>();
    auto future = promise->get_future();
    try
    {
      std::thread(
          [promise, resolver, host = url.host, port = url.port]()
          {
            try
            {
              promise->set_value(resolver(host, port));
            }
            catch (...)
            {
              promise->set_exception(std::current_exception());
            }
          })
          .detach();
    }
    catch (const std::system_error &e)
    {
      throw IoError(TransportError::Resolve, "resolve " + url.host + ": " + e.what());
    }

    waiter.waitReady(future);
    try
    {
      return future.get();
    }
    catch (const std::exception &e)
    {
      throw IoError(TransportError::Resolve, "resolve " + url.host + ": " + e.what());
    }
  }

  ConnectionPtr open(const ParsedUrl &url, const Waiter &waiter)
  {
    const std::vector<ResolvedAddress> addresses = resolve(url, waiter);
    const std::string port = std::to_string(url.port);

    auto conn = std::make_unique<Connection>();
    conn->key = url.poolKey();
    std::string lastError = "no addresses";
    int lastErrno = 0;
    for (const auto &address : addresses)
    {
      int fd = ::socket(address.family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC,
                        address.protocol);
      if (fd < 0)
      {
        lastError = "socket: " + lastErr();
        lastErrno = errno;
        continue;
      }
      int rc = ::connect(fd, reinterpret_cast<const sockaddr *>(&address.address), address.length);
      if (rc < 0 && errno != EINPROGRESS)
      {
        lastError = "connect: " + lastErr();
        lastErrno = errno;
        ::close(fd);
        continue;
      }
      if (rc < 0)
      {
        try
        {
          waiter.wait(fd, POLLOUT);
        }
        catch (const IoError &)
        {
          ::close(fd);
          throw;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
        if (soError != 0)
        {
          lastError = std::string("connect: ") + std::strerror(soError);
          lastErrno = soError;
          ::close(fd);
          continue;
        }
      }
      int one = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      conn->fd = fd;
      break;
    }
    if (conn->fd < 0)
    {
      throw IoError(TransportError::Connect, url.host + ":" + port + " " + lastError, lastErrno);
    }

    if (url.isHttps())
    {
      handshake(*conn, url, waiter);
    }
    _opened.fetch_add(1);
    DRTGW_LOG_DEBUG("HttpTransport: connected to " << conn->key);
    return conn;
  }

  SSL_CTX *sslContext()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_sslCtx || !_sslCtxError.empty())
    {
      return _sslCtx;
    }
    SSL_CTX *ctx = ::SSL_CTX_new(TLS_client_method());
    if (!ctx)
    {
      _sslCtxError = "SSL_CTX_new(client): " + sslErr();
      return nullptr;
    }
    if (_config.tls.verifyPeer)
    {
      ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
      int ok = _config.tls.caFile.empty()
                   ? ::SSL_CTX_set_default_verify_paths(ctx)
                   : ::SSL_CTX_load_verify_locations(ctx, _config.tls.caFile.c_str(), nullptr);
      if (ok != 1)
      {
        _sslCtxError = "cannot load CA certificates: " + sslErr();
        ::SSL_CTX_free(ctx);
        return nullptr;
      }
    }
    else
    {
      ::SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    }
    _sslCtx = ctx;
    return _sslCtx;
  }

  void handshake(Connection &conn, const ParsedUrl &url, const Waiter &waiter)
  {
    SSL_CTX *ctx = sslContext();
    if (!ctx)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      throw IoError(TransportError::Config, _sslCtxError);
    }
    conn.ssl = ::SSL_new(ctx);
    if (!conn.ssl)
    {
      throw IoError(TransportError::TLSHandshake, "SSL_new(client) failed");
    }
    ::SSL_set_fd(conn.ssl, conn.fd);
    ::SSL_set_tlsext_host_name(conn.ssl, url.host.c_str());
    if (_config.tls.verifyPeer)
    {
      ::SSL_set1_host(conn.ssl, url.host.c_str());
    }
    ::SSL_set_connect_state(conn.ssl);
    for (;;)
    {
      int rc = ::SSL_do_handshake(conn.ssl);
      if (rc == 1)
      {
        return;
      }
      int code = ::SSL_get_error(conn.ssl, rc);
      if (code == SSL_ERROR_WANT_READ)
      {
        waiter.wait(conn.fd, POLLIN);
      }
      else if (code == SSL_ERROR_WANT_WRITE)
      {
        waiter.wait(conn.fd, POLLOUT);
      }
      else
      {
        throw IoError(TransportError::TLSHandshake, "TLS handshake with " + url.host + ": " + sslErr());
      }
    }
  }

  static void writeAll(Connection &conn, const std::string &data, const Waiter &waiter)
  {
    std::size_t sent = 0;
    while (sent < data.size())
    {
      if (conn.ssl)
      {
        int n = ::SSL_write(conn.ssl, data.data() + sent, static_cast<int>(data.size() - sent));
        if (n > 0)
        {
          sent += static_cast<std::size_t>(n);
          conn.sent += static_cast<std::size_t>(n);
          continue;
        }
        int code = ::SSL_get_error(conn.ssl, n);
        if (code == SSL_ERROR_WANT_WRITE)
          waiter.wait(conn.fd, POLLOUT);
        else if (code == SSL_ERROR_WANT_READ)
          waiter.wait(conn.fd, POLLIN);
        else
          throw IoError(TransportError::TLSIO, "SSL_write: " + sslErr(), errno);
        continue;
      }

      ssize_t n = ::send(conn.fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n > 0)
      {
        sent += static_cast<std::size_t>(n);
        conn.sent += static_cast<std::size_t>(n);
      }
      else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
      {
        waiter.wait(conn.fd, POLLOUT);
      }
      else if (n < 0 && errno == EINTR)
      {
        continue;
      }
      else if (n < 0 && (errno == EPIPE || errno == ECONNRESET))
      {
        throw IoError(TransportError::PeerClosed, "send: " + lastErr(), errno);
      }
      else
      {
        throw IoError(TransportError::Send, "send: " + lastErr(), errno);
      }
    }
  }

  /// Appends available bytes to \p buffer; returns false on orderly EOF.
  static bool readSome(Connection &conn, std::string &buffer, const Waiter &waiter)
  {
    char chunk[16384];
    for (;;)
    {
      if (conn.ssl)
      {
        int n = ::SSL_read(conn.ssl, chunk, sizeof(chunk));
        if (n > 0)
        {
          buffer.append(chunk, static_cast<std::size_t>(n));
          conn.received += static_cast<std::size_t>(n);
          return true;
        }
        int code = ::SSL_get_error(conn.ssl, n);
        if (code == SSL_ERROR_WANT_READ)
          waiter.wait(conn.fd, POLLIN);
        else if (code == SSL_ERROR_WANT_WRITE)
          waiter.wait(conn.fd, POLLOUT);
        else if (code == SSL_ERROR_ZERO_RETURN || (code == SSL_ERROR_SYSCALL && n == 0))
          return false;
        else
          throw IoError(TransportError::TLSIO, "SSL_read: " + sslErr(), errno);
        continue;
      }

      ssize_t n = ::recv(conn.fd, chunk, sizeof(chunk), 0);
      if (n > 0)
      {
        buffer.append(chunk, static_cast<std::size_t>(n));
        conn.received += static_cast<std::size_t>(n);
        return true;
      }
      if (n == 0)
      {
        return false;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK)
      {
        waiter.wait(conn.fd, POLLIN);
      }
      else if (errno == ECONNRESET)
      {
        throw IoError(TransportError::PeerClosed, "recv: " + lastErr(), errno);
      }
      else if (errno != EINTR)
      {
        throw IoError(TransportError::Receive, "recv: " + lastErr(), errno);
      }
    }
  }

  void readMore(Connection &conn, std::string &buffer, const Waiter &waiter) const
  {
    if (!readSome(conn, buffer, waiter))
    {
      throw IoError(TransportError::PeerClosed,
                    "connection closed before receiving complete HTTP response");
    }
    if (buffer.size() > _config.maxResponseSize)
    {
      throw IoError(TransportError::Protocol, "response exceeds maximum size");
    }
  }

  RawResponse readResponse(Connection &conn, const Waiter &waiter, bool &reusable) const
  {
    std::string buffer;
    RawResponse response;
    std::size_t bodyStart = 0;
    bool http10 = false;
    // Skip interim 1xx responses.
    for (;;)
    {
      std::size_t headerEnd;
      while ((headerEnd = buffer.find("\r\n\r\n")) == std::string::npos)
      {
        if (buffer.size() > 64 * 1024)
        {
          throw IoError(TransportError::Protocol, "response headers too large");
        }
        readMore(conn, buffer, waiter);
      }
      response = RawResponse{};
      http10 = parseHead(buffer.substr(0, headerEnd), response);
      bodyStart = headerEnd + 4;
      if (response.statusCode >= 200 || response.statusCode < 100)
      {
        break;
      }
      buffer.erase(0, bodyStart);
    }

    std::string connectionHeader = toLower(response.header("connection").value_or(""));
    reusable = http10 ? connectionHeader.find("keep-alive") != std::string::npos
                      : connectionHeader.find("close") == std::string::npos;

    std::string encoding = toLower(response.header("transfer-encoding").value_or(""));
    auto contentLength = response.header("content-length");
    if (response.statusCode == 204 || response.statusCode == 304)
    {
      return response;
    }
    if (encoding.find("chunked") != std::string::npos)
    {
      response.body = readChunked(conn, buffer, bodyStart, waiter);
    }
    else if (contentLength)
    {
      std::size_t length = std::stoul(*contentLength);
      if (length > _config.maxResponseSize)
      {
        throw IoError(TransportError::Protocol, "response exceeds maximum size");
      }
      while (buffer.size() - bodyStart < length)
      {
        readMore(conn, buffer, waiter);
      }
      response.body = buffer.substr(bodyStart, length);
    }
    else
    {
      reusable = false;
      while (readSome(conn, buffer, waiter))
      {
        if (buffer.size() > _config.maxResponseSize)
        {
          throw IoError(TransportError::Protocol, "response exceeds maximum size");
        }
      }
      response.body = buffer.substr(bodyStart);
    }
    return response;
  }

  std::string readChunked(Connection &conn, std::string &buffer, std::size_t pos,
                          const Waiter &waiter) const
  {
    std::string body;
    for (;;)
    {
      std::size_t lineEnd;
      while ((lineEnd = buffer.find("\r\n", pos)) == std::string::npos)
      {
        readMore(conn, buffer, waiter);
      }
      std::string sizeLine = buffer.substr(pos, lineEnd - pos);
      sizeLine = sizeLine.substr(0, sizeLine.find(';'));
      std::size_t size = std::stoul(sizeLine, nullptr, 16);
      pos = lineEnd + 2;
      if (size == 0)
      {
        // Trailer section ends with an empty line.
        for (;;)
        {
          while ((lineEnd = buffer.find("\r\n", pos)) == std::string::npos)
          {
            readMore(conn, buffer, waiter);
          }
          bool empty = lineEnd == pos;
          pos = lineEnd + 2;
          if (empty)
          {
            return body;
          }
        }
      }
      while (buffer.size() < pos + size + 2)
      {
        readMore(conn, buffer, waiter);
      }
      body.append(buffer, pos, size);
      pos += size + 2;
    }
  }

  /// Parses the status line and headers; returns true for an HTTP/1.0 peer.
  static bool parseHead(const std::string &head, RawResponse &response)
  {
    static const std::regex statusRegex(R"(HTTP/(\d)\.(\d)\s+(\d{3})\s*(.*))");
    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r')
    {
      line.pop_back();
    }
    std::smatch match;
    if (!std::regex_match(line, match, statusRegex))
    {
      throw IoError(TransportError::Protocol, "invalid HTTP status line: " + line);
    }
    bool http10 = match[1].str() == "1" && match[2].str() == "0";
    response.statusCode = std::stoi(match[3].str());
    response.statusText = match[4].str();

    while (std::getline(stream, line))
    {
      if (!line.empty() && line.back() == '\r')
      {
        line.pop_back();
      }
      auto colon = line.find(':');
      if (colon == std::string::npos)
      {
        continue;
      }
      std::string name = toLower(line.substr(0, colon));
      std::string value = line.substr(colon + 1);
      value.erase(0, value.find_first_not_of(" \t"));
      value.erase(value.find_last_not_of(" \t") + 1);
      response.headers[name] = value;
    }
    return http10;
  }
};

} // namespace network
} // namespace drtgw
