#pragma once
#include <asio.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace svcman_test {

inline std::filesystem::path mkd(const std::string& name) {
  auto d = std::filesystem::temp_directory_path() / ("svcman_" + name);
  std::filesystem::remove_all(d);
  std::filesystem::create_directories(d);
  return d;
}

inline void write_text(const std::filesystem::path& p, const std::string& s) {
  std::ofstream o(p, std::ios::trunc);
  o << s;
}

inline std::string read_text(const std::filesystem::path& p) {
  std::ifstream in(p);
  return std::string((std::istreambuf_iterator<char>(in)), {});
}

// a loopback port nobody listens on (best effort)
inline unsigned short unused_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor acc(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  unsigned short port = acc.local_endpoint().port();
  acc.close();
  return port;
}

// Answers every request with a fixed status until destroyed.
class HttpStub {
public:
  explicit HttpStub(int status)
    : acc_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
      status_(status) {
    port_ = acc_.local_endpoint().port();
    th_ = std::thread([this] { run(); });
  }

  ~HttpStub() {
    stopping_ = true;
    // wake the blocking accept
    asio::io_context io;
    asio::ip::tcp::socket s(io);
    asio::error_code ec;
    s.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_), ec);
    th_.join();
  }

  HttpStub(const HttpStub&) = delete;
  HttpStub& operator=(const HttpStub&) = delete;

  unsigned short port() const { return port_; }
  int hits() const { return hits_.load(); }
  std::string url(const std::string& path = "/") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

private:
  void run() {
    while (!stopping_.load()) {
      asio::ip::tcp::socket sock(io_);
      asio::error_code ec;
      acc_.accept(sock, ec);
      if (ec || stopping_.load()) continue;

      asio::streambuf req;
      asio::read_until(sock, req, "\r\n\r\n", ec);
      if (ec) continue;
      ++hits_;

      std::string body = "status " + std::to_string(status_) + "\n";
      std::string resp = "HTTP/1.1 " + std::to_string(status_) + " " + reason() +
                         "\r\nContent-Type: text/plain\r\nContent-Length: " +
                         std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
      asio::write(sock, asio::buffer(resp), ec);
      sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
      sock.close(ec);
    }
  }

  std::string reason() const {
    switch (status_) {
    case 200: return "OK";
    case 404: return "Not Found";
    case 503: return "Service Unavailable";
    default: return "Status";
    }
  }

  asio::io_context io_;
  asio::ip::tcp::acceptor acc_;
  unsigned short port_ = 0;
  int status_;
  std::atomic<bool> stopping_{false};
  std::atomic<int> hits_{0};
  std::thread th_;
};

} // namespace svcman_test
