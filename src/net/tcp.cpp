#include "net/tcp.hpp"

#include "net/socket.hpp"

namespace netmon_agent::net {
namespace {

class SocketConnector final : public TcpConnector {
 public:
  TcpResult connect(const std::string& host, const std::uint16_t port,
                    const std::chrono::milliseconds timeout) override {
    const auto start = std::chrono::steady_clock::now();
    std::string error;
    const Socket socket = connect_tcp(host, port, timeout, &error);
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);

    TcpResult result{};
    result.open = socket.valid();
    result.response_time_ms = elapsed.count();
    if (!result.open) {
      result.error = error.empty() ? "connection failed" : error;
    }
    return result;
  }
};

}  // namespace

std::unique_ptr<TcpConnector> make_socket_connector() { return std::make_unique<SocketConnector>(); }

}  // namespace netmon_agent::net
