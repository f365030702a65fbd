#include "WHOIS.hpp"

#include "WHOIS-classify.hpp"
#include "WHOIS-resolver.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(live, false, "also query the real whois.verisign-grs.com");

using namespace std::string_literals;

namespace {
// Accepts one connection on 127.0.0.1 and hands it to session.
class loopback_server {
public:
  loopback_server(loopback_server const&) = delete;
  loopback_server& operator=(loopback_server const&) = delete;

  explicit loopback_server(std::function<void(int)> session)
  {
    PCHECK((fd_ = socket(AF_INET, SOCK_STREAM, 0)) >= 0);

    auto in4{sockaddr_in{}};
    in4.sin_family      = AF_INET;
    in4.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    in4.sin_port        = 0;
    PCHECK(bind(fd_, reinterpret_cast<sockaddr*>(&in4), sizeof(in4)) == 0);
    PCHECK(listen(fd_, 1) == 0);

    socklen_t len = sizeof(in4);
    PCHECK(getsockname(fd_, reinterpret_cast<sockaddr*>(&in4), &len) == 0);
    port_ = ntohs(in4.sin_port);

    thread_ = std::thread([this, session] {
      int const conn = accept(fd_, nullptr, nullptr);
      PCHECK(conn >= 0) << "accept() failed";
      session(conn);
      close(conn);
    });
  }

  ~loopback_server()
  {
    thread_.join();
    close(fd_);
  }

  uint16_t port() const { return port_; }

private:
  int         fd_{-1};
  uint16_t    port_{0};
  std::thread thread_;
};

// Everything up to and including the CRLF.
std::string read_line(int fd)
{
  std::string line;
  char        ch;
  while (read(fd, &ch, 1) == 1) {
    line += ch;
    if (line.size() >= 2 && line.compare(line.size() - 2, 2, "\r\n") == 0)
      break;
  }
  return line;
}

void write_all(int fd, std::string_view data)
{
  while (!data.empty()) {
    auto const n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    PCHECK(n > 0) << "send() failed";
    data.remove_prefix(n);
  }
}

// Have close() send a reset rather than a FIN.
void abort_on_close(int fd)
{
  auto const lng{linger{1, 0}};
  PCHECK(setsockopt(fd, SOL_SOCKET, SO_LINGER, &lng, sizeof(lng)) == 0);
}

uint16_t unused_port()
{
  int fd;
  PCHECK((fd = socket(AF_INET, SOCK_STREAM, 0)) >= 0);
  auto in4{sockaddr_in{}};
  in4.sin_family      = AF_INET;
  in4.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(fd, reinterpret_cast<sockaddr*>(&in4), sizeof(in4)) == 0);
  socklen_t len = sizeof(in4);
  PCHECK(getsockname(fd, reinterpret_cast<sockaddr*>(&in4), &len) == 0);
  close(fd); // bound, never listening
  return ntohs(in4.sin_port);
}

auto constexpr taken_response = R"(   Domain Name: EXAMPLE.COM
   Registry Domain ID: 2336799_DOMAIN_COM-VRSN
   Registrar WHOIS Server: whois.iana.org
   Registrar: RESERVED-Internet Assigned Numbers Authority
>>> Last update of whois database: 2024-01-01T00:00:00Z <<<
)";
} // namespace

int main(int argc, char* argv[])
{
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  // The whole response, sent in pieces, ending when the server closes.
  {
    std::string query_seen;
    auto const  big = std::string(100 * 1024, 'x');

    std::string response;
    {
      loopback_server srv([&](int fd) {
        query_seen = read_line(fd);
        write_all(fd, taken_response);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        write_all(fd, big);
      });

      response = WHOIS::query("127.0.0.1", "domain example.com",
                              Config::no_timeout, srv.port());
    }
    CHECK_EQ(response, taken_response + big);
    CHECK_EQ(query_seen, "domain example.com\r\n");

    CHECK_EQ(WHOIS::Classifier::standard().classify("whois.verisign-grs.com",
                                                    response, "example.com"),
             WHOIS::status::taken);
  }

  // Host names resolve, and a server that says nothing is not an error.
  {
    std::string query_seen;
    std::string response;
    {
      loopback_server srv([&](int fd) { query_seen = read_line(fd); });

      response = WHOIS::query("localhost", "example.com",
                              std::chrono::seconds(10), srv.port());
    }
    CHECK(response.empty());
    CHECK_EQ(query_seen, "example.com\r\n");
  }

  // Connection reset after part of the response: keep what arrived.
  {
    loopback_server srv([](int fd) {
      read_line(fd);
      write_all(fd, taken_response);
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      abort_on_close(fd);
    });

    auto const response = WHOIS::query("127.0.0.1", "example.com",
                                       std::chrono::seconds(10), srv.port());
    CHECK_EQ(response, taken_response);
  }

  // Connection reset before any response.
  {
    loopback_server srv([](int fd) {
      read_line(fd);
      abort_on_close(fd);
    });

    try {
      WHOIS::query("127.0.0.1", "example.com", std::chrono::seconds(10),
                   srv.port());
      LOG(FATAL) << "should have thrown";
    }
    catch (WHOIS::query_error const& ex) {
      CHECK_EQ(ex.server(), "127.0.0.1");
      LOG(INFO) << ex.what();
    }
  }

  // Timeout.
  {
    loopback_server srv([](int fd) {
      read_line(fd);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    });

    try {
      WHOIS::query("127.0.0.1", "example.com", std::chrono::milliseconds(100),
                   srv.port());
      LOG(FATAL) << "should have timed out";
    }
    catch (WHOIS::query_error const& ex) {
      CHECK_EQ(ex.server(), "127.0.0.1");
      CHECK_NE(std::string(ex.what()).find(
                   "timed out at [127.0.0.1] after 0 octets"),
               std::string::npos)
          << ex.what();
    }
  }

  // Connection refused.
  try {
    WHOIS::query("127.0.0.1", "example.com", Config::no_timeout,
                 unused_port());
    LOG(FATAL) << "should have thrown";
  }
  catch (WHOIS::query_error const& ex) {
    CHECK_EQ(ex.server(), "127.0.0.1");
    CHECK_NE(std::string(ex.what()).find("whois query to 127.0.0.1 failed"),
             std::string::npos);
  }

  // Name doesn't resolve.
  try {
    WHOIS::query("no-such-host.invalid", "example.com");
    LOG(FATAL) << "should have thrown";
  }
  catch (WHOIS::query_error const& ex) {
    CHECK_EQ(ex.server(), "no-such-host.invalid");
  }

  if (FLAGS_live) {
    WHOIS::Resolver const res;
    auto const            server = res.resolve("example.com");
    auto const response = WHOIS::query(server, "example.com",
                                       std::chrono::seconds(30));
    CHECK(!response.empty());
    CHECK(response.find("No match") != std::string::npos
          || response.find("Registrar:") != std::string::npos)
        << response;
  }
}
