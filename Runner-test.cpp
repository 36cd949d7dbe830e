#include "Runner.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.substr(0, prefix.size()) == prefix;
}

// Listens on a loopback port, a thread per connection.  Takes every
// message but one with "reject-me" in it.
class FakeServer {
public:
  FakeServer()
  {
    PCHECK((listen_ = socket(AF_INET, SOCK_STREAM, 0)) != -1);

    auto addr{sockaddr_in{}};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    PCHECK(bind(listen_, reinterpret_cast<sockaddr*>(&addr), sizeof addr)
           == 0);
    PCHECK(listen(listen_, 16) == 0);

    auto len{socklen_t{sizeof addr}};
    PCHECK(getsockname(listen_, reinterpret_cast<sockaddr*>(&addr), &len)
           == 0);
    port_ = ntohs(addr.sin_port);

    acceptor_ = std::thread(&FakeServer::accept_loop, this);
  }

  ~FakeServer()
  {
    PCHECK(shutdown(listen_, SHUT_RDWR) == 0);
    acceptor_.join();
    for (auto& t : sessions_) {
      t.join();
    }
    PCHECK(close(listen_) == 0);
  }

  uint16_t port() const { return port_; }
  int      connections() const { return connections_; }
  int      accepted() const { return accepted_; }
  int      rejected() const { return rejected_; }

private:
  void accept_loop()
  {
    for (;;) {
      auto const fd{accept(listen_, nullptr, nullptr)};
      if (fd == -1) {
        if (errno == EINTR)
          continue;
        return; // shut down
      }
      ++connections_;
      sessions_.emplace_back(&FakeServer::serve, this, fd);
    }
  }

  static bool read_line(int fd, std::string& line)
  {
    line.clear();
    for (;;) {
      char c;
      auto const n{read(fd, &c, 1)};
      if (n == -1 && errno == EINTR)
        continue;
      if (n != 1)
        return false;
      if (c == '\n') {
        if (!line.empty() && line.back() == '\r')
          line.pop_back();
        return true;
      }
      line.push_back(c);
    }
  }

  static void say(int fd, std::string_view reply)
  {
    while (!reply.empty()) {
      auto const n{write(fd, reply.data(), reply.size())};
      if (n == -1) {
        if (errno == EINTR)
          continue;
        PLOG(WARNING) << "fake server write";
        return;
      }
      reply.remove_prefix(n);
    }
  }

  void serve(int fd)
  {
    say(fd, "220 fake.example.com ESMTP\r\n");

    std::string line;
    while (read_line(fd, line)) {
      if (starts_with(line, "EHLO ")) {
        say(fd, "250-fake.example.com\r\n250 8BITMIME\r\n");
      }
      else if (starts_with(line, "MAIL FROM:") || starts_with(line, "RCPT TO:")
               || (line == "RSET")) {
        say(fd, "250 2.0.0 Ok\r\n");
      }
      else if (line == "DATA") {
        say(fd, "354 go ahead\r\n");
        std::string msg;
        while (read_line(fd, line) && (line != ".")) {
          msg += line;
          msg += "\r\n";
        }
        if (msg.find("reject-me") != std::string::npos) {
          ++rejected_;
          say(fd, "554 5.7.1 rejected\r\n");
        }
        else {
          ++accepted_;
          say(fd, "250 2.0.0 Ok: queued\r\n");
        }
      }
      else if (line == "QUIT") {
        say(fd, "221 2.0.0 Bye\r\n");
        break;
      }
      else {
        say(fd, "500 5.5.2 what?\r\n");
      }
    }
    PCHECK(close(fd) == 0);
  }

  int         listen_{-1};
  uint16_t    port_{0};
  std::thread acceptor_;

  std::vector<std::thread> sessions_; // touched by acceptor_ only

  std::atomic<int> connections_{0};
  std::atomic<int> accepted_{0};
  std::atomic<int> rejected_{0};
};

class Files {
public:
  Files()
  {
    char tmplt[]{"/tmp/Runner-test-XXXXXX"};
    PCHECK(mkdtemp(tmplt) != nullptr);
    dir_ = tmplt;
  }
  ~Files() { fs::remove_all(dir_); }

  std::string eml(char const* name, std::string_view subject) const
  {
    auto const path{dir_ / name};
    std::ofstream ofs(path, std::ios::binary);
    ofs << "Subject: " << subject << "\r\n"
        << "Date: Sun, 26 Jul 2020 22:01:37 +0900\r\n"
        << "Message-ID: <x@ah62.example.jp>\r\n"
        << "\r\n"
        << "test\r\n";
    return path.string();
  }
  std::string missing(char const* name) const { return (dir_ / name).string(); }

private:
  fs::path dir_;
};

auto const timeouts{SMTP::Timeouts{std::chrono::seconds(5),
                                   std::chrono::seconds(5)}};

Settings make_settings(uint16_t port, std::vector<std::string> files)
{
  Settings settings;
  settings.smtp_host    = "127.0.0.1";
  settings.smtp_port    = port;
  settings.from_address = "a001@ah62.example.jp";
  settings.to_addresses = {"a002@ah62.example.jp"};
  settings.eml_files    = std::move(files);
  return settings;
}

void test_sequential(Files const& files)
{
  FakeServer server;

  auto const settings{make_settings(
      server.port(), {files.eml("one.eml", "one"), files.missing("none.eml"),
                      files.eml("two.eml", "two")})};

  auto const results{Runner::run(settings, timeouts)};
  CHECK_EQ(results.size(), 1U);
  CHECK(results[0].ok()) << results[0].error;
  CHECK_EQ(results[0].id, "");
  CHECK_EQ(results[0].file, "");

  CHECK_EQ(server.connections(), 1);
  CHECK_EQ(server.accepted(), 2);
}

// One rejected message fails its own worker and no other.
void test_parallel(Files const& files)
{
  auto const eml_files{std::vector<std::string>{
      files.eml("one.eml", "one"),
      files.eml("bad.eml", "reject-me"),
      files.eml("two.eml", "two"),
      files.eml("three.eml", "three"),
  }};

  FakeServer server;

  auto settings{make_settings(server.port(), eml_files)};
  settings.use_parallel = true;

  auto const results{Runner::run(settings, timeouts)};
  CHECK_EQ(results.size(), eml_files.size());
  for (auto i{0u}; i < results.size(); ++i) {
    CHECK_EQ(results[i].id, fmt::format("id: {}, ", i + 1));
    CHECK_EQ(results[i].file, eml_files[i]);
    if (i == 1) {
      CHECK_EQ(results[i].error, "554 5.7.1 rejected");
    }
    else {
      CHECK(results[i].ok()) << results[i].id << results[i].error;
    }
  }

  CHECK_EQ(server.connections(), 4);
  CHECK_EQ(server.accepted(), 3);
  CHECK_EQ(server.rejected(), 1);

  // A single file needs no worker.
  settings.eml_files = {eml_files[0]};
  auto const single{Runner::run(settings, timeouts)};
  CHECK_EQ(single.size(), 1U);
  CHECK(single[0].ok()) << single[0].error;
  CHECK_EQ(single[0].id, "");
}

void test_no_server(Files const& files)
{
  // A port nothing listens on any more.
  auto const port = [] {
    FakeServer server;
    return server.port();
  }();

  auto const results{
      Runner::run(make_settings(port, {files.eml("one.eml", "one")}), timeouts)};
  CHECK_EQ(results.size(), 1U);
  CHECK_EQ(results[0].error, fmt::format("can't connect to 127.0.0.1:{}", port));
}

// With no room left for a thread stack, every file reports the failure
// to start its worker.  Run in a child, the address space limit is
// for good, and before any thread has been joined: the C library keeps
// the stacks of old threads for new ones.
void test_no_threads(Files const& files)
{
  auto const eml_files{std::vector<std::string>{
      files.eml("one.eml", "one"),
      files.eml("two.eml", "two"),
      files.eml("three.eml", "three"),
  }};

  auto const pid{fork()};
  PCHECK(pid != -1);
  if (pid == 0) {
    auto size{rlim_t{0}};
    {
      std::ifstream statm("/proc/self/statm");
      statm >> size;
      CHECK(statm) << "/proc/self/statm";
    }
    auto const page{sysconf(_SC_PAGESIZE)};
    PCHECK(page != -1);

    // Two MiB to spare, no thread stack fits.
    auto rl{rlimit{}};
    PCHECK(getrlimit(RLIMIT_AS, &rl) == 0);
    rl.rlim_cur = size * page + (2 << 20);
    PCHECK(setrlimit(RLIMIT_AS, &rl) == 0);

    auto settings{make_settings(1, eml_files)};
    settings.use_parallel = true;

    auto const results{Runner::run(settings, timeouts)};
    CHECK_EQ(results.size(), eml_files.size());
    for (auto i{0u}; i < results.size(); ++i) {
      CHECK_EQ(results[i].id, fmt::format("id: {}, ", i + 1));
      CHECK_EQ(results[i].file, eml_files[i]);
      CHECK(starts_with(results[i].error, "can't start worker: "))
          << results[i].error;
    }
    _exit(EXIT_SUCCESS);
  }

  auto status{0};
  PCHECK(waitpid(pid, &status, 0) == pid);
  CHECK(WIFEXITED(status)) << "child status " << status;
  CHECK_EQ(WEXITSTATUS(status), EXIT_SUCCESS);
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::signal(SIGPIPE, SIG_IGN);

  Files files;
  test_no_threads(files); // first, with no spare thread stacks cached
  test_sequential(files);
  test_parallel(files);
  test_no_server(files);

  std::cout << "all Runner tests passed\n";
}
