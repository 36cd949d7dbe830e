// Send raw eml files, byte for byte, to an SMTP server.  This is used
// to test SMTP servers with real mail, optionally with a fresh Date:
// and Message-ID: so the server won't see a duplicate.

#include <gflags/gflags.h>
namespace gflags {
// in case we didn't have one
}

DEFINE_uint64(read_timeout, 30, "seconds to wait for a reply");
DEFINE_uint64(write_timeout, 180, "seconds to wait to send data");

#include "Runner.hpp"
#include "Settings.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>

#include <glog/logging.h>

namespace {
auto constexpr version = "1.5";

void write_usage(std::ostream& os)
{
  os << "Usage: sendeml json_file ...\n"
     << "---\n"
     << "json_file sample:\n"
     << json_sample() << '\n';
}

// False if any session, or the settings file itself, failed.
bool proc_json_file(std::string const& json_file, SMTP::Timeouts timeouts)
{
  auto const settings{get_settings(json_file)};

  auto ok{true};
  for (auto const& result : Runner::run(settings, timeouts)) {
    if (result.ok())
      continue;
    ok = false;
    if (result.file.empty()) {
      LOG(ERROR) << "error: " << json_file << ": " << result.error;
    }
    else {
      LOG(ERROR) << result.id << "error: " << json_file << ": " << result.file
                 << ": " << result.error;
    }
  }
  return ok;
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  FLAGS_logtostderr = true;

  { // Need to work with either namespace.
    using namespace gflags;
    using namespace google;
    SetVersionString(version);
    SetUsageMessage("sendeml json_file ...");
    ParseCommandLineFlags(&argc, &argv, true);
  }

  google::InitGoogleLogging(argv[0]);

  // A server hanging up on us is an error to report, not a signal.
  std::signal(SIGPIPE, SIG_IGN);

  if (argc == 1) {
    write_usage(std::cout);
    return EXIT_SUCCESS;
  }

  auto const timeouts{
      SMTP::Timeouts{std::chrono::seconds(FLAGS_read_timeout),
                     std::chrono::seconds(FLAGS_write_timeout)}};

  auto status{EXIT_SUCCESS};
  for (auto a{1}; a < argc; ++a) {
    std::string const json_file{argv[a]};
    try {
      if (!proc_json_file(json_file, timeouts))
        status = EXIT_FAILURE;
    }
    catch (std::exception const& e) {
      LOG(ERROR) << "error: " << json_file << ": " << e.what();
      status = EXIT_FAILURE;
    }
  }

  return status;
}
