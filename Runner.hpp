#ifndef RUNNER_DOT_HPP
#define RUNNER_DOT_HPP

#include <string>
#include <vector>

#include "Send.hpp"
#include "Settings.hpp"

namespace Runner {

// How one session ended.  An empty error is success.
struct Result {
  std::string id;   // worker prefix, "id: 1, " or empty
  std::string file; // the eml file of a parallel worker, else empty
  std::string error;

  bool ok() const { return error.empty(); }
};

// Connect, run the whole SMTP conversation for eml_files, close.
void send_messages(Settings const&                 settings,
                   std::vector<std::string> const& eml_files,
                   std::string const&              log_prefix,
                   SMTP::Timeouts                  timeouts);

// One session over all of the settings' eml files, or with
// use_parallel and more than one file, a session per file on its own
// connection and thread.  Every session is waited for, and each
// reports its own result; none is thrown.  A file whose thread can't
// be started reports that as its error.
std::vector<Result> run(Settings const& settings,
                        SMTP::Timeouts  timeouts = SMTP::Timeouts{});

} // namespace Runner

#endif // RUNNER_DOT_HPP
