#include "Runner.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include <glog/logging.h>

namespace Runner {

void send_messages(Settings const&                 settings,
                   std::vector<std::string> const& eml_files,
                   std::string const&              log_prefix,
                   SMTP::Timeouts                  timeouts)
{
  auto const conn{SMTP::Connection::open(settings.smtp_host, settings.smtp_port,
                                         log_prefix, timeouts)};
  SMTP::send_messages(*conn, settings, eml_files);
}

namespace {
Result session(Settings const&                 settings,
               std::vector<std::string> const& eml_files,
               std::string                     id,
               std::string                     file,
               SMTP::Timeouts                  timeouts)
{
  Result result{std::move(id), std::move(file), ""};
  try {
    send_messages(settings, eml_files, result.id, timeouts);
  }
  catch (std::exception const& e) {
    result.error = e.what();
    if (result.error.empty())
      result.error = "unknown error";
  }
  return result;
}
} // namespace

std::vector<Result> run(Settings const& settings, SMTP::Timeouts timeouts)
{
  auto const& files = settings.eml_files;

  if (!settings.use_parallel || (files.size() <= 1)) {
    return {session(settings, files, "", "", timeouts)};
  }

  // Each worker writes only its own slot.
  std::vector<Result>      results(files.size());
  std::vector<std::thread> workers;
  workers.reserve(files.size());

  for (auto i{std::size_t{0}}; i < files.size(); ++i) {
    auto id{fmt::format("id: {}, ", i + 1)};
    try {
      workers.emplace_back([&settings, &files, &results, timeouts, i, id] {
        results[i] = session(settings, {files[i]}, id, files[i], timeouts);
      });
    }
    catch (std::system_error const& e) {
      // This file, and every one after it, never gets a worker.
      LOG(ERROR) << id << "can't start worker: " << e.what();
      for (auto j{i}; j < files.size(); ++j) {
        results[j] = Result{fmt::format("id: {}, ", j + 1), files[j],
                            fmt::format("can't start worker: {}", e.what())};
      }
      break;
    }
  }

  for (auto& worker : workers) {
    worker.join();
  }

  return results;
}

} // namespace Runner
