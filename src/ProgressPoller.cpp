#include "ProgressPoller.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace ingest {

bool isSuccessStatus(const std::string &status) {
  return status == "completed" || status == "done";
}

bool isTerminalStatus(const std::string &status) {
  return isSuccessStatus(status) || status == "error" || status == "failed";
}

ProgressPoller::ProgressPoller(IngestionApi &api, PollPolicy policy)
    : m_api(api), m_policy(policy) {}

PollResult ProgressPoller::pollUntilTerminal(const AppConfig &config,
                                             const std::string &progressId,
                                             const UpdateFn &onUpdate) {
  PollResult result;

  for (int poll = 0; poll < m_policy.maxPolls; ++poll) {
    std::this_thread::sleep_for(m_policy.interval);

    ProgressReport report;
    try {
      report = m_api.fetchProgress(config, progressId);
    } catch (const TransferError &e) {
      std::cerr << "[Poller] " << progressId << ": poll " << poll + 1
                << " failed: " << e.what() << std::endl;
      continue;
    }

    PollUpdate update;
    update.status = report.status;
    update.message = report.message;
    double reported = std::clamp(report.percent.value_or(result.last.percent),
                                 0.0, 100.0);
    bool remoteError = report.status == "error" || report.status == "failed";
    update.percent = remoteError ? reported : std::max(result.last.percent, reported);

    result.last = update;
    if (onUpdate)
      onUpdate(update);

    if (!isTerminalStatus(report.status))
      continue;

    if (isSuccessStatus(report.status)) {
      PollUpdate done{"done", 100.0, report.message};
      result.last = done;
      if (onUpdate)
        onUpdate(done);
      result.outcome = PollOutcome::Completed;
    } else {
      result.outcome = PollOutcome::Failed;
    }
    std::cout << "[Poller] " << progressId << " finished with status "
              << report.status << std::endl;
    return result;
  }

  std::cout << "[Poller] " << progressId << ": no terminal status after "
            << m_policy.maxPolls << " polls, leaving it at '"
            << result.last.status << "'" << std::endl;
  result.outcome = PollOutcome::TimedOut;
  return result;
}

} // namespace ingest
