#pragma once

#include "AppConfig.hpp"
#include "IngestionApi.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace ingest {

struct PollPolicy {
  std::chrono::milliseconds interval{2000};
  int maxPolls = 120;
};

enum class PollOutcome { Completed, Failed, TimedOut };

struct PollUpdate {
  std::string status;
  double percent = 0.0;
  std::optional<std::string> message;
};

struct PollResult {
  PollOutcome outcome = PollOutcome::TimedOut;
  PollUpdate last; // Last state forwarded to the callback
};

bool isTerminalStatus(const std::string &status);
bool isSuccessStatus(const std::string &status);

/**
 * Polls the progress endpoint for one ingestion job until it reports a
 * terminal status or the poll budget runs out. Transport errors are logged
 * and do not end polling. Percent never goes down unless the remote reports
 * an error state.
 */
class ProgressPoller {
public:
  using UpdateFn = std::function<void(const PollUpdate &)>;

  ProgressPoller(IngestionApi &api, PollPolicy policy = {});

  PollResult pollUntilTerminal(const AppConfig &config,
                               const std::string &progressId,
                               const UpdateFn &onUpdate);

  const PollPolicy &policy() const { return m_policy; }

private:
  IngestionApi &m_api;
  PollPolicy m_policy;
};

} // namespace ingest
