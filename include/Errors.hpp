#pragma once

#include <stdexcept>
#include <string>

namespace ingest {

// Filesystem read/walk failures.
class IoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The OS notification backend refused the watch.
class WatchSetupError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Base for every failure of a remote call. The uploader retries on it and
 * reports the final message in UploadResult::error.
 */
class TransferError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Connect/send/receive/timeout failures.
class NetworkError : public TransferError {
public:
  using TransferError::TransferError;
};

// Non-2xx status or a body that could not be parsed.
class RemoteProtocolError : public TransferError {
public:
  RemoteProtocolError(const std::string &message, int status = 0)
      : TransferError(message), m_status(status) {}

  int status() const { return m_status; }

private:
  int m_status;
};

} // namespace ingest
