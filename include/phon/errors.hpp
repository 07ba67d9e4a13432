#pragma once

#include <stdexcept>
#include <string>

namespace phon {

enum class ErrorCode {
  CurriculumCorrupt,
  ProfileNotFound,
  StorageCorrupt,
  StorageWriteFailed,
  SynthesisFailed,
  SessionAlreadyActive
};

inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::CurriculumCorrupt: return "CurriculumCorrupt";
    case ErrorCode::ProfileNotFound: return "ProfileNotFound";
    case ErrorCode::StorageCorrupt: return "StorageCorrupt";
    case ErrorCode::StorageWriteFailed: return "StorageWriteFailed";
    case ErrorCode::SynthesisFailed: return "SynthesisFailed";
    case ErrorCode::SessionAlreadyActive: return "SessionAlreadyActive";
  }
  return "Unknown";
}

class PhonicsError : public std::runtime_error {
public:
  PhonicsError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

class CurriculumCorrupt : public PhonicsError {
public:
  explicit CurriculumCorrupt(const std::string& message)
      : PhonicsError(ErrorCode::CurriculumCorrupt, "Curriculum corrupt: " + message) {}
};

class ProfileNotFound : public PhonicsError {
public:
  explicit ProfileNotFound(const std::string& profile_id)
      : PhonicsError(ErrorCode::ProfileNotFound, "Profile not found: " + profile_id) {}
};

class StorageCorrupt : public PhonicsError {
public:
  StorageCorrupt(const std::string& profile_id, const std::string& reason)
      : PhonicsError(ErrorCode::StorageCorrupt,
                     "Stored progress for '" + profile_id + "' is unreadable: " + reason) {}
};

class StorageWriteFailed : public PhonicsError {
public:
  StorageWriteFailed(const std::string& profile_id, const std::string& reason)
      : PhonicsError(ErrorCode::StorageWriteFailed,
                     "Failed to write progress for '" + profile_id + "': " + reason) {}
};

class SessionAlreadyActive : public PhonicsError {
public:
  explicit SessionAlreadyActive(const std::string& profile_id)
      : PhonicsError(ErrorCode::SessionAlreadyActive,
                     "A session is already active for profile: " + profile_id) {}
};

// A recoverable problem surfaced to the UI. `message` is meant for the child,
// `detail` for logs.
struct Notice {
  ErrorCode code = ErrorCode::StorageCorrupt;
  std::string message;
  std::string detail;
};

} // namespace phon
