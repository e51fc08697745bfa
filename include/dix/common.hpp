#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace dix {

// Error handling - using std::expected pattern
enum class ErrorCode {
  kSuccess = 0,
  kInvalidArgument,
  kNotExist,
  kNameNotExist,
  kValidationError,
  kFactoryError,
  kTypeMismatch,
  kFileNotFound,
  kParseError,
  kConfigError,
  kUnknownError
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// Error class for detailed error information
class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

  // An error carrying kSuccess is treated as "no error"
  bool isNil() const { return code_ == ErrorCode::kSuccess; }

  // "<code string>: <message>"
  std::string toString() const;

 private:
  ErrorCode code_;
  std::string message_;
};

// Result type alias
template <typename T>
using Result = std::expected<T, Error>;

// Convenience function for creating errors
inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

// Convenience function for creating error results
template<typename T>
inline Result<T> makeErrorResult(ErrorCode code, const std::string& message) {
  return std::unexpected(makeError(code, message));
}

}  // namespace dix
