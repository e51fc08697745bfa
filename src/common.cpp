#include "dix/common.hpp"

namespace dix {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kNotExist:
      return "Item does not exist in the container";
    case ErrorCode::kNameNotExist:
      return "Item with the given name does not exist in the container";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kFactoryError:
      return "Factory error";
    case ErrorCode::kTypeMismatch:
      return "Type mismatch";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::toString() const {
  std::string result(errorCodeToString(code_));
  if (!message_.empty()) {
    result += ": ";
    result += message_;
  }
  return result;
}

}  // namespace dix
