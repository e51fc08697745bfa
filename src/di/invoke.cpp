#include "dix/di/invoke.hpp"

namespace dix::di {

Error makeNotInvocableError(const TypeKey& type) {
  return makeError(ErrorCode::kValidationError,
                   fmt::format("'{}' must be a function", type.name()));
}

Error makeFactoryError(const TypeKey& type, const std::exception& exception) {
  return makeError(ErrorCode::kFactoryError,
                   fmt::format("'{}' threw: {}", type.name(), exception.what()));
}

std::optional<Error> ErrorTraits<Error>::toError(const Error& error) {
  if (error.isNil()) {
    return std::nullopt;
  }
  return error;
}

std::optional<Error> ErrorTraits<std::error_code>::toError(const std::error_code& error) {
  if (!error) {
    return std::nullopt;
  }
  return makeError(ErrorCode::kFactoryError,
                   fmt::format("{}: {}", error.category().name(), error.message()));
}

std::optional<Error> ErrorTraits<std::exception_ptr>::toError(const std::exception_ptr& error) {
  if (!error) {
    return std::nullopt;
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return makeError(ErrorCode::kFactoryError, e.what());
  } catch (...) {
    return makeError(ErrorCode::kFactoryError, "unknown exception");
  }
}

}  // namespace dix::di
