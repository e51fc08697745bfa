#pragma once

#include <any>
#include <map>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "dix/common.hpp"
#include "dix/di/type_key.hpp"

namespace dix::di {

using AnyMap = std::map<std::string, std::any>;

/**
 * @brief Exception thrown by Resolver::require when resolution fails
 */
class ResolutionException : public std::exception {
 public:
  explicit ResolutionException(Error error)
      : error_(std::move(error)), message_(error_.toString()) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  const Error& error() const noexcept { return error_; }

 private:
  Error error_;
  std::string message_;
};

// Cast a type-erased instance back to T
template <typename T>
Result<T> castInstance(const std::any& instance) {
  if (const T* value = std::any_cast<T>(&instance)) {
    return *value;
  }
  return makeErrorResult<T>(
      ErrorCode::kTypeMismatch,
      fmt::format("unable to cast instance to {}", TypeKey::of<T>().name()));
}

/**
 * @brief Read side of the container: resolves instances by type descriptor
 *
 * Implementations provide the untyped operations; the typed helpers cast the
 * erased values back to T.
 */
class Resolver {
 public:
  virtual ~Resolver() = default;

  /**
   * @brief Resolve the instance registered for a type
   *
   * The last anonymous registration wins; a named registration is used only
   * when there are no anonymous ones.
   */
  Result<std::any> resolve(const TypeKey& type) {
    return resolveImpl(type);
  }

  /**
   * @brief Resolve every instance registered for a type, named first
   */
  Result<std::vector<std::any>> resolveAll(const TypeKey& type) {
    return resolveAllImpl(type);
  }

  /**
   * @brief Resolve the instance registered for a type under a name
   */
  Result<std::any> resolveByName(const TypeKey& type, const std::string& name) {
    return resolveByNameImpl(type, name);
  }

  /**
   * @brief Resolve the named instances of a type, keyed by name
   */
  Result<AnyMap> resolveMap(const TypeKey& type) {
    return resolveMapImpl(type);
  }

  template <typename T>
  Result<T> resolve() {
    auto instance = resolveImpl(TypeKey::of<T>());
    if (!instance.has_value()) {
      return std::unexpected(instance.error());
    }
    return castInstance<T>(*instance);
  }

  template <typename T>
  Result<T> resolveByName(const std::string& name) {
    auto instance = resolveByNameImpl(TypeKey::of<T>(), name);
    if (!instance.has_value()) {
      return std::unexpected(instance.error());
    }
    return castInstance<T>(*instance);
  }

  template <typename T>
  Result<std::vector<T>> resolveAll() {
    auto instances = resolveAllImpl(TypeKey::of<T>());
    if (!instances.has_value()) {
      return std::unexpected(instances.error());
    }

    std::vector<T> casts;
    casts.reserve(instances->size());
    for (const auto& instance : *instances) {
      auto cast = castInstance<T>(instance);
      if (!cast.has_value()) {
        return std::unexpected(cast.error());
      }
      casts.push_back(std::move(*cast));
    }
    return casts;
  }

  template <typename T>
  Result<std::map<std::string, T>> resolveMap() {
    auto instances = resolveMapImpl(TypeKey::of<T>());
    if (!instances.has_value()) {
      return std::unexpected(instances.error());
    }

    std::map<std::string, T> casts;
    for (const auto& [name, instance] : *instances) {
      auto cast = castInstance<T>(instance);
      if (!cast.has_value()) {
        return std::unexpected(cast.error());
      }
      casts.emplace(name, std::move(*cast));
    }
    return casts;
  }

  /**
   * @brief Resolve or throw ResolutionException
   */
  template <typename T>
  T require() {
    auto result = resolve<T>();
    if (!result.has_value()) {
      throw ResolutionException(result.error());
    }
    return std::move(*result);
  }

 protected:
  virtual Result<std::any> resolveImpl(const TypeKey& type) = 0;

  virtual Result<std::vector<std::any>> resolveAllImpl(const TypeKey& type) = 0;

  virtual Result<std::any> resolveByNameImpl(const TypeKey& type,
                                             const std::string& name) = 0;

  virtual Result<AnyMap> resolveMapImpl(const TypeKey& type) = 0;
};

}  // namespace dix::di
