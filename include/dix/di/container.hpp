#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "dix/common.hpp"
#include "dix/di/invoke.hpp"
#include "dix/di/registration.hpp"
#include "dix/di/resolver.hpp"
#include "dix/di/type_key.hpp"

namespace dix::config {
class Config;
}  // namespace dix::config

namespace dix::di {

// Produces the instance for one registration
using Factory = std::function<Result<std::any>(Resolver&)>;

/**
 * @brief One factory binding with its effective options
 *
 * Static items keep the result of their first invocation, failures included.
 * Per-request items run their factory on every call without locking.
 */
class RegistrationItem {
 public:
  RegistrationItem(TypeKey type, Factory factory, RegistrationOptions options);

  Result<std::any> resolve(Resolver& resolver);

 private:
  Result<std::any> run(Resolver& resolver);

  TypeKey type_;
  Factory factory_;
  RegistrationOptions options_;

  // Guards cached_; held across a static item's first construction
  std::mutex static_mutex_;
  std::optional<Result<std::any>> cached_;
};

/**
 * @brief All registrations of one type
 *
 * An item is either anonymous (kept in registration order) or named.
 */
struct RegistrationGroup {
  std::vector<std::shared_ptr<RegistrationItem>> items;
  std::map<std::string, std::shared_ptr<RegistrationItem>> named_items;

  std::size_t size() const { return items.size() + named_items.size(); }
};

/**
 * @brief Dependency injection container
 *
 * Maps type descriptors to factories. Every registration receives the
 * container's default options first, then its own. The registry is guarded by
 * one mutex that is never held while a factory runs, so factories may resolve
 * from the container they belong to, on any thread.
 */
class Container : public Resolver {
 public:
  explicit Container(RegistrationOptionList default_options = {});
  ~Container() override = default;

  // Default options taken from the configuration
  static Container fromConfig(const config::Config& config);

  // Non-copyable, non-movable
  Container(const Container&) = delete;
  Container& operator=(const Container&) = delete;
  Container(Container&&) = delete;
  Container& operator=(Container&&) = delete;

  /**
   * @brief Register a fixed instance under a type
   */
  void registerInstance(const TypeKey& type, std::any instance,
                        const RegistrationOptionList& options = {});

  /**
   * @brief Register a factory under a type
   */
  void registerDynamic(const TypeKey& type, Factory factory,
                       const RegistrationOptionList& options = {});

  /**
   * @brief Remove every registration of the type, then register the factory
   */
  void replaceDynamic(const TypeKey& type, Factory factory,
                      const RegistrationOptionList& options = {});

  /**
   * @brief Remove every registration of the type, then register the instance
   */
  void replaceInstance(const TypeKey& type, std::any instance,
                       const RegistrationOptionList& options = {});

  /**
   * @brief Remove every registration of the type
   */
  void removeAll(const TypeKey& type);

  bool isRegistered(const TypeKey& type) const;

  // Named and anonymous registrations of the type
  std::size_t registrationCount(const TypeKey& type) const;

  // Number of types with at least one registration
  std::size_t groupCount() const;

  template <typename T>
  void registerInstance(std::type_identity_t<T> instance,
                        const RegistrationOptionList& options = {}) {
    registerInstance(TypeKey::of<T>(), std::any(std::move(instance)), options);
  }

  template <typename T>
  void registerDynamic(std::function<Result<T>(Resolver&)> factory,
                       const RegistrationOptionList& options = {}) {
    registerDynamic(TypeKey::of<T>(), eraseFactory<T>(std::move(factory)), options);
  }

  template <typename T>
  void replaceInstance(std::type_identity_t<T> instance,
                       const RegistrationOptionList& options = {}) {
    replaceInstance(TypeKey::of<T>(), std::any(std::move(instance)), options);
  }

  template <typename T>
  void replaceDynamic(std::function<Result<T>(Resolver&)> factory,
                      const RegistrationOptionList& options = {}) {
    replaceDynamic(TypeKey::of<T>(), eraseFactory<T>(std::move(factory)), options);
  }

  template <typename T>
  void removeAll() {
    removeAll(TypeKey::of<T>());
  }

  template <typename T>
  bool isRegistered() const {
    return isRegistered(TypeKey::of<T>());
  }

  /**
   * @brief Register a callable whose parameters are resolved from the container
   *
   * The registration key is the callable's value type. Callables that return
   * nothing, only an error, or a value paired with a non-error are rejected
   * with kValidationError and nothing is registered.
   */
  template <typename F>
  Result<void> registerConstructor(F&& constructor, const RegistrationOptionList& options = {}) {
    auto valid = validateConstructor<F>();
    if (!valid.has_value()) {
      logRejectedConstructor(TypeKey::of<std::decay_t<F>>(), valid.error());
      return valid;
    }
    if constexpr (Introspectable<F>) {
      registerDynamic(
          TypeKey::of<InvokeValue<F>>(),
          [constructor = std::decay_t<F>(std::forward<F>(constructor))](
              Resolver& resolver) mutable { return invokeAny(resolver, constructor); },
          options);
    }
    return {};
  }

 protected:
  Result<std::any> resolveImpl(const TypeKey& type) override;

  Result<std::vector<std::any>> resolveAllImpl(const TypeKey& type) override;

  Result<std::any> resolveByNameImpl(const TypeKey& type, const std::string& name) override;

  Result<AnyMap> resolveMapImpl(const TypeKey& type) override;

 private:
  template <typename T>
  static Factory eraseFactory(std::function<Result<T>(Resolver&)> factory) {
    return [factory = std::move(factory)](Resolver& resolver) -> Result<std::any> {
      auto instance = factory(resolver);
      if (!instance.has_value()) {
        return std::unexpected(std::move(instance.error()));
      }
      return std::any(std::move(*instance));
    };
  }

  // Looks up the group for a type; kNotExist if there is none. Caller holds mutex_.
  Result<RegistrationGroup*> group(const TypeKey& type);

  // Caller holds mutex_
  void addItem(const TypeKey& type, Factory factory, const RegistrationOptionList& options);
  void eraseGroup(const TypeKey& type);

  void logRejectedConstructor(const TypeKey& type, const Error& error) const;

  mutable std::mutex mutex_;
  std::unordered_map<TypeKey, RegistrationGroup> groups_;
  RegistrationOptionList default_options_;
};

}  // namespace dix::di
