#include "dix/di/container.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "dix/config/config.hpp"
#include "dix/util/logging.hpp"

namespace dix::di {

RegistrationItem::RegistrationItem(TypeKey type, Factory factory, RegistrationOptions options)
    : type_(std::move(type)), factory_(std::move(factory)), options_(std::move(options)) {}

Result<std::any> RegistrationItem::resolve(Resolver& resolver) {
  if (options_.lifetime != Lifetime::kStatic) {
    return run(resolver);
  }

  // Cached result (value or error) of a static item
  std::lock_guard<std::mutex> lock(static_mutex_);
  if (!cached_.has_value()) {
    cached_ = run(resolver);
  }
  return *cached_;
}

Result<std::any> RegistrationItem::run(Resolver& resolver) {
  Result<std::any> result = [&]() -> Result<std::any> {
    try {
      return factory_(resolver);
    } catch (const std::exception& e) {
      return std::unexpected(makeFactoryError(type_, e));
    }
  }();

  if (!result.has_value()) {
    util::logger()->warn("Factory for '{}' (name='{}') failed: {}", type_.name(),
                         options_.name, result.error().toString());
  }
  return result;
}

Container::Container(RegistrationOptionList default_options)
    : default_options_(std::move(default_options)) {}

Container Container::fromConfig(const config::Config& config) {
  return Container(config.defaultOptions());
}

void Container::registerInstance(const TypeKey& type, std::any instance,
                                 const RegistrationOptionList& options) {
  registerDynamic(
      type,
      [instance = std::move(instance)](Resolver&) -> Result<std::any> { return instance; },
      options);
}

void Container::registerDynamic(const TypeKey& type, Factory factory,
                                const RegistrationOptionList& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  addItem(type, std::move(factory), options);
}

void Container::replaceDynamic(const TypeKey& type, Factory factory,
                               const RegistrationOptionList& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  eraseGroup(type);
  addItem(type, std::move(factory), options);
}

void Container::replaceInstance(const TypeKey& type, std::any instance,
                                const RegistrationOptionList& options) {
  std::lock_guard<std::mutex> lock(mutex_);
  eraseGroup(type);
  addItem(
      type,
      [instance = std::move(instance)](Resolver&) -> Result<std::any> { return instance; },
      options);
}

void Container::removeAll(const TypeKey& type) {
  std::lock_guard<std::mutex> lock(mutex_);
  eraseGroup(type);
}

void Container::addItem(const TypeKey& type, Factory factory,
                        const RegistrationOptionList& options) {
  auto effective = buildOptions(default_options_, options);
  auto& group = groups_.try_emplace(type).first->second;
  auto item = std::make_shared<RegistrationItem>(type, std::move(factory), effective);

  // Unnamed items are appended; named items replace an earlier entry of the same name
  if (effective.name.empty()) {
    group.items.push_back(std::move(item));
  } else {
    group.named_items[effective.name] = std::move(item);
  }

  util::logger()->debug("Registered '{}' (name='{}', lifetime={})", type.name(),
                        effective.name, lifetimeToString(effective.lifetime));
}

void Container::eraseGroup(const TypeKey& type) {
  if (groups_.erase(type) > 0) {
    util::logger()->debug("Removed all registrations of '{}'", type.name());
  }
}

bool Container::isRegistered(const TypeKey& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return groups_.find(type) != groups_.end();
}

std::size_t Container::registrationCount(const TypeKey& type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(type);
  return it == groups_.end() ? 0 : it->second.size();
}

std::size_t Container::groupCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return groups_.size();
}

Result<RegistrationGroup*> Container::group(const TypeKey& type) {
  auto it = groups_.find(type);
  if (it == groups_.end()) {
    return makeErrorResult<RegistrationGroup*>(ErrorCode::kNotExist,
                                               fmt::format("'{}'", type.name()));
  }
  return &it->second;
}

Result<std::any> Container::resolveImpl(const TypeKey& type) {
  util::logger()->trace("Resolving '{}'", type.name());

  std::shared_ptr<RegistrationItem> item;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = group(type);
    if (!found.has_value()) {
      return std::unexpected(std::move(found.error()));
    }

    // Last anonymous registration wins, then the first named one
    if (!(*found)->items.empty()) {
      item = (*found)->items.back();
    } else if (!(*found)->named_items.empty()) {
      item = (*found)->named_items.begin()->second;
    } else {
      return makeErrorResult<std::any>(ErrorCode::kNotExist, fmt::format("'{}'", type.name()));
    }
  }
  return item->resolve(*this);
}

Result<std::any> Container::resolveByNameImpl(const TypeKey& type, const std::string& name) {
  util::logger()->trace("Resolving '{}' by name '{}'", type.name(), name);

  std::shared_ptr<RegistrationItem> item;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = group(type);
    if (!found.has_value()) {
      return std::unexpected(std::move(found.error()));
    }

    auto it = (*found)->named_items.find(name);
    if (it == (*found)->named_items.end()) {
      return makeErrorResult<std::any>(ErrorCode::kNameNotExist,
                                       fmt::format("'{}' for '{}'", name, type.name()));
    }
    item = it->second;
  }
  return item->resolve(*this);
}

Result<std::vector<std::any>> Container::resolveAllImpl(const TypeKey& type) {
  util::logger()->trace("Resolving all of '{}'", type.name());

  // Named items first, then anonymous ones in registration order
  std::vector<std::shared_ptr<RegistrationItem>> items;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = group(type);
    if (!found.has_value()) {
      return std::unexpected(std::move(found.error()));
    }

    items.reserve((*found)->size());
    for (const auto& [name, item] : (*found)->named_items) {
      items.push_back(item);
    }
    items.insert(items.end(), (*found)->items.begin(), (*found)->items.end());
  }

  std::vector<std::any> all;
  all.reserve(items.size());
  for (const auto& item : items) {
    auto instance = item->resolve(*this);
    if (!instance.has_value()) {
      return std::unexpected(std::move(instance.error()));
    }
    all.push_back(std::move(*instance));
  }
  return all;
}

Result<AnyMap> Container::resolveMapImpl(const TypeKey& type) {
  util::logger()->trace("Resolving named map of '{}'", type.name());

  std::map<std::string, std::shared_ptr<RegistrationItem>> named_items;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = group(type);
    if (!found.has_value()) {
      return std::unexpected(std::move(found.error()));
    }
    named_items = (*found)->named_items;
  }

  AnyMap result;
  for (const auto& [name, item] : named_items) {
    auto instance = item->resolve(*this);
    if (!instance.has_value()) {
      return std::unexpected(std::move(instance.error()));
    }
    result.emplace(name, std::move(*instance));
  }
  return result;
}

void Container::logRejectedConstructor(const TypeKey& type, const Error& error) const {
  util::logger()->warn("Rejected constructor '{}': {}", type.name(), error.toString());
}

}  // namespace dix::di
