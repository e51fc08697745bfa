#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "dix/common.hpp"
#include "dix/di/resolver.hpp"
#include "dix/di/type_key.hpp"

namespace dix::di {

void logSkippedField(const TypeKey& record, const std::string& field);

/**
 * @brief Describes the fields of a record that receive resolved instances
 *
 * Fields are injected in the order they are added. Const members are kept in
 * the description but never assigned.
 *
 * @code
 * struct Handler {
 *   std::shared_ptr<Greeter> greeter;
 *   static FieldSet<Handler> injectableFields() {
 *     return FieldSet<Handler>().field("greeter", &Handler::greeter);
 *   }
 * };
 * @endcode
 */
template <typename Record>
class FieldSet {
 public:
  template <typename T>
  FieldSet& field(std::string name, T Record::*member) {
    Field entry;
    entry.name = std::move(name);
    if constexpr (std::is_const_v<T>) {
      entry.settable = false;
    } else {
      entry.assign = [member](Resolver& resolver, Record& record) -> Result<void> {
        auto value = resolver.resolve<T>();
        if (!value.has_value()) {
          return std::unexpected(std::move(value.error()));
        }
        record.*member = std::move(*value);
        return {};
      };
      entry.settable = true;
    }
    fields_.push_back(std::move(entry));
    return *this;
  }

  std::size_t size() const { return fields_.size(); }

  std::vector<std::string> names() const {
    std::vector<std::string> result;
    result.reserve(fields_.size());
    for (const auto& entry : fields_) {
      result.push_back(entry.name);
    }
    return result;
  }

  // Stops at the first failure; fields assigned before it keep their values
  Result<void> injectInto(Resolver& resolver, Record& record) const {
    for (const auto& entry : fields_) {
      if (!entry.settable) {
        logSkippedField(TypeKey::of<Record>(), entry.name);
        continue;
      }
      auto assigned = entry.assign(resolver, record);
      if (!assigned.has_value()) {
        return assigned;
      }
    }
    return {};
  }

 private:
  struct Field {
    std::string name;
    std::function<Result<void>(Resolver&, Record&)> assign;
    bool settable = false;
  };

  std::vector<Field> fields_;
};

// Records that publish their own field description
template <typename Record>
concept Injectable = requires {
  { Record::injectableFields() } -> std::convertible_to<FieldSet<Record>>;
};

template <typename Record>
Result<void> inject(Resolver& resolver, Record& record, const FieldSet<Record>& fields) {
  return fields.injectInto(resolver, record);
}

template <Injectable Record>
Result<void> inject(Resolver& resolver, Record& record) {
  return inject(resolver, record, FieldSet<Record>(Record::injectableFields()));
}

}  // namespace dix::di
