#pragma once

#include <string>
#include <typeindex>
#include <typeinfo>

namespace dix::di {

// Comparable identity of a C++ type, used as the registry key.
// Top-level cv and reference qualifiers are ignored (as with typeid).
class TypeKey {
 public:
  template <typename T>
  static TypeKey of() {
    return TypeKey(typeid(T));
  }

  explicit TypeKey(const std::type_info& info);

  // Demangled type name, for messages and logs
  const std::string& name() const { return name_; }

  std::type_index index() const noexcept { return index_; }

  bool operator==(const TypeKey& other) const noexcept { return index_ == other.index_; }
  bool operator!=(const TypeKey& other) const noexcept { return index_ != other.index_; }
  bool operator<(const TypeKey& other) const noexcept { return index_ < other.index_; }

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const TypeKey& key) const noexcept;
  };

 private:
  std::type_index index_;
  std::string name_;
};

// Demangle a compiler type name; returns the input unchanged if it cannot.
std::string demangle(const char* mangled);

}  // namespace dix::di

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<dix::di::TypeKey> : dix::di::TypeKey::Hash {};
}  // namespace std
