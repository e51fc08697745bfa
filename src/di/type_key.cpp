#include "dix/di/type_key.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace dix::di {

std::string demangle(const char* mangled) {
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) {
    return std::string(demangled.get());
  }
#endif
  return std::string(mangled);
}

TypeKey::TypeKey(const std::type_info& info)
    : index_(info), name_(demangle(info.name())) {}

std::size_t TypeKey::Hash::operator()(const TypeKey& key) const noexcept {
  return std::hash<std::type_index>{}(key.index_);
}

}  // namespace dix::di
