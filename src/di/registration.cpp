#include "dix/di/registration.hpp"

namespace dix::di {

std::string_view lifetimeToString(Lifetime lifetime) {
  switch (lifetime) {
    case Lifetime::kStatic:
      return "static";
    case Lifetime::kPerRequest:
      return "per_request";
  }
  return "unknown";
}

RegistrationOption withLifetime(Lifetime lifetime) {
  return [lifetime](RegistrationOptions& options) {
    options.lifetime = lifetime;
  };
}

RegistrationOption withName(std::string name) {
  return [name = std::move(name)](RegistrationOptions& options) {
    options.name = name;
  };
}

RegistrationOptions buildOptions(const RegistrationOptionList& defaults,
                                 const RegistrationOptionList& overrides) {
  RegistrationOptions options;
  for (const auto& option : defaults) {
    if (option) {
      option(options);
    }
  }
  for (const auto& option : overrides) {
    if (option) {
      option(options);
    }
  }
  return options;
}

}  // namespace dix::di
