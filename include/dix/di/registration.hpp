#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dix::di {

/**
 * @brief Registration lifetime options
 */
enum class Lifetime {
  kStatic,     // Factory runs once, result is reused for the container's lifetime
  kPerRequest  // Factory runs on every resolution
};

std::string_view lifetimeToString(Lifetime lifetime);

/**
 * @brief Effective settings of a single registration
 */
struct RegistrationOptions {
  Lifetime lifetime = Lifetime::kPerRequest;
  std::string name;  // empty = anonymous
};

// Options are applied in order; later options win on conflicting fields.
using RegistrationOption = std::function<void(RegistrationOptions&)>;
using RegistrationOptionList = std::vector<RegistrationOption>;

RegistrationOption withLifetime(Lifetime lifetime);

RegistrationOption withName(std::string name);

// Apply defaults, then overrides, on top of a default-constructed RegistrationOptions
RegistrationOptions buildOptions(const RegistrationOptionList& defaults,
                                 const RegistrationOptionList& overrides);

}  // namespace dix::di
