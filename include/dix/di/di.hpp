#pragma once

// Convenience header for the dependency injection container

#include "dix/di/container.hpp"
#include "dix/di/inject.hpp"
#include "dix/di/invoke.hpp"
#include "dix/di/registration.hpp"
#include "dix/di/resolver.hpp"
#include "dix/di/type_key.hpp"
