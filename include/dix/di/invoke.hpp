#pragma once

#include <any>
#include <exception>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "dix/common.hpp"
#include "dix/di/function_traits.hpp"
#include "dix/di/resolver.hpp"
#include "dix/di/type_key.hpp"

namespace dix::di {

// Upper bound on the number of trailing arguments invokeVariadic can splat
inline constexpr std::size_t kMaxVariadicArguments = 16;

// Errors shared by invoke and constructor registration
Error makeNotInvocableError(const TypeKey& type);
Error makeFactoryError(const TypeKey& type, const std::exception& exception);

namespace detail {

// Bind one parameter from the resolver according to its shape
template <typename P>
Result<P> bindArgument(Resolver& resolver) {
  if constexpr (SequenceTraits<P>::kIsSequence) {
    using Element = typename SequenceTraits<P>::Element;
    auto all = resolver.resolveAll<Element>();
    if (!all.has_value()) {
      return std::unexpected(all.error());
    }
    if constexpr (SequenceTraits<P>::kFixedSize) {
      constexpr std::size_t kSize = SequenceTraits<P>::kSize;
      if (all->size() != kSize) {
        return makeErrorResult<P>(
            ErrorCode::kValidationError,
            fmt::format("{} requires exactly {} instances of {}, {} are registered",
                        TypeKey::of<P>().name(), kSize, TypeKey::of<Element>().name(),
                        all->size()));
      }
      return [&]<std::size_t... I>(std::index_sequence<I...>) {
        return P{std::move((*all)[I])...};
      }(std::make_index_sequence<kSize>{});
    } else if constexpr (std::is_same_v<P, std::vector<Element>>) {
      return std::move(*all);
    } else {
      return P(std::make_move_iterator(all->begin()), std::make_move_iterator(all->end()));
    }
  } else if constexpr (StringMapTraits<P>::kIsStringMap) {
    using Element = typename StringMapTraits<P>::Element;
    auto named = resolver.resolveMap<Element>();
    if (!named.has_value()) {
      return std::unexpected(named.error());
    }
    P mapping;
    for (auto& [name, value] : *named) {
      mapping.emplace(name, std::move(value));
    }
    return mapping;
  } else {
    return resolver.resolve<P>();
  }
}

// Lvalue-reference parameters see the bound value; everything else gets it moved
template <typename Param, typename Value>
decltype(auto) passArgument(Value& value) {
  if constexpr (std::is_lvalue_reference_v<Param>) {
    return (value);
  } else {
    return std::move(value);
  }
}

template <typename Tuple>
struct Binder;

template <typename... Params>
struct Binder<std::tuple<Params...>> {
  using Slots = std::tuple<std::optional<std::remove_cvref_t<Params>>...>;

  // Binds every parameter in declaration order, stopping at the first failure
  static std::optional<Error> bind(Resolver& resolver, Slots& slots) {
    std::optional<Error> failure;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
      (bindSlot(resolver, std::get<I>(slots), failure) && ...);
    }(std::index_sequence_for<Params...>{});
    return failure;
  }

  template <typename F, typename... Trailing>
  static decltype(auto) call(F& callable, Slots& slots, Trailing&&... trailing) {
    return [&]<std::size_t... I>(std::index_sequence<I...>) -> decltype(auto) {
      return std::invoke(callable, passArgument<Params>(*std::get<I>(slots))...,
                         std::forward<Trailing>(trailing)...);
    }(std::index_sequence_for<Params...>{});
  }

 private:
  template <typename P>
  static bool bindSlot(Resolver& resolver, std::optional<P>& slot,
                       std::optional<Error>& failure) {
    auto value = bindArgument<P>(resolver);
    if (!value.has_value()) {
      failure.emplace(std::move(value.error()));
      return false;
    }
    slot.emplace(std::move(*value));
    return true;
  }
};

template <typename F>
using SignatureOf = FunctionTraits<std::decay_t<F>>;

template <typename R>
using ReturnOf = ReturnTraits<std::remove_cvref_t<R>>;

// Run the call and fold its return shape into a Result
template <typename R, typename Call>
Result<typename ReturnOf<R>::Value> runNormalized(const TypeKey& type, Call&& call) {
  try {
    if constexpr (std::is_void_v<R>) {
      call();
      return {};
    } else {
      std::remove_cvref_t<R> result = call();
      return ReturnOf<R>::normalize(std::move(result));
    }
  } catch (const std::exception& e) {
    return std::unexpected(makeFactoryError(type, e));
  }
}

}  // namespace detail

// Value type a callable produces once its return shape is normalized
template <Introspectable F>
using InvokeValue =
    typename detail::ReturnOf<typename detail::SignatureOf<F>::ReturnType>::Value;

/**
 * @brief Resolve every parameter of a callable and call it
 *
 * Sequence parameters (vector, deque, list, array) receive all instances of
 * their element type, string-keyed maps receive the named instances, any
 * other parameter receives resolve<T>(). A failed binding returns before the
 * callable runs. An error returned by the callable (expected, or the second
 * member of a pair/tuple) voids the value.
 */
template <Introspectable F>
Result<InvokeValue<F>> invoke(Resolver& resolver, F&& callable) {
  using Signature = detail::SignatureOf<F>;
  using Bind = detail::Binder<typename Signature::ArgumentTypes>;
  using Return = typename Signature::ReturnType;

  typename Bind::Slots slots;
  if (auto failure = Bind::bind(resolver, slots)) {
    return std::unexpected(std::move(*failure));
  }
  return detail::runNormalized<Return>(
      TypeKey::of<std::decay_t<F>>(),
      [&]() -> decltype(auto) { return Bind::call(callable, slots); });
}

/**
 * @brief Type-erased invoke; rejects non-callables at run time
 */
template <typename F>
Result<std::any> invokeAny(Resolver& resolver, F&& callable) {
  if constexpr (!Introspectable<F>) {
    return std::unexpected(makeNotInvocableError(TypeKey::of<std::decay_t<F>>()));
  } else {
    auto result = invoke(resolver, std::forward<F>(callable));
    if (!result.has_value()) {
      return std::unexpected(std::move(result.error()));
    }
    if constexpr (std::is_void_v<InvokeValue<F>>) {
      return std::any{};
    } else {
      return std::any(std::move(*result));
    }
  }
}

namespace detail {

template <std::size_t N, typename Bind, typename Value, typename F, typename Element>
Result<Value> callWithTail(const TypeKey& type, F& callable, typename Bind::Slots& slots,
                           std::vector<Element>& tail) {
  if (tail.size() == N) {
    return [&]<std::size_t... I>(std::index_sequence<I...>) -> Result<Value> {
      auto call = [&]() -> decltype(auto) {
        return Bind::call(callable, slots, std::move(tail[I])...);
      };
      return runNormalized<decltype(call())>(type, call);
    }(std::make_index_sequence<N>{});
  }
  if constexpr (N < kMaxVariadicArguments) {
    return callWithTail<N + 1, Bind, Value>(type, callable, slots, tail);
  } else {
    return makeErrorResult<Value>(
        ErrorCode::kValidationError,
        fmt::format("{} instances of {} exceed the variadic limit of {}", tail.size(),
                    TypeKey::of<Element>().name(), kMaxVariadicArguments));
  }
}

}  // namespace detail

/**
 * @brief Invoke a callable whose trailing parameters are a pack of Element
 *
 * The Leading parameters are bound like invoke() does; then every instance
 * of Element is passed as its own trailing argument, e.g. for
 * [](Config cfg, auto... plugins) use invokeVariadic<Plugin, Config>.
 */
template <typename Element, typename... Leading, typename F>
auto invokeVariadic(Resolver& resolver, F&& callable)
    -> Result<typename detail::ReturnOf<std::invoke_result_t<F&, Leading...>>::Value> {
  using Value = typename detail::ReturnOf<std::invoke_result_t<F&, Leading...>>::Value;
  using Bind = detail::Binder<std::tuple<Leading...>>;

  typename Bind::Slots slots;
  if (auto failure = Bind::bind(resolver, slots)) {
    return std::unexpected(std::move(*failure));
  }

  auto tail = resolver.resolveAll<Element>();
  if (!tail.has_value()) {
    return std::unexpected(std::move(tail.error()));
  }
  return detail::callWithTail<0, Bind, Value>(TypeKey::of<std::decay_t<F>>(), callable,
                                              slots, *tail);
}

/**
 * @brief Check that a callable can serve as a constructor
 *
 * A constructor returns one value, optionally paired with an error-capable
 * second value (or wrapped in std::expected).
 */
template <typename F>
Result<void> validateConstructor() {
  if constexpr (!Introspectable<F>) {
    return std::unexpected(makeNotInvocableError(TypeKey::of<std::decay_t<F>>()));
  } else {
    using Return = detail::ReturnOf<typename detail::SignatureOf<F>::ReturnType>;
    if constexpr (Return::kShape == ReturnShape::kNothing ||
                  Return::kShape == ReturnShape::kErrorOnly ||
                  Return::kShape == ReturnShape::kUnsupported) {
      return makeErrorResult<void>(ErrorCode::kValidationError,
                                   "function must have a return value and optional error");
    } else if constexpr (Return::kShape == ReturnShape::kUnpairedError) {
      return makeErrorResult<void>(
          ErrorCode::kValidationError,
          "if a function has two return values, the second must be an error");
    } else if constexpr (std::is_void_v<typename Return::Value>) {
      return makeErrorResult<void>(ErrorCode::kValidationError,
                                   "function must have a return value and optional error");
    } else {
      return {};
    }
  }
}

}  // namespace dix::di
