#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <exception>
#include <expected>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dix/common.hpp"

namespace dix::di {

// ---------------------------------------------------------------------------
// Callable signatures
// ---------------------------------------------------------------------------

template <typename F, typename = void>
struct FunctionTraits {
  static constexpr bool kIntrospectable = false;
};

template <typename R, typename... Args>
struct FunctionTraits<R(Args...), void> {
  static constexpr bool kIntrospectable = true;
  using ReturnType = R;
  using ArgumentTypes = std::tuple<Args...>;
  static constexpr std::size_t kArity = sizeof...(Args);
};

template <typename R, typename... Args>
struct FunctionTraits<R(Args...) noexcept, void> : FunctionTraits<R(Args...)> {};

template <typename R, typename... Args>
struct FunctionTraits<R (*)(Args...), void> : FunctionTraits<R(Args...)> {};

template <typename R, typename... Args>
struct FunctionTraits<R (*)(Args...) noexcept, void> : FunctionTraits<R(Args...)> {};

namespace detail {

// Signature of a functor's call operator, without the object parameter
template <typename M>
struct CallOperatorTraits {
  static constexpr bool kIntrospectable = false;
};

template <typename C, typename R, typename... Args>
struct CallOperatorTraits<R (C::*)(Args...)> : FunctionTraits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct CallOperatorTraits<R (C::*)(Args...) const> : FunctionTraits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct CallOperatorTraits<R (C::*)(Args...) noexcept> : FunctionTraits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct CallOperatorTraits<R (C::*)(Args...) const noexcept> : FunctionTraits<R(Args...)> {};

}  // namespace detail

// Lambdas, std::function and functors with exactly one non-template operator()
template <typename F>
struct FunctionTraits<F, std::void_t<decltype(&F::operator())>>
    : detail::CallOperatorTraits<decltype(&F::operator())> {};

template <typename F>
concept Introspectable = FunctionTraits<std::decay_t<F>>::kIntrospectable;

// ---------------------------------------------------------------------------
// Parameter shapes
// ---------------------------------------------------------------------------

template <typename T>
struct SequenceTraits {
  static constexpr bool kIsSequence = false;
};

template <typename E, typename A>
struct SequenceTraits<std::vector<E, A>> {
  static constexpr bool kIsSequence = true;
  static constexpr bool kFixedSize = false;
  using Element = E;
};

template <typename E, typename A>
struct SequenceTraits<std::deque<E, A>> {
  static constexpr bool kIsSequence = true;
  static constexpr bool kFixedSize = false;
  using Element = E;
};

template <typename E, typename A>
struct SequenceTraits<std::list<E, A>> {
  static constexpr bool kIsSequence = true;
  static constexpr bool kFixedSize = false;
  using Element = E;
};

template <typename E, std::size_t N>
struct SequenceTraits<std::array<E, N>> {
  static constexpr bool kIsSequence = true;
  static constexpr bool kFixedSize = true;
  static constexpr std::size_t kSize = N;
  using Element = E;
};

template <typename T>
struct StringMapTraits {
  static constexpr bool kIsStringMap = false;
};

template <typename E, typename C, typename A>
struct StringMapTraits<std::map<std::string, E, C, A>> {
  static constexpr bool kIsStringMap = true;
  using Element = E;
};

template <typename E, typename H, typename Eq, typename A>
struct StringMapTraits<std::unordered_map<std::string, E, H, Eq, A>> {
  static constexpr bool kIsStringMap = true;
  using Element = E;
};

// ---------------------------------------------------------------------------
// Error channel
// ---------------------------------------------------------------------------

// Types that can act as the error half of a callable's result
template <typename T>
struct ErrorTraits {
  static constexpr bool kIsError = false;
};

template <>
struct ErrorTraits<Error> {
  static constexpr bool kIsError = true;
  static std::optional<Error> toError(const Error& error);
};

template <>
struct ErrorTraits<std::error_code> {
  static constexpr bool kIsError = true;
  static std::optional<Error> toError(const std::error_code& error);
};

template <>
struct ErrorTraits<std::exception_ptr> {
  static constexpr bool kIsError = true;
  static std::optional<Error> toError(const std::exception_ptr& error);
};

template <typename T>
concept ErrorCapable = ErrorTraits<std::remove_cvref_t<T>>::kIsError;

// ---------------------------------------------------------------------------
// Return shapes
// ---------------------------------------------------------------------------

enum class ReturnShape {
  kNothing,         // void
  kValue,           // a single value
  kValueWithError,  // expected<V, E>, pair<V, E> or tuple<V, E> with an error-capable E
  kErrorOnly,       // only an error-capable type
  kUnpairedError,   // pair/tuple of two whose second member is not an error
  kUnsupported      // tuple of any other size
};

template <typename R>
struct ReturnTraits {
  static constexpr ReturnShape kShape = ReturnShape::kValue;
  using Value = R;

  static Result<Value> normalize(R&& result) { return Result<Value>(std::move(result)); }
};

template <>
struct ReturnTraits<void> {
  static constexpr ReturnShape kShape = ReturnShape::kNothing;
  using Value = void;
};

template <ErrorCapable E>
struct ReturnTraits<E> {
  static constexpr ReturnShape kShape = ReturnShape::kErrorOnly;
  using Value = void;

  static Result<void> normalize(E&& result) {
    if (auto error = ErrorTraits<E>::toError(result)) {
      return std::unexpected(std::move(*error));
    }
    return {};
  }
};

template <typename V, typename E>
struct ReturnTraits<std::expected<V, E>> {
  static constexpr ReturnShape kShape =
      ErrorCapable<E> ? ReturnShape::kValueWithError : ReturnShape::kUnpairedError;
  using Value = std::conditional_t<ErrorCapable<E>, V, std::expected<V, E>>;

  static Result<Value> normalize(std::expected<V, E>&& result) {
    if constexpr (!ErrorCapable<E>) {
      return Result<Value>(std::move(result));
    } else if (!result.has_value()) {
      if (auto error = ErrorTraits<E>::toError(result.error())) {
        return std::unexpected(std::move(*error));
      }
      return makeErrorResult<Value>(ErrorCode::kFactoryError, "factory returned an empty result");
    } else if constexpr (std::is_void_v<V>) {
      return {};
    } else {
      return Result<Value>(std::move(*result));
    }
  }
};

namespace detail {

template <typename V, typename E, typename R>
struct PairReturnTraits {
  static constexpr ReturnShape kShape =
      ErrorCapable<E> ? ReturnShape::kValueWithError : ReturnShape::kUnpairedError;
  using Value = std::conditional_t<ErrorCapable<E>, V, R>;

  static Result<Value> normalize(R&& result) {
    if constexpr (ErrorCapable<E>) {
      if (auto error = ErrorTraits<E>::toError(std::get<1>(result))) {
        return std::unexpected(std::move(*error));
      }
      return Result<Value>(std::move(std::get<0>(result)));
    } else {
      return Result<Value>(std::move(result));
    }
  }
};

}  // namespace detail

template <typename V, typename E>
struct ReturnTraits<std::pair<V, E>> : detail::PairReturnTraits<V, E, std::pair<V, E>> {};

template <typename V, typename E>
struct ReturnTraits<std::tuple<V, E>> : detail::PairReturnTraits<V, E, std::tuple<V, E>> {};

template <typename... Ts>
  requires(sizeof...(Ts) != 2)
struct ReturnTraits<std::tuple<Ts...>> {
  static constexpr ReturnShape kShape = ReturnShape::kUnsupported;
  using Value = std::tuple<Ts...>;

  static Result<Value> normalize(Value&& result) { return Result<Value>(std::move(result)); }
};

}  // namespace dix::di
