#include <gtest/gtest.h>

#include <any>
#include <array>
#include <deque>
#include <exception>
#include <list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dix/di/container.hpp"
#include "dix/di/invoke.hpp"
#include "test_helpers.hpp"

using namespace dix::di;
using namespace dix::test;
using dix::Error;
using dix::ErrorCode;
using dix::Result;

namespace {

using GreeterPtr = std::shared_ptr<Greeter>;

// Minimal resolver backed by one value per type, to show invoke needs no Container
class SingleValueResolver : public Resolver {
 public:
  template <typename T>
  void set(T value) {
    values_.insert_or_assign(TypeKey::of<T>(), std::any(std::move(value)));
  }

 protected:
  Result<std::any> resolveImpl(const TypeKey& type) override {
    auto it = values_.find(type);
    if (it == values_.end()) {
      return dix::makeErrorResult<std::any>(ErrorCode::kNotExist, type.name());
    }
    return it->second;
  }

  Result<std::vector<std::any>> resolveAllImpl(const TypeKey& type) override {
    auto single = resolveImpl(type);
    if (!single.has_value()) {
      return std::unexpected(single.error());
    }
    return std::vector<std::any>{*single};
  }

  Result<std::any> resolveByNameImpl(const TypeKey& type, const std::string&) override {
    return dix::makeErrorResult<std::any>(ErrorCode::kNameNotExist, type.name());
  }

  Result<AnyMap> resolveMapImpl(const TypeKey&) override { return AnyMap{}; }

 private:
  std::unordered_map<TypeKey, std::any> values_;
};

}  // namespace

class InvokeTest : public ::testing::Test {
 protected:
  void registerDependencies() {
    container_.registerInstance<Dependency>(Dependency{"first"});
    container_.registerInstance<Dependency>(Dependency{"second"});
  }

  Container container_;
};

TEST_F(InvokeTest, BindsScalarParameters) {
  container_.registerInstance<std::string>("hello");
  container_.registerInstance<GreeterPtr>(std::make_shared<NamedGreeter>("test"));

  auto result = invoke(container_, [](GreeterPtr greeter, std::string greeting) {
    return greeting + " " + greeter->name();
  });

  ASSERT_OK(result);
  EXPECT_EQ(*result, "hello test");
}

TEST_F(InvokeTest, BindsConstReferenceParameters) {
  container_.registerInstance<std::string>("hello");
  registerDependencies();

  auto result = invoke(container_, [](const std::string& greeting,
                                      const std::vector<Dependency>& dependencies) {
    return greeting + " " + std::to_string(dependencies.size());
  });

  ASSERT_OK(result);
  EXPECT_EQ(*result, "hello 2");
}

TEST_F(InvokeTest, VectorParameterReceivesAllInRegistrationOrder) {
  registerDependencies();

  auto result = invoke(container_, [](std::vector<Dependency> dependencies) {
    return dependencies;
  });

  ASSERT_OK(result);
  ASSERT_EQ(result->size(), 2u);
  EXPECT_EQ((*result)[0].label, "first");
  EXPECT_EQ((*result)[1].label, "second");
}

TEST_F(InvokeTest, DequeAndListParameters) {
  registerDependencies();

  auto result = invoke(container_, [](std::deque<Dependency> queue, std::list<Dependency> list) {
    return queue.back().label + "/" + list.front().label;
  });

  ASSERT_OK(result);
  EXPECT_EQ(*result, "second/first");
}

TEST_F(InvokeTest, ArrayParameterRequiresExactCount) {
  registerDependencies();

  auto exact = invoke(container_, [](std::array<Dependency, 2> dependencies) {
    return dependencies[0].label + dependencies[1].label;
  });
  ASSERT_OK(exact);
  EXPECT_EQ(*exact, "firstsecond");

  auto mismatched = invoke(container_, [](std::array<Dependency, 3> dependencies) {
    return dependencies.size();
  });
  EXPECT_ERROR(mismatched, ErrorCode::kValidationError);
}

TEST_F(InvokeTest, VariadicParameterReceivesSeparateArguments) {
  registerDependencies();
  size_t argument_count = 0;
  std::vector<std::string> labels;

  auto result = invokeVariadic<Dependency>(container_, [&](auto... dependencies) {
    argument_count = sizeof...(dependencies);
    labels = {dependencies.label...};
  });

  ASSERT_OK(result);
  EXPECT_EQ(argument_count, 2u);
  EXPECT_EQ(labels, (std::vector<std::string>{"first", "second"}));
}

TEST_F(InvokeTest, VariadicParameterAfterLeadingParameters) {
  registerDependencies();
  container_.registerInstance<std::string>("deps:");

  auto result = invokeVariadic<Dependency, std::string>(
      container_, [](std::string prefix, auto... dependencies) {
        ((prefix += " " + dependencies.label), ...);
        return prefix;
      });

  ASSERT_OK(result);
  EXPECT_EQ(*result, "deps: first second");
}

TEST_F(InvokeTest, VariadicParameterLimit) {
  for (size_t i = 0; i <= kMaxVariadicArguments; ++i) {
    container_.registerInstance<Dependency>(Dependency{std::to_string(i)});
  }

  auto result = invokeVariadic<Dependency>(container_, [](auto... dependencies) {
    return sizeof...(dependencies);
  });

  EXPECT_ERROR(result, ErrorCode::kValidationError);
}

TEST_F(InvokeTest, MapParameterReceivesNamedOnly) {
  container_.registerInstance<Dependency>(Dependency{"x value"}, {withName("x")});
  container_.registerInstance<Dependency>(Dependency{"y value"}, {withName("y")});
  container_.registerInstance<Dependency>(Dependency{"anonymous"});

  auto result = invoke(container_, [](std::map<std::string, Dependency> dependencies) {
    return dependencies;
  });

  ASSERT_OK(result);
  ASSERT_EQ(result->size(), 2u);
  EXPECT_EQ(result->at("x").label, "x value");
  EXPECT_EQ(result->at("y").label, "y value");
}

TEST_F(InvokeTest, UnorderedMapParameter) {
  container_.registerInstance<Dependency>(Dependency{"x value"}, {withName("x")});

  auto result = invoke(container_, [](std::unordered_map<std::string, Dependency> dependencies) {
    return dependencies.count("x");
  });

  ASSERT_OK(result);
  EXPECT_EQ(*result, 1u);
}

TEST_F(InvokeTest, MissingDependencyAbortsBeforeCall) {
  container_.registerInstance<std::string>("hello");
  bool called = false;

  auto result = invoke(container_, [&called](std::string greeting, GreeterPtr greeter) {
    called = true;
    return greeting + greeter->name();
  });

  EXPECT_ERROR(result, ErrorCode::kNotExist);
  EXPECT_FALSE(called);
}

TEST_F(InvokeTest, VoidCallable) {
  container_.registerInstance<int>(3);
  int seen = 0;

  auto result = invoke(container_, [&seen](int value) { seen = value; });

  EXPECT_OK(result);
  EXPECT_EQ(seen, 3);
}

TEST_F(InvokeTest, ErrorInPairVoidsValue) {
  auto result = invoke(container_, []() -> std::pair<int, Error> {
    return {5, Error(ErrorCode::kInvalidArgument, "bad input")};
  });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(result.error().message(), "bad input");
}

TEST_F(InvokeTest, NilErrorInTupleKeepsValue) {
  auto result = invoke(container_, []() -> std::tuple<int, std::error_code> {
    return {5, std::error_code()};
  });

  ASSERT_OK(result);
  EXPECT_EQ(*result, 5);
}

TEST_F(InvokeTest, ErrorCodeBecomesFactoryError) {
  auto result = invoke(container_, []() -> std::pair<int, std::error_code> {
    return {0, std::make_error_code(std::errc::permission_denied)};
  });

  EXPECT_ERROR(result, ErrorCode::kFactoryError);
}

TEST_F(InvokeTest, ExceptionPtrBecomesFactoryError) {
  auto result = invoke(container_, []() -> std::pair<int, std::exception_ptr> {
    return {0, std::make_exception_ptr(std::runtime_error("lost connection"))};
  });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kFactoryError);
  EXPECT_EQ(result.error().message(), "lost connection");
}

TEST_F(InvokeTest, ExpectedReturnPassesThrough) {
  auto ok = invoke(container_, []() -> Result<int> { return 9; });
  ASSERT_OK(ok);
  EXPECT_EQ(*ok, 9);

  auto failed = invoke(container_, []() -> Result<int> {
    return dix::makeErrorResult<int>(ErrorCode::kInvalidArgument, "nope");
  });
  EXPECT_ERROR(failed, ErrorCode::kInvalidArgument);
}

TEST_F(InvokeTest, ErrorOnlyReturn) {
  EXPECT_OK(invoke(container_, [] { return Error(ErrorCode::kSuccess, ""); }));
  EXPECT_ERROR(invoke(container_, [] { return Error(ErrorCode::kInvalidArgument, "x"); }),
               ErrorCode::kInvalidArgument);
}

TEST_F(InvokeTest, PairWithoutErrorIsSingleValue) {
  auto result = invoke(container_, [] { return std::pair<int, int>{1, 2}; });

  ASSERT_OK(result);
  EXPECT_EQ(result->second, 2);
}

TEST_F(InvokeTest, ThrowingCallableBecomesFactoryError) {
  auto result = invoke(container_, []() -> int { throw std::runtime_error("boom"); });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kFactoryError);
  EXPECT_NE(result.error().message().find("boom"), std::string::npos);
}

TEST_F(InvokeTest, InvokeAnyRejectsNonCallable) {
  EXPECT_ERROR(invokeAny(container_, 42), ErrorCode::kValidationError);
  EXPECT_ERROR(invokeAny(container_, std::string("not a function")), ErrorCode::kValidationError);
}

TEST_F(InvokeTest, InvokeAnyErasesResult) {
  container_.registerInstance<int>(20);

  auto result = invokeAny(container_, [](int value) { return value + 1; });

  ASSERT_OK(result);
  EXPECT_EQ(std::any_cast<int>(*result), 21);
}

TEST_F(InvokeTest, InvokesFunctionPointer) {
  container_.registerInstance<int>(4);

  auto result = invoke(container_, +[](int value) { return value * 2; });

  ASSERT_OK(result);
  EXPECT_EQ(*result, 8);
}

TEST(InvokeResolverTest, WorksWithAnyResolver) {
  SingleValueResolver resolver;
  resolver.set<std::string>("hello");
  resolver.set<GreeterPtr>(std::make_shared<NamedGreeter>("test"));

  auto result = invoke(resolver, [](GreeterPtr greeter, const std::string& greeting) {
    return greeting + " " + greeter->name();
  });

  ASSERT_OK(result);
  EXPECT_EQ(*result, "hello test");
}

TEST(ConstructorValidationTest, AcceptedShapes) {
  EXPECT_OK(validateConstructor<int (*)()>());
  EXPECT_OK((validateConstructor<std::pair<int, Error> (*)()>()));
  EXPECT_OK((validateConstructor<std::tuple<int, std::exception_ptr> (*)(std::string)>()));
  EXPECT_OK(validateConstructor<Result<int> (*)()>());
}

TEST(ConstructorValidationTest, RejectedShapes) {
  EXPECT_ERROR(validateConstructor<void (*)()>(), ErrorCode::kValidationError);
  EXPECT_ERROR(validateConstructor<Error (*)()>(), ErrorCode::kValidationError);
  EXPECT_ERROR(validateConstructor<Result<void> (*)()>(), ErrorCode::kValidationError);
  EXPECT_ERROR((validateConstructor<std::pair<int, int> (*)()>()), ErrorCode::kValidationError);
  EXPECT_ERROR((validateConstructor<std::tuple<int, int, Error> (*)()>()),
               ErrorCode::kValidationError);
  EXPECT_ERROR(validateConstructor<int>(), ErrorCode::kValidationError);
}
