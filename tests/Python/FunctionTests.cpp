// FunctionTests.cpp - exported free functions called from the interpreter

#include <catch2/catch_test_macros.hpp>

#include "TestModules.hpp"

#include <string>

using namespace NGIN::Python;
using TestSupport::Contains;
using TestSupport::EvalError;
using TestSupport::EvalInt;
using TestSupport::Exec;
using TestSupport::Gil;
using TestSupport::Unwrap;

namespace FunctionDemo
{
  long long Twice(long long n) { return 2 * n; }

  void ImportDemo(GilToken gil)
  {
    REQUIRE(Exec(gil, "import demo").has_value());
  }
} // namespace FunctionDemo

TEST_CASE("CallsBindPositionalAndKeywordArguments", "[python][Function]")
{
  const auto gil = Gil();
  FunctionDemo::ImportDemo(gil);

  CHECK(EvalInt(gil, "demo.add_one(41)") == 42);
  CHECK(EvalInt(gil, "demo.add_one(x=5)") == 6);
  CHECK(EvalInt(gil, "demo.greet('Ada') == 'Hello, Ada'") == 1);
  CHECK(EvalInt(gil, "demo.greet('Ada', 'Hi') == 'Hi, Ada'") == 1);
  CHECK(EvalInt(gil, "demo.greet('Ada', shout=True) == 'HELLO, ADA!'") == 1);
  CHECK(EvalInt(gil, "demo.scale(3) == 6.0") == 1);
  CHECK(EvalInt(gil, "demo.scale(3, factor=0.5) == 1.5") == 1);
}

TEST_CASE("VariadicArgumentsReachTheHost", "[python][Function]")
{
  const auto gil = Gil();
  FunctionDemo::ImportDemo(gil);

  CHECK(EvalInt(gil, "demo.count_args(1)") == 1);
  CHECK(EvalInt(gil, "demo.count_args(1, 2, 3)") == 21);
  CHECK(EvalInt(gil, "demo.count_args(1, 2, a=1, b=2)") == 211);
  CHECK(EvalInt(gil, "demo.count_args(first=4, z=0)") == 104);
}

TEST_CASE("ArgumentErrorsAreTypeErrors", "[python][Function]")
{
  const auto gil = Gil();
  FunctionDemo::ImportDemo(gil);

  CHECK(EvalError(gil, "demo.add_one()") == "TypeError: add_one() missing required argument 'x' (pos 1)");
  CHECK(EvalError(gil, "demo.add_one(1, 2)") ==
        "TypeError: add_one() got an unexpected positional argument (takes at most 1 positional argument, 2 given)");
  CHECK(EvalError(gil, "demo.add_one('x')") == "TypeError: add_one() argument 1 ('x'): expected int, got str");
  CHECK(EvalError(gil, "demo.add_one(1, x=2)") == "TypeError: add_one() got multiple values for argument 'x'");
  CHECK(EvalError(gil, "demo.greet('Ada', 'Hi', True)") ==
        "TypeError: greet() got an unexpected positional argument (takes at most 2 positional arguments, 3 given)");
  CHECK(EvalError(gil, "demo.greet('Ada', loud=True)") == "TypeError: greet() got an unexpected keyword argument 'loud'");
  CHECK(EvalError(gil, "demo.narrow(300)") == "OverflowError: narrow() argument 1 ('v'): int value out of range for int8");
}

TEST_CASE("BindingFailuresDoNotRunTheFunction", "[python][Function]")
{
  const auto gil = Gil();
  FunctionDemo::ImportDemo(gil);
  const int before = DemoModule::tallyCalls;

  CHECK(Contains(EvalError(gil, "demo.tally()"), "missing required argument 'x'"));
  CHECK(DemoModule::tallyCalls == before);
  CHECK(Contains(EvalError(gil, "demo.tally(1, 2, 3)"), "unexpected positional argument"));
  CHECK(DemoModule::tallyCalls == before);
  CHECK(EvalError(gil, "demo.tally(1, x=2)") == "TypeError: tally() got multiple values for argument 'x'");
  CHECK(DemoModule::tallyCalls == before);
  CHECK(EvalError(gil, "demo.tally(1, z=2)") == "TypeError: tally() got an unexpected keyword argument 'z'");
  CHECK(DemoModule::tallyCalls == before);
  CHECK(EvalError(gil, "demo.tally(1, 'y')") == "TypeError: tally() argument 2 ('y'): expected int, got str");
  CHECK(DemoModule::tallyCalls == before);

  CHECK(EvalInt(gil, "demo.tally(1, y=2)") == 3);
  CHECK(DemoModule::tallyCalls == before + 1);
}

TEST_CASE("ResultsAreConverted", "[python][Function]")
{
  const auto gil = Gil();
  FunctionDemo::ImportDemo(gil);

  CHECK(EvalInt(gil, "demo.divide(7, 2)") == 3);
  CHECK(EvalError(gil, "demo.divide(1, 0)") == "ValueError: division by zero");
  CHECK(EvalInt(gil, "demo.half(8)") == 4);
  CHECK(EvalInt(gil, "demo.half(3) is None") == 1);
  CHECK(EvalInt(gil, "demo.describe() is None") == 1);
  CHECK(EvalInt(gil, "demo.describe(5) == '5'") == 1);
  CHECK(EvalInt(gil, "demo.nothing() is None") == 1);
  CHECK(EvalInt(gil, "(lambda o: demo.identity(o) is o)(object())") == 1);
  CHECK(EvalInt(gil, "demo.Length(demo.Point(3, 4)) == 5.0") == 1);
}

TEST_CASE("PendingErrorOnSuccessIsRaised", "[python][Function]")
{
  const auto gil = Gil();
  FunctionDemo::ImportDemo(gil);

  CHECK(EvalError(gil, "demo.leaks_error()") == "RuntimeError: pending error");
  CHECK(PyErr_Occurred() == nullptr);
}

TEST_CASE("FunctionObjectsCarryMetadata", "[python][Function]")
{
  const auto gil = Gil();
  FunctionDemo::ImportDemo(gil);

  CHECK(EvalInt(gil, "demo.add_one.__name__ == 'add_one'") == 1);
  CHECK(EvalInt(gil, "demo.add_one.__module__ == 'demo'") == 1);
  CHECK(EvalInt(gil, "demo.add_one.__doc__ == 'Returns x + 1'") == 1);
  CHECK(EvalInt(gil, "demo.greet.__doc__ is None") == 1);

  const auto *record = FindExportedFunction(ModuleIdOf("demo"), "add_one");
  REQUIRE(record != nullptr);
  CHECK(record->moduleName == "demo");
  CHECK(record->qualifiedName == "add_one");
  CHECK(record->location == "add_one()");
  CHECK(FindExportedFunction(ModuleIdOf("demo"), "Length") != nullptr);
  CHECK(FindExportedFunction(ModuleIdOf("demo"), "missing") == nullptr);
  CHECK(ExportedFunctionCount(ModuleIdOf("demo")) >= 12);
}

TEST_CASE("MakeFunctionWithoutModule", "[python][Function]")
{
  const auto gil = Gil();
  auto fn = MakeFunction<&FunctionDemo::Twice, "n">(gil, "", "twice");
  REQUIRE(fn.has_value());

  auto arg = ToPython(gil, 21);
  REQUIRE(arg.has_value());
  auto args = Tuple::New(gil, {arg->Borrow()});
  REQUIRE(args.has_value());
  auto result = (*fn)->Call(gil, args->Borrow());
  REQUIRE(result.has_value());
  CHECK(Unwrap(FromPython<long long>::Extract(gil, result->Borrow())) == 42);

  auto missing = (*fn)->Call(gil);
  REQUIRE_FALSE(missing.has_value());
  CHECK(Contains(missing.error().Describe(gil), "twice() missing required argument 'n'"));
}
