// ErrorTests.cpp - moving errors between the host and the interpreter's error indicator

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <string>

using namespace NGIN::Python;
using TestSupport::Gil;

TEST_CASE("FetchTakesThePendingException", "[python][Error]")
{
  const auto gil = Gil();
  PyErr_SetString(PyExc_KeyError, "missing key");

  Error error = Error::Fetch(gil);
  CHECK(PyErr_Occurred() == nullptr);
  CHECK(error.IsPythonException());
  CHECK(error.Code() == ErrorCode::PythonException);
  CHECK(error.Matches(gil, PyExc_KeyError));
  CHECK(error.Matches(gil, PyExc_LookupError));
  CHECK_FALSE(error.Matches(gil, PyExc_TypeError));
  CHECK(error.Describe(gil) == "KeyError: 'missing key'");
}

TEST_CASE("FetchWithoutPendingExceptionIsSystemError", "[python][Error]")
{
  const auto gil = Gil();
  REQUIRE(PyErr_Occurred() == nullptr);

  Error error = Error::Fetch(gil);
  CHECK_FALSE(error.IsPythonException());
  CHECK(error.Code() == ErrorCode::SystemError);
  CHECK(error.Message() == "error return without exception set");
}

TEST_CASE("FetchOrPrefersThePendingException", "[python][Error]")
{
  const auto gil = Gil();
  Error synthesized = Error::FetchOr(gil, ErrorCode::AttributeError, "no name");
  CHECK(synthesized.Code() == ErrorCode::AttributeError);
  CHECK(synthesized.Describe(gil) == "AttributeError: no name");

  PyErr_SetString(PyExc_ValueError, "bad value");
  Error fetched = Error::FetchOr(gil, ErrorCode::AttributeError, "no name");
  CHECK(fetched.IsPythonException());
  CHECK(fetched.Matches(gil, PyExc_ValueError));
}

TEST_CASE("RestoreDepositsHostErrorsOnce", "[python][Error]")
{
  const auto gil = Gil();
  Error error{ErrorCode::OverflowError, "too big"};
  std::move(error).Restore(gil);

  REQUIRE(PyErr_Occurred() != nullptr);
  CHECK(PyErr_ExceptionMatches(PyExc_OverflowError));
  Error back = Error::Fetch(gil);
  CHECK(back.Describe(gil) == "OverflowError: too big");
  CHECK(PyErr_Occurred() == nullptr);
}

TEST_CASE("RestoreRoundTripsFetchedExceptions", "[python][Error]")
{
  const auto gil = Gil();
  auto failed = TestSupport::Eval(gil, "int('not a number')");
  REQUIRE_FALSE(failed.has_value());
  CHECK(failed.error().Matches(gil, PyExc_ValueError));

  std::move(failed.error()).Restore(gil);
  REQUIRE(PyErr_ExceptionMatches(PyExc_ValueError));
  PyErr_Clear();
}

TEST_CASE("ExceptionTypesForHostCodes", "[python][Error]")
{
  CHECK(ExceptionTypeFor(ErrorCode::TypeError) == PyExc_TypeError);
  CHECK(ExceptionTypeFor(ErrorCode::ValueError) == PyExc_ValueError);
  CHECK(ExceptionTypeFor(ErrorCode::AttributeError) == PyExc_AttributeError);
  CHECK(ExceptionTypeFor(ErrorCode::KeyError) == PyExc_KeyError);
  CHECK(ExceptionTypeFor(ErrorCode::OverflowError) == PyExc_OverflowError);
  CHECK(ExceptionTypeFor(ErrorCode::RuntimeError) == PyExc_RuntimeError);
  CHECK(ExceptionTypeFor(ErrorCode::SystemError) == PyExc_SystemError);
}

TEST_CASE("FromInstanceWrapsABuiltException", "[python][Error]")
{
  const auto gil = Gil();
  const char bytes[] = "ab\xff";
  PyObject *exc = PyUnicodeDecodeError_Create("utf-8", bytes, 3, 2, 3, "invalid start byte");
  REQUIRE(exc != nullptr);

  Error error = Error::FromInstance(gil, Owned<Object>::FromOwnedPtr(gil, exc));
  CHECK(error.IsPythonException());
  CHECK(error.Matches(gil, PyExc_UnicodeDecodeError));
  CHECK(TestSupport::Contains(error.Describe(gil), "UnicodeDecodeError"));
  CHECK(TestSupport::Contains(error.Describe(gil), "invalid start byte"));
}

TEST_CASE("DescribeKeepsAPendingExceptionIntact", "[python][Error]")
{
  const auto gil = Gil();
  PyErr_SetString(PyExc_TypeError, "first");
  Error first = Error::Fetch(gil);

  PyErr_SetString(PyExc_ValueError, "second");
  CHECK(first.Describe(gil) == "TypeError: first");
  REQUIRE(PyErr_ExceptionMatches(PyExc_ValueError));
  PyErr_Clear();
}
