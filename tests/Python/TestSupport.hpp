// TestSupport.hpp - shared helpers for the embedded-interpreter tests
#pragma once

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Python/Python.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Entry points of the modules compiled into the test binary (TestModules.cpp).
PyMODINIT_FUNC PyInit_demo(void);
PyMODINIT_FUNC PyInit_demo_multiphase(void);
PyMODINIT_FUNC PyInit_broken(void);

namespace TestSupport
{
  using namespace NGIN::Python;

  inline GilToken Gil() { return GilToken::AssumeAcquired(); }

  inline Borrowed<Dict> MainGlobals(GilToken gil)
  {
    PyObject *main = PyImport_AddModule("__main__"); // borrowed
    return Borrowed<Dict>::FromBorrowedPtr(gil, PyModule_GetDict(main));
  }

  /** Evaluates a single expression in `__main__`. */
  inline std::expected<Owned<Object>, Error> Eval(GilToken gil, const std::string &expr)
  {
    auto globals = MainGlobals(gil);
    return OwnedOrFetch(gil, PyRun_String(expr.c_str(), Py_eval_input, globals.Get(), globals.Get()));
  }

  /** Runs statements in `__main__`. */
  inline std::expected<void, Error> Exec(GilToken gil, const std::string &code)
  {
    auto globals = MainGlobals(gil);
    auto result = OwnedOrFetch(gil, PyRun_String(code.c_str(), Py_file_input, globals.Get(), globals.Get()));
    if (!result)
      return std::unexpected(std::move(result.error()));
    return {};
  }

  inline std::optional<long long> EvalInt(GilToken gil, const std::string &expr)
  {
    auto out = Eval(gil, expr);
    if (!out)
      return std::nullopt;
    auto v = FromPython<long long>::Extract(gil, out->Borrow());
    if (!v)
      return std::nullopt;
    return *v;
  }

  /** "TypeName: message" of the error raised by `expr`, or empty when it succeeded. */
  inline std::string EvalError(GilToken gil, const std::string &expr)
  {
    auto out = Eval(gil, expr);
    if (out)
      return {};
    return out.error().Describe(gil);
  }

  /** The value of a result that must have succeeded; fails the test otherwise. */
  template <class T>
  T Unwrap(std::expected<T, Error> &&result)
  {
    if (!result)
      FAIL(result.error().Describe(GilToken::AssumeAcquired()));
    return std::move(*result);
  }

  inline bool Contains(std::string_view haystack, std::string_view needle)
  {
    return haystack.find(needle) != std::string_view::npos;
  }
} // namespace TestSupport
