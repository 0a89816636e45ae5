// Callback.hpp
// Boundary guard and result conventions for native entry points called by the interpreter
#pragma once

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Handle.hpp>
#include <NGIN/Python/Object.hpp>

#include <exception>
#include <expected>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Python
{

  /**
   * Defuse-or-die guard spanning one entry point.
   *
   * Unwinding across the C boundary is undefined, so leaving the scope without
   * `Defuse()` aborts the process, as does `Panic`. Both print the location
   * tag (for example "add_one()" or "PyInit_demo") to stderr first.
   */
  class NGIN_PYTHON_API CallbackGuard
  {
  public:
    explicit CallbackGuard(std::string_view location) noexcept : m_location(location) {}
    ~CallbackGuard();

    CallbackGuard(const CallbackGuard &) = delete;
    CallbackGuard &operator=(const CallbackGuard &) = delete;

    void Defuse() noexcept { m_armed = false; }

    [[nodiscard]] std::string_view Location() const noexcept { return m_location; }
    [[nodiscard]] bool IsArmed() const noexcept { return m_armed; }

    [[noreturn]] void Panic(std::string_view reason) const noexcept;

  private:
    std::string_view m_location;
    bool m_armed{true};
  };

  // Result conventions of the entry points CPython calls.
  struct ObjectCallback
  {
    using Raw = PyObject *;
    using Value = Owned<Object>;
    static Raw Success(GilToken, Value value) noexcept { return std::move(value).IntoPtr(); }
    static Raw Failure() noexcept { return nullptr; }
  };

  // tp_init, Py_mod_exec
  struct StatusCallback
  {
    using Raw = int;
    using Value = void;
    static Raw Success(GilToken) noexcept { return 0; }
    static Raw Failure() noexcept { return -1; }
  };

  /**
   * Runs `body(gil)` as an entry point: the result is converted with
   * `Convention`, an `Error` is restored into the error indicator, and a C++
   * exception escaping `body` aborts the process through the guard.
   *
   * A successful result observed together with a pending Python error is
   * dropped so that the caller sees exactly one of {value, error}.
   */
  template <class Convention, class Body>
  typename Convention::Raw InvokeCallback(std::string_view location, Body &&body) noexcept
  {
    CallbackGuard guard{location};
    const GilToken gil = GilToken::AssumeAcquired();
    try
    {
      std::expected<typename Convention::Value, Error> result = std::forward<Body>(body)(gil);
      if (!result)
      {
        std::move(result.error()).Restore(gil);
        guard.Defuse();
        return Convention::Failure();
      }
      if (PyErr_Occurred())
      {
        guard.Defuse();
        return Convention::Failure();
      }
      guard.Defuse();
      if constexpr (std::is_void_v<typename Convention::Value>)
        return Convention::Success(gil);
      else
        return Convention::Success(gil, std::move(*result));
    }
    catch (const std::exception &e)
    {
      guard.Panic(e.what());
    }
    catch (...)
    {
      guard.Panic("unknown exception");
    }
  }

} // namespace NGIN::Python
