// Gil.hpp
// Proof-of-possession token for the interpreter lock
#pragma once

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Export.hpp>

namespace NGIN::Python
{

  namespace detail
  {
    [[noreturn]] NGIN_PYTHON_API void AbortGilNotHeld() noexcept;
  }

  /**
   * Zero-sized capability proving that the calling thread holds the GIL.
   *
   * Every operation that touches a guest object takes a `GilToken` by value.
   * The token does not acquire anything; it is produced at the places where
   * CPython hands control to native code with the lock already held (module
   * initialization, entry-point callbacks) or by a `GilGuard`.
   */
  class GilToken
  {
  public:
    /** The caller asserts the GIL is held by this thread. */
    [[nodiscard]] static GilToken AssumeAcquired() noexcept
    {
#if defined(NGIN_PYTHON_CHECK_GIL)
      if (!PyGILState_Check())
        detail::AbortGilNotHeld();
#endif
      return GilToken{};
    }

  private:
    constexpr GilToken() noexcept = default;
    friend class GilGuard;
  };

  /**
   * Acquires the GIL for the current scope (`PyGILState_Ensure`).
   * Meant for embedders entering from native threads; the core never uses it.
   */
  class GilGuard
  {
  public:
    GilGuard() noexcept : m_state(PyGILState_Ensure()) {}
    ~GilGuard() { PyGILState_Release(m_state); }

    GilGuard(const GilGuard &) = delete;
    GilGuard &operator=(const GilGuard &) = delete;

    [[nodiscard]] GilToken Token() const noexcept { return GilToken{}; }

  private:
    PyGILState_STATE m_state;
  };

} // namespace NGIN::Python
