// Error.hpp
// Error values and the bridge to the interpreter's error indicator
#pragma once

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Handle.hpp>
#include <NGIN/Python/Object.hpp>

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace NGIN::Python
{

  enum class ErrorCode : unsigned
  {
    PythonException = 0, // fetched from the error indicator
    TypeError = 1,
    ValueError = 2,
    AttributeError = 3,
    KeyError = 4,
    OverflowError = 5,
    RuntimeError = 6,
    SystemError = 7,
  };

  /**
   * Either an exception taken out of the interpreter's error indicator, or a
   * host-side error (code + message) that has not been raised yet.
   *
   * `Restore` deposits the error into the indicator and consumes the value, so
   * a given Error reaches the interpreter at most once. Errors that hold a
   * fetched exception own references and must be destroyed under the GIL.
   */
  class NGIN_PYTHON_API Error
  {
  public:
    Error(ErrorCode code, std::string message);

    /**
     * Takes the pending exception out of the error indicator (clearing it).
     * When nothing is pending this yields a SystemError, mirroring the
     * interpreter's "error return without exception set".
     */
    [[nodiscard]] static Error Fetch(GilToken gil);

    /** Fetches the pending exception if there is one, else builds a host error. */
    [[nodiscard]] static Error FetchOr(GilToken gil, ErrorCode code, std::string message);

    /** Wraps an exception instance (e.g. a freshly built UnicodeDecodeError). */
    [[nodiscard]] static Error FromInstance(GilToken gil, Owned<Object> exception);

    Error(Error &&) noexcept = default;
    Error &operator=(Error &&) noexcept = default;

    [[nodiscard]] ErrorCode Code() const noexcept;
    [[nodiscard]] bool IsPythonException() const noexcept { return std::holds_alternative<Fetched>(m_state); }

    /** Host-side message; empty for fetched exceptions (see `Describe`). */
    [[nodiscard]] std::string_view Message() const noexcept;

    /** "TypeName: message" for both kinds; may run `str()` on the exception value. */
    [[nodiscard]] std::string Describe(GilToken gil) const;

    /** `PyErr_GivenExceptionMatches` against this error's exception type. */
    [[nodiscard]] bool Matches(GilToken gil, PyObject *exceptionType) const noexcept;

    /** Sets the error indicator from this value. */
    void Restore(GilToken gil) &&;

  private:
    struct Fetched
    {
      Owned<Object> type;
      Owned<Object> value;
      Owned<Object> traceback;
    };
    struct Host
    {
      ErrorCode code;
      std::string message;
    };

    explicit Error(Fetched fetched) noexcept : m_state(std::move(fetched)) {}

    std::variant<Fetched, Host> m_state;
  };

  /**
   * Raised when a class type object fails its first-time initialization. A
   * half-initialized type cannot be retried, so this is not an Error value.
   */
  class FatalError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Exception type object used for a host error code.
  [[nodiscard]] NGIN_PYTHON_API PyObject *ExceptionTypeFor(ErrorCode code) noexcept;

  /** Wraps a "new reference" result, fetching the pending error on null. */
  template <class T = Object>
  [[nodiscard]] inline std::expected<Owned<T>, Error> OwnedOrFetch(GilToken gil, PyObject *ptr)
  {
    if (!ptr)
      return std::unexpected(Error::Fetch(gil));
    return Owned<T>::FromOwnedPtr(gil, ptr);
  }

  /** Wraps a "borrowed reference" result, fetching the pending error on null. */
  template <class T = Object>
  [[nodiscard]] inline std::expected<Borrowed<T>, Error> BorrowedOrFetch(GilToken gil, PyObject *ptr)
  {
    if (!ptr)
      return std::unexpected(Error::Fetch(gil));
    return Borrowed<T>::FromBorrowedPtr(gil, ptr);
  }

  /** Checked downcast of a handle to a more specific view. */
  template <class U, class T>
  [[nodiscard]] inline std::expected<Borrowed<U>, Error> Downcast(GilToken gil, Borrowed<T> handle)
  {
    if (!U::Check(handle.Get()))
    {
      std::string msg{"expected "};
      msg.append(U::PythonName).append(", got ").append(handle->TypeName());
      return std::unexpected(Error{ErrorCode::TypeError, std::move(msg)});
    }
    return Borrowed<U>::FromBorrowedPtr(gil, handle.Get());
  }

  template <class U, class T>
  [[nodiscard]] inline std::expected<Owned<U>, Error> Downcast(GilToken gil, Owned<T> handle)
  {
    auto checked = Downcast<U>(gil, handle.Borrow());
    if (!checked)
      return std::unexpected(std::move(checked.error()));
    return Owned<U>::FromOwnedPtr(gil, std::move(handle).IntoPtr());
  }

} // namespace NGIN::Python
