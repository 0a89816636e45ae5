#include <NGIN/Python/Error.hpp>

#include <utility>

namespace NGIN::Python
{

  namespace
  {
    constexpr std::string_view kNoExceptionSet = "error return without exception set";
  } // namespace

  PyObject *ExceptionTypeFor(ErrorCode code) noexcept
  {
    switch (code)
    {
      case ErrorCode::TypeError: return PyExc_TypeError;
      case ErrorCode::ValueError: return PyExc_ValueError;
      case ErrorCode::AttributeError: return PyExc_AttributeError;
      case ErrorCode::KeyError: return PyExc_KeyError;
      case ErrorCode::OverflowError: return PyExc_OverflowError;
      case ErrorCode::RuntimeError: return PyExc_RuntimeError;
      case ErrorCode::SystemError:
      case ErrorCode::PythonException:
      default: break;
    }
    return PyExc_SystemError;
  }

  Error::Error(ErrorCode code, std::string message)
      : m_state(Host{code, std::move(message)})
  {
  }

  Error Error::Fetch(GilToken gil)
  {
    PyObject *type = nullptr;
    PyObject *value = nullptr;
    PyObject *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type)
    {
      Py_XDECREF(value);
      Py_XDECREF(traceback);
      return Error{ErrorCode::SystemError, std::string{kNoExceptionSet}};
    }
    PyErr_NormalizeException(&type, &value, &traceback);
    if (traceback && value)
      PyException_SetTraceback(value, traceback);
    return Error{Fetched{Owned<Object>::FromOwnedPtr(gil, type),
                         Owned<Object>::FromOwnedPtr(gil, value),
                         Owned<Object>::FromOwnedPtr(gil, traceback)}};
  }

  Error Error::FetchOr(GilToken gil, ErrorCode code, std::string message)
  {
    if (PyErr_Occurred())
      return Fetch(gil);
    return Error{code, std::move(message)};
  }

  Error Error::FromInstance(GilToken gil, Owned<Object> exception)
  {
    PyObject *type = reinterpret_cast<PyObject *>(Py_TYPE(exception.Get()));
    Py_INCREF(type);
    return Error{Fetched{Owned<Object>::FromOwnedPtr(gil, type),
                         std::move(exception),
                         Owned<Object>::FromOwnedPtr(gil, nullptr)}};
  }

  ErrorCode Error::Code() const noexcept
  {
    if (const auto *host = std::get_if<Host>(&m_state))
      return host->code;
    return ErrorCode::PythonException;
  }

  std::string_view Error::Message() const noexcept
  {
    if (const auto *host = std::get_if<Host>(&m_state))
      return host->message;
    return {};
  }

  std::string Error::Describe(GilToken gil) const
  {
    if (const auto *host = std::get_if<Host>(&m_state))
    {
      const auto *type = reinterpret_cast<PyTypeObject *>(ExceptionTypeFor(host->code));
      std::string out{type->tp_name};
      out.append(": ").append(host->message);
      return out;
    }

    const auto &fetched = std::get<Fetched>(m_state);
    std::string out;
    if (PyType_Check(fetched.type.Get()))
      out = reinterpret_cast<PyTypeObject *>(fetched.type.Get())->tp_name;
    else
      out = fetched.type->TypeName();
    if (!fetched.value.IsValid() || fetched.value->IsNone())
      return out;

    // Describing must not disturb an exception the caller may have pending.
    PyObject *savedType = nullptr;
    PyObject *savedValue = nullptr;
    PyObject *savedTb = nullptr;
    PyErr_Fetch(&savedType, &savedValue, &savedTb);
    auto text = fetched.value->ToString(gil);
    if (text)
      out.append(": ").append(*text);
    else
      out.append(": <unprintable ").append(fetched.value->TypeName()).append(" object>");
    PyErr_Restore(savedType, savedValue, savedTb);
    return out;
  }

  bool Error::Matches(GilToken, PyObject *exceptionType) const noexcept
  {
    if (const auto *host = std::get_if<Host>(&m_state))
      return PyErr_GivenExceptionMatches(ExceptionTypeFor(host->code), exceptionType) != 0;
    return PyErr_GivenExceptionMatches(std::get<Fetched>(m_state).type.Get(), exceptionType) != 0;
  }

  void Error::Restore(GilToken) &&
  {
    if (auto *host = std::get_if<Host>(&m_state))
    {
      PyErr_SetString(ExceptionTypeFor(host->code), host->message.c_str());
      host->message.clear();
      return;
    }
    auto &fetched = std::get<Fetched>(m_state);
    // PyErr_Restore steals all three references.
    PyErr_Restore(std::move(fetched.type).IntoPtr(),
                  std::move(fetched.value).IntoPtr(),
                  std::move(fetched.traceback).IntoPtr());
  }

} // namespace NGIN::Python
