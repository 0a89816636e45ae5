// Object.hpp
// Typed views over guest objects (used through Owned<T> / Borrowed<T>)
#pragma once

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Handle.hpp>

#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Python
{

  class Error;
  class Str;
  class Tuple;
  class Dict;

  /**
   * Non-owning view over a `PyObject*`. Views never touch reference counts;
   * ownership is expressed by the handle that carries them.
   */
  class NGIN_PYTHON_API Object
  {
  public:
    static constexpr std::string_view PythonName = "object";
    [[nodiscard]] static bool Check(PyObject *) noexcept { return true; }

    explicit Object(PyObject *ptr) noexcept : m_ptr(ptr) {}

    [[nodiscard]] PyObject *Ptr() const noexcept { return m_ptr; }
    [[nodiscard]] std::string_view TypeName() const noexcept { return Py_TYPE(m_ptr)->tp_name; }
    [[nodiscard]] Py_ssize_t RefCount() const noexcept { return Py_REFCNT(m_ptr); }
    [[nodiscard]] bool IsNone() const noexcept { return m_ptr == Py_None; }
    [[nodiscard]] bool Is(const Object &other) const noexcept { return m_ptr == other.m_ptr; }

    /** `getattr(self, name)`; a missing attribute yields the interpreter's AttributeError. */
    [[nodiscard]] std::expected<Owned<Object>, Error> GetAttr(GilToken gil, std::string_view name) const;
    [[nodiscard]] std::expected<void, Error> SetAttr(GilToken gil, std::string_view name, Borrowed<Object> value) const;
    [[nodiscard]] std::expected<bool, Error> HasAttr(GilToken gil, std::string_view name) const;

    /** `self(*args, **kwargs)`; an absent `kwargs` is passed as NULL. */
    [[nodiscard]] std::expected<Owned<Object>, Error> Call(GilToken gil, Borrowed<Tuple> args,
                                                           std::optional<Borrowed<Dict>> kwargs = std::nullopt) const;
    [[nodiscard]] std::expected<Owned<Object>, Error> Call(GilToken gil) const;

    [[nodiscard]] std::expected<std::string, Error> Repr(GilToken gil) const;
    [[nodiscard]] std::expected<std::string, Error> ToString(GilToken gil) const;

  protected:
    PyObject *m_ptr{nullptr};
  };

  class NGIN_PYTHON_API Str : public Object
  {
  public:
    static constexpr std::string_view PythonName = "str";
    [[nodiscard]] static bool Check(PyObject *p) noexcept { return PyUnicode_Check(p); }

    using Object::Object;

    [[nodiscard]] static std::expected<Owned<Str>, Error> New(GilToken gil, std::string_view text);

    /** UTF-8 contents; the view lives as long as the string object. */
    [[nodiscard]] std::expected<std::string_view, Error> ToUtf8(GilToken gil) const;
  };

  class NGIN_PYTHON_API Tuple : public Object
  {
  public:
    static constexpr std::string_view PythonName = "tuple";
    [[nodiscard]] static bool Check(PyObject *p) noexcept { return PyTuple_Check(p); }

    using Object::Object;

    [[nodiscard]] static std::expected<Owned<Tuple>, Error> New(GilToken gil, std::initializer_list<Borrowed<Object>> items);
    [[nodiscard]] static std::expected<Owned<Tuple>, Error> Empty(GilToken gil);

    [[nodiscard]] Py_ssize_t Size() const noexcept { return PyTuple_GET_SIZE(m_ptr); }

    /** Item `index`; the caller guarantees `index < Size()`. */
    [[nodiscard]] Borrowed<Object> GetItem(GilToken gil, Py_ssize_t index) const noexcept;

    /** `self[from:to]` as a new tuple. */
    [[nodiscard]] std::expected<Owned<Tuple>, Error> Slice(GilToken gil, Py_ssize_t from, Py_ssize_t to) const;
  };

  class NGIN_PYTHON_API Dict : public Object
  {
  public:
    static constexpr std::string_view PythonName = "dict";
    [[nodiscard]] static bool Check(PyObject *p) noexcept { return PyDict_Check(p); }

    using Object::Object;

    [[nodiscard]] static std::expected<Owned<Dict>, Error> New(GilToken gil);

    [[nodiscard]] Py_ssize_t Size() const noexcept { return PyDict_GET_SIZE(m_ptr); }

    /** Lookup by string key; `std::nullopt` when absent. */
    [[nodiscard]] std::expected<std::optional<Borrowed<Object>>, Error> GetItem(GilToken gil, std::string_view key) const;
    [[nodiscard]] std::expected<void, Error> SetItem(GilToken gil, std::string_view key, Borrowed<Object> value) const;
    [[nodiscard]] std::expected<void, Error> SetItem(GilToken gil, Borrowed<Object> key, Borrowed<Object> value) const;

    /**
     * Iteration step over (key, value) pairs, `PyDict_Next` style. Start with
     * `pos = 0`; returns `std::nullopt` once exhausted. The dict must not be
     * mutated while iterating.
     */
    [[nodiscard]] std::optional<std::pair<Borrowed<Object>, Borrowed<Object>>> Next(GilToken gil, Py_ssize_t &pos) const noexcept;

    /** Calls `fn(key, value)` for every entry; stops early when `fn` returns false. */
    template <class Fn>
    void ForEach(GilToken gil, Fn &&fn) const
    {
      Py_ssize_t pos = 0;
      while (auto entry = Next(gil, pos))
      {
        if constexpr (std::is_same_v<std::invoke_result_t<Fn &, Borrowed<Object>, Borrowed<Object>>, bool>)
        {
          if (!fn(entry->first, entry->second))
            return;
        }
        else
        {
          fn(entry->first, entry->second);
        }
      }
    }
  };

  class NGIN_PYTHON_API TypeObject : public Object
  {
  public:
    static constexpr std::string_view PythonName = "type";
    [[nodiscard]] static bool Check(PyObject *p) noexcept { return PyType_Check(p); }

    using Object::Object;

    [[nodiscard]] PyTypeObject *Raw() const noexcept { return reinterpret_cast<PyTypeObject *>(m_ptr); }
    [[nodiscard]] bool IsReady() const noexcept { return PyType_HasFeature(Raw(), Py_TPFLAGS_READY); }
    [[nodiscard]] std::string_view Name() const noexcept { return Raw()->tp_name; }
  };

  /** The `None` singleton. */
  [[nodiscard]] inline Borrowed<Object> None(GilToken gil) noexcept
  {
    return Borrowed<Object>::FromBorrowedPtr(gil, Py_None);
  }

} // namespace NGIN::Python
