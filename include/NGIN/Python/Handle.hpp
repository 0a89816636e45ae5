// Handle.hpp
// Owned / borrowed handles over raw guest object pointers
#pragma once

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Gil.hpp>

#include <type_traits>
#include <utility>

namespace NGIN::Python
{

  template <class T>
  class Owned;
  template <class T>
  class Borrowed;

  /**
   * Holds exactly one reference-count unit of a guest object.
   *
   * `T` is a view type (`Object`, `Str`, `Tuple`, `Dict`, `Module`,
   * `TypeObject`) reached through `operator->`. Destruction releases the unit
   * once; the handle is move-only, a second unit is taken explicitly with
   * `Clone`. Must be destroyed while the GIL is held.
   */
  template <class T>
  class Owned
  {
  public:
    /** Steals the reference carried by `ptr` (a "new reference" in CPython terms). */
    [[nodiscard]] static Owned FromOwnedPtr(GilToken, PyObject *ptr) noexcept
    {
      return Owned{ptr};
    }

    Owned(const Owned &) = delete;
    Owned &operator=(const Owned &) = delete;

    Owned(Owned &&other) noexcept : m_view(other.m_view.Ptr())
    {
      other.m_view = T{nullptr};
    }

    Owned &operator=(Owned &&other) noexcept
    {
      if (this != &other)
      {
        Reset();
        m_view = other.m_view;
        other.m_view = T{nullptr};
      }
      return *this;
    }

    ~Owned() { Reset(); }

    [[nodiscard]] PyObject *Get() const noexcept { return m_view.Ptr(); }
    [[nodiscard]] bool IsValid() const noexcept { return m_view.Ptr() != nullptr; }

    const T *operator->() const noexcept { return &m_view; }
    const T &operator*() const noexcept { return m_view; }

    /** A borrowed view bounded by this handle's lifetime. */
    [[nodiscard]] Borrowed<T> Borrow() const noexcept;

    /** Takes an additional reference unit. */
    [[nodiscard]] Owned Clone(GilToken) const noexcept
    {
      Py_XINCREF(m_view.Ptr());
      return Owned{m_view.Ptr()};
    }

    /** Hands the reference unit to the caller; the handle becomes empty. */
    [[nodiscard]] PyObject *IntoPtr() && noexcept
    {
      PyObject *p = m_view.Ptr();
      m_view = T{nullptr};
      return p;
    }

    /** Re-types the handle as one of the view's bases; no reference traffic. */
    template <class U>
    requires std::is_base_of_v<U, T>
    [[nodiscard]] Owned<U> Upcast() && noexcept
    {
      return Owned<U>{std::move(*this).IntoPtr()};
    }

  private:
    explicit Owned(PyObject *ptr) noexcept : m_view(ptr) {}

    void Reset() noexcept
    {
      Py_XDECREF(m_view.Ptr());
      m_view = T{nullptr};
    }

    template <class>
    friend class Owned;
    template <class>
    friend class Borrowed;

    T m_view{nullptr};
  };

  /**
   * Non-owning handle. Valid only while some owner (the caller's frame, a
   * container, an `Owned` handle) keeps the object alive; never releases.
   */
  template <class T>
  class Borrowed
  {
  public:
    /** Wraps a "borrowed reference"; `ptr` must be non-null. */
    [[nodiscard]] static Borrowed FromBorrowedPtr(GilToken, PyObject *ptr) noexcept
    {
      return Borrowed{ptr};
    }

    [[nodiscard]] PyObject *Get() const noexcept { return m_view.Ptr(); }

    const T *operator->() const noexcept { return &m_view; }
    const T &operator*() const noexcept { return m_view; }

    /** Takes a reference unit of its own (`Py_INCREF`). */
    [[nodiscard]] Owned<T> ClaimOwnership() const noexcept
    {
      Py_INCREF(m_view.Ptr());
      return Owned<T>{m_view.Ptr()};
    }

    template <class U>
    requires std::is_base_of_v<U, T>
    [[nodiscard]] Borrowed<U> Upcast() const noexcept
    {
      return Borrowed<U>{m_view.Ptr()};
    }

  private:
    explicit Borrowed(PyObject *ptr) noexcept : m_view(ptr) {}

    template <class>
    friend class Owned;
    template <class>
    friend class Borrowed;

    T m_view;
  };

  template <class T>
  inline Borrowed<T> Owned<T>::Borrow() const noexcept
  {
    return Borrowed<T>{m_view.Ptr()};
  }

} // namespace NGIN::Python
