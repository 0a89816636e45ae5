// Convert.hpp
// FromPython / IntoPython conversion policies between host values and guest objects
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/Handle.hpp>
#include <NGIN/Python/Instance.hpp>
#include <NGIN/Python/Object.hpp>

#include <cmath>
#include <concepts>
#include <expected>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Python
{

  /**
   * Extraction policy for a parameter type.
   *
   * Specializations provide `Value` (what is stored between binding and the
   * call), `Name()` (the guest-facing type name used in messages) and
   * `Extract(GilToken, Borrowed<Object>) -> std::expected<Value, Error>`.
   */
  template <class T>
  struct FromPython
  {
    static constexpr bool Supported = false;
  };

  /** Conversion policy for a result type: `Convert(GilToken, T) -> std::expected<Owned<Object>, Error>`. */
  template <class T>
  struct IntoPython
  {
    static constexpr bool Supported = false;
  };

  template <class T>
  concept Extractable = FromPython<T>::Supported;

  template <class T>
  concept Returnable = std::is_void_v<T> || IntoPython<T>::Supported;

  namespace detail
  {
    template <class T>
    struct IsOptional : std::false_type
    {
    };
    template <class U>
    struct IsOptional<std::optional<U>> : std::true_type
    {
    };

    template <class T>
    struct IsExpected : std::false_type
    {
    };
    template <class U>
    struct IsExpected<std::expected<U, Error>> : std::true_type
    {
    };

    template <class T>
    struct IsHandle : std::false_type
    {
    };
    template <class V>
    struct IsHandle<Owned<V>> : std::true_type
    {
    };
    template <class V>
    struct IsHandle<Borrowed<V>> : std::true_type
    {
    };

    template <class T>
    inline constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                         !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t> &&
                                         !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> &&
                                         !std::is_same_v<T, char32_t>;

    // "int8" .. "uint64", for overflow messages.
    template <class T>
    consteval std::string_view IntegerName() noexcept
    {
      constexpr bool s = std::is_signed_v<T>;
      switch (sizeof(T))
      {
        case 1: return s ? "int8" : "uint8";
        case 2: return s ? "int16" : "uint16";
        case 4: return s ? "int32" : "uint32";
        default: return s ? "int64" : "uint64";
      }
    }

    [[nodiscard]] inline Error TypeMismatch(std::string_view expected, Borrowed<Object> actual)
    {
      std::string msg{"expected "};
      msg.append(expected).append(", got ").append(actual->TypeName());
      return Error{ErrorCode::TypeError, std::move(msg)};
    }

    template <class T>
    [[nodiscard]] std::string_view BoundClassName() noexcept
    {
      const auto &type = TypeStorage<T>();
      if (type.tp_name)
        return type.tp_name;
      return NGIN::Meta::TypeName<T>::unqualifiedName;
    }
  } // namespace detail

  // bool (strict: only True / False are accepted)
  template <>
  struct FromPython<bool>
  {
    static constexpr bool Supported = true;
    using Value = bool;
    static std::string_view Name() noexcept { return "bool"; }

    static std::expected<Value, Error> Extract(GilToken, Borrowed<Object> obj)
    {
      if (!PyBool_Check(obj.Get()))
        return std::unexpected(detail::TypeMismatch(Name(), obj));
      return obj.Get() == Py_True;
    }
  };

  // Integers, range-checked against the host type
  template <class T>
  requires detail::is_integer_v<T>
  struct FromPython<T>
  {
    static constexpr bool Supported = true;
    using Value = T;
    static std::string_view Name() noexcept { return "int"; }

    static std::expected<Value, Error> Extract(GilToken gil, Borrowed<Object> obj)
    {
      if (!PyLong_Check(obj.Get()))
        return std::unexpected(detail::TypeMismatch(Name(), obj));

      if constexpr (std::is_signed_v<T>)
      {
        const long long v = PyLong_AsLongLong(obj.Get());
        if (v == -1 && PyErr_Occurred())
          return std::unexpected(Error::Fetch(gil));
        if (!std::in_range<T>(v))
          return std::unexpected(OutOfRange());
        return static_cast<T>(v);
      }
      else
      {
        const unsigned long long v = PyLong_AsUnsignedLongLong(obj.Get());
        if (v == static_cast<unsigned long long>(-1) && PyErr_Occurred())
          return std::unexpected(Error::Fetch(gil));
        if (!std::in_range<T>(v))
          return std::unexpected(OutOfRange());
        return static_cast<T>(v);
      }
    }

  private:
    static Error OutOfRange()
    {
      std::string msg{"int value out of range for "};
      msg.append(detail::IntegerName<T>());
      return Error{ErrorCode::OverflowError, std::move(msg)};
    }
  };

  // Floating point; ints are accepted and widened
  template <std::floating_point T>
  struct FromPython<T>
  {
    static constexpr bool Supported = true;
    using Value = T;
    static std::string_view Name() noexcept { return "float"; }

    static std::expected<Value, Error> Extract(GilToken gil, Borrowed<Object> obj)
    {
      if (!PyFloat_Check(obj.Get()) && !PyLong_Check(obj.Get()))
        return std::unexpected(detail::TypeMismatch(Name(), obj));
      const double v = PyFloat_AsDouble(obj.Get());
      if (v == -1.0 && PyErr_Occurred())
        return std::unexpected(Error::Fetch(gil));
      // Narrowing a finite value past the target's range is undefined; infinities pass through.
      if constexpr (std::numeric_limits<T>::max() < std::numeric_limits<double>::max())
      {
        if (std::isfinite(v) && std::fabs(v) > static_cast<double>(std::numeric_limits<T>::max()))
          return std::unexpected(Error{ErrorCode::OverflowError, "float value out of range for " + std::string{Name()}});
      }
      return static_cast<T>(v);
    }
  };

  template <>
  struct FromPython<std::string>
  {
    static constexpr bool Supported = true;
    using Value = std::string;
    static std::string_view Name() noexcept { return "str"; }

    static std::expected<Value, Error> Extract(GilToken gil, Borrowed<Object> obj)
    {
      if (!Str::Check(obj.Get()))
        return std::unexpected(detail::TypeMismatch(Name(), obj));
      auto text = Str{obj.Get()}.ToUtf8(gil);
      if (!text)
        return std::unexpected(std::move(text.error()));
      return std::string{*text};
    }
  };

  // Views into the string object's UTF-8 buffer; valid while the argument lives.
  template <>
  struct FromPython<std::string_view>
  {
    static constexpr bool Supported = true;
    using Value = std::string_view;
    static std::string_view Name() noexcept { return "str"; }

    static std::expected<Value, Error> Extract(GilToken gil, Borrowed<Object> obj)
    {
      if (!Str::Check(obj.Get()))
        return std::unexpected(detail::TypeMismatch(Name(), obj));
      return Str{obj.Get()}.ToUtf8(gil);
    }
  };

  template <class U>
  requires Extractable<U>
  struct FromPython<std::optional<U>>
  {
    static constexpr bool Supported = true;
    using Value = std::optional<U>;
    static std::string_view Name() noexcept { return FromPython<U>::Name(); }

    static std::expected<Value, Error> Extract(GilToken gil, Borrowed<Object> obj)
    {
      if (obj->IsNone())
        return Value{};
      auto inner = FromPython<U>::Extract(gil, obj);
      if (!inner)
        return std::unexpected(std::move(inner.error()));
      return Value{std::move(*inner)};
    }
  };

  template <class V>
  struct FromPython<Borrowed<V>>
  {
    static constexpr bool Supported = true;
    using Value = Borrowed<V>;
    static std::string_view Name() noexcept { return V::PythonName; }

    static std::expected<Value, Error> Extract(GilToken gil, Borrowed<Object> obj)
    {
      return Downcast<V>(gil, obj);
    }
  };

  template <class V>
  struct FromPython<Owned<V>>
  {
    static constexpr bool Supported = true;
    using Value = Owned<V>;
    static std::string_view Name() noexcept { return V::PythonName; }

    static std::expected<Value, Error> Extract(GilToken gil, Borrowed<Object> obj)
    {
      auto checked = Downcast<V>(gil, obj);
      if (!checked)
        return std::unexpected(std::move(checked.error()));
      return checked->ClaimOwnership();
    }
  };

  // Registered classes are extracted by reference to the wrapped value.
  template <BoundClass T>
  struct FromPython<T>
  {
    static constexpr bool Supported = true;
    using Value = std::reference_wrapper<T>;
    static std::string_view Name() noexcept { return detail::BoundClassName<T>(); }

    static std::expected<Value, Error> Extract(GilToken, Borrowed<Object> obj)
    {
      if (!detail::IsTypeReady<T>() || !PyObject_TypeCheck(obj.Get(), &detail::TypeStorage<T>()))
        return std::unexpected(detail::TypeMismatch(Name(), obj));
      auto *value = detail::InstanceValue<T>(obj.Get());
      if (!value)
      {
        std::string msg{Name()};
        msg.append(" object is not initialized");
        return std::unexpected(Error{ErrorCode::RuntimeError, std::move(msg)});
      }
      return std::ref(*value);
    }
  };

  // ---------------------------------------------------------------------------
  // Host -> guest

  template <>
  struct IntoPython<bool>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, bool value)
    {
      return OwnedOrFetch(gil, PyBool_FromLong(value ? 1 : 0));
    }
  };

  template <class T>
  requires detail::is_integer_v<T>
  struct IntoPython<T>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, T value)
    {
      if constexpr (std::is_signed_v<T>)
        return OwnedOrFetch(gil, PyLong_FromLongLong(static_cast<long long>(value)));
      else
        return OwnedOrFetch(gil, PyLong_FromUnsignedLongLong(static_cast<unsigned long long>(value)));
    }
  };

  template <std::floating_point T>
  struct IntoPython<T>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, T value)
    {
      return OwnedOrFetch(gil, PyFloat_FromDouble(static_cast<double>(value)));
    }
  };

  template <class T>
  requires std::same_as<T, std::string> || std::same_as<T, std::string_view>
  struct IntoPython<T>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, const T &value)
    {
      auto str = Str::New(gil, value);
      if (!str)
        return std::unexpected(std::move(str.error()));
      return std::move(*str).template Upcast<Object>();
    }
  };

  template <>
  struct IntoPython<const char *>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, const char *value)
    {
      if (!value)
        return None(gil).ClaimOwnership();
      return IntoPython<std::string_view>::Convert(gil, std::string_view{value});
    }
  };

  template <class V>
  struct IntoPython<Owned<V>>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken, Owned<V> value)
    {
      if constexpr (std::is_same_v<V, Object>)
        return value;
      else
        return std::move(value).template Upcast<Object>();
    }
  };

  template <class V>
  struct IntoPython<Borrowed<V>>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken, Borrowed<V> value)
    {
      return value.template Upcast<Object>().ClaimOwnership();
    }
  };

  template <class U>
  requires Returnable<U>
  struct IntoPython<std::optional<U>>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, std::optional<U> value)
    {
      if (!value)
        return None(gil).ClaimOwnership();
      return IntoPython<U>::Convert(gil, std::move(*value));
    }
  };

  // Errors carried by the result propagate to the caller unchanged.
  template <class U>
  requires Returnable<U>
  struct IntoPython<std::expected<U, Error>>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, std::expected<U, Error> value)
    {
      if (!value)
        return std::unexpected(std::move(value.error()));
      if constexpr (std::is_void_v<U>)
        return None(gil).ClaimOwnership();
      else
        return IntoPython<U>::Convert(gil, std::move(*value));
    }
  };

  // Registered classes are returned as new instances holding a moved/copied value.
  template <BoundClass T>
  struct IntoPython<T>
  {
    static constexpr bool Supported = true;
    static std::expected<Owned<Object>, Error> Convert(GilToken gil, T value)
    {
      if (!detail::IsTypeReady<T>())
      {
        std::string msg{"type "};
        msg.append(NGIN::Meta::TypeName<T>::unqualifiedName).append(" is not registered with any module");
        return std::unexpected(Error{ErrorCode::RuntimeError, std::move(msg)});
      }
      PyTypeObject *type = &detail::TypeStorage<T>();
      auto obj = OwnedOrFetch(gil, type->tp_alloc(type, 0));
      if (!obj)
        return obj;
      auto *inst = reinterpret_cast<detail::Instance<T> *>(obj->Get());
      ::new (static_cast<void *>(inst->storage)) T(std::move(value));
      inst->constructed = true;
      return obj;
    }
  };

  /** Converts any returnable host value; `void` results are produced by the callers as `None`. */
  template <class T>
  [[nodiscard]] inline std::expected<Owned<Object>, Error> ToPython(GilToken gil, T &&value)
  {
    using U = std::remove_cvref_t<T>;
    static_assert(IntoPython<U>::Supported, "type has no IntoPython conversion");
    return IntoPython<U>::Convert(gil, std::forward<T>(value));
  }

} // namespace NGIN::Python
