// ArgParse.hpp
// Binds a positional tuple and an optional keyword dict to typed host arguments
#pragma once

#include <NGIN/Python/Convert.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Handle.hpp>
#include <NGIN/Python/Object.hpp>
#include <NGIN/Python/Signature.hpp>

#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <utility>

namespace NGIN::Python
{

  /** Owners of the `*args` tuple / `**kwargs` dict built while binding. */
  struct VariadicArguments
  {
    std::optional<Owned<Tuple>> varArgs;
    std::optional<Owned<Dict>> varKwargs;
  };

  /**
   * Assigns every supplied argument to a parameter slot without converting it.
   *
   * On success `slots[i]` holds a borrowed pointer to the value for
   * `params[i]`, or null when the parameter was not supplied (it is then
   * optional or defaulted). Variadic slots point into `extra`. Errors name the
   * function and the offending parameter; `args` and `kwargs` are only read.
   */
  [[nodiscard]] NGIN_PYTHON_API std::expected<void, Error>
  BindArguments(GilToken gil, std::string_view function, std::span<const ParameterSpec> params,
                Borrowed<Tuple> args, std::optional<Borrowed<Dict>> kwargs,
                std::span<PyObject *> slots, VariadicArguments &extra);

  /** Prefixes a conversion error with "f() argument N ('name'): ". */
  [[nodiscard]] NGIN_PYTHON_API Error AnnotateArgumentError(std::string_view function, std::size_t index,
                                                            std::string_view name, Error error);

  namespace detail
  {
    template <class T>
    inline constexpr bool can_default_v =
        std::is_same_v<T, bool> || is_integer_v<T> || std::is_floating_point_v<T> ||
        std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>;

    template <class T>
    typename FromPython<T>::Value DefaultValue(const DefaultLiteral &lit)
    {
      if constexpr (IsOptional<T>::value)
      {
        using U = typename T::value_type;
        if constexpr (can_default_v<U>)
        {
          if (lit.kind != DefaultKind::Absent && lit.kind != DefaultKind::None)
            return T{DefaultValue<U>(lit)};
        }
        return T{};
      }
      else if constexpr (std::is_same_v<T, bool>)
        return lit.boolean;
      else if constexpr (is_integer_v<T>)
        return static_cast<T>(lit.integer);
      else if constexpr (std::is_floating_point_v<T>)
        return static_cast<T>(lit.kind == DefaultKind::Int ? static_cast<double>(lit.integer) : lit.real);
      else
        return T{lit.text};
    }

    template <class Spec, std::size_t I>
    using StoredAt = typename FromPython<Decayed<typename Spec::template ParameterType<I>>>::Value;

    template <class Spec, class Seq = std::make_index_sequence<Spec::Arity>>
    struct StoredArgumentsOf;
    template <class Spec, std::size_t... I>
    struct StoredArgumentsOf<Spec, std::index_sequence<I...>>
    {
      using type = std::tuple<StoredAt<Spec, I>...>;
    };

    template <class Spec, std::size_t I>
    std::expected<StoredAt<Spec, I>, Error> ConvertArgument(GilToken gil, std::string_view function, PyObject *slot)
    {
      using T = Decayed<typename Spec::template ParameterType<I>>;
      constexpr ParameterSpec spec = Spec::Parameters[I];

      if constexpr (spec.mode == ParameterMode::VarArgs)
      {
        return Borrowed<Tuple>::FromBorrowedPtr(gil, slot);
      }
      else if constexpr (spec.mode == ParameterMode::VarKwargs)
      {
        if (!slot)
          return std::optional<Borrowed<Dict>>{};
        return std::optional<Borrowed<Dict>>{Borrowed<Dict>::FromBorrowedPtr(gil, slot)};
      }
      else
      {
        if (!slot)
        {
          if constexpr (IsOptional<T>::value || can_default_v<T>)
            return DefaultValue<T>(spec.value);
          else
            return std::unexpected(Error{ErrorCode::SystemError, "unbound argument without default"});
        }
        auto value = FromPython<T>::Extract(gil, Borrowed<Object>::FromBorrowedPtr(gil, slot));
        if (!value)
          return std::unexpected(AnnotateArgumentError(function, I, spec.name, std::move(value.error())));
        return value;
      }
    }

    template <class Spec, std::size_t... I>
    std::expected<typename StoredArgumentsOf<Spec>::type, Error>
    ConvertArguments(GilToken gil, std::string_view function, std::span<PyObject *const> slots, std::index_sequence<I...>)
    {
      std::tuple<std::optional<StoredAt<Spec, I>>...> staged;
      std::optional<Error> failure;
      auto step = [&]<std::size_t K>() -> bool
      {
        auto converted = ConvertArgument<Spec, K>(gil, function, slots[K]);
        if (!converted)
        {
          failure.emplace(std::move(converted.error()));
          return false;
        }
        std::get<K>(staged).emplace(std::move(*converted));
        return true;
      };
      (void)(step.template operator()<I>() && ...);
      if (failure)
        return std::unexpected(std::move(*failure));
      return typename StoredArgumentsOf<Spec>::type{std::move(*std::get<I>(staged))...};
    }
  } // namespace detail

  /**
   * Full binding for a `FunctionSpec`: slot assignment followed by per-parameter
   * conversion. `extra` must outlive the use of the returned values, which may
   * borrow from it.
   */
  template <class Spec>
  [[nodiscard]] std::expected<typename detail::StoredArgumentsOf<Spec>::type, Error>
  ExtractArguments(GilToken gil, std::string_view function, Borrowed<Tuple> args,
                   std::optional<Borrowed<Dict>> kwargs, VariadicArguments &extra)
  {
    std::array<PyObject *, Spec::Arity> slots{};
    auto bound = BindArguments(gil, function, Spec::Parameters, args, kwargs, slots, extra);
    if (!bound)
      return std::unexpected(std::move(bound.error()));
    return detail::ConvertArguments<Spec>(gil, function, slots, std::make_index_sequence<Spec::Arity>{});
  }

} // namespace NGIN::Python
