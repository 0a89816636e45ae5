// Signature.hpp
// Compile-time description of an exported callable: parameters, modes and defaults
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Python/Convert.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Handle.hpp>
#include <NGIN/Python/Object.hpp>
#include <NGIN/Python/Types.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Python
{

  enum class FunctionKind : NGIN::UInt8
  {
    Function,
    Method,
    Constructor,
    StaticMethod,
  };

  enum class ParameterMode : NGIN::UInt8
  {
    PositionalOrKeyword,
    KeywordOnly,
    VarArgs,   // *args
    VarKwargs, // **kwargs
  };

  enum class DefaultKind : NGIN::UInt8
  {
    Absent,
    None,
    Bool,
    Int,
    Float,
    Str,
  };

  struct DefaultLiteral
  {
    DefaultKind kind{DefaultKind::Absent};
    bool boolean{false};
    long long integer{0};
    double real{0.0};
    std::string_view text{};
  };

  struct ParameterSpec
  {
    std::string_view name{};
    ParameterMode mode{ParameterMode::PositionalOrKeyword};
    bool optional{false}; // declared as std::optional<U>
    DefaultLiteral value{};

    [[nodiscard]] constexpr bool HasDefault() const noexcept { return value.kind != DefaultKind::Absent; }
    [[nodiscard]] constexpr bool IsVariadic() const noexcept
    {
      return mode == ParameterMode::VarArgs || mode == ParameterMode::VarKwargs;
    }
    [[nodiscard]] constexpr bool IsRequired() const noexcept { return !IsVariadic() && !optional && !HasDefault(); }
  };

  struct SignatureFlags
  {
    bool keywordOnly{false};
    bool varArgs{false};
    bool varKwargs{false};
    bool takesGil{false};
  };

  namespace detail
  {
    struct AttributeItem
    {
      std::string_view name{};
      bool star{false};       // "*" or "*name"
      bool doubleStar{false}; // "**name"
      DefaultLiteral value{};
    };

    consteval bool IsSpace(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
    consteval bool IsDigit(char c) noexcept { return c >= '0' && c <= '9'; }
    consteval bool IsIdentStart(char c) noexcept
    {
      return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }
    consteval bool IsIdentChar(char c) noexcept { return IsIdentStart(c) || IsDigit(c); }

    consteval std::string_view Trim(std::string_view s) noexcept
    {
      while (!s.empty() && IsSpace(s.front()))
        s.remove_prefix(1);
      while (!s.empty() && IsSpace(s.back()))
        s.remove_suffix(1);
      return s;
    }

    consteval std::size_t CountAttributeItems(std::string_view s)
    {
      if (Trim(s).empty())
        return 0;
      std::size_t count = 1;
      char quote = 0;
      for (char c : s)
      {
        if (quote)
        {
          if (c == quote)
            quote = 0;
        }
        else if (c == '"' || c == '\'')
          quote = c;
        else if (c == ',')
          ++count;
      }
      if (quote)
        throw "argument attributes: unterminated string literal";
      return count;
    }

    consteval long long ParseInteger(std::string_view s)
    {
      bool negative = false;
      if (!s.empty() && (s.front() == '-' || s.front() == '+'))
      {
        negative = s.front() == '-';
        s.remove_prefix(1);
      }
      if (s.empty())
        throw "argument attributes: malformed integer default";
      unsigned long long v = 0;
      for (char c : s)
      {
        if (!IsDigit(c))
          throw "argument attributes: malformed integer default";
        if (v > (static_cast<unsigned long long>(-1) - 9) / 10)
          throw "argument attributes: integer default out of range";
        v = v * 10 + static_cast<unsigned long long>(c - '0');
      }
      if (v > static_cast<unsigned long long>(9223372036854775807LL) + (negative ? 1u : 0u))
        throw "argument attributes: integer default out of range";
      if (negative)
        return v == static_cast<unsigned long long>(9223372036854775807LL) + 1u ? (-9223372036854775807LL - 1) : -static_cast<long long>(v);
      return static_cast<long long>(v);
    }

    // Decimal floats: [sign] digits [. digits] [e [sign] digits]
    consteval double ParseFloat(std::string_view s)
    {
      double sign = 1.0;
      if (!s.empty() && (s.front() == '-' || s.front() == '+'))
      {
        sign = s.front() == '-' ? -1.0 : 1.0;
        s.remove_prefix(1);
      }
      double mantissa = 0.0;
      bool anyDigit = false;
      std::size_t i = 0;
      for (; i < s.size() && IsDigit(s[i]); ++i, anyDigit = true)
        mantissa = mantissa * 10.0 + (s[i] - '0');
      if (i < s.size() && s[i] == '.')
      {
        double scale = 0.1;
        for (++i; i < s.size() && IsDigit(s[i]); ++i, anyDigit = true, scale /= 10.0)
          mantissa += (s[i] - '0') * scale;
      }
      if (!anyDigit)
        throw "argument attributes: malformed float default";
      if (i < s.size() && (s[i] == 'e' || s[i] == 'E'))
      {
        ++i;
        const long long exponent = ParseInteger(s.substr(i));
        if (exponent > 308 || exponent < -308)
          throw "argument attributes: float default out of range";
        for (long long e = 0; e < (exponent < 0 ? -exponent : exponent); ++e)
          mantissa = exponent < 0 ? mantissa / 10.0 : mantissa * 10.0;
        i = s.size();
      }
      if (i != s.size())
        throw "argument attributes: malformed float default";
      return sign * mantissa;
    }

    consteval DefaultLiteral ParseDefault(std::string_view s)
    {
      DefaultLiteral lit{};
      if (s.empty())
        throw "argument attributes: empty default value";
      if (s == "None")
      {
        lit.kind = DefaultKind::None;
      }
      else if (s == "True" || s == "False")
      {
        lit.kind = DefaultKind::Bool;
        lit.boolean = s == "True";
      }
      else if (s.front() == '"' || s.front() == '\'')
      {
        if (s.size() < 2 || s.back() != s.front())
          throw "argument attributes: malformed string default";
        lit.kind = DefaultKind::Str;
        lit.text = s.substr(1, s.size() - 2);
      }
      else if (s.find_first_of(".eE") != std::string_view::npos)
      {
        lit.kind = DefaultKind::Float;
        lit.real = ParseFloat(s);
      }
      else
      {
        lit.kind = DefaultKind::Int;
        lit.integer = ParseInteger(s);
        lit.real = static_cast<double>(lit.integer);
      }
      return lit;
    }

    consteval void CheckIdentifier(std::string_view name)
    {
      if (name.empty() || name == "_")
        throw "argument attributes: unnamed parameter";
      if (!IsIdentStart(name.front()))
        throw "argument attributes: parameter name is not an identifier";
      for (char c : name)
        if (!IsIdentChar(c))
          throw "argument attributes: parameter name is not an identifier";
    }

    consteval AttributeItem ParseItem(std::string_view raw)
    {
      std::string_view s = Trim(raw);
      AttributeItem item{};
      if (s.empty())
        throw "argument attributes: unnamed parameter";
      if (s.starts_with("**"))
      {
        item.doubleStar = true;
        item.name = Trim(s.substr(2));
        CheckIdentifier(item.name);
        return item;
      }
      if (s.starts_with("*"))
      {
        item.star = true;
        item.name = Trim(s.substr(1));
        if (!item.name.empty())
          CheckIdentifier(item.name);
        return item;
      }
      const auto eq = s.find('=');
      if (eq == std::string_view::npos)
      {
        item.name = s;
      }
      else
      {
        item.name = Trim(s.substr(0, eq));
        item.value = ParseDefault(Trim(s.substr(eq + 1)));
      }
      CheckIdentifier(item.name);
      return item;
    }

    template <std::size_t N>
    consteval std::array<AttributeItem, N> SplitAttributes(std::string_view s)
    {
      std::array<AttributeItem, N> items{};
      if constexpr (N == 0)
        return items;
      std::size_t begin = 0;
      std::size_t idx = 0;
      char quote = 0;
      for (std::size_t i = 0; i <= s.size(); ++i)
      {
        const bool atEnd = i == s.size();
        const char c = atEnd ? ',' : s[i];
        if (quote)
        {
          if (c == quote)
            quote = 0;
          continue;
        }
        if (c == '"' || c == '\'')
        {
          quote = c;
          continue;
        }
        if (c == ',')
        {
          items[idx++] = ParseItem(s.substr(begin, i - begin));
          begin = i + 1;
        }
      }
      return items;
    }

    template <std::size_t ItemCount>
    consteval std::size_t CountParameters(const std::array<AttributeItem, ItemCount> &items) noexcept
    {
      std::size_t n = 0;
      for (const auto &item : items)
        if (!(item.star && item.name.empty()))
          ++n;
      return n;
    }

    /**
     * Maps attribute items onto parameters, enforcing the ordering rules:
     * positional parameters, then `*` or `*args`, keyword-only parameters,
     * and `**kwargs` last.
     */
    template <std::size_t Arity, std::size_t ItemCount>
    consteval std::array<ParameterSpec, Arity> BuildParameters(const std::array<AttributeItem, ItemCount> &items)
    {
      if (CountParameters(items) != Arity)
        throw "argument attributes: number of named parameters does not match the function signature";

      std::array<ParameterSpec, Arity> params{};
      bool keywordOnly = false;
      bool seenStar = false;
      bool seenVarKwargs = false;
      bool seenDefault = false;
      std::size_t p = 0;
      for (const auto &item : items)
      {
        if (seenVarKwargs)
          throw "argument attributes: **kwargs must be the last parameter";
        if (item.star)
        {
          if (seenStar)
            throw "argument attributes: '*' or '*args' given twice";
          seenStar = true;
          keywordOnly = true;
          if (item.name.empty())
            continue;
          params[p].name = item.name;
          params[p].mode = ParameterMode::VarArgs;
          ++p;
          continue;
        }
        if (item.doubleStar)
        {
          seenVarKwargs = true;
          params[p].name = item.name;
          params[p].mode = ParameterMode::VarKwargs;
          ++p;
          continue;
        }
        params[p].name = item.name;
        params[p].mode = keywordOnly ? ParameterMode::KeywordOnly : ParameterMode::PositionalOrKeyword;
        params[p].value = item.value;
        if (!keywordOnly)
        {
          if (item.value.kind != DefaultKind::Absent)
            seenDefault = true;
          else if (seenDefault)
            throw "argument attributes: required positional parameter follows a parameter with a default";
        }
        ++p;
      }

      for (std::size_t i = 0; i < Arity; ++i)
        for (std::size_t j = i + 1; j < Arity; ++j)
          if (params[i].name == params[j].name)
            throw "argument attributes: parameter name given twice";
      return params;
    }

    // ---------------------------------------------------------------------
    // Type-dependent checks

    template <class P>
    using Decayed = std::remove_cvref_t<P>;

    template <class P>
    inline constexpr bool is_supported_shape_v =
        !std::is_pointer_v<Decayed<P>> &&
        !std::is_same_v<Decayed<P>, GilToken> &&
        (!std::is_lvalue_reference_v<P> || std::is_const_v<std::remove_reference_t<P>> || BoundClass<Decayed<P>>);

    template <class T>
    struct OptionalInner
    {
      using type = T;
    };
    template <class U>
    struct OptionalInner<std::optional<U>>
    {
      using type = U;
    };

    template <class T>
    consteval bool DefaultFits(DefaultKind kind) noexcept
    {
      using U = typename OptionalInner<T>::type;
      switch (kind)
      {
        case DefaultKind::Absent: return true;
        case DefaultKind::None: return IsOptional<T>::value;
        case DefaultKind::Bool: return std::is_same_v<U, bool>;
        case DefaultKind::Int: return is_integer_v<U> || std::is_floating_point_v<U>;
        case DefaultKind::Float: return std::is_floating_point_v<U>;
        case DefaultKind::Str: return std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view>;
      }
      return false;
    }

    template <class P>
    consteval bool CheckParameter(ParameterSpec &spec)
    {
      using T = Decayed<P>;
      static_assert(!std::is_same_v<T, GilToken>, "GilToken is only accepted as the first parameter");
      static_assert(!std::is_pointer_v<T>, "raw pointer parameters are not supported; take a handle or a reference");
      static_assert(is_supported_shape_v<P>, "non-const lvalue reference parameters are only supported for bound classes");
      static_assert(Extractable<T>, "parameter type has no FromPython conversion");

      spec.optional = IsOptional<T>::value;
      if (spec.mode == ParameterMode::VarArgs && !std::is_same_v<T, Borrowed<Tuple>>)
        throw "argument attributes: *args parameter must be declared as Borrowed<Tuple>";
      if (spec.mode == ParameterMode::VarKwargs && !std::is_same_v<T, std::optional<Borrowed<Dict>>>)
        throw "argument attributes: **kwargs parameter must be declared as std::optional<Borrowed<Dict>>";
      if (!DefaultFits<T>(spec.value.kind))
        throw "argument attributes: default value is incompatible with the parameter type";
      if constexpr (is_integer_v<typename OptionalInner<T>::type>)
      {
        if (spec.value.kind == DefaultKind::Int && !std::in_range<typename OptionalInner<T>::type>(spec.value.integer))
          throw "argument attributes: integer default out of range for the parameter type";
      }
      return true;
    }

    template <class... P>
    consteval auto CheckParameters(std::array<ParameterSpec, sizeof...(P)> params)
    {
      std::size_t i = 0;
      (CheckParameter<P>(params[i++]), ...);
      return params;
    }

    template <class Tuple>
    struct ParametersOf;
    template <class... P>
    struct ParametersOf<std::tuple<P...>>
    {
      template <FixedString Args>
      static consteval std::array<ParameterSpec, sizeof...(P)> Build()
      {
        constexpr std::size_t itemCount = CountAttributeItems(Args.View());
        constexpr auto items = SplitAttributes<itemCount>(Args.View());
        return CheckParameters<P...>(BuildParameters<sizeof...(P)>(items));
      }
    };

    template <class Tuple>
    struct DropGil
    {
      using type = Tuple;
      static constexpr bool dropped = false;
    };
    template <class... P>
    struct DropGil<std::tuple<GilToken, P...>>
    {
      using type = std::tuple<P...>;
      static constexpr bool dropped = true;
    };
  } // namespace detail

  /**
   * Normalized description of one exported callable.
   *
   * `R` is the declared return type, `P...` the declared parameters including a
   * leading `GilToken` when present. Everything here is computed at compile
   * time; a malformed attribute string or an unsupported parameter type stops
   * compilation at the declaration that exported it.
   */
  template <FunctionKind K, FixedString Args, class R, class... P>
  struct FunctionSpec
  {
    static constexpr FunctionKind Kind = K;
    using Return = R;
    using Declared = std::tuple<P...>;
    using Guest = typename detail::DropGil<Declared>::type;

    static constexpr std::size_t Arity = std::tuple_size_v<Guest>;
    static constexpr std::array<ParameterSpec, Arity> Parameters =
        detail::ParametersOf<Guest>::template Build<Args>();

    static constexpr SignatureFlags Flags = []
    {
      SignatureFlags f{};
      f.takesGil = detail::DropGil<Declared>::dropped;
      for (const auto &p : Parameters)
      {
        f.keywordOnly |= p.mode == ParameterMode::KeywordOnly;
        f.varArgs |= p.mode == ParameterMode::VarArgs;
        f.varKwargs |= p.mode == ParameterMode::VarKwargs;
      }
      return f;
    }();

    template <std::size_t I>
    using ParameterType = std::tuple_element_t<I, Guest>;

    static_assert(Returnable<std::remove_cvref_t<R>> || std::is_void_v<R>, "return type has no IntoPython conversion");
  };

  namespace detail
  {
    template <FunctionKind K, FixedString Args, class Fn>
    struct SignatureFromPointer;

    template <FunctionKind K, FixedString Args, class R, class... P>
    struct SignatureFromPointer<K, Args, R (*)(P...)>
    {
      using type = FunctionSpec<K, Args, R, P...>;
    };
    template <FunctionKind K, FixedString Args, class R, class... P>
    struct SignatureFromPointer<K, Args, R (*)(P...) noexcept>
    {
      using type = FunctionSpec<K, Args, R, P...>;
    };

    // Member functions: the receiver is supplied separately.
    template <FunctionKind K, FixedString Args, class C, class R, class... P>
    struct SignatureFromPointer<K, Args, R (C::*)(P...)>
    {
      using type = FunctionSpec<K, Args, R, P...>;
      using Class = C;
      static constexpr bool isConst = false;
    };
    template <FunctionKind K, FixedString Args, class C, class R, class... P>
    struct SignatureFromPointer<K, Args, R (C::*)(P...) const>
    {
      using type = FunctionSpec<K, Args, R, P...>;
      using Class = C;
      static constexpr bool isConst = true;
    };
    template <FunctionKind K, FixedString Args, class C, class R, class... P>
    struct SignatureFromPointer<K, Args, R (C::*)(P...) noexcept>
    {
      using type = FunctionSpec<K, Args, R, P...>;
      using Class = C;
      static constexpr bool isConst = false;
    };
    template <FunctionKind K, FixedString Args, class C, class R, class... P>
    struct SignatureFromPointer<K, Args, R (C::*)(P...) const noexcept>
    {
      using type = FunctionSpec<K, Args, R, P...>;
      using Class = C;
      static constexpr bool isConst = true;
    };
  } // namespace detail

  /** Spec of a free function or static method given by pointer. */
  template <auto Fn, FixedString Args, FunctionKind K = FunctionKind::Function>
  using SignatureOf = typename detail::SignatureFromPointer<K, Args, decltype(Fn)>::type;

  /** Spec of a constructor taking `A...`. */
  template <FixedString Args, class... A>
  using ConstructorSignature = FunctionSpec<FunctionKind::Constructor, Args, void, A...>;

} // namespace NGIN::Python
