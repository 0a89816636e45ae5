#include <NGIN/Python/ArgParse.hpp>

#include <string>
#include <utility>

namespace NGIN::Python
{

  namespace
  {
    std::string Prefix(std::string_view function)
    {
      std::string out{function};
      out.append("() ");
      return out;
    }

    // Parameters accepting positional values form the leading run of the list.
    std::size_t PositionalCapacity(std::span<const ParameterSpec> params) noexcept
    {
      std::size_t n = 0;
      while (n < params.size() && params[n].mode == ParameterMode::PositionalOrKeyword)
        ++n;
      return n;
    }

    std::optional<std::size_t> FindVariadic(std::span<const ParameterSpec> params, ParameterMode mode) noexcept
    {
      for (std::size_t i = 0; i < params.size(); ++i)
        if (params[i].mode == mode)
          return i;
      return std::nullopt;
    }

    std::optional<std::size_t> FindNamed(std::span<const ParameterSpec> params, std::string_view name) noexcept
    {
      for (std::size_t i = 0; i < params.size(); ++i)
        if (!params[i].IsVariadic() && params[i].name == name)
          return i;
      return std::nullopt;
    }
  } // namespace

  std::expected<void, Error> BindArguments(GilToken gil, std::string_view function, std::span<const ParameterSpec> params,
                                           Borrowed<Tuple> args, std::optional<Borrowed<Dict>> kwargs,
                                           std::span<PyObject *> slots, VariadicArguments &extra)
  {
    const std::size_t capacity = PositionalCapacity(params);
    const auto varArgsIndex = FindVariadic(params, ParameterMode::VarArgs);
    const auto varKwargsIndex = FindVariadic(params, ParameterMode::VarKwargs);

    // 1. positional arguments, left to right
    const auto given = static_cast<std::size_t>(args->Size());
    const std::size_t bound = given < capacity ? given : capacity;
    for (std::size_t i = 0; i < bound; ++i)
      slots[i] = args->GetItem(gil, static_cast<Py_ssize_t>(i)).Get();

    if (given > capacity && !varArgsIndex)
    {
      std::string msg = Prefix(function);
      msg.append("got an unexpected positional argument (takes at most ")
          .append(std::to_string(capacity))
          .append(capacity == 1 ? " positional argument, " : " positional arguments, ")
          .append(std::to_string(given))
          .append(" given)");
      return std::unexpected(Error{ErrorCode::TypeError, std::move(msg)});
    }
    if (varArgsIndex)
    {
      auto rest = given > capacity
                      ? args->Slice(gil, static_cast<Py_ssize_t>(capacity), static_cast<Py_ssize_t>(given))
                      : Tuple::Empty(gil);
      if (!rest)
        return std::unexpected(std::move(rest.error()));
      slots[*varArgsIndex] = rest->Get();
      extra.varArgs.emplace(std::move(*rest));
    }

    // 2. keyword arguments
    if (kwargs)
    {
      Py_ssize_t pos = 0;
      while (auto entry = (*kwargs)->Next(gil, pos))
      {
        auto [key, value] = *entry;
        if (!Str::Check(key.Get()))
          return std::unexpected(Error{ErrorCode::TypeError, Prefix(function) + "keywords must be strings"});
        auto name = Str{key.Get()}.ToUtf8(gil);
        if (!name)
          return std::unexpected(std::move(name.error()));

        if (auto index = FindNamed(params, *name))
        {
          if (slots[*index])
          {
            std::string msg = Prefix(function);
            msg.append("got multiple values for argument '").append(*name).append("'");
            return std::unexpected(Error{ErrorCode::TypeError, std::move(msg)});
          }
          slots[*index] = value.Get();
          continue;
        }

        if (!varKwargsIndex)
        {
          std::string msg = Prefix(function);
          msg.append("got an unexpected keyword argument '").append(*name).append("'");
          return std::unexpected(Error{ErrorCode::TypeError, std::move(msg)});
        }
        if (!extra.varKwargs)
        {
          auto dict = Dict::New(gil);
          if (!dict)
            return std::unexpected(std::move(dict.error()));
          extra.varKwargs.emplace(std::move(*dict));
        }
        auto stored = (*extra.varKwargs)->SetItem(gil, key, value);
        if (!stored)
          return std::unexpected(std::move(stored.error()));
      }
    }
    if (varKwargsIndex && extra.varKwargs)
      slots[*varKwargsIndex] = extra.varKwargs->Get();

    // 3. everything required must be present now
    for (std::size_t i = 0; i < params.size(); ++i)
    {
      if (params[i].IsRequired() && !slots[i])
      {
        std::string msg = Prefix(function);
        msg.append("missing required argument '")
            .append(params[i].name)
            .append("' (pos ")
            .append(std::to_string(i + 1))
            .append(")");
        return std::unexpected(Error{ErrorCode::TypeError, std::move(msg)});
      }
    }
    return {};
  }

  Error AnnotateArgumentError(std::string_view function, std::size_t index, std::string_view name, Error error)
  {
    // Exceptions raised by the interpreter itself already carry their own text.
    if (error.IsPythonException())
      return error;
    std::string msg{function};
    msg.append("() argument ")
        .append(std::to_string(index + 1))
        .append(" ('")
        .append(name)
        .append("'): ")
        .append(error.Message());
    return Error{error.Code(), std::move(msg)};
  }

} // namespace NGIN::Python
