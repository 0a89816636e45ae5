// Module.hpp
// Module view: naming, namespace access and registration of functions and classes
#pragma once

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Class.hpp>
#include <NGIN/Python/Convert.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Function.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Handle.hpp>
#include <NGIN/Python/NameUtils.hpp>
#include <NGIN/Python/Object.hpp>
#include <NGIN/Python/Registry.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace NGIN::Python
{

  class NGIN_PYTHON_API Module : public Object
  {
  public:
    static constexpr std::string_view PythonName = "module";
    [[nodiscard]] static bool Check(PyObject *p) noexcept { return PyModule_Check(p); }

    using Object::Object;

    /** A new, empty module object (not inserted into `sys.modules`). */
    [[nodiscard]] static std::expected<Owned<Module>, Error> New(GilToken gil, std::string_view name);

    /** `import name`. */
    [[nodiscard]] static std::expected<Owned<Module>, Error> Import(GilToken gil, std::string_view name);

    /**
     * The module's `__name__`. A missing name yields the pending exception or an
     * AttributeError; bytes that are not valid UTF-8 yield a UnicodeDecodeError.
     */
    [[nodiscard]] std::expected<std::string_view, Error> Name(GilToken gil) const;

    /** The module's `__file__`, in the filesystem encoding; same error rules as `Name`. */
    [[nodiscard]] std::expected<std::string, Error> Filename(GilToken gil) const;

    /** The namespace dict (`__dict__`). */
    [[nodiscard]] Borrowed<NGIN::Python::Dict> GetDict(GilToken gil) const noexcept;

    [[nodiscard]] std::expected<Owned<Object>, Error> Get(GilToken gil, std::string_view name) const
    {
      return GetAttr(gil, name);
    }

    /** `module.name = value` after converting `value` with IntoPython. */
    template <class V>
    [[nodiscard]] std::expected<void, Error> Add(GilToken gil, std::string_view name, V &&value) const
    {
      auto obj = ToPython(gil, std::forward<V>(value));
      if (!obj)
        return std::unexpected(std::move(obj.error()));
      return SetAttr(gil, name, obj->Borrow());
    }

    /** `module.name(*args, **kwargs)`. */
    [[nodiscard]] std::expected<Owned<Object>, Error> Call(GilToken gil, std::string_view name, Borrowed<Tuple> args,
                                                           std::optional<Borrowed<NGIN::Python::Dict>> kwargs = std::nullopt) const;

    using Object::Call;

    /**
     * Adds the type object of `T` under its class name. The first call readies
     * the type; later calls (from any module) reuse it. A failure to ready the
     * type throws FatalError.
     */
    template <BoundClass T>
    [[nodiscard]] std::expected<void, Error> AddClass(GilToken gil) const
    {
      auto moduleName = Name(gil);
      if (!moduleName)
        return std::unexpected(std::move(moduleName.error()));
      const auto type = detail::EnsureClassReady<T>(gil, *moduleName);
      const auto *record = detail::FindClassRecord(detail::TypeIdOf<T>());
      return SetAttr(gil, record->name, type.template Upcast<Object>());
    }

    /** Exports `Fn` as `module.name`; see MakeFunction for `Args`. */
    template <auto Fn, FixedString Args = "">
    [[nodiscard]] std::expected<void, Error> AddFunction(GilToken gil, std::string_view name, std::string_view doc = {}) const
    {
      auto moduleName = Name(gil);
      if (!moduleName)
        return std::unexpected(std::move(moduleName.error()));
      auto fn = MakeFunction<Fn, Args>(gil, *moduleName, name, doc);
      if (!fn)
        return std::unexpected(std::move(fn.error()));
      return SetAttr(gil, name, fn->Borrow());
    }

    /** Exports `Fn` under its C++ name. */
    template <auto Fn, FixedString Args = "">
    [[nodiscard]] std::expected<void, Error> AddFunction(GilToken gil) const
    {
      return AddFunction<Fn, Args>(gil, detail::FunctionNameFromPretty<Fn>());
    }
  };

} // namespace NGIN::Python
