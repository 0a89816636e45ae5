// Function.hpp
// Entry-point synthesis for exported host functions
#pragma once

#include <NGIN/Python/ArgParse.hpp>
#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Callback.hpp>
#include <NGIN/Python/Convert.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/NameUtils.hpp>
#include <NGIN/Python/Registry.hpp>
#include <NGIN/Python/Signature.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Python
{

  namespace detail
  {
    /**
     * Binds `args`/`kwargs` against `Spec`, calls `call` with the converted
     * values (prefixed by the token when the callable declares one) and
     * converts the result. `void` results become `None`.
     */
    template <class Spec, class Call>
    std::expected<Owned<Object>, Error> BindAndInvoke(GilToken gil, std::string_view function,
                                                      PyObject *args, PyObject *kwargs, Call &&call)
    {
      const auto argsView = Borrowed<Tuple>::FromBorrowedPtr(gil, args);
      std::optional<Borrowed<Dict>> kwargsView;
      if (kwargs)
        kwargsView.emplace(Borrowed<Dict>::FromBorrowedPtr(gil, kwargs));

      VariadicArguments extra;
      auto values = ExtractArguments<Spec>(gil, function, argsView, kwargsView, extra);
      if (!values)
        return std::unexpected(std::move(values.error()));

      auto invoke = [&]() -> decltype(auto)
      {
        return std::apply(
            [&](auto &&...v) -> decltype(auto)
            {
              if constexpr (Spec::Flags.takesGil)
                return call(gil, std::forward<decltype(v)>(v)...);
              else
                return call(std::forward<decltype(v)>(v)...);
            },
            std::move(*values));
      };

      if constexpr (std::is_void_v<typename Spec::Return>)
      {
        invoke();
        return None(gil).ClaimOwnership();
      }
      else
      {
        return ToPython(gil, invoke());
      }
    }

    inline PyCFunction AsMethodPointer(PyCFunctionWithKeywords fn) noexcept
    {
      // METH_KEYWORDS entries are stored in the PyCFunction slot.
      return reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)()>(fn));
    }

    inline const FunctionRecord *RecordFromSelf(PyObject *self) noexcept
    {
      return static_cast<const FunctionRecord *>(PyCapsule_GetPointer(self, kFunctionCapsuleName));
    }

    template <auto Fn, FixedString Args>
    PyObject *FunctionEntry(PyObject *self, PyObject *args, PyObject *kwargs) noexcept
    {
      using Spec = SignatureOf<Fn, Args>;
      const FunctionRecord *record = RecordFromSelf(self);
      const std::string_view location = record ? std::string_view{record->location} : FunctionNameFromPretty<Fn>();
      return InvokeCallback<ObjectCallback>(location, [&](GilToken gil) -> std::expected<Owned<Object>, Error>
      {
        if (!record)
          return std::unexpected(Error::Fetch(gil));
        return BindAndInvoke<Spec>(gil, record->qualifiedName, args, kwargs,
                                   [](auto &&...a) -> decltype(auto)
                                   { return std::invoke(Fn, std::forward<decltype(a)>(a)...); });
      });
    }
  } // namespace detail

  /**
   * Creates the guest function object for `Fn`.
   *
   * `Args` is the argument-attribute string (`"x, y=1, *, flag=False"`); it
   * must name every guest-visible parameter. The function's `__module__` is
   * `moduleName` (left unset when empty). Name, doc and method table are kept
   * in the binding registry for the lifetime of the process.
   */
  template <auto Fn, FixedString Args = "">
  [[nodiscard]] std::expected<Owned<Object>, Error> MakeFunction(GilToken gil, std::string_view moduleName,
                                                                 std::string_view name, std::string_view doc = {})
  {
    static_assert(std::is_pointer_v<decltype(Fn)> && std::is_function_v<std::remove_pointer_t<decltype(Fn)>>,
                  "MakeFunction expects a pointer to a free function or static member function");
    // Parsing the signature here reports attribute errors at the export site.
    [[maybe_unused]] constexpr auto flags = SignatureOf<Fn, Args>::Flags;

    auto &record = detail::NewFunctionRecord(moduleName, name, doc);
    record.def.ml_name = record.name.c_str();
    record.def.ml_meth = detail::AsMethodPointer(&detail::FunctionEntry<Fn, Args>);
    record.def.ml_flags = METH_VARARGS | METH_KEYWORDS;
    record.def.ml_doc = record.doc.empty() ? nullptr : record.doc.c_str();

    auto capsule = OwnedOrFetch(gil, PyCapsule_New(&record, detail::kFunctionCapsuleName, nullptr));
    if (!capsule)
      return std::unexpected(std::move(capsule.error()));

    std::optional<Owned<Str>> module;
    if (!moduleName.empty())
    {
      auto str = Str::New(gil, moduleName);
      if (!str)
        return std::unexpected(std::move(str.error()));
      module.emplace(std::move(*str));
    }
    return OwnedOrFetch(gil, PyCFunction_NewEx(&record.def, capsule->Get(), module ? module->Get() : nullptr));
  }

} // namespace NGIN::Python
