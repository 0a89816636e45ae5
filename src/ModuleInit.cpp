#include <NGIN/Python/ModuleInit.hpp>
#include <NGIN/Python/Callback.hpp>

#include <utility>

namespace NGIN::Python::detail
{

  PyObject *InitSinglePhase(PyModuleDef *def, std::string_view location, ModuleBody body) noexcept
  {
    return InvokeCallback<ObjectCallback>(location, [&](GilToken gil) -> std::expected<Owned<Object>, Error>
    {
      auto created = OwnedOrFetch(gil, PyModule_Create(def));
      if (!created)
        return std::unexpected(std::move(created.error()));
      auto module = Downcast<Module>(gil, std::move(*created));
      if (!module)
        return std::unexpected(std::move(module.error()));

      auto populated = body(gil, **module);
      if (!populated)
        return std::unexpected(std::move(populated.error()));
      return std::move(*module).Upcast<Object>();
    });
  }

  int ExecMultiPhase(PyObject *module, std::string_view location, ModuleBody body) noexcept
  {
    return InvokeCallback<StatusCallback>(location, [&](GilToken gil) -> std::expected<void, Error>
    {
      auto view = Downcast<Module>(gil, Borrowed<Object>::FromBorrowedPtr(gil, module));
      if (!view)
        return std::unexpected(std::move(view.error()));
      return body(gil, **view);
    });
  }

  void FillModuleDef(PyModuleDef &def, const ModuleSpec &spec, PyModuleDef_Slot *slots) noexcept
  {
    // Filled once; CPython owns the header after the first import.
    if (def.m_name)
      return;
    // The name and doc come from string literals in the module macros.
    def.m_base = PyModuleDef_HEAD_INIT;
    def.m_name = spec.name.data();
    def.m_doc = spec.doc.empty() ? nullptr : spec.doc.data();
    if (spec.generation == ModuleGeneration::MultiPhase)
    {
      def.m_size = 0;
      def.m_slots = slots;
    }
    else
    {
      // No per-interpreter state; the module cannot be re-initialized.
      def.m_size = -1;
      def.m_slots = nullptr;
    }
  }

} // namespace NGIN::Python::detail
