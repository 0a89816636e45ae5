// ModuleInit.hpp
// Module-initializer synthesis for single-phase and multi-phase (PEP 489) extension modules
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Module.hpp>
#include <NGIN/Python/Registry.hpp>

#include <expected>
#include <string_view>

namespace NGIN::Python
{

  enum class ModuleGeneration : NGIN::UInt8
  {
    SinglePhase, // PyInit_<name> creates and populates the module
    MultiPhase,  // PyInit_<name> returns the definition; Py_mod_exec populates
  };

  struct ModuleSpec
  {
    std::string_view name;
    std::string_view doc;
    ModuleGeneration generation{ModuleGeneration::SinglePhase};

    [[nodiscard]] constexpr ModuleId Id() const noexcept { return ModuleIdOf(name); }
  };

  /** Body of a module initializer: adds functions, classes and values to `module`. */
  using ModuleBody = std::expected<void, Error> (*)(GilToken gil, const Module &module);

  namespace detail
  {
    /**
     * Single-phase initialization. Allocates the module from `def`, runs `body`
     * on it and returns the module, or returns null with the error indicator
     * set; a module whose body failed is released, never returned.
     */
    [[nodiscard]] NGIN_PYTHON_API PyObject *InitSinglePhase(PyModuleDef *def, std::string_view location, ModuleBody body) noexcept;

    /** Py_mod_exec slot of a multi-phase module: 0 on success, -1 with the error set. */
    [[nodiscard]] NGIN_PYTHON_API int ExecMultiPhase(PyObject *module, std::string_view location, ModuleBody body) noexcept;

    /** Fills `def` for `spec`; `slots` is only used by multi-phase modules. */
    NGIN_PYTHON_API void FillModuleDef(PyModuleDef &def, const ModuleSpec &spec, PyModuleDef_Slot *slots) noexcept;
  } // namespace detail

} // namespace NGIN::Python

/**
 * Declares the single-phase extension module `name`:
 *
 *   NGIN_PYTHON_MODULE(demo, "Demo module", gil, m)
 *   {
 *     return m.AddFunction<&AddOne, "x">(gil, "add_one");
 *   }
 *
 * expands to the exported `PyInit_demo` and opens the body
 * `std::expected<void, Error>(GilToken gil, const Module &m)`.
 */
#define NGIN_PYTHON_MODULE(name, doc, gil, module)                                                            \
  static std::expected<void, ::NGIN::Python::Error> NginPythonModuleBody_##name(::NGIN::Python::GilToken gil, \
                                                                                const ::NGIN::Python::Module &module); \
  PyMODINIT_FUNC PyInit_##name(void)                                                                          \
  {                                                                                                           \
    static PyModuleDef def{};                                                                                 \
    ::NGIN::Python::detail::FillModuleDef(                                                                    \
        def, ::NGIN::Python::ModuleSpec{#name, doc, ::NGIN::Python::ModuleGeneration::SinglePhase}, nullptr); \
    return ::NGIN::Python::detail::InitSinglePhase(&def, "PyInit_" #name, &NginPythonModuleBody_##name);      \
  }                                                                                                           \
  static std::expected<void, ::NGIN::Python::Error> NginPythonModuleBody_##name(::NGIN::Python::GilToken gil, \
                                                                                const ::NGIN::Python::Module &module)

/**
 * Multi-phase (PEP 489) variant of NGIN_PYTHON_MODULE. The exported entry point
 * keeps the `PyInit_<name>` spelling; the body runs from the module's
 * `Py_mod_exec` slot.
 */
#define NGIN_PYTHON_MODULE_MULTIPHASE(name, doc, gil, module)                                                 \
  static std::expected<void, ::NGIN::Python::Error> NginPythonModuleBody_##name(::NGIN::Python::GilToken gil, \
                                                                                const ::NGIN::Python::Module &module); \
  static int NginPythonModuleExec_##name(PyObject *m)                                                         \
  {                                                                                                           \
    return ::NGIN::Python::detail::ExecMultiPhase(m, "PyInit_" #name, &NginPythonModuleBody_##name);          \
  }                                                                                                           \
  PyMODINIT_FUNC PyInit_##name(void)                                                                          \
  {                                                                                                           \
    static PyModuleDef_Slot slots[] = {                                                                       \
        {Py_mod_exec, reinterpret_cast<void *>(&NginPythonModuleExec_##name)},                               \
        {0, nullptr},                                                                                         \
    };                                                                                                        \
    static PyModuleDef def{};                                                                                 \
    ::NGIN::Python::detail::FillModuleDef(                                                                    \
        def, ::NGIN::Python::ModuleSpec{#name, doc, ::NGIN::Python::ModuleGeneration::MultiPhase}, slots);    \
    return PyModuleDef_Init(&def);                                                                            \
  }                                                                                                           \
  static std::expected<void, ::NGIN::Python::Error> NginPythonModuleBody_##name(::NGIN::Python::GilToken gil, \
                                                                                const ::NGIN::Python::Module &module)
