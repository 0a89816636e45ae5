// Registry.hpp
// Process-lifetime storage for the method tables and names handed to the interpreter
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Types.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace NGIN::Python
{

  /** Stable identifier of a guest module, derived from its name. */
  [[nodiscard]] constexpr ModuleId ModuleIdOf(std::string_view moduleName) noexcept
  {
    return NGIN::Hashing::FNV1a64(moduleName.data(), moduleName.size());
  }

  namespace detail
  {
    // Compute FNV-based type id for a host type
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    /**
     * One exported callable. CPython keeps raw pointers to `def` and to the
     * name/doc characters for as long as the function object lives, so
     * records are never freed or moved once created.
     */
    struct FunctionRecord
    {
      ModuleId moduleId{0};
      std::string moduleName;
      std::string name;
      std::string qualifiedName; // "name" or "Class.name", used in argument errors
      std::string doc;
      std::string location; // "name()" as printed by boundary diagnostics
      PyMethodDef def{};
    };

    struct ClassRecord
    {
      ModuleId moduleId{0};
      NGIN::UInt64 typeId{0};
      std::string name;
      std::string qualifiedName; // "module.Name", used as tp_name
      std::string doc;
      std::string initLocation;  // "Name.__init__()"
      initproc init{nullptr};
      // Terminated by a zeroed entry once the type is readied.
      NGIN::Containers::Vector<PyMethodDef> methods;
      NGIN::Containers::Vector<std::unique_ptr<FunctionRecord>> methodRecords;
    };

    struct Registry
    {
      NGIN::Containers::Vector<std::unique_ptr<FunctionRecord>> functions;
      NGIN::Containers::FlatHashMap<ModuleId, NGIN::Containers::Vector<NGIN::UInt32>> functionsByModule;
      NGIN::Containers::Vector<std::unique_ptr<ClassRecord>> classes;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> classByTypeId;
    };

    NGIN_PYTHON_API Registry &GetRegistry() noexcept;

    /** Creates a module-level function record; `def` is filled by the caller. */
    NGIN_PYTHON_API FunctionRecord &NewFunctionRecord(std::string_view moduleName, std::string_view name, std::string_view doc);

    /** Returns the record for `typeId`, creating an empty one on first use. */
    NGIN_PYTHON_API ClassRecord &ClassRecordFor(NGIN::UInt64 typeId);

    [[nodiscard]] NGIN_PYTHON_API const ClassRecord *FindClassRecord(NGIN::UInt64 typeId) noexcept;

    /** Capsule name carried by the `self` slot of every exported function. */
    inline constexpr const char *kFunctionCapsuleName = "NGIN.Python.FunctionRecord";
  } // namespace detail

  // Lookup helpers, mainly for diagnostics and tests
  [[nodiscard]] NGIN_PYTHON_API NGIN::UIntSize ExportedFunctionCount(ModuleId moduleId) noexcept;
  [[nodiscard]] NGIN_PYTHON_API const detail::FunctionRecord *FindExportedFunction(ModuleId moduleId, std::string_view name) noexcept;

  template <class T>
  [[nodiscard]] inline bool IsClassRegistered()
  {
    return detail::FindClassRecord(detail::TypeIdOf<T>()) != nullptr;
  }

} // namespace NGIN::Python
