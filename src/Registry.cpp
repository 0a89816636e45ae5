#include <NGIN/Python/Registry.hpp>

#include <utility>

namespace NGIN::Python::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }

  FunctionRecord &NewFunctionRecord(std::string_view moduleName, std::string_view name, std::string_view doc)
  {
    auto &reg = GetRegistry();
    auto rec = std::make_unique<FunctionRecord>();
    rec->moduleId = ModuleIdOf(moduleName);
    rec->moduleName = std::string{moduleName};
    rec->name = std::string{name};
    rec->qualifiedName = rec->name;
    rec->doc = std::string{doc};
    rec->location = rec->name + "()";

    const auto idx = static_cast<NGIN::UInt32>(reg.functions.Size());
    const auto moduleId = rec->moduleId;
    reg.functions.PushBack(std::move(rec));
    if (auto *list = reg.functionsByModule.GetPtr(moduleId))
    {
      list->PushBack(idx);
    }
    else
    {
      NGIN::Containers::Vector<NGIN::UInt32> v;
      v.PushBack(idx);
      reg.functionsByModule.Insert(moduleId, std::move(v));
    }
    return *reg.functions[idx];
  }

  ClassRecord &ClassRecordFor(NGIN::UInt64 typeId)
  {
    auto &reg = GetRegistry();
    if (auto *p = reg.classByTypeId.GetPtr(typeId))
      return *reg.classes[*p];

    auto rec = std::make_unique<ClassRecord>();
    rec->typeId = typeId;
    const auto idx = static_cast<NGIN::UInt32>(reg.classes.Size());
    reg.classes.PushBack(std::move(rec));
    reg.classByTypeId.Insert(typeId, idx);
    return *reg.classes[idx];
  }

  const ClassRecord *FindClassRecord(NGIN::UInt64 typeId) noexcept
  {
    auto &reg = GetRegistry();
    if (auto *p = reg.classByTypeId.GetPtr(typeId))
      return reg.classes[*p].get();
    return nullptr;
  }

} // namespace NGIN::Python::detail

namespace NGIN::Python
{

  using detail::GetRegistry;

  NGIN::UIntSize ExportedFunctionCount(ModuleId moduleId) noexcept
  {
    auto &reg = GetRegistry();
    if (auto *list = reg.functionsByModule.GetPtr(moduleId))
      return list->Size();
    return 0;
  }

  const detail::FunctionRecord *FindExportedFunction(ModuleId moduleId, std::string_view name) noexcept
  {
    auto &reg = GetRegistry();
    auto *list = reg.functionsByModule.GetPtr(moduleId);
    if (!list)
      return nullptr;
    // Later registrations shadow earlier ones, like repeated setattr on the module.
    for (NGIN::UIntSize i = list->Size(); i > 0; --i)
    {
      const auto &rec = *reg.functions[(*list)[i - 1]];
      if (rec.name == name)
        return &rec;
    }
    return nullptr;
  }

} // namespace NGIN::Python
