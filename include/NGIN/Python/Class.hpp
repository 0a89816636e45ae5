// Class.hpp
// ClassBuilder and the lazily readied type object of a bound host class
#pragma once

#include <NGIN/Meta/TypeName.hpp>

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Callback.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/Function.hpp>
#include <NGIN/Python/Instance.hpp>
#include <NGIN/Python/NameUtils.hpp>
#include <NGIN/Python/Registry.hpp>
#include <NGIN/Python/Signature.hpp>

#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Python
{

  namespace detail
  {
    // Record of a method entry point, one per (bound class, member, attribute string).
    template <class T, auto M, FixedString Args>
    struct MethodSlot
    {
      static inline const FunctionRecord *record = nullptr;
    };

    template <class T>
    Error NotAnInstance(std::string_view method, PyObject *self)
    {
      if (self && PyObject_TypeCheck(self, &TypeStorage<T>()))
        return Error{ErrorCode::RuntimeError, std::string{BoundClassName<T>()} + " object is not initialized"};
      std::string msg{"descriptor '"};
      msg.append(method).append("' requires a '").append(BoundClassName<T>()).append("' object");
      if (self)
        msg.append(" but received a '").append(Py_TYPE(self)->tp_name).append("'");
      return Error{ErrorCode::TypeError, std::move(msg)};
    }

    template <class T, auto M, FixedString Args>
    PyObject *MethodEntry(PyObject *self, PyObject *args, PyObject *kwargs) noexcept
    {
      using Spec = typename SignatureFromPointer<FunctionKind::Method, Args, decltype(M)>::type;
      const FunctionRecord *record = MethodSlot<T, M, Args>::record;
      const std::string_view location = record ? std::string_view{record->location} : FunctionNameFromPretty<M>();
      return InvokeCallback<ObjectCallback>(location, [&](GilToken gil) -> std::expected<Owned<Object>, Error>
      {
        if (!record)
          return std::unexpected(Error{ErrorCode::SystemError, "method called before its class was registered"});
        T *value = InstanceValue<T>(self);
        if (!value)
          return std::unexpected(NotAnInstance<T>(record->name, self));
        return BindAndInvoke<Spec>(gil, record->qualifiedName, args, kwargs,
                                   [value](auto &&...a) -> decltype(auto)
                                   { return std::invoke(M, *value, std::forward<decltype(a)>(a)...); });
      });
    }

    template <class T, auto F, FixedString Args>
    PyObject *StaticMethodEntry(PyObject *, PyObject *args, PyObject *kwargs) noexcept
    {
      using Spec = SignatureOf<F, Args, FunctionKind::StaticMethod>;
      const FunctionRecord *record = MethodSlot<T, F, Args>::record;
      const std::string_view location = record ? std::string_view{record->location} : FunctionNameFromPretty<F>();
      return InvokeCallback<ObjectCallback>(location, [&](GilToken gil) -> std::expected<Owned<Object>, Error>
      {
        if (!record)
          return std::unexpected(Error{ErrorCode::SystemError, "method called before its class was registered"});
        return BindAndInvoke<Spec>(gil, record->qualifiedName, args, kwargs,
                                   [](auto &&...a) -> decltype(auto)
                                   { return std::invoke(F, std::forward<decltype(a)>(a)...); });
      });
    }

    // tp_init: (re)constructs the wrapped value in place.
    template <class T, class Spec>
    int InitEntry(PyObject *self, PyObject *args, PyObject *kwargs) noexcept
    {
      const ClassRecord *record = FindClassRecord(TypeIdOf<T>());
      const std::string_view location = record ? std::string_view{record->initLocation} : std::string_view{"__init__()"};
      return InvokeCallback<StatusCallback>(location, [&](GilToken gil) -> std::expected<void, Error>
      {
        const auto argsView = Borrowed<Tuple>::FromBorrowedPtr(gil, args);
        std::optional<Borrowed<Dict>> kwargsView;
        if (kwargs)
          kwargsView.emplace(Borrowed<Dict>::FromBorrowedPtr(gil, kwargs));

        VariadicArguments extra;
        const std::string_view function = record ? std::string_view{record->name} : std::string_view{"__init__"};
        auto values = ExtractArguments<Spec>(gil, function, argsView, kwargsView, extra);
        if (!values)
          return std::unexpected(std::move(values.error()));

        auto *inst = reinterpret_cast<Instance<T> *>(self);
        inst->Destroy();
        std::apply([&](auto &&...v)
                   { ::new (static_cast<void *>(inst->storage)) T(std::forward<decltype(v)>(v)...); },
                   std::move(*values));
        inst->constructed = true;
        return {};
      });
    }

    template <class T>
    void DeallocEntry(PyObject *self) noexcept
    {
      reinterpret_cast<Instance<T> *>(self)->Destroy();
      Py_TYPE(self)->tp_free(self);
    }
  } // namespace detail

  /**
   * Describes a host class to the interpreter. Instances are handed to the
   * ADL hook `NginPython(Tag<T>, ClassBuilder<T>&)` exactly once, the first
   * time the class is added to a module.
   *
   *   friend void NginPython(Tag<Point>, ClassBuilder<Point> &b)
   *   {
   *     b.Name("Point");
   *     b.Constructor<"x=0.0, y=0.0", double, double>();
   *     b.Method<&Point::Norm>("norm");
   *   }
   */
  template <class T>
  class ClassBuilder
  {
  public:
    explicit ClassBuilder(detail::ClassRecord &record) noexcept : m_record(&record) {}

    /** Guest-visible class name; defaults to the unqualified C++ name. */
    ClassBuilder &Name(std::string_view name)
    {
      m_record->name = std::string{name};
      return *this;
    }

    ClassBuilder &Doc(std::string_view doc)
    {
      m_record->doc = std::string{doc};
      return *this;
    }

    /** Constructor `T(A...)`, exposed as `__init__`. A later call replaces an earlier one. */
    template <FixedString Args, class... A>
    ClassBuilder &Constructor()
    {
      static_assert(std::is_constructible_v<T, A...>, "no matching constructor for the declared argument types");
      using Spec = ConstructorSignature<Args, A...>;
      static_assert(!Spec::Flags.takesGil, "constructors cannot take a GilToken");
      m_record->init = &detail::InitEntry<T, Spec>;
      return *this;
    }

    /** Instance method; the name defaults to the C++ member name. */
    template <auto M, FixedString Args = "">
    ClassBuilder &Method(std::string_view name = detail::FunctionNameFromPretty<M>(), std::string_view doc = {})
    {
      using Ptr = detail::SignatureFromPointer<FunctionKind::Method, Args, decltype(M)>;
      static_assert(std::is_member_function_pointer_v<decltype(M)>, "Method expects a pointer to member function");
      static_assert(std::is_base_of_v<typename Ptr::Class, T>, "method does not belong to the bound class");
      [[maybe_unused]] constexpr auto flags = Ptr::type::Flags;

      auto &rec = AddRecord(detail::MethodSlot<T, M, Args>::record, name, doc);
      AddMethodDef(rec, detail::AsMethodPointer(&detail::MethodEntry<T, M, Args>), METH_VARARGS | METH_KEYWORDS);
      return *this;
    }

    /** Static method (`METH_STATIC`); `F` is a free or static member function. */
    template <auto F, FixedString Args = "">
    ClassBuilder &StaticMethod(std::string_view name = detail::FunctionNameFromPretty<F>(), std::string_view doc = {})
    {
      static_assert(std::is_pointer_v<decltype(F)>, "StaticMethod expects a function pointer");
      [[maybe_unused]] constexpr auto flags = SignatureOf<F, Args, FunctionKind::StaticMethod>::Flags;

      auto &rec = AddRecord(detail::MethodSlot<T, F, Args>::record, name, doc);
      AddMethodDef(rec, detail::AsMethodPointer(&detail::StaticMethodEntry<T, F, Args>),
                   METH_VARARGS | METH_KEYWORDS | METH_STATIC);
      return *this;
    }

  private:
    // The entry point finds its record through `slot`, so one callable can back
    // only one method name per class.
    detail::FunctionRecord &AddRecord(const detail::FunctionRecord *&slot, std::string_view name, std::string_view doc)
    {
      if (slot)
        throw FatalError("cannot bind " + m_record->name + "." + std::string{name} + ": the same callable is already bound as " +
                         m_record->name + "." + slot->name);
      auto rec = std::make_unique<detail::FunctionRecord>();
      rec->name = std::string{name};
      rec->doc = std::string{doc};
      auto &ref = *rec;
      m_record->methodRecords.PushBack(std::move(rec));
      slot = &ref;
      return ref;
    }

    void AddMethodDef(const detail::FunctionRecord &rec, PyCFunction fn, int flags)
    {
      PyMethodDef def{};
      def.ml_name = rec.name.c_str();
      def.ml_meth = fn;
      def.ml_flags = flags;
      def.ml_doc = rec.doc.empty() ? nullptr : rec.doc.c_str();
      m_record->methods.PushBack(def);
    }

    detail::ClassRecord *m_record;
  };

  namespace detail
  {
    /**
     * Returns the type object of `T`, running first-time initialization when it
     * is not ready yet. Initialization runs the ADL hook, builds the method
     * table and calls `PyType_Ready`. A rejected binding or a failure there
     * leaves a type that cannot be retried and is reported as `FatalError`.
     */
    template <BoundClass T>
    Borrowed<TypeObject> EnsureClassReady(GilToken gil, std::string_view moduleName)
    {
      PyTypeObject &type = TypeStorage<T>();
      if (PyType_HasFeature(&type, Py_TPFLAGS_READY))
        return Borrowed<TypeObject>::FromBorrowedPtr(gil, reinterpret_cast<PyObject *>(&type));

      auto &record = ClassRecordFor(TypeIdOf<T>());
      record.moduleId = ModuleIdOf(moduleName);
      record.name = std::string{NGIN::Meta::TypeName<T>::unqualifiedName};

      ClassBuilder<T> builder{record};
      NginPython(Tag<T>{}, builder);

      record.qualifiedName = moduleName.empty() ? record.name : std::string{moduleName} + "." + record.name;
      record.initLocation = record.name + ".__init__()";
      for (NGIN::UIntSize i = 0; i < record.methodRecords.Size(); ++i)
      {
        auto &method = *record.methodRecords[i];
        method.moduleId = record.moduleId;
        method.moduleName = std::string{moduleName};
        method.qualifiedName = record.name + "." + method.name;
        method.location = method.qualifiedName + "()";
      }
      record.methods.PushBack(PyMethodDef{nullptr, nullptr, 0, nullptr});

      type.tp_name = record.qualifiedName.c_str();
      type.tp_doc = record.doc.empty() ? nullptr : record.doc.c_str();
      type.tp_basicsize = static_cast<Py_ssize_t>(sizeof(Instance<T>));
      type.tp_itemsize = 0;
      type.tp_flags = Py_TPFLAGS_DEFAULT;
#if PY_VERSION_HEX >= 0x030A0000
      if (!record.init)
        type.tp_flags |= Py_TPFLAGS_DISALLOW_INSTANTIATION;
#endif
      type.tp_methods = &record.methods[0];
      type.tp_init = record.init;
      // Without a constructor instances only come from host code (IntoPython).
      type.tp_new = record.init ? PyType_GenericNew : nullptr;
      type.tp_dealloc = &DeallocEntry<T>;

      if (PyType_Ready(&type) < 0)
      {
        const Error error = Error::Fetch(gil);
        throw FatalError("failed to initialize type object " + record.qualifiedName + ": " + error.Describe(gil));
      }
      return Borrowed<TypeObject>::FromBorrowedPtr(gil, reinterpret_cast<PyObject *>(&type));
    }
  } // namespace detail

} // namespace NGIN::Python
