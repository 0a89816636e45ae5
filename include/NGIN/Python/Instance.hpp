// Instance.hpp
// Object layout and type-object storage for host classes exposed to the interpreter
#pragma once

#include <NGIN/Python/CApi.hpp>
#include <NGIN/Python/Types.hpp>

#include <concepts>
#include <new>
#include <type_traits>

namespace NGIN::Python
{

  template <class T>
  class ClassBuilder;

  /**
   * A host class is exposed by declaring, next to it (found by ADL):
   *
   *   void NginPython(NGIN::Python::Tag<Point>, NGIN::Python::ClassBuilder<Point> &);
   */
  template <class T>
  concept BoundClass = std::is_class_v<T> && requires(ClassBuilder<T> &b) {
    { NginPython(Tag<T>{}, b) } -> std::same_as<void>;
  };

  namespace detail
  {
    /**
     * Memory layout of a guest instance wrapping a `T`. The value is built in
     * place by `__init__`; `constructed` stays false for objects that only went
     * through `__new__`.
     */
    template <class T>
    struct Instance
    {
      PyObject_HEAD
      alignas(T) unsigned char storage[sizeof(T)];
      bool constructed;

      [[nodiscard]] T &Value() noexcept { return *std::launder(reinterpret_cast<T *>(storage)); }

      void Destroy() noexcept
      {
        if (constructed)
        {
          Value().~T();
          constructed = false;
        }
      }
    };

    /** The single static type object of `T`; zeroed until first registration. */
    template <class T>
    PyTypeObject &TypeStorage() noexcept
    {
      static PyTypeObject type = {PyVarObject_HEAD_INIT(nullptr, 0)};
      return type;
    }

    template <class T>
    [[nodiscard]] bool IsTypeReady() noexcept
    {
      return PyType_HasFeature(&TypeStorage<T>(), Py_TPFLAGS_READY);
    }

    /** The wrapped value when `obj` is a constructed `T` instance, else null. */
    template <class T>
    [[nodiscard]] T *InstanceValue(PyObject *obj) noexcept
    {
      if (!IsTypeReady<T>() || !PyObject_TypeCheck(obj, &TypeStorage<T>()))
        return nullptr;
      auto *inst = reinterpret_cast<Instance<T> *>(obj);
      return inst->constructed ? &inst->Value() : nullptr;
    }
  } // namespace detail

} // namespace NGIN::Python
