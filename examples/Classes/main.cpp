#include <NGIN/Python/Python.hpp>

#include <cmath>
#include <iostream>

namespace Demo
{
  struct Vec2
  {
    double x{0.0};
    double y{0.0};

    Vec2(double px, double py) : x(px), y(py) {}

    double Length() const { return std::hypot(x, y); }
    Vec2 Scaled(double factor) const { return Vec2{x * factor, y * factor}; }
    void Translate(double dx, double dy)
    {
      x += dx;
      y += dy;
    }
    static Vec2 Zero() { return Vec2{0.0, 0.0}; }

    friend void NginPython(NGIN::Python::Tag<Vec2>, NGIN::Python::ClassBuilder<Vec2> &b)
    {
      b.Name("Vec2");
      b.Doc("Two-component vector");
      b.Constructor<"x=0.0, y=0.0", double, double>();
      b.Method<&Vec2::Length>("length");
      b.Method<&Vec2::Scaled, "factor">("scaled");
      b.Method<&Vec2::Translate, "dx, dy=0.0">("translate");
      b.StaticMethod<&Vec2::Zero>("zero");
    }
  };
}

NGIN_PYTHON_MODULE_MULTIPHASE(geometry, "Classes example", gil, m)
{
  return m.AddClass<Demo::Vec2>(gil);
}

int main()
{
  PyImport_AppendInittab("geometry", &PyInit_geometry);
  Py_Initialize();

  const char *script = "from geometry import Vec2\n"
                       "v = Vec2(3, 4)\n"
                       "print('length =>', v.length())\n"
                       "w = v.scaled(2)\n"
                       "w.translate(1)\n"
                       "print('scaled+translated length =>', round(w.length(), 3))\n"
                       "print('zero =>', Vec2.zero().length())\n"
                       "print(Vec2.__doc__)\n";
  const int status = PyRun_SimpleString(script);
  if (Py_FinalizeEx() < 0)
    return 1;
  return status == 0 ? 0 : 1;
}
