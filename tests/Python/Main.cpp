// Main.cpp - test runner hosting an embedded interpreter

#include <catch2/catch_session.hpp>

#include "TestSupport.hpp"

int main(int argc, char *argv[])
{
  // Built-in modules must be registered before the interpreter starts.
  PyImport_AppendInittab("demo", &PyInit_demo);
  PyImport_AppendInittab("demo_multiphase", &PyInit_demo_multiphase);
  PyImport_AppendInittab("broken", &PyInit_broken);
  Py_Initialize();

  const int result = Catch::Session().run(argc, argv);

  if (Py_FinalizeEx() < 0)
    return result == 0 ? 120 : result;
  return result;
}
