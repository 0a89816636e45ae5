#include <NGIN/Python/Python.hpp>

#include <iostream>
#include <string>

namespace Demo
{
  long long Add(long long a, long long b) { return a + b; }

  std::string Greet(std::string_view name, bool shout)
  {
    std::string out{"Hello, "};
    out.append(name);
    if (shout)
      out.append("!");
    return out;
  }
}

NGIN_PYTHON_MODULE(quickstart, "Functions exported by the QuickStart example", gil, m)
{
  if (auto r = m.AddFunction<&Demo::Add, "a, b=1">(gil, "add", "Adds two integers"); !r)
    return r;
  return m.AddFunction<&Demo::Greet, "name, *, shout=False">(gil, "greet");
}

int main()
{
  using namespace NGIN::Python;
  std::cout << "Library: " << LibraryName() << "\n";

  // Built-in modules must be registered before the interpreter starts.
  PyImport_AppendInittab("quickstart", &PyInit_quickstart);
  Py_Initialize();
  const auto gil = GilToken::AssumeAcquired();

  auto module = Module::Import(gil, "quickstart");
  if (!module)
  {
    std::cerr << "import failed: " << module.error().Describe(gil) << "\n";
    return 1;
  }

  const char *script = "import quickstart\n"
                       "print('add(2, 3) =>', quickstart.add(2, 3))\n"
                       "print('add(41) =>', quickstart.add(41))\n"
                       "print(quickstart.greet('NGIN', shout=True))\n"
                       "try:\n"
                       "    quickstart.add('two')\n"
                       "except TypeError as e:\n"
                       "    print('TypeError:', e)\n";
  if (PyRun_SimpleString(script) != 0)
    return 1;

  // Calling back into the module from C++
  auto a = ToPython(gil, 20);
  auto b = ToPython(gil, 22);
  if (!a || !b)
    return 1;
  auto args = Tuple::New(gil, {a->Borrow(), b->Borrow()});
  if (!args)
    return 1;
  auto sum = (*module)->Call(gil, "add", args->Borrow());
  if (!sum)
  {
    std::cerr << sum.error().Describe(gil) << "\n";
    return 1;
  }
  std::cout << "add(20, 22) from C++ => " << FromPython<long long>::Extract(gil, sum->Borrow()).value_or(0) << "\n";

  return Py_FinalizeEx() < 0 ? 1 : 0;
}
