#include <catch2/catch_test_macros.hpp>

#include <NGIN/Python/Python.hpp>

#include <cstdint>
#include <string>

#if defined(_WIN32)
#include <windows.h>
using LibHandle = HMODULE;
static LibHandle OpenLib(const char *path) { return LoadLibraryA(path); }
static void *GetSym(LibHandle h, const char *name)
{
  return (void *)GetProcAddress(h, name);
}
static void CloseLib(LibHandle h)
{
  if (h)
    FreeLibrary(h);
}
static std::string GetExeDir()
{
  char buf[MAX_PATH];
  DWORD n = GetModuleFileNameA(nullptr, buf, MAX_PATH);
  std::string s(buf, buf + n);
  auto p = s.find_last_of("/\\");
  return (p == std::string::npos) ? std::string{"."} : s.substr(0, p);
}
#elif defined(__APPLE__)
#include <dlfcn.h>
#include <mach-o/dyld.h>
using LibHandle = void *;
static LibHandle OpenLib(const char *path) { return dlopen(path, RTLD_LAZY | RTLD_LOCAL); }
static void *GetSym(LibHandle h, const char *name) { return dlsym(h, name); }
static void CloseLib(LibHandle h)
{
  if (h)
    dlclose(h);
}
static std::string GetExeDir()
{
  uint32_t size = 0;
  _NSGetExecutablePath(nullptr, &size);
  std::string tmp(size, '\0');
  _NSGetExecutablePath(tmp.data(), &size);
  auto p = tmp.find_last_of('/');
  return (p == std::string::npos) ? std::string{"."} : tmp.substr(0, p);
}
#else
#include <dlfcn.h>
#include <unistd.h>
using LibHandle = void *;
static LibHandle OpenLib(const char *path) { return dlopen(path, RTLD_LAZY | RTLD_LOCAL); }
static void *GetSym(LibHandle h, const char *name) { return dlsym(h, name); }
static void CloseLib(LibHandle h)
{
  if (h)
    dlclose(h);
}
static std::string GetExeDir()
{
  char buf[4096];
  ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf));
  if (n <= 0)
    return ".";
  std::string s(buf, buf + n);
  auto p = s.find_last_of('/');
  return (p == std::string::npos) ? std::string{"."} : s.substr(0, p);
}
#endif

// File names of the extension modules, provided by the build.
#ifndef NGIN_PYTHON_INTEROP_A_FILE
#error "NGIN_PYTHON_INTEROP_A_FILE must name the interop_a extension file"
#endif
#ifndef NGIN_PYTHON_INTEROP_B_FILE
#error "NGIN_PYTHON_INTEROP_B_FILE must name the interop_b extension file"
#endif

using namespace NGIN::Python;

namespace
{
  struct LibGuard
  {
    explicit LibGuard(LibHandle h = nullptr) : handle(h) {}
    ~LibGuard() { CloseLib(handle); }

    LibGuard(const LibGuard &) = delete;
    LibGuard &operator=(const LibGuard &) = delete;

    LibGuard(LibGuard &&other) noexcept : handle(other.handle)
    {
      other.handle = nullptr;
    }
    LibGuard &operator=(LibGuard &&other) noexcept
    {
      if (this != &other)
      {
        CloseLib(handle);
        handle = other.handle;
        other.handle = nullptr;
      }
      return *this;
    }

    LibHandle handle{nullptr};
  };

  // The interpreter lives until process exit; extension modules are never unloaded.
  GilToken EnsureInterpreter()
  {
    if (!Py_IsInitialized())
      Py_Initialize();
    return GilToken::AssumeAcquired();
  }

  std::expected<Owned<Object>, Error> Run(GilToken gil, const std::string &expr)
  {
    PyObject *main = PyImport_AddModule("__main__");
    PyObject *globals = PyModule_GetDict(main);
    return OwnedOrFetch(gil, PyRun_String(expr.c_str(), Py_eval_input, globals, globals));
  }

  long long RunInt(GilToken gil, const std::string &expr)
  {
    auto out = Run(gil, expr);
    INFO(expr);
    REQUIRE(out.has_value());
    auto v = FromPython<long long>::Extract(gil, out->Borrow());
    REQUIRE(v.has_value());
    return *v;
  }

  void AddExeDirToPath(GilToken gil)
  {
    auto sys = Module::Import(gil, "sys");
    REQUIRE(sys.has_value());
    auto path = (*sys)->Get(gil, "path");
    REQUIRE(path.has_value());
    auto dir = ToPython(gil, GetExeDir());
    REQUIRE(dir.has_value());
    REQUIRE(PyList_Insert(path->Get(), 0, dir->Get()) == 0);
  }
} // namespace

TEST_CASE("ExtensionFilesExportTheirInitFunctions", "[python][Interop]")
{
  auto dir = GetExeDir();
  auto aPath = dir + "/" + NGIN_PYTHON_INTEROP_A_FILE;
  auto bPath = dir + "/" + NGIN_PYTHON_INTEROP_B_FILE;

  // The interpreter symbols must be resolvable before the extensions are opened.
  EnsureInterpreter();

  LibGuard a{OpenLib(aPath.c_str())};
  LibGuard b{OpenLib(bPath.c_str())};
  INFO("load A from " << aPath);
  REQUIRE(a.handle != nullptr);
  INFO("load B from " << bPath);
  REQUIRE(b.handle != nullptr);

  CHECK(GetSym(a.handle, "PyInit_interop_a") != nullptr);
  CHECK(GetSym(b.handle, "PyInit_interop_b") != nullptr);
}

TEST_CASE("ImportsExtensionsFromDisk", "[python][Interop]")
{
  const auto gil = EnsureInterpreter();
  AddExeDirToPath(gil);

  auto a = Module::Import(gil, "interop_a");
  INFO("import interop_a");
  REQUIRE(a.has_value());
  auto b = Module::Import(gil, "interop_b");
  INFO("import interop_b");
  REQUIRE(b.has_value());

  auto fileA = (*a)->Filename(gil);
  REQUIRE(fileA.has_value());
  CHECK(fileA->find(NGIN_PYTHON_INTEROP_A_FILE) != std::string::npos);

  CHECK(RunInt(gil, "__import__('interop_a').Adder().add(2, 3)") == 5);
  CHECK(RunInt(gil, "__import__('interop_a').Adder(offset=10).add(y=2, x=3)") == 15);
  CHECK(RunInt(gil, "__import__('interop_b').Multiplier(3).mul(2)") == 6);
  CHECK(RunInt(gil, "__import__('interop_b').label('item', 2) == 'item#2'") == 1);
  CHECK(RunInt(gil, "__import__('interop_b').label('item') == 'item'") == 1);
  CHECK(RunInt(gil, "__import__('interop_a').Adder.__module__ == 'interop_a'") == 1);
}

TEST_CASE("ErrorsCrossTheExtensionBoundary", "[python][Interop]")
{
  const auto gil = EnsureInterpreter();
  AddExeDirToPath(gil);

  CHECK(RunInt(gil, "__import__('interop_a').checked(4)") == 4);

  auto failed = Run(gil, "__import__('interop_a').checked(-1)");
  REQUIRE_FALSE(failed.has_value());
  CHECK(failed.error().Matches(gil, PyExc_ValueError));
  CHECK(failed.error().Describe(gil) == "ValueError: negative value");

  auto wrongType = Run(gil, "__import__('interop_b').Multiplier('x')");
  REQUIRE_FALSE(wrongType.has_value());
  CHECK(wrongType.error().Describe(gil) == "TypeError: Multiplier() argument 1 ('factor'): expected int, got str");
}
