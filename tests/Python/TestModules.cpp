// TestModules.cpp - extension modules compiled into the test binary

#include "TestModules.hpp"

#include <cmath>
#include <cstdint>
#include <string>

using namespace NGIN::Python;

namespace DemoModule
{
  int Counter::builderRuns = 0;
  int Point::builderRuns = 0;
  int tallyCalls = 0;

  long long AddOne(long long x) { return x + 1; }

  std::string Greet(std::string_view name, std::string_view greeting, bool shout)
  {
    std::string out{greeting};
    out.append(", ").append(name);
    if (shout)
    {
      for (auto &c : out)
        if (c >= 'a' && c <= 'z')
          c = static_cast<char>(c - 'a' + 'A');
      out.push_back('!');
    }
    return out;
  }

  double Scale(double value, double factor) { return value * factor; }

  long long CountArgs(GilToken, long long first, Borrowed<Tuple> rest, std::optional<Borrowed<Dict>> options)
  {
    return first + rest->Size() * 10 + (options ? (*options)->Size() * 100 : 0);
  }

  std::expected<long long, Error> Divide(long long a, long long b)
  {
    if (b == 0)
      return std::unexpected(Error{ErrorCode::ValueError, "division by zero"});
    return a / b;
  }

  std::optional<long long> Half(long long x)
  {
    if (x % 2 != 0)
      return std::nullopt;
    return x / 2;
  }

  int Narrow(std::int8_t v) { return v; }

  std::optional<std::string> Describe(std::optional<long long> value)
  {
    if (!value)
      return std::nullopt;
    return std::to_string(*value);
  }

  Owned<Object> Identity(GilToken, Borrowed<Object> obj) { return obj.ClaimOwnership(); }

  void Nothing() {}

  // Sets an error indicator but reports success; the entry point must turn this into the error.
  long long LeaksError(GilToken)
  {
    PyErr_SetString(PyExc_RuntimeError, "pending error");
    return 1;
  }

  long long Tally(long long x, long long y)
  {
    ++tallyCalls;
    return x + y;
  }

  Counter::Counter(long long start, long long step) : m_value(start), m_step(step) {}

  long long Counter::Next()
  {
    m_value += m_step;
    return m_value;
  }

  void Counter::Reset(long long to) { m_value = to; }

  Counter Counter::StartingAt(long long start) { return Counter{start, 1}; }

  void NginPython(Tag<Counter>, ClassBuilder<Counter> &b)
  {
    ++Counter::builderRuns;
    b.Name("Counter");
    b.Doc("Counts upwards in fixed steps");
    b.Constructor<"start=0, step=1", long long, long long>();
    b.Method<&Counter::Next>("next");
    b.Method<&Counter::Value>("value");
    b.Method<&Counter::Reset, "to=0">("reset");
    b.StaticMethod<&Counter::StartingAt, "start">("starting_at");
  }

  double Point::Distance(const Point &other) const
  {
    return std::hypot(x - other.x, y - other.y);
  }

  Point Point::Midpoint(const Point &other) const
  {
    return Point{(x + other.x) / 2.0, (y + other.y) / 2.0};
  }

  void NginPython(Tag<Point>, ClassBuilder<Point> &b)
  {
    ++Point::builderRuns;
    b.Constructor<"x, y", double, double>();
    b.Method<&Point::Distance, "other">("distance");
    b.Method<&Point::Midpoint, "other">("midpoint");
    b.Method<&Point::X>("x");
    b.Method<&Point::Y>("y");
  }

  double Length(const Point &p) { return std::hypot(p.x, p.y); }

  // A class the broken module tries to add after Counter.
  void NginPython(Tag<Unnamed>, ClassBuilder<Unnamed> &b) { b.Name("Unnamed"); }
} // namespace DemoModule

NGIN_PYTHON_MODULE(demo, "Demo module used by the binding tests", gil, m)
{
  using namespace DemoModule;
  if (auto r = m.AddFunction<&AddOne, "x">(gil, "add_one", "Returns x + 1"); !r)
    return r;
  if (auto r = m.AddFunction<&Greet, "name, greeting='Hello', *, shout=False">(gil, "greet"); !r)
    return r;
  if (auto r = m.AddFunction<&Scale, "value, factor=2.0">(gil, "scale"); !r)
    return r;
  if (auto r = m.AddFunction<&CountArgs, "first, *rest, **options">(gil, "count_args"); !r)
    return r;
  if (auto r = m.AddFunction<&Divide, "a, b">(gil, "divide"); !r)
    return r;
  if (auto r = m.AddFunction<&Half, "x">(gil, "half"); !r)
    return r;
  if (auto r = m.AddFunction<&Narrow, "v">(gil, "narrow"); !r)
    return r;
  if (auto r = m.AddFunction<&Describe, "value=None">(gil, "describe"); !r)
    return r;
  if (auto r = m.AddFunction<&Identity, "obj">(gil, "identity"); !r)
    return r;
  if (auto r = m.AddFunction<&Nothing>(gil, "nothing"); !r)
    return r;
  if (auto r = m.AddFunction<&LeaksError>(gil, "leaks_error"); !r)
    return r;
  if (auto r = m.AddFunction<&Tally, "x, y=0">(gil, "tally"); !r)
    return r;
  if (auto r = m.AddFunction<&Length, "p">(gil); !r)
    return r;
  if (auto r = m.AddClass<Counter>(gil); !r)
    return r;
  if (auto r = m.AddClass<Point>(gil); !r)
    return r;
  return m.Add(gil, "VERSION", std::string_view{"1.0"});
}

NGIN_PYTHON_MODULE_MULTIPHASE(demo_multiphase, "Multi-phase variant of the demo module", gil, m)
{
  using namespace DemoModule;
  if (auto r = m.AddFunction<&AddOne, "x">(gil, "add_one"); !r)
    return r;
  if (auto r = m.AddClass<Point>(gil); !r)
    return r;
  return m.Add(gil, "ANSWER", 42);
}

// Registering the second class fails: without __name__ the class cannot be qualified.
NGIN_PYTHON_MODULE(broken, "", gil, m)
{
  using namespace DemoModule;
  if (auto r = m.AddClass<Counter>(gil); !r)
    return r;
  if (PyDict_DelItemString(m.GetDict(gil).Get(), "__name__") < 0)
    return std::unexpected(Error::Fetch(gil));
  return m.AddClass<Unnamed>(gil);
}
