#include <cstdlib>
#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Python/Python.hpp>

using namespace NGIN;

namespace BenchDemo
{
  template <class T>
  T OrDie(Python::GilToken gil, std::expected<T, Python::Error> result)
  {
    if (!result)
    {
      std::cerr << result.error().Describe(gil) << "\n";
      std::exit(1);
    }
    return std::move(*result);
  }

  long long Add(long long a, long long b) { return a + b; }

  struct Acc
  {
    long long total{0};
    long long Push(long long v) { return total += v; }
    friend void NginPython(Python::Tag<Acc>, Python::ClassBuilder<Acc> &b)
    {
      b.Constructor<"">();
      b.Method<&Acc::Push, "v">("push");
    }
  };
}

NGIN_PYTHON_MODULE(bench, "", gil, m)
{
  if (auto r = m.AddFunction<&BenchDemo::Add, "a, b">(gil, "add"); !r)
    return r;
  return m.AddClass<BenchDemo::Acc>(gil);
}

int main()
{
  PyImport_AppendInittab("bench", &PyInit_bench);
  Py_Initialize();
  const auto gil = Python::GilToken::AssumeAcquired();

  auto module = BenchDemo::OrDie(gil, Python::Module::Import(gil, "bench"));
  auto add = BenchDemo::OrDie(gil, module->Get(gil, "add"));
  auto one = BenchDemo::OrDie(gil, Python::ToPython(gil, 1));
  auto two = BenchDemo::OrDie(gil, Python::ToPython(gil, 2));
  auto args = BenchDemo::OrDie(gil, Python::Tuple::New(gil, {one.Borrow(), two.Borrow()}));
  auto kwargs = BenchDemo::OrDie(gil, Python::Dict::New(gil));
  if (!kwargs->SetItem(gil, "b", two.Borrow()))
    return 1;
  auto firstOnly = BenchDemo::OrDie(gil, Python::Tuple::New(gil, {one.Borrow()}));

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    long long sum = 0;
    for (int i=0;i<10000;++i) {
      sum += BenchDemo::Add(i, 2);
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct add 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    long long sum = 0;
    for (int i=0;i<10000;++i) {
      auto out = add->Call(gil, args.Borrow());
      sum += out ? 1 : 0;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Exported add positional 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    long long sum = 0;
    for (int i=0;i<10000;++i) {
      auto out = add->Call(gil, firstOnly.Borrow(), kwargs.Borrow());
      sum += out ? 1 : 0;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Exported add keyword 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    using Spec = Python::SignatureOf<&BenchDemo::Add, "a, b">;
    ctx.start();
    long long sum = 0;
    for (int i=0;i<10000;++i) {
      Python::VariadicArguments extra;
      auto values = Python::ExtractArguments<Spec>(gil, "add", args.Borrow(), kwargs.Borrow(), extra);
      sum += values ? 1 : 0;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "ExtractArguments (error path) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto none = BenchDemo::OrDie(gil, Python::Tuple::Empty(gil));
    auto acc = BenchDemo::OrDie(gil, module->Call(gil, "Acc", none.Borrow()));
    auto push = BenchDemo::OrDie(gil, acc->GetAttr(gil, "push"));
    ctx.start();
    long long sum = 0;
    for (int i=0;i<10000;++i) {
      auto out = push->Call(gil, firstOnly.Borrow());
      sum += out ? 1 : 0;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Bound method push 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return Py_FinalizeEx() < 0 ? 1 : 0;
}
