#include <iostream>
#include <span>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Dispatch/Dispatch.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct Obj
  {
    int n{0};
    int add(int v) const { return n + v; }
    friend void NginReflect(Dispatch::Tag<Obj>, Dispatch::TypeBuilder<Obj> &b)
    {
      b.Field<&Obj::n>("n");
      b.Method<&Obj::add>("add");
    }
  };

  struct Other
  {
    int add(int v) const { return v; }
    friend void NginReflect(Dispatch::Tag<Other>, Dispatch::TypeBuilder<Other> &b)
    {
      b.Method<&Other::add>("add");
    }
  };
}

int main()
{
  using namespace NGIN::Dispatch;
  using BenchDemo::Obj;
  using BenchDemo::Other;

  DispatchEngine engine;
  auto op = Operation::InvokeMember("add", 1);

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto site = engine.CreateSite(op);
    Obj o{5};
    Value args[2] = {Value::Ref(o), Value::Box(7)};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += site->Execute(args).As<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "CallSite add(int) monomorphic 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto site = engine.CreateSite(op);
    Obj o{5};
    Other x{};
    Value a[2] = {Value::Ref(o), Value::Box(7)};
    Value b[2] = {Value::Ref(x), Value::Box(7)};
    std::span<const Value> shapes[2] = {b, a};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += site->Execute(shapes[i & 1]).As<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "CallSite add(int) two shapes 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Obj o{5};
    Value args[2] = {Value::Ref(o), Value::Box(7)};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += engine.ExecuteUncached(op, args).As<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Uncached bind+invoke add(int) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Obj o{5};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += o.add(7);
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct add(int) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto site = engine.CreateSite(Operation::Binary(BinaryOperator::Add));
    Value args[2] = {Value::Box(3), Value::Box(4)};
    ctx.start();
    long long sum = 0;
    for (int i=0;i<10000;++i) {
      sum += site->Execute(args).As<long long>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "CallSite builtin int+int 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
