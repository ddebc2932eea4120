#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <NGIN/Benchmark.hpp>
#include <NGIN/Relations/Relations.hpp>

using namespace NGIN;

namespace LookupBench
{
  // Twenty int relation types bound to one object.
  struct ManyRelations
  {
    // Declared first so the object and its bindings go away before their types.
    std::vector<std::unique_ptr<Relations::RelationType<int>>> types;
    Relations::Relatable object;

    ManyRelations()
    {
      for (int i = 0; i < 20; ++i)
      {
        types.push_back(std::make_unique<Relations::RelationType<int>>("bench.lookup.A" + std::to_string(i)));
        (void)object.Set(*types.back(), i);
      }
    }
  };
}

int main()
{
  using LookupBench::ManyRelations;
  namespace R = NGIN::Relations;

  ManyRelations many;
  auto &hit = *many.types[15];
  auto missing = R::NewIntType("bench.lookup.Missing", -1);
  auto counter = R::NewIntCounter("bench.lookup.Changes", [](const R::RelationEvent &)
                                  { return true; });
  R::Relatable counted;
  (void)counted.Init(counter);

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int sum = 0;
                        for (int i = 0; i < N; ++i)
                          sum += many.object.Get(hit).value();
                        ctx.doNotOptimize(sum);
                        ctx.stop(); }, "Get(type) 10k hits");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int sum = 0;
                        for (int i = 0; i < N; ++i)
                          sum += many.object.Get(missing).value();
                        ctx.doNotOptimize(sum);
                        ctx.stop(); }, "Get(type) 10k defaults");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int found = 0;
                        for (int i = 0; i < N; ++i)
                          found += R::RelationTypeBase::ValueOf("bench.lookup.A15") ? 1 : 0;
                        ctx.doNotOptimize(found);
                        ctx.stop(); }, "ValueOf(name) 10k hits");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                          (void)many.object.Set(hit, i);
                        ctx.stop(); }, "Set(type) 10k updates");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        for (int i = 0; i < N; ++i)
                          (void)counted.Set(hit, i);
                        int changes = counted.Get(counter).value();
                        ctx.doNotOptimize(changes);
                        ctx.stop(); }, "Set(type) 10k updates with counter");

  auto results = NGIN::Benchmark::RunAll<NGIN::Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
