#include <NGIN/Dispatch/Dispatch.hpp>

#include <iostream>
#include <string>

namespace Demo
{
  struct Math
  {
    int scale{2};

    int mul(int a, int b) const { return a * b * scale; }
    double mul(int a, double b) const { return a * b * scale; }

    friend void NginReflect(NGIN::Dispatch::Tag<Math>, NGIN::Dispatch::TypeBuilder<Math> &b)
    {
      b.SetName("Demo::Math");
      b.Field<&Math::scale>("scale");
      b.Method<static_cast<int (Math::*)(int, int) const>(&Math::mul)>("mul");
      b.Method<static_cast<double (Math::*)(int, double) const>(&Math::mul)>("mul");
    }
  };
}

int main()
{
  using namespace NGIN::Dispatch;
  std::cout << "Library: " << LibraryName() << "\n";

  DispatchEngine engine;
  auto mul = engine.CreateSite(Operation::InvokeMember("mul", 2));
  auto scale = engine.CreateSite(Operation::SetMember("scale"));

  Demo::Math math{};
  std::cout << "mul(3,4) => " << mul->Call(Value::Ref(math), 3, 4).As<int>() << "\n";
  std::cout << "mul(3,2.5) => " << mul->Call(Value::Ref(math), 3, 2.5).As<double>() << "\n";

  (void)scale->Call(Value::Ref(math), 10);
  std::cout << "scale=10, mul(3,4) => " << mul->Call(Value::Ref(math), 3, 4).As<int>() << "\n";

  auto stats = mul->Stats();
  std::cout << "mul site: " << stats.hits << " hits, " << stats.misses << " misses\n";

  // Same expression, different operand shapes.
  auto add = engine.CreateSite(Operation::Binary(BinaryOperator::Add));
  std::cout << "1 + 2 => " << add->Call(1, 2).As<long long>() << "\n";
  std::cout << "\"a\" + \"b\" => " << add->Call("a", "b").As<std::string>() << "\n";

  try
  {
    (void)mul->Call(Value::Ref(math), "x", 4);
  }
  catch (const DispatchError &e)
  {
    std::cout << e.what() << "\n";
  }
  return 0;
}
