#include <NGIN/Dispatch/Dispatch.hpp>

#include <iostream>
#include <map>
#include <optional>
#include <string>

namespace Demo
{
  using namespace NGIN::Dispatch;

  // Expando-style object: members are created on assignment.
  class PropertyBag : public MetaObject
  {
  public:
    std::optional<NGIN::UInt64> CustomShapeKey() const override { return m_version; }

    MetaResult TryGetMember(const Operation &op, std::span<const Envelope>) override
    {
      std::string key{op.Name()};
      if (!m_slots.count(key))
        return MetaResult::Failed("no member '" + key + "'");
      return MetaResult::Resolved([key](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
                                  { return ops[0].As<PropertyBag>().m_slots.at(key); });
    }

    MetaResult TrySetMember(const Operation &op, std::span<const Envelope>) override
    {
      std::string key{op.Name()};
      return MetaResult::Resolved([key](std::span<const Value> ops) -> std::expected<Value, BindingFailure>
                                  {
                                    auto &bag = ops[0].As<PropertyBag>();
                                    if (bag.m_slots.insert_or_assign(key, ops[1]).second)
                                      ++bag.m_version;
                                    return ops[1]; });
    }

  private:
    std::map<std::string, Value> m_slots{};
    NGIN::UInt64 m_version{0};
  };
}

int main()
{
  using namespace NGIN::Dispatch;

  DispatchEngine engine;
  auto setName = engine.CreateSite(Operation::SetMember("name"));
  auto getName = engine.CreateSite(Operation::GetMember("name"));
  auto getAge = engine.CreateSite(Operation::GetMember("age"));

  Demo::PropertyBag bag;
  (void)setName->Call(Value::Ref(bag), "Ada");
  std::cout << "name => " << getName->Call(Value::Ref(bag)).As<std::string>() << "\n";

  auto age = getAge->TryExecute({Value::Ref(bag)});
  if (!age)
    std::cout << FormatFailure(age.error()) << "\n";

  // Adding a member changes the bag's shape; the getter rebinds.
  auto setAge = engine.CreateSite(Operation::SetMember("age"));
  (void)setAge->Call(Value::Ref(bag), 36);
  std::cout << "age => " << getAge->Call(Value::Ref(bag)).As<int>() << "\n";
  std::cout << "name => " << getName->Call(Value::Ref(bag)).As<std::string>()
            << " (site cache entries: " << getName->CacheSize() << ")\n";
  return 0;
}
