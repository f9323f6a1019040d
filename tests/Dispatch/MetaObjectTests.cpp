// MetaObjectTests.cpp - host-supplied binding through the meta-object protocol

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Dispatch/Dispatch.hpp>

#include <map>
#include <optional>
#include <string>

namespace MetaDemo {
using namespace NGIN::Dispatch;

// Resolves GetMember("Value") to 42 and counts how often it is asked.
struct Counter : MetaObject {
  int value{7};
  int binds{0};

  MetaResult TryGetMember(const Operation &op, std::span<const Envelope>) override {
    ++binds;
    if (op.Name() != "Value")
      return MetaResult::NotApplicable();
    return MetaResult::Resolved([](std::span<const Value>) -> std::expected<Value, BindingFailure> {
      return Value::Box(42);
    });
  }

  int Doubled() const { return value * 2; }

  friend void NginReflect(Tag<Counter>, TypeBuilder<Counter> &b) {
    b.Field<&Counter::value>("Value");
    b.Field<&Counter::value>("Raw");
    b.Method<&Counter::Doubled>("Doubled");
  }
};

// Dynamic members backed by a map; the key set is part of the shape.
struct Bag : MetaObject {
  std::map<std::string, int> slots{};

  std::optional<NGIN::UInt64> CustomShapeKey() const override {
    NGIN::UInt64 h = 1469598103934665603ull;
    for (const auto &[k, v] : slots)
      for (char c : k)
        h = (h ^ static_cast<unsigned char>(c)) * 1099511628211ull;
    return h;
  }

  MetaResult TryGetMember(const Operation &op, std::span<const Envelope>) override {
    if (!slots.count(std::string{op.Name()}))
      return MetaResult::Failed("no slot '" + std::string{op.Name()} + "'");
    std::string key{op.Name()};
    return MetaResult::Resolved([key](std::span<const Value> ops) -> std::expected<Value, BindingFailure> {
      return Value::Box(ops[0].As<Bag>().slots.at(key));
    });
  }

  MetaResult TrySetMember(const Operation &op, std::span<const Envelope>) override {
    std::string key{op.Name()};
    return MetaResult::Resolved([key](std::span<const Value> ops) -> std::expected<Value, BindingFailure> {
      auto v = ops[1].Get<int>();
      if (!v)
        return std::unexpected(v.error());
      ops[0].As<Bag>().slots[key] = *v;
      return ops[1];
    });
  }

  MetaResult TryBinaryOperation(const Operation &op, std::span<const Envelope>) override {
    if (op.Operator() != BinaryOperator::Add)
      return MetaResult::NotApplicable();
    return MetaResult::Resolved([](std::span<const Value> ops) -> std::expected<Value, BindingFailure> {
      int total = 0;
      for (const auto &[k, v] : ops[0].As<Bag>().slots)
        total += v;
      return Value::Box(total + ops[1].As<int>());
    });
  }
};

struct Broken : MetaObject {
  MetaResult TryInvokeMember(const Operation &, std::span<const Envelope>) override {
    return MetaResult::Resolved(BindingTarget{});
  }
};
} // namespace MetaDemo

TEST_CASE("CounterWalkthroughBindsOnce", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  auto site = engine.CreateSite(Operation::GetMember("Value"));
  MetaDemo::Counter counter;

  auto first = site->Execute({Value::Ref(counter)});
  CHECK(first.As<int>() == 42);
  CHECK(counter.binds == 1);

  auto second = site->Execute({Value::Ref(counter)});
  CHECK(second.As<int>() == 42);
  CHECK(counter.binds == 1);

  auto stats = site->Stats();
  CHECK(stats.misses == 1);
  CHECK(stats.hits == 1);
}

TEST_CASE("MetaObjectTakesPrecedenceOverReflection", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  MetaDemo::Counter counter;
  // Reflection would yield 7 for the same member.
  auto v = engine.ExecuteUncached(Operation::GetMember("Value"), {Value::Ref(counter)});
  CHECK(v.As<int>() == 42);
}

TEST_CASE("NotApplicableFallsBackToReflection", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  MetaDemo::Counter counter;

  auto raw = engine.ExecuteUncached(Operation::GetMember("Raw"), {Value::Ref(counter)});
  CHECK(raw.As<int>() == 7);

  // Hooks the host does not override default to NotApplicable.
  auto doubled = engine.ExecuteUncached(Operation::InvokeMember("Doubled", 0), {Value::Ref(counter)});
  CHECK(doubled.As<int>() == 14);
}

TEST_CASE("MetaObjectFailureIsNotCached", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  auto site = engine.CreateSite(Operation::GetMember("Missing"));
  MetaDemo::Bag bag;

  Value ops[] = {Value::Ref(bag)};
  auto r = site->TryExecute(ops);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == DispatchErrorKind::MetaObjectError);
  CHECK_FALSE(r.error().permanent);
  CHECK(r.error().message == "no slot 'Missing'");
  CHECK(site->CacheSize() == 0);
  CHECK(site->StateOf(ops) == SiteState::Unbound);

  CHECK_THROWS_AS(site->Execute(ops), DispatchError);
  CHECK(site->Stats().misses == 2);
}

TEST_CASE("MetaObjectHandlesSetAndBinary", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  MetaDemo::Bag bag;

  auto set = engine.CreateSite(Operation::SetMember("a"));
  (void)set->Execute({Value::Ref(bag), Value::Box(5)});
  CHECK(bag.slots.at("a") == 5);

  auto get = engine.CreateSite(Operation::GetMember("a"));
  CHECK(get->Execute({Value::Ref(bag)}).As<int>() == 5);

  auto add = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Ref(bag), Value::Box(10)});
  CHECK(add.As<int>() == 15);

  // Subtract is NotApplicable; Bag has no reflected operator either.
  Value ops[] = {Value::Ref(bag), Value::Box(1)};
  auto sub = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Subtract), ops);
  REQUIRE_FALSE(sub.has_value());
  CHECK(sub.error().kind == DispatchErrorKind::MemberNotFound);
}

TEST_CASE("CustomShapeKeySeparatesCacheEntries", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  auto site = engine.CreateSite(Operation::GetMember("x"));
  MetaDemo::Bag one;
  one.slots["x"] = 1;
  MetaDemo::Bag two;
  two.slots["x"] = 2;
  two.slots["y"] = 3;

  CHECK(site->Call(Value::Ref(one)).As<int>() == 1);
  CHECK(site->Call(Value::Ref(two)).As<int>() == 2);
  CHECK(site->CacheSize() == 2);

  // Same key set as `one` shares its entry.
  MetaDemo::Bag three;
  three.slots["x"] = 9;
  CHECK(site->Call(Value::Ref(three)).As<int>() == 9);
  CHECK(site->CacheSize() == 2);
  CHECK(site->Stats().hits == 1);
}

TEST_CASE("EmptyResolvedTargetIsMetaObjectError", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  MetaDemo::Broken broken;
  Value ops[] = {Value::Ref(broken)};
  auto r = engine.TryExecuteUncached(Operation::InvokeMember("Run", 0), ops);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == DispatchErrorKind::MetaObjectError);
}

TEST_CASE("MetaResultStates", "[dispatch][MetaObject]") {
  using namespace NGIN::Dispatch;
  CHECK(MetaResult::NotApplicable().IsNotApplicable());
  auto failed = MetaResult::Failed("bad");
  CHECK(failed.IsFailed());
  CHECK(failed.Reason() == "bad");
  auto resolved = MetaResult::Resolved([](std::span<const Value>) -> std::expected<Value, BindingFailure> {
    return Value::Null();
  });
  CHECK(resolved.IsResolved());
  CHECK(static_cast<bool>(resolved.Target()));
}
