// ReflectionBinder.cpp - reflection fallback for members, calls, conversions and operators

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <NGIN/Dispatch/Dispatch.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace BindDemo {
struct Vec2;
Vec2 AddVec(const Vec2 &a, const Vec2 &b);

struct Vec2 {
  double x{0};
  double y{0};

  double Length2() const { return x * x + y * y; }
  double Dot(const Vec2 &o) const { return x * o.x + y * o.y; }
  void Reset() { x = y = 0; }
  Vec2 Scale(double k) const { return Vec2{x * k, y * k}; }
  bool Same(const Vec2 &o) const { return x == o.x && y == o.y; }

  friend void NginReflect(NGIN::Dispatch::Tag<Vec2>, NGIN::Dispatch::TypeBuilder<Vec2> &b) {
    using NGIN::Dispatch::BinaryOperator;
    b.Field<&Vec2::x>("X");
    b.Field<&Vec2::y>("Y");
    b.Property<&Vec2::Length2>("Length2");
    b.Method<&Vec2::Dot>("Dot");
    b.Method<&Vec2::Reset>("Reset");
    b.Operator<BinaryOperator::Add, &AddVec>();
    b.Operator<BinaryOperator::Multiply, &Vec2::Scale>();
    b.Operator<BinaryOperator::Equal, &Vec2::Same>();
  }
};

Vec2 AddVec(const Vec2 &a, const Vec2 &b) { return Vec2{a.x + b.x, a.y + b.y}; }

struct Celsius {
  double degrees{0};
  double ToDouble() const { return degrees; }
  int ToInt() const { return static_cast<int>(degrees); }
  friend void NginReflect(NGIN::Dispatch::Tag<Celsius>, NGIN::Dispatch::TypeBuilder<Celsius> &b) {
    b.Field<&Celsius::degrees>("Degrees");
    b.Conversion<&Celsius::ToDouble>();
    b.Conversion<&Celsius::ToInt>(NGIN::Dispatch::ConversionMode::Explicit);
  }
};

struct Thermostat {
  double target{20};
  double Set(double t) {
    target = t;
    return target;
  }
  friend void NginReflect(NGIN::Dispatch::Tag<Thermostat>, NGIN::Dispatch::TypeBuilder<Thermostat> &b) {
    b.Method<&Thermostat::Set>("Set");
  }
};

struct Multiplier {
  int factor{3};
  int operator()(int v) const { return v * factor; }
  friend void NginReflect(NGIN::Dispatch::Tag<Multiplier>, NGIN::Dispatch::TypeBuilder<Multiplier> &b) {
    b.CallOperator<&Multiplier::operator()>();
  }
};

struct Thrower {
  int Fail() const { throw std::logic_error("boom"); }
  friend void NginReflect(NGIN::Dispatch::Tag<Thrower>, NGIN::Dispatch::TypeBuilder<Thrower> &b) {
    b.Method<&Thrower::Fail>("Fail");
  }
};

// Both operands carry a table for the same operator; the left one must win.
struct Left;
struct Right;
int LeftPlusRight(const Left &, const Right &);
int RightTablePlus(const Left &, const Right &);

struct Left {
  friend void NginReflect(NGIN::Dispatch::Tag<Left>, NGIN::Dispatch::TypeBuilder<Left> &b) {
    b.Operator<NGIN::Dispatch::BinaryOperator::Add, &LeftPlusRight>();
  }
};
struct Right {
  friend void NginReflect(NGIN::Dispatch::Tag<Right>, NGIN::Dispatch::TypeBuilder<Right> &b) {
    b.Operator<NGIN::Dispatch::BinaryOperator::Add, &RightTablePlus>();
  }
};
int LeftPlusRight(const Left &, const Right &) { return 1; }
int RightTablePlus(const Left &, const Right &) { return 2; }
} // namespace BindDemo

TEST_CASE("GetMemberReadsFieldsAndProperties", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Vec2 v{3, 4};

  auto x = engine.ExecuteUncached(Operation::GetMember("X"), {Value::Ref(v)});
  CHECK(x.As<double>() == Catch::Approx(3.0));
  auto len = engine.ExecuteUncached(Operation::GetMember("Length2"), {Value::Ref(v)});
  CHECK(len.As<double>() == Catch::Approx(25.0));
}

TEST_CASE("GetMemberMissingIsPermanent", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Vec2 v{};
  Value ops[] = {Value::Ref(v)};
  auto r = engine.TryExecuteUncached(Operation::GetMember("Z"), ops);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == DispatchErrorKind::MemberNotFound);
  CHECK(r.error().permanent);
  CHECK(r.error().member == "Z");
  REQUIRE(r.error().shapes.Size() == 1);
  CHECK(r.error().shapes[0].id == detail::TypeIdOf<BindDemo::Vec2>());
}

TEST_CASE("SetMemberWritesAndReturnsValue", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Vec2 v{};

  auto out = engine.ExecuteUncached(Operation::SetMember("Y"), {Value::Ref(v), Value::Box(2.5)});
  CHECK(v.y == Catch::Approx(2.5));
  CHECK(out.As<double>() == Catch::Approx(2.5));

  // int widens to double on assignment
  (void)engine.ExecuteUncached(Operation::SetMember("X"), {Value::Ref(v), Value::Box(7)});
  CHECK(v.x == Catch::Approx(7.0));
}

TEST_CASE("SetMemberRejectsReadOnlyAndMismatch", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Vec2 v{};

  Value ro[] = {Value::Ref(v), Value::Box(1.0)};
  auto r1 = engine.TryExecuteUncached(Operation::SetMember("Length2"), ro);
  REQUIRE_FALSE(r1.has_value());
  CHECK(r1.error().kind == DispatchErrorKind::MemberNotFound);

  Value bad[] = {Value::Ref(v), Value::Box(std::string{"nope"})};
  auto r2 = engine.TryExecuteUncached(Operation::SetMember("X"), bad);
  REQUIRE_FALSE(r2.has_value());
  CHECK(r2.error().kind == DispatchErrorKind::ArgumentMismatch);
}

TEST_CASE("InvokeMemberCallsMethod", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Vec2 a{1, 2};
  BindDemo::Vec2 b{3, 4};

  auto dot = engine.ExecuteUncached(Operation::InvokeMember("Dot", 1), {Value::Ref(a), Value::Ref(b)});
  CHECK(dot.As<double>() == Catch::Approx(11.0));

  auto none = engine.ExecuteUncached(Operation::InvokeMember("Reset", 0), {Value::Ref(a)});
  CHECK(none.IsNull());
  CHECK(a.x == 0);
}

TEST_CASE("InvokeMemberAppliesUserConversion", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Thermostat t{};
  BindDemo::Celsius c{22.5};

  auto out = engine.ExecuteUncached(Operation::InvokeMember("Set", 1), {Value::Ref(t), Value::Ref(c)});
  CHECK(out.As<double>() == Catch::Approx(22.5));
  CHECK(t.target == Catch::Approx(22.5));
}

TEST_CASE("InvokeCallsCallOperator", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Multiplier m{};
  auto out = engine.ExecuteUncached(Operation::Invoke(1), {Value::Ref(m), Value::Box(5)});
  CHECK(out.As<int>() == 15);

  BindDemo::Vec2 v{};
  Value ops[] = {Value::Ref(v), Value::Box(5)};
  auto r = engine.TryExecuteUncached(Operation::Invoke(1), ops);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == DispatchErrorKind::MemberNotFound);
}

TEST_CASE("ConvertNumericHonoursMode", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;

  auto widened = engine.ExecuteUncached(Operation::Convert<double>(), {Value::Box(3)});
  CHECK(widened.Is<double>());
  CHECK(widened.As<double>() == Catch::Approx(3.0));

  Value narrowing[] = {Value::Box(3.9)};
  auto implicitNarrow = engine.TryExecuteUncached(Operation::Convert<int>(), narrowing);
  REQUIRE_FALSE(implicitNarrow.has_value());
  CHECK(implicitNarrow.error().kind == DispatchErrorKind::MemberNotFound);

  auto explicitNarrow = engine.ExecuteUncached(Operation::Convert<int>(ConversionMode::Explicit), {Value::Box(3.9)});
  CHECK(explicitNarrow.As<int>() == 3);

  auto same = engine.ExecuteUncached(Operation::Convert<int>(), {Value::Box(8)});
  CHECK(same.As<int>() == 8);
}

TEST_CASE("ExplicitConvertRejectsUnrepresentableValues", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  const auto toInt = Operation::Convert<int>(ConversionMode::Explicit);

  CHECK_THROWS_AS(engine.ExecuteUncached(toInt, {Value::Box(1e30)}), std::overflow_error);
  CHECK_THROWS_AS(engine.ExecuteUncached(toInt, {Value::Box(-1e30)}), std::overflow_error);
  CHECK_THROWS_AS(engine.ExecuteUncached(toInt, {Value::Box(std::nan(""))}), std::overflow_error);
  CHECK(engine.ExecuteUncached(toInt, {Value::Box(-3.9)}).As<int>() == -3);

  const auto toByte = Operation::Convert<unsigned char>(ConversionMode::Explicit);
  CHECK(engine.ExecuteUncached(toByte, {Value::Box(255.5)}).As<unsigned char>() == 255);
  CHECK(engine.ExecuteUncached(toByte, {Value::Box(-0.5)}).As<unsigned char>() == 0);
  CHECK_THROWS_AS(engine.ExecuteUncached(toByte, {Value::Box(256.0)}), std::overflow_error);

  const auto toLong = Operation::Convert<long long>(ConversionMode::Explicit);
  CHECK(engine.ExecuteUncached(toLong, {Value::Box(-9223372036854775808.0)}).As<long long>() ==
        std::numeric_limits<long long>::min());
  CHECK_THROWS_AS(engine.ExecuteUncached(toLong, {Value::Box(9223372036854775808.0)}), std::overflow_error);

  const auto toFloat = Operation::Convert<float>(ConversionMode::Explicit);
  CHECK_THROWS_AS(engine.ExecuteUncached(toFloat, {Value::Box(1e300)}), std::overflow_error);
  CHECK(engine.ExecuteUncached(toFloat, {Value::Box(0.5)}).As<float>() == 0.5f);
}

TEST_CASE("ConvertUsesUserConversions", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Celsius c{36.6};

  auto d = engine.ExecuteUncached(Operation::Convert<double>(), {Value::Ref(c)});
  CHECK(d.As<double>() == Catch::Approx(36.6));

  Value ops[] = {Value::Ref(c)};
  auto implicitInt = engine.TryExecuteUncached(Operation::Convert<int>(), ops);
  REQUIRE_FALSE(implicitInt.has_value());

  auto explicitInt = engine.ExecuteUncached(Operation::Convert<int>(ConversionMode::Explicit), {Value::Ref(c)});
  CHECK(explicitInt.As<int>() == 36);
}

TEST_CASE("UserOperatorsBind", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Vec2 a{1, 2};
  BindDemo::Vec2 b{10, 20};

  auto sum = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Ref(a), Value::Ref(b)});
  REQUIRE(sum.Is<BindDemo::Vec2>());
  CHECK(sum.As<BindDemo::Vec2>().x == Catch::Approx(11.0));

  // member operator taking double; int argument widens
  auto scaled = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Multiply), {Value::Ref(a), Value::Box(2)});
  CHECK(scaled.As<BindDemo::Vec2>().y == Catch::Approx(4.0));

  auto eq = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Equal), {Value::Ref(a), Value::Box(BindDemo::Vec2{1, 2})});
  CHECK(eq.As<bool>());

  Value ops[] = {Value::Ref(a), Value::Ref(b)};
  auto sub = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Subtract), ops);
  REQUIRE_FALSE(sub.has_value());
  CHECK(sub.error().kind == DispatchErrorKind::MemberNotFound);
  CHECK(sub.error().member == "-");
}

TEST_CASE("LeftOperandTableWins", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  BindDemo::Left l;
  BindDemo::Right r;
  auto out = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Ref(l), Value::Ref(r)});
  CHECK(out.As<int>() == 1);
}

TEST_CASE("BuiltinNumericOperatorsPromote", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;

  auto i = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Box(2), Value::Box(3)});
  CHECK(i.Is<long long>());
  CHECK(i.As<long long>() == 5);

  auto f = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Multiply), {Value::Box(2), Value::Box(1.5)});
  CHECK(f.Is<double>());
  CHECK(f.As<double>() == Catch::Approx(3.0));

  auto u = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Subtract),
                                  {Value::Box(10ull), Value::Box(4u)});
  CHECK(u.Is<unsigned long long>());
  CHECK(u.As<unsigned long long>() == 6);

  auto mod = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Modulo), {Value::Box(7), Value::Box(3)});
  CHECK(mod.As<long long>() == 1);

  auto lt = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Less), {Value::Box(1), Value::Box(2.0)});
  CHECK(lt.As<bool>());
}

TEST_CASE("IntegerArithmeticWraps", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  constexpr long long kMax = std::numeric_limits<long long>::max();
  constexpr long long kMin = std::numeric_limits<long long>::min();

  auto add = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Box(kMax), Value::Box(1LL)});
  REQUIRE(add.Is<long long>());
  CHECK(add.As<long long>() == kMin);

  auto sub = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Subtract), {Value::Box(kMin), Value::Box(1LL)});
  CHECK(sub.As<long long>() == kMax);

  auto mul = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Multiply), {Value::Box(kMax), Value::Box(2LL)});
  CHECK(mul.As<long long>() == -2);

  // int operands promote before the operation
  auto wide = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add),
                                     {Value::Box(std::numeric_limits<int>::max()), Value::Box(1)});
  CHECK(wide.As<long long>() == 2147483648LL);

  auto uwrap = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Subtract), {Value::Box(0ull), Value::Box(1ull)});
  CHECK(uwrap.As<unsigned long long>() == std::numeric_limits<unsigned long long>::max());
}

TEST_CASE("MinDividedByMinusOneThrowsOverflow", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  constexpr long long kMin = std::numeric_limits<long long>::min();

  CHECK_THROWS_AS(engine.ExecuteUncached(Operation::Binary(BinaryOperator::Divide), {Value::Box(kMin), Value::Box(-1LL)}),
                  std::overflow_error);
  CHECK_THROWS_AS(engine.ExecuteUncached(Operation::Binary(BinaryOperator::Modulo), {Value::Box(kMin), Value::Box(-1LL)}),
                  std::overflow_error);
  CHECK_THROWS_AS(engine.ExecuteUncached(Operation::Binary(BinaryOperator::Modulo), {Value::Box(5LL), Value::Box(0LL)}),
                  std::domain_error);

  // The failure belongs to the operation; the cached binding keeps working.
  auto site = engine.CreateSite(Operation::Binary(BinaryOperator::Divide));
  CHECK_THROWS_AS(site->Call(kMin, -1LL), std::overflow_error);
  CHECK(site->Call(kMin, 2LL).As<long long>() == kMin / 2);
  CHECK(site->Call(7LL, -1LL).As<long long>() == -7);
  CHECK(site->StateOf({Value::Box(1LL), Value::Box(1LL)}) == SiteState::Bound);
}

TEST_CASE("SignedWithWideUnsignedIsAmbiguous", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;

  Value less[] = {Value::Box(-1), Value::Box(1ull)};
  auto lt = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Less), less);
  REQUIRE_FALSE(lt.has_value());
  CHECK(lt.error().kind == DispatchErrorKind::AmbiguousMatch);
  CHECK(lt.error().permanent);

  Value sum[] = {Value::Box(2ull), Value::Box(-5LL)};
  auto add = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Add), sum);
  REQUIRE_FALSE(add.has_value());
  CHECK(add.error().kind == DispatchErrorKind::AmbiguousMatch);

  // Narrower unsigned operands still promote to long long.
  auto mixed = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Box(-5), Value::Box(2u)});
  CHECK(mixed.As<long long>() == -3);

  auto unsignedOnly = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Less), {Value::Box(1u), Value::Box(2ull)});
  CHECK(unsignedOnly.As<bool>());
}

TEST_CASE("LongDoubleOperandsKeepPrecision", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  const long double eps = std::numeric_limits<long double>::epsilon();

  auto sum = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Box(1.0L), Value::Box(eps)});
  REQUIRE(sum.Is<long double>());
  CHECK(sum.As<long double>() == 1.0L + eps);

  auto mixed = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Multiply), {Value::Box(2), Value::Box(0.5L)});
  REQUIRE(mixed.Is<long double>());
  CHECK(mixed.As<long double>() == 1.0L);

  auto plain = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Box(1.0f), Value::Box(1.0)});
  CHECK(plain.Is<double>());
}

TEST_CASE("BoolOnlyTakesPartInEquality", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  auto eq = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Equal), {Value::Box(true), Value::Box(true)});
  CHECK(eq.As<bool>());

  Value ops[] = {Value::Box(true), Value::Box(1)};
  auto add = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Add), ops);
  REQUIRE_FALSE(add.has_value());
  CHECK(add.error().kind == DispatchErrorKind::MemberNotFound);
}

TEST_CASE("StringOperators", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  auto cat = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Add), {Value::Box("foo"), Value::Box("bar")});
  CHECK(cat.As<std::string>() == "foobar");

  auto less = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Less), {Value::Box("a"), Value::Box("b")});
  CHECK(less.As<bool>());

  Value ops[] = {Value::Box("a"), Value::Box("b")};
  auto sub = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Subtract), ops);
  CHECK_FALSE(sub.has_value());

  Value mixed[] = {Value::Box("a"), Value::Box(1)};
  CHECK_FALSE(engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Add), mixed).has_value());
}

TEST_CASE("TargetExceptionsPropagateUnwrapped", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  CHECK_THROWS_AS(engine.ExecuteUncached(Operation::Binary(BinaryOperator::Divide), {Value::Box(1), Value::Box(0)}),
                  std::domain_error);

  auto fdiv = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Divide), {Value::Box(1.0), Value::Box(4)});
  CHECK(fdiv.As<double>() == Catch::Approx(0.25));

  BindDemo::Thrower t;
  CHECK_THROWS_AS(engine.ExecuteUncached(Operation::InvokeMember("Fail", 0), {Value::Ref(t)}), std::logic_error);
}

TEST_CASE("NullHandling", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;

  Value get[] = {Value::Null()};
  auto r = engine.TryExecuteUncached(Operation::GetMember("X"), get);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == DispatchErrorKind::NullReceiver);
  CHECK(r.error().shapes[0].IsNull());

  auto eq = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Equal), {Value::Null(), Value::Null()});
  CHECK(eq.As<bool>());
  auto ne = engine.ExecuteUncached(Operation::Binary(BinaryOperator::NotEqual), {Value::Null(), Value::Box(1)});
  CHECK(ne.As<bool>());

  Value add[] = {Value::Null(), Value::Box(1)};
  auto bad = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Add), add);
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().kind == DispatchErrorKind::NullReceiver);

  CHECK_THROWS_AS(engine.ExecuteUncached(Operation::InvokeMember("Dot", 1), {Value::Null(), Value::Null()}),
                  DispatchError);
}

TEST_CASE("CoalescePassesThrough", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  auto right = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Coalesce), {Value::Null(), Value::Box(9)});
  CHECK(right.As<int>() == 9);
  auto left = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Coalesce), {Value::Box("x"), Value::Box(9)});
  CHECK(left.As<std::string>() == "x");
  auto both = engine.ExecuteUncached(Operation::Binary(BinaryOperator::Coalesce), {Value::Null(), Value::Null()});
  CHECK(both.IsNull());
}

TEST_CASE("WrongOperandCountIsArgumentMismatch", "[dispatch][ReflectionBinder]") {
  using namespace NGIN::Dispatch;
  DispatchEngine engine;
  Value ops[] = {Value::Box(1)};
  auto r = engine.TryExecuteUncached(Operation::Binary(BinaryOperator::Add), ops);
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == DispatchErrorKind::ArgumentMismatch);
}
