// Envelope.hpp
// Ephemeral operand wrapper and the shape tuple that keys call-site caches
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Value.hpp>

#include <span>

namespace NGIN::Dispatch
{
  class MetaObject;

  // Borrowed view of one operand for the duration of a single bind. Never cached.
  struct Envelope
  {
    const Value *value{nullptr};
    ShapeKey shape{};
    MetaObject *meta{nullptr};

    [[nodiscard]] bool IsNull() const noexcept { return shape.IsNull(); }
  };

  class NGIN_DISPATCH_API ShapeTuple
  {
  public:
    ShapeTuple() = default;

    void Reserve(NGIN::UIntSize n) { m_keys.Reserve(n); }
    void Append(ShapeKey key) noexcept;

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_keys.Size(); }
    [[nodiscard]] const ShapeKey &operator[](NGIN::UIntSize i) const { return m_keys[i]; }
    [[nodiscard]] NGIN::UInt64 Hash() const noexcept { return m_hash; }
    [[nodiscard]] const NGIN::Containers::Vector<ShapeKey> &Keys() const noexcept { return m_keys; }

    friend bool operator==(const ShapeTuple &a, const ShapeTuple &b) noexcept
    {
      if (a.m_hash != b.m_hash || a.m_keys.Size() != b.m_keys.Size())
        return false;
      for (NGIN::UIntSize i = 0; i < a.m_keys.Size(); ++i)
        if (!(a.m_keys[i] == b.m_keys[i]))
          return false;
      return true;
    }

  private:
    NGIN::Containers::Vector<ShapeKey> m_keys{};
    NGIN::UInt64 m_hash{0xcbf29ce484222325ull};
  };

  struct WrappedOperands
  {
    NGIN::Containers::Vector<Envelope> envelopes{};
    ShapeTuple shapes{};
  };

  // O(1): reads the type id and meta-object accessor stamped on the Value at construction.
  [[nodiscard]] NGIN_DISPATCH_API Envelope Wrap(const Value &value);

  [[nodiscard]] NGIN_DISPATCH_API WrappedOperands WrapAll(std::span<const Value> values);

  // Shape tuple only; used to recheck operands after a bind.
  [[nodiscard]] NGIN_DISPATCH_API ShapeTuple ShapesOf(std::span<const Value> values);

} // namespace NGIN::Dispatch
