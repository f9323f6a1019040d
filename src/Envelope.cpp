#include <NGIN/Dispatch/Envelope.hpp>
#include <NGIN/Dispatch/MetaObject.hpp>
#include <NGIN/Hashing/FNV.hpp>

namespace NGIN::Dispatch
{

  namespace
  {
    constexpr NGIN::UInt64 kFnvPrime = 0x100000001b3ull;

    NGIN::UInt64 MixCustomKey(NGIN::UInt64 typeId, NGIN::UInt64 key) noexcept
    {
      const NGIN::UInt64 parts[2] = {typeId, key};
      return NGIN::Hashing::FNV1a64(reinterpret_cast<const char *>(parts), sizeof(parts));
    }
  } // namespace

  void ShapeTuple::Append(ShapeKey key) noexcept
  {
    m_keys.PushBack(key);
    m_hash = (m_hash ^ static_cast<NGIN::UInt64>(key.kind)) * kFnvPrime;
    m_hash = (m_hash ^ key.id) * kFnvPrime;
  }

  Envelope Wrap(const Value &value)
  {
    Envelope e{};
    e.value = &value;
    if (value.IsNull())
      return e;
    e.shape = ShapeKey{value.GetShapeKind(), value.GetTypeId()};
    e.meta = value.GetMetaObject();
    if (e.meta)
    {
      if (auto custom = e.meta->CustomShapeKey())
        e.shape.id = MixCustomKey(e.shape.id, *custom);
    }
    return e;
  }

  WrappedOperands WrapAll(std::span<const Value> values)
  {
    WrappedOperands out{};
    out.envelopes.Reserve(values.size());
    out.shapes.Reserve(values.size());
    for (const auto &v : values)
    {
      auto e = Wrap(v);
      out.shapes.Append(e.shape);
      out.envelopes.PushBack(e);
    }
    return out;
  }

  ShapeTuple ShapesOf(std::span<const Value> values)
  {
    ShapeTuple out{};
    out.Reserve(values.size());
    for (const auto &v : values)
      out.Append(Wrap(v).shape);
    return out;
  }

} // namespace NGIN::Dispatch
