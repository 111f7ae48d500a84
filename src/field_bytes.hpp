#ifndef FIELD_BYTES_HPP
#define FIELD_BYTES_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <gmp.h>
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

namespace mlpoly {

using FieldT = libff::Fr<libff::alt_bn128_pp>;

/* width of the canonical encoding: every limb of the standard representative */
template <class F> constexpr size_t field_bytes() {
  return static_cast<size_t>(F::num_limbs) * sizeof(mp_limb_t);
}

inline void append_u64(std::vector<uint8_t> &out, uint64_t v) {
  for (size_t i = 0; i < 8; ++i)
    out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

/* -------------------------------------------------------------------- *
 *  Forward-only cursor over a serialized buffer.                        *
 *  Every read is bounds checked; running off the end is an error,      *
 *  never a silent zero fill.                                           *
 * -------------------------------------------------------------------- */
class ByteReader {
  const uint8_t *data;
  size_t size;
  size_t pos;

public:
  ByteReader(const uint8_t *data_, size_t size_)
      : data(data_), size(size_), pos(0) {}
  explicit ByteReader(const std::vector<uint8_t> &buf)
      : ByteReader(buf.data(), buf.size()) {}

  const uint8_t *take(size_t n) {
    if (n > size - pos)
      throw std::runtime_error("unexpected end of serialized data");
    const uint8_t *p = data + pos;
    pos += n;
    return p;
  }

  uint64_t read_u64() {
    const uint8_t *p = take(8);
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i)
      v |= static_cast<uint64_t>(p[i]) << (8 * i);
    return v;
  }

  size_t remaining() const { return size - pos; }
  bool exhausted() const { return pos == size; }
};

// Canonical little-endian bytes of x (standard form, not Montgomery form).
template <class F> void append_field(std::vector<uint8_t> &out, const F &x) {
  const auto repr = x.as_bigint();
  for (size_t limb = 0; limb < static_cast<size_t>(F::num_limbs); ++limb) {
    const mp_limb_t w = repr.data[limb];
    for (size_t i = 0; i < sizeof(mp_limb_t); ++i)
      out.push_back(static_cast<uint8_t>(w >> (8 * i)));
  }
}

template <class F> std::vector<uint8_t> field_to_bytes(const F &x) {
  std::vector<uint8_t> out;
  out.reserve(field_bytes<F>());
  append_field(out, x);
  return out;
}

template <class F> F read_field(ByteReader &in) {
  const uint8_t *p = in.take(field_bytes<F>());
  libff::bigint<F::num_limbs> repr;
  for (size_t limb = 0; limb < static_cast<size_t>(F::num_limbs); ++limb) {
    mp_limb_t w = 0;
    for (size_t i = 0; i < sizeof(mp_limb_t); ++i)
      w |= static_cast<mp_limb_t>(p[limb * sizeof(mp_limb_t) + i]) << (8 * i);
    repr.data[limb] = w;
  }
  // only values strictly below the modulus have a canonical encoding
  if (mpn_cmp(repr.data, F::mod.data, F::num_limbs) >= 0)
    throw std::invalid_argument("non-canonical field element");
  return F(repr);
}

/*
 * Interpret `len` bytes as a little-endian integer and reduce it modulo
 * the field order. Horner's rule from the most significant byte keeps
 * every intermediate value inside the field, so inputs of any length
 * (hash digests included) are accepted.
 */
template <class F> F from_le_bytes_mod_order(const uint8_t *bytes, size_t len) {
  const F radix(256);
  F acc = F::zero();
  for (size_t i = len; i-- > 0;)
    acc = acc * radix + F(static_cast<long>(bytes[i]));
  return acc;
}

} // namespace mlpoly

#endif // FIELD_BYTES_HPP
