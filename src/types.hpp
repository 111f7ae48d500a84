#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "field_bytes.hpp"

namespace sumcheck {

// Public claim: sum of f over {0,1}^n_vars equals claim_sum
template <class F> struct Statement {
  size_t n_vars;
  F claim_sum;
};

/* -------------------------------------------------------------------- *
 *  Degree-1 round polynomial kept as its values at 0 and 1.             *
 * -------------------------------------------------------------------- */
template <class F> struct RoundPoly {
  F g0, g1;

  RoundPoly() : g0(F::zero()), g1(F::zero()) {}
  RoundPoly(const F &g0_, const F &g1_) : g0(g0_), g1(g1_) {}

  const F &eval_0() const { return g0; }
  const F &eval_1() const { return g1; }

  // g(x) = g(0) + (g(1) - g(0)) * x
  F eval(const F &x) const { return g0 + (g1 - g0) * x; }
  F sum_over_binary() const { return g0 + g1; }

  // (c0, c1) with g(x) = c0 + c1 * x
  std::pair<F, F> coeffs() const { return {g0, g1 - g0}; }

  bool operator==(const RoundPoly &o) const { return g0 == o.g0 && g1 == o.g1; }
  bool operator!=(const RoundPoly &o) const { return !(*this == o); }
};

template <class F> struct SumcheckProof {
  std::vector<RoundPoly<F>> round_polys; // round i binds the i-th variable

  size_t num_rounds() const { return round_polys.size(); }

  size_t size_in_bytes() const {
    return 8 + round_polys.size() * 2 * mlpoly::field_bytes<F>();
  }

  // u64 count, then g0 || g1 per round
  void serialize(std::vector<uint8_t> &out) const {
    mlpoly::append_u64(out, static_cast<uint64_t>(round_polys.size()));
    for (const auto &rp : round_polys) {
      mlpoly::append_field(out, rp.g0);
      mlpoly::append_field(out, rp.g1);
    }
  }

  std::vector<uint8_t> to_bytes() const {
    std::vector<uint8_t> out;
    out.reserve(size_in_bytes());
    serialize(out);
    return out;
  }

  // The round count is not checked here; verify() owns that check.
  static SumcheckProof deserialize(mlpoly::ByteReader &in) {
    const uint64_t count = in.read_u64();
    if (count > in.remaining() / (2 * mlpoly::field_bytes<F>()))
      throw std::runtime_error("unexpected end of serialized data");
    SumcheckProof proof;
    proof.round_polys.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
      const F g0 = mlpoly::read_field<F>(in);
      const F g1 = mlpoly::read_field<F>(in);
      proof.round_polys.emplace_back(g0, g1);
    }
    return proof;
  }

  static SumcheckProof from_bytes(const std::vector<uint8_t> &bytes) {
    mlpoly::ByteReader in(bytes);
    SumcheckProof proof = deserialize(in);
    if (!in.exhausted())
      throw std::invalid_argument("trailing bytes after proof");
    return proof;
  }

  bool operator==(const SumcheckProof &o) const {
    return round_polys == o.round_polys;
  }
  bool operator!=(const SumcheckProof &o) const { return !(*this == o); }
};

} // namespace sumcheck

#endif // TYPES_HPP
