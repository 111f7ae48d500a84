// multilinear.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifdef MULTICORE
#include <omp.h>
#endif

#include "errors.hpp"
#include "field_bytes.hpp"

namespace mlpoly {

/* ----------------------------------------------------------- *
 *  Multilinear polynomial in evaluation form.                  *
 *  evals[i] = f(b_1, ..., b_n) where b_1 is the least          *
 *  significant bit of i, so x_1 pairs neighbouring entries:    *
 *  (evals[2j], evals[2j+1]) differ only in x_1.                *
 * ----------------------------------------------------------- */
template <class F> class MLPoly {
  size_t n;              // #variables  (= log_2 |values|)
  std::vector<F> values; // evaluations on the Boolean cube

  MLPoly(size_t n_, std::vector<F> v) : n(n_), values(std::move(v)) {}

public:
  static MLPoly zero(size_t n_vars) {
    if (n_vars >= 8 * sizeof(size_t))
      throw std::invalid_argument("n_vars too large for an evaluation table");
    return MLPoly(n_vars, std::vector<F>(size_t(1) << n_vars, F::zero()));
  }

  static MLPoly from_evals(std::vector<F> evals) {
    const size_t len = evals.size();
    if (len == 0 || (len & (len - 1)) != 0)
      throw std::invalid_argument("evals length must be a power of two");
    size_t n_vars = 0;
    while ((size_t(1) << n_vars) < len)
      ++n_vars; // derive n
    return MLPoly(n_vars, std::move(evals));
  }

  size_t num_variables() const { return n; }
  size_t len() const { return values.size(); }
  bool is_constant() const { return n == 0; }
  const std::vector<F> &evals() const { return values; }

  // nullptr when index is outside the cube
  const F *get(size_t index) const {
    return index < values.size() ? &values[index] : nullptr;
  }

  F sum_all() const {
    F acc = F::zero();
    for (const auto &v : values)
      acc += v;
    return acc;
  }

  /*
   * f'(x_2, ..., x_n) = f(r, x_2, ..., x_n).
   * With every other coordinate fixed f is linear in x_1, so each pair
   * (v0, v1) = (f(0, ...), f(1, ...)) collapses to (1-r)*v0 + r*v1.
   * r = 0 keeps the even entries, r = 1 the odd ones.
   */
  MLPoly fold_first_var(const F &r) const {
    if (n == 0)
      throw std::invalid_argument("cannot fold a constant polynomial");
    const F one_minus_r = F::one() - r;
    const size_t half = values.size() >> 1;
    std::vector<F> out(half);
#ifdef MULTICORE
#pragma omp parallel for
#endif
    for (size_t i = 0; i < half; ++i)
      out[i] = values[2 * i] * one_minus_r + values[2 * i + 1] * r;
    return MLPoly(n - 1, std::move(out));
  }

  // f(r_1, ..., r_k, x_{k+1}, ..., x_n)
  MLPoly fold_many(const std::vector<F> &r_vec) const {
    if (r_vec.size() > n)
      throw sumcheck::DimensionMismatch(
          "too many r values: given " + std::to_string(r_vec.size()) +
          ", but n_vars is " + std::to_string(n));
    std::vector<F> tmp = values;
    for (const auto &r : r_vec)
      fold_once_inplace(tmp, r);
    return MLPoly(n - r_vec.size(), std::move(tmp));
  }

  /*
   * Evaluate the multilinear extension at an arbitrary field point.
   * After the i-th fold the table holds g(x_1, ..., x_i, ...) with arity
   * n-i, so the length halves each time: 2^n -> 2^{n-1} -> ... -> 1.
   */
  F eval_at(const std::vector<F> &x) const {
    if (x.size() != n)
      throw sumcheck::DimensionMismatch(
          "wrong number of evaluation points: given " +
          std::to_string(x.size()) + ", expected " + std::to_string(n));
    std::vector<F> tmp = values;
    for (const auto &xi : x)
      fold_once_inplace(tmp, xi);
    return tmp.front();
  }

  /*
   * (g(0), g(1)) of the round polynomial for x_1:
   *   g(0) = sum over x_2..x_n of f(0, x_2, ..., x_n)   (even entries)
   *   g(1) = sum over x_2..x_n of f(1, x_2, ..., x_n)   (odd entries)
   * One pass, nothing folded. A constant has no x_1; it reports (f, 0).
   */
  std::pair<F, F> round_sum_g0_g1() const {
    if (n == 0)
      return {values.front(), F::zero()};
    const size_t half = values.size() >> 1;
#ifdef MULTICORE
    const size_t chunks = static_cast<size_t>(omp_get_max_threads());
#else
    const size_t chunks = 1;
#endif
    std::vector<F> part0(chunks, F::zero());
    std::vector<F> part1(chunks, F::zero());
    const size_t per_chunk = (half + chunks - 1) / chunks;
#ifdef MULTICORE
#pragma omp parallel for
#endif
    for (size_t c = 0; c < chunks; ++c) {
      const size_t end = std::min(half, (c + 1) * per_chunk);
      for (size_t j = c * per_chunk; j < end; ++j) {
        part0[c] += values[2 * j];
        part1[c] += values[2 * j + 1];
      }
    }
    F g0 = F::zero();
    F g1 = F::zero();
    for (size_t c = 0; c < chunks; ++c) {
      g0 += part0[c];
      g1 += part1[c];
    }
    return {g0, g1};
  }

  // Fold to half, overwriting the front of vec. Caller owns the copy.
  static void fold_once_inplace(std::vector<F> &vec, const F &r) {
    const size_t sz = vec.size();
    if (sz < 2 || sz % 2 != 0)
      throw std::invalid_argument("Invalid table size for folding");
    const F one_minus_r = F::one() - r;
    const size_t half = sz >> 1;
    for (size_t pair = 0; pair < half; ++pair) {
      // each pair is read before slot `pair` can be overwritten
      const F v0 = vec[2 * pair];
      const F v1 = vec[2 * pair + 1];
      vec[pair] = v0 * one_minus_r + v1 * r;
    }
    vec.resize(half);
  }

  /* -------- canonical encoding: u64 n, u64 len, len field elements -------- */
  void serialize(std::vector<uint8_t> &out) const {
    append_u64(out, static_cast<uint64_t>(n));
    append_u64(out, static_cast<uint64_t>(values.size()));
    for (const auto &v : values)
      append_field(out, v);
  }

  std::vector<uint8_t> to_bytes() const {
    std::vector<uint8_t> out;
    out.reserve(16 + values.size() * field_bytes<F>());
    serialize(out);
    return out;
  }

  static MLPoly deserialize(ByteReader &in) {
    const uint64_t n_vars = in.read_u64();
    const uint64_t len = in.read_u64();
    if (n_vars >= 8 * sizeof(size_t) || len != (uint64_t(1) << n_vars))
      throw std::invalid_argument("evaluation table length must be 2^n_vars");
    if (len > in.remaining() / field_bytes<F>())
      throw std::runtime_error("unexpected end of serialized data");
    std::vector<F> evals;
    evals.reserve(static_cast<size_t>(len));
    for (uint64_t i = 0; i < len; ++i)
      evals.push_back(read_field<F>(in));
    return MLPoly(static_cast<size_t>(n_vars), std::move(evals));
  }

  static MLPoly from_bytes(const std::vector<uint8_t> &bytes) {
    ByteReader in(bytes);
    MLPoly p = deserialize(in);
    if (!in.exhausted())
      throw std::invalid_argument("trailing bytes after polynomial");
    return p;
  }

  bool operator==(const MLPoly &other) const {
    return n == other.n && values == other.values;
  }
  bool operator!=(const MLPoly &other) const { return !(*this == other); }
};

} // namespace mlpoly
