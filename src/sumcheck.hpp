// sumcheck.hpp
#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "multilinear.hpp"
#include "oracle.hpp"
#include "transcript.hpp"
#include "types.hpp"

namespace sumcheck {

using FieldT = mlpoly::FieldT;

// transcript labels shared by prover and verifier
namespace labels {
constexpr const char *g0 = "g0";
constexpr const char *g1 = "g1";
constexpr const char *r = "r";
} // namespace labels

/* ===================================================================== *
 *  Prover: linear-time, one table that shrinks with every round         *
 *  2^n -> 2^{n-1} -> ... -> 1                                           *
 * ===================================================================== */
template <class F> class Prover {
  mlpoly::MLPoly<F> table; // current slice, arity n - processed
  const size_t n;
  size_t processed; // how many coordinates are already fixed

public:
  explicit Prover(const mlpoly::MLPoly<F> &g_)
      : table(g_), n(g_.num_variables()), processed(0) {}

  size_t num_variables() const { return n; }
  size_t round() const { return processed; }
  const mlpoly::MLPoly<F> &current() const { return table; }

  /* round polynomial for x_{processed+1}: sums of the even / odd halves */
  RoundPoly<F> next_round_poly() const {
    if (processed >= n)
      throw DimensionMismatch("all variables are already bound");
    const auto sums = table.round_sum_g0_g1();
    return RoundPoly<F>(sums.first, sums.second);
  }

  void fold_challenge(const F &r) {
    if (processed >= n)
      throw DimensionMismatch("no unbound variable left to fold");
    table = table.fold_first_var(r);
    ++processed;
  }
};

/* -------------------------------------------------------------------- *
 *  Verifier state: running claim and the challenges bound so far.       *
 *  Drives the interactive protocol directly (update_challenge samples   *
 *  fresh randomness) and is replayed by the Fiat-Shamir verify() below  *
 *  through check_round / bind.                                          *
 * -------------------------------------------------------------------- */
template <class F> class Verifier {
  const Statement<F> stmt;
  F current_claim;
  std::vector<F> fixed; // r_1, ..., r_k

public:
  explicit Verifier(const Statement<F> &stmt_)
      : stmt(stmt_), current_claim(stmt_.claim_sum) {
    fixed.reserve(stmt_.n_vars);
  }

  const F &claim() const { return current_claim; }
  const std::vector<F> &challenges() const { return fixed; }

  void check_round(const RoundPoly<F> &p) const {
    if (fixed.size() >= stmt.n_vars)
      throw DimensionMismatch("more round polynomials than variables");
    if (p.sum_over_binary() != current_claim) {
      std::cerr << "Sumcheck round " << fixed.size() + 1 << " failed\n";
      throw InvalidProof("sum check failed");
    }
  }

  // the new claim is p(r)
  void bind(const RoundPoly<F> &p, const F &r) {
    fixed.push_back(r);
    current_claim = p.eval(r);
  }

  F update_challenge(const RoundPoly<F> &p) {
    check_round(p);
    const F r = F::random_element();
    bind(p, r);
    return r;
  }

  /* false is a rejected proof, not an error */
  bool finalize_with_oracle(const Oracle<F> &oracle) const {
    if (fixed.size() != stmt.n_vars)
      throw DimensionMismatch("r_vec length mismatch: " +
                              std::to_string(fixed.size()) + " challenges for " +
                              std::to_string(stmt.n_vars) + " variables");
    return oracle.query(fixed) == current_claim;
  }

  bool verify(Prover<F> &prover, const Oracle<F> &oracle) {
    if (prover.num_variables() != stmt.n_vars)
      throw DimensionMismatch("prover and statement disagree on n_vars");
    for (size_t round = 0; round < stmt.n_vars; ++round) {
      const RoundPoly<F> p = prover.next_round_poly();
      prover.fold_challenge(update_challenge(p));
    }
    return finalize_with_oracle(oracle);
  }
};

/*
 * Non-interactive prover. Every round absorbs g(0), g(1) and squeezes the
 * challenge that binds the next variable. `stmt.claim_sum` is not checked:
 * a wrong claim simply yields a proof that verify() rejects.
 */
template <class F>
SumcheckProof<F> prove(const Statement<F> &stmt, const mlpoly::MLPoly<F> &poly,
                       Transcript &transcript) {
  if (poly.num_variables() != stmt.n_vars)
    throw DimensionMismatch("polynomial has " +
                            std::to_string(poly.num_variables()) +
                            " variables, statement has " +
                            std::to_string(stmt.n_vars));
  Prover<F> prover(poly);
  SumcheckProof<F> proof;
  proof.round_polys.reserve(stmt.n_vars);

  for (size_t round = 0; round < stmt.n_vars; ++round) {
    const RoundPoly<F> p = prover.next_round_poly();
    transcript.append_field(labels::g0, p.g0);
    transcript.append_field(labels::g1, p.g1);
    proof.round_polys.push_back(p);

    const F r = transcript.challenge_scalar<F>(labels::r);
    prover.fold_challenge(r);
  }
  return proof;
}

/*
 * Verifier side. `transcript` must be fresh and built from the prover's
 * domain. Throws DimensionMismatch for a proof of the wrong length and
 * InvalidProof at the first round whose g(0) + g(1) misses the claim;
 * otherwise returns whether the oracle agrees with the final claim.
 */
template <class F>
bool verify(const Statement<F> &stmt, const SumcheckProof<F> &proof,
            const Oracle<F> &oracle, Transcript &transcript) {
  if (proof.num_rounds() != stmt.n_vars)
    throw DimensionMismatch("wrong number of round polynomials: " +
                            std::to_string(proof.num_rounds()) +
                            ", expected " + std::to_string(stmt.n_vars));
  Verifier<F> verifier(stmt);

  for (const auto &p : proof.round_polys) {
    verifier.check_round(p);
    // replay exactly what the prover absorbed
    transcript.append_field(labels::g0, p.g0);
    transcript.append_field(labels::g1, p.g1);
    const F r = transcript.challenge_scalar<F>(labels::r);
    verifier.bind(p, r);
  }
  return verifier.finalize_with_oracle(oracle);
}

} // namespace sumcheck
