#ifndef ORACLE_HPP
#define ORACLE_HPP

#include <utility>
#include <vector>

#include "multilinear.hpp"

namespace sumcheck {

// Answers the verifier's single point query at the end of the protocol.
template <class F> class Oracle {
public:
  virtual ~Oracle() = default;
  virtual F query(const std::vector<F> &point) const = 0;
};

/*
 * Direct access to the polynomial. Stands in for a commitment opening
 * in tests and whenever the verifier holds the table itself.
 */
template <class F> class PolyOracle : public Oracle<F> {
  mlpoly::MLPoly<F> poly_;

public:
  explicit PolyOracle(mlpoly::MLPoly<F> poly) : poly_(std::move(poly)) {}

  F query(const std::vector<F> &point) const override {
    return poly_.eval_at(point);
  }

  const mlpoly::MLPoly<F> &poly() const { return poly_; }
};

} // namespace sumcheck

#endif // ORACLE_HPP
