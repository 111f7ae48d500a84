#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sumcheck {

enum class ErrorKind { InvalidProof, TranscriptMismatch, DimensionMismatch };

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidProof:
    return "invalid proof";
  case ErrorKind::TranscriptMismatch:
    return "transcript mismatch";
  case ErrorKind::DimensionMismatch:
    return "dimension mismatch";
  }
  return "unknown error";
}

/* -------------------------------------------------------------------- *
 *  Verification-time failures. A rejected-but-well-formed proof is NOT  *
 *  an error: verify() reports that through its boolean result.          *
 * -------------------------------------------------------------------- */
class SumcheckError : public std::runtime_error {
  ErrorKind kind_;

public:
  SumcheckError(ErrorKind kind, const std::string &what)
      : std::runtime_error(std::string(to_string(kind)) + ": " + what),
        kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }
};

// a round polynomial does not sum to the running claim
class InvalidProof : public SumcheckError {
public:
  explicit InvalidProof(const std::string &what)
      : SumcheckError(ErrorKind::InvalidProof, what) {}
};

// never raised by the base protocol
class TranscriptMismatch : public SumcheckError {
public:
  explicit TranscriptMismatch(const std::string &what)
      : SumcheckError(ErrorKind::TranscriptMismatch, what) {}
};

// wrong number of rounds, challenges or evaluation coordinates
class DimensionMismatch : public SumcheckError {
public:
  explicit DimensionMismatch(const std::string &what)
      : SumcheckError(ErrorKind::DimensionMismatch, what) {}
};

} // namespace sumcheck

#endif // ERRORS_HPP
