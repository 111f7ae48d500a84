#ifndef TRANSCRIPT_HPP
#define TRANSCRIPT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "field_bytes.hpp"

namespace sumcheck {

/* -------------------------------------------------------------------- *
 *  Fiat-Shamir transcript over BLAKE2s-256.                             *
 *                                                                      *
 *  Two transcripts built from the same domain and fed the same         *
 *  append_* calls in the same order hand out the same challenges;      *
 *  that replay is all the verifier relies on.                          *
 *                                                                      *
 *  A challenge is squeezed from a fork of the running state; the live  *
 *  state is then ratcheted with the squeezed bytes, so every later     *
 *  challenge depends on every earlier one.                             *
 * -------------------------------------------------------------------- */
class Transcript {
public:
  static constexpr size_t kChallengeBytes = 32;
  using Challenge = std::array<uint8_t, kChallengeBytes>;

  explicit Transcript(const std::string &domain);
  Transcript(const Transcript &other);
  Transcript &operator=(const Transcript &other);
  Transcript(Transcript &&) noexcept = default;
  Transcript &operator=(Transcript &&) noexcept = default;
  ~Transcript() = default;

  void append_message(const std::string &label, const uint8_t *bytes,
                      size_t len);
  void append_message(const std::string &label,
                      const std::vector<uint8_t> &bytes) {
    append_message(label, bytes.data(), bytes.size());
  }

  template <class F> void append_field(const std::string &label, const F &x) {
    append_message(label, mlpoly::field_to_bytes(x));
  }

  Challenge challenge_bytes(const std::string &label);

  template <class F> F challenge_scalar(const std::string &label) {
    const Challenge out = challenge_bytes(label);
    return mlpoly::from_le_bytes_mod_order<F>(out.data(), out.size());
  }

  uint64_t challenge_count() const { return ctr; }

private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
  };
  using CtxPtr = std::unique_ptr<EVP_MD_CTX, CtxDeleter>;

  static CtxPtr clone_ctx(const EVP_MD_CTX *src);
  static void absorb(EVP_MD_CTX *ctx, const void *data, size_t len);
  static void absorb_u64(EVP_MD_CTX *ctx, uint64_t v);

  CtxPtr h;
  uint64_t ctr;
};

} // namespace sumcheck

#endif // TRANSCRIPT_HPP
