#include "transcript.hpp"

#include <stdexcept>

namespace sumcheck {

namespace {

const char kAppendTag[] = "APPEND_MESSAGE";
const char kChallengeTag[] = "chal";
const char kRatchetTag[] = "ratchet";

} // namespace

Transcript::Transcript(const std::string &domain) : ctr(0) {
  h.reset(EVP_MD_CTX_new());
  if (!h || EVP_DigestInit_ex(h.get(), EVP_blake2s256(), nullptr) != 1)
    throw std::runtime_error("transcript: cannot initialise BLAKE2s-256");
  absorb(h.get(), domain.data(), domain.size());
  absorb_u64(h.get(), domain.size());
  absorb(h.get(), domain.data(), domain.size());
}

Transcript::Transcript(const Transcript &other)
    : h(clone_ctx(other.h.get())), ctr(other.ctr) {}

Transcript &Transcript::operator=(const Transcript &other) {
  if (this != &other) {
    h = clone_ctx(other.h.get());
    ctr = other.ctr;
  }
  return *this;
}

Transcript::CtxPtr Transcript::clone_ctx(const EVP_MD_CTX *src) {
  if (src == nullptr)
    throw std::logic_error("transcript: use of a moved-from transcript");
  CtxPtr dst(EVP_MD_CTX_new());
  if (!dst || EVP_MD_CTX_copy_ex(dst.get(), src) != 1)
    throw std::runtime_error("transcript: cannot copy hash state");
  return dst;
}

void Transcript::absorb(EVP_MD_CTX *ctx, const void *data, size_t len) {
  if (ctx == nullptr)
    throw std::logic_error("transcript: use of a moved-from transcript");
  if (len != 0 && EVP_DigestUpdate(ctx, data, len) != 1)
    throw std::runtime_error("transcript: hash update failed");
}

void Transcript::absorb_u64(EVP_MD_CTX *ctx, uint64_t v) {
  uint8_t le[8];
  for (size_t i = 0; i < 8; ++i)
    le[i] = static_cast<uint8_t>(v >> (8 * i));
  absorb(ctx, le, sizeof(le));
}

// tag || |label| || label || |msg| || msg
void Transcript::append_message(const std::string &label, const uint8_t *bytes,
                                size_t len) {
  absorb(h.get(), kAppendTag, sizeof(kAppendTag) - 1);
  absorb_u64(h.get(), label.size());
  absorb(h.get(), label.data(), label.size());
  absorb_u64(h.get(), len);
  absorb(h.get(), bytes, len);
}

Transcript::Challenge Transcript::challenge_bytes(const std::string &label) {
  CtxPtr fork = clone_ctx(h.get());
  absorb(fork.get(), kChallengeTag, sizeof(kChallengeTag) - 1);
  absorb_u64(fork.get(), label.size());
  absorb(fork.get(), label.data(), label.size());
  absorb_u64(fork.get(), ctr);

  Challenge out;
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(fork.get(), out.data(), &out_len) != 1 ||
      out_len != out.size())
    throw std::runtime_error("transcript: hash finalisation failed");

  absorb(h.get(), kRatchetTag, sizeof(kRatchetTag) - 1);
  absorb(h.get(), out.data(), out.size());
  ++ctr;
  return out;
}

} // namespace sumcheck
