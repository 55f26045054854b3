#ifndef VOTE_LEDGER_GALOIS_FIELD_H
#define VOTE_LEDGER_GALOIS_FIELD_H

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace vl {
namespace crypto {

/**
 * Raised on division by (or inversion of) zero in GF(256).
 * Callers that validate share ids never reach it; seeing it means a defect.
 */
class DivisionByZero : public std::domain_error {
public:
  DivisionByZero() : std::domain_error("Division by zero in GF(256)") {}
};

/**
 * Arithmetic in GF(2^8) with the AES reduction polynomial x^8+x^4+x^3+x+1.
 *
 * Multiplication and division go through exp/log tables built from the
 * generator 3. The tables are computed once on first use and never change, so
 * concurrent readers need no locking.
 *
 * Lookups are indexed by secret-dependent values and are not constant time.
 */
class GF256 {
public:
  static constexpr uint16_t POLYNOMIAL = 0x11b;
  static constexpr uint8_t GENERATOR = 0x03;

  static uint8_t add(uint8_t a, uint8_t b) { return a ^ b; }
  static uint8_t sub(uint8_t a, uint8_t b) { return a ^ b; }

  static uint8_t mul(uint8_t a, uint8_t b);

  /** @throws DivisionByZero when b == 0 */
  static uint8_t div(uint8_t a, uint8_t b);

  /** @throws DivisionByZero when a == 0 */
  static uint8_t inv(uint8_t a);

  /**
   * Evaluate a polynomial at x with Horner's rule.
   * @param coeffs Coefficients, constant term first
   */
  static uint8_t evaluate(const std::vector<uint8_t> &coeffs, uint8_t x);

  static uint8_t exp(uint8_t power);
  static uint8_t log(uint8_t value);

private:
  struct Tables {
    std::array<uint8_t, 256> exp{};
    std::array<uint8_t, 256> log{};
    Tables();
  };

  static const Tables &tables();
};

} // namespace crypto
} // namespace vl

#endif // VOTE_LEDGER_GALOIS_FIELD_H
