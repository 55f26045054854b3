#include "GaloisField.h"

namespace vl {
namespace crypto {

namespace {

// Multiply by x modulo the field polynomial
uint8_t xtime(uint8_t a) {
  uint16_t r = static_cast<uint16_t>(a) << 1;
  if (r & 0x100) {
    r ^= GF256::POLYNOMIAL;
  }
  return static_cast<uint8_t>(r);
}

} // namespace

GF256::Tables::Tables() {
  uint8_t x = 1;
  for (int i = 0; i < 255; ++i) {
    exp[i] = x;
    log[x] = static_cast<uint8_t>(i);
    // x *= 3, i.e. x*2 + x
    x = static_cast<uint8_t>(xtime(x) ^ x);
  }
  exp[255] = exp[0];
  // log[0] is undefined and never read
}

const GF256::Tables &GF256::tables() {
  static const Tables instance;
  return instance;
}

uint8_t GF256::exp(uint8_t power) { return tables().exp[power]; }

uint8_t GF256::log(uint8_t value) {
  if (value == 0) {
    throw std::domain_error("Logarithm of zero in GF(256)");
  }
  return tables().log[value];
}

uint8_t GF256::mul(uint8_t a, uint8_t b) {
  if (a == 0 || b == 0) {
    return 0;
  }
  const auto &t = tables();
  return t.exp[(t.log[a] + t.log[b]) % 255];
}

uint8_t GF256::div(uint8_t a, uint8_t b) {
  if (b == 0) {
    throw DivisionByZero();
  }
  if (a == 0) {
    return 0;
  }
  const auto &t = tables();
  return t.exp[(t.log[a] - t.log[b] + 255) % 255];
}

uint8_t GF256::inv(uint8_t a) {
  if (a == 0) {
    throw DivisionByZero();
  }
  const auto &t = tables();
  return t.exp[(255 - t.log[a]) % 255];
}

uint8_t GF256::evaluate(const std::vector<uint8_t> &coeffs, uint8_t x) {
  uint8_t result = 0;
  for (auto it = coeffs.rbegin(); it != coeffs.rend(); ++it) {
    result = add(mul(result, x), *it);
  }
  return result;
}

} // namespace crypto
} // namespace vl
