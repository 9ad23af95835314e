#include <verdict/crypto/curve.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace verdict::crypto {

namespace {

namespace mp = boost::multiprecision;
using field_t = mp::cpp_int;

const field_t& field_prime() {
  static const field_t p = (field_t{1} << 255) - 19;
  return p;
}

field_t inverse(const field_t& value) {
  const auto& p = field_prime();
  field_t result = mp::powm(value, field_t{p - 2}, p);
  return result;
}

// d = -121665 / 121666 (mod p)
const field_t& edwards_d() {
  static const field_t d = [] {
    const auto& p = field_prime();
    field_t numerator = p - 121665;
    field_t value = (numerator * inverse(field_t{121666})) % p;
    return value;
  }();
  return d;
}

field_t load_y(const verdict::schema::pubkey_t& bytes) {
  field_t y{};
  for (auto i = bytes.size(); i-- > 0;) {
    y <<= 8;
    y |= bytes[i];
  }
  // The top bit carries the sign of x, not part of y.
  mp::bit_unset(y, 255);
  field_t reduced = y % field_prime();
  return reduced;
}

}  // namespace

bool is_on_curve(const verdict::schema::pubkey_t& bytes) {
  const auto& p = field_prime();
  const field_t y = load_y(bytes);
  const field_t yy = (y * y) % p;

  // -x^2 + y^2 = 1 + d x^2 y^2  =>  x^2 = (y^2 - 1) / (d y^2 + 1)
  const field_t u = (yy + p - 1) % p;
  const field_t v = (edwards_d() * yy + 1) % p;
  const field_t xx = (u * inverse(v)) % p;
  if (xx.is_zero()) {
    return true;
  }

  // Euler's criterion: xx is a square iff xx^((p-1)/2) == 1.
  const field_t exponent = (p - 1) >> 1;
  const field_t legendre = mp::powm(xx, exponent, p);
  return legendre == 1;
}

}  // namespace verdict::crypto
