// Copyright 2026 Tamaki Nishino
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <algorithm>
#include <array>
#include <complex>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "mobius/infinity.hpp"
#include "mobius/scalar_traits.hpp"
#include "mobius/types.hpp"

namespace mobius
{

// Integral coefficients are held as double; every other common type is kept.
template <typename... Ts>
struct promoted_scalar
{
  using common = std::common_type_t<Ts...>;
  using type = std::conditional_t<std::is_integral_v<common>, double, common>;
};

template <typename... Ts>
using promoted_scalar_t = typename promoted_scalar<Ts...>::type;

// z -> (a*z + b) / (c*z + d) on the extended plane.
//
// Coefficients are stored as given. (a, b, c, d) and (k*a, k*b, k*c, k*d)
// denote the same map, so equality is projective, never coefficient-wise.
// A zero determinant is accepted; inverse() and apply() stay defined,
// normalize() does not.
template <typename T>
class MobiusTransformation
{
public:
  using scalar_type = T;
  using Traits = ScalarTraits<T>;

  MobiusTransformation(
    const T & a, const T & b, const T & c, const T & d, Infinity<T> infinity = Infinity<T>())
  : a_(a), b_(b), c_(c), d_(d), infinity_(std::move(infinity))
  {
  }

  static MobiusTransformation identity()
  {
    return MobiusTransformation(Traits::one(), Traits::zero(), Traits::zero(), Traits::one());
  }

  const T & a() const { return a_; }
  const T & b() const { return b_; }
  const T & c() const { return c_; }
  const T & d() const { return d_; }

  std::array<T, 4> coefficients() const { return {a_, b_, c_, d_}; }
  Matrix2<T> as_matrix() const { return {{{a_, b_}, {c_, d_}}}; }

  const Infinity<T> & infinity() const { return infinity_; }
  MobiusTransformation with_infinity(Infinity<T> infinity) const
  {
    return MobiusTransformation(a_, b_, c_, d_, std::move(infinity));
  }

  // Image of z. An infinite z maps to a/c; a vanishing denominator maps to
  // the configured infinity. The zero test is exact.
  T apply(const T & z) const
  {
    T numer = a_;
    T denom = c_;
    if (!infinity_.is_infinity(z)) {
      numer = a_ * z + b_;
      denom = c_ * z + d_;
    }
    if (Traits::is_zero(denom)) {
      return infinity_.value();
    }
    return numer * Traits::inv(denom);
  }

  // A point of another scalar type is evaluated in the promoted type, e.g. a
  // double map on a std::complex<double> point.
  template <
    typename U, typename = std::enable_if_t<!std::is_same_v<U, T> && has_common_scalar_v<T, U>>>
  auto apply(const U & z) const
  {
    using P = promoted_scalar_t<T, U>;
    if constexpr (std::is_same_v<P, T>) {
      return apply(T(z));
    } else {
      return cast<P>().apply(P(z));
    }
  }

  T operator()(const T & z) const { return apply(z); }

  template <
    typename U, typename = std::enable_if_t<!std::is_same_v<U, T> && has_common_scalar_v<T, U>>>
  auto operator()(const U & z) const
  {
    return apply(z);
  }

  // (*this)(n(z)). The result keeps this map's infinity.
  MobiusTransformation compose(const MobiusTransformation & n) const
  {
    return MobiusTransformation(
      a_ * n.a_ + b_ * n.c_, a_ * n.b_ + b_ * n.d_, c_ * n.a_ + d_ * n.c_, c_ * n.b_ + d_ * n.d_,
      infinity_);
  }

  // Adjugate; a scalar multiple of the matrix inverse, which is the same map.
  MobiusTransformation inverse() const
  {
    return MobiusTransformation(d_, -b_, -c_, a_, infinity_);
  }

  MobiusTransformation scale(const T & lambda) const
  {
    return MobiusTransformation(lambda * a_, lambda * b_, lambda * c_, lambda * d_, infinity_);
  }

  T determinant() const { return a_ * d_ - b_ * c_; }

  bool is_degenerate() const { return Traits::is_zero(determinant()); }

  // Scaled by the inverse determinant. Requires !is_degenerate().
  MobiusTransformation normalize() const { return scale(Traits::inv(determinant())); }

  std::optional<MobiusTransformation> try_normalize() const
  {
    if (is_degenerate()) {
      return std::nullopt;
    }
    return normalize();
  }

  // Exact check on the stored coefficients: b = 0, c = 0, a = d.
  bool is_identity() const { return Traits::is_zero(b_) && Traits::is_zero(c_) && a_ == d_; }

  bool equals(const MobiusTransformation & n) const { return compose(n.inverse()).is_identity(); }

  // Hashes the images of 0, 1 and infinity. Over an exact field projectively
  // equal maps collide as operator== requires. Over floating scalars the
  // images of (a, b, c, d) and (k*a, k*b, k*c, k*d) may round apart, so equal
  // maps are only guaranteed to share a hash when k is a power of two.
  std::size_t hash() const
  {
    std::size_t seed = Traits::hash_value(apply(Traits::zero()));
    seed = hash_combine(seed, Traits::hash_value(apply(Traits::one())));
    return hash_combine(seed, Traits::hash_value(apply(infinity_.value())));
  }

  template <typename U>
  MobiusTransformation<U> cast() const
  {
    Infinity<U> infinity;
    if (infinity_.is_bound()) {
      infinity = Infinity<U>(U(infinity_.value()));
    }
    return MobiusTransformation<U>(U(a_), U(b_), U(c_), U(d_), std::move(infinity));
  }

private:
  T a_;
  T b_;
  T c_;
  T d_;
  Infinity<T> infinity_;
};

template <typename T>
MobiusTransformation<T> operator*(const MobiusTransformation<T> & m, const MobiusTransformation<T> & n)
{
  return m.compose(n);
}

template <typename T>
MobiusTransformation<T> operator*(const T & lambda, const MobiusTransformation<T> & m)
{
  return m.scale(lambda);
}

template <typename T>
bool operator==(const MobiusTransformation<T> & m, const MobiusTransformation<T> & n)
{
  return m.equals(n);
}

template <typename T>
bool operator!=(const MobiusTransformation<T> & m, const MobiusTransformation<T> & n)
{
  return !m.equals(n);
}

// Free-function algebra

template <typename T>
MobiusTransformation<T> compose(const MobiusTransformation<T> & m, const MobiusTransformation<T> & n)
{
  return m.compose(n);
}

template <typename T>
MobiusTransformation<T> invert(const MobiusTransformation<T> & m)
{
  return m.inverse();
}

template <typename T>
bool equals(const MobiusTransformation<T> & m, const MobiusTransformation<T> & n)
{
  return m.equals(n);
}

template <typename T>
bool isone(const MobiusTransformation<T> & m)
{
  return m.is_identity();
}

template <typename T>
T determinant(const MobiusTransformation<T> & m)
{
  return m.determinant();
}

template <typename T>
MobiusTransformation<T> normalize(const MobiusTransformation<T> & m)
{
  return m.normalize();
}

template <typename T>
Matrix2<T> as_matrix(const MobiusTransformation<T> & m)
{
  return m.as_matrix();
}

template <typename T>
std::size_t hash_value(const MobiusTransformation<T> & m)
{
  return m.hash();
}

// Construction

template <typename A, typename B, typename C, typename D>
auto transformation(const A & a, const B & b, const C & c, const D & d)
{
  static_assert(
    has_common_scalar_v<A, B, C, D>, "TypeMismatch: coefficients share no common scalar type");
  using T = promoted_scalar_t<A, B, C, D>;
  return MobiusTransformation<T>(T(a), T(b), T(c), T(d));
}

template <typename S>
auto transformation(const std::array<S, 4> & coeffs)
{
  return transformation(coeffs[0], coeffs[1], coeffs[2], coeffs[3]);
}

// Runtime-sized coefficient sequence [a, b, c, d]; nullopt unless it holds
// exactly four values. The range is traversed once, so input iterators work.
template <typename T, typename Range>
std::optional<MobiusTransformation<T>> from_coefficients(const Range & coeffs)
{
  std::array<std::optional<T>, 4> values;
  std::size_t count = 0;
  for (const auto & value : coeffs) {
    if (count == values.size()) {
      return std::nullopt;
    }
    values[count++].emplace(value);
  }
  if (count != values.size()) {
    return std::nullopt;
  }
  return MobiusTransformation<T>(*values[0], *values[1], *values[2], *values[3]);
}

template <typename T = std::complex<double>>
MobiusTransformation<T> identity_transformation()
{
  return MobiusTransformation<T>::identity();
}

// Display

template <typename T>
std::ostream & operator<<(std::ostream & os, const MobiusTransformation<T> & m)
{
  return os << "z -> (" << m.a() << "*z + " << m.b() << ") / (" << m.c() << "*z + " << m.d()
            << ")";
}

template <typename T>
std::string to_string(const MobiusTransformation<T> & m)
{
  std::ostringstream os;
  os << m;
  return os.str();
}

// Multi-line fraction:
//   Mobius:
//      (a)*z + b
//      ---------
//      (c)*z + d
template <typename T>
std::string to_pretty_string(const MobiusTransformation<T> & m)
{
  auto linear = [](const T & x, const T & y) {
    std::ostringstream os;
    os << "(" << x << ")*z + " << y;
    return os.str();
  };
  const std::string numer = linear(m.a(), m.b());
  const std::string denom = linear(m.c(), m.d());
  const std::string rule(std::max(numer.size(), denom.size()), '-');
  const std::string newline = "\n   ";
  return "Mobius:" + newline + numer + newline + rule + newline + denom;
}

extern template class MobiusTransformation<double>;
extern template class MobiusTransformation<std::complex<double>>;

}  // namespace mobius

namespace std
{

// Consistent with operator== for exact scalars. For floating scalars see
// MobiusTransformation::hash(): projectively equal maps built with different
// scale factors can land in different buckets.
template <typename T>
struct hash<mobius::MobiusTransformation<T>>
{
  size_t operator()(const mobius::MobiusTransformation<T> & m) const { return m.hash(); }
};

}  // namespace std
