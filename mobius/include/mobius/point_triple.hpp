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
#include <array>
#include <optional>

#include "mobius/infinity.hpp"
#include "mobius/mobius_transformation.hpp"

namespace mobius
{

// The map sending (0, 1, inf) to (x, y, z). Any one of the points may be
// infinite. x, y, z must be pairwise distinct; otherwise the result is
// degenerate and no error is reported.
template <typename T>
MobiusTransformation<T> from_canonical_triple(
  const T & x, const T & y, const T & z, const Infinity<T> & infinity = Infinity<T>())
{
  using Traits = ScalarTraits<T>;
  const T one = Traits::one();
  const T zero = Traits::zero();

  if (infinity.is_infinity(x)) {
    return MobiusTransformation<T>(z, y - z, one, zero, infinity);
  }
  if (infinity.is_infinity(y)) {
    return MobiusTransformation<T>(-z, x, -one, one, infinity);
  }
  if (infinity.is_infinity(z)) {
    return MobiusTransformation<T>(y - x, x, zero, one, infinity);
  }
  const T xy = y - x;
  const T yz = z - y;
  return MobiusTransformation<T>(z * xy, x * yz, xy, yz, infinity);
}

// The map sending (x, y, z) to (X, Y, Z), built from two canonical maps so
// the infinite cases are handled in one place. No division is performed.
template <typename T>
MobiusTransformation<T> from_triples(
  const T & x, const T & y, const T & z, const T & X, const T & Y, const T & Z,
  const Infinity<T> & infinity = Infinity<T>())
{
  const auto source = from_canonical_triple(x, y, z, infinity);
  const auto image = from_canonical_triple(X, Y, Z, infinity);
  return image.compose(source.inverse());
}

// Two infinite points coincide; finite points compare exactly.
template <typename T>
bool are_distinct(const T & p, const T & q, const Infinity<T> & infinity = Infinity<T>())
{
  const bool p_inf = infinity.is_infinity(p);
  const bool q_inf = infinity.is_infinity(q);
  if (p_inf || q_inf) {
    return p_inf != q_inf;
  }
  return !(p == q);
}

template <typename T>
bool are_distinct(
  const T & x, const T & y, const T & z, const Infinity<T> & infinity = Infinity<T>())
{
  return are_distinct(x, y, infinity) && are_distinct(y, z, infinity) &&
         are_distinct(x, z, infinity);
}

template <typename T>
std::optional<MobiusTransformation<T>> try_from_canonical_triple(
  const T & x, const T & y, const T & z, const Infinity<T> & infinity = Infinity<T>())
{
  if (!are_distinct(x, y, z, infinity)) {
    return std::nullopt;
  }
  return from_canonical_triple(x, y, z, infinity);
}

template <typename T>
std::optional<MobiusTransformation<T>> try_from_triples(
  const T & x, const T & y, const T & z, const T & X, const T & Y, const T & Z,
  const Infinity<T> & infinity = Infinity<T>())
{
  if (!are_distinct(x, y, z, infinity) || !are_distinct(X, Y, Z, infinity)) {
    return std::nullopt;
  }
  return from_triples(x, y, z, X, Y, Z, infinity);
}

// transformation() overloads taking points rather than coefficients

template <typename A, typename B, typename C>
auto transformation(const A & x, const B & y, const C & z)
{
  static_assert(has_common_scalar_v<A, B, C>, "TypeMismatch: points share no common scalar type");
  using T = promoted_scalar_t<A, B, C>;
  return from_canonical_triple<T>(T(x), T(y), T(z));
}

template <typename A, typename B, typename C, typename D, typename E, typename F>
auto transformation(const A & x, const B & y, const C & z, const D & X, const E & Y, const F & Z)
{
  static_assert(
    has_common_scalar_v<A, B, C, D, E, F>, "TypeMismatch: points share no common scalar type");
  using T = promoted_scalar_t<A, B, C, D, E, F>;
  return from_triples<T>(T(x), T(y), T(z), T(X), T(Y), T(Z));
}

template <typename T>
MobiusTransformation<T> transformation(const std::array<T, 3> & target)
{
  return from_canonical_triple(target[0], target[1], target[2]);
}

template <typename T>
MobiusTransformation<T> transformation(
  const std::array<T, 3> & source, const std::array<T, 3> & target)
{
  return from_triples(source[0], source[1], source[2], target[0], target[1], target[2]);
}

}  // namespace mobius
