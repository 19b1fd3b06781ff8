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
#include <cmath>
#include <complex>
#include <cstddef>
#include <functional>
#include <limits>
#include <type_traits>

namespace mobius
{

// Mix a value hash into a running seed.
std::size_t hash_combine(std::size_t seed, std::size_t value);

// Field operations the transformation and projection code relies on.
// A scalar type plugs in by specializing this template with:
//   real_type, complex_type
//   zero(), one(), is_zero(x), inv(x)
//   is_infinite(x), infinity(), hash_value(x)
//   make_complex(re, im), real_part(z), imag_part(z)
// Comparisons are exact; no tolerance is applied anywhere.
template <typename T, typename Enable = void>
struct ScalarTraits;

template <typename F>
struct ScalarTraits<F, std::enable_if_t<std::is_floating_point_v<F>>>
{
  using real_type = F;
  using complex_type = std::complex<F>;

  static F zero() { return F(0); }
  static F one() { return F(1); }
  static bool is_zero(const F & x) { return x == F(0); }
  static F inv(const F & x) { return F(1) / x; }

  static bool is_infinite(const F & x) { return std::isinf(x); }
  static F infinity() { return std::numeric_limits<F>::infinity(); }

  // -0.0 + 0.0 == +0.0
  static std::size_t hash_value(const F & x) { return std::hash<F>{}(x + F(0)); }

  static complex_type make_complex(const F & re, const F & im) { return complex_type(re, im); }
  static F real_part(const complex_type & z) { return z.real(); }
  static F imag_part(const complex_type & z) { return z.imag(); }
};

template <typename F>
struct ScalarTraits<std::complex<F>, std::enable_if_t<std::is_floating_point_v<F>>>
{
  using real_type = F;
  using complex_type = std::complex<F>;

  static complex_type zero() { return complex_type(F(0), F(0)); }
  static complex_type one() { return complex_type(F(1), F(0)); }
  static bool is_zero(const complex_type & z) { return z.real() == F(0) && z.imag() == F(0); }
  static complex_type inv(const complex_type & z) { return F(1) / z; }

  // Either component infinite, matching the extended-plane convention.
  static bool is_infinite(const complex_type & z)
  {
    return std::isinf(z.real()) || std::isinf(z.imag());
  }
  static complex_type infinity()
  {
    return complex_type(std::numeric_limits<F>::infinity(), F(0));
  }

  static std::size_t hash_value(const complex_type & z)
  {
    const std::size_t h = std::hash<F>{}(z.real() + F(0));
    return hash_combine(h, std::hash<F>{}(z.imag() + F(0)));
  }

  static complex_type make_complex(const F & re, const F & im) { return complex_type(re, im); }
  static F real_part(const complex_type & z) { return z.real(); }
  static F imag_part(const complex_type & z) { return z.imag(); }
};

}  // namespace mobius
