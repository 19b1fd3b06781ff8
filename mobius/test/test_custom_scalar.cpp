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

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <functional>
#include <numeric>
#include <ostream>
#include <unordered_set>
#include <vector>

#include "mobius/mobius_transformation.hpp"
#include "mobius/point_triple.hpp"
#include "mobius/stereographic_projection.hpp"

namespace
{

// Exact rational with int64 parts, always in lowest terms with den > 0.
struct Rational
{
  int64_t num = 0;
  int64_t den = 1;

  Rational() = default;
  Rational(int64_t n, int64_t d = 1) : num(n), den(d)
  {
    if (den < 0) {
      num = -num;
      den = -den;
    }
    const int64_t g = std::gcd(num, den);
    if (g > 1) {
      num /= g;
      den /= g;
    }
  }
};

Rational operator+(const Rational & a, const Rational & b)
{
  return Rational(a.num * b.den + b.num * a.den, a.den * b.den);
}
Rational operator-(const Rational & a) { return Rational(-a.num, a.den); }
Rational operator-(const Rational & a, const Rational & b) { return a + (-b); }
Rational operator*(const Rational & a, const Rational & b)
{
  return Rational(a.num * b.num, a.den * b.den);
}
bool operator==(const Rational & a, const Rational & b) { return a.num == b.num && a.den == b.den; }

// Gaussian rational re + im*i, plus one flagged point at infinity.
// Any arithmetic touching infinity yields infinity.
struct Gaussian
{
  Rational re;
  Rational im;
  bool infinite = false;

  Gaussian() = default;
  Gaussian(Rational r, Rational i = Rational()) : re(r), im(i) {}

  static Gaussian infinity()
  {
    Gaussian g;
    g.infinite = true;
    return g;
  }
};

Gaussian operator+(const Gaussian & a, const Gaussian & b)
{
  if (a.infinite || b.infinite) {
    return Gaussian::infinity();
  }
  return Gaussian(a.re + b.re, a.im + b.im);
}
Gaussian operator-(const Gaussian & a)
{
  if (a.infinite) {
    return a;
  }
  return Gaussian(-a.re, -a.im);
}
Gaussian operator-(const Gaussian & a, const Gaussian & b) { return a + (-b); }
Gaussian operator*(const Gaussian & a, const Gaussian & b)
{
  if (a.infinite || b.infinite) {
    return Gaussian::infinity();
  }
  return Gaussian(a.re * b.re - a.im * b.im, a.re * b.im + a.im * b.re);
}
bool operator==(const Gaussian & a, const Gaussian & b)
{
  if (a.infinite || b.infinite) {
    return a.infinite == b.infinite;
  }
  return a.re == b.re && a.im == b.im;
}

std::ostream & operator<<(std::ostream & os, const Gaussian & g)
{
  if (g.infinite) {
    return os << "inf";
  }
  return os << g.re.num << "/" << g.re.den << " + " << g.im.num << "/" << g.im.den << "i";
}

Gaussian G(int64_t re_num, int64_t re_den = 1, int64_t im_num = 0, int64_t im_den = 1)
{
  return Gaussian(Rational(re_num, re_den), Rational(im_num, im_den));
}

}  // namespace

namespace mobius
{

template <>
struct ScalarTraits<Gaussian>
{
  using real_type = Gaussian;
  using complex_type = Gaussian;

  static Gaussian zero() { return G(0); }
  static Gaussian one() { return G(1); }
  static bool is_zero(const Gaussian & x) { return !x.infinite && x == G(0); }
  static Gaussian inv(const Gaussian & x)
  {
    if (x.infinite) {
      return G(0);
    }
    const Rational norm = x.re * x.re + x.im * x.im;
    const Rational inv_norm(norm.den, norm.num);
    return Gaussian(x.re * inv_norm, -x.im * inv_norm);
  }

  static bool is_infinite(const Gaussian & x) { return x.infinite; }
  static Gaussian infinity() { return Gaussian::infinity(); }

  static std::size_t hash_value(const Gaussian & x)
  {
    if (x.infinite) {
      return 0;
    }
    std::size_t h = std::hash<int64_t>{}(x.re.num);
    h = hash_combine(h, std::hash<int64_t>{}(x.re.den));
    h = hash_combine(h, std::hash<int64_t>{}(x.im.num));
    return hash_combine(h, std::hash<int64_t>{}(x.im.den));
  }

  // Coordinates are Gaussians on the real line; i comes from the field itself.
  static Gaussian make_complex(const Gaussian & re, const Gaussian & im)
  {
    return re + im * G(0, 1, 1, 1);
  }
  static Gaussian real_part(const Gaussian & z) { return Gaussian(z.re); }
  static Gaussian imag_part(const Gaussian & z) { return Gaussian(z.im); }
};

}  // namespace mobius

namespace
{

class CustomScalarTest : public ::testing::Test
{
protected:
  void TearDown() override { mobius::reset_infinity<Gaussian>(); }
};

}  // namespace

TEST_F(CustomScalarTest, ExactArithmetic)
{
  EXPECT_EQ(G(1, 2) + G(1, 3), G(5, 6));
  EXPECT_EQ(mobius::ScalarTraits<Gaussian>::inv(G(0, 1, 1, 1)), G(0, 1, -1, 1));
  EXPECT_EQ(mobius::ScalarTraits<Gaussian>::inv(G(3, 1, 4, 1)), G(3, 25, -4, 25));
}

TEST_F(CustomScalarTest, ReciprocalMap)
{
  const auto m = mobius::transformation(G(0), G(1), G(1), G(0));
  EXPECT_EQ(m(G(2)), G(1, 2));
  EXPECT_EQ(m(G(0)), Gaussian::infinity());
  EXPECT_EQ(m(Gaussian::infinity()), G(0));
}

TEST_F(CustomScalarTest, CanonicalTripleIsExact)
{
  const Gaussian inf = Gaussian::infinity();
  const Gaussian x = G(1, 2, 1, 1);
  const Gaussian y = G(-3, 1, 2, 3);
  const Gaussian z = G(0, 1, -5, 7);

  const std::vector<std::array<Gaussian, 3>> triples = {
    {x, y, z},
    {inf, y, z},
    {x, inf, z},
    {x, y, inf},
  };
  for (const auto & t : triples) {
    const auto m = mobius::transformation(t);
    EXPECT_EQ(m(G(0)), t[0]);
    EXPECT_EQ(m(G(1)), t[1]);
    EXPECT_EQ(m(inf), t[2]);
  }

  EXPECT_EQ(
    mobius::from_canonical_triple(G(0), G(1), inf), mobius::identity_transformation<Gaussian>());
}

TEST_F(CustomScalarTest, SixPointSolverIsExact)
{
  const Gaussian inf = Gaussian::infinity();
  const std::array<Gaussian, 3> src = {G(1, 3), inf, G(2, 1, -1, 2)};
  const std::array<Gaussian, 3> dst = {G(0, 1, 1, 1), G(4), G(-1, 5)};
  const auto m = mobius::transformation(src, dst);
  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(m(src[i]), dst[i]);
  }
  const auto back = mobius::invert(m);
  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(back(dst[i]), src[i]);
  }
}

TEST_F(CustomScalarTest, ProjectiveEqualityAndHash)
{
  const auto m = mobius::transformation(G(1), G(2, 1, 1, 1), G(0, 1, 3, 1), G(5));
  const Gaussian lambda = G(2, 3, 1, 5);
  const auto scaled = lambda * m;
  EXPECT_EQ(m, scaled);
  EXPECT_EQ(m.hash(), scaled.hash());

  const auto n = mobius::normalize(m);
  EXPECT_EQ(n, m);
  EXPECT_EQ(mobius::determinant(n) * mobius::determinant(m), G(1));
}

TEST_F(CustomScalarTest, HashAgreesForEveryScaleFactor)
{
  const auto m = mobius::transformation(G(1), G(2, 1, 1, 1), G(0, 1, 3, 1), G(5));
  std::unordered_set<mobius::MobiusTransformation<Gaussian>> set;
  set.insert(m);
  for (int64_t k = 2; k < 24; ++k) {
    const auto scaled = G(k, 7, 1, k) * m;
    ASSERT_EQ(scaled, m) << "k = " << k;
    EXPECT_EQ(std::hash<mobius::MobiusTransformation<Gaussian>>()(scaled), m.hash())
      << "k = " << k;
    set.insert(scaled);
  }
  set.insert(G(-3) * m);
  EXPECT_EQ(set.size(), 1u);

  set.insert(mobius::transformation(G(0), G(1), G(1), G(0)));
  EXPECT_EQ(set.size(), 2u);
}

TEST_F(CustomScalarTest, ProjectionRoundTripIsExact)
{
  using Point = mobius::Point3<Gaussian>;
  const auto proj = mobius::stereographic_projection<Gaussian>();

  EXPECT_EQ(proj.project(Point{G(0), G(0), G(-1)}), G(0));
  EXPECT_EQ(proj.project(Point{G(3, 5), G(0), G(4, 5)}), G(3));
  EXPECT_EQ(proj.project(Point{G(0), G(0), G(1)}), Gaussian::infinity());

  const Point pole = proj.unproject(Gaussian::infinity());
  EXPECT_EQ(pole[0], G(0));
  EXPECT_EQ(pole[1], G(0));
  EXPECT_EQ(pole[2], G(1));

  const std::vector<Point> points = {
    {G(3, 5), G(0), G(4, 5)},
    {G(12, 25), G(3, 5), G(16, 25)},
    {G(0), G(-4, 5), G(-3, 5)},
    {G(-1), G(0), G(0)},
  };
  for (const auto & p : points) {
    const Point back = proj.unproject(proj.project(p));
    for (std::size_t i = 0; i < 3; ++i) {
      EXPECT_EQ(back[i], p[i]) << "axis " << i;
    }
  }
}

TEST_F(CustomScalarTest, ConfiguredToken)
{
  // A finite field element standing in for infinity
  mobius::set_infinity(G(1000000));
  const auto m = mobius::transformation(G(0), G(1), G(1), G(0));
  EXPECT_EQ(m(G(0)), G(1000000));
  EXPECT_EQ(m(G(1000000)), G(0));

  const auto proj = mobius::stereographic_projection<Gaussian>();
  EXPECT_EQ(proj.project(proj.north_pole()), G(1000000));
}
