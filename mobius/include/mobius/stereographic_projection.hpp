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
#include <cstddef>
#include <utility>

#include "mobius/infinity.hpp"
#include "mobius/scalar_traits.hpp"
#include "mobius/types.hpp"

namespace mobius
{

// Unit sphere around `center`, projected from its north pole
// (center + unit vector along `north_axis`) onto the plane where the
// north-axis coordinate is zero. The other two axes, in ascending order,
// give the real and imaginary parts. The north pole corresponds to infinity.
template <typename R>
class StereographicProjection
{
public:
  using real_type = R;
  using Traits = ScalarTraits<R>;
  using complex_type = typename Traits::complex_type;
  using point_type = Point3<R>;

  static point_type origin() { return {Traits::zero(), Traits::zero(), Traits::zero()}; }

  explicit StereographicProjection(
    const point_type & center = origin(), Axis north_axis = kDefaultNorthAxis,
    Infinity<complex_type> infinity = Infinity<complex_type>())
  : center_(center), north_axis_(north_axis), infinity_(std::move(infinity))
  {
    n_ = axis_index(north_axis_);
    j_ = (n_ == 0) ? 1 : 0;
    k_ = (n_ == 2) ? 1 : 2;
    north_pole_ = center_;
    north_pole_[n_] = center_[n_] + Traits::one();
  }

  const point_type & center() const { return center_; }
  const point_type & north_pole() const { return north_pole_; }
  Axis north_axis() const { return north_axis_; }
  const Infinity<complex_type> & infinity() const { return infinity_; }

  StereographicProjection with_infinity(Infinity<complex_type> infinity) const
  {
    return StereographicProjection(center_, north_axis_, std::move(infinity));
  }

  // Sphere point to plane value; the north pole goes to infinity.
  complex_type project(const point_type & p) const
  {
    point_type dir;
    bool at_pole = true;
    for (std::size_t i = 0; i < 3; ++i) {
      dir[i] = p[i] - north_pole_[i];
      at_pole = at_pole && Traits::is_zero(dir[i]);
    }
    // A direction parallel to the plane never reaches it.
    if (at_pole || Traits::is_zero(dir[n_])) {
      return infinity_.value();
    }

    const R t = -north_pole_[n_] * Traits::inv(dir[n_]);
    return Traits::make_complex(north_pole_[j_] + t * dir[j_], north_pole_[k_] + t * dir[k_]);
  }

  // Plane value to sphere point; infinity goes to the north pole.
  point_type unproject(const complex_type & z) const
  {
    if (infinity_.is_infinity(z)) {
      return north_pole_;
    }

    point_type plane = origin();
    plane[j_] = Traits::real_part(z);
    plane[k_] = Traits::imag_part(z);

    point_type dir;
    R norm2 = Traits::zero();
    for (std::size_t i = 0; i < 3; ++i) {
      dir[i] = plane[i] - north_pole_[i];
      norm2 = norm2 + dir[i] * dir[i];
    }
    if (Traits::is_zero(norm2)) {
      return north_pole_;
    }

    // |np + t*dir - c|^2 = 1 with np - c a unit vector along the north axis
    // leaves t = 0 (the pole itself) and this root.
    const R t = -(dir[n_] + dir[n_]) * Traits::inv(norm2);

    point_type result;
    for (std::size_t i = 0; i < 3; ++i) {
      result[i] = north_pole_[i] + t * dir[i];
    }
    return result;
  }

  complex_type operator()(const point_type & p) const { return project(p); }
  point_type operator()(const complex_type & z) const { return unproject(z); }

private:
  point_type center_;
  Axis north_axis_;
  Infinity<complex_type> infinity_;
  point_type north_pole_;
  std::size_t n_ = 2;
  std::size_t j_ = 0;
  std::size_t k_ = 1;
};

template <typename R>
StereographicProjection<R> stereographic_projection(
  const Point3<R> & center, Axis north_axis = kDefaultNorthAxis)
{
  return StereographicProjection<R>(center, north_axis);
}

// Sphere centered at the origin.
template <typename R = double>
StereographicProjection<R> stereographic_projection(Axis north_axis = kDefaultNorthAxis)
{
  return StereographicProjection<R>(StereographicProjection<R>::origin(), north_axis);
}

extern template class StereographicProjection<double>;

}  // namespace mobius
