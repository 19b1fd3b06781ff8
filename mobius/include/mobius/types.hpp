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
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace mobius
{

template <typename R>
using Point3 = std::array<R, 3>;

// Row-major [[a, b], [c, d]]
template <typename T>
using Matrix2 = std::array<std::array<T, 2>, 2>;

enum class Axis : uint8_t
{
  X = 0,
  Y = 1,
  Z = 2,
};

constexpr Axis kDefaultNorthAxis = Axis::Z;

constexpr std::size_t axis_index(Axis axis) { return static_cast<std::size_t>(axis); }

// True when the types share a std::common_type.
template <typename Void, typename... Ts>
struct has_common_scalar_impl : std::false_type
{
};

template <typename... Ts>
struct has_common_scalar_impl<std::void_t<std::common_type_t<Ts...>>, Ts...> : std::true_type
{
};

template <typename... Ts>
constexpr bool has_common_scalar_v = has_common_scalar_impl<void, Ts...>::value;

static_assert(std::is_trivially_copyable_v<Point3<double>>);

}  // namespace mobius
