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
#include <type_traits>
#include <utility>

namespace mobius
{

// A point map is any value callable on an argument of kind X.
// MobiusTransformation and StereographicProjection both qualify without
// sharing a base class.
template <typename Map, typename X, typename = void>
struct is_point_map : std::false_type
{
};

template <typename Map, typename X>
struct is_point_map<Map, X, std::void_t<decltype(std::declval<const Map &>()(std::declval<const X &>()))>>
: std::true_type
{
};

template <typename Map, typename X>
constexpr bool is_point_map_v = is_point_map<Map, X>::value;

template <typename Map, typename X>
auto apply(const Map & map, const X & x) -> decltype(map(x))
{
  return map(x);
}

// Apply several maps right to left: apply_chain(f, g, x) == f(g(x)).
template <typename Map, typename... Rest>
auto apply_chain(const Map & map, const Rest &... rest)
{
  if constexpr (sizeof...(Rest) == 1) {
    return map(rest...);
  } else {
    return map(apply_chain(rest...));
  }
}

}  // namespace mobius
