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
#include <optional>

#include "mobius/scalar_traits.hpp"

namespace mobius
{

// Process-wide "point at infinity" for one scalar type.
// Configure once before sharing; reads are unsynchronized.
template <typename T>
class InfinityRegistry
{
public:
  static T get() { return storage(); }
  static void set(const T & value) { storage() = value; }
  static void reset() { storage() = ScalarTraits<T>::infinity(); }

private:
  static T & storage()
  {
    static T value = ScalarTraits<T>::infinity();
    return value;
  }
};

template <typename T>
T get_infinity()
{
  return InfinityRegistry<T>::get();
}

template <typename T>
void set_infinity(const T & value)
{
  InfinityRegistry<T>::set(value);
}

template <typename T>
void reset_infinity()
{
  InfinityRegistry<T>::reset();
}

// Infinity held by a transformation or projection.
// Unbound (default) reads the registry on every call, so set_infinity()
// reaches instances created earlier. Bound carries its own value.
template <typename T>
class Infinity
{
public:
  Infinity() = default;
  explicit Infinity(const T & value) : value_(value) {}

  T value() const { return value_ ? *value_ : get_infinity<T>(); }
  bool is_bound() const { return value_.has_value(); }

  // Infinite in the scalar's own sense, or equal to the configured token.
  bool is_infinity(const T & z) const
  {
    return ScalarTraits<T>::is_infinite(z) || z == value();
  }

private:
  std::optional<T> value_;
};

}  // namespace mobius
