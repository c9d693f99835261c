////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once
#include <cstddef>
#include <type_traits>
//------------------------------------------------------------------------------
namespace std
{
#if defined( _LIBCPP_VERSION )
inline namespace __1 {
#endif
    template <typename T, size_t size> class array;
    template <class T, class D> class unique_ptr;
    template <class T1, class T2> struct pair;
#if defined( _LIBCPP_VERSION )
} // namespace __1
#endif
} // namespace std
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

// template <typename T>
// bool is_trivially_moveable;
//
// growable_vector relocates its buffer with realloc for types that can be
// 'picked up' from one address and 'dropped' at another w/o running any move
// constructor or destructor (P1144/P2786 'trivial relocatability'). Everything
// else is relocated element by element (move if noexcept, copy otherwise).
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p1144r12.html std::is_trivially_relocatable
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p2786r11.html Trivial Relocatability
// https://quuxplusone.github.io/blog/2019/02/20/p1144-what-types-are-relocatable

// allowed/expected to be user-specialized for custom types
template <typename T>
bool constexpr is_trivially_moveable
{
#ifdef __clang__
    __is_trivially_relocatable( T ) ||
#endif
#if defined( __cpp_lib_trivially_relocatable /*P1144*/ ) || defined( __cpp_trivial_relocatability /*P2786*/ )
    std::is_trivially_relocatable<T> ||
#endif
    std::is_trivially_copyable_v<T> // implies trivial destructibility https://eel.is/c++draft/class.prop#1
}; // is_trivially_moveable

template <typename T>
requires requires{ T::is_trivially_moveable; }
bool constexpr is_trivially_moveable<T>{ T::is_trivially_moveable };

template <typename T1, typename T2>
bool constexpr is_trivially_moveable<std::pair<T1, T2>>{ is_trivially_moveable<T1> && is_trivially_moveable<T2> };
template <typename T, std::size_t size>
bool constexpr is_trivially_moveable<std::array<T, size>>{ is_trivially_moveable<T> };
#if !defined( _LIBCPP_DEBUG )
template <typename T, typename D> bool constexpr is_trivially_moveable<std::unique_ptr<T, D>>{ is_trivially_moveable<D> };
#endif

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
