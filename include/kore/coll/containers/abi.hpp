////////////////////////////////////////////////////////////////////////////////
/// Pass-by-value vs pass-by-reference selection for element and key
/// parameters, so that generic container operations neither copy non-trivial
/// types nor pass small trivial ones through memory.
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

#include <type_traits>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivial_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV (ignoring the MS x64 disaster)
    // users are encouraged to provide specializations for types that the
    // compiler passes in registers but that cannot be detected as such
}; // can_be_passed_in_reg

template <typename T>
using param_const_ref = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
