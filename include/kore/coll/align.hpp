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

#include <boost/assert.hpp>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

// power-of-2 denominators (e.g. bits per word) fold to a shift
[[ using gnu: const, always_inline ]]
constexpr auto divide_up( auto const numerator, auto const denominator ) noexcept
{
    BOOST_ASSERT( denominator != 0 );
    return static_cast<decltype( numerator )>( ( numerator + denominator - 1 ) / denominator );
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
