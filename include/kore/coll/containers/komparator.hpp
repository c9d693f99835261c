////////////////////////////////////////////////////////////////////////////////
/// Komparator: the comparator wrapper of the kore::coll ordered containers.
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

/// Inherits from Comparator for the empty-base optimisation (stateless
/// comparators cost no storage in the containers deriving from Komparator)
/// and names the strict ordering test the tree descents are written with.
template <typename Comparator>
struct Komparator : Comparator
{
    constexpr Komparator() = default;
    constexpr explicit Komparator( Comparator const & c ) : Comparator( c ) {}

    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Comparator       & comp()       noexcept { return *this; }

    // strictly "less" in the container's order
    [[ gnu::pure ]] constexpr bool le( auto const & left, auto const & right ) const noexcept { return comp()( left, right ); }
}; // struct Komparator

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
