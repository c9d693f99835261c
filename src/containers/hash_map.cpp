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
#include <kore/coll/containers/hash_map.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

namespace detail
{
    hash_map_options validated( hash_map_options options )
    {
        // written so that NaN fails too
        if ( !( options.load_factor > 0 && options.load_factor <= 1 ) )
            throw_invalid_configuration( "kore::coll::hash_map: load factor must lie in (0, 1]" );
        if ( options.treeify_threshold < 2 )
            throw_invalid_configuration( "kore::coll::hash_map: treeify threshold must be at least 2" );
        if ( options.untreeify_threshold >= options.treeify_threshold )
            throw_invalid_configuration( "kore::coll::hash_map: untreeify threshold must be below the treeify threshold" );
        if ( options.initial_capacity > max_bucket_count )
            throw_invalid_configuration( "kore::coll::hash_map: initial capacity exceeds the maximum bucket count" );

        options.initial_capacity = std::bit_ceil( std::max<std::size_t>( options.initial_capacity, 1 ) );
        return options;
    }

    std::uint32_t resize_threshold( std::uint32_t const bucket_count, float const load_factor ) noexcept
    {
        BOOST_ASSERT( std::has_single_bit( bucket_count ) );
        auto const threshold{ std::floor( static_cast<double>( bucket_count ) * load_factor ) };
        return std::max<std::uint32_t>( static_cast<std::uint32_t>( threshold ), 1 );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
