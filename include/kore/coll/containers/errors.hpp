////////////////////////////////////////////////////////////////////////////////
/// Exception types thrown by kore::coll containers and the cold, out-of-line
/// helpers used to raise them (keeping the throw machinery out of the inlined
/// fast paths).
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

#include <boost/config.hpp>

#include <cstddef>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

// sequence access outside [0, size)
class index_out_of_range    : public std::out_of_range     { public: using std::out_of_range    ::out_of_range    ; };
// removal/peek on an empty structure
class empty_structure       : public std::out_of_range     { public: using std::out_of_range    ::out_of_range    ; };
// only from the value-or-fail accessors (at()), plain lookups report absence
class key_not_found         : public std::out_of_range     { public: using std::out_of_range    ::out_of_range    ; };
// bit_set operations across different universes
class domain_mismatch       : public std::invalid_argument { public: using std::invalid_argument::invalid_argument; };
class invalid_configuration : public std::invalid_argument { public: using std::invalid_argument::invalid_argument; };

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_index_out_of_range   ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_empty_structure      ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_key_not_found        ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_domain_mismatch      ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_invalid_configuration( char const * what );
    [[ noreturn, gnu::cold ]] void throw_bad_alloc            ();

    BOOST_FORCEINLINE
    constexpr void verify_index( std::size_t const index, std::size_t const size, char const * const what )
    {
        if ( index >= size ) [[ unlikely ]]
            throw_index_out_of_range( what );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
