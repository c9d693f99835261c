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
#include <kore/coll/containers/errors.hpp>

#include <new>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_index_out_of_range   ( char const * const what ) { throw index_out_of_range   ( what ); }
    [[ noreturn, gnu::cold ]] void throw_empty_structure      ( char const * const what ) { throw empty_structure      ( what ); }
    [[ noreturn, gnu::cold ]] void throw_key_not_found        ( char const * const what ) { throw key_not_found        ( what ); }
    [[ noreturn, gnu::cold ]] void throw_domain_mismatch      ( char const * const what ) { throw domain_mismatch      ( what ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_configuration( char const * const what ) { throw invalid_configuration( what ); }
    [[ noreturn, gnu::cold ]] void throw_bad_alloc            (                         ) { throw std::bad_alloc(); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
