////////////////////////////////////////////////////////////////////////////////
/// Base CRTP implementation of shared, standard-like functionality for
/// vector-like containers. Also provides extensions like default vs value
/// initialization, explicit grow and shrink (noexcept) vs resize methods and
/// the checked index based operations (at, replace, insert_at, remove_at)
/// w/ special emphasis on code reuse and bloat reduction.
///
/// The derived Impl class provides the storage primitives:
///   data(), size(), capacity(),
///   storage_grow_to( target_size ) - makes room for and accounts for
///                                    target_size elements, new ones are left
///                                    uninitialized
///   storage_shrink_size_to( target_size ) - merely updates the size
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

#include <kore/coll/containers/abi.hpp>
#include <kore/coll/containers/errors.hpp>
#include <kore/coll/containers/is_trivially_moveable.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

namespace detail
{
    struct init_policy_tag{};
} // namespace detail

struct no_init_t      : detail::init_policy_tag{}; inline constexpr no_init_t      no_init     ;
struct default_init_t : detail::init_policy_tag{}; inline constexpr default_init_t default_init;
struct value_init_t   : detail::init_policy_tag{}; inline constexpr value_init_t   value_init  ;

template <typename T>
concept init_policy = std::is_base_of_v<detail::init_policy_tag, T>;


// The 'actual implementation' derived type has to be explicitly specified as a
// template parameter (classic CRTP): this also avoids instantiating the
// vector_impl methods for every possible further derived type.
template <typename Impl, typename T, typename sz_t>
class vector_impl
{
public:
    using value_type             = T;
    using       pointer          = value_type       *;
    using const_pointer          = value_type const *;
    using       reference        = value_type       &;
    using const_reference        = value_type const &;
    using param_const_ref        = coll::param_const_ref<value_type>;
    using       size_type        = sz_t;
    using difference_type        = std::make_signed_t<size_type>;
    using       iterator         =       pointer;
    using const_iterator         = const_pointer;
    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

private:
    [[ gnu::const ]] constexpr Impl       & impl()       noexcept { return static_cast<Impl       &>( *this ); }
    [[ gnu::const ]] constexpr Impl const & impl() const noexcept { return static_cast<Impl const &>( *this ); }

protected:
    constexpr  vector_impl(                      ) noexcept = default;
    constexpr  vector_impl( vector_impl const &  ) noexcept = default;
    constexpr  vector_impl( vector_impl       && ) noexcept = default;
    constexpr ~vector_impl(                      ) noexcept = default;

    constexpr vector_impl & operator=( vector_impl const &  ) noexcept = default;
    constexpr vector_impl & operator=( vector_impl       && ) noexcept = default;

public:
    //////////////////////////////////////////////
    //
    //                iterators
    //
    //////////////////////////////////////////////

    //! <b>Effects</b>: Returns an iterator to the first element contained in the vector.
    //! <b>Throws</b>: Nothing.
    //! <b>Complexity</b>: Constant.
    [[ nodiscard ]]       iterator  begin()       noexcept { return impl().data(); }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return impl().data(); }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }

    //! <b>Effects</b>: Returns an iterator to the end of the vector.
    //! <b>Throws</b>: Nothing.
    //! <b>Complexity</b>: Constant.
    [[ nodiscard ]]       iterator  end()       noexcept { return begin() + impl().size(); }
    [[ nodiscard ]] const_iterator  end() const noexcept { return begin() + impl().size(); }
    [[ nodiscard ]] const_iterator cend() const noexcept { return end(); }

    [[ nodiscard ]]       reverse_iterator  rbegin()       noexcept { return       reverse_iterator( end() ); }
    [[ nodiscard ]] const_reverse_iterator  rbegin() const noexcept { return const_reverse_iterator( end() ); }
    [[ nodiscard ]] const_reverse_iterator crbegin() const noexcept { return rbegin(); }

    [[ nodiscard ]]       reverse_iterator  rend()       noexcept { return       reverse_iterator( begin() ); }
    [[ nodiscard ]] const_reverse_iterator  rend() const noexcept { return const_reverse_iterator( begin() ); }
    [[ nodiscard ]] const_reverse_iterator crend() const noexcept { return rend(); }

    //////////////////////////////////////////////
    //
    //                capacity
    //
    //////////////////////////////////////////////

    [[ nodiscard, gnu::pure ]] bool empty() const noexcept { return BOOST_UNLIKELY( impl().size() == 0 ); }

    [[ nodiscard ]] static constexpr size_type max_size() noexcept { return static_cast<size_type>( std::numeric_limits<size_type>::max() / sizeof( value_type ) ); }

    void resize( size_type const new_size, init_policy auto const policy )
    {
        if ( new_size > impl().size() ) grow_to  ( new_size, policy );
        else                            shrink_to( new_size         );
    }
    // intentional non-standard behaviour: default_init by default
    void resize( size_type const new_size ) { resize( new_size, default_init ); }

    //! <b>Effects</b>: Inserts or erases elements at the end such that
    //!   the size becomes n. New elements are copy constructed from x.
    //!
    //! <b>Throws</b>: If memory allocation throws, or T's copy/move constructor throws.
    //!
    //! <b>Complexity</b>: Linear to the difference between size() and new_size.
    void resize( size_type const new_size, param_const_ref x )
    {
        if ( new_size > impl().size() ) grow_to  ( new_size, x );
        else                            shrink_to( new_size    );
    }

    //////////////////////////////////////////////
    //
    //               element access
    //
    //////////////////////////////////////////////

    //! <b>Requires</b>: !empty()
    [[ nodiscard ]] reference       front()       noexcept { BOOST_ASSERT( !empty() ); return *begin(); }
    [[ nodiscard ]] const_reference front() const noexcept { BOOST_ASSERT( !empty() ); return *begin(); }

    //! <b>Requires</b>: !empty()
    [[ nodiscard ]] reference       back()       noexcept { BOOST_ASSERT( !empty() ); return end()[ -1 ]; }
    [[ nodiscard ]] const_reference back() const noexcept { BOOST_ASSERT( !empty() ); return end()[ -1 ]; }

    //! <b>Requires</b>: size() > n.
    //!
    //! <b>Effects</b>: Returns a reference to the nth element
    //!   from the beginning of the container.
    //!
    //! <b>Throws</b>: Nothing.
    //!
    //! <b>Complexity</b>: Constant.
    [[ nodiscard ]] reference       operator[]( size_type const n )       noexcept { BOOST_ASSERT( n < impl().size() ); return begin()[ n ]; }
    [[ nodiscard ]] const_reference operator[]( size_type const n ) const noexcept { BOOST_ASSERT( n < impl().size() ); return begin()[ n ]; }

    //! <b>Requires</b>: size() >= n.
    //!
    //! <b>Effects</b>: Returns an iterator to the nth element
    //!   from the beginning of the container. Returns end()
    //!   if n == size().
    //!
    //! <b>Note</b>: Non-standard extension
    [[ nodiscard ]]       iterator nth( size_type const n )       noexcept { BOOST_ASSERT( n <= impl().size() ); return begin() + n; }
    [[ nodiscard ]] const_iterator nth( size_type const n ) const noexcept { BOOST_ASSERT( n <= impl().size() ); return begin() + n; }

    //! <b>Requires</b>: begin() <= p <= end().
    //!
    //! <b>Effects</b>: Returns the index of the element pointed by p
    //!   and size() if p == end().
    //!
    //! <b>Note</b>: Non-standard extension
    [[ nodiscard ]] size_type index_of( const_iterator const p ) const noexcept
    {
        verify_iterator( p );
        return static_cast<size_type>( p - begin() );
    }

    //! <b>Effects</b>: Returns a reference to the nth element
    //!   from the beginning of the container.
    //!
    //! <b>Throws</b>: index_out_of_range if n >= size()
    //!
    //! <b>Complexity</b>: Constant.
    [[ nodiscard ]] reference at( size_type const n )
    {
        detail::verify_index( n, impl().size(), "kore::coll::vector::at" );
        return (*this)[ n ];
    }
    [[ nodiscard ]] const_reference at( size_type const n ) const
    {
        detail::verify_index( n, impl().size(), "kore::coll::vector::at" );
        return (*this)[ n ];
    }

    //////////////////////////////////////////////
    //
    //                 data access
    //
    //////////////////////////////////////////////

    [[ nodiscard, gnu::pure ]] std::span<value_type      > span()       noexcept { return { impl().data(), impl().size() }; }
    [[ nodiscard, gnu::pure ]] std::span<value_type const> span() const noexcept { return { impl().data(), impl().size() }; }

    //////////////////////////////////////////////
    //
    //                modifiers
    //
    //////////////////////////////////////////////

    //! <b>Effects</b>: Inserts an object of type T constructed with
    //!   std::forward<Args>(args)... at the end of the vector.
    //!
    //! <b>Returns</b>: A reference to the created object.
    //!
    //! <b>Throws</b>: If memory allocation throws or the in-place constructor throws or
    //!   T's copy/move constructor throws.
    //!
    //! <b>Complexity</b>: Amortized constant time.
    template <class ...Args>
    reference emplace_back( Args &&...args )
    {
        auto const current_size{ impl().size() };
        if ( current_size < impl().capacity() ) [[ likely ]]
        {
            auto const data{ impl().storage_grow_to( current_size + 1 ) };
            try {
                return *std::construct_at( &data[ current_size ], std::forward<Args>( args )... );
            } catch( ... ) {
                impl().storage_shrink_size_to( current_size );
                throw;
            }
        }
        // the arguments may refer to an element of this very vector: construct
        // before the storage gets relocated
        value_type new_element( std::forward<Args>( args )... );
        auto const data{ impl().storage_grow_to( current_size + 1 ) };
        return *std::construct_at( &data[ current_size ], std::move( new_element ) );
    }

    //! <b>Effects</b>: Inserts a copy of x at the end of the vector.
    //!
    //! <b>Complexity</b>: Amortized constant time.
    void push_back( param_const_ref x ) { emplace_back( x ); }

    //! <b>Effects</b>: Constructs a new element in the end of the vector
    //!   and moves the resources of x to this new element.
    //!
    //! <b>Complexity</b>: Amortized constant time.
    void push_back( value_type && x ) requires( !std::is_trivial_v<value_type> ) { emplace_back( std::move( x ) ); }

    //! <b>Requires</b>: position must be a valid iterator of *this.
    //!
    //! <b>Effects</b>: Inserts an object of type T constructed with
    //!   std::forward<Args>(args)... before position
    //!
    //! <b>Complexity</b>: If position is end(), amortized constant time
    //!   Linear time otherwise.
    template <typename... Args>
    iterator emplace( const_iterator const position, Args &&... args )
    {
        value_type new_element( std::forward<Args>( args )... );
        auto const gap{ make_space_for_insert( index_of( position ), 1 ) };
        std::construct_at( gap, std::move( new_element ) );
        return gap;
    }

    iterator insert( const_iterator const position, param_const_ref x ) { return emplace( position, x ); }
    iterator insert( const_iterator const position, value_type && x ) requires( !std::is_trivial_v<value_type> ) { return emplace( position, std::move( x ) ); }

    template <std::ranges::range Rng>
    void append_range( Rng && rng )
    {
        if constexpr ( std::ranges::sized_range<Rng> )
            reserve_additional( static_cast<size_type>( std::ranges::size( rng ) ) );
        for ( auto && element : rng )
            emplace_back( std::forward<decltype( element )>( element ) );
    }
    void append_range( std::initializer_list<value_type> const rng ) { append_range( std::span{ rng.begin(), rng.end() } ); }

    //! <b>Effects</b>: Removes the last element from the container.
    //!
    //! <b>Throws</b>: Nothing.
    //!
    //! <b>Complexity</b>: Constant time.
    void pop_back() noexcept
    {
        BOOST_ASSERT( !empty() );
        std::destroy_at( &back() );
        impl().storage_shrink_size_to( impl().size() - 1 );
    }

    //! <b>Effects</b>: Erases the element at position pos.
    //!
    //! <b>Complexity</b>: Linear to the elements between pos and the
    //!   last element. Constant if pos is the last element.
    iterator erase( const_iterator const position ) noexcept( std::is_nothrow_move_assignable_v<value_type> )
    {
        BOOST_ASSERT( position != end() );
        auto const pos_index  { index_of( position ) };
        auto const mutable_pos{ nth( pos_index ) };
        std::move( mutable_pos + 1, end(), mutable_pos );
        pop_back();
        return nth( pos_index );
    }

    //! <b>Effects</b>: Erases the elements pointed by [first, last).
    //!
    //! <b>Complexity</b>: Linear to the distance between first and last
    //!   plus linear to the elements between pos and the last element.
    iterator erase( const_iterator const first, const_iterator const last ) noexcept( std::is_nothrow_move_assignable_v<value_type> )
    {
        verify_iterator( first );
        verify_iterator( last  );
        BOOST_ASSERT( first <= last );
        auto const first_index{ index_of( first ) };
        auto const new_end    { std::move( nth( index_of( last ) ), end(), nth( first_index ) ) };
        shrink_to( static_cast<size_type>( new_end - begin() ) );
        return nth( first_index );
    }

    //! <b>Effects</b>: Erases all the elements of the vector (retaining the
    //! capacity).
    void clear() noexcept { shrink_to( 0 ); }

    ///////////////////////////////////////////////////////////////////////////
    // Index based operations (checked)
    ///////////////////////////////////////////////////////////////////////////

    //! <b>Effects</b>: Overwrites the element at index with value.
    //!
    //! <b>Returns</b>: The previous value.
    //!
    //! <b>Throws</b>: index_out_of_range if index >= size().
    template <typename U = value_type>
    value_type replace( size_type const index, U && value )
    {
        detail::verify_index( index, impl().size(), "kore::coll::vector::replace" );
        value_type incoming( std::forward<U>( value ) ); // may alias (*this)[ index ]
        return std::exchange( (*this)[ index ], std::move( incoming ) );
    }

    //! <b>Effects</b>: Inserts value before the element at index (appends if
    //!   index == size()).
    //!
    //! <b>Throws</b>: index_out_of_range if index > size().
    template <typename U = value_type>
    reference insert_at( size_type const index, U && value )
    {
        detail::verify_index( index, impl().size() + 1, "kore::coll::vector::insert_at" );
        return *emplace( nth( index ), std::forward<U>( value ) );
    }

    //! <b>Effects</b>: Removes the element at index shifting the following
    //!   ones one slot to the left. Never releases capacity.
    //!
    //! <b>Returns</b>: The removed value.
    //!
    //! <b>Throws</b>: index_out_of_range if index >= size().
    value_type remove_at( size_type const index )
    {
        detail::verify_index( index, impl().size(), "kore::coll::vector::remove_at" );
        value_type removed( std::move( (*this)[ index ] ) );
        erase( nth( index ) );
        return removed;
    }


    ///////////////////////////////////////////////////////////////////////////
    // Extensions
    ///////////////////////////////////////////////////////////////////////////

    value_type * grow_to( size_type const target_size, no_init_t ) { return impl().storage_grow_to( target_size ); }
    value_type * grow_to( size_type const target_size, default_init_t )
    {
        auto const current_size{ impl().size() };
        auto const data{ grow_to( target_size, no_init ) };
        if constexpr ( !std::is_trivially_default_constructible_v<value_type> ) {
            try {
                std::uninitialized_default_construct( &data[ current_size ], &data[ target_size ] );
            } catch(...) {
                impl().storage_shrink_size_to( current_size );
                throw;
            }
        }
        return data;
    }
    value_type * grow_to( size_type const target_size, value_init_t )
    {
        auto const current_size{ impl().size() };
        BOOST_ASSERT( target_size >= current_size );
        auto const data{ grow_to( target_size, no_init ) };
        try {
            std::uninitialized_value_construct( &data[ current_size ], &data[ target_size ] );
        } catch(...) {
            impl().storage_shrink_size_to( current_size );
            throw;
        }
        return data;
    }
    value_type * grow_to( size_type const target_size, param_const_ref default_value )
    {
        auto const current_size{ impl().size() };
        BOOST_ASSERT( target_size >= current_size );
        value_type const fill_value( default_value ); // may alias an element
        auto const data{ grow_to( target_size, no_init ) };
        try {
            std::uninitialized_fill( &data[ current_size ], &data[ target_size ], fill_value );
        } catch(...) {
            impl().storage_shrink_size_to( current_size );
            throw;
        }
        return data;
    }

    void shrink_to( size_type const target_size ) noexcept
    {
        BOOST_ASSERT( target_size <= impl().size() );
        std::destroy( nth( target_size ), end() );
        impl().storage_shrink_size_to( target_size ); // std::vector behaviour: never release/shrink capacity
    }

    void reserve_additional( size_type const additional ) { impl().reserve( impl().size() + additional ); }

private:
    void verify_iterator( [[ maybe_unused ]] const_iterator const iter ) const noexcept
    {
        BOOST_ASSERT( iter >= begin() );
        BOOST_ASSERT( iter <= end  () );
    }

    // Returns a pointer to n uninitialized slots at position_index (the
    // elements that were there are shifted right).
    value_type * make_space_for_insert( size_type const position_index, size_type const n )
    {
        auto const current_size{ impl().size() };
        BOOST_ASSERT( position_index <= current_size );
        auto const data{ grow_to( current_size + n, no_init ) };
        auto const elements_to_move{ static_cast<size_type>( current_size - position_index ) };
        if constexpr ( is_trivially_moveable<value_type> )
        {
            std::memmove( static_cast<void *>( &data[ position_index + n ] ), &data[ position_index ], elements_to_move * sizeof( value_type ) );
        }
        else
        {
            // the trailing elements land in the uninitialized space, the rest
            // are move assigned over already constructed (moved-from) ones
            auto const split{ std::max( position_index, current_size >= n ? static_cast<size_type>( current_size - n ) : size_type{ 0 } ) };
            std::uninitialized_move( &data[ split ], &data[ current_size ], &data[ split + n ] );
            std::move_backward( &data[ position_index ], &data[ split ], &data[ split + n ] );
            std::destroy( &data[ position_index ], &data[ std::min( position_index + n, current_size ) ] );
        }
        return &data[ position_index ];
    }
}; // class vector_impl


//! <b>Effects</b>: Returns the result of std::lexicographical_compare_three_way
//!
//! <b>Complexity</b>: Linear to the number of elements in the container.
template <typename Impl, typename T, typename sz_t>
[[ nodiscard ]] constexpr auto operator<=>( vector_impl<Impl, T, sz_t> const & left, vector_impl<Impl, T, sz_t> const & right ) noexcept { return std::lexicographical_compare_three_way( left.begin(), left.end(), right.begin(), right.end() ); }
template <typename Impl, typename T, typename sz_t>
[[ nodiscard ]] constexpr bool operator== ( vector_impl<Impl, T, sz_t> const & left, vector_impl<Impl, T, sz_t> const & right ) noexcept { return std::equal( left.begin(), left.end(), right.begin(), right.end() ); }

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
