////////////////////////////////////////////////////////////////////////////////
/// Fixed universe map keyed by enumerators (or small unsigned ordinals): a
/// presence bit_set plus one directly indexed value slot per ordinal.
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

#include <kore/coll/containers/bit_set.hpp>
#include <kore/coll/containers/errors.hpp>
#include <kore/coll/containers/growable_vector.hpp>

#include <boost/assert.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

template <ordinal_element E, typename T>
class [[ nodiscard ]] bit_map
{
private:
    template <bool is_const>
    class basic_iterator;

public:
    using key_type    = E;
    using mapped_type = T;
    using size_type   = std::size_t;

    using       iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true >;

public:
    explicit bit_map( size_type const universe_size )
        : present_( universe_size )
    {
        values_.grow_to( universe_size, value_init );
    }

    [[ nodiscard ]] size_type universe_size() const noexcept { return present_.universe_size(); }
    [[ nodiscard ]] size_type size         () const noexcept { return present_.size(); }
    [[ nodiscard ]] bool      empty        () const noexcept { return present_.empty(); }

    // the set of mapped keys
    [[ nodiscard ]] bit_set<E> const & keys() const noexcept { return present_; }

    [[ nodiscard ]] bool contains( E const key ) const noexcept { return present_.contains( key ); }

    //! <b>Returns</b>: The replaced value (empty if key was newly mapped).
    //!
    //! <b>Throws</b>: index_out_of_range if key is outside the universe.
    template <typename U = mapped_type>
    std::optional<mapped_type> insert_or_assign( E const key, U && value )
    {
        auto & slot{ values_.at( ordinal( key ) ) };
        // built before touching the slot: value may alias *slot and a throwing
        // construction must leave the presence bit and the slot in agreement
        mapped_type incoming( std::forward<U>( value ) );
        auto previous{ std::exchange( slot, std::move( incoming ) ) };
        present_.insert( key );
        return previous;
    }

    //! <b>Returns</b>: A pointer to the mapped value or nullptr if key is
    //!   absent (or outside the universe).
    [[ nodiscard ]] mapped_type       * get( E const key )       noexcept { return contains( key ) ? &*values_[ ordinal( key ) ] : nullptr; }
    [[ nodiscard ]] mapped_type const * get( E const key ) const noexcept { return contains( key ) ? &*values_[ ordinal( key ) ] : nullptr; }

    //! <b>Throws</b>: key_not_found if key is absent.
    [[ nodiscard ]] mapped_type & at( E const key )
    {
        if ( !contains( key ) ) [[ unlikely ]]
            detail::throw_key_not_found( "kore::coll::bit_map::at" );
        return *values_[ ordinal( key ) ];
    }
    [[ nodiscard ]] mapped_type const & at( E const key ) const
    {
        if ( !contains( key ) ) [[ unlikely ]]
            detail::throw_key_not_found( "kore::coll::bit_map::at" );
        return *values_[ ordinal( key ) ];
    }

    //! <b>Returns</b>: Whether key was mapped (and removed).
    //!
    //! <b>Throws</b>: index_out_of_range if key is outside the universe.
    bool erase( E const key )
    {
        if ( !present_.erase( key ) )
            return false;
        values_[ ordinal( key ) ].reset();
        return true;
    }

    void clear() noexcept
    {
        for ( auto const key : present_ )
            values_[ ordinal( key ) ].reset();
        present_.clear();
    }

    // in ordinal order
    [[ nodiscard ]]       iterator begin()       noexcept { return {  this, present_.begin() }; }
    [[ nodiscard ]] const_iterator begin() const noexcept { return {  this, present_.begin() }; }
    [[ nodiscard ]]       iterator end  ()       noexcept { return {  this, present_.end  () }; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return {  this, present_.end  () }; }

    friend bool operator==( bit_map const & left, bit_map const & right )
    {
        if ( !( left.present_ == right.present_ ) )
            return false;
        for ( auto const key : left.present_ )
        {
            if ( !( *left.values_[ ordinal( key ) ] == *right.values_[ ordinal( key ) ] ) )
                return false;
        }
        return true;
    }

private:
    bit_set<E>                                 present_;
    growable_vector<std::optional<mapped_type>> values_;
}; // class bit_map


template <ordinal_element E, typename T>
template <bool is_const>
class bit_map<E, T>::basic_iterator
    :
    public boost::stl_interfaces::proxy_iterator_interface
    <
        basic_iterator<is_const>,
        std::forward_iterator_tag,
        std::pair<E, T>,
        std::pair<E, std::conditional_t<is_const, T const &, T &>>
    >
{
private:
    using map_t     = std::conditional_t<is_const, bit_map const, bit_map>;
    using reference = std::pair<E, std::conditional_t<is_const, T const &, T &>>;
    using base_type = boost::stl_interfaces::proxy_iterator_interface
    <
        basic_iterator<is_const>,
        std::forward_iterator_tag,
        std::pair<E, T>,
        reference
    >;

public:
    constexpr basic_iterator() noexcept = default;
    template <bool other_const> requires( is_const && !other_const )
    constexpr basic_iterator( basic_iterator<other_const> const & other ) noexcept
        : map_{ other.map_ }, key_{ other.key_ } {}

    reference operator*() const noexcept
    {
        auto const key{ *key_ };
        return { key, *map_->values_[ ordinal( key ) ] };
    }

    basic_iterator & operator++() noexcept { ++key_; return *this; }
    using base_type::operator++;

    friend bool operator==( basic_iterator const & left, basic_iterator const & right ) noexcept { return left.key_ == right.key_; }

private: friend class bit_map; friend class basic_iterator<!is_const>;
    constexpr basic_iterator( map_t * const map, typename bit_set<E>::iterator const key ) noexcept : map_{ map }, key_{ key } {}

    map_t *                        map_{ nullptr };
    typename bit_set<E>::iterator  key_;
}; // class bit_map::basic_iterator

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
