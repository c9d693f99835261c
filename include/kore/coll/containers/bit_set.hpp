////////////////////////////////////////////////////////////////////////////////
/// Fixed universe set of enumerators (or small unsigned ordinals) stored as a
/// bit vector: bit i set <=> the element with ordinal i is a member. Set
/// algebra between sets over different universes is rejected
/// (domain_mismatch).
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

#include <kore/coll/align.hpp>
#include <kore/coll/containers/errors.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/container/small_vector.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <bit>
#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <type_traits>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

template <typename E>
concept ordinal_element = std::is_enum_v<E> || std::unsigned_integral<E>;

template <ordinal_element E>
[[ nodiscard, gnu::const ]] constexpr std::size_t ordinal( E const element ) noexcept
{
    if constexpr ( std::is_enum_v<E> )
        return static_cast<std::size_t>( static_cast<std::underlying_type_t<E>>( element ) );
    else
        return static_cast<std::size_t>( element );
}

template <ordinal_element E>
[[ nodiscard, gnu::const ]] constexpr E from_ordinal( std::size_t const index ) noexcept
{
    if constexpr ( std::is_enum_v<E> )
        return static_cast<E>( static_cast<std::underlying_type_t<E>>( index ) );
    else
        return static_cast<E>( index );
}


template <ordinal_element E>
class [[ nodiscard ]] bit_set
{
public:
    using value_type = E;
    using size_type  = std::size_t;
    using word_type  = std::uint64_t;

    static size_type constexpr bits_per_word{ sizeof( word_type ) * CHAR_BIT };

    class iterator;
    using const_iterator = iterator;

public:
    //! <b>Effects</b>: Constructs an empty set over the ordinals
    //!   [0, universe_size).
    explicit bit_set( size_type const universe_size )
        : words_( divide_up( universe_size, bits_per_word ), word_type{ 0 } ), universe_{ universe_size } {}

    bit_set( size_type const universe_size, std::initializer_list<E> const elements )
        : bit_set( universe_size )
    {
        for ( auto const element : elements )
            insert( element );
    }

    [[ nodiscard ]] size_type universe_size() const noexcept { return universe_; }

    // population count
    [[ nodiscard ]] size_type size() const noexcept
    {
        size_type count{ 0 };
        for ( auto const word : words_ )
            count += static_cast<size_type>( std::popcount( word ) );
        return count;
    }
    [[ nodiscard ]] bool empty() const noexcept { return std::ranges::all_of( words_, []( word_type const word ) { return word == 0; } ); }

    [[ nodiscard ]] bool contains( E const element ) const noexcept
    {
        auto const index{ ordinal( element ) };
        return ( index < universe_ ) && ( words_[ index / bits_per_word ] & bit( index ) );
    }

    //! <b>Returns</b>: Whether element was newly added.
    //!
    //! <b>Throws</b>: index_out_of_range if element is outside the universe.
    bool insert( E const element )
    {
        auto const index{ checked_ordinal( element, "kore::coll::bit_set::insert" ) };
        auto & word{ words_[ index / bits_per_word ] };
        bool const added{ !( word & bit( index ) ) };
        word |= bit( index );
        return added;
    }

    //! <b>Returns</b>: Whether element was present (and removed).
    //!
    //! <b>Throws</b>: index_out_of_range if element is outside the universe.
    bool erase( E const element )
    {
        auto const index{ checked_ordinal( element, "kore::coll::bit_set::erase" ) };
        auto & word{ words_[ index / bits_per_word ] };
        bool const removed{ static_cast<bool>( word & bit( index ) ) };
        word &= ~bit( index );
        return removed;
    }

    void clear() noexcept { std::ranges::fill( words_, word_type{ 0 } ); }
    void fill () noexcept { std::ranges::fill( words_, ~word_type{ 0 } ); mask_tail(); }

    bit_set & complement() noexcept
    {
        for ( auto & word : words_ )
            word = ~word;
        mask_tail();
        return *this;
    }

    //! <b>Throws</b>: domain_mismatch if the universes differ.
    bit_set & unite     ( bit_set const & other ) { verify_same_domain( other ); for ( size_type w{ 0 }; w < words_.size(); ++w ) words_[ w ] |=  other.words_[ w ]; return *this; }
    bit_set & intersect ( bit_set const & other ) { verify_same_domain( other ); for ( size_type w{ 0 }; w < words_.size(); ++w ) words_[ w ] &=  other.words_[ w ]; return *this; }
    bit_set & difference( bit_set const & other ) { verify_same_domain( other ); for ( size_type w{ 0 }; w < words_.size(); ++w ) words_[ w ] &= ~other.words_[ w ]; return *this; }

    bit_set & operator|=( bit_set const & other ) { return unite     ( other ); }
    bit_set & operator&=( bit_set const & other ) { return intersect ( other ); }
    bit_set & operator-=( bit_set const & other ) { return difference( other ); }

    //! <b>Throws</b>: domain_mismatch if the universes differ.
    [[ nodiscard ]] bool is_subset_of( bit_set const & other ) const
    {
        verify_same_domain( other );
        for ( size_type w{ 0 }; w < words_.size(); ++w )
        {
            if ( words_[ w ] & ~other.words_[ w ] )
                return false;
        }
        return true;
    }

    // sets over different universes are never equal
    friend bool operator==( bit_set const & left, bit_set const & right ) noexcept
    {
        return ( left.universe_ == right.universe_ ) && std::ranges::equal( left.words_, right.words_ );
    }

    [[ nodiscard ]] iterator begin() const noexcept { return { this, find_from( 0 ) }; }
    [[ nodiscard ]] iterator end  () const noexcept { return { this, universe_      }; }

private:
    [[ gnu::const ]] static word_type bit( size_type const index ) noexcept { return word_type{ 1 } << ( index % bits_per_word ); }

    size_type checked_ordinal( E const element, char const * const what ) const
    {
        auto const index{ ordinal( element ) };
        detail::verify_index( index, universe_, what );
        return index;
    }

    void verify_same_domain( bit_set const & other ) const
    {
        if ( universe_ != other.universe_ ) [[ unlikely ]]
            detail::throw_domain_mismatch( "kore::coll::bit_set: operands have different universes" );
    }

    // bits past the universe are kept clear (size(), == and iteration rely on it)
    void mask_tail() noexcept
    {
        if ( auto const used_bits{ universe_ % bits_per_word }; used_bits && !words_.empty() )
            words_.back() &= ( word_type{ 1 } << used_bits ) - 1;
    }

    // first member with ordinal >= index (universe_size() if none)
    [[ nodiscard, gnu::pure ]] size_type find_from( size_type const index ) const noexcept
    {
        if ( index >= universe_ )
            return universe_;
        auto w{ index / bits_per_word };
        auto word{ words_[ w ] & ( ~word_type{ 0 } << ( index % bits_per_word ) ) };
        for ( ; ; )
        {
            if ( word )
                return w * bits_per_word + static_cast<size_type>( std::countr_zero( word ) );
            if ( ++w == words_.size() )
                return universe_;
            word = words_[ w ];
        }
    }

private:
    boost::container::small_vector<word_type, 1> words_;
    size_type                                    universe_;
}; // class bit_set


template <ordinal_element E>
class bit_set<E>::iterator
    :
    public boost::stl_interfaces::proxy_iterator_interface<iterator, std::forward_iterator_tag, E, E>
{
private:
    using base_type = boost::stl_interfaces::proxy_iterator_interface<iterator, std::forward_iterator_tag, E, E>;

public:
    constexpr iterator() noexcept = default;

    E operator*() const noexcept { BOOST_ASSERT( index_ < set_->universe_ ); return from_ordinal<E>( index_ ); }

    iterator & operator++() noexcept { index_ = set_->find_from( index_ + 1 ); return *this; }
    using base_type::operator++;

    friend bool operator==( iterator const & left, iterator const & right ) noexcept { return left.index_ == right.index_; }

private: friend class bit_set;
    constexpr iterator( bit_set const * const set, size_type const index ) noexcept : set_{ set }, index_{ index } {}

    bit_set const * set_  { nullptr };
    size_type       index_{ 0 };
}; // class bit_set::iterator


//! <b>Throws</b>: domain_mismatch if the universes differ.
template <ordinal_element E> [[ nodiscard ]] bit_set<E> unite     ( bit_set<E> left, bit_set<E> const & right ) { return std::move( left.unite     ( right ) ); }
template <ordinal_element E> [[ nodiscard ]] bit_set<E> intersect ( bit_set<E> left, bit_set<E> const & right ) { return std::move( left.intersect ( right ) ); }
template <ordinal_element E> [[ nodiscard ]] bit_set<E> difference( bit_set<E> left, bit_set<E> const & right ) { return std::move( left.difference( right ) ); }

template <ordinal_element E> [[ nodiscard ]] bit_set<E> operator|( bit_set<E> left, bit_set<E> const & right ) { return unite     ( std::move( left ), right ); }
template <ordinal_element E> [[ nodiscard ]] bit_set<E> operator&( bit_set<E> left, bit_set<E> const & right ) { return intersect ( std::move( left ), right ); }
template <ordinal_element E> [[ nodiscard ]] bit_set<E> operator-( bit_set<E> left, bit_set<E> const & right ) { return difference( std::move( left ), right ); }

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
