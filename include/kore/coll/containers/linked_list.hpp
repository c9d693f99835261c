////////////////////////////////////////////////////////////////////////////////
/// Doubly linked sequence over a node_pool: O(1) insertion and removal at
/// both ends and at iterator positions, O(n/2) indexed access (walking from
/// whichever end is closer).
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

#include <kore/coll/containers/errors.hpp>
#include <kore/coll/containers/node_pool.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

template <typename T>
class [[ nodiscard ]] linked_list
{
private:
    struct node
    {
        template <typename ... Args>
        explicit node( std::in_place_t, Args && ... args ) : value( std::forward<Args>( args )... ) {}

        T         value;
        node_slot prev;
        node_slot next;
    }; // struct node

    template <bool is_const>
    class basic_iterator;

public:
    using value_type      = T;
    using       reference = value_type       &;
    using const_reference = value_type const &;
    using size_type       = node_slot::value_type;
    using difference_type = std::ptrdiff_t;

    using       iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true >;

    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

public:
    linked_list() noexcept = default;
    linked_list( std::initializer_list<value_type> const values )
    {
        nodes_.reserve( static_cast<size_type>( values.size() ) );
        for ( auto const & value : values )
            emplace_back( value );
    }
    // node slots are copied verbatim so the links stay valid
    linked_list( linked_list const & ) = default;
    linked_list( linked_list && other ) noexcept
        : nodes_{ std::move( other.nodes_ ) }, head_{ std::exchange( other.head_, node_slot::null ) }, tail_{ std::exchange( other.tail_, node_slot::null ) } {}

    linked_list & operator=( linked_list const & ) = default;
    linked_list & operator=( linked_list && other ) noexcept
    {
        nodes_ = std::move( other.nodes_ );
        head_  = std::exchange( other.head_, node_slot::null );
        tail_  = std::exchange( other.tail_, node_slot::null );
        return *this;
    }

    [[ nodiscard ]] size_type size () const noexcept { return nodes_.size(); }
    [[ nodiscard ]] bool      empty() const noexcept { return BOOST_UNLIKELY( !head_ ); }

    [[ nodiscard ]]       iterator  begin()       noexcept { return {  this, head_ }; }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return {  this, head_ }; }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]]       iterator  end  ()       noexcept { return {  this, node_slot::null }; }
    [[ nodiscard ]] const_iterator  end  () const noexcept { return {  this, node_slot::null }; }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end(); }

    [[ nodiscard ]]       reverse_iterator rbegin()       noexcept { return       reverse_iterator{ end() }; }
    [[ nodiscard ]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    [[ nodiscard ]]       reverse_iterator rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //! <b>Throws</b>: empty_structure if the list is empty.
    [[ nodiscard ]] reference       front()       { return nodes_[ checked_end( head_, "kore::coll::linked_list::front" ) ].value; }
    [[ nodiscard ]] const_reference front() const { return nodes_[ checked_end( head_, "kore::coll::linked_list::front" ) ].value; }
    [[ nodiscard ]] reference       back ()       { return nodes_[ checked_end( tail_, "kore::coll::linked_list::back"  ) ].value; }
    [[ nodiscard ]] const_reference back () const { return nodes_[ checked_end( tail_, "kore::coll::linked_list::back"  ) ].value; }

    template <typename ... Args>
    reference emplace_front( Args && ... args ) { return nodes_[ link_before( head_, std::forward<Args>( args )... ) ].value; }
    template <typename ... Args>
    reference emplace_back ( Args && ... args ) { return nodes_[ link_before( node_slot::null, std::forward<Args>( args )... ) ].value; }

    void push_front( value_type const &  value ) { emplace_front( value ); }
    void push_front( value_type       && value ) { emplace_front( std::move( value ) ); }
    void push_back ( value_type const &  value ) { emplace_back ( value ); }
    void push_back ( value_type       && value ) { emplace_back ( std::move( value ) ); }

    //! <b>Effects</b>: Unlinks the first/last element.
    //!
    //! <b>Returns</b>: The removed value.
    //!
    //! <b>Throws</b>: empty_structure if the list is empty.
    value_type pop_front() { return unlink( checked_end( head_, "kore::coll::linked_list::pop_front" ) ); }
    value_type pop_back () { return unlink( checked_end( tail_, "kore::coll::linked_list::pop_back"  ) ); }

    //! <b>Effects</b>: Returns the element at index, walking from the head for
    //!   the first half of the list and from the tail for the second.
    //!
    //! <b>Throws</b>: index_out_of_range if index >= size().
    [[ nodiscard ]] reference       at( size_type const index )       { detail::verify_index( index, size(), "kore::coll::linked_list::at" ); return nodes_[ locate( index ) ].value; }
    [[ nodiscard ]] const_reference at( size_type const index ) const { detail::verify_index( index, size(), "kore::coll::linked_list::at" ); return nodes_[ locate( index ) ].value; }

    //! <b>Effects</b>: Splices a new node before the element at index (appends
    //!   if index == size()).
    //!
    //! <b>Throws</b>: index_out_of_range if index > size().
    template <typename U = value_type>
    reference insert_at( size_type const index, U && value )
    {
        detail::verify_index( index, size() + 1, "kore::coll::linked_list::insert_at" );
        auto const successor{ ( index == size() ) ? node_slot::null : locate( index ) };
        return nodes_[ link_before( successor, std::forward<U>( value ) ) ].value;
    }

    //! <b>Throws</b>: index_out_of_range if index >= size().
    value_type remove_at( size_type const index )
    {
        detail::verify_index( index, size(), "kore::coll::linked_list::remove_at" );
        return unlink( locate( index ) );
    }

    template <typename ... Args>
    iterator emplace( const_iterator const position, Args && ... args )
    {
        BOOST_ASSERT( position.list_ == this );
        return { this, link_before( position.slot_, std::forward<Args>( args )... ) };
    }
    iterator insert( const_iterator const position, value_type const &  value ) { return emplace( position, value ); }
    iterator insert( const_iterator const position, value_type       && value ) { return emplace( position, std::move( value ) ); }

    iterator erase( const_iterator const position )
    {
        BOOST_ASSERT( position.list_ == this );
        BOOST_ASSERT( position.slot_ );
        auto const next{ nodes_[ position.slot_ ].next };
        unlink( position.slot_ );
        return { this, next };
    }

    void clear() noexcept
    {
        nodes_.clear();
        head_ = tail_ = node_slot::null;
    }

    // Checks the link structure: head/tail terminators, prev/next symmetry and
    // that the chain length matches size().
    [[ nodiscard ]] bool validate() const noexcept
    {
        if ( !head_ || !tail_ )
            return !head_ && !tail_ && size() == 0;
        if ( nodes_[ head_ ].prev || nodes_[ tail_ ].next )
            return false;
        size_type chain_length{ 0 };
        node_slot previous{ node_slot::null };
        for ( auto current{ head_ }; current; current = nodes_[ current ].next )
        {
            if ( !nodes_.is_live( current ) || nodes_[ current ].prev != previous )
                return false;
            if ( ++chain_length > size() )
                return false;
            previous = current;
        }
        return ( previous == tail_ ) && ( chain_length == size() );
    }

    friend bool operator==( linked_list const & left, linked_list const & right ) noexcept
    {
        return std::equal( left.begin(), left.end(), right.begin(), right.end() );
    }

private:
    node_slot checked_end( node_slot const end_node, char const * const what ) const
    {
        if ( !end_node ) [[ unlikely ]]
            detail::throw_empty_structure( what );
        return end_node;
    }

    [[ gnu::pure ]] node_slot locate( size_type const index ) const noexcept
    {
        BOOST_ASSERT( index < size() );
        if ( index < size() / 2 )
        {
            auto current{ head_ };
            for ( size_type i{ 0 }; i < index; ++i )
                current = nodes_[ current ].next;
            return current;
        }
        auto current{ tail_ };
        for ( auto i{ static_cast<size_type>( size() - 1 ) }; i > index; --i )
            current = nodes_[ current ].prev;
        return current;
    }

    // successor == null appends
    template <typename ... Args>
    node_slot link_before( node_slot const successor, Args && ... args )
    {
        auto const new_node{ nodes_.acquire( std::in_place, std::forward<Args>( args )... ) };
        auto const predecessor{ successor ? nodes_[ successor ].prev : tail_ };
        auto & linked{ nodes_[ new_node ] };
        linked.prev = predecessor;
        linked.next = successor;
        if ( predecessor ) nodes_[ predecessor ].next = new_node; else head_ = new_node;
        if ( successor   ) nodes_[ successor   ].prev = new_node; else tail_ = new_node;
        return new_node;
    }

    value_type unlink( node_slot const node ) noexcept( std::is_nothrow_move_constructible_v<value_type> )
    {
        auto & unlinked{ nodes_[ node ] };
        auto const prev{ unlinked.prev };
        auto const next{ unlinked.next };
        if ( prev ) nodes_[ prev ].next = next; else head_ = next;
        if ( next ) nodes_[ next ].prev = prev; else tail_ = prev;
        value_type value( std::move( unlinked.value ) );
        nodes_.release( node );
        return value;
    }

private:
    node_pool<node> nodes_;
    node_slot       head_;
    node_slot       tail_;
}; // class linked_list


template <typename T>
template <bool is_const>
class linked_list<T>::basic_iterator
    :
    public boost::stl_interfaces::iterator_interface
    <
        basic_iterator<is_const>,
        std::bidirectional_iterator_tag,
        T,
        std::conditional_t<is_const, T const &, T &>,
        std::conditional_t<is_const, T const *, T *>
    >
{
private:
    using list_t = std::conditional_t<is_const, linked_list const, linked_list>;
    using base_type = boost::stl_interfaces::iterator_interface
    <
        basic_iterator<is_const>,
        std::bidirectional_iterator_tag,
        T,
        std::conditional_t<is_const, T const &, T &>,
        std::conditional_t<is_const, T const *, T *>
    >;

public:
    constexpr basic_iterator() noexcept = default;
    template <bool other_const> requires( is_const && !other_const )
    constexpr basic_iterator( basic_iterator<other_const> const & other ) noexcept
        : list_{ other.list_ }, slot_{ other.slot_ } {}

    typename base_type::reference operator*() const noexcept { return list_->nodes_[ slot_ ].value; }

    basic_iterator & operator++() noexcept { slot_ = list_->nodes_[ slot_ ].next; return *this; }
    // decrementing end() lands on the tail
    basic_iterator & operator--() noexcept { slot_ = slot_ ? list_->nodes_[ slot_ ].prev : list_->tail_; return *this; }
    using base_type::operator++;
    using base_type::operator--;

    friend bool operator==( basic_iterator const & left, basic_iterator const & right ) noexcept
    {
        BOOST_ASSERT( left.list_ == right.list_ || !left.list_ || !right.list_ );
        return left.slot_ == right.slot_;
    }

private: friend class linked_list; friend class basic_iterator<!is_const>;
    constexpr basic_iterator( list_t * const list, node_slot const slot ) noexcept : list_{ list }, slot_{ slot } {}

    list_t *  list_{ nullptr };
    node_slot slot_;
}; // class linked_list::basic_iterator

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
