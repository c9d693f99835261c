////////////////////////////////////////////////////////////////////////////////
/// Slot addressed node storage shared by the node based containers: nodes
/// link to each other with node_slot indices (instead of pointers) so
/// back links (parent, prev) are plain non-owning values and the whole
/// structure is a single owning vector (no per node allocations, no ownership
/// cycles). Released slots are recycled (through an intrusive free list)
/// before the pool grows.
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

#include <kore/coll/containers/growable_vector.hpp>

#include <boost/assert.hpp>

#include <cstdint>
#include <optional>
#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

struct [[ nodiscard, clang::trivial_abi ]] node_slot // a pool index standing in for a node pointer
{
    using value_type = std::uint32_t;
    static node_slot const null;
    value_type index{ static_cast<value_type>( -1 ) };
    [[ gnu::pure ]] value_type operator*() const noexcept { BOOST_ASSERT( index != null.index ); return index; }
    [[ gnu::pure ]] bool operator==( node_slot const other ) const noexcept { return this->index == other.index; }
    [[ gnu::pure ]] explicit operator bool() const noexcept { return index != null.index; }
}; // struct node_slot

inline node_slot const node_slot::null{};


template <typename Node>
class node_pool
{
private:
    struct slot
    {
        slot() = default;
        template <typename ... Args>
        explicit slot( std::in_place_t, Args && ... args ) : node( std::in_place, std::forward<Args>( args )... ) {}

        std::optional<Node> node;
        node_slot           next_free;
    }; // struct slot

public:
    using size_type = node_slot::value_type;

    node_pool() noexcept = default;
    node_pool( node_pool const & ) = default;
    node_pool( node_pool && other ) noexcept
        : slots_{ std::move( other.slots_ ) }, free_list_{ std::exchange( other.free_list_, node_slot::null ) }, live_count_{ std::exchange( other.live_count_, 0 ) } {}

    node_pool & operator=( node_pool const & ) = default;
    node_pool & operator=( node_pool && other ) noexcept
    {
        slots_      = std::move( other.slots_ );
        free_list_  = std::exchange( other.free_list_ , node_slot::null );
        live_count_ = std::exchange( other.live_count_, 0               );
        return *this;
    }

    //! <b>Effects</b>: Constructs a node from args in a recycled slot (or a new
    //!   one if the free list is empty).
    //!
    //! <b>Note</b>: may relocate all nodes (invalidating references to them but
    //!   not their slots).
    template <typename ... Args>
    node_slot acquire( Args && ... args )
    {
        if ( free_list_ )
        {
            auto const recycled{ free_list_ };
            auto & cached_slot{ slots_[ *recycled ] };
            BOOST_ASSERT( !cached_slot.node );
            cached_slot.node.emplace( std::forward<Args>( args )... );
            free_list_ = std::exchange( cached_slot.next_free, node_slot::null );
            ++live_count_;
            return recycled;
        }
        if ( slots_.size() == node_slot::null.index ) [[ unlikely ]]
            detail::throw_bad_alloc();
        slots_.emplace_back( std::in_place, std::forward<Args>( args )... );
        ++live_count_;
        return { static_cast<node_slot::value_type>( slots_.size() - 1 ) };
    }

    void release( node_slot const node ) noexcept
    {
        auto & released{ slots_[ *node ] };
        BOOST_ASSERT( released.node );
        BOOST_ASSERT( live_count_ );
        released.node.reset();
        released.next_free = free_list_;
        free_list_ = node;
        --live_count_;
    }

    [[ nodiscard ]] Node       & operator[]( node_slot const node )       noexcept { BOOST_ASSERT( is_live( node ) ); return *slots_[ *node ].node; }
    [[ nodiscard ]] Node const & operator[]( node_slot const node ) const noexcept { BOOST_ASSERT( is_live( node ) ); return *slots_[ *node ].node; }

    // number of live nodes
    [[ nodiscard ]] size_type size      () const noexcept { return live_count_; }
    // number of live + recyclable slots
    [[ nodiscard ]] size_type slot_count() const noexcept { return slots_.size(); }

    [[ nodiscard ]] bool is_live( node_slot const node ) const noexcept
    {
        return node && ( *node < slots_.size() ) && slots_[ *node ].node.has_value();
    }

    void reserve( size_type const node_count ) { slots_.reserve( node_count ); }

    void clear() noexcept
    {
        slots_.clear();
        free_list_  = node_slot::null;
        live_count_ = 0;
    }

private:
    growable_vector<slot, node_slot::value_type> slots_;
    node_slot                                    free_list_;
    size_type                                    live_count_{ 0 };
}; // class node_pool

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
