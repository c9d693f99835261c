////////////////////////////////////////////////////////////////////////////////
/// Separate chaining hash map with power-of-2 bucket counts. Over-long
/// collision chains escalate into balanced trees (rb_map keyed by
/// (hash, insertion sequence)) once the table is large enough and trees that
/// shrink back below a threshold during a resize split revert to chains.
/// Entries live in a node_pool so chains and the insertion order list are
/// node_slot links; linked_hash_map additionally iterates in insertion order.
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
#include <kore/coll/containers/growable_vector.hpp>
#include <kore/coll/containers/node_pool.hpp>
#include <kore/coll/containers/rb_tree.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <bit>
#include <climits>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

struct hash_map_options
{
    std::size_t   initial_capacity    { 16    }; // rounded up to a power of 2
    float         load_factor         { 0.75f }; // (0, 1]
    std::uint32_t treeify_threshold   { 8     }; // a chain longer than this escalates...
    std::uint32_t untreeify_threshold { 6     }; // ...a split tree this small reverts
    std::uint32_t min_treeify_capacity{ 64    }; // ...but smaller tables resize instead
}; // struct hash_map_options

enum class bucket_representation : std::uint8_t { empty, chained, escalated };

namespace detail
{
    // throws invalid_configuration, returns the options with initial_capacity
    // rounded up to a power of 2
    [[ nodiscard ]] hash_map_options validated( hash_map_options );

    [[ nodiscard ]] std::uint32_t resize_threshold( std::uint32_t bucket_count, float load_factor ) noexcept;

    inline std::uint32_t constexpr max_bucket_count{ std::uint32_t{ 1 } << 31 };

    // XOR the upper half of the hash into the lower one: bucket indices are
    // taken from the low bits only
    [[ using gnu: const, always_inline ]] constexpr std::size_t spread( std::size_t const hash ) noexcept
    {
        return hash ^ ( hash >> ( sizeof( hash ) * CHAR_BIT / 2 ) );
    }
} // namespace detail


template
<
    typename Key,
    typename T,
    typename Hash     = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>,
    bool     insertion_ordered = false
>
class [[ nodiscard ]] basic_hash_map
{
public:
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<Key const, T>;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using       reference = value_type       &;
    using const_reference = value_type const &;
    using size_type       = node_slot::value_type;
    using difference_type = std::ptrdiff_t;

private:
    template <bool is_const>
    class basic_iterator;

    struct order_links
    {
        node_slot prev;
        node_slot next;
    }; // struct order_links
    struct no_order_links {};

    struct entry
    {
        template <typename ... Args>
        entry( std::size_t const hash_value, std::uint64_t const seq, Args && ... args )
            : kv( std::forward<Args>( args )... ), hash{ hash_value }, sequence{ seq } {}

        value_type    kv;
        std::size_t   hash;
        std::uint64_t sequence;
        node_slot     next; // chain link (unused in escalated buckets)
        [[ no_unique_address ]]
        std::conditional_t<insertion_ordered, order_links, no_order_links> order;
    }; // struct entry

    struct chain
    {
        node_slot head;
        size_type length{ 0 };
    }; // struct chain

    // total order within an escalated bucket: hash first then insertion
    // sequence (so colliding distinct keys stay distinct)
    struct bin_key
    {
        std::size_t   hash;
        std::uint64_t sequence;
        friend constexpr auto operator<=>( bin_key const &, bin_key const & ) noexcept = default;
    }; // struct bin_key

    using tree_bin = rb_map<bin_key, node_slot>;
    using bucket   = std::variant<std::monostate, chain, tree_bin>;

public:
    using       iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true >;

public:
    basic_hash_map() : basic_hash_map( hash_map_options{} ) {}
    explicit basic_hash_map( hash_map_options const & options, Hash const & hash = {}, KeyEqual const & equal = {} )
        :
        options_ { detail::validated( options ) },
        capacity_{ static_cast<size_type>( options_.initial_capacity ) },
        threshold_{ detail::resize_threshold( capacity_, options_.load_factor ) },
        hash_    { hash  },
        key_eq_  { equal }
    {}
    basic_hash_map( std::initializer_list<value_type> const values, hash_map_options const & options = {} )
        : basic_hash_map( options )
    {
        reserve( static_cast<size_type>( values.size() ) );
        for ( auto const & value : values )
            insert( value );
    }

    // entry slots are copied verbatim so all the links stay valid
    basic_hash_map( basic_hash_map const & ) = default;
    basic_hash_map( basic_hash_map && other ) noexcept
        :
        entries_      { std::move( other.entries_ ) },
        buckets_      { std::move( other.buckets_ ) },
        options_      { other.options_   },
        capacity_     { other.capacity_  },
        threshold_    { other.threshold_ },
        next_sequence_{ std::exchange( other.next_sequence_, 0 ) },
        order_head_   { std::exchange( other.order_head_, node_slot::null ) },
        order_tail_   { std::exchange( other.order_tail_, node_slot::null ) },
        hash_         { other.hash_   },
        key_eq_       { other.key_eq_ }
    {}

    basic_hash_map & operator=( basic_hash_map const & ) = default;
    basic_hash_map & operator=( basic_hash_map && other ) noexcept
    {
        entries_       = std::move( other.entries_ );
        buckets_       = std::move( other.buckets_ );
        options_       = other.options_;
        capacity_      = other.capacity_;
        threshold_     = other.threshold_;
        next_sequence_ = std::exchange( other.next_sequence_, 0 );
        order_head_    = std::exchange( other.order_head_, node_slot::null );
        order_tail_    = std::exchange( other.order_tail_, node_slot::null );
        hash_          = other.hash_;
        key_eq_        = other.key_eq_;
        return *this;
    }

    [[ nodiscard ]] size_type size () const noexcept { return entries_.size(); }
    [[ nodiscard ]] bool      empty() const noexcept { return BOOST_UNLIKELY( size() == 0 ); }

    [[ nodiscard ]] hash_map_options const & options() const noexcept { return options_; }
    [[ nodiscard ]] hasher   hash_function() const { return hash_  ; }
    [[ nodiscard ]] key_equal key_eq      () const { return key_eq_; }

    //////////////////////////////////////////////
    //                iterators
    //////////////////////////////////////////////

    [[ nodiscard ]]       iterator  begin()       noexcept { return { this, first_entry() }; }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return { this, first_entry() }; }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]]       iterator  end  ()       noexcept { return { this, node_slot::null }; }
    [[ nodiscard ]] const_iterator  end  () const noexcept { return { this, node_slot::null }; }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end(); }

    //////////////////////////////////////////////
    //                modifiers
    //////////////////////////////////////////////

    template <typename ... Args>
    std::pair<iterator, bool> try_emplace( key_type const & key, Args && ... args )
    {
        auto const hash_value{ hash_of( key ) };
        if ( auto const existing{ find_entry( key, hash_value ) } )
            return { iterator{ this, existing }, false };
        auto const inserted{ insert_new( hash_value, std::piecewise_construct, std::forward_as_tuple( key ), std::forward_as_tuple( std::forward<Args>( args )... ) ) };
        return { iterator{ this, inserted }, true };
    }

    std::pair<iterator, bool> insert( value_type const & value ) { return try_emplace( value.first, value.second ); }
    std::pair<iterator, bool> insert( value_type && value ) { return try_emplace( value.first, std::move( value.second ) ); }

    //! <b>Effects</b>: Maps key to value, replacing the previously mapped
    //!   value (an existing key keeps its position in the iteration order).
    //!
    //! <b>Returns</b>: The replaced value (empty if key was newly inserted).
    template <typename U = mapped_type>
    std::optional<mapped_type> insert_or_assign( key_type const & key, U && value )
    {
        auto const hash_value{ hash_of( key ) };
        if ( auto const existing{ find_entry( key, hash_value ) } )
        {
            mapped_type incoming( std::forward<U>( value ) );
            return std::exchange( entries_[ existing ].kv.second, std::move( incoming ) );
        }
        insert_new( hash_value, std::piecewise_construct, std::forward_as_tuple( key ), std::forward_as_tuple( std::forward<U>( value ) ) );
        return std::nullopt;
    }
    template <typename U = mapped_type>
    std::optional<mapped_type> put( key_type const & key, U && value ) { return insert_or_assign( key, std::forward<U>( value ) ); }

    mapped_type & operator[]( key_type const & key ) { return try_emplace( key ).first->second; }

    //! <b>Returns</b>: Whether key was present (and removed).
    bool erase( key_type const & key )
    {
        auto const entry_slot{ find_entry( key, hash_of( key ) ) };
        if ( !entry_slot )
            return false;
        erase_entry( entry_slot );
        return true;
    }

    iterator erase( const_iterator const position )
    {
        BOOST_ASSERT( position.map_ == this );
        BOOST_ASSERT( position.slot_ );
        auto const following{ next_entry( position.slot_ ) };
        erase_entry( position.slot_ );
        return { this, following };
    }

    // retains the bucket count
    void clear() noexcept
    {
        entries_.clear();
        buckets_.clear();
        next_sequence_ = 0;
        order_head_    = order_tail_ = node_slot::null;
    }

    // makes room for entry_count entries without triggering a resize
    void reserve( size_type const entry_count )
    {
        auto const required_buckets{ static_cast<std::size_t>( static_cast<double>( entry_count ) / options_.load_factor ) + 1 };
        rehash( static_cast<size_type>( std::min<std::size_t>( required_buckets, detail::max_bucket_count ) ) );
    }

    // grows (never shrinks) the bucket count to at least bucket_count
    void rehash( size_type const bucket_count )
    {
        auto const target{ static_cast<size_type>( std::bit_ceil( std::min<std::size_t>( std::max<std::size_t>( bucket_count, 1 ), detail::max_bucket_count ) ) ) };
        if ( buckets_.empty() )
        {
            if ( target > capacity_ )
            {
                capacity_  = target;
                threshold_ = detail::resize_threshold( capacity_, options_.load_factor );
            }
            return;
        }
        while ( capacity_ < target )
            resize();
    }

    //////////////////////////////////////////////
    //                  lookup
    //////////////////////////////////////////////

    [[ nodiscard ]]       iterator find( key_type const & key )       { return { this, find_entry( key, hash_of( key ) ) }; }
    [[ nodiscard ]] const_iterator find( key_type const & key ) const { return { this, find_entry( key, hash_of( key ) ) }; }

    [[ nodiscard ]] bool contains( key_type const & key ) const { return static_cast<bool>( find_entry( key, hash_of( key ) ) ); }

    //! <b>Returns</b>: A pointer to the mapped value or nullptr if key is absent.
    [[ nodiscard ]] mapped_type       * get( key_type const & key )       { auto const slot{ find_entry( key, hash_of( key ) ) }; return slot ? &entries_[ slot ].kv.second : nullptr; }
    [[ nodiscard ]] mapped_type const * get( key_type const & key ) const { auto const slot{ find_entry( key, hash_of( key ) ) }; return slot ? &entries_[ slot ].kv.second : nullptr; }

    //! <b>Throws</b>: key_not_found if key is absent.
    [[ nodiscard ]] mapped_type & at( key_type const & key )
    {
        auto const value{ get( key ) };
        if ( !value ) [[ unlikely ]]
            detail::throw_key_not_found( "kore::coll::hash_map::at" );
        return *value;
    }
    [[ nodiscard ]] mapped_type const & at( key_type const & key ) const
    {
        auto const value{ get( key ) };
        if ( !value ) [[ unlikely ]]
            detail::throw_key_not_found( "kore::coll::hash_map::at" );
        return *value;
    }

    //////////////////////////////////////////////
    //               introspection
    //////////////////////////////////////////////

    [[ nodiscard ]] size_type bucket_count() const noexcept { return capacity_; }
    [[ nodiscard ]] size_type bucket_index( key_type const & key ) const { return index_for( hash_of( key ) ); }
    [[ nodiscard ]] float     load_factor () const noexcept { return static_cast<float>( size() ) / static_cast<float>( capacity_ ); }

    [[ nodiscard ]] bucket_representation bucket_kind( size_type const index ) const
    {
        detail::verify_index( index, capacity_, "kore::coll::hash_map::bucket_kind" );
        if ( buckets_.empty() )
            return bucket_representation::empty;
        return static_cast<bucket_representation>( buckets_[ index ].index() );
    }

    [[ nodiscard ]] size_type bucket_size( size_type const index ) const
    {
        detail::verify_index( index, capacity_, "kore::coll::hash_map::bucket_size" );
        if ( buckets_.empty() )
            return 0;
        auto const & target{ buckets_[ index ] };
        if ( auto const p_chain{ std::get_if<chain   >( &target ) } ) return p_chain->length;
        if ( auto const p_tree { std::get_if<tree_bin>( &target ) } ) return p_tree ->size();
        return 0;
    }

    // Re-checks every structural invariant: bucket placement of every entry,
    // chain lengths, escalated bucket trees, absence of duplicate keys, the
    // total population and (for linked_hash_map) the insertion order list.
    [[ nodiscard ]] bool validate() const;

    friend bool operator==( basic_hash_map const & left, basic_hash_map const & right )
    {
        if ( left.size() != right.size() )
            return false;
        for ( auto const & [key, value] : left )
        {
            auto const p_right_value{ right.get( key ) };
            if ( !p_right_value || !( *p_right_value == value ) )
                return false;
        }
        return true;
    }

    // solely a debugging helper (include hash_map_print.hpp)
    void print() const;

private:
    [[ nodiscard ]] std::size_t hash_of  ( key_type    const & key        ) const { return detail::spread( hash_( key ) ); }
    [[ nodiscard ]] size_type   index_for( std::size_t const   hash_value ) const noexcept { return static_cast<size_type>( hash_value & ( capacity_ - 1 ) ); }

    [[ nodiscard ]] bin_key bin_key_of( node_slot const slot ) const noexcept { auto const & e{ entries_[ slot ] }; return { e.hash, e.sequence }; }

    [[ nodiscard ]] node_slot find_entry( key_type const & key, std::size_t const hash_value ) const
    {
        if ( buckets_.empty() )
            return {};
        auto const & target{ buckets_[ index_for( hash_value ) ] };
        if ( auto const p_chain{ std::get_if<chain>( &target ) } )
        {
            for ( auto slot{ p_chain->head }; slot; slot = entries_[ slot ].next )
            {
                auto const & candidate{ entries_[ slot ] };
                if ( ( candidate.hash == hash_value ) && key_eq_( candidate.kv.first, key ) )
                    return slot;
            }
        }
        else
        if ( auto const p_tree{ std::get_if<tree_bin>( &target ) } )
        {
            for ( auto pos{ p_tree->ceiling( bin_key{ hash_value, 0 } ) }; ( pos != p_tree->end() ) && ( pos->first.hash == hash_value ); ++pos )
            {
                if ( key_eq_( entries_[ pos->second ].kv.first, key ) )
                    return pos->second;
            }
        }
        return {};
    }

    template <typename ... Args>
    node_slot insert_new( std::size_t const hash_value, Args && ... args )
    {
        if ( buckets_.empty() )
            buckets_.grow_to( capacity_, value_init );
        auto const slot{ entries_.acquire( hash_value, next_sequence_, std::forward<Args>( args )... ) };
        ++next_sequence_;
        link_order( slot );
        auto const bucket_index{ index_for( hash_value ) };
        auto & target{ buckets_[ bucket_index ] };
        if ( auto const p_tree{ std::get_if<tree_bin>( &target ) } )
        {
            p_tree->try_emplace( bin_key_of( slot ), slot );
        }
        else
        {
            if ( std::holds_alternative<std::monostate>( target ) )
                target.template emplace<chain>();
            auto & bucket_chain{ std::get<chain>( target ) };
            append_to_chain( bucket_chain, slot );
            if ( bucket_chain.length > options_.treeify_threshold )
            {
                if ( capacity_ < options_.min_treeify_capacity && capacity_ < detail::max_bucket_count )
                    resize();
                else
                    treeify( bucket_index );
            }
        }
        if ( size() > threshold_ )
            resize();
        return slot;
    }

    void append_to_chain( chain & bucket_chain, node_slot const slot ) noexcept
    {
        entries_[ slot ].next = node_slot::null;
        if ( !bucket_chain.head )
        {
            bucket_chain.head = slot;
        }
        else
        {
            auto tail{ bucket_chain.head };
            while ( entries_[ tail ].next )
                tail = entries_[ tail ].next;
            entries_[ tail ].next = slot;
        }
        ++bucket_chain.length;
    }

    void treeify( size_type const bucket_index )
    {
        auto & target{ buckets_[ bucket_index ] };
        auto const & bucket_chain{ std::get<chain>( target ) };
        tree_bin tree;
        tree.reserve( bucket_chain.length );
        for ( auto slot{ bucket_chain.head }; slot; slot = entries_[ slot ].next )
            tree.try_emplace( bin_key_of( slot ), slot );
        target = std::move( tree );
    }

    [[ nodiscard ]] bucket link_chain( std::span<node_slot const> const slots ) noexcept
    {
        if ( slots.empty() )
            return {};
        for ( std::size_t i{ 0 }; i < slots.size(); ++i )
            entries_[ slots[ i ] ].next = ( i + 1 < slots.size() ) ? slots[ i + 1 ] : node_slot::null;
        return chain{ slots.front(), static_cast<size_type>( slots.size() ) };
    }

    [[ nodiscard ]] bucket build_tree( std::span<node_slot const> const slots )
    {
        tree_bin tree;
        tree.reserve( static_cast<size_type>( slots.size() ) );
        for ( auto const slot : slots )
            tree.try_emplace( bin_key_of( slot ), slot );
        return tree;
    }

    // Doubles the bucket count: every old bucket i splits (by the newly
    // significant hash bit) into buckets i and i + old_capacity, preserving the
    // relative order of its entries. Split trees at or below the untreeify
    // threshold revert to chains.
    [[ gnu::cold ]] void resize()
    {
        auto const old_capacity{ capacity_ };
        if ( old_capacity >= detail::max_bucket_count ) [[ unlikely ]]
        {
            threshold_ = node_slot::null.index;
            return;
        }
        auto const new_capacity{ static_cast<size_type>( old_capacity * 2 ) };
        growable_vector<bucket, size_type> new_buckets;
        new_buckets.grow_to( new_capacity, value_init );

        growable_vector<node_slot, size_type> low;
        growable_vector<node_slot, size_type> high;
        for ( size_type i{ 0 }; i < old_capacity; ++i )
        {
            auto const & old_bucket{ buckets_[ i ] };
            if ( std::holds_alternative<std::monostate>( old_bucket ) )
                continue;
            low .clear();
            high.clear();
            bool const escalated{ std::holds_alternative<tree_bin>( old_bucket ) };
            if ( escalated )
            {
                for ( auto const & [bin, slot] : std::get<tree_bin>( old_bucket ) )
                    ( ( bin.hash & old_capacity ) ? high : low ).push_back( slot );
            }
            else
            {
                for ( auto slot{ std::get<chain>( old_bucket ).head }; slot; slot = entries_[ slot ].next )
                    ( ( entries_[ slot ].hash & old_capacity ) ? high : low ).push_back( slot );
            }
            auto const redistribute{ [&]( std::span<node_slot const> const slots ) -> bucket
            {
                if ( escalated && ( slots.size() > options_.untreeify_threshold ) )
                    return build_tree( slots );
                return link_chain( slots );
            }};
            new_buckets[ i                ] = redistribute( low .span() );
            new_buckets[ i + old_capacity ] = redistribute( high.span() );
        }
        buckets_   = std::move( new_buckets );
        capacity_  = new_capacity;
        threshold_ = detail::resize_threshold( capacity_, options_.load_factor );
    }

    void erase_entry( node_slot const slot )
    {
        auto const hash_value{ entries_[ slot ].hash };
        auto & target{ buckets_[ index_for( hash_value ) ] };
        if ( auto const p_chain{ std::get_if<chain>( &target ) } )
        {
            node_slot previous{};
            for ( auto current{ p_chain->head }; current != slot; current = entries_[ current ].next )
            {
                BOOST_ASSERT( current );
                previous = current;
            }
            auto const following{ entries_[ slot ].next };
            if ( previous ) entries_[ previous ].next = following;
            else            p_chain->head          = following;
            if ( --p_chain->length == 0 )
                target = std::monostate{};
        }
        else
        {
            auto & tree{ std::get<tree_bin>( target ) };
            BOOST_VERIFY( tree.erase( bin_key_of( slot ) ) );
            if ( tree.empty() )
                target = std::monostate{};
        }
        unlink_order( slot );
        entries_.release( slot );
    }

    void link_order( node_slot const slot ) noexcept
    {
        if constexpr ( insertion_ordered )
        {
            auto & links{ entries_[ slot ].order };
            links.prev = order_tail_;
            links.next = node_slot::null;
            if ( order_tail_ ) entries_[ order_tail_ ].order.next = slot;
            else               order_head_ = slot;
            order_tail_ = slot;
        }
    }

    void unlink_order( node_slot const slot ) noexcept
    {
        if constexpr ( insertion_ordered )
        {
            auto const & links{ entries_[ slot ].order };
            if ( links.prev ) entries_[ links.prev ].order.next = links.next; else order_head_ = links.next;
            if ( links.next ) entries_[ links.next ].order.prev = links.prev; else order_tail_ = links.prev;
        }
    }

    [[ nodiscard ]] node_slot first_entry() const noexcept
    {
        if constexpr ( insertion_ordered )
            return order_head_;
        else
            return live_slot_from( 0 );
    }

    [[ nodiscard ]] node_slot next_entry( node_slot const slot ) const noexcept
    {
        if constexpr ( insertion_ordered )
            return entries_[ slot ].order.next;
        else
            return live_slot_from( *slot + 1 );
    }

    [[ nodiscard ]] node_slot live_slot_from( size_type index ) const noexcept
    {
        for ( ; index < entries_.slot_count(); ++index )
        {
            if ( entries_.is_live( { index } ) )
                return { index };
        }
        return {};
    }

private:
    node_pool<entry>                   entries_;
    growable_vector<bucket, size_type> buckets_; // allocated on the first insertion
    hash_map_options                   options_;
    size_type                          capacity_;
    size_type                          threshold_;
    std::uint64_t                      next_sequence_{ 0 };
    node_slot                          order_head_;
    node_slot                          order_tail_;
    [[ no_unique_address ]] Hash       hash_;
    [[ no_unique_address ]] KeyEqual   key_eq_;
}; // class basic_hash_map


template <typename Key, typename T, typename Hash, typename KeyEqual, bool insertion_ordered>
template <bool is_const>
class basic_hash_map<Key, T, Hash, KeyEqual, insertion_ordered>::basic_iterator
    :
    public boost::stl_interfaces::iterator_interface
    <
        basic_iterator<is_const>,
        std::forward_iterator_tag,
        value_type,
        std::conditional_t<is_const, value_type const &, value_type &>,
        std::conditional_t<is_const, value_type const *, value_type *>
    >
{
private:
    using map_t     = std::conditional_t<is_const, basic_hash_map const, basic_hash_map>;
    using base_type = boost::stl_interfaces::iterator_interface
    <
        basic_iterator<is_const>,
        std::forward_iterator_tag,
        value_type,
        std::conditional_t<is_const, value_type const &, value_type &>,
        std::conditional_t<is_const, value_type const *, value_type *>
    >;

public:
    constexpr basic_iterator() noexcept = default;
    template <bool other_const> requires( is_const && !other_const )
    constexpr basic_iterator( basic_iterator<other_const> const & other ) noexcept
        : map_{ other.map_ }, slot_{ other.slot_ } {}

    typename base_type::reference operator*() const noexcept { return map_->entries_[ slot_ ].kv; }

    basic_iterator & operator++() noexcept { slot_ = map_->next_entry( slot_ ); return *this; }
    using base_type::operator++;

    friend bool operator==( basic_iterator const & left, basic_iterator const & right ) noexcept
    {
        return left.slot_ == right.slot_;
    }

private: friend class basic_hash_map; friend class basic_iterator<!is_const>;
    constexpr basic_iterator( map_t * const map, node_slot const slot ) noexcept : map_{ map }, slot_{ slot } {}

    map_t *   map_{ nullptr };
    node_slot slot_;
}; // class basic_hash_map::basic_iterator


template <typename Key, typename T, typename Hash, typename KeyEqual, bool insertion_ordered>
bool basic_hash_map<Key, T, Hash, KeyEqual, insertion_ordered>::validate() const
{
    if ( !std::has_single_bit( capacity_ ) || ( capacity_ > detail::max_bucket_count ) )
        return false;
    if ( buckets_.empty() )
        return size() == 0;
    if ( buckets_.size() != capacity_ )
        return false;

    size_type population{ 0 };
    auto const check_entry{ [&]( node_slot const slot, size_type const bucket_index )
    {
        if ( !entries_.is_live( slot ) )
            return false;
        auto const & e{ entries_[ slot ] };
        return ( e.hash == hash_of( e.kv.first ) ) && ( index_for( e.hash ) == bucket_index );
    }};
    growable_vector<node_slot, size_type> members;
    for ( size_type i{ 0 }; i < capacity_; ++i )
    {
        auto const & current{ buckets_[ i ] };
        members.clear();
        if ( auto const p_chain{ std::get_if<chain>( &current ) } )
        {
            for ( auto slot{ p_chain->head }; slot; slot = entries_[ slot ].next )
            {
                if ( !check_entry( slot, i ) || ( members.size() >= p_chain->length ) )
                    return false;
                members.push_back( slot );
            }
            if ( members.empty() || ( members.size() != p_chain->length ) )
                return false;
        }
        else
        if ( auto const p_tree{ std::get_if<tree_bin>( &current ) } )
        {
            if ( p_tree->empty() || !p_tree->validate() )
                return false;
            for ( auto const & [bin, slot] : *p_tree )
            {
                if ( !check_entry( slot, i ) || !( bin == bin_key_of( slot ) ) )
                    return false;
                members.push_back( slot );
            }
        }
        for ( size_type a{ 0 }; a < members.size(); ++a )
            for ( auto b{ a + 1 }; b < members.size(); ++b )
                if ( key_eq_( entries_[ members[ a ] ].kv.first, entries_[ members[ b ] ].kv.first ) )
                    return false;
        population += members.size();
    }
    if ( population != size() )
        return false;

    if constexpr ( insertion_ordered )
    {
        size_type listed{ 0 };
        node_slot previous{};
        for ( auto slot{ order_head_ }; slot; slot = entries_[ slot ].order.next )
        {
            if ( !entries_.is_live( slot ) || ( entries_[ slot ].order.prev != previous ) || ( ++listed > size() ) )
                return false;
            previous = slot;
        }
        if ( ( listed != size() ) || ( previous != order_tail_ ) )
            return false;
    }
    return true;
}


template <typename Key, typename T, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using hash_map = basic_hash_map<Key, T, Hash, KeyEqual, false>;

// iterates in insertion order (re-inserting an existing key keeps its position)
template <typename Key, typename T, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using linked_hash_map = basic_hash_map<Key, T, Hash, KeyEqual, true>;

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
