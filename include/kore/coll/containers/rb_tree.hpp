////////////////////////////////////////////////////////////////////////////////
/// Red-black balanced ordered map. Nodes are slots in a pool (links in a
/// non-template base which implements all of the comparator independent
/// rebalancing/navigation logic out-of-line, values in a parallel vector in
/// the derived template).
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
#include <kore/coll/containers/komparator.hpp>
#include <kore/coll/containers/node_pool.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \class rb_tree_base
////////////////////////////////////////////////////////////////////////////////

class rb_tree_base
{
public:
    using size_type = node_slot::value_type;

    enum class color : std::uint8_t { red, black };

    [[ nodiscard ]] size_type size () const noexcept { return size_; }
    [[ nodiscard ]] bool      empty() const noexcept { return BOOST_UNLIKELY( size_ == 0 ); }

    // number of black nodes on every root-to-null path (null leaves not counted)
    [[ nodiscard ]] size_type black_height() const noexcept;

protected:
    struct links
    {
        node_slot parent{};
        node_slot left  {};
        node_slot right {};
        color     colour{ color::red };
    }; // struct links

    rb_tree_base() noexcept = default;
    rb_tree_base( rb_tree_base const & ) = default;
    rb_tree_base( rb_tree_base && ) noexcept;
   ~rb_tree_base() noexcept = default;

    rb_tree_base & operator=( rb_tree_base const & ) = default;
    rb_tree_base & operator=( rb_tree_base && ) noexcept;

    // recycled slots first, fresh (slot_count()) ones otherwise
    [[ nodiscard ]] node_slot allocate_links();
    void free_links( node_slot ) noexcept;

    // links node (previously obtained from allocate_links()) as a red leaf
    // under parent (null for the root) and restores the red-black properties
    void insert_and_rebalance( node_slot node, node_slot parent, bool as_left ) noexcept;
    // unlinks node (leaving it allocated: the caller frees it) and restores
    // the red-black properties (nodes are relinked, never swapped by value)
    void erase_and_rebalance( node_slot node ) noexcept;

    [[ nodiscard, gnu::pure ]] node_slot minimum( node_slot ) const noexcept;
    [[ nodiscard, gnu::pure ]] node_slot maximum( node_slot ) const noexcept;
    [[ nodiscard, gnu::pure ]] node_slot next   ( node_slot ) const noexcept; // null after the last
    [[ nodiscard, gnu::pure ]] node_slot prev   ( node_slot ) const noexcept; // maximum for null (end)

    [[ nodiscard ]] node_slot first() const noexcept { return root_ ? minimum( root_ ) : node_slot::null; }
    [[ nodiscard ]] node_slot last () const noexcept { return root_ ? maximum( root_ ) : node_slot::null; }

    [[ nodiscard ]] node_slot root () const noexcept { return root_; }
    [[ nodiscard ]] node_slot left ( node_slot const node ) const noexcept { return lnk( node ).left ; }
    [[ nodiscard ]] node_slot right( node_slot const node ) const noexcept { return lnk( node ).right; }
    [[ nodiscard ]] bool      is_red( node_slot const node ) const noexcept { return node && ( lnk( node ).colour == color::red ); }

    // number of slots ever handed out by allocate_links() (live and free)
    [[ nodiscard ]] size_type slot_count() const noexcept { return links_.size(); }

    void reserve_links( size_type const node_count ) { links_.reserve( node_count ); }

    // parent/child symmetry, root color, no red-red edges, uniform black
    // height and a node count matching size()
    [[ nodiscard ]] bool validate_structure() const noexcept;

    void clear_links() noexcept;

private:
    [[ gnu::pure ]] links       & lnk( node_slot const node )       noexcept { return links_[ *node ]; }
    [[ gnu::pure ]] links const & lnk( node_slot const node ) const noexcept { return links_[ *node ]; }

    node_slot parent( node_slot const node ) const noexcept { return lnk( node ).parent; }
    bool is_black( node_slot const node ) const noexcept { return !is_red( node ); }

    void rotate_left ( node_slot ) noexcept;
    void rotate_right( node_slot ) noexcept;
    void replace_child( node_slot parent, node_slot old_child, node_slot new_child ) noexcept;

    // returns the black height of the subtree or -1 if it violates an invariant
    int validate_subtree( node_slot node, node_slot expected_parent, size_type & node_count ) const noexcept;

private:
    growable_vector<links, size_type> links_;
    node_slot                         root_;
    node_slot                         free_list_; // chained through links::parent
    size_type                         size_{ 0 };
}; // class rb_tree_base


////////////////////////////////////////////////////////////////////////////////
// \class rb_map
////////////////////////////////////////////////////////////////////////////////

template <typename Key, typename T, typename Compare = std::less<Key>>
class [[ nodiscard ]] rb_map
    :
    public  rb_tree_base,
    private Komparator<Compare>
{
private:
    using base = rb_tree_base;
    using komparator = Komparator<Compare>;

    template <bool is_const>
    class basic_iterator;

public:
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<Key const, T>;
    using key_compare     = Compare;
    using       reference = value_type       &;
    using const_reference = value_type const &;
    using size_type       = base::size_type;
    using difference_type = std::ptrdiff_t;

    using       iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true >;

    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

public:
    rb_map() noexcept( std::is_nothrow_default_constructible_v<Compare> ) = default;
    explicit rb_map( Compare const & comp ) : komparator{ comp } {}
    rb_map( std::initializer_list<value_type> const values, Compare const & comp = {} )
        : komparator{ comp }
    {
        reserve( static_cast<size_type>( values.size() ) );
        for ( auto const & value : values )
            insert( value );
    }

    rb_map( rb_map const & ) = default;
    rb_map( rb_map && ) noexcept = default;
    rb_map & operator=( rb_map const & ) = default;
    rb_map & operator=( rb_map && ) noexcept = default;

    [[ nodiscard ]] key_compare const & key_comp() const noexcept { return komparator::comp(); }

    //////////////////////////////////////////////
    //                iterators
    //////////////////////////////////////////////

    [[ nodiscard ]]       iterator  begin()       noexcept { return { this, first() }; }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return { this, first() }; }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]]       iterator  end  ()       noexcept { return { this, node_slot::null }; }
    [[ nodiscard ]] const_iterator  end  () const noexcept { return { this, node_slot::null }; }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end(); }

    [[ nodiscard ]]       reverse_iterator rbegin()       noexcept { return       reverse_iterator{ end() }; }
    [[ nodiscard ]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end() }; }
    [[ nodiscard ]]       reverse_iterator rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //////////////////////////////////////////////
    //                modifiers
    //////////////////////////////////////////////

    template <typename ... Args>
    std::pair<iterator, bool> try_emplace( key_type const & key, Args && ... args )
    {
        auto const [existing, parent, as_left]{ find_insert_position( key ) };
        if ( existing )
            return { iterator{ this, existing }, false };
        auto const node{ new_node( std::piecewise_construct, std::forward_as_tuple( key ), std::forward_as_tuple( std::forward<Args>( args )... ) ) };
        insert_and_rebalance( node, parent, as_left );
        return { iterator{ this, node }, true };
    }

    std::pair<iterator, bool> insert( value_type const & value ) { return try_emplace( value.first, value.second ); }
    std::pair<iterator, bool> insert( value_type && value ) { return try_emplace( value.first, std::move( value.second ) ); }

    //! <b>Effects</b>: Maps key to value, replacing the previously mapped
    //!   value if there was one.
    //!
    //! <b>Returns</b>: The replaced value (empty if key was newly inserted).
    template <typename U = mapped_type>
    std::optional<mapped_type> insert_or_assign( key_type const & key, U && value )
    {
        auto const [existing, parent, as_left]{ find_insert_position( key ) };
        if ( existing )
        {
            // value may alias the currently mapped one
            mapped_type incoming( std::forward<U>( value ) );
            return std::exchange( mapped( existing ), std::move( incoming ) );
        }
        auto const node{ new_node( std::piecewise_construct, std::forward_as_tuple( key ), std::forward_as_tuple( std::forward<U>( value ) ) ) };
        insert_and_rebalance( node, parent, as_left );
        return std::nullopt;
    }

    mapped_type & operator[]( key_type const & key ) { return try_emplace( key ).first->second; }

    //! <b>Returns</b>: Whether key was present (and removed).
    bool erase( key_type const & key ) noexcept
    {
        auto const node{ find_node( key ) };
        if ( !node )
            return false;
        erase_node( node );
        return true;
    }

    iterator erase( const_iterator const position ) noexcept
    {
        BOOST_ASSERT( position.map_ == this );
        auto const node{ position.slot_ };
        BOOST_ASSERT( node );
        auto const successor{ next( node ) };
        erase_node( node );
        return { this, successor };
    }

    //! <b>Effects</b>: Removes and returns the smallest/largest entry.
    //!
    //! <b>Throws</b>: empty_structure if the map is empty.
    value_type pop_front() { return extract( checked_end( first(), "kore::coll::rb_map::pop_front" ) ); }
    value_type pop_back () { return extract( checked_end( last (), "kore::coll::rb_map::pop_back"  ) ); }

    void clear() noexcept
    {
        values_.clear();
        clear_links();
    }

    void reserve( size_type const node_count )
    {
        reserve_links( node_count );
        values_.reserve( node_count );
    }

    //////////////////////////////////////////////
    //                  lookup
    //////////////////////////////////////////////

    [[ nodiscard ]]       iterator find( key_type const & key )       noexcept { return { this, find_node( key ) }; }
    [[ nodiscard ]] const_iterator find( key_type const & key ) const noexcept { return { this, find_node( key ) }; }

    [[ nodiscard ]] bool contains( key_type const & key ) const noexcept { return static_cast<bool>( find_node( key ) ); }

    //! <b>Returns</b>: A pointer to the mapped value or nullptr if key is absent.
    [[ nodiscard ]] mapped_type       * get( key_type const & key )       noexcept { auto const node{ find_node( key ) }; return node ? &mapped( node ) : nullptr; }
    [[ nodiscard ]] mapped_type const * get( key_type const & key ) const noexcept { auto const node{ find_node( key ) }; return node ? &mapped( node ) : nullptr; }

    //! <b>Throws</b>: key_not_found if key is absent.
    [[ nodiscard ]] mapped_type & at( key_type const & key )
    {
        auto const node{ find_node( key ) };
        if ( !node ) [[ unlikely ]]
            detail::throw_key_not_found( "kore::coll::rb_map::at" );
        return mapped( node );
    }
    [[ nodiscard ]] mapped_type const & at( key_type const & key ) const
    {
        auto const node{ find_node( key ) };
        if ( !node ) [[ unlikely ]]
            detail::throw_key_not_found( "kore::coll::rb_map::at" );
        return mapped( node );
    }

    //! <b>Throws</b>: empty_structure if the map is empty.
    [[ nodiscard ]] reference       front()       { return value( checked_end( first(), "kore::coll::rb_map::front" ) ); }
    [[ nodiscard ]] const_reference front() const { return value( checked_end( first(), "kore::coll::rb_map::front" ) ); }
    [[ nodiscard ]] reference       back ()       { return value( checked_end( last (), "kore::coll::rb_map::back"  ) ); }
    [[ nodiscard ]] const_reference back () const { return value( checked_end( last (), "kore::coll::rb_map::back"  ) ); }

    // first entry with key >= k
    [[ nodiscard ]]       iterator lower_bound( key_type const & key )       noexcept { return { this, lower_bound_node( key ) }; }
    [[ nodiscard ]] const_iterator lower_bound( key_type const & key ) const noexcept { return { this, lower_bound_node( key ) }; }
    // first entry with key > k
    [[ nodiscard ]]       iterator upper_bound( key_type const & key )       noexcept { return { this, upper_bound_node( key ) }; }
    [[ nodiscard ]] const_iterator upper_bound( key_type const & key ) const noexcept { return { this, upper_bound_node( key ) }; }

    // greatest entry with key <= k (end() if none)
    [[ nodiscard ]]       iterator floor  ( key_type const & key )       noexcept { return { this, floor_node( key ) }; }
    [[ nodiscard ]] const_iterator floor  ( key_type const & key ) const noexcept { return { this, floor_node( key ) }; }
    // least entry with key >= k (end() if none)
    [[ nodiscard ]]       iterator ceiling( key_type const & key )       noexcept { return lower_bound( key ); }
    [[ nodiscard ]] const_iterator ceiling( key_type const & key ) const noexcept { return lower_bound( key ); }
    // greatest entry with key < k (end() if none)
    [[ nodiscard ]]       iterator lower  ( key_type const & key )       noexcept { return { this, lower_node( key ) }; }
    [[ nodiscard ]] const_iterator lower  ( key_type const & key ) const noexcept { return { this, lower_node( key ) }; }
    // least entry with key > k (end() if none)
    [[ nodiscard ]]       iterator higher ( key_type const & key )       noexcept { return upper_bound( key ); }
    [[ nodiscard ]] const_iterator higher ( key_type const & key ) const noexcept { return upper_bound( key ); }

    // entries in [from, to)
    [[ nodiscard ]] auto range( key_type const & from, key_type const & to )       noexcept { return range_of( *this, from, to ); }
    [[ nodiscard ]] auto range( key_type const & from, key_type const & to ) const noexcept { return range_of( *this, from, to ); }

    // red-black structure + strictly ascending in-order key sequence
    [[ nodiscard ]] bool validate() const noexcept
    {
        if ( !validate_structure() )
            return false;
        node_slot previous{};
        for ( auto node{ first() }; node; node = next( node ) )
        {
            if ( *node >= values_.size() || !values_[ *node ] )
                return false;
            if ( previous && !komparator::le( key( previous ), key( node ) ) )
                return false;
            previous = node;
        }
        return true;
    }

    friend bool operator==( rb_map const & left, rb_map const & right ) noexcept
    {
        return std::equal( left.begin(), left.end(), right.begin(), right.end() );
    }

    // solely a debugging helper (include rb_tree_print.hpp)
    void print() const;

private:
    struct insert_position
    {
        node_slot existing;
        node_slot parent;
        bool      as_left;
    }; // struct insert_position

    [[ gnu::pure ]] key_type    const & key   ( node_slot const node ) const noexcept { return value( node ).first ; }
    [[ gnu::pure ]] mapped_type       & mapped( node_slot const node )       noexcept { return value( node ).second; }
    [[ gnu::pure ]] mapped_type const & mapped( node_slot const node ) const noexcept { return value( node ).second; }
    [[ gnu::pure ]] value_type        & value ( node_slot const node )       noexcept { return *values_[ *node ]; }
    [[ gnu::pure ]] value_type  const & value ( node_slot const node ) const noexcept { return *values_[ *node ]; }

    // empty when from is not ordered before to
    static auto range_of( auto & map, key_type const & from, key_type const & to ) noexcept
    {
        auto const empty{ !map.key_comp()( from, to ) };
        auto const first{ empty ? map.end() : map.lower_bound( from ) };
        auto const last { empty ? map.end() : map.lower_bound( to   ) };
        return std::ranges::subrange{ first, last };
    }

    node_slot checked_end( node_slot const node, char const * const what ) const
    {
        if ( !node ) [[ unlikely ]]
            detail::throw_empty_structure( what );
        return node;
    }

    insert_position find_insert_position( key_type const & search_key ) const noexcept
    {
        insert_position position{ {}, {}, true };
        for ( auto node{ root() }; node; )
        {
            position.parent = node;
            if ( komparator::le( search_key, key( node ) ) )
            {
                position.as_left = true;
                node = left( node );
            }
            else
            if ( komparator::le( key( node ), search_key ) )
            {
                position.as_left = false;
                node = right( node );
            }
            else
            {
                position.existing = node;
                break;
            }
        }
        return position;
    }

    [[ gnu::pure ]] node_slot find_node( key_type const & search_key ) const noexcept
    {
        for ( auto node{ root() }; node; )
        {
            if      ( komparator::le( search_key, key( node ) ) ) node = left ( node );
            else if ( komparator::le( key( node ), search_key ) ) node = right( node );
            else return node;
        }
        return {};
    }

    [[ gnu::pure ]] node_slot lower_bound_node( key_type const & search_key ) const noexcept
    {
        node_slot result{};
        for ( auto node{ root() }; node; )
        {
            if ( komparator::le( key( node ), search_key ) ) { node = right( node ); }
            else                                             { result = node; node = left( node ); }
        }
        return result;
    }

    [[ gnu::pure ]] node_slot upper_bound_node( key_type const & search_key ) const noexcept
    {
        node_slot result{};
        for ( auto node{ root() }; node; )
        {
            if ( komparator::le( search_key, key( node ) ) ) { result = node; node = left( node ); }
            else                                             { node = right( node ); }
        }
        return result;
    }

    [[ gnu::pure ]] node_slot floor_node( key_type const & search_key ) const noexcept
    {
        node_slot result{};
        for ( auto node{ root() }; node; )
        {
            if ( komparator::le( search_key, key( node ) ) ) { node = left( node ); }
            else                                             { result = node; node = right( node ); }
        }
        return result;
    }

    [[ gnu::pure ]] node_slot lower_node( key_type const & search_key ) const noexcept
    {
        node_slot result{};
        for ( auto node{ root() }; node; )
        {
            if ( komparator::le( key( node ), search_key ) ) { result = node; node = right( node ); }
            else                                             { node = left( node ); }
        }
        return result;
    }

    template <typename ... Args>
    node_slot new_node( Args && ... args )
    {
        auto const node{ allocate_links() };
        try
        {
            if ( *node == values_.size() )
                values_.emplace_back( std::in_place, std::forward<Args>( args )... );
            else
                values_[ *node ].emplace( std::forward<Args>( args )... );
        }
        catch(...)
        {
            free_links( node );
            throw;
        }
        return node;
    }

    void erase_node( node_slot const node ) noexcept
    {
        erase_and_rebalance( node );
        values_[ *node ].reset();
        free_links( node );
    }

    value_type extract( node_slot const node )
    {
        value_type extracted{ std::move( value( node ) ) };
        erase_node( node );
        return extracted;
    }

private:
    growable_vector<std::optional<value_type>, size_type> values_;
}; // class rb_map


template <typename Key, typename T, typename Compare>
template <bool is_const>
class rb_map<Key, T, Compare>::basic_iterator
    :
    public boost::stl_interfaces::iterator_interface
    <
        basic_iterator<is_const>,
        std::bidirectional_iterator_tag,
        value_type,
        std::conditional_t<is_const, value_type const &, value_type &>,
        std::conditional_t<is_const, value_type const *, value_type *>
    >
{
private:
    using map_t     = std::conditional_t<is_const, rb_map const, rb_map>;
    using base_type = boost::stl_interfaces::iterator_interface
    <
        basic_iterator<is_const>,
        std::bidirectional_iterator_tag,
        value_type,
        std::conditional_t<is_const, value_type const &, value_type &>,
        std::conditional_t<is_const, value_type const *, value_type *>
    >;

public:
    constexpr basic_iterator() noexcept = default;
    template <bool other_const> requires( is_const && !other_const )
    constexpr basic_iterator( basic_iterator<other_const> const & other ) noexcept
        : map_{ other.map_ }, slot_{ other.slot_ } {}

    typename base_type::reference operator*() const noexcept { return map_->value( slot_ ); }

    basic_iterator & operator++() noexcept { slot_ = map_->next( slot_ ); return *this; }
    // decrementing end() lands on the last entry
    basic_iterator & operator--() noexcept { slot_ = map_->prev( slot_ ); return *this; }
    using base_type::operator++;
    using base_type::operator--;

    friend bool operator==( basic_iterator const & left, basic_iterator const & right ) noexcept
    {
        return left.slot_ == right.slot_;
    }

private: friend class rb_map; friend class basic_iterator<!is_const>;
    constexpr basic_iterator( map_t * const map, node_slot const slot ) noexcept : map_{ map }, slot_{ slot } {}

    map_t *   map_{ nullptr };
    node_slot slot_;
}; // class rb_map::basic_iterator

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
