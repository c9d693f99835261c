////////////////////////////////////////////////////////////////////////////////
/// Key-only sets on top of the mapping containers (the mapped type is an
/// empty tag).
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

#include <kore/coll/containers/hash_map.hpp>
#include <kore/coll/containers/rb_tree.hpp>

#include <boost/stl_interfaces/iterator_interface.hpp>

#include <concepts>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

struct set_tag
{
    friend constexpr bool operator==( set_tag, set_tag ) noexcept { return true; }
}; // struct set_tag

template <typename Map>
concept ordered_mapping = requires( Map const & map, typename Map::key_type const & key )
{
    map.floor  ( key );
    map.ceiling( key );
    map.front  ();
    map.back   ();
};

template <typename Map>
class [[ nodiscard ]] set_adapter
{
public:
    using map_type        = Map;
    using key_type        = typename Map::key_type;
    using value_type      = key_type;
    using size_type       = typename Map::size_type;
    using const_reference = key_type const &;

    class const_iterator;
    using iterator = const_iterator;

    static_assert( std::is_same_v<typename Map::mapped_type, set_tag> );

public:
    set_adapter() = default;
    set_adapter( std::initializer_list<key_type> const keys )
    {
        for ( auto const & key : keys )
            insert( key );
    }
    // constructs the underlying map from args (e.g. hash_map_options or a comparator)
    template <typename ... Args>
    requires std::constructible_from<Map, Args...>
    explicit set_adapter( std::in_place_t, Args && ... args ) : map_( std::forward<Args>( args )... ) {}

    [[ nodiscard ]] size_type size () const noexcept { return map_.size (); }
    [[ nodiscard ]] bool      empty() const noexcept { return map_.empty(); }

    //! <b>Returns</b>: Whether key was newly added.
    bool insert  ( key_type const & key ) { return map_.try_emplace( key ).second; }
    //! <b>Returns</b>: Whether key was present (and removed).
    bool erase   ( key_type const & key ) { return map_.erase( key ); }
    [[ nodiscard ]]
    bool contains( key_type const & key ) const { return map_.contains( key ); }

    void clear() noexcept { map_.clear(); }

    [[ nodiscard ]] const_iterator begin() const noexcept { return const_iterator{ map_.begin() }; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return const_iterator{ map_.end  () }; }

    [[ nodiscard ]] const_iterator find( key_type const & key ) const { return const_iterator{ map_.find( key ) }; }

    // ordered sets only; end() if there is no such key
    [[ nodiscard ]] const_iterator floor  ( key_type const & key ) const requires ordered_mapping<Map> { return const_iterator{ map_.floor  ( key ) }; }
    [[ nodiscard ]] const_iterator ceiling( key_type const & key ) const requires ordered_mapping<Map> { return const_iterator{ map_.ceiling( key ) }; }

    //! <b>Throws</b>: empty_structure if the set is empty.
    [[ nodiscard ]] const_reference front() const requires ordered_mapping<Map> { return map_.front().first; }
    [[ nodiscard ]] const_reference back () const requires ordered_mapping<Map> { return map_.back ().first; }

    [[ nodiscard ]] bool validate() const { return map_.validate(); }

    // the underlying map (bucket/tree introspection)
    [[ nodiscard ]] map_type const & underlying() const noexcept { return map_; }

    friend bool operator==( set_adapter const & left, set_adapter const & right ) { return left.map_ == right.map_; }

private:
    map_type map_;
}; // class set_adapter


template <typename Map>
class set_adapter<Map>::const_iterator
    :
    public boost::stl_interfaces::iterator_interface
    <
        const_iterator,
        typename std::iterator_traits<typename Map::const_iterator>::iterator_category,
        key_type,
        key_type const &,
        key_type const *
    >
{
private:
    using map_iterator = typename Map::const_iterator;
    using base_type    = boost::stl_interfaces::iterator_interface
    <
        const_iterator,
        typename std::iterator_traits<map_iterator>::iterator_category,
        key_type,
        key_type const &,
        key_type const *
    >;

public:
    constexpr const_iterator() noexcept = default;

    key_type const & operator*() const noexcept { return ( *position_ ).first; }

    const_iterator & operator++() noexcept { ++position_; return *this; }
    using base_type::operator++;

    const_iterator & operator--() noexcept requires std::derived_from<typename std::iterator_traits<map_iterator>::iterator_category, std::bidirectional_iterator_tag> { --position_; return *this; }
    using base_type::operator--;

    friend bool operator==( const_iterator const & left, const_iterator const & right ) noexcept { return left.position_ == right.position_; }

private: friend class set_adapter;
    explicit constexpr const_iterator( map_iterator const position ) noexcept : position_{ position } {}

    map_iterator position_;
}; // class set_adapter::const_iterator


template <typename Key, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using hash_set = set_adapter<hash_map<Key, set_tag, Hash, KeyEqual>>;

// iterates in insertion order
template <typename Key, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
using linked_hash_set = set_adapter<linked_hash_map<Key, set_tag, Hash, KeyEqual>>;

template <typename Key, typename Compare = std::less<Key>>
using ordered_set = set_adapter<rb_map<Key, set_tag, Compare>>;

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
