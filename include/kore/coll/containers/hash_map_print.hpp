#pragma once

#include "hash_map.hpp"

#include <cstdio>
#include <iostream>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Hash, typename KeyEqual, bool insertion_ordered>
void basic_hash_map<Key, T, Hash, KeyEqual, insertion_ordered>::print() const
{
    if ( empty() )
    {
        std::puts( "The map is empty." );
        return;
    }

    size_type chained_buckets{ 0 };
    size_type escalated_buckets{ 0 };
    for ( size_type i{ 0 }; i < capacity_; ++i )
    {
        auto const & current{ buckets_[ i ] };
        if ( auto const p_chain{ std::get_if<chain>( &current ) } )
        {
            ++chained_buckets;
            std::cout << '[' << i << "] chain(" << p_chain->length << "):\t";
            for ( auto slot{ p_chain->head }; slot; slot = entries_[ slot ].next )
                std::cout << entries_[ slot ].kv.first << ' ';
            std::cout << '\n';
        }
        else
        if ( auto const p_tree{ std::get_if<tree_bin>( &current ) } )
        {
            ++escalated_buckets;
            std::cout << '[' << i << "] tree(" << p_tree->size() << ", black height " << p_tree->black_height() << "):\t";
            for ( auto const & [bin, slot] : *p_tree )
                std::cout << entries_[ slot ].kv.first << ' ';
            std::cout << '\n';
        }
    }
    std::cout
        << size() << " entries in " << capacity_ << " buckets ("
        << chained_buckets << " chained, " << escalated_buckets << " escalated), load factor "
        << load_factor() << std::endl;
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
