#pragma once

#include "rb_tree.hpp"

#include <cstdint>
#include <cstdio>
#include <iostream>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Compare>
void rb_map<Key, T, Compare>::print() const
{
    if ( empty() )
    {
        std::puts( "The tree is empty." );
        return;
    }

    // BFS, one level of the tree at a time.
    growable_vector<node_slot, size_type> level_nodes{ root() };
    growable_vector<node_slot, size_type> next_level;
    for ( std::uint16_t level{ 0 }; !level_nodes.empty(); ++level )
    {
        std::cout << "Level " << level << ":\t";
        size_type red_count{ 0 };
        for ( auto const node : level_nodes )
        {
            std::cout << key( node ) << ( is_red( node ) ? "(R) " : "(B) " );
            red_count += is_red( node );
            if ( left ( node ) ) next_level.push_back( left ( node ) );
            if ( right( node ) ) next_level.push_back( right( node ) );
        }
        std::cout << " [" << level_nodes.size() << " nodes, " << red_count << " red]\n";
        level_nodes = std::move( next_level );
        next_level.clear();
    }
    std::cout << "size " << size() << ", black height " << black_height() << std::endl;
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
