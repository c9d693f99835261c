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
#include <kore/coll/containers/rb_tree.hpp>

#include <boost/assert.hpp>

#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

rb_tree_base::rb_tree_base( rb_tree_base && other ) noexcept
    :
    links_    { std::move( other.links_ ) },
    root_     { std::exchange( other.root_     , node_slot::null ) },
    free_list_{ std::exchange( other.free_list_, node_slot::null ) },
    size_     { std::exchange( other.size_     , 0               ) }
{}

rb_tree_base & rb_tree_base::operator=( rb_tree_base && other ) noexcept
{
    links_     = std::move( other.links_ );
    root_      = std::exchange( other.root_     , node_slot::null );
    free_list_ = std::exchange( other.free_list_, node_slot::null );
    size_      = std::exchange( other.size_     , 0               );
    return *this;
}

node_slot rb_tree_base::allocate_links()
{
    if ( free_list_ )
    {
        auto const recycled{ free_list_ };
        auto & cached{ lnk( recycled ) };
        free_list_ = cached.parent;
        cached     = {};
        return recycled;
    }
    if ( links_.size() == node_slot::null.index ) [[ unlikely ]]
        detail::throw_bad_alloc();
    links_.emplace_back();
    return { static_cast<node_slot::value_type>( links_.size() - 1 ) };
}

void rb_tree_base::free_links( node_slot const node ) noexcept
{
    auto & freed{ lnk( node ) };
    freed        = {};
    freed.parent = free_list_;
    free_list_   = node;
}

void rb_tree_base::clear_links() noexcept
{
    links_.clear();
    root_      = {};
    free_list_ = {};
    size_      = 0;
}

node_slot rb_tree_base::minimum( node_slot node ) const noexcept
{
    BOOST_ASSERT( node );
    while ( left( node ) )
        node = left( node );
    return node;
}

node_slot rb_tree_base::maximum( node_slot node ) const noexcept
{
    BOOST_ASSERT( node );
    while ( right( node ) )
        node = right( node );
    return node;
}

node_slot rb_tree_base::next( node_slot node ) const noexcept
{
    BOOST_ASSERT( node );
    if ( right( node ) )
        return minimum( right( node ) );
    auto up{ parent( node ) };
    while ( up && ( node == right( up ) ) )
    {
        node = up;
        up   = parent( up );
    }
    return up;
}

node_slot rb_tree_base::prev( node_slot node ) const noexcept
{
    if ( !node )
        return last();
    if ( left( node ) )
        return maximum( left( node ) );
    auto up{ parent( node ) };
    while ( up && ( node == left( up ) ) )
    {
        node = up;
        up   = parent( up );
    }
    return up;
}

void rb_tree_base::replace_child( node_slot const parent, node_slot const old_child, node_slot const new_child ) noexcept
{
    if ( !parent )
        root_ = new_child;
    else
    if ( lnk( parent ).left == old_child )
        lnk( parent ).left = new_child;
    else
    {
        BOOST_ASSERT( lnk( parent ).right == old_child );
        lnk( parent ).right = new_child;
    }
}

// x(a, y(b, c)) => y(x(a, b), c)
void rb_tree_base::rotate_left( node_slot const x ) noexcept
{
    auto const y{ right( x ) };
    BOOST_ASSERT( y );
    auto const b{ left( y ) };
    lnk( x ).right = b;
    if ( b )
        lnk( b ).parent = x;
    auto const x_parent{ parent( x ) };
    lnk( y ).parent = x_parent;
    replace_child( x_parent, x, y );
    lnk( y ).left   = x;
    lnk( x ).parent = y;
}

void rb_tree_base::rotate_right( node_slot const x ) noexcept
{
    auto const y{ left( x ) };
    BOOST_ASSERT( y );
    auto const b{ right( y ) };
    lnk( x ).left = b;
    if ( b )
        lnk( b ).parent = x;
    auto const x_parent{ parent( x ) };
    lnk( y ).parent = x_parent;
    replace_child( x_parent, x, y );
    lnk( y ).right  = x;
    lnk( x ).parent = y;
}

void rb_tree_base::insert_and_rebalance( node_slot x, node_slot const parent, bool const as_left ) noexcept
{
    {
        auto & new_links{ lnk( x ) };
        new_links.parent = parent;
        new_links.left   = {};
        new_links.right  = {};
        new_links.colour = color::red;
    }
    if ( !parent )
    {
        BOOST_ASSERT( !root_ );
        root_ = x;
    }
    else
    if ( as_left )
    {
        BOOST_ASSERT( !left( parent ) );
        lnk( parent ).left = x;
    }
    else
    {
        BOOST_ASSERT( !right( parent ) );
        lnk( parent ).right = x;
    }
    ++size_;

    // a red parent is never the root so the grandparent always exists
    while ( ( x != root_ ) && is_red( this->parent( x ) ) )
    {
        auto const xp { this->parent( x  ) };
        auto const xpp{ this->parent( xp ) };
        if ( xp == left( xpp ) )
        {
            auto const uncle{ right( xpp ) };
            if ( is_red( uncle ) )
            {
                lnk( xp    ).colour = color::black;
                lnk( uncle ).colour = color::black;
                lnk( xpp   ).colour = color::red;
                x = xpp;
            }
            else
            {
                if ( x == right( xp ) ) // triangle -> line
                {
                    x = xp;
                    rotate_left( x );
                }
                auto const line_parent{ this->parent( x ) };
                auto const line_grandparent{ this->parent( line_parent ) };
                lnk( line_parent      ).colour = color::black;
                lnk( line_grandparent ).colour = color::red;
                rotate_right( line_grandparent );
            }
        }
        else
        {
            auto const uncle{ left( xpp ) };
            if ( is_red( uncle ) )
            {
                lnk( xp    ).colour = color::black;
                lnk( uncle ).colour = color::black;
                lnk( xpp   ).colour = color::red;
                x = xpp;
            }
            else
            {
                if ( x == left( xp ) )
                {
                    x = xp;
                    rotate_right( x );
                }
                auto const line_parent{ this->parent( x ) };
                auto const line_grandparent{ this->parent( line_parent ) };
                lnk( line_parent      ).colour = color::black;
                lnk( line_grandparent ).colour = color::red;
                rotate_left( line_grandparent );
            }
        }
    }
    lnk( root_ ).colour = color::black;
}

void rb_tree_base::erase_and_rebalance( node_slot const z ) noexcept
{
    BOOST_ASSERT( size_ );
    node_slot y{ z }; // the node that actually leaves its position
    node_slot x;      // the node that takes y's position (may be null)
    node_slot x_parent;

    if      ( !left ( y ) ) x = right( y );
    else if ( !right( y ) ) x = left ( y );
    else
    {
        // two children: the in-order successor takes z's place
        y = minimum( right( y ) );
        x = right( y );
    }

    if ( y != z )
    {
        auto const z_left{ left( z ) };
        lnk( z_left ).parent = y;
        lnk( y      ).left   = z_left;
        if ( y != right( z ) )
        {
            x_parent = parent( y );
            if ( x )
                lnk( x ).parent = x_parent;
            lnk( x_parent ).left = x; // y is a left child
            auto const z_right{ right( z ) };
            lnk( y       ).right  = z_right;
            lnk( z_right ).parent = y;
        }
        else
        {
            x_parent = y;
        }
        auto const z_parent{ parent( z ) };
        replace_child( z_parent, z, y );
        lnk( y ).parent = z_parent;
        std::swap( lnk( y ).colour, lnk( z ).colour );
        y = z; // y now names the removed node (and its color the removed color)
    }
    else
    {
        x_parent = parent( y );
        if ( x )
            lnk( x ).parent = x_parent;
        replace_child( x_parent, z, x );
    }

    if ( lnk( y ).colour == color::black )
    {
        // x carries an extra black: push it up or absorb it through the
        // sibling (which always exists as the removed black node contributed
        // to the black height of this side)
        while ( ( x != root_ ) && is_black( x ) )
        {
            if ( x == left( x_parent ) )
            {
                auto sibling{ right( x_parent ) };
                if ( is_red( sibling ) )
                {
                    lnk( sibling  ).colour = color::black;
                    lnk( x_parent ).colour = color::red;
                    rotate_left( x_parent );
                    sibling = right( x_parent );
                }
                if ( is_black( left( sibling ) ) && is_black( right( sibling ) ) )
                {
                    lnk( sibling ).colour = color::red;
                    x        = x_parent;
                    x_parent = parent( x_parent );
                }
                else
                {
                    if ( is_black( right( sibling ) ) )
                    {
                        lnk( left( sibling ) ).colour = color::black;
                        lnk( sibling         ).colour = color::red;
                        rotate_right( sibling );
                        sibling = right( x_parent );
                    }
                    lnk( sibling  ).colour = lnk( x_parent ).colour;
                    lnk( x_parent ).colour = color::black;
                    if ( right( sibling ) )
                        lnk( right( sibling ) ).colour = color::black;
                    rotate_left( x_parent );
                    break;
                }
            }
            else
            {
                auto sibling{ left( x_parent ) };
                if ( is_red( sibling ) )
                {
                    lnk( sibling  ).colour = color::black;
                    lnk( x_parent ).colour = color::red;
                    rotate_right( x_parent );
                    sibling = left( x_parent );
                }
                if ( is_black( right( sibling ) ) && is_black( left( sibling ) ) )
                {
                    lnk( sibling ).colour = color::red;
                    x        = x_parent;
                    x_parent = parent( x_parent );
                }
                else
                {
                    if ( is_black( left( sibling ) ) )
                    {
                        lnk( right( sibling ) ).colour = color::black;
                        lnk( sibling          ).colour = color::red;
                        rotate_left( sibling );
                        sibling = left( x_parent );
                    }
                    lnk( sibling  ).colour = lnk( x_parent ).colour;
                    lnk( x_parent ).colour = color::black;
                    if ( left( sibling ) )
                        lnk( left( sibling ) ).colour = color::black;
                    rotate_right( x_parent );
                    break;
                }
            }
        }
        if ( x )
            lnk( x ).colour = color::black;
    }

    auto & removed{ lnk( z ) };
    removed.parent = removed.left = removed.right = {};
    --size_;
}

rb_tree_base::size_type rb_tree_base::black_height() const noexcept
{
    size_type height{ 0 };
    for ( auto node{ root_ }; node; node = left( node ) )
        height += !is_red( node );
    return height;
}

int rb_tree_base::validate_subtree( node_slot const node, node_slot const expected_parent, size_type & node_count ) const noexcept
{
    if ( !node )
        return 0;
    if ( ( *node >= links_.size() ) || ( parent( node ) != expected_parent ) )
        return -1;
    if ( ++node_count > size_ )
        return -1;
    if ( is_red( node ) && ( is_red( left( node ) ) || is_red( right( node ) ) ) )
        return -1;
    auto const left_height { validate_subtree( left ( node ), node, node_count ) };
    auto const right_height{ validate_subtree( right( node ), node, node_count ) };
    if ( ( left_height < 0 ) || ( left_height != right_height ) )
        return -1;
    return left_height + is_black( node );
}

bool rb_tree_base::validate_structure() const noexcept
{
    if ( !root_ )
        return size_ == 0;
    if ( is_red( root_ ) || parent( root_ ) )
        return false;
    size_type node_count{ 0 };
    auto const height{ validate_subtree( root_, node_slot::null, node_count ) };
    return ( height >= 0 ) && ( node_count == size_ ) && ( static_cast<size_type>( height ) == black_height() );
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
