#include <kore/coll/containers/set_adapter.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <random>
#include <set>
#include <string>
#include <tuple>
#include <vector>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

namespace
{
    template <typename Set>
    std::vector<typename Set::key_type> keys_of( Set const & set ) { return std::vector<typename Set::key_type>( set.begin(), set.end() ); }
} // anonymous namespace

TEST( hash_set, membership )
{
    hash_set<std::string> set{ "x", "y" };
    EXPECT_EQ   ( set.size(), 2 );
    EXPECT_TRUE ( set.insert( "z" ) );
    EXPECT_FALSE( set.insert( "x" ) );
    EXPECT_TRUE ( set.contains( "y" ) );
    EXPECT_TRUE ( set.erase( "y" ) );
    EXPECT_FALSE( set.erase( "y" ) );
    EXPECT_FALSE( set.contains( "y" ) );
    EXPECT_EQ   ( set.find( "y" ), set.end() );

    auto keys{ keys_of( set ) };
    std::ranges::sort( keys );
    EXPECT_EQ( keys, ( std::vector<std::string>{ "x", "z" } ) );
    EXPECT_TRUE( set.validate() );

    set.clear();
    EXPECT_TRUE( set.empty() );
}

TEST( hash_set, equality_and_options )
{
    hash_set<int> a( std::in_place, hash_map_options{ .initial_capacity = 128 } );
    EXPECT_EQ( a.underlying().bucket_count(), 128 );
    for ( int i{ 0 }; i < 10; ++i )
        a.insert( i );

    hash_set<int> b;
    for ( int i{ 9 }; i >= 0; --i )
        b.insert( i );
    EXPECT_EQ( a, b );
    b.erase( 0 );
    EXPECT_NE( a, b );
}

TEST( linked_hash_set, insertion_order )
{
    linked_hash_set<int> set{ 5, 1, 4, 2 };
    set.insert( 1 ); // already present: keeps its position
    set.erase ( 4 );
    set.insert( 3 );
    EXPECT_EQ( keys_of( set ), ( std::vector<int>{ 5, 1, 2, 3 } ) );
    EXPECT_TRUE( set.validate() );
}

TEST( ordered_set, ordered_queries )
{
    ordered_set<int> const set{ 40, 10, 30, 20 };
    EXPECT_EQ( keys_of( set ), ( std::vector<int>{ 10, 20, 30, 40 } ) );
    EXPECT_EQ( set.front(), 10 );
    EXPECT_EQ( set.back (), 40 );
    EXPECT_EQ( *set.floor  ( 25 ), 20 );
    EXPECT_EQ( *set.ceiling( 25 ), 30 );
    EXPECT_EQ(  set.floor  (  5 ), set.end() );
    EXPECT_EQ(  set.ceiling( 45 ), set.end() );
    EXPECT_EQ( *std::prev( set.end() ), 40 );
    EXPECT_TRUE( set.validate() );
}

TEST( ordered_set, empty_structure_errors )
{
    ordered_set<std::string, std::greater<std::string>> set;
    EXPECT_THROW( std::ignore = set.front(), empty_structure );
    EXPECT_THROW( std::ignore = set.back (), empty_structure );
    set.insert( "a" );
    set.insert( "b" );
    EXPECT_EQ( set.front(), "b" );
}

TEST( ordered_set, randomized_against_std_set )
{
    auto const seed{ std::random_device{}() };
    SCOPED_TRACE( "seed " + std::to_string( seed ) );
    std::mt19937 rng{ seed };

    ordered_set<unsigned> set;
    std::set   <unsigned> reference;
    for ( int step{ 0 }; step < 10000; ++step )
    {
        auto const key{ static_cast<unsigned>( rng() % 1000 ) };
        if ( rng() % 3 )
            EXPECT_EQ( set.insert( key ), reference.insert( key ).second );
        else
            EXPECT_EQ( set.erase( key ), reference.erase( key ) == 1 );
    }
    ASSERT_EQ( set.size(), reference.size() );
    EXPECT_TRUE( set.validate() );
    EXPECT_TRUE( std::ranges::equal( set, reference ) );
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
