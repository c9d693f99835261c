#include <kore/coll/containers/linked_list.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <iterator>
#include <random>
#include <string>
#include <tuple>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

TEST( linked_list, deque_operations )
{
    linked_list<int> list;
    EXPECT_TRUE( list.empty() );
    EXPECT_TRUE( list.validate() );

    list.push_back ( 2 );
    list.push_front( 1 );
    list.push_back ( 3 );
    EXPECT_EQ( list, ( linked_list<int>{ 1, 2, 3 } ) );
    EXPECT_EQ( list.front(), 1 );
    EXPECT_EQ( list.back (), 3 );
    EXPECT_TRUE( list.validate() );

    EXPECT_EQ( list.pop_front(), 1 );
    EXPECT_EQ( list.pop_back (), 3 );
    EXPECT_EQ( list.pop_back (), 2 );
    EXPECT_TRUE( list.empty() );
    EXPECT_TRUE( list.validate() );
}

TEST( linked_list, empty_structure_errors )
{
    linked_list<std::string> list;
    EXPECT_THROW( std::ignore = list.front(), empty_structure );
    EXPECT_THROW( std::ignore = list.back (), empty_structure );
    EXPECT_THROW( list.pop_front()          , empty_structure );
    EXPECT_THROW( list.pop_back ()          , empty_structure );
    EXPECT_THROW( list.pop_back ()          , std::out_of_range );
    EXPECT_TRUE ( list.validate() );
}

TEST( linked_list, indexed_operations )
{
    linked_list<std::string> list{ "a", "c", "e" };
    list.insert_at( 1, "b" );
    list.insert_at( 3, "d" );
    list.insert_at( 5, "f" ); // append
    list.insert_at( 0, "_" );
    EXPECT_EQ( list, ( linked_list<std::string>{ "_", "a", "b", "c", "d", "e", "f" } ) );

    for ( std::uint32_t i{ 0 }; i < list.size(); ++i )
        EXPECT_EQ( list.at( i ), std::string( 1, "_abcdef"[ i ] ) );

    EXPECT_EQ( list.remove_at( 0 ), "_" );
    EXPECT_EQ( list.remove_at( 5 ), "f" );
    EXPECT_EQ( list.remove_at( 2 ), "c" );
    EXPECT_EQ( list, ( linked_list<std::string>{ "a", "b", "d", "e" } ) );

    EXPECT_THROW( std::ignore = list.at( 4 ), index_out_of_range );
    EXPECT_THROW( list.insert_at( 5, "x" )  , index_out_of_range );
    EXPECT_THROW( list.remove_at( 4 )       , index_out_of_range );
    EXPECT_EQ   ( list.size(), 4 );
    EXPECT_TRUE ( list.validate() );
}

TEST( linked_list, iteration )
{
    linked_list<int> list{ 1, 2, 3, 4 };
    EXPECT_EQ( *std::prev( list.end() ), 4 );
    int const reversed[]{ 4, 3, 2, 1 };
    EXPECT_TRUE( std::equal( list.rbegin(), list.rend(), std::begin( reversed ), std::end( reversed ) ) );

    auto const pos{ std::next( list.begin(), 2 ) };
    list.insert( pos, 10 );
    EXPECT_EQ( list, ( linked_list<int>{ 1, 2, 10, 3, 4 } ) );

    auto const after{ list.erase( list.begin() ) };
    EXPECT_EQ( *after, 2 );
    EXPECT_EQ( list, ( linked_list<int>{ 2, 10, 3, 4 } ) );
    EXPECT_TRUE( list.validate() );
}

TEST( linked_list, copy_move_and_slot_reuse )
{
    linked_list<int> list{ 1, 2, 3 };
    auto copy{ list };
    EXPECT_EQ( copy, list );

    copy.pop_front();
    copy.push_back( 4 ); // reuses the released slot
    EXPECT_EQ( copy, ( linked_list<int>{ 2, 3, 4 } ) );
    EXPECT_TRUE( copy.validate() );

    auto moved{ std::move( copy ) };
    EXPECT_TRUE( copy.empty() );
    EXPECT_TRUE( copy.validate() );
    EXPECT_EQ( moved.size(), 3 );

    moved.clear();
    EXPECT_TRUE( moved.empty() );
    EXPECT_TRUE( moved.validate() );
}

TEST( linked_list, iterator_copies_and_conversions )
{
    linked_list<int> list{ 1, 2, 3 };
    auto position{ list.begin() };
    auto const copy{ position++ };
    EXPECT_EQ( *copy, 1 );
    EXPECT_EQ( *position, 2 );
    linked_list<int>::const_iterator const as_const{ position };
    EXPECT_EQ( as_const, position );
    EXPECT_EQ( std::next( as_const ), std::prev( list.end() ) );
}

TEST( linked_list, randomized_against_std_deque )
{
    auto const seed{ std::random_device{}() };
    SCOPED_TRACE( "seed " + std::to_string( seed ) );
    std::mt19937 rng{ seed };

    linked_list<int> list;
    std::deque <int> reference;
    for ( int step{ 0 }; step < 4000; ++step )
    {
        auto const value{ static_cast<int>( rng() % 1000 ) };
        switch ( rng() % 6 )
        {
            case 0: list.push_front( value ); reference.push_front( value ); break;
            case 1: list.push_back ( value ); reference.push_back ( value ); break;
            case 2:
            {
                auto const index{ static_cast<std::uint32_t>( rng() % ( reference.size() + 1 ) ) };
                list.insert_at( index, value );
                reference.insert( reference.begin() + index, value );
                break;
            }
            case 3:
                if ( !reference.empty() )
                {
                    auto const index{ static_cast<std::uint32_t>( rng() % reference.size() ) };
                    EXPECT_EQ( list.remove_at( index ), reference[ index ] );
                    reference.erase( reference.begin() + index );
                }
                break;
            case 4:
                if ( !reference.empty() ) { EXPECT_EQ( list.pop_front(), reference.front() ); reference.pop_front(); }
                break;
            case 5:
                if ( !reference.empty() ) { EXPECT_EQ( list.pop_back(), reference.back() ); reference.pop_back(); }
                break;
        }
        ASSERT_EQ( list.size(), reference.size() );
        if ( step % 100 == 0 )
            ASSERT_TRUE( list.validate() );
    }
    EXPECT_TRUE( list.validate() );
    EXPECT_TRUE( std::equal( list.begin(), list.end(), reference.begin(), reference.end() ) );
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
