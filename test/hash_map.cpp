#include <kore/coll/containers/hash_map.hpp>
#include <kore/coll/containers/hash_map_print.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <random>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

namespace
{
    // every key collides
    struct constant_hash
    {
        std::size_t operator()( std::string const & ) const noexcept { return 42; }
    };

    struct identity_hash
    {
        std::size_t operator()( std::size_t const key ) const noexcept { return key; }
    };

    std::string letter( int const index ) { return std::string( 1, static_cast<char>( 'a' + index ) ); }
} // anonymous namespace

TEST( hash_map, insertion_and_lookup )
{
    hash_map<std::string, int> map;
    EXPECT_TRUE( map.empty() );
    EXPECT_TRUE( map.validate() );
    EXPECT_EQ  ( map.bucket_count(), 16 );

    EXPECT_EQ( map.put( "one", 1 ), std::nullopt );
    EXPECT_EQ( map.put( "two", 2 ), std::nullopt );
    EXPECT_EQ( map.put( "one", 10 ), 1 );
    EXPECT_TRUE ( map.try_emplace( "three", 3 ).second );
    EXPECT_FALSE( map.insert( { "three", 30 } ).second );
    map[ "four" ] = 4;

    EXPECT_EQ   ( map.size(), 4 );
    EXPECT_EQ   ( map.at( "one" ), 10 );
    EXPECT_EQ   ( map.at( "three" ), 3 );
    EXPECT_TRUE ( map.contains( "four" ) );
    EXPECT_FALSE( map.contains( "five" ) );
    EXPECT_EQ   ( map.get( "five" ), nullptr );
    EXPECT_EQ   ( map.find( "five" ), map.end() );
    EXPECT_THROW( std::ignore = map.at( "five" ), key_not_found );
    EXPECT_TRUE ( map.validate() );
}

TEST( hash_map, absent_versus_empty_value )
{
    hash_map<int, std::string> map;
    map.put( 1, "" );
    ASSERT_NE( map.get( 1 ), nullptr );
    EXPECT_TRUE( map.get( 1 )->empty() );
    EXPECT_EQ( map.get( 2 ), nullptr );
}

TEST( hash_map, escalation_of_a_colliding_bucket )
{
    hash_map<std::string, int, constant_hash> map( hash_map_options{ .initial_capacity = 64 } );
    auto const bucket{ map.bucket_index( "a" ) };

    for ( int i{ 0 }; i < 8; ++i )
        map.put( letter( i ), i );
    EXPECT_EQ( map.bucket_kind( bucket ), bucket_representation::chained );
    EXPECT_EQ( map.bucket_size( bucket ), 8 );
    EXPECT_TRUE( map.validate() );

    map.put( letter( 8 ), 8 );
    EXPECT_EQ( map.bucket_kind( bucket ), bucket_representation::escalated );
    EXPECT_EQ( map.bucket_size( bucket ), 9 );
    EXPECT_TRUE( map.validate() );

    for ( int i{ 9 }; i < 26; ++i )
        map.put( letter( i ), i );
    EXPECT_EQ( map.size(), 26 );
    EXPECT_EQ( map.bucket_count(), 64 );
    EXPECT_EQ( map.bucket_kind( bucket ), bucket_representation::escalated );
    for ( int i{ 0 }; i < 26; ++i )
        EXPECT_EQ( map.at( letter( i ) ), i );
    EXPECT_TRUE( map.validate() );

    // removals never revert an escalated bucket
    for ( int i{ 0 }; i < 24; ++i )
        EXPECT_TRUE( map.erase( letter( i ) ) );
    EXPECT_EQ( map.bucket_kind( bucket ), bucket_representation::escalated );
    EXPECT_EQ( map.at( "z" ), 25 );
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, small_table_resizes_instead_of_escalating )
{
    hash_map<std::string, int, constant_hash> map( hash_map_options{ .initial_capacity = 16 } );
    for ( int i{ 0 }; i < 9; ++i )
        map.put( letter( i ), i );
    EXPECT_EQ( map.bucket_count(), 32 );
    EXPECT_EQ( map.bucket_kind( map.bucket_index( "a" ) ), bucket_representation::chained );
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, resize_split_reverts_small_trees_to_chains )
{
    // keys hash to themselves: 5 + 128 n stays in bucket 5 of a 128 bucket
    // table, 69 + 128 n moves to bucket 69
    hash_map<std::size_t, std::size_t, identity_hash> map( hash_map_options{ .initial_capacity = 64 } );
    for ( std::size_t n{ 0 }; n < 5; ++n )
        map.put( 5 + 128 * n, n );
    for ( std::size_t n{ 0 }; n < 4; ++n )
        map.put( 69 + 128 * n, n );
    ASSERT_EQ( map.bucket_count(), 64 );
    EXPECT_EQ( map.bucket_kind( 5 ), bucket_representation::escalated );
    EXPECT_EQ( map.bucket_size( 5 ), 9 );

    // fill other buckets (none congruent to 5 modulo 64) until the table doubles
    for ( std::size_t key{ 1000 }; map.bucket_count() == 64; ++key )
    {
        if ( key % 64 != 5 )
            map.put( key, key );
    }
    ASSERT_EQ( map.bucket_count(), 128 );
    EXPECT_EQ( map.bucket_kind( 5  ), bucket_representation::chained );
    EXPECT_EQ( map.bucket_size( 5  ), 5 );
    EXPECT_EQ( map.bucket_kind( 69 ), bucket_representation::chained );
    EXPECT_EQ( map.bucket_size( 69 ), 4 );
    for ( std::size_t n{ 0 }; n < 5; ++n )
        EXPECT_EQ( map.at( 5 + 128 * n ), n );
    for ( std::size_t n{ 0 }; n < 4; ++n )
        EXPECT_EQ( map.at( 69 + 128 * n ), n );
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, put_own_value )
{
    std::string const long_value( 40, 'x' );
    hash_map<int, std::string> map;
    map.put( 1, long_value );
    map.put( 2, "y" );
    EXPECT_EQ( map.put( 1, *map.get( 1 ) ), long_value );
    EXPECT_EQ( map.at( 1 ), long_value );
    EXPECT_EQ( map.put( 2, map.at( 1 ) ), "y" );
    EXPECT_EQ( map.at( 2 ), long_value );
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, iterator_copies_and_conversions )
{
    hash_map<int, int> map;
    auto const [inserted, is_new]{ map.try_emplace( 1, 2 ) };
    EXPECT_TRUE( is_new );
    auto copy{ inserted };
    copy->second = 3;
    hash_map<int, int>::const_iterator const as_const{ copy };
    EXPECT_EQ( as_const, map.find( 1 ) );
    EXPECT_EQ( as_const->second, 3 );
}

TEST( hash_map, resize_preserves_entries )
{
    hash_map<int, int> map( hash_map_options{ .initial_capacity = 4, .load_factor = 0.5f } );
    for ( int i{ 0 }; i < 1000; ++i )
        map.put( i, -i );
    EXPECT_EQ( map.size(), 1000 );
    EXPECT_LE( map.load_factor(), 0.5f );
    for ( int i{ 0 }; i < 1000; ++i )
    {
        ASSERT_TRUE( map.contains( i ) );
        EXPECT_EQ( map.at( i ), -i );
        EXPECT_LT( map.bucket_index( i ), map.bucket_count() );
    }
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, reserve_and_rehash )
{
    hash_map<int, int> map;
    map.reserve( 100 );
    EXPECT_GE( map.bucket_count() * 0.75f, 100 );
    auto const buckets{ map.bucket_count() };
    for ( int i{ 0 }; i < 100; ++i )
        map.put( i, i );
    EXPECT_EQ( map.bucket_count(), buckets );

    map.rehash( 1000 );
    EXPECT_EQ( map.bucket_count(), 1024 );
    map.rehash( 8 ); // never shrinks
    EXPECT_EQ( map.bucket_count(), 1024 );
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, invalid_configuration )
{
    using map_t = hash_map<int, int>;
    EXPECT_THROW( std::ignore = map_t( hash_map_options{ .load_factor = 0.0f } ), invalid_configuration );
    EXPECT_THROW( std::ignore = map_t( hash_map_options{ .load_factor = 1.5f } ), invalid_configuration );
    EXPECT_THROW( std::ignore = map_t( hash_map_options{ .load_factor = std::numeric_limits<float>::quiet_NaN() } ), invalid_configuration );
    EXPECT_THROW( std::ignore = map_t( hash_map_options{ .treeify_threshold = 4, .untreeify_threshold = 4 } ), invalid_configuration );
    EXPECT_THROW( std::ignore = map_t( hash_map_options{ .initial_capacity = std::numeric_limits<std::size_t>::max() } ), std::invalid_argument );

    map_t const rounded( hash_map_options{ .initial_capacity = 17 } );
    EXPECT_EQ( rounded.bucket_count(), 32 );
    EXPECT_EQ( rounded.options().initial_capacity, 32 );
}

TEST( hash_map, erase_and_clear )
{
    hash_map<int, std::string> map{ { 1, "a" }, { 2, "b" }, { 3, "c" } };
    EXPECT_TRUE ( map.erase( 2 ) );
    EXPECT_FALSE( map.erase( 2 ) );
    EXPECT_EQ   ( map.size(), 2 );

    for ( auto it{ map.begin() }; it != map.end(); )
        it = map.erase( it );
    EXPECT_TRUE( map.empty() );
    EXPECT_TRUE( map.validate() );

    map.put( 5, "e" );
    auto const buckets{ map.bucket_count() };
    map.clear();
    EXPECT_TRUE( map.empty() );
    EXPECT_EQ  ( map.bucket_count(), buckets );
    EXPECT_EQ  ( map.bucket_size( map.bucket_index( 5 ) ), 0 );
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, bucket_introspection_bounds )
{
    hash_map<int, int> const map;
    EXPECT_EQ   ( map.bucket_kind( 0 ), bucket_representation::empty );
    EXPECT_THROW( std::ignore = map.bucket_kind( map.bucket_count() ), index_out_of_range );
    EXPECT_THROW( std::ignore = map.bucket_size( map.bucket_count() ), index_out_of_range );
}

TEST( hash_map, equality_ignores_order )
{
    hash_map<int, int> a{ { 1, 1 }, { 2, 2 }, { 3, 3 } };
    hash_map<int, int> b{ { 3, 3 }, { 1, 1 }, { 2, 2 } };
    EXPECT_EQ( a, b );
    b.put( 3, 4 );
    EXPECT_NE( a, b );

    auto moved{ std::move( a ) };
    EXPECT_EQ( moved.size(), 3 );
    EXPECT_TRUE( a.empty() );
    EXPECT_TRUE( a.validate() );
}

TEST( hash_map, print )
{
    hash_map<std::string, int, constant_hash> map( hash_map_options{ .initial_capacity = 64 } );
    for ( int i{ 0 }; i < 9; ++i )
        map.put( letter( i ), i );
    testing::internal::CaptureStdout();
    map.print();
    auto const output{ testing::internal::GetCapturedStdout() };
    EXPECT_NE( output.find( "tree(9" ), std::string::npos );
    EXPECT_NE( output.find( "1 escalated" ), std::string::npos );
}

TEST( linked_hash_map, insertion_order )
{
    linked_hash_map<std::string, int> map;
    for ( auto const * const key : { "delta", "alpha", "charlie", "bravo" } )
        map.put( key, 0 );
    map.put( "alpha", 1 ); // keeps its position
    map.erase( "charlie" );
    map.put( "echo", 2 );

    std::vector<std::string> keys;
    for ( auto const & [key, value] : map )
        keys.push_back( key );
    EXPECT_EQ( keys, ( std::vector<std::string>{ "delta", "alpha", "bravo", "echo" } ) );
    EXPECT_EQ( map.at( "alpha" ), 1 );
    EXPECT_TRUE( map.validate() );
}

TEST( linked_hash_map, order_survives_resize_and_escalation )
{
    linked_hash_map<std::string, int, constant_hash> map( hash_map_options{ .initial_capacity = 2 } );
    for ( int i{ 0 }; i < 26; ++i )
        map.put( letter( i ), i );
    int expected{ 0 };
    for ( auto const & [key, value] : map )
        EXPECT_EQ( value, expected++ );
    EXPECT_EQ( expected, 26 );
    EXPECT_TRUE( map.validate() );
}

TEST( hash_map, randomized_against_unordered_map )
{
    auto const seed{ std::random_device{}() };
    SCOPED_TRACE( "seed " + std::to_string( seed ) );
    std::mt19937 rng{ seed };

    // a weak hash to force long chains, escalation and splits
    struct weak_hash { std::size_t operator()( int const key ) const noexcept { return static_cast<std::size_t>( key % 97 ) << 6; } };

    hash_map          <int, int, weak_hash> map;
    std::unordered_map<int, int>            reference;
    for ( int step{ 0 }; step < 20000; ++step )
    {
        auto const key  { static_cast<int>( rng() % 5000 ) };
        auto const value{ static_cast<int>( rng() ) };
        if ( rng() % 4 )
        {
            auto const previous{ map.insert_or_assign( key, value ) };
            auto const found   { reference.find( key ) };
            ASSERT_EQ( previous.has_value(), found != reference.end() );
            if ( previous )
                EXPECT_EQ( *previous, found->second );
            reference.insert_or_assign( key, value );
        }
        else
        {
            EXPECT_EQ( map.erase( key ), reference.erase( key ) == 1 );
        }
        ASSERT_EQ( map.size(), reference.size() );
        if ( step % 1000 == 0 )
            ASSERT_TRUE( map.validate() );
    }
    EXPECT_TRUE( map.validate() );
    for ( auto const & [key, value] : reference )
        EXPECT_EQ( map.at( key ), value );
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
