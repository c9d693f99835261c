#include <kore/coll/containers/bit_map.hpp>
#include <kore/coll/containers/bit_set.hpp>

#include <gtest/gtest.h>

#include <cstdint>
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
    enum class colour : std::uint8_t { red, orange, yellow, green, blue, indigo, violet };
    auto constexpr colour_count{ 7U };

    template <typename E>
    std::vector<E> members( bit_set<E> const & set ) { return std::vector<E>( set.begin(), set.end() ); }
} // anonymous namespace

TEST( bit_set, membership )
{
    bit_set<colour> set( colour_count );
    EXPECT_TRUE ( set.empty() );
    EXPECT_EQ   ( set.universe_size(), colour_count );

    EXPECT_TRUE ( set.insert( colour::green ) );
    EXPECT_FALSE( set.insert( colour::green ) );
    EXPECT_TRUE ( set.insert( colour::red   ) );
    EXPECT_EQ   ( set.size(), 2 );
    EXPECT_TRUE ( set.contains( colour::green ) );
    EXPECT_FALSE( set.contains( colour::blue  ) );

    EXPECT_TRUE ( set.erase( colour::green ) );
    EXPECT_FALSE( set.erase( colour::green ) );
    EXPECT_EQ   ( members( set ), ( std::vector{ colour::red } ) );
}

TEST( bit_set, outside_the_universe )
{
    bit_set<std::uint32_t> set( 10 );
    EXPECT_FALSE( set.contains( 10 ) );
    EXPECT_THROW( set.insert( 10 ), index_out_of_range );
    EXPECT_THROW( set.erase ( 99 ), index_out_of_range );
    EXPECT_TRUE ( set.empty() );
}

TEST( bit_set, ordinal_order_iteration_across_words )
{
    bit_set<std::uint32_t> set( 200, { 199, 0, 64, 63, 128, 5 } );
    EXPECT_EQ( members( set ), ( std::vector<std::uint32_t>{ 0, 5, 63, 64, 128, 199 } ) );
    EXPECT_EQ( set.size(), 6 );
}

TEST( bit_set, complement_and_fill )
{
    bit_set<colour> set( colour_count, { colour::red, colour::blue } );
    set.complement();
    EXPECT_EQ( set.size(), colour_count - 2 );
    EXPECT_FALSE( set.contains( colour::red ) );
    EXPECT_TRUE ( set.contains( colour::violet ) );

    set.fill();
    EXPECT_EQ( set.size(), colour_count );
    set.complement();
    EXPECT_TRUE( set.empty() );

    set.fill();
    set.clear();
    EXPECT_TRUE( set.empty() );
}

TEST( bit_set, set_algebra )
{
    bit_set<colour> const warm( colour_count, { colour::red, colour::orange, colour::yellow } );
    bit_set<colour> const rgb ( colour_count, { colour::red, colour::green, colour::blue } );

    EXPECT_EQ( members( warm | rgb ), ( std::vector{ colour::red, colour::orange, colour::yellow, colour::green, colour::blue } ) );
    EXPECT_EQ( members( warm & rgb ), ( std::vector{ colour::red } ) );
    EXPECT_EQ( members( warm - rgb ), ( std::vector{ colour::orange, colour::yellow } ) );
    EXPECT_EQ( unite( warm, rgb ), warm | rgb );

    auto in_place{ warm };
    in_place -= rgb;
    in_place |= bit_set<colour>( colour_count, { colour::violet } );
    EXPECT_EQ( members( in_place ), ( std::vector{ colour::orange, colour::yellow, colour::violet } ) );

    EXPECT_TRUE ( ( warm & rgb ).is_subset_of( warm ) );
    EXPECT_FALSE( warm.is_subset_of( rgb ) );
}

TEST( bit_set, domain_mismatch )
{
    bit_set<std::uint32_t> small( 10 );
    bit_set<std::uint32_t> large( 100 );
    EXPECT_THROW( small |= large                     , domain_mismatch );
    EXPECT_THROW( std::ignore = intersect( small, large ), domain_mismatch );
    EXPECT_THROW( std::ignore = small.is_subset_of( large ), std::invalid_argument );
    EXPECT_NE( small, large );
}

TEST( bit_set, randomized_against_std_set )
{
    auto const seed{ std::random_device{}() };
    SCOPED_TRACE( "seed " + std::to_string( seed ) );
    std::mt19937 rng{ seed };

    auto constexpr universe{ 300U };
    bit_set<std::uint32_t>  set( universe );
    std::set<std::uint32_t> reference;
    for ( int step{ 0 }; step < 5000; ++step )
    {
        auto const element{ static_cast<std::uint32_t>( rng() % universe ) };
        if ( rng() % 2 )
            EXPECT_EQ( set.insert( element ), reference.insert( element ).second );
        else
            EXPECT_EQ( set.erase( element ), reference.erase( element ) == 1 );
        ASSERT_EQ( set.size(), reference.size() );
    }
    EXPECT_EQ( members( set ), ( std::vector<std::uint32_t>{ reference.begin(), reference.end() } ) );
}

TEST( bit_map, keyed_by_enum )
{
    bit_map<colour, std::string> map( colour_count );
    EXPECT_TRUE( map.empty() );

    EXPECT_EQ( map.insert_or_assign( colour::blue, "sky" ), std::nullopt );
    EXPECT_EQ( map.insert_or_assign( colour::red , "rose" ), std::nullopt );
    EXPECT_EQ( map.insert_or_assign( colour::blue, "sea" ), "sky" );
    EXPECT_EQ( map.size(), 2 );

    ASSERT_NE( map.get( colour::blue ), nullptr );
    EXPECT_EQ( *map.get( colour::blue ), "sea" );
    EXPECT_EQ( map.get( colour::green ), nullptr );
    EXPECT_EQ( map.at( colour::red ), "rose" );
    EXPECT_THROW( std::ignore = map.at( colour::green ), key_not_found );
    EXPECT_EQ( map.keys(), bit_set<colour>( colour_count, { colour::red, colour::blue } ) );

    std::vector<std::string> values;
    for ( auto const [key, value] : map )
        values.push_back( value );
    EXPECT_EQ( values, ( std::vector<std::string>{ "rose", "sea" } ) );

    for ( auto [key, value] : map )
        value += "!";
    EXPECT_EQ( map.at( colour::red ), "rose!" );

    EXPECT_TRUE ( map.erase( colour::red ) );
    EXPECT_FALSE( map.erase( colour::red ) );
    EXPECT_FALSE( map.contains( colour::red ) );

    map.clear();
    EXPECT_TRUE( map.empty() );
    EXPECT_EQ  ( map.get( colour::blue ), nullptr );
}

TEST( bit_map, assign_from_own_value )
{
    std::string const long_value( 40, 'x' );
    bit_map<colour, std::string> map( colour_count );
    map.insert_or_assign( colour::red, long_value );
    EXPECT_EQ( map.insert_or_assign( colour::red, map.at( colour::red ) ), long_value );
    EXPECT_EQ( map.at( colour::red ), long_value );
    EXPECT_EQ( map.insert_or_assign( colour::blue, map.at( colour::red ) ), std::nullopt );
    EXPECT_EQ( map.at( colour::blue ), long_value );

    auto const first{ map.begin() };
    auto copy{ first };
    bit_map<colour, std::string>::const_iterator const as_const{ copy };
    EXPECT_EQ( as_const, first );
    EXPECT_EQ( ( *as_const ).first, colour::red );
}

TEST( bit_map, outside_the_universe )
{
    bit_map<std::uint32_t, int> map( 4 );
    EXPECT_EQ   ( map.get( 4 ), nullptr );
    EXPECT_THROW( map.insert_or_assign( 4, 1 ), index_out_of_range );
    EXPECT_THROW( map.erase( 4 )              , index_out_of_range );
    EXPECT_TRUE ( map.empty() );
}

TEST( bit_map, equality )
{
    bit_map<std::uint32_t, int> a( 8 );
    bit_map<std::uint32_t, int> b( 8 );
    a.insert_or_assign( 3, 30 );
    b.insert_or_assign( 3, 30 );
    EXPECT_EQ( a, b );
    b.insert_or_assign( 3, 31 );
    EXPECT_NE( a, b );
}

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------
