////////////////////////////////////////////////////////////////////////////////
/// micromap::map iteration and view tests
////////////////////////////////////////////////////////////////////////////////

#include <micromap/map.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <numeric>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace micromap {
//------------------------------------------------------------------------------

TEST( map_iteration, empty )
{
    map<unsigned, unsigned, 4> const m;
    EXPECT_EQ( m.begin(), m.end() );
    EXPECT_TRUE( m.keys  ().empty() );
    EXPECT_TRUE( m.values().empty() );
}

TEST( map_iteration, zero_capacity )
{
    map<int, int, 0> m;
    EXPECT_TRUE( m.empty() );
    EXPECT_TRUE( m.full () );
    EXPECT_EQ  ( m.begin(), m.end() );
    EXPECT_FALSE( m.contains( 1 ) );
    EXPECT_FALSE( m.remove( 1 ).has_value() );
    m.clear();
    EXPECT_EQ( m.size(), 0 );
}

TEST( map_iteration, reproduces_insertion_order )
{
    std::vector<std::pair<int, std::string>> const pairs{
        { 9, "nine" }, { 2, "two" }, { 7, "seven" }, { 4, "four" }
    };
    map<int, std::string, 6> const m( pairs.begin(), pairs.end() );

    std::vector<std::pair<int, std::string>> collected;
    for ( auto const & [key, value] : m )
        collected.emplace_back( key, value );
    EXPECT_EQ( collected, pairs );

    // restartable
    collected.clear();
    for ( auto const & [key, value] : m )
        collected.emplace_back( key, value );
    EXPECT_EQ( collected, pairs );
}

TEST( map_iteration, sum_values )
{
    map<std::string, int, 10> m;
    m.insert( "one", 42 );
    m.insert( "two", 16 );
    int sum{ 0 };
    for ( auto const & [key, value] : m )
        sum += value;
    EXPECT_EQ( sum, 58 );
    EXPECT_EQ( std::accumulate( m.values().begin(), m.values().end(), 0 ), 58 );
}

TEST( map_iteration, skips_removed )
{
    map<std::string, int, 10> m;
    m.insert( "one"  , 1 );
    m.insert( "two"  , 3 );
    m.insert( "three", 5 );
    EXPECT_EQ( std::distance( m.begin(), m.end() ), 3 );
    m.remove( "two" );
    EXPECT_EQ( std::distance( m.begin(), m.end() ), 2 );

    int sum{ 0 };
    for ( auto const & kv : m )
        sum += kv.second;
    EXPECT_EQ( sum, 6 );
    EXPECT_EQ( ( *std::prev( m.end() ) ).second, 5 );
}

TEST( map_iteration, mutate_values )
{
    map<std::string, int, 10> m;
    m.insert( "one"  , 2 );
    m.insert( "two"  , 3 );
    m.insert( "three", 5 );
    for ( auto [key, value] : m ) // proxy reference: value binds to the stored value
        value *= 2;
    EXPECT_EQ( std::accumulate( m.values().begin(), m.values().end(), 0 ), 20 );

    for ( auto & value : m.values() )
        value += 1;
    EXPECT_EQ( m[ "one"   ], 5  );
    EXPECT_EQ( m[ "three" ], 11 );
}

TEST( map_iteration, keys_view )
{
    map<char, int, 5> m{ { 'c', 3 }, { 'a', 1 }, { 'b', 2 } };
    std::string const keys( m.keys().begin(), m.keys().end() );
    EXPECT_EQ( keys, "cab" );
}

TEST( map_iteration, random_access )
{
    map<int, int, 5> m{ { 10, 1 }, { 20, 2 }, { 30, 3 } };
    auto const it{ m.begin() };
    EXPECT_EQ( it[ 2 ].first, 30 );
    EXPECT_EQ( ( it + 1 )->second, 2 );
    EXPECT_EQ( m.end() - m.begin(), 3 );
    EXPECT_LT( m.begin(), m.end() );

    map<int, int, 5>::const_iterator const cit{ it };
    EXPECT_EQ( cit, m.cbegin() );
}

TEST( map_iteration, reverse )
{
    map<int, int, 5> const m{ { 1, 10 }, { 2, 20 }, { 3, 30 } };
    std::vector<int> keys;
    for ( auto it{ m.rbegin() }; it != m.rend(); ++it )
        keys.push_back( ( *it ).first );
    EXPECT_EQ( keys, ( std::vector<int>{ 3, 2, 1 } ) );
}

TEST( map_iteration, standard_algorithms )
{
    map<int, int, 8> m{ { 1, 10 }, { 2, 20 }, { 3, 30 }, { 4, 40 } };
    auto const found{ std::find_if( m.begin(), m.end(), []( auto const & kv ) { return kv.second == 30; } ) };
    ASSERT_NE( found, m.end() );
    EXPECT_EQ( found->first, 3 );
    EXPECT_EQ( std::count_if( m.cbegin(), m.cend(), []( auto const & kv ) { return kv.first % 2 == 0; } ), 2 );
}

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
