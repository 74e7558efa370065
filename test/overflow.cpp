////////////////////////////////////////////////////////////////////////////////
/// micromap::map capacity overflow and fatal lookup tests
////////////////////////////////////////////////////////////////////////////////

#include <micromap/map.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace micromap {
//------------------------------------------------------------------------------

TEST( map_overflow, exactly_capacity_inserts_succeed )
{
    map<int, int, 4> m;
    for ( int i{ 0 }; i < 4; ++i )
        m.insert( i, i * 10 );
    EXPECT_TRUE( m.full() );
    EXPECT_EQ  ( m.size(), 4 );
    // overwriting an existing key needs no free slot
    EXPECT_EQ( m.insert( 2, 99 ), 20 );
    EXPECT_EQ( m.size(), 4 );
}

TEST( map_overflow, full_map_keeps_working_after_remove )
{
    map<int, char const *, 3> m{ { 1, "a" }, { 2, "b" }, { 3, "c" } };
    EXPECT_EQ( std::string{ *m.insert( 2, "z" ) }, "b" );
    EXPECT_EQ( m.size(), 3 );
    m.remove( 1 );
    m.insert( 4, "d" );
    EXPECT_EQ( m.size(), 3 );
    EXPECT_EQ( m.keys()[ 2 ], 4 );
}

TEST( map_overflow, insert_past_capacity_dies )
{
    map<int, char const *, 3> m{ { 1, "a" }, { 2, "b" }, { 3, "c" } };
    EXPECT_DEATH( m.insert( 4, "d" ), "capacity overflow" );
}

TEST( map_overflow, zero_capacity_insert_dies )
{
    map<int, int, 0> m;
    EXPECT_DEATH( m.insert( 1, 1 ), "capacity overflow" );
}

TEST( map_overflow, construction_from_too_many_pairs_dies )
{
    std::vector<std::pair<int, int>> const pairs{ { 1, 1 }, { 2, 2 }, { 3, 3 } };
    EXPECT_DEATH( ( map<int, int, 2>( pairs.begin(), pairs.end() ) ), "capacity overflow" );
}

TEST( map_overflow, construction_with_duplicates_fits )
{
    std::vector<std::pair<int, int>> const pairs{ { 1, 1 }, { 2, 2 }, { 1, 3 } };
    map<int, int, 2> const m( pairs.begin(), pairs.end() );
    EXPECT_EQ( m.size(), 2 );
    EXPECT_EQ( m[ 1 ], 3 );
}

TEST( map_overflow, vacant_entry_on_full_map_dies )
{
    map<int, int, 1> m{ { 1, 1 } };
    EXPECT_DEATH( m.entry( 2 ).or_insert( 2 ), "capacity overflow" );
}

TEST( map_overflow, index_missing_key_dies )
{
    map<std::string, int, 4> m{ { "one", 1 } };
    EXPECT_EQ   ( m[ "one" ], 1 );
    EXPECT_DEATH( m[ "two" ] = 2, "not in the map" );
}

TEST( map_overflow, at_missing_key_throws )
{
    map<std::string, int, 4> const m{ { "one", 1 } };
    EXPECT_THROW( static_cast<void>( m.at( "two" ) ), std::out_of_range );
}

TEST( map_overflow, throwing_policy_leaves_map_unchanged )
{
    map<int, std::string, 2, throw_on_overflow> m{ { 1, "a" }, { 2, "b" } };
    EXPECT_THROW( m.insert( 3, "c" ), std::length_error );
    EXPECT_EQ   ( m.size(), 2 );
    EXPECT_FALSE( m.contains( 3 ) );
    EXPECT_EQ   ( m[ 1 ], "a" );
    EXPECT_EQ   ( m[ 2 ], "b" );

    m.remove( 1 );
    EXPECT_NO_THROW( m.insert( 3, "c" ) );
    EXPECT_EQ( m.keys()[ 0 ], 2 );
    EXPECT_EQ( m.keys()[ 1 ], 3 );
}

TEST( map_overflow, throwing_policy_extend_stops_at_capacity )
{
    map<int, int, 2, throw_on_overflow> m;
    EXPECT_THROW( m.extend( { std::pair{ 1, 1 }, std::pair{ 2, 2 }, std::pair{ 3, 3 } } ), std::length_error );
    EXPECT_EQ( m.size(), 2 );
    EXPECT_TRUE( m.contains( 1 ) );
    EXPECT_TRUE( m.contains( 2 ) );
}

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
