////////////////////////////////////////////////////////////////////////////////
/// detail::paired_slots: fixed capacity, in-object storage of up to N
/// key/value slots kept as two parallel arrays (keys contiguous for cheap
/// linear scans). Slots [0, size) are always constructed, slots [size, N)
/// never are. All operations keep both arrays in lock step.
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

#include <micromap/noninitialized_array.hpp>

#include <boost/assert.hpp>
#include <boost/integer.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace micromap::detail
{
//------------------------------------------------------------------------------

template <typename Key, typename T, std::uint32_t maximum_size>
class paired_slots
{
public:
    using size_type = typename boost::uint_value_t<maximum_size>::least;

    static size_type constexpr static_capacity{ maximum_size };

    static bool constexpr nothrow_copy_constructible{ std::is_nothrow_copy_constructible_v<Key> && std::is_nothrow_copy_constructible_v<T> };
    static bool constexpr nothrow_move_constructible{ std::is_nothrow_move_constructible_v<Key> && std::is_nothrow_move_constructible_v<T> };

    constexpr paired_slots() noexcept : size_{ 0 } {}

    paired_slots( paired_slots const & other ) noexcept( nothrow_copy_constructible )
        : size_{ 0 }
    {
        copy_from( other );
    }
    paired_slots( paired_slots && other ) noexcept( nothrow_move_constructible )
        : size_{ 0 }
    {
        move_from( other );
    }

    paired_slots & operator=( paired_slots const & other ) noexcept( nothrow_copy_constructible )
    {
        if ( this != &other ) {
            clear();
            copy_from( other );
        }
        return *this;
    }
    paired_slots & operator=( paired_slots && other ) noexcept( nothrow_move_constructible )
    {
        if ( this != &other ) {
            clear();
            move_from( other );
        }
        return *this;
    }

    ~paired_slots() noexcept { clear(); }

    [[ nodiscard, gnu::pure ]] constexpr size_type size() const noexcept { BOOST_ASSERT( size_ <= maximum_size ); return size_; }
    [[ nodiscard, gnu::pure ]] constexpr bool      full() const noexcept { return size() == maximum_size; }

    [[ nodiscard, gnu::const ]] constexpr Key       * keys_data  ()       noexcept { return keys_  .data(); }
    [[ nodiscard, gnu::const ]] constexpr Key const * keys_data  () const noexcept { return keys_  .data(); }
    [[ nodiscard, gnu::const ]] constexpr T         * values_data()       noexcept { return values_.data(); }
    [[ nodiscard, gnu::const ]] constexpr T   const * values_data() const noexcept { return values_.data(); }

    [[ nodiscard ]] constexpr Key       & key  ( size_type const pos )       noexcept { BOOST_ASSERT( pos < size() ); return keys_data  ()[ pos ]; }
    [[ nodiscard ]] constexpr Key const & key  ( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return keys_data  ()[ pos ]; }
    [[ nodiscard ]] constexpr T         & value( size_type const pos )       noexcept { BOOST_ASSERT( pos < size() ); return values_data()[ pos ]; }
    [[ nodiscard ]] constexpr T   const & value( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return values_data()[ pos ]; }

    //--------------------------------------------------------------------------
    // Construct a new slot at position size(), the value is constructed in
    // place from value_args (exception-safe: a throwing value constructor
    // leaves no half-constructed slot behind)
    //--------------------------------------------------------------------------
    template <typename K, typename... ValueArgs>
    void append( K && key, ValueArgs &&... value_args )
    {
        BOOST_ASSERT_MSG( !full(), "paired_slots overflow" );
        auto const pos{ size() };
        auto * const p_key{ std::construct_at( keys_data() + pos, std::forward<K>( key ) ) };
        try {
            std::construct_at( values_data() + pos, std::forward<ValueArgs>( value_args )... );
        } catch ( ... ) {
            std::destroy_at( p_key );
            throw;
        }
        ++size_;
    }

    //--------------------------------------------------------------------------
    // Compaction: shift the tail one slot left over pos, destroy the vacated
    // last slot. Relative order of the remaining slots is preserved.
    //--------------------------------------------------------------------------
    void erase_element_at( size_type const pos ) noexcept
    {
        BOOST_ASSERT( pos < size() );
        auto const sz{ size() };
        std::move( keys_data  () + pos + 1, keys_data  () + sz, keys_data  () + pos );
        std::move( values_data() + pos + 1, values_data() + sz, values_data() + pos );
        truncate_to( static_cast<size_type>( sz - 1 ) );
    }

    //--------------------------------------------------------------------------
    // Stable in place removal of all slots for which pred( key, value ) holds.
    // If pred throws the slots tested so far are already removed and the
    // untested tail is kept (shifted down over the gap).
    //--------------------------------------------------------------------------
    template <typename Pred>
    size_type remove_if( Pred && pred )
    {
        auto const sz{ size() };
        size_type kept{ 0 };
        size_type i   { 0 };
        try {
            for ( ; i < sz; ++i )
            {
                if ( pred( std::as_const( keys_data()[ i ] ), values_data()[ i ] ) )
                    continue;
                move_slot( i, kept );
                ++kept;
            }
        } catch ( ... ) {
            for ( ; i < sz; ++i, ++kept )
                move_slot( i, kept );
            truncate_to( kept );
            throw;
        }
        truncate_to( kept );
        return static_cast<size_type>( sz - kept );
    }

    void truncate_to( size_type const new_size ) noexcept
    {
        BOOST_ASSERT( new_size <= size() );
        std::destroy( keys_data  () + new_size, keys_data  () + size_ );
        std::destroy( values_data() + new_size, values_data() + size_ );
        size_ = new_size;
    }

    void clear() noexcept { truncate_to( 0 ); }

private:
    void move_slot( size_type const from, size_type const to ) noexcept
    {
        if ( from != to ) {
            keys_data  ()[ to ] = std::move( keys_data  ()[ from ] );
            values_data()[ to ] = std::move( values_data()[ from ] );
        }
    }

    void copy_from( paired_slots const & other )
    {
        for ( size_type i{ 0 }; i < other.size(); ++i )
            append( other.key( i ), other.value( i ) );
    }

    void move_from( paired_slots & other )
    {
        for ( size_type i{ 0 }; i < other.size(); ++i )
            append( std::move( other.key( i ) ), std::move( other.value( i ) ) );
        other.clear();
    }

private:
    size_type                              size_;
    noninitialized_array<Key, maximum_size> keys_;
    noninitialized_array<T  , maximum_size> values_;
}; // class paired_slots

//------------------------------------------------------------------------------
} // namespace micromap::detail
//------------------------------------------------------------------------------
