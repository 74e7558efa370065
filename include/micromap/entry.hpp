////////////////////////////////////////////////////////////////////////////////
/// micromap::entry: in-place get-or-insert handle returned by map::entry().
///
/// An entry remembers the lookup result for a single key: either the occupied
/// slot holding it or the fact that the key is absent (vacant). It borrows the
/// map exclusively: any modification of the map through other means while an
/// entry is alive invalidates it.
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

#include <boost/assert.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace micromap
{
//------------------------------------------------------------------------------

template <typename Map>
class entry
{
public:
    using key_type    = typename Map::key_type;
    using mapped_type = typename Map::mapped_type;
    using size_type   = typename Map::size_type;

    entry( entry const & ) = delete;
    entry & operator=( entry const & ) = delete;

    [[ nodiscard ]] bool occupied() const noexcept { return occupied_; }
    [[ nodiscard ]] bool vacant  () const noexcept { return !occupied_; }

    [[ nodiscard ]] key_type const & key() const noexcept { return occupied_ ? map_.slot_key( index_ ) : key_; }

    [[ nodiscard ]] mapped_type & get() noexcept
    {
        BOOST_ASSERT_MSG( occupied_, "micromap::entry::get() on a vacant entry" );
        return map_.slot_value( index_ );
    }

    template <typename M>
    requires std::constructible_from<mapped_type, M>
    mapped_type & or_insert( M && value )
    {
        if ( !occupied_ )
            emplace( std::forward<M>( value ) );
        return get();
    }

    // make_value is only invoked for a vacant entry
    template <std::invocable F>
    mapped_type & or_insert_with( F && make_value )
    {
        if ( !occupied_ )
            emplace( std::invoke( std::forward<F>( make_value ) ) );
        return get();
    }

    mapped_type & or_default() requires std::default_initializable<mapped_type>
    {
        if ( !occupied_ )
            emplace( mapped_type{} );
        return get();
    }

    template <std::invocable<mapped_type &> F>
    entry & and_modify( F && modify )
    {
        if ( occupied_ )
            std::invoke( std::forward<F>( modify ), get() );
        return *this;
    }

    /// Sets the value for the key, returns the previous one (if any).
    template <typename M>
    requires std::constructible_from<mapped_type, M>
    std::optional<mapped_type> insert( M && value )
    {
        if ( occupied_ ) {
            // value may refer to the stored value itself
            mapped_type previous( std::forward<M>( value ) );
            using std::swap;
            swap( get(), previous );
            return previous;
        }
        emplace( std::forward<M>( value ) );
        return std::nullopt;
    }

    /// Removes the pair, the entry becomes vacant and keeps the key.
    mapped_type remove()
    {
        BOOST_ASSERT_MSG( occupied_, "micromap::entry::remove() on a vacant entry" );
        mapped_type removed( std::move( get() ) );
        key_ = std::move( map_.slot_key( index_ ) );
        map_.erase_at( index_ );
        occupied_ = false;
        return removed;
    }

private: friend Map;
    entry( Map & map, key_type && key, size_type const index, bool const occupied ) noexcept( std::is_nothrow_move_constructible_v<key_type> )
        : map_{ map }, key_{ std::move( key ) }, index_{ index }, occupied_{ occupied } {}

    template <typename M>
    void emplace( M && value )
    {
        auto const pos{ map_.size() };
        map_.append( std::move( key_ ), std::forward<M>( value ) );
        index_    = pos;
        occupied_ = true;
    }

private:
    Map &     map_;
    key_type  key_;
    size_type index_;
    bool      occupied_;
}; // class entry

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
