////////////////////////////////////////////////////////////////////////////////
/// Fixed capacity, insertion ordered, allocation free associative container
/// for small key counts (a drop-in replacement for a hash map when there are
/// roughly 20 or fewer entries).
///
/// Architecture:
///   map privately inherits detail::paired_slots<Key, T, N> which keeps the
///   keys and the mapped values in two parallel in-object arrays (the keys are
///   contiguous so a lookup scans only key memory). There is no hashing and no
///   ordering: every lookup is a linear scan over the occupied slots, which
///   for small N is dominated by cache resident sequential reads rather than
///   by hash computation and pointer chasing.
///
/// Semantics:
///   - entries keep their insertion order; overwriting an existing key keeps
///     its position, removal shifts the later entries left (compaction)
///   - the capacity is a compile-time contract: inserting a new key into a
///     full map invokes the OverflowHandler (abort_on_overflow by default,
///     see overflow.hpp)
///   - operator[] on a missing key is fatal, at() throws std::out_of_range
///   - equality is order-insensitive
///   - iterators, references and views borrow from the map and are
///     invalidated by any modification that inserts or removes a slot
///
/// Not thread safe (in the same sense as standard containers).
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

#include <micromap/detail/paired_slots.hpp>
#include <micromap/entry.hpp>
#include <micromap/lookup.hpp>
#include <micromap/overflow.hpp>

#include <boost/assert.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace micromap
{
//------------------------------------------------------------------------------

template
<
    typename      Key,
    typename      T,
    std::uint32_t maximum_size,
    overflow_handler OverflowHandler = abort_on_overflow
>
class map
    : private detail::paired_slots<Key, T, maximum_size>
{
    using base = detail::paired_slots<Key, T, maximum_size>;

    static_assert( std::equality_comparable<Key>, "micromap::map keys must be equality comparable" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type              = Key;
    using mapped_type           = T;
    using value_type            = std::pair<key_type, mapped_type>;
    using reference             = std::pair<key_type const &, mapped_type       &>;
    using const_reference       = std::pair<key_type const &, mapped_type const &>;
    using size_type             = typename base::size_type;
    using difference_type       = std::ptrdiff_t;
    using overflow_handler_type = OverflowHandler;
    using entry_type            = micromap::entry<map>;

    static size_type constexpr static_capacity{ maximum_size };

    //--------------------------------------------------------------------------
    // Iterator
    //--------------------------------------------------------------------------
private:
    // A pair of cursors into the (parallel) key and value arrays. Keys are
    // never mutable through an iterator.
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = map::value_type;
        using difference_type   = map::difference_type;
        using reference         = std::conditional_t<IsConst, map::const_reference, map::reference>;

        // the dereferenced pair is a temporary so -> needs somewhere to keep it
        struct pointer {
            reference pair;
            reference * operator->() noexcept { return &pair; }
        };

    private:
        friend map;
        friend iterator_impl<!IsConst>;

        using value_pointer = std::conditional_t<IsConst, mapped_type const *, mapped_type *>;

        key_type const * p_key_  { nullptr };
        value_pointer    p_value_{ nullptr };

        constexpr iterator_impl( key_type const * const p_key, value_pointer const p_value ) noexcept : p_key_{ p_key }, p_value_{ p_value } {}

    public:
        constexpr iterator_impl() noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : p_key_{ other.p_key_ }, p_value_{ other.p_value_ } {}

        constexpr reference operator* () const noexcept { return { *p_key_, *p_value_ }; }
        constexpr pointer   operator->() const noexcept { return { **this }; }

        constexpr reference operator[]( difference_type const n ) const noexcept { return { p_key_[ n ], p_value_[ n ] }; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { p_key_ += n; p_value_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { return *this += -n; }

        constexpr iterator_impl & operator++(     ) noexcept { return *this += 1; }
        constexpr iterator_impl & operator--(     ) noexcept { return *this -= 1; }
        constexpr iterator_impl   operator++( int ) noexcept { auto const prev{ *this }; ++*this; return prev; }
        constexpr iterator_impl   operator--( int ) noexcept { auto const prev{ *this }; --*this; return prev; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return it += n; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return it += n; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return it -= n; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.p_key_ - b.p_key_; }

        friend constexpr bool operator== ( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.p_key_ ==  b.p_key_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.p_key_ <=> b.p_key_; }
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    map() noexcept = default;

    // Pairs are inserted in order: a later duplicate key overwrites the value
    // of the earlier one, more than maximum_size distinct keys overflow.
    template <std::input_iterator InputIt, std::sentinel_for<InputIt> Sentinel>
    map( InputIt const first, Sentinel const last ) { extend( first, last ); }

    map( std::initializer_list<value_type> const il ) { extend( il ); }

    map( map const & ) = default;
    map( map &&      ) = default;

    map & operator=( map const & ) = default;
    map & operator=( map &&      ) = default;

    map & operator=( std::initializer_list<value_type> const il ) {
        clear();
        extend( il );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return iterator_at( 0      ); }
    const_iterator begin() const noexcept { return iterator_at( 0      ); }
    iterator       end  ()       noexcept { return iterator_at( size() ); }
    const_iterator end  () const noexcept { return iterator_at( size() ); }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Views (insertion order)
    //--------------------------------------------------------------------------
    [[ nodiscard ]] std::span<key_type    const> keys  () const noexcept { return { base::keys_data  (), size() }; }
    [[ nodiscard ]] std::span<mapped_type const> values() const noexcept { return { base::values_data(), size() }; }
    [[ nodiscard ]] std::span<mapped_type      > values()       noexcept { return { base::values_data(), size() }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    using base::size;
    using base::full;

    [[ nodiscard ]] bool empty() const noexcept { return size() == 0; }

    [[ nodiscard, gnu::const ]] static constexpr size_type capacity() noexcept { return maximum_size; }
    [[ nodiscard, gnu::const ]] static constexpr size_type max_size() noexcept { return maximum_size; }

    //--------------------------------------------------------------------------
    // Lookup (linear scans)
    //--------------------------------------------------------------------------
    template <LookupType<key_type> K>
    [[ nodiscard ]] iterator       find( K const & key )       noexcept { return iterator_at( find_index( key ) ); }
    template <LookupType<key_type> K>
    [[ nodiscard ]] const_iterator find( K const & key ) const noexcept { return iterator_at( find_index( key ) ); }

    template <LookupType<key_type> K>
    [[ nodiscard ]] bool      contains( K const & key ) const noexcept { return find_index( key ) != size(); }
    template <LookupType<key_type> K>
    [[ nodiscard ]] size_type count   ( K const & key ) const noexcept { return contains( key ) ? 1 : 0; }

    /// Pointer to the mapped value or nullptr if the key is absent.
    template <LookupType<key_type> K>
    [[ nodiscard ]] mapped_type const * get( K const & key ) const noexcept
    {
        auto const pos{ find_index( key ) };
        return ( pos != size() ) ? &base::value( pos ) : nullptr;
    }
    template <LookupType<key_type> K>
    [[ nodiscard ]] mapped_type * get( K const & key ) noexcept
    {
        auto const pos{ find_index( key ) };
        return ( pos != size() ) ? &base::value( pos ) : nullptr;
    }

    template <LookupType<key_type> K>
    [[ nodiscard ]] std::optional<const_reference> get_key_value( K const & key ) const noexcept
    {
        auto const pos{ find_index( key ) };
        if ( pos == size() )
            return std::nullopt;
        return const_reference{ base::key( pos ), base::value( pos ) };
    }

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    template <LookupType<key_type> K>
    mapped_type       & at( K const & key )       { return base::value( checked_index( key ) ); }
    template <LookupType<key_type> K>
    mapped_type const & at( K const & key ) const { return base::value( checked_index( key ) ); }

    // Unlike std::map::operator[] this never inserts: indexing by an absent
    // key is a fatal logic error (see detail::missing_key_abort()).
    template <LookupType<key_type> K>
    mapped_type       & operator[]( K const & key )       noexcept { return base::value( existing_index( key ) ); }
    template <LookupType<key_type> K>
    mapped_type const & operator[]( K const & key ) const noexcept { return base::value( existing_index( key ) ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Inserts or overwrites the value for key.
    /// Returns the previous value if the key was already present (its slot
    /// and thus its iteration position are kept), otherwise appends the pair
    /// and returns nullopt. Appending to a full map invokes the overflow
    /// handler.
    template <LookupType<key_type> K, typename M>
    requires( std::constructible_from<key_type, K> && std::constructible_from<mapped_type, M> )
    std::optional<mapped_type> insert( K && key, M && value )
    {
        auto const pos{ find_index( key ) };
        if ( pos != size() ) {
            // value may refer to the stored value itself
            mapped_type previous( std::forward<M>( value ) );
            using std::swap;
            swap( base::value( pos ), previous );
            return previous;
        }
        append( std::forward<K>( key ), std::forward<M>( value ) );
        return std::nullopt;
    }

    template <LookupType<key_type> K, typename M>
    requires( std::constructible_from<key_type, K> && std::constructible_from<mapped_type, M> )
    std::pair<iterator, bool> insert_or_assign( K && key, M && value )
    {
        auto const pos{ find_index( key ) };
        if ( pos != size() ) {
            base::value( pos ) = std::forward<M>( value );
            return { iterator_at( pos ), false };
        }
        append( std::forward<K>( key ), std::forward<M>( value ) );
        return { iterator_at( pos ), true };
    }

    template <LookupType<key_type> K, typename... Args>
    requires std::constructible_from<key_type, K>
    std::pair<iterator, bool> try_emplace( K && key, Args &&... args )
    {
        auto const pos{ find_index( key ) };
        if ( pos != size() )
            return { iterator_at( pos ), false };
        append( std::forward<K>( key ), std::forward<Args>( args )... );
        return { iterator_at( pos ), true };
    }

    template <std::input_iterator InputIt, std::sentinel_for<InputIt> Sentinel>
    void extend( InputIt first, Sentinel const last )
    {
        for ( ; first != last; ++first )
        {
            auto && pair{ *first };
            insert( pair.first, pair.second );
        }
    }

    template <std::ranges::input_range R>
    void extend( R && rg ) { extend( std::ranges::begin( rg ), std::ranges::end( rg ) ); }

    void extend( std::initializer_list<value_type> const il ) { extend( il.begin(), il.end() ); }

    /// Removes the key (shifting all later entries one slot left) and returns
    /// its value, or nullopt if the key is absent.
    template <LookupType<key_type> K>
    std::optional<mapped_type> remove( K const & key )
    {
        auto const pos{ find_index( key ) };
        if ( pos == size() )
            return std::nullopt;
        std::optional<mapped_type> removed{ std::move( base::value( pos ) ) };
        base::erase_element_at( pos );
        return removed;
    }

    template <LookupType<key_type> K>
    std::optional<value_type> remove_entry( K const & key )
    {
        auto const pos{ find_index( key ) };
        if ( pos == size() )
            return std::nullopt;
        std::optional<value_type> removed{ std::in_place, std::move( base::key( pos ) ), std::move( base::value( pos ) ) };
        base::erase_element_at( pos );
        return removed;
    }

    template <LookupType<key_type> K>
    size_type erase( K const & key ) noexcept
    {
        auto const pos{ find_index( key ) };
        if ( pos == size() )
            return 0;
        base::erase_element_at( pos );
        return 1;
    }

    iterator erase( iterator const pos ) noexcept { return erase( const_iterator{ pos } ); }

    iterator erase( const_iterator const pos ) noexcept
    {
        auto const idx{ static_cast<size_type>( pos.p_key_ - base::keys_data() ) };
        BOOST_ASSERT( idx < size() );
        base::erase_element_at( idx );
        return iterator_at( idx );
    }

    /// Keeps only the entries for which pred( key, value ) returns true
    /// (preserving their relative order).
    template <typename Pred>
    requires std::predicate<Pred &, key_type const &, mapped_type &>
    void retain( Pred pred )
    {
        base::remove_if( [&pred]( key_type const & key, mapped_type & value ) { return !pred( key, value ); } );
    }

    template <typename Pred>
    friend size_type erase_if( map & c, Pred pred )
    {
        return c.base::remove_if( [&pred]( key_type const & key, mapped_type & value ) {
            return pred( const_reference{ key, value } );
        } );
    }

    using base::clear;

    template <LookupType<key_type> K>
    requires std::constructible_from<key_type, K>
    [[ nodiscard ]] entry_type entry( K && key )
    {
        auto const pos{ find_index( key ) };
        return entry_type{ *this, key_type( std::forward<K>( key ) ), pos, pos != size() };
    }

    void swap( map & other ) noexcept( base::nothrow_move_constructible )
    {
        map tmp{ std::move( other ) };
        other = std::move( *this );
        *this = std::move( tmp );
    }

    friend void swap( map & a, map & b ) noexcept( base::nothrow_move_constructible ) { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Private helpers
    //--------------------------------------------------------------------------
private:
    friend entry_type;

    template <LookupType<key_type> K>
    [[ nodiscard ]] size_type find_index( K const & key ) const noexcept
    {
        auto const sz  { size() };
        auto const keys{ base::keys_data() };
        for ( size_type i{ 0 }; i < sz; ++i )
        {
            if ( keys[ i ] == key )
                return i;
        }
        return sz;
    }

    template <LookupType<key_type> K>
    [[ nodiscard ]] size_type checked_index( K const & key ) const
    {
        auto const pos{ find_index( key ) };
        if ( pos == size() ) [[ unlikely ]]
            detail::throw_out_of_range( "micromap::map::at" );
        return pos;
    }

    template <LookupType<key_type> K>
    [[ nodiscard ]] size_type existing_index( K const & key ) const noexcept
    {
        auto const pos{ find_index( key ) };
        if ( pos == size() ) [[ unlikely ]]
            detail::missing_key_abort();
        return pos;
    }

    template <typename K, typename... ValueArgs>
    void append( K && key, ValueArgs &&... value_args )
    {
        if ( full() ) [[ unlikely ]]
            OverflowHandler{}( maximum_size );
        base::append( std::forward<K>( key ), std::forward<ValueArgs>( value_args )... );
    }

    [[ nodiscard ]] iterator       iterator_at( size_type const pos )       noexcept { return { base::keys_data() + pos, base::values_data() + pos }; }
    [[ nodiscard ]] const_iterator iterator_at( size_type const pos ) const noexcept { return { base::keys_data() + pos, base::values_data() + pos }; }

    [[ nodiscard ]] key_type          & slot_key  ( size_type const pos )       noexcept { return base::key  ( pos ); }
    [[ nodiscard ]] mapped_type       & slot_value( size_type const pos )       noexcept { return base::value( pos ); }

    void erase_at( size_type const pos ) noexcept { base::erase_element_at( pos ); }
}; // class map

//------------------------------------------------------------------------------
// Comparison: order-insensitive (same set of key/value pairs), capacities and
// overflow policies may differ
//------------------------------------------------------------------------------

template <typename Key, typename T, std::uint32_t lhs_size, typename LhsHandler, std::uint32_t rhs_size, typename RhsHandler>
requires std::equality_comparable<T>
[[ nodiscard ]] bool operator==( map<Key, T, lhs_size, LhsHandler> const & lhs, map<Key, T, rhs_size, RhsHandler> const & rhs )
{
    if ( lhs.size() != rhs.size() )
        return false;
    for ( auto const & [key, value] : lhs )
    {
        auto const p_value{ rhs.get( key ) };
        if ( !p_value || !( *p_value == value ) )
            return false;
    }
    return true;
}

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
