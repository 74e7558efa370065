////////////////////////////////////////////////////////////////////////////////
/// Stream output for micromap::map.
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

#include <micromap/map.hpp>

#include <cstdint>
#include <ostream>
#include <version>
#ifdef __cpp_lib_format
#include <format>
#endif
//------------------------------------------------------------------------------
namespace micromap
{
//------------------------------------------------------------------------------

// {key0: value0, key1: value1} in insertion order, {} when empty
template <typename Key, typename T, std::uint32_t maximum_size, typename OverflowHandler>
std::ostream & operator<<( std::ostream & os, map<Key, T, maximum_size, OverflowHandler> const & m )
{
    os.put( '{' );
    bool first{ true };
    for ( auto const & [key, value] : m )
    {
        if ( !first )
            os << ", ";
        os << key << ": " << value;
        first = false;
    }
    os.put( '}' );
    return os;
}

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------

#ifdef __cpp_lib_format
// std::format( "{}", m ) / std::print: same layout as operator<<
template <typename Key, typename T, std::uint32_t maximum_size, typename OverflowHandler>
struct std::formatter<micromap::map<Key, T, maximum_size, OverflowHandler>>
{
    constexpr auto parse( std::format_parse_context & ctx ) { return ctx.begin(); }

    auto format( micromap::map<Key, T, maximum_size, OverflowHandler> const & m, std::format_context & ctx ) const
    {
        auto out{ ctx.out() };
        *out++ = '{';
        bool first{ true };
        for ( auto const & [key, value] : m )
        {
            if ( !first )
                out = std::format_to( out, ", " );
            out   = std::format_to( out, "{}: {}", key, value );
            first = false;
        }
        *out++ = '}';
        return out;
    }
}; // std::formatter<micromap::map>
#endif // __cpp_lib_format
