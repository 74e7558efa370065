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
#include <micromap/overflow.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
//------------------------------------------------------------------------------
namespace micromap
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void overflow_abort( std::uint32_t const capacity ) noexcept
    {
        std::fprintf( stderr, "micromap: capacity overflow, no free slot left in a map of capacity %u\n", static_cast<unsigned>( capacity ) );
        std::fflush ( stderr );
        std::abort();
    }

    [[ noreturn, gnu::cold ]] void missing_key_abort() noexcept
    {
        std::fputs( "micromap: indexing by a key that is not in the map\n", stderr );
        std::fflush( stderr );
        std::abort();
    }

    [[ noreturn, gnu::cold ]] void throw_length_error( std::uint32_t const capacity )
    {
        throw std::length_error( "micromap::map capacity (" + std::to_string( capacity ) + ") exceeded" );
    }

    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * const msg ) { throw std::out_of_range( msg ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
