////////////////////////////////////////////////////////////////////////////////
/// Capacity overflow policies for micromap::map.
///
/// The capacity of a map is a compile-time contract: inserting a new key into
/// a full map is a logic error. The default policy reports it and terminates
/// the process (in all build modes, unlike a plain assert). An alternative,
/// throwing, policy is provided for callers that want to treat overflow as a
/// recoverable runtime condition.
///
/// Any default constructible type with a (noreturn) call operator taking the
/// capacity can serve as a policy.
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

#include <cstdint>
//------------------------------------------------------------------------------
namespace micromap
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void overflow_abort    ( std::uint32_t capacity ) noexcept;
    [[ noreturn, gnu::cold ]] void missing_key_abort () noexcept;
    [[ noreturn, gnu::cold ]] void throw_length_error( std::uint32_t capacity );
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg );
} // namespace detail

struct abort_on_overflow {
    [[ noreturn ]] void operator()( std::uint32_t const capacity ) const noexcept { detail::overflow_abort( capacity ); }
}; // abort_on_overflow

struct throw_on_overflow {
    [[ noreturn ]] void operator()( std::uint32_t const capacity ) const { detail::throw_length_error( capacity ); }
}; // throw_on_overflow

template <typename Handler>
concept overflow_handler = requires( Handler const handler, std::uint32_t const capacity ) { Handler{}; handler( capacity ); };

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
