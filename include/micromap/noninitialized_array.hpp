////////////////////////////////////////////////////////////////////////////////
/// In-object raw storage for up to N objects. The union member keeps the
/// contained values directly visible in a debugger (no 'visualizers' over
/// type-erased byte arrays needed). Lifetimes of the individual elements are
/// managed by the owner.
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

template <typename T, std::uint32_t size>
union [[ clang::trivial_abi ]] noninitialized_array
{
    constexpr  noninitialized_array() noexcept {}
    constexpr ~noninitialized_array() noexcept {}

    [[ nodiscard, gnu::const ]] constexpr T       * data()       noexcept { return elements; }
    [[ nodiscard, gnu::const ]] constexpr T const * data() const noexcept { return elements; }

    T elements[ size ];
}; // noninitialized_array

// zero sized arrays are ill-formed: a zero capacity container is permanently
// full and never touches its storage
template <typename T>
union [[ clang::trivial_abi ]] noninitialized_array<T, 0>
{
    constexpr  noninitialized_array() noexcept {}
    constexpr ~noninitialized_array() noexcept {}

    [[ nodiscard, gnu::const ]] constexpr T       * data()       noexcept { return nullptr; }
    [[ nodiscard, gnu::const ]] constexpr T const * data() const noexcept { return nullptr; }
}; // noninitialized_array<T, 0>

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
