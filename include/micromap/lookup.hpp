////////////////////////////////////////////////////////////////////////////////
/// Lookup key constraint for micromap containers.
///
/// The containers never hash or order keys: a lookup is a linear scan
/// comparing the stored keys for equality with the probe. Any probe type that
/// is equality comparable with the stored key type is therefore accepted
/// directly, without first materializing a key_type temporary (e.g. a
/// std::string keyed map can be searched with string literals or
/// std::string_views).
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

#include <concepts>
//------------------------------------------------------------------------------
namespace micromap
{
//------------------------------------------------------------------------------

template <typename K, typename StoredKeyType>
concept LookupType = requires( StoredKeyType const & stored, K const & probe )
{
    { stored == probe } -> std::convertible_to<bool>;
};

//------------------------------------------------------------------------------
} // namespace micromap
//------------------------------------------------------------------------------
