#pragma once

#include <ring-core/fwd.hh>

#include <string>

/// Why a ring_list operation could not be performed.
/// In every case the list is left exactly as it was.
enum class rc::list_error : rc::u8
{
    /// remove_index on a list without elements
    empty_list,

    /// remove_index with index < 0 or index >= size()
    index_out_of_bounds,

    /// the bounded traversal did not reach an index that passed the bounds check
    /// only possible with a broken ring, so it also trips RC_ASSERT
    not_found,
};

namespace rc
{
/// Human-readable message for an error, e.g. "index out of bounds"
[[nodiscard]] std::string to_string(list_error e);
} // namespace rc
