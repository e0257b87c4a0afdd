#pragma once

#include <tiny-deque/fwd.hh>

#include <string_view>

/// Expected failures of deque operations, reported through td::result by the try_* operations.
/// All of them are recoverable and leave the deque unchanged.
enum class td::deque_error : td::u8
{
    /// push on a deque without room (array_deque, or tiny_deque built without allocation support)
    capacity_exceeded,
    /// pop on an empty deque
    empty_deque,
    /// get(i) with i outside [0, size())
    index_out_of_bounds,
};

namespace td
{
[[nodiscard]] constexpr std::string_view to_string_view(deque_error e)
{
    switch (e)
    {
    case deque_error::capacity_exceeded:
        return "capacity_exceeded";
    case deque_error::empty_deque:
        return "empty_deque";
    case deque_error::index_out_of_bounds:
        return "index_out_of_bounds";
    }
    return "<invalid deque_error>";
}
} // namespace td
