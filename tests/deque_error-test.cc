#include <tiny-deque/deque_error.hh>

#include <nexus/test.hh>

static_assert(td::to_string_view(td::deque_error::capacity_exceeded) == "capacity_exceeded");

TEST("deque_error - names")
{
    CHECK(td::to_string_view(td::deque_error::capacity_exceeded) == "capacity_exceeded");
    CHECK(td::to_string_view(td::deque_error::empty_deque) == "empty_deque");
    CHECK(td::to_string_view(td::deque_error::index_out_of_bounds) == "index_out_of_bounds");
    CHECK(td::to_string_view(td::deque_error(200)) == "<invalid deque_error>");
}

TEST("deque_error - value-initialized error")
{
    // default-constructed results hold this value
    CHECK(td::deque_error{} == td::deque_error::capacity_exceeded);
}
