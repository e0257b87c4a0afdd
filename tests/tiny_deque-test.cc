#include <tiny-deque/assert-handler.hh>
#include <tiny-deque/tiny_deque.hh>

#include <nexus/test.hh>

#include <iterator>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

static_assert(std::random_access_iterator<td::tiny_deque<int, 4>::iterator>);
static_assert(!std::is_copy_constructible_v<td::tiny_deque<std::unique_ptr<int>, 4>>);
static_assert(std::is_nothrow_move_constructible_v<td::tiny_deque<std::unique_ptr<int>, 4>>);
static_assert(td::tiny_deque<int, 4>::inline_capacity == 4);

namespace
{
// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    static int alive() { return ctor_count + copy_ctor_count + move_ctor_count - dtor_count; }

    explicit Tracked(int v) : value(v) { ++ctor_count; }
    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    Tracked(Tracked&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }
    Tracked& operator=(Tracked const&) = default;
    Tracked& operator=(Tracked&&) noexcept = default;
    ~Tracked() { ++dtor_count; }

    friend bool operator==(Tracked const& a, Tracked const& b) { return a.value == b.value; }
};

// copy construction throws for the marked value
struct ThrowOnCopy
{
    int value = 0;
    static inline int poisoned = -1;
    static inline int live = 0;

    explicit ThrowOnCopy(int v) : value(v) { ++live; }
    ThrowOnCopy(ThrowOnCopy const& rhs) : value(rhs.value)
    {
        if (value == poisoned)
            throw std::runtime_error("poisoned copy");
        ++live;
    }
    ThrowOnCopy(ThrowOnCopy&& rhs) noexcept : value(rhs.value) { ++live; }
    ThrowOnCopy& operator=(ThrowOnCopy const&) = default;
    ThrowOnCopy& operator=(ThrowOnCopy&&) noexcept = default;
    ~ThrowOnCopy() { --live; }
};

#if TD_HAS_ALLOCATION
// Counting memory resource
struct CountingResource : td::memory_resource
{
    int allocations = 0;
    int deallocations = 0;
    td::isize total_allocated_bytes = 0;
    td::isize total_deallocated_bytes = 0;

    CountingResource()
    {
        allocate_bytes = [](td::byte** out_ptr, td::isize min_bytes, td::isize max_bytes, td::isize alignment,
                            void* userdata) -> td::isize
        {
            (void)max_bytes;
            auto* self = static_cast<CountingResource*>(userdata);
            ++self->allocations;
            if (min_bytes == 0)
            {
                *out_ptr = nullptr;
                return 0;
            }
            *out_ptr = static_cast<td::byte*>(::operator new(min_bytes, std::align_val_t(alignment)));
            self->total_allocated_bytes += min_bytes;
            return min_bytes;
        };

        deallocate_bytes = [](td::byte* p, td::isize bytes, td::isize alignment, void* userdata)
        {
            auto* self = static_cast<CountingResource*>(userdata);
            ++self->deallocations;
            self->total_deallocated_bytes += bytes;
            if (p != nullptr)
                ::operator delete(p, std::align_val_t(alignment));
        };

        userdata = this;
    }

    [[nodiscard]] bool balanced() const
    {
        return allocations == deallocations && total_allocated_bytes == total_deallocated_bytes;
    }
};
#endif

template <class Deque>
std::vector<int> contents(Deque const& d)
{
    std::vector<int> r;
    for (auto const& v : d)
        r.push_back(int(v));
    return r;
}

struct assertion_fired
{
};

// true iff f triggers a TD_ASSERT
template <class F>
bool fires_assertion(F&& f)
{
    auto handler
        = td::impl::scoped_assertion_handler([](td::impl::assertion_info const&) { throw assertion_fired{}; });
    try
    {
        f();
    }
    catch (assertion_fired const&)
    {
        return true;
    }
    return false;
}
} // namespace

TEST("tiny_deque - default construction invariants")
{
    td::tiny_deque<int, 3> d;
    CHECK(d.empty());
    CHECK(d.size() == 0);
    CHECK(d.is_inline());
    CHECK(!d.is_heap());
    CHECK(d.storage() == td::deque_storage::inline_storage);
    CHECK(d.capacity() == 3);
    CHECK(d.begin() == d.end());
}

TEST("tiny_deque - inline behaves like array_deque")
{
    td::tiny_deque<int, 4> d;
    d.push_back(2);
    d.push_front(1);
    d.push_back(3);
    CHECK(d.is_inline());
    CHECK(contents(d) == std::vector<int>{1, 2, 3});
    CHECK(d.front() == 1);
    CHECK(d.back() == 3);
    CHECK(*d.get(1).value() == 2);
    CHECK(d.get(3).error() == td::deque_error::index_out_of_bounds);

    CHECK(d.pop_front() == 1);
    CHECK(d.pop_back() == 3);
    CHECK(d.pop_back() == 2);
    CHECK(d.try_pop_front().error() == td::deque_error::empty_deque);
    CHECK(d.try_pop_back().error() == td::deque_error::empty_deque);
}

TEST("tiny_deque - FIFO and LIFO")
{
    td::tiny_deque<int, TD_HAS_ALLOCATION ? 2 : 16> d;

    SECTION("push_back then pop_front")
    {
        for (auto i = 0; i < 10; ++i)
            d.push_back(i);
        for (auto i = 0; i < 10; ++i)
            CHECK(d.pop_front() == i);
        CHECK(d.empty());
    }

    SECTION("push_front then pop_front")
    {
        for (auto i = 0; i < 10; ++i)
            d.push_front(i);
        for (auto i = 9; i >= 0; --i)
            CHECK(d.pop_front() == i);
        CHECK(d.try_pop_front().error() == td::deque_error::empty_deque);
    }
}

#if TD_HAS_ALLOCATION

TEST("tiny_deque - inline capacity 2 scenario")
{
    CountingResource res;
    {
        td::tiny_deque<int, 2> d(&res);
        d.push_back(1);
        d.push_back(2);
        CHECK(d.is_inline());
        CHECK(res.allocations == 0);

        d.push_back(3);
        CHECK(d.is_heap());
        CHECK(res.allocations == 1);
        CHECK(*d.get(0).value() == 1);
        CHECK(*d.get(1).value() == 2);
        CHECK(*d.get(2).value() == 3);

        CHECK(d.pop_front() == 1);
        CHECK(d.size() == 2);
        CHECK(d.is_heap()); // no reversion even though the elements fit inline again

        d.clear();
        CHECK(d.is_heap());
    }
    CHECK(res.deallocations == 1);
    CHECK(res.balanced());
}

TEST("tiny_deque - migration capacity and growth policy")
{
    CountingResource res;

    SECTION("first heap capacity is max(2N, N + 1)")
    {
        td::tiny_deque<int, 3> d(&res);
        for (auto i = 0; i < 4; ++i)
            d.push_back(i);
        CHECK(d.capacity() == 6);
        CHECK(res.total_allocated_bytes == 6 * td::isize(sizeof(int)));

        td::tiny_deque<int, 1> one(&res);
        one.push_back(0);
        CHECK(one.capacity() == 1);
        one.push_back(1);
        CHECK(one.capacity() == 2);
    }

    SECTION("heap growth doubles")
    {
        td::tiny_deque<int, 2> d(&res);
        std::vector<td::isize> capacities;
        for (auto i = 0; i < 17; ++i)
        {
            d.push_back(i);
            if (capacities.empty() || capacities.back() != d.capacity())
                capacities.push_back(d.capacity());
        }
        CHECK(capacities == std::vector<td::isize>{2, 4, 8, 16, 32});
        CHECK(res.allocations == 4);
        CHECK(res.deallocations == 3); // every replaced block was released
        CHECK(contents(d).size() == 17);
    }

    SECTION("capacity never decreases through pops")
    {
        td::tiny_deque<int, 2> d(&res);
        for (auto i = 0; i < 5; ++i)
            d.push_back(i);
        auto const cap = d.capacity();
        while (!d.empty())
        {
            d.remove_back();
            CHECK(d.capacity() == cap);
        }
    }

    CHECK(res.balanced());
}

TEST("tiny_deque - migration preserves logical order")
{
    CountingResource res;

    SECTION("wrapped inline ring")
    {
        td::tiny_deque<int, 4> d(&res);
        for (auto i : {0, 1, 2, 3})
            d.push_back(i);
        d.remove_front();
        d.remove_front();
        d.push_back(4);
        d.push_back(5); // inline ring [4, 5, 2, 3]
        REQUIRE(d.is_inline());
        REQUIRE(!d.is_contiguous());

        d.push_back(6);
        REQUIRE(d.is_heap());
        CHECK(contents(d) == std::vector<int>{2, 3, 4, 5, 6});
        CHECK(d.is_contiguous()); // relinearized at slot 0
        CHECK(d.segments().first.size() == 5);
    }

    SECTION("migration through push_front")
    {
        td::tiny_deque<int, 3> d(&res);
        d.push_back(1);
        d.push_back(2);
        d.push_back(3);
        d.push_front(0);
        REQUIRE(d.is_heap());
        CHECK(contents(d) == std::vector<int>{0, 1, 2, 3});
        CHECK(d.front() == 0);
        CHECK(d.capacity() == 6);

        d.push_front(-1);
        d.push_back(4);
        CHECK(contents(d) == std::vector<int>{-1, 0, 1, 2, 3, 4});
        CHECK(d.capacity() == 6);
    }

    SECTION("interleaved against a model")
    {
        td::tiny_deque<int, 2> d(&res);
        std::vector<int> model;
        for (auto i = 0; i < 100; ++i)
        {
            if (i % 3 == 0)
            {
                d.push_front(i);
                model.insert(model.begin(), i);
            }
            else
            {
                d.push_back(i);
                model.push_back(i);
            }
            if (i % 5 == 4)
            {
                CHECK(d.pop_front() == model.front());
                model.erase(model.begin());
            }
            CHECK(contents(d) == model);
        }
    }

    CHECK(res.balanced());
}

TEST("tiny_deque - try_push always succeeds with heap storage")
{
    td::tiny_deque<std::string, 1> d;
    CHECK(d.try_push_back("a").has_value());
    CHECK(d.try_push_back("b").has_value());
    CHECK(d.try_push_front("c").has_value());
    CHECK(d.try_emplace_back(2, 'd').has_value());
    CHECK(d.try_emplace_front(2, 'e').has_value());
    CHECK(d.is_heap());
    CHECK(d.size() == 5);
    CHECK(d[0] == "ee");
    CHECK(d[4] == "dd");
}

TEST("tiny_deque - pushing a reference to an own element while growing")
{
    td::tiny_deque<std::string, 2> d;
    d.push_back("first-long-enough-to-avoid-sso");
    d.push_back("second-long-enough-to-avoid-sso");
    REQUIRE(d.full());

    d.push_back(d[0]); // migrates, the argument lives in the inline slots
    d.push_front(d.back());

    CHECK(d.size() == 4);
    CHECK(d[0] == "first-long-enough-to-avoid-sso");
    CHECK(d[1] == "first-long-enough-to-avoid-sso");
    CHECK(d[2] == "second-long-enough-to-avoid-sso");
    CHECK(d[3] == "first-long-enough-to-avoid-sso");
}

TEST("tiny_deque - object lifetimes across migration")
{
    Tracked::reset_counters();
    CountingResource res;
    {
        td::tiny_deque<Tracked, 2> d(&res);
        d.emplace_back(1);
        d.emplace_back(2);
        CHECK(Tracked::ctor_count == 2);

        d.emplace_back(3);
        CHECK(Tracked::ctor_count == 3);
        CHECK(Tracked::move_ctor_count == 2); // both inline elements relocated
        CHECK(Tracked::copy_ctor_count == 0);
        CHECK(Tracked::alive() == 3);

        auto t = d.pop_front();
        CHECK(t.value == 1);
        CHECK(Tracked::alive() == 3);
    }
    CHECK(Tracked::alive() == 0);
    CHECK(res.balanced());
}

TEST("tiny_deque - failed construction during migration leaves the deque unchanged")
{
    CountingResource res;
    ThrowOnCopy::poisoned = 99;
    {
        td::tiny_deque<ThrowOnCopy, 2> d(&res);
        d.emplace_back(1);
        d.emplace_back(2);

        auto const poison = ThrowOnCopy(99);
        bool thrown = false;
        try
        {
            d.push_back(poison);
        }
        catch (std::runtime_error const&)
        {
            thrown = true;
        }

        CHECK(thrown);
        CHECK(d.is_inline());
        CHECK(d.size() == 2);
        CHECK(d[0].value == 1);
        CHECK(d[1].value == 2);
        CHECK(res.allocations == 1);
        CHECK(res.deallocations == 1); // the unused block was returned
    }
    ThrowOnCopy::poisoned = -1;
    CHECK(res.balanced());
}

TEST("tiny_deque - failed copy construction releases everything")
{
    CountingResource res;
    ThrowOnCopy::poisoned = 4;
    {
        td::tiny_deque<ThrowOnCopy, 2> d(&res);
        for (auto i = 1; i <= 5; ++i)
            d.emplace_back(i);
        REQUIRE(d.is_heap());

        auto const allocations = res.allocations;
        auto const deallocations = res.deallocations;
        auto const live = ThrowOnCopy::live;

        bool thrown = false;
        try
        {
            auto copy = d;
            (void)copy;
        }
        catch (std::runtime_error const&)
        {
            thrown = true;
        }

        CHECK(thrown);
        CHECK(ThrowOnCopy::live == live);
        CHECK(res.allocations == allocations + 1);
        CHECK(res.deallocations == deallocations + 1);
        CHECK(d.size() == 5);
        CHECK(d[3].value == 4);
    }
    ThrowOnCopy::poisoned = -1;
    CHECK(ThrowOnCopy::live == 0);
    CHECK(res.balanced());
}

TEST("tiny_deque - oversized capacity requests are fatal")
{
    CountingResource res;
    td::tiny_deque<int, 2> d(&res);
    d.push_back(1);

    CHECK(fires_assertion([&] { d.reserve((td::isize(1) << 62) + 1); }));
    CHECK(fires_assertion([&] { (void)td::tiny_deque<int, 2>::create_with_capacity(td::isize(1) << 62, &res); }));

    CHECK(d.is_inline());
    CHECK(d.size() == 1);
    CHECK(res.allocations == 0);
}

TEST("tiny_deque - reserve and create_with_capacity")
{
    CountingResource res;

    SECTION("reserve within inline capacity is a no-op")
    {
        td::tiny_deque<int, 4> d(&res);
        d.reserve(3);
        d.reserve(4);
        CHECK(d.is_inline());
        CHECK(res.allocations == 0);
    }

    SECTION("reserve beyond inline capacity migrates")
    {
        td::tiny_deque<int, 4> d(&res);
        d.push_back(1);
        d.push_front(0);
        d.reserve(10);
        CHECK(d.is_heap());
        CHECK(d.capacity() == 10);
        CHECK(contents(d) == std::vector<int>{0, 1});

        for (auto i = 2; i < 10; ++i)
            d.push_back(i);
        CHECK(res.allocations == 1);
        CHECK(d.capacity() == 10);
    }

    SECTION("create_with_capacity")
    {
        auto small = td::tiny_deque<int, 4>::create_with_capacity(4, &res);
        CHECK(small.is_inline());

        auto large = td::tiny_deque<int, 4>::create_with_capacity(20, &res);
        CHECK(large.is_heap());
        CHECK(large.empty());
        CHECK(large.capacity() == 20);
        CHECK(large.resource() == &res);
    }

    CHECK(res.balanced());
}

TEST("tiny_deque - copy and move")
{
    CountingResource res;
    {
        td::tiny_deque<std::string, 2> heap_d(&res);
        for (auto s : {"a", "b", "c", "d", "e"})
            heap_d.push_back(s);
        heap_d.remove_front(); // [b, c, d, e]

        td::tiny_deque<std::string, 2> inline_d(&res);
        inline_d.push_back("y");
        inline_d.push_front("x");

        SECTION("copy of heap deque")
        {
            auto c = heap_d;
            CHECK(c == heap_d);
            CHECK(c.is_heap());
            CHECK(c.resource() == &res);
            c[0] = "changed";
            CHECK(heap_d[0] == "b");
        }

        SECTION("copy of inline deque stays inline")
        {
            auto const allocations = res.allocations;
            auto c = inline_d;
            CHECK(c == inline_d);
            CHECK(c.is_inline());
            CHECK(res.allocations == allocations);
        }

        SECTION("copy that fits inline after pops")
        {
            heap_d.truncate(2);
            auto c = heap_d;
            CHECK(c.is_inline());
            CHECK(c == heap_d);
        }

        SECTION("move steals the heap block")
        {
            auto const allocations = res.allocations;
            auto m = std::move(heap_d);
            CHECK(res.allocations == allocations);
            CHECK(m.is_heap());
            CHECK(m.size() == 4);
            CHECK(m.front() == "b");
            CHECK(heap_d.empty());     // NOLINT(bugprone-use-after-move)
            CHECK(heap_d.is_inline()); // NOLINT(bugprone-use-after-move)

            heap_d.push_back("reuse"); // NOLINT(bugprone-use-after-move)
            CHECK(heap_d.size() == 1);
        }

        SECTION("move of inline deque moves elements")
        {
            auto m = std::move(inline_d);
            CHECK(m.is_inline());
            CHECK(m.front() == "x");
            CHECK(m.back() == "y");
            CHECK(inline_d.empty()); // NOLINT(bugprone-use-after-move)
        }

        SECTION("copy assignment keeps the target resource")
        {
            CountingResource other;
            {
                td::tiny_deque<std::string, 2> c(&other);
                c = heap_d;
                CHECK(c == heap_d);
                CHECK(c.resource() == &other);
                CHECK(other.allocations >= 1);
            }
            CHECK(other.balanced());
        }

        SECTION("move assignment releases the previous heap block")
        {
            td::tiny_deque<std::string, 2> m(&res);
            for (auto s : {"1", "2", "3"})
                m.push_back(s);
            auto const deallocations = res.deallocations;
            m = std::move(heap_d);
            CHECK(res.deallocations == deallocations + 1);
            CHECK(m.size() == 4);
        }
    }
    CHECK(res.balanced());
}

TEST("tiny_deque - range operations")
{
    CountingResource res;
    {
        auto d = td::tiny_deque<int, 2>::create_copy_of({1, 2, 3, 4}, &res);
        CHECK(contents(d) == std::vector<int>{1, 2, 3, 4});
        CHECK(res.allocations == 1);

        std::vector<int> const more = {5, 6, 7};
        d.push_back_range(td::span<int const>(more));
        CHECK(contents(d) == std::vector<int>{1, 2, 3, 4, 5, 6, 7});

        auto small = td::tiny_deque<int, 4>::create_copy_of({1, 2});
        CHECK(small.is_inline());
    }
    CHECK(res.balanced());
}

TEST("tiny_deque - default memory resource")
{
    td::tiny_deque<std::unique_ptr<int>, 1> d;
    CHECK(d.resource() == nullptr);
    for (auto i = 0; i < 10; ++i)
        d.push_back(std::make_unique<int>(i));
    CHECK(d.is_heap());
    CHECK(*d.back() == 9);
    CHECK(*d.pop_front() == 0);
}

#else // !TD_HAS_ALLOCATION

TEST("tiny_deque - inline only without allocation support")
{
    td::tiny_deque<int, 2> d;
    CHECK(d.try_push_back(1).has_value());
    CHECK(d.try_push_front(0).has_value());
    CHECK(d.try_push_back(2).error() == td::deque_error::capacity_exceeded);
    CHECK(d.is_inline());
    CHECK(contents(d) == std::vector<int>{0, 1});
}

#endif

TEST("tiny_deque - equality ignores storage")
{
    td::tiny_deque<int, 4> a;
    td::tiny_deque<int, 4> b;
    CHECK(a == b);

    a.push_back(1);
    a.push_back(2);
    b.push_front(2);
    b.push_front(1);
    CHECK(a == b);

#if TD_HAS_ALLOCATION
    b.reserve(16);
    CHECK(b.is_heap());
    CHECK(a == b);
#endif

    b.back() = 5;
    CHECK(a != b);
}

#if TD_ASSERT_ENABLED
TEST("tiny_deque - contract violations")
{
    td::tiny_deque<int, 2> d;
    CHECK(fires_assertion([&] { (void)d.pop_front(); }));
    CHECK(fires_assertion([&] { (void)d.pop_back(); }));
    CHECK(fires_assertion([&] { d.remove_back(); }));
    CHECK(fires_assertion([&] { (void)d.front(); }));
    CHECK(fires_assertion([&] { (void)d[0]; }));

    d.push_back(1);
    CHECK(fires_assertion([&] { (void)d[1]; }));
    CHECK(fires_assertion([&] { d.truncate(-1); }));
    CHECK(d.size() == 1);
}
#endif
