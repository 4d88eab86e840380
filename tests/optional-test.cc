#include <ring-core/assert-handler.hh>
#include <ring-core/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// optional of trivial types stays trivial
static_assert(std::is_constructible_v<rc::optional<rc::isize>>);
static_assert(std::is_constructible_v<rc::optional<rc::isize>, rc::isize>);
static_assert(std::is_constructible_v<rc::optional<rc::isize>, rc::nullopt_t>);
static_assert(std::is_trivially_copyable_v<rc::optional<rc::isize>>);
static_assert(std::is_trivially_destructible_v<rc::optional<rc::isize>>);
static_assert(!std::is_trivially_destructible_v<rc::optional<std::string>>);
static_assert(!std::is_copy_constructible_v<rc::optional<std::unique_ptr<int>>>);

// no implicit bool conversion and no comparison with bool
static_assert(!std::is_convertible_v<rc::optional<int>, bool>);

namespace
{
// counts live instances and moves
struct counted
{
    static inline int alive = 0;
    static inline int moves = 0;

    int value = 0;

    static void reset_counters()
    {
        alive = 0;
        moves = 0;
    }

    explicit counted(int v) : value(v) { ++alive; }
    counted(counted const& rhs) : value(rhs.value) { ++alive; }
    counted(counted&& rhs) noexcept : value(rhs.value)
    {
        ++alive;
        ++moves;
    }
    counted& operator=(counted const&) = default;
    counted& operator=(counted&& rhs) noexcept
    {
        value = rhs.value;
        ++moves;
        return *this;
    }
    ~counted() { --alive; }

    friend bool operator==(counted const&, counted const&) = default;
};
} // namespace

TEST("optional - positions")
{
    SECTION("default is empty")
    {
        auto const opt = rc::optional<rc::isize>{};
        CHECK(!opt.has_value());
        CHECK(opt == rc::nullopt);
    }

    SECTION("nullopt is empty")
    {
        auto const opt = rc::optional<rc::isize>{rc::nullopt};
        CHECK(!opt.has_value());
    }

    SECTION("engaged")
    {
        auto const opt = rc::optional<rc::isize>{3};
        CHECK(opt.has_value());
        CHECK(opt.value() == 3);
        CHECK(!(opt == rc::nullopt));
    }

    SECTION("zero is a value, not emptiness")
    {
        auto const opt = rc::optional<rc::isize>{0};
        CHECK(opt.has_value());
        CHECK(opt.value() == 0);
    }

    SECTION("copies are independent")
    {
        auto a = rc::optional<rc::isize>{7};
        auto b = a;
        b = rc::nullopt;
        CHECK(a.has_value());
        CHECK(!b.has_value());
    }

    SECTION("value_or")
    {
        CHECK(rc::optional<rc::isize>{5}.value_or(-1) == 5);
        CHECK(rc::optional<rc::isize>{}.value_or(-1) == -1);
    }

    SECTION("reset")
    {
        auto opt = rc::optional<rc::isize>{1};
        opt.reset();
        CHECK(!opt.has_value());
        opt.reset();
        CHECK(!opt.has_value());
    }
}

TEST("optional - equality")
{
    using opt_t = rc::optional<rc::isize>;

    CHECK(opt_t{} == opt_t{});
    CHECK(opt_t{1} == opt_t{1});
    CHECK(!(opt_t{1} == opt_t{2}));
    CHECK(!(opt_t{1} == opt_t{}));
    CHECK(!(opt_t{} == opt_t{1}));

    SECTION("against a plain value")
    {
        CHECK(opt_t{4} == rc::isize(4));
        CHECK(!(opt_t{4} == rc::isize(5)));
        CHECK(!(opt_t{} == rc::isize(0)));
    }

    SECTION("strings")
    {
        auto const a = rc::optional<std::string>{"ring"};
        auto const b = rc::optional<std::string>{std::string("ring")};
        CHECK(a == b);
        CHECK(a.value() == "ring");
    }
}

TEST("optional - non-trivial values")
{
    counted::reset_counters();

    SECTION("destruction")
    {
        {
            auto const opt = rc::optional<counted>{counted{1}};
            CHECK(counted::alive == 1);
        }
        CHECK(counted::alive == 0);
    }

    SECTION("move construction empties the source")
    {
        {
            auto a = rc::optional<counted>{counted{1}};
            auto const b = rc::move(a);
            CHECK(!a.has_value());
            CHECK(b.value().value == 1);
            CHECK(counted::alive == 1);
        }
        CHECK(counted::alive == 0);
    }

    SECTION("move assignment empties the source")
    {
        {
            auto a = rc::optional<counted>{counted{1}};
            auto b = rc::optional<counted>{counted{2}};
            b = rc::move(a);
            CHECK(!a.has_value());
            CHECK(b.value().value == 1);
            CHECK(counted::alive == 1);
        }
        CHECK(counted::alive == 0);
    }

    SECTION("copy assignment")
    {
        {
            auto const a = rc::optional<counted>{counted{1}};
            auto b = rc::optional<counted>{};
            b = a;
            CHECK(a.has_value());
            CHECK(b == a);
            CHECK(counted::alive == 2);

            b = rc::optional<counted>{};
            CHECK(!b.has_value());
            CHECK(counted::alive == 1);
        }
        CHECK(counted::alive == 0);
    }

    SECTION("value() forwards the value category")
    {
        auto opt = rc::optional<counted>{counted{5}};
        counted::moves = 0;

        auto taken = rc::move(opt).value();
        CHECK(taken.value == 5);
        CHECK(counted::moves == 1);

        static_assert(std::is_same_v<decltype(opt.value()), counted&>);
        static_assert(std::is_same_v<decltype(rc::move(opt).value()), counted&&>);
        static_assert(std::is_same_v<decltype(static_cast<rc::optional<counted> const&>(opt).value()), counted const&>);
    }
}

TEST("optional - move-only values")
{
    auto a = rc::optional<std::unique_ptr<int>>{std::make_unique<int>(3)};
    CHECK(*a.value() == 3);

    auto b = rc::move(a);
    CHECK(!a.has_value());
    CHECK(*b.value() == 3);

    auto p = rc::move(b).value();
    CHECK(*p == 3);
}

#if RC_ASSERT_ENABLED
TEST("optional - empty access asserts")
{
    auto const opt = rc::optional<rc::isize>{};

    bool asserted = false;
    {
        auto handler = rc::impl::scoped_assertion_handler(
            [&](rc::impl::assertion_info const& info)
            {
                asserted = true;
                CHECK(info.message == "attempted to access value of empty optional");
                throw 0; // Must throw to prevent abort
            });
        try
        {
            (void)opt.value();
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    CHECK(asserted);
}
#endif
