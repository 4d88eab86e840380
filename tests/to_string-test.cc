#include <ring-core/to_string.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace
{
struct labeled
{
    int id = 0;
};

std::string to_string(labeled const& l)
{
    return "#" + std::to_string(l.id);
}

struct opaque
{
};
} // namespace

static_assert(rc::stringable<int>);
static_assert(rc::stringable<double>);
static_assert(rc::stringable<std::string>);
static_assert(rc::stringable<char const*>);
static_assert(rc::stringable<labeled>);
static_assert(!rc::stringable<opaque>);

TEST("to_string - primitives")
{
    SECTION("bool")
    {
        CHECK(rc::to_string(true) == "true");
        CHECK(rc::to_string(false) == "false");
    }

    SECTION("char")
    {
        CHECK(rc::to_string('a') == "a");
        CHECK(rc::to_string(' ') == " ");
    }

    SECTION("byte")
    {
        CHECK(rc::to_string(std::byte{0}) == "0x00");
        CHECK(rc::to_string(std::byte{0xAB}) == "0xAB");
        CHECK(rc::to_string(std::byte{0xFF}) == "0xFF");
    }

    SECTION("small integers are numbers, not characters")
    {
        CHECK(rc::to_string(static_cast<signed char>(-5)) == "-5");
        CHECK(rc::to_string(static_cast<unsigned char>(65)) == "65");
        CHECK(rc::to_string(rc::i8(-128)) == "-128");
        CHECK(rc::to_string(rc::u8(255)) == "255");
    }

    SECTION("integers")
    {
        CHECK(rc::to_string(0) == "0");
        CHECK(rc::to_string(-42) == "-42");
        CHECK(rc::to_string(42u) == "42");
        CHECK(rc::to_string(short(-7)) == "-7");
        CHECK(rc::to_string(rc::u16(65535)) == "65535");
        CHECK(rc::to_string(-123456789l) == "-123456789");
        CHECK(rc::to_string(rc::isize(-1)) == "-1");
        CHECK(rc::to_string(rc::u64(18446744073709551615ull)) == "18446744073709551615");
        CHECK(rc::to_string(std::numeric_limits<rc::i64>::min()) == "-9223372036854775808");
    }

    SECTION("floating point")
    {
        CHECK(rc::to_string(1.5) == "1.5");
        CHECK(rc::to_string(0.25f) == "0.25");
        CHECK(rc::to_string(-2.0) == "-2");
        CHECK(rc::to_string(0.1) == "0.1");
    }

    SECTION("pointers")
    {
        CHECK(rc::to_string(static_cast<void const*>(nullptr)) == "0x0");

        int x = 0;
        auto const s = rc::to_string(static_cast<void const*>(&x));
        CHECK(s.starts_with("0x"));
        CHECK(s.size() > 2);
    }
}

TEST("to_string - strings")
{
    CHECK(rc::to_string("ring") == "ring");
    CHECK(rc::to_string(static_cast<char const*>(nullptr)) == "(null)");
    CHECK(rc::to_string(std::string("core")) == "core");
    CHECK(rc::to_string(std::string_view("view")) == "view");
    CHECK(rc::to_string(std::string()).empty());
}

TEST("to_string - user types via ADL")
{
    CHECK(rc::impl::to_string_adl(labeled{7}) == "#7");

    // built-in types still go to the rc overloads
    CHECK(rc::impl::to_string_adl(3) == "3");
    CHECK(rc::impl::to_string_adl(std::string("s")) == "s");
}
