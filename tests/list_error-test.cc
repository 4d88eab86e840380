#include <ring-core/list_error.hh>
#include <ring-core/ring_list.hh>

#include <nexus/test.hh>

#include <string>

static_assert(sizeof(rc::list_error) == 1);

TEST("list_error - messages")
{
    CHECK(rc::to_string(rc::list_error::empty_list) == "the list is empty, nothing was done");
    CHECK(rc::to_string(rc::list_error::index_out_of_bounds) == "index out of bounds");
    CHECK(rc::to_string(rc::list_error::not_found) == "the index could not be found, nothing was done");

    // not an enumerator
    CHECK(rc::to_string(static_cast<rc::list_error>(200)) == "<invalid rc::list_error>");
}

TEST("list_error - reported by ring_list")
{
    auto list = rc::ring_list<int>{};

    auto const empty = list.remove_index(0);
    REQUIRE(empty.has_error());
    CHECK(rc::to_string(empty.error()) == "the list is empty, nothing was done");

    list.add(1);
    auto const oob = list.remove_index(1);
    REQUIRE(oob.has_error());
    CHECK(rc::to_string(oob.error()) == "index out of bounds");

    // errors leave the list untouched
    CHECK(list.size() == 1);
    CHECK(list.to_string() == "1 -> (sentinel)\n");
}
