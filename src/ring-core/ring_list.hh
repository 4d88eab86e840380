#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/list_error.hh>
#include <ring-core/node_pool.hh>
#include <ring-core/optional.hh>
#include <ring-core/result.hh>
#include <ring-core/to_string.hh>
#include <ring-core/utility.hh>

#include <concepts>
#include <string>

/// One element of a ring_list, living in the list's node_pool.
/// next and prev may point to the node itself or to the sentinel.
template <class T>
struct rc::ring_node
{
    T value;
    node_handle next = node_handle::invalid;
    node_handle prev = node_handle::invalid;
};

/// Doubly-linked list closed into a ring by a sentinel node.
///
/// The sentinel is always present and holds T{}. Its next is the front element and its prev is the back element;
/// in an empty list both point back to the sentinel itself. add() inserts at the front, so elements appear
/// most-recently-added first:
///
///   list.add(1); list.add(2); list.add(3);
///   list.to_string() == "3 -> 2 -> 1 -> (sentinel)\n"
///
/// All nodes, the sentinel included, are owned by a node_pool and link to each other through node_handles.
/// The ring is therefore a plain cyclic graph inside one arena; no node owns another.
///
/// Invariants after every public operation (checked by is_ring_consistent()):
///   - next and prev are inverse: prev_of(next_of(n)) == n for every node n in the ring
///   - following next (or prev) from the sentinel returns to it after exactly size() + 1 steps
///   - the pool holds exactly size() + 1 live nodes
///
/// Every traversal is bounded by size(), so a malformed ring can never cause an endless loop.
///
/// Requirements on T: default-initializable (sentinel value), equality comparable (index_of), movable.
/// to_string() additionally needs rc::to_string(T) or an ADL-visible to_string(T).
///
/// Not thread-safe; wrap the whole list in a mutex when sharing it between threads.
template <class T>
struct rc::ring_list
{
    static_assert(std::default_initializable<T>, "the sentinel stores a default-constructed T");
    static_assert(std::equality_comparable<T>, "index_of compares elements with ==");
    static_assert(std::movable<T>, "elements are moved into and out of nodes");

    using node_t = ring_node<T>;

    // factories
public:
    /// Same as the default constructor, for call sites that read better with a named factory.
    [[nodiscard]] static ring_list create_empty() { return ring_list(); }

    // ctors/dtor
public:
    /// Empty list: size() == 0, sentinel linked to itself.
    ring_list()
    {
        // the sentinel cannot name itself before it exists, so link it in a second step
        _sentinel = _pool.allocate(T(), node_handle::invalid, node_handle::invalid);
        auto& s = _pool[_sentinel];
        s.next = _sentinel;
        s.prev = _sentinel;
    }

    /// rhs is left as a valid empty list with a fresh sentinel.
    ring_list(ring_list&& rhs) : ring_list() { swap(rhs); }

    /// rhs is left as a valid empty list; the previous content of *this is destroyed.
    ring_list& operator=(ring_list&& rhs)
    {
        if (this != &rhs)
        {
            ring_list taken(rc::move(rhs));
            swap(taken);
        }
        return *this;
    }

    ring_list(ring_list const&) = delete;
    ring_list& operator=(ring_list const&) = delete;

    // remaining nodes are destroyed by the pool
    ~ring_list() = default;

    // properties
public:
    [[nodiscard]] bool is_empty() const { return _size == 0; }

    /// number of elements, the sentinel not included
    [[nodiscard]] isize size() const { return _size; }

    // modification
public:
    /// Inserts value at the front (directly after the sentinel).
    /// O(1) amortized, may allocate a new slab.
    void add(T value)
    {
        auto const old_front = _pool[_sentinel].next;
        auto const h = _pool.allocate(rc::move(value), old_front, _sentinel);

        // old_front is the sentinel itself if the list was empty, which makes the new node the back as well
        _pool[old_front].prev = h;
        _pool[_sentinel].next = h;
        ++_size;
    }

    /// Removes the element at index (0 = front) and returns it.
    /// Fails without touching the list if it is empty or index is not in [0, size()).
    /// O(index).
    [[nodiscard]] result<T, list_error> remove_index(isize index)
    {
        if (_size == 0)
            return rc::error(list_error::empty_list);

        if (index < 0 || index >= _size)
            return rc::error(list_error::index_out_of_bounds);

        auto current = _pool[_sentinel].next;
        for (isize i = 0; i < _size; ++i)
        {
            if (current == _sentinel)
                break;

            if (i == index)
                return unlink_and_release(current);

            current = _pool[current].next;
        }

        // only reachable if the ring closes before size() elements
        RC_ASSERT(false, "ring is shorter than size(), the list is corrupted");
        return rc::error(list_error::not_found);
    }

    // search
public:
    /// Position of the first element equal to value, or nullopt.
    /// Compares at most size() elements.
    [[nodiscard]] optional<isize> index_of(T const& value) const
    {
        auto current = _pool[_sentinel].next;
        for (isize i = 0; i < _size; ++i)
        {
            if (_pool[current].value == value)
                return i;

            current = _pool[current].next;
        }

        return rc::nullopt;
    }

    // rendering
public:
    /// Front to back, each element followed by " -> ", then "(sentinel)\n".
    /// An empty list renders as "(sentinel)\n".
    [[nodiscard]] std::string to_string() const
        requires rc::stringable<T>
    {
        std::string s;
        auto current = _pool[_sentinel].next;
        for (isize i = 0; i < _size && current != _sentinel; ++i)
        {
            s += impl::to_string_adl(_pool[current].value);
            s += " -> ";
            current = _pool[current].next;
        }

        s += "(sentinel)\n";
        return s;
    }

    // ring inspection
    // read-only view on the node graph, used by tests and for debugging
public:
    [[nodiscard]] node_handle sentinel() const { return _sentinel; }
    [[nodiscard]] node_handle front_node() const { return _pool[_sentinel].next; }
    [[nodiscard]] node_handle back_node() const { return _pool[_sentinel].prev; }

    /// Precondition: h is a live node of this list
    [[nodiscard]] node_handle next_of(node_handle h) const { return _pool[h].next; }
    [[nodiscard]] node_handle prev_of(node_handle h) const { return _pool[h].prev; }
    [[nodiscard]] T const& value_of(node_handle h) const { return _pool[h].value; }

    /// always T{}
    [[nodiscard]] T const& sentinel_value() const { return _pool[_sentinel].value; }

    /// size() + 1 while the ring is intact
    [[nodiscard]] isize live_node_count() const { return _pool.live_count(); }

    /// Walks size() + 1 steps in both directions and verifies link symmetry, ring closure and node count.
    /// Returns false instead of asserting, so callers can probe a list they suspect is broken.
    [[nodiscard]] bool is_ring_consistent() const
    {
        if (!_pool.is_live(_sentinel))
            return false;

        if (_pool.live_count() != _size + 1)
            return false;

        return walk_is_consistent(&node_t::next, &node_t::prev) && walk_is_consistent(&node_t::prev, &node_t::next);
    }

    void swap(ring_list& rhs) noexcept
    {
        if (this == &rhs)
            return;

        auto pool = rc::move(_pool);
        _pool = rc::move(rhs._pool);
        rhs._pool = rc::move(pool);

        auto const sentinel = _sentinel;
        _sentinel = rhs._sentinel;
        rhs._sentinel = sentinel;

        auto const size = _size;
        _size = rhs._size;
        rhs._size = size;
    }

    // helper
private:
    /// Bypasses h in both directions, moves its value out and frees the node.
    T unlink_and_release(node_handle h)
    {
        RC_ASSERT(h != _sentinel, "the sentinel is never removed");

        auto& n = _pool[h];
        auto const prev = n.prev;
        auto const next = n.next;

        _pool[prev].next = next;
        _pool[next].prev = prev;

        T value = rc::move(n.value);
        _pool.free(h);
        --_size;

        return value;
    }

    /// link is followed, back_link must point back to where we came from
    bool walk_is_consistent(node_handle node_t::*link, node_handle node_t::*back_link) const
    {
        auto current = _sentinel;
        for (isize step = 1; step <= _size + 1; ++step)
        {
            auto const following = _pool[current].*link;
            if (!_pool.is_live(following))
                return false;

            if (_pool[following].*back_link != current)
                return false;

            // the sentinel may only be reached again on the last step
            if ((following == _sentinel) != (step == _size + 1))
                return false;

            current = following;
        }

        return current == _sentinel;
    }

    // members
private:
    node_pool<node_t> _pool;
    node_handle _sentinel = node_handle::invalid;
    isize _size = 0;
};

namespace rc
{
/// Same as list.to_string()
template <class T>
    requires stringable<T>
[[nodiscard]] std::string to_string(ring_list<T> const& list)
{
    return list.to_string();
}
} // namespace rc
