#pragma once

#include <ring-core/assert.hh>
#include <ring-core/bit.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <memory>
#include <vector>

/// Strong index naming one slot of a node_pool.
/// Encodes (slab_index * 64 + slot_index). Handles are plain values: copying one does not keep the node alive.
enum class rc::node_handle : rc::u32
{
    /// never returned by allocate, used for "not linked yet"
    invalid = ~rc::u32(0),
};

namespace rc
{
/// Number of slots per slab, one per bit of the u64 freemap
constexpr isize node_pool_slab_slots = 64;
static_assert(rc::has_single_bit(u64(node_pool_slab_slots)), "handle encoding uses shift and mask");

[[nodiscard]] constexpr isize node_handle_slab(node_handle h) { return isize(u32(h) >> 6); }
[[nodiscard]] constexpr isize node_handle_slot(node_handle h) { return isize(u32(h) & 63u); }
[[nodiscard]] constexpr node_handle node_handle_from(isize slab, isize slot)
{
    return node_handle(u32(slab * node_pool_slab_slots + slot));
}
} // namespace rc

/// Arena of NodeT objects addressed by node_handle.
///
/// Memory is organized in slabs of 64 slots. Each slab stores a u64 freemap with one bit per slot (1 = free).
/// Allocation takes the lowest free bit of the current slab; when that slab is full the other slabs are scanned
/// and only if all are full a new slab is appended. Freeing destroys the node and sets its bit again, so freed
/// slots are reused by the next allocation from that slab.
///
/// Slabs are heap-allocated individually and never move, so references to nodes stay valid until the node is freed.
/// Nodes refer to each other through handles, never through owning pointers:
/// a cyclic graph of nodes (like the ring of a ring_list) is owned by the pool as a whole and cannot leak.
///
/// Not thread-safe. Move-only.
template <class NodeT>
struct rc::node_pool
{
    // ctors/dtor
public:
    node_pool() = default;

    node_pool(node_pool&& rhs) noexcept
      : _slabs(rc::move(rhs._slabs)), _current_slab(rc::exchange(rhs._current_slab, 0)),
        _live_count(rc::exchange(rhs._live_count, 0))
    {
        rhs._slabs.clear();
    }
    node_pool& operator=(node_pool&& rhs) noexcept
    {
        if (this != &rhs)
        {
            destroy_all();
            _slabs = rc::move(rhs._slabs);
            _current_slab = rc::exchange(rhs._current_slab, 0);
            _live_count = rc::exchange(rhs._live_count, 0);
            rhs._slabs.clear();
        }
        return *this;
    }
    node_pool(node_pool const&) = delete;
    node_pool& operator=(node_pool const&) = delete;

    ~node_pool() { destroy_all(); }

    // allocation
public:
    /// Constructs a node from args in a free slot and returns its handle.
    /// If the constructor throws, the slot stays free.
    template <class... Args>
    [[nodiscard]] node_handle allocate(Args&&... args)
    {
        auto const slab_idx = find_slab_with_free_slot();
        auto& s = *_slabs[slab_idx];

        auto const slot_idx = rc::count_trailing_zeroes(s.freemap);
        auto const slot_bit = u64(1) << slot_idx;

        new (rc::placement_new, &s.slots[slot_idx].value) NodeT(rc::forward<Args>(args)...);
        s.freemap &= ~slot_bit;
        ++_live_count;

        return rc::node_handle_from(slab_idx, slot_idx);
    }

    /// Destroys the node and returns its slot to the slab.
    /// Precondition: is_live(h). Freeing twice is caught even in release builds.
    void free(node_handle h)
    {
        RC_ASSERT(h != node_handle::invalid, "cannot free the invalid node handle");
        RC_ASSERT(node_handle_slab(h) < isize(_slabs.size()), "node handle does not belong to this pool");

        auto const slab_idx = node_handle_slab(h);
        auto& s = *_slabs[slab_idx];
        auto const slot_bit = u64(1) << node_handle_slot(h);

        RC_ASSERT_ALWAYS((s.freemap & slot_bit) == 0, "node is already freed. double-free or corruption?");

        s.slots[node_handle_slot(h)].value.~NodeT();
        s.freemap |= slot_bit;
        --_live_count;

        // the next allocation should refill this hole before touching fresh slots
        _current_slab = slab_idx;
    }

    // access
public:
    /// True if h names a slot of this pool that currently holds a node.
    [[nodiscard]] bool is_live(node_handle h) const
    {
        if (h == node_handle::invalid || node_handle_slab(h) >= isize(_slabs.size()))
            return false;

        auto const& s = *_slabs[node_handle_slab(h)];
        return (s.freemap & (u64(1) << node_handle_slot(h))) == 0;
    }

    /// Precondition: is_live(h)
    [[nodiscard]] NodeT& get(node_handle h)
    {
        RC_ASSERT(is_live(h), "node handle refers to a freed or foreign slot");
        return _slabs[node_handle_slab(h)]->slots[node_handle_slot(h)].value;
    }
    [[nodiscard]] NodeT const& get(node_handle h) const
    {
        RC_ASSERT(is_live(h), "node handle refers to a freed or foreign slot");
        return _slabs[node_handle_slab(h)]->slots[node_handle_slot(h)].value;
    }

    [[nodiscard]] NodeT& operator[](node_handle h) { return get(h); }
    [[nodiscard]] NodeT const& operator[](node_handle h) const { return get(h); }

    // properties
public:
    /// number of nodes currently allocated
    [[nodiscard]] isize live_count() const { return _live_count; }

    /// number of slots across all slabs
    [[nodiscard]] isize capacity() const { return isize(_slabs.size()) * node_pool_slab_slots; }

    [[nodiscard]] isize slab_count() const { return isize(_slabs.size()); }

    /// number of free slots across all slabs, always capacity() - live_count()
    [[nodiscard]] isize free_count() const
    {
        isize count = 0;
        for (auto const& s : _slabs)
            count += rc::popcount(s->freemap);
        return count;
    }

    // helper
private:
    struct slab
    {
        u64 freemap = ~u64(0);
        rc::storage_for<NodeT> slots[node_pool_slab_slots];
    };

    isize find_slab_with_free_slot()
    {
        auto const slab_count = isize(_slabs.size());

        // happy path: the current slab still has room
        if (_current_slab < slab_count && _slabs[_current_slab]->freemap != 0) [[likely]]
            return _current_slab;

        // scan the other slabs for holes left by free()
        for (isize i = 0; i < slab_count; ++i)
        {
            if (_slabs[i]->freemap != 0)
            {
                _current_slab = i;
                return i;
            }
        }

        // all slabs are full
        RC_ASSERT(capacity() + node_pool_slab_slots <= isize(u32(node_handle::invalid)), "node_pool exhausted the handle space");
        _slabs.push_back(std::make_unique<slab>());
        _current_slab = slab_count;
        return slab_count;
    }

    void destroy_all()
    {
        for (auto& s : _slabs)
        {
            auto used = ~s->freemap;
            while (used != 0)
            {
                auto const slot_idx = rc::count_trailing_zeroes(used);
                s->slots[slot_idx].value.~NodeT();
                used &= used - 1;
            }
            s->freemap = ~u64(0);
        }
        _live_count = 0;
    }

    // members
private:
    std::vector<std::unique_ptr<slab>> _slabs;
    isize _current_slab = 0;
    isize _live_count = 0;
};
