#pragma once

/// @file indexed_list.hpp
/// @brief Array-backed singly linked list for linkvec_structures
///
/// IndexedList keeps its elements in one contiguous slot array and orders
/// them with next-links stored as slot indices. Vacated slots go onto a free
/// list and are reused by later insertions; the slot array never shrinks.
///
/// Complexity:
/// - push_front / push_back / pop_front: O(1) amortized
/// - remove(i), erase(i), operator[](i), at(i): O(i), one forward walk from head

#include "fwd.hpp"
#include <linkvec/core/error.hpp>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>
#include <cassert>
#include <stdexcept>
#include <iterator>
#include <ostream>
#include <type_traits>
#include <utility>

namespace linkvec_structures {

// =============================================================================
// LinkedSlot
// =============================================================================

/// One backing-array position: an element and the link to its successor
/// @tparam T Element type
///
/// Only IndexedList can empty or relink a slot. Callers reach the element
/// through value(), which keeps every slot on the live chain engaged.
template<typename T>
class LinkedSlot {
public:
    template<typename... Args>
    explicit LinkedSlot(std::optional<SlotIndex> next, std::in_place_t, Args&&... args)
        : m_item(std::in_place, std::forward<Args>(args)...)
        , m_next(next) {}

    /// Slot index of the logical successor (nullopt for the tail)
    [[nodiscard]] std::optional<SlotIndex> next() const noexcept { return m_next; }

    /// False only while the slot sits on the free list
    [[nodiscard]] bool has_value() const noexcept { return m_item.has_value(); }

    /// Element reference
    [[nodiscard]] T& value() { return *m_item; }
    [[nodiscard]] const T& value() const { return *m_item; }

private:
    friend class IndexedList<T>;

    std::optional<T> m_item;
    std::optional<SlotIndex> m_next;
};

// =============================================================================
// IndexedList
// =============================================================================

/// Singly linked list stored in a single growable slot array
/// @tparam T Element type
template<typename T>
class IndexedList {
public:
    using value_type = T;
    using size_type = std::size_t;
    using slot_type = LinkedSlot<T>;

private:
    std::vector<slot_type> m_slots;
    std::optional<SlotIndex> m_head;
    std::optional<SlotIndex> m_tail;
    std::vector<SlotIndex> m_free_list;
    size_type m_len = 0;

public:
    // =========================================================================
    // Constructors / Destructor
    // =========================================================================

    /// Create empty list
    IndexedList() = default;

    /// Create with room reserved for `capacity` slots
    explicit IndexedList(size_type capacity) {
        m_slots.reserve(capacity);
    }

    /// Named constructor for a pre-reserved list
    [[nodiscard]] static IndexedList with_capacity(size_type capacity) {
        return IndexedList(capacity);
    }

    ~IndexedList() = default;

    IndexedList(IndexedList&& other) noexcept
        : m_slots(std::move(other.m_slots))
        , m_head(std::exchange(other.m_head, std::nullopt))
        , m_tail(std::exchange(other.m_tail, std::nullopt))
        , m_free_list(std::move(other.m_free_list))
        , m_len(std::exchange(other.m_len, 0)) {
        other.m_slots.clear();
        other.m_free_list.clear();
    }

    IndexedList& operator=(IndexedList&& other) noexcept {
        if (this != &other) {
            m_slots = std::move(other.m_slots);
            m_head = std::exchange(other.m_head, std::nullopt);
            m_tail = std::exchange(other.m_tail, std::nullopt);
            m_free_list = std::move(other.m_free_list);
            m_len = std::exchange(other.m_len, 0);
            other.m_slots.clear();
            other.m_free_list.clear();
        }
        return *this;
    }

    // Disable copy (expensive and usually not intended)
    IndexedList(const IndexedList&) = delete;
    IndexedList& operator=(const IndexedList&) = delete;

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Number of live elements
    [[nodiscard]] size_type len() const noexcept {
        check_counts();
        return m_len;
    }

    /// Alias for len()
    [[nodiscard]] size_type size() const noexcept { return len(); }

    /// Check if empty
    [[nodiscard]] bool empty() const noexcept { return m_len == 0; }

    /// Alias for empty()
    [[nodiscard]] bool is_empty() const noexcept { return empty(); }

    /// Size of the slot array (live + free); never decreases
    [[nodiscard]] size_type true_len() const noexcept {
        check_counts();
        return m_slots.size();
    }

    /// Number of recycled slots waiting for reuse
    [[nodiscard]] size_type free_count() const noexcept { return m_free_list.size(); }

    /// Reserved slot-array capacity
    [[nodiscard]] size_type capacity() const noexcept { return m_slots.capacity(); }

    /// Reserve room for `additional` more slots
    void reserve(size_type additional) {
        m_slots.reserve(m_slots.size() + additional);
    }

    // =========================================================================
    // Memory Accounting
    // =========================================================================

    /// Heap bytes in use by every slot (live or free) plus the free list
    [[nodiscard]] size_type mem_used() const noexcept {
        return (sizeof(T) + sizeof(SlotIndex)) * m_slots.size()
            + sizeof(SlotIndex) * m_free_list.size();
    }

    /// Heap bytes reserved, counting the headroom of both arrays
    [[nodiscard]] size_type true_mem_used() const noexcept {
        return (sizeof(T) + sizeof(SlotIndex)) * m_slots.capacity()
            + sizeof(SlotIndex) * m_free_list.capacity();
    }

    // =========================================================================
    // Insertion
    // =========================================================================

    /// Insert at the front
    void push_front(T value) {
        emplace_front(std::move(value));
    }

    /// Insert at the back
    void push_back(T value) {
        emplace_back(std::move(value));
    }

    /// Construct an element in place at the front
    template<typename... Args>
    T& emplace_front(Args&&... args) {
        SlotIndex idx = alloc(m_head, std::forward<Args>(args)...);

        m_head = idx;
        if (!m_tail) {
            m_tail = idx;
        }
        ++m_len;

        check_counts();
        return *m_slots[idx].m_item;
    }

    /// Construct an element in place at the back
    template<typename... Args>
    T& emplace_back(Args&&... args) {
        SlotIndex idx = alloc(std::nullopt, std::forward<Args>(args)...);

        if (m_tail) {
            m_slots[*m_tail].m_next = idx;
        } else {
            m_head = idx;
        }
        m_tail = idx;
        ++m_len;

        check_counts();
        return *m_slots[idx].m_item;
    }

    // =========================================================================
    // Removal
    // =========================================================================

    /// Remove and return the head element
    /// @return nullopt if the list is empty
    std::optional<T> pop_front() {
        if (!m_head) {
            return std::nullopt;
        }
        return take(unlink(0));
    }

    /// Remove and return the element at logical position `index`
    /// @throws std::out_of_range if index >= len()
    T remove(size_type index) {
        return take(unlink(index));
    }

    /// Destroy the element at logical position `index` in place
    /// @throws std::out_of_range if index >= len()
    void erase(size_type index) {
        m_slots[unlink(index)].m_item.reset();
    }

    /// Remove the element at logical position `index` without throwing
    /// @return The removed element, or a ListError if index >= len()
    linkvec_core::Result<T> try_remove(size_type index) {
        if (index >= m_len) {
            return linkvec_core::Err<T>(linkvec_core::ListError::out_of_bounds(index, m_len));
        }
        return linkvec_core::Ok(remove(index));
    }

    /// Destroy every element; all slots move to the free list
    void clear() {
        m_free_list.reserve(m_slots.size());
        m_free_list.clear();
        for (SlotIndex i = 0; i < m_slots.size(); ++i) {
            m_slots[i].m_item.reset();
            m_free_list.push_back(i);
        }
        m_head.reset();
        m_tail.reset();
        m_len = 0;

        check_counts();
    }

    // =========================================================================
    // Access
    // =========================================================================

    /// Head slot, or nullptr if empty
    [[nodiscard]] slot_type* head() noexcept {
        return m_head ? &m_slots[*m_head] : nullptr;
    }

    [[nodiscard]] const slot_type* head() const noexcept {
        return m_head ? &m_slots[*m_head] : nullptr;
    }

    /// Tail slot, or nullptr if empty
    [[nodiscard]] slot_type* tail() noexcept {
        return m_tail ? &m_slots[*m_tail] : nullptr;
    }

    [[nodiscard]] const slot_type* tail() const noexcept {
        return m_tail ? &m_slots[*m_tail] : nullptr;
    }

    /// Slot at logical position `index`
    /// @throws std::out_of_range if index >= len()
    [[nodiscard]] slot_type& at(size_type index) {
        return m_slots[physical_index_of(index)];
    }

    [[nodiscard]] const slot_type& at(size_type index) const {
        return m_slots[physical_index_of(index)];
    }

    /// Index operator (throws on out of bounds, same as at())
    [[nodiscard]] slot_type& operator[](size_type index) {
        return at(index);
    }

    [[nodiscard]] const slot_type& operator[](size_type index) const {
        return at(index);
    }

    /// Element at logical position `index`
    /// @return Pointer to element or nullptr if out of bounds
    [[nodiscard]] T* get(size_type index) {
        if (index >= m_len) {
            return nullptr;
        }
        return &m_slots[physical_index_of(index)].value();
    }

    [[nodiscard]] const T* get(size_type index) const {
        if (index >= m_len) {
            return nullptr;
        }
        return &m_slots[physical_index_of(index)].value();
    }

    // =========================================================================
    // Validation
    // =========================================================================

    /// Walk the whole structure and check its invariants
    /// @return Ok, or the first ListError found
    [[nodiscard]] linkvec_core::Result<void> validate() const {
        using linkvec_core::Err;
        using linkvec_core::ListError;

        if (m_slots.size() != m_len + m_free_list.size()) {
            return Err(ListError::count_mismatch(m_slots.size(), m_len, m_free_list.size()));
        }
        if (m_head.has_value() != m_tail.has_value()) {
            return Err(ListError::endpoint_mismatch("only one of head/tail is set", m_len));
        }
        if (m_head.has_value() != (m_len != 0)) {
            return Err(ListError::endpoint_mismatch("head presence disagrees with len", m_len));
        }

        enum : std::uint8_t { Unseen = 0, Live = 1, Free = 2 };
        std::vector<std::uint8_t> state(m_slots.size(), Unseen);

        for (SlotIndex idx : m_free_list) {
            if (idx >= m_slots.size() || state[idx] != Unseen) {
                return Err(ListError::slot_aliased(idx, m_len));
            }
            state[idx] = Free;
        }

        std::optional<SlotIndex> current = m_head;
        size_type position = 0;
        while (current && position < m_len) {
            SlotIndex idx = *current;
            if (idx >= m_slots.size() || !m_slots[idx].m_item) {
                return Err(ListError::broken_chain(position, m_len));
            }
            if (state[idx] == Live) {
                return Err(ListError::cycle(idx, m_len));
            }
            if (state[idx] == Free) {
                return Err(ListError::slot_aliased(idx, m_len));
            }
            state[idx] = Live;
            ++position;

            if (position == m_len) {
                if (current != m_tail) {
                    return Err(ListError::endpoint_mismatch("chain does not end at tail", m_len));
                }
                if (m_slots[idx].m_next) {
                    return Err(ListError::endpoint_mismatch("tail has a successor", m_len));
                }
            }
            current = m_slots[idx].m_next;
        }

        if (position != m_len) {
            return Err(ListError::broken_chain(position, m_len));
        }
        return linkvec_core::Ok();
    }

    // =========================================================================
    // Iterators
    // =========================================================================

    /// Forward iterator over elements in logical order
    template<bool IsConst>
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = T;
        using pointer = std::conditional_t<IsConst, const T*, T*>;
        using reference = std::conditional_t<IsConst, const T&, T&>;
        using slot_vec = std::conditional_t<IsConst, const std::vector<slot_type>, std::vector<slot_type>>;

    private:
        slot_vec* m_slots = nullptr;
        std::optional<SlotIndex> m_current;

    public:
        Iterator() = default;

        Iterator(slot_vec* slots, std::optional<SlotIndex> start)
            : m_slots(slots), m_current(start) {}

        reference operator*() const { return (*m_slots)[*m_current].value(); }

        pointer operator->() const { return &**this; }

        Iterator& operator++() {
            m_current = (*m_slots)[*m_current].next();
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        /// Physical slot index of the current element
        [[nodiscard]] std::optional<SlotIndex> slot_index() const noexcept { return m_current; }

        bool operator==(const Iterator& other) const {
            return m_current == other.m_current;
        }

        bool operator!=(const Iterator& other) const {
            return !(*this == other);
        }
    };

    using iterator = Iterator<false>;
    using const_iterator = Iterator<true>;

    iterator begin() { return iterator(&m_slots, m_head); }
    iterator end() { return iterator(&m_slots, std::nullopt); }
    const_iterator begin() const { return const_iterator(&m_slots, m_head); }
    const_iterator end() const { return const_iterator(&m_slots, std::nullopt); }
    const_iterator cbegin() const { return begin(); }
    const_iterator cend() const { return end(); }

private:
    /// Place a new element in a recycled slot if one exists, else append
    template<typename... Args>
    SlotIndex alloc(std::optional<SlotIndex> next, Args&&... args) {
        if (!m_free_list.empty()) {
            SlotIndex idx = m_free_list.back();
            slot_type& slot = m_slots[idx];
            slot.m_item.emplace(std::forward<Args>(args)...);
            slot.m_next = next;
            m_free_list.pop_back();
            return idx;
        }

        m_slots.emplace_back(next, std::in_place, std::forward<Args>(args)...);
        return m_slots.size() - 1;
    }

    /// Move the element out of a slot, leaving it empty
    T take(SlotIndex idx) {
        T value = std::move(*m_slots[idx].m_item);
        m_slots[idx].m_item.reset();
        return value;
    }

    /// Detach logical position `index` from the chain and free-list its slot
    /// @return Physical index of the detached slot, element still engaged
    /// @throws std::out_of_range if index >= len()
    SlotIndex unlink(size_type index) {
        if (index >= m_len) {
            throw std::out_of_range(linkvec_core::ListError::out_of_bounds(index, m_len).message);
        }

        std::optional<SlotIndex> prev;
        SlotIndex target = *m_head;
        if (index > 0) {
            prev = physical_index_of(index - 1);
            std::optional<SlotIndex> next = m_slots[*prev].m_next;
            if (!next) {
                throw std::out_of_range(linkvec_core::ListError::broken_chain(index, m_len).message);
            }
            target = *next;
        }

        // Grow the free list before touching any link
        m_free_list.push_back(target);

        if (prev) {
            m_slots[*prev].m_next = m_slots[target].m_next;
            if (m_tail == target) {
                m_tail = prev;
            }
        } else {
            m_head = m_slots[target].m_next;
            if (!m_head) {
                m_tail.reset();
            }
        }
        --m_len;

        check_counts();
        return target;
    }

    /// Slot index of logical position `index`
    /// @throws std::out_of_range if index >= len() or the chain ends early
    SlotIndex physical_index_of(size_type index) const {
        if (index >= m_len || !m_head) {
            throw std::out_of_range(linkvec_core::ListError::out_of_bounds(index, m_len).message);
        }

        SlotIndex current = *m_head;
        for (size_type i = 0; i < index; ++i) {
            std::optional<SlotIndex> next = m_slots[current].m_next;
            if (!next) {
                throw std::out_of_range(linkvec_core::ListError::broken_chain(i + 1, m_len).message);
            }
            current = *next;
        }
        return current;
    }

    void check_counts() const noexcept {
        assert(m_slots.size() == m_len + m_free_list.size() && "IndexedList: slot count mismatch");
        assert(m_head.has_value() == m_tail.has_value() && "IndexedList: head/tail mismatch");
        assert(m_head.has_value() == (m_len != 0) && "IndexedList: head/len mismatch");
    }
};

// =============================================================================
// Formatting
// =============================================================================

/// Write every element followed by a space, in logical order
template<typename T>
std::ostream& operator<<(std::ostream& os, const IndexedList<T>& list) {
    for (const T& value : list) {
        os << value << ' ';
    }
    return os;
}

} // namespace linkvec_structures
