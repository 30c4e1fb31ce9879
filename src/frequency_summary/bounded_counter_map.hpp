#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

// Fixed-capacity key -> counter map. All slots are allocated at construction and the slot
// array never grows, so memory stays O(capacity) no matter how long the stream is.
template <typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
class BoundedCounterMap
{
public:
    struct Slot
    {
        std::optional<T> key;
        uint64_t count = 0;

        bool is_occupied() const { return key.has_value(); }
    };

    explicit BoundedCounterMap(uint32_t capacity) : m_slots(capacity)
    {
        m_index.reserve(capacity);
        m_free.reserve(capacity);
        // Hand out low slot ids first.
        for (uint32_t i = capacity; i > 0; --i) { m_free.push_back(i - 1); }
    }

    Slot *find(const T &key)
    {
        auto it = m_index.find(key);
        return it == m_index.end() ? nullptr : &m_slots[it->second];
    }

    const Slot *find(const T &key) const
    {
        auto it = m_index.find(key);
        return it == m_index.end() ? nullptr : &m_slots[it->second];
    }

    Slot &insert(const T &key, uint64_t count)
    {
        if (full()) throw std::length_error("BoundedCounterMap is full.");
        if (m_index.count(key)) throw std::invalid_argument("Key already owns a slot.");

        uint32_t id = m_free.back();
        m_free.pop_back();
        m_slots[id].key.emplace(key);
        m_slots[id].count = count;
        m_index.emplace(key, id);
        return m_slots[id];
    }

    void erase(Slot &slot)
    {
        uint32_t id = _slot_id(slot);
        if (!slot.is_occupied()) throw std::invalid_argument("Cannot erase an empty slot.");

        m_index.erase(*slot.key);
        slot.key.reset();
        slot.count = 0;
        m_free.push_back(id);
    }

    // Subtracts one from every positive counter, returns how many reached zero.
    // on_zero is called for those slots in slot order.
    uint32_t decrement_all(const std::function<void(Slot &slot)> &on_zero = nullptr)
    {
        uint32_t zeroed = 0;
        for (auto &slot : m_slots)
        {
            if (!slot.is_occupied() || slot.count == 0) continue;
            if (--slot.count == 0)
            {
                zeroed++;
                if (on_zero) on_zero(slot);
            }
        }
        return zeroed;
    }

    uint32_t erase_zero_slots()
    {
        uint32_t erased = 0;
        for (auto &slot : m_slots)
        {
            if (slot.is_occupied() && slot.count == 0)
            {
                erase(slot);
                erased++;
            }
        }
        return erased;
    }

    void for_each(const std::function<void(const T &key, uint64_t count)> &func) const
    {
        for (const auto &slot : m_slots)
        {
            if (slot.is_occupied()) func(*slot.key, slot.count);
        }
    }

    void clear()
    {
        for (auto &slot : m_slots)
        {
            if (slot.is_occupied()) erase(slot);
        }
    }

    uint32_t size() const { return static_cast<uint32_t>(m_index.size()); }
    uint32_t capacity() const { return static_cast<uint32_t>(m_slots.size()); }
    bool full() const { return m_free.empty(); }
    bool empty() const { return m_index.empty(); }

    // Slot arena plus the key index, assuming the index never exceeds capacity entries.
    uint64_t get_max_memory_usage() const
    {
        uint64_t slot_memory = m_slots.size() * sizeof(Slot);
        uint64_t index_memory = m_slots.size() * (sizeof(T) + sizeof(uint32_t) + sizeof(void *));
        uint64_t free_list_memory = m_slots.size() * sizeof(uint32_t);
        return slot_memory + index_memory + free_list_memory;
    }

private:
    uint32_t _slot_id(const Slot &slot) const
    {
        if (&slot < m_slots.data() || &slot >= m_slots.data() + m_slots.size()) { throw std::invalid_argument("Slot does not belong to this map."); }
        return static_cast<uint32_t>(&slot - m_slots.data());
    }

    std::vector<Slot> m_slots;
    std::unordered_map<T, uint32_t, Hash, KeyEqual> m_index;
    std::vector<uint32_t> m_free;
};
