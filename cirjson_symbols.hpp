#ifndef CIRJSON_SYMBOLS_H
#define CIRJSON_SYMBOLS_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cirjson_error.hpp"

namespace cirjson
{

// Immutable property name shared by every parser of a canonicalizer lineage.
// Two names of one lineage with the same bytes are the same object.
class canonical_name final
{
private:

    std::string m_text;

public:

    explicit canonical_name(std::string text) noexcept
    : m_text(std::move(text))
    {
    }

    std::string_view text() const noexcept
    {
        return m_text;
    }

    std::size_t size() const noexcept
    {
        return m_text.size();
    }
}; // class canonical_name

using name_ref = std::shared_ptr<const canonical_name>;

// Bytes are packed most significant first. A partial last quad is padded
// with 0xFF bytes, which never occur in UTF-8.
inline std::uint32_t pad_last_quad(
    const std::uint32_t quad,
    const std::size_t bytes) noexcept
{
    return (bytes == 4) ? quad : (quad | (0xFFFFFFFFu << (bytes << 3)));
}

// Quad encoding of a whole name; the empty name is a single padding quad
inline std::vector<std::uint32_t> name_quads(const std::string_view text)
{
    std::vector<std::uint32_t> quads;
    quads.reserve((text.size() >> 2) + 1);

    std::uint32_t quad = 0;
    std::size_t bytes = 0;
    for (const char c : text)
    {
        quad = (quad << 8) | static_cast<std::uint8_t>(c);
        if (++bytes == 4)
        {
            quads.push_back(quad);
            quad = 0;
            bytes = 0;
        }
    }
    if (bytes > 0 || quads.empty())
    {
        quads.push_back(pad_last_quad(quad, bytes));
    }

    return quads;
}

namespace detail
{

// Open addressed hash area of 4-word slots. For a table of N primary slots
// the area holds N primary slots, N/2 secondary slots, N/4 tertiary slots
// (in buckets) and N/4 spill-over slots, followed by the long name area.
// A slot is {q1, q2, q3, length} or, for names of more than three quads,
// {hash, offset in the long name area, 0, length}. Length 0 means empty.
struct quad_table
{
    static constexpr std::size_t MIN_HASH_SIZE = 16;
    static constexpr std::size_t MAX_HASH_SIZE = 0x10000;

    static constexpr std::size_t NO_SLOT =
        std::numeric_limits<std::size_t>::max();

    // Collisions only count as an attack on tables bigger than this
    static constexpr std::size_t MIN_SIZE_FOR_OVERFLOW_CHECK = 1024;

    static constexpr std::uint32_t MULT = 33;
    static constexpr std::uint32_t MULT2 = 65599;
    static constexpr std::uint32_t MULT3 = 31;

    std::uint32_t seed = 0;
    std::size_t hash_size = 0;
    std::size_t count = 0;
    std::size_t tertiary_shift = 0;
    std::size_t spillover_end = 0;
    std::size_t long_name_offset = 0;
    bool need_rehash = false;
    // Set once the table would have to grow past MAX_HASH_SIZE; a full table
    // keeps its entries but takes no new ones
    bool full = false;
    std::vector<std::uint32_t> hash_area;
    std::vector<name_ref> names;

    static std::size_t calc_tertiary_shift(const std::size_t primary_slots)
    {
        const std::size_t tertiary_slots = primary_slots >> 2;

        if (tertiary_slots < 64)
        {
            return 4;
        }
        if (tertiary_slots <= 256)
        {
            return 5;
        }
        if (tertiary_slots <= 1024)
        {
            return 6;
        }
        return 7;
    }

    static quad_table create(std::size_t size, const std::uint32_t seed)
    {
        if (size < MIN_HASH_SIZE)
        {
            size = MIN_HASH_SIZE;
        }
        else if ((size & (size - 1)) != 0)
        {
            std::size_t curr = MIN_HASH_SIZE;
            while (curr < size)
            {
                curr += curr;
            }
            size = curr;
        }

        quad_table result;
        result.seed = seed;
        result.hash_size = size;
        result.tertiary_shift = calc_tertiary_shift(size);
        result.hash_area.assign(size << 3, 0);
        result.names.assign(size << 1, nullptr);
        result.spillover_end = result.spillover_start();
        result.long_name_offset = size << 3;
        return result;
    }

    std::size_t secondary_start() const noexcept
    {
        return hash_size << 2;
    }

    std::size_t tertiary_start() const noexcept
    {
        return secondary_start() + (secondary_start() >> 1);
    }

    std::size_t spillover_start() const noexcept
    {
        return (hash_size << 3) - hash_size;
    }

    std::size_t spillover_count() const noexcept
    {
        return (spillover_end - spillover_start()) >> 2;
    }

    std::size_t primary_offset(const std::uint32_t hash) const noexcept
    {
        return static_cast<std::size_t>(hash & (hash_size - 1)) << 2;
    }

    std::size_t secondary_offset(const std::size_t primary) const noexcept
    {
        return secondary_start() + ((primary >> 3) << 2);
    }

    std::size_t tertiary_offset(const std::size_t primary) const noexcept
    {
        return tertiary_start()
            + ((primary >> (tertiary_shift + 2)) << tertiary_shift);
    }

    std::uint32_t calc_hash(const std::uint32_t q1) const noexcept
    {
        std::uint32_t hash = q1 ^ seed;
        hash += (hash >> 16);
        hash ^= (hash << 3);
        hash += (hash >> 12);
        return hash;
    }

    std::uint32_t calc_hash(
        const std::uint32_t q1,
        const std::uint32_t q2) const noexcept
    {
        std::uint32_t hash = q1;
        hash += (hash >> 15);
        hash ^= (hash >> 9);
        hash += (q2 * MULT);
        hash ^= seed;
        hash += (hash >> 16);
        hash ^= (hash >> 4);
        hash += (hash << 3);
        return hash;
    }

    std::uint32_t calc_hash(
        const std::uint32_t q1,
        const std::uint32_t q2,
        const std::uint32_t q3) const noexcept
    {
        std::uint32_t hash = q1 ^ seed;
        hash += (hash >> 9);
        hash *= MULT3;
        hash += q2;
        hash *= MULT;
        hash += (hash >> 15);
        hash ^= q3;
        hash += (hash >> 4);
        hash += (hash >> 15);
        hash ^= (hash << 9);
        return hash;
    }

    std::uint32_t calc_hash(
        const std::uint32_t* const quads,
        const std::size_t qlen) const noexcept
    {
        switch (qlen)
        {
        case 1:
            return calc_hash(quads[0]);
        case 2:
            return calc_hash(quads[0], quads[1]);
        case 3:
            return calc_hash(quads[0], quads[1], quads[2]);
        default:
            break;
        }

        std::uint32_t hash = quads[0] ^ seed;
        hash += (hash >> 9);
        hash += quads[1];
        hash += (hash >> 15);
        hash *= MULT;
        hash ^= quads[2];
        hash += (hash >> 4);

        for (std::size_t i = 3; i < qlen; ++i)
        {
            std::uint32_t next = quads[i];
            next = next ^ (next >> 21);
            hash += next;
        }
        hash *= MULT2;

        hash += (hash >> 19);
        hash ^= (hash << 5);
        return hash;
    }

    bool slot_matches(
        const std::size_t offset,
        const std::uint32_t hash,
        const std::uint32_t* const quads,
        const std::size_t qlen) const noexcept
    {
        if (hash_area[offset + 3] != qlen)
        {
            return false;
        }

        switch (qlen)
        {
        case 1:
            return hash_area[offset] == quads[0];
        case 2:
            return hash_area[offset] == quads[0]
                && hash_area[offset + 1] == quads[1];
        case 3:
            return hash_area[offset] == quads[0]
                && hash_area[offset + 1] == quads[1]
                && hash_area[offset + 2] == quads[2];
        default:
            break;
        }

        if (hash_area[offset] != hash)
        {
            return false;
        }
        const std::uint32_t* const stored =
            hash_area.data() + hash_area[offset + 1];
        return std::equal(stored, stored + qlen, quads);
    }

    bool slot_empty(const std::size_t offset) const noexcept
    {
        return hash_area[offset + 3] == 0;
    }

    name_ref find(
        const std::uint32_t* const quads,
        const std::size_t qlen) const
    {
        if (qlen == 0 || hash_size == 0)
        {
            return nullptr;
        }

        const std::uint32_t hash = calc_hash(quads, qlen);

        const std::size_t offset = primary_offset(hash);
        if (slot_matches(offset, hash, quads, qlen))
        {
            return names[offset >> 2];
        }
        if (slot_empty(offset))
        {
            return nullptr;
        }

        const std::size_t offset2 = secondary_offset(offset);
        if (slot_matches(offset2, hash, quads, qlen))
        {
            return names[offset2 >> 2];
        }
        if (slot_empty(offset2))
        {
            return nullptr;
        }

        const std::size_t bucket = tertiary_offset(offset);
        const std::size_t bucket_end = bucket + (std::size_t(1) << tertiary_shift);
        for (std::size_t offset3 = bucket; offset3 < bucket_end; offset3 += 4)
        {
            if (slot_matches(offset3, hash, quads, qlen))
            {
                return names[offset3 >> 2];
            }
            if (slot_empty(offset3))
            {
                return nullptr;
            }
        }

        for (std::size_t offset4 = spillover_start();
             offset4 < spillover_end;
             offset4 += 4)
        {
            if (slot_matches(offset4, hash, quads, qlen))
            {
                return names[offset4 >> 2];
            }
        }

        return nullptr;
    }

    std::size_t append_long_name(
        const std::uint32_t* const quads,
        const std::size_t qlen)
    {
        const std::size_t start = long_name_offset;
        if (start + qlen > hash_area.size())
        {
            const std::size_t to_add = start + qlen - hash_area.size();
            const std::size_t min_add = std::min<std::size_t>(4096, hash_size);
            hash_area.resize(hash_area.size() + std::max(to_add, min_add), 0);
        }
        std::copy(quads, quads + qlen, hash_area.begin() + start);
        long_name_offset += qlen;
        return start;
    }

    void report_too_many_collisions() const
    {
        throw parse_error(
            parse_error::SYMBOL_TABLE_OVERFLOW,
            {},
            PROPERTY_NAME,
            "Spill-over slots in symbol table with " + std::to_string(count)
                + " entries, hash area of " + std::to_string(hash_size)
                + " slots is now full (all " + std::to_string(hash_size >> 2)
                + " slots): suspect a DoS attack based on hash collisions."
                " The check can be disabled via FAIL_ON_SYMBOL_HASH_OVERFLOW");
    }

    std::size_t find_offset_for_add(
        const std::uint32_t hash,
        const bool fail_on_overflow)
    {
        const std::size_t offset = primary_offset(hash);
        if (slot_empty(offset))
        {
            return offset;
        }

        const std::size_t offset2 = secondary_offset(offset);
        if (slot_empty(offset2))
        {
            return offset2;
        }

        const std::size_t bucket = tertiary_offset(offset);
        const std::size_t bucket_end = bucket + (std::size_t(1) << tertiary_shift);
        for (std::size_t offset3 = bucket; offset3 < bucket_end; offset3 += 4)
        {
            if (slot_empty(offset3))
            {
                return offset3;
            }
        }

        const std::size_t offset4 = spillover_end;
        if (offset4 + 4 >= (hash_size << 3))
        {
            if (fail_on_overflow && hash_size > MIN_SIZE_FOR_OVERFLOW_CHECK)
            {
                report_too_many_collisions();
            }
            rehash();
            if (full)
            {
                return NO_SLOT;
            }
            return find_offset_for_add(hash, fail_on_overflow);
        }
        spillover_end += 4;
        return offset4;
    }

    void check_need_for_rehash() noexcept
    {
        if (count > (hash_size >> 1))
        {
            const std::size_t spill_count = spillover_count();
            if (spill_count > 1 + (count >> 7)
                || count * 5 > hash_size * 4)
            {
                need_rehash = true;
            }
        }
    }

    // Returns false, leaving the table unchanged, when the table is full
    bool insert(
        name_ref name,
        const std::uint32_t* const quads,
        const std::size_t qlen,
        const bool fail_on_overflow)
    {
        if (need_rehash)
        {
            rehash();
        }
        if (full)
        {
            return false;
        }

        const std::uint32_t hash = calc_hash(quads, qlen);
        const std::size_t offset = find_offset_for_add(hash, fail_on_overflow);
        if (offset == NO_SLOT)
        {
            return false;
        }

        switch (qlen)
        {
        case 1:
            hash_area[offset] = quads[0];
            break;
        case 2:
            hash_area[offset] = quads[0];
            hash_area[offset + 1] = quads[1];
            break;
        case 3:
            hash_area[offset] = quads[0];
            hash_area[offset + 1] = quads[1];
            hash_area[offset + 2] = quads[2];
            break;
        default:
            hash_area[offset] = hash;
            hash_area[offset + 1] =
                static_cast<std::uint32_t>(append_long_name(quads, qlen));
            break;
        }
        hash_area[offset + 3] = static_cast<std::uint32_t>(qlen);
        names[offset >> 2] = std::move(name);
        ++count;

        check_need_for_rehash();
        return true;
    }

    void rehash()
    {
        need_rehash = false;

        const std::size_t new_size = hash_size + hash_size;
        if (new_size > MAX_HASH_SIZE)
        {
            full = true;
            return;
        }

        const quad_table old = std::move(*this);
        *this = create(new_size, old.seed);

        std::size_t copy_count = 0;
        for (std::size_t offset = 0; offset < old.spillover_end; offset += 4)
        {
            const std::size_t len = old.hash_area[offset + 3];
            if (len == 0)
            {
                continue;
            }

            const std::uint32_t* const quads = (len <= 3)
                ? old.hash_area.data() + offset
                : old.hash_area.data() + old.hash_area[offset + 1];
            if (insert(old.names[offset >> 2], quads, len, false))
            {
                ++copy_count;
            }
        }

        // LCOV_EXCL_START
        if (copy_count != old.count)
        {
            throw std::logic_error(
                "Failed rehash(): old count=" + std::to_string(old.count)
                + ", copy count=" + std::to_string(copy_count));
        }
        // LCOV_EXCL_STOP
    }
}; // struct quad_table

} // namespace detail

// Maps property names, as sequences of 32-bit quads, to canonical_name
// instances. A factory owns a ROOT table; every parser works on a BRANCH of
// it and merges what it discovered back on release(). A PLACEHOLDER never
// finds or stores anything.
class byte_quads_canonicalizer
: public std::enable_shared_from_this<byte_quads_canonicalizer>
{
public:

    enum table_mode
    {
        ROOT,
        BRANCH,
        PLACEHOLDER
    };

    static constexpr std::size_t DEFAULT_TABLE_SIZE = 64;
    static constexpr std::size_t MAX_ENTRIES_FOR_REUSE = 6000;

private:

    struct private_tag
    {
        explicit private_tag() = default;
    };

    struct added_name
    {
        std::vector<std::uint32_t> quads;
        name_ref name;
    };

    table_mode m_mode;
    std::uint32_t m_seed;
    bool m_fail_on_overflow = true;

    // ROOT
    mutable std::mutex m_mutex;
    std::shared_ptr<const detail::quad_table> m_snapshot;
    std::uint64_t m_generation = 0;
    std::size_t m_initial_size = DEFAULT_TABLE_SIZE;

    // BRANCH
    std::shared_ptr<byte_quads_canonicalizer> m_parent;
    std::uint64_t m_base_generation = 0;
    std::unique_ptr<detail::quad_table> m_local;
    std::vector<added_name> m_added;
    bool m_released = false;

    const detail::quad_table* table() const noexcept
    {
        return m_local ? m_local.get() : m_snapshot.get();
    }

    void verify_sharing()
    {
        if (m_mode == PLACEHOLDER)
        {
            throw usage_error("Cannot add names to Placeholder symbol table");
        }
        if (m_mode == ROOT)
        {
            throw usage_error("Cannot add names to Root symbol table");
        }
        if (m_released)
        {
            throw usage_error("Cannot add names to a released symbol table");
        }

        if (!m_local)
        {
            m_local = std::make_unique<detail::quad_table>(*m_snapshot);
            m_snapshot.reset();
        }
    }

    void merge_child(
        std::unique_ptr<detail::quad_table> child,
        const std::uint64_t base_generation,
        const std::vector<added_name>& added)
    {
        const std::lock_guard<std::mutex> lock(m_mutex);

        if (child->count > MAX_ENTRIES_FOR_REUSE)
        {
            // Too big to keep around: start over
            m_snapshot = std::make_shared<const detail::quad_table>(
                detail::quad_table::create(m_initial_size, m_seed));
        }
        else if (base_generation == m_generation)
        {
            m_snapshot = std::shared_ptr<const detail::quad_table>(
                std::move(child));
        }
        else
        {
            // Another branch merged first: replay what this one added,
            // keeping the instances already in the root
            auto merged = std::make_unique<detail::quad_table>(*m_snapshot);
            for (const added_name& entry : added)
            {
                const std::size_t qlen = entry.quads.size();
                if (!merged->find(entry.quads.data(), qlen)
                    && !merged->insert(
                        entry.name, entry.quads.data(), qlen, false))
                {
                    break;
                }
            }
            m_snapshot = std::shared_ptr<const detail::quad_table>(
                std::move(merged));
        }

        ++m_generation;
    }

public:

    // Use create_root(), create_placeholder() or make_child()
    explicit byte_quads_canonicalizer(
        private_tag,
        const table_mode mode,
        const std::uint32_t seed) noexcept
    : m_mode(mode)
    , m_seed(seed)
    {
    }

    byte_quads_canonicalizer(const byte_quads_canonicalizer&) = delete;
    byte_quads_canonicalizer(byte_quads_canonicalizer&&) = delete;
    byte_quads_canonicalizer& operator=(const byte_quads_canonicalizer&) = delete;
    byte_quads_canonicalizer& operator=(byte_quads_canonicalizer&&) = delete;

    static std::shared_ptr<byte_quads_canonicalizer> create_root(
        const std::uint32_t seed,
        const std::size_t size = DEFAULT_TABLE_SIZE)
    {
        auto root = std::make_shared<byte_quads_canonicalizer>(
            private_tag(), ROOT, seed);
        root->m_initial_size = size;
        root->m_snapshot = std::make_shared<const detail::quad_table>(
            detail::quad_table::create(size, seed));
        return root;
    }

    static std::shared_ptr<byte_quads_canonicalizer> create_root()
    {
        std::random_device random;
        return create_root(static_cast<std::uint32_t>(random()));
    }

    static std::unique_ptr<byte_quads_canonicalizer> create_placeholder()
    {
        return std::make_unique<byte_quads_canonicalizer>(
            private_tag(), PLACEHOLDER, 0);
    }

    // Only valid on a ROOT table; the branch shares the current root state
    // until its first insert
    std::unique_ptr<byte_quads_canonicalizer> make_child(
        const bool fail_on_overflow = true)
    {
        if (m_mode != ROOT)
        {
            throw usage_error("Only a root symbol table can have children");
        }

        auto child = std::make_unique<byte_quads_canonicalizer>(
            private_tag(), BRANCH, m_seed);
        child->m_fail_on_overflow = fail_on_overflow;
        child->m_parent = shared_from_this();

        const std::lock_guard<std::mutex> lock(m_mutex);
        child->m_snapshot = m_snapshot;
        child->m_base_generation = m_generation;
        return child;
    }

    // Merges the names this branch added into its root. Only the first call
    // does anything; ROOT and PLACEHOLDER tables ignore it.
    void release()
    {
        if (m_mode != BRANCH || m_released)
        {
            return;
        }
        m_released = true;

        if (m_local && !m_added.empty())
        {
            m_parent->merge_child(
                std::move(m_local),
                m_base_generation,
                m_added);
        }
        m_local.reset();
        m_snapshot.reset();
        m_added.clear();
    }

    table_mode mode() const noexcept
    {
        return m_mode;
    }

    std::uint32_t hash_seed() const noexcept
    {
        return m_seed;
    }

    bool is_released() const noexcept
    {
        return m_released;
    }

    // Number of merges the root has seen
    std::uint64_t generation() const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        return m_mode == ROOT ? m_generation : m_base_generation;
    }

    std::size_t size() const
    {
        if (m_mode == ROOT)
        {
            const std::lock_guard<std::mutex> lock(m_mutex);
            return m_snapshot->count;
        }

        const detail::quad_table* const current = table();
        return current ? current->count : 0;
    }

    // Number of primary slots
    std::size_t bucket_count() const
    {
        if (m_mode == ROOT)
        {
            const std::lock_guard<std::mutex> lock(m_mutex);
            return m_snapshot->hash_size;
        }

        const detail::quad_table* const current = table();
        return current ? current->hash_size : 0;
    }

    std::size_t spillover_count() const
    {
        if (m_mode == ROOT)
        {
            const std::lock_guard<std::mutex> lock(m_mutex);
            return m_snapshot->spillover_count();
        }

        const detail::quad_table* const current = table();
        return current ? current->spillover_count() : 0;
    }

    std::uint32_t calc_hash(const std::uint32_t q1) const noexcept
    {
        detail::quad_table hasher;
        hasher.seed = m_seed;
        return hasher.calc_hash(q1);
    }

    name_ref find_name(const std::uint32_t q1) const
    {
        return find_name(&q1, 1);
    }

    name_ref find_name(const std::uint32_t q1, const std::uint32_t q2) const
    {
        const std::uint32_t quads[] = {q1, q2};
        return find_name(quads, 2);
    }

    name_ref find_name(
        const std::uint32_t q1,
        const std::uint32_t q2,
        const std::uint32_t q3) const
    {
        const std::uint32_t quads[] = {q1, q2, q3};
        return find_name(quads, 3);
    }

    name_ref find_name(
        const std::uint32_t* const quads,
        const std::size_t qlen) const
    {
        if (m_mode == PLACEHOLDER)
        {
            return nullptr;
        }
        if (m_mode == ROOT)
        {
            std::shared_ptr<const detail::quad_table> snapshot;
            {
                const std::lock_guard<std::mutex> lock(m_mutex);
                snapshot = m_snapshot;
            }
            return snapshot->find(quads, qlen);
        }

        const detail::quad_table* const current = table();
        return current ? current->find(quads, qlen) : nullptr;
    }

    name_ref find_name(const std::string_view text) const
    {
        const std::vector<std::uint32_t> quads = name_quads(text);
        return find_name(quads.data(), quads.size());
    }

    // The caller must have checked that the name is not present yet. Once
    // the table has reached its maximum size, the returned name is not
    // interned and names already in the table stay where they are.
    name_ref add_name(
        std::string text,
        const std::uint32_t* const quads,
        const std::size_t qlen)
    {
        verify_sharing();

        name_ref name = std::make_shared<const canonical_name>(std::move(text));
        if (m_local->insert(name, quads, qlen, m_fail_on_overflow))
        {
            m_added.push_back(added_name {
                std::vector<std::uint32_t>(quads, quads + qlen), name});
        }
        return name;
    }

    name_ref add_name(const std::string_view text)
    {
        const std::vector<std::uint32_t> quads = name_quads(text);
        return add_name(std::string(text), quads.data(), quads.size());
    }
}; // class byte_quads_canonicalizer

} // namespace cirjson

#endif // CIRJSON_SYMBOLS_H
