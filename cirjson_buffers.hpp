#ifndef CIRJSON_BUFFERS_H
#define CIRJSON_BUFFERS_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <utility>
#include <vector>

#include "cirjson_error.hpp"

namespace cirjson
{

// Keeps the largest released buffer of every kind for reuse. Instances are
// not synchronized: use one per thread (see for_current_thread()).
class buffer_recycler
{
public:

    enum byte_buffer_kind
    {
        BYTE_READ_IO_BUFFER,
        BYTE_WRITE_ENCODING_BUFFER,
        BYTE_WRITE_CONCAT_BUFFER,
        BYTE_BASE64_CODEC_BUFFER,
        BYTE_BUFFER_KINDS
    };

    enum char_buffer_kind
    {
        CHAR_TOKEN_BUFFER,
        CHAR_CONCAT_BUFFER,
        CHAR_TEXT_BUFFER,
        CHAR_NAME_COPY_BUFFER,
        CHAR_BUFFER_KINDS
    };

private:

    std::array<std::vector<std::uint8_t>, BYTE_BUFFER_KINDS> m_byte_buffers;
    std::array<std::vector<char>, CHAR_BUFFER_KINDS> m_char_buffers;

    template<typename T>
    static std::vector<T> take(
        std::vector<T>& slot,
        const std::size_t default_size,
        const std::size_t min_size)
    {
        const std::size_t size = std::max(default_size, min_size);

        std::vector<T> buffer = std::move(slot);
        slot.clear();
        if (buffer.size() < size)
        {
            buffer.assign(size, T());
        }

        return buffer;
    }

    template<typename T>
    static void keep(std::vector<T>& slot, std::vector<T>&& buffer)
    {
        if (slot.empty() || buffer.size() > slot.size())
        {
            slot = std::move(buffer);
        }
    }

public:

    explicit buffer_recycler() = default;
    buffer_recycler(const buffer_recycler&) = delete;
    buffer_recycler(buffer_recycler&&) = delete;
    buffer_recycler& operator=(const buffer_recycler&) = delete;
    buffer_recycler& operator=(buffer_recycler&&) = delete;

    static buffer_recycler& for_current_thread()
    {
        thread_local buffer_recycler instance;
        return instance;
    }

    static std::size_t default_length(const byte_buffer_kind kind) noexcept
    {
        switch (kind)
        {
        case BYTE_READ_IO_BUFFER:
        case BYTE_WRITE_ENCODING_BUFFER:
            return 8000;
        case BYTE_WRITE_CONCAT_BUFFER:
        case BYTE_BASE64_CODEC_BUFFER:
            return 2000;
        default:
            return 0;
        }
    }

    static std::size_t default_length(const char_buffer_kind kind) noexcept
    {
        switch (kind)
        {
        case CHAR_TOKEN_BUFFER:
        case CHAR_CONCAT_BUFFER:
            return 4000;
        case CHAR_TEXT_BUFFER:
        case CHAR_NAME_COPY_BUFFER:
            return 200;
        default:
            return 0;
        }
    }

    std::vector<std::uint8_t> allocate(
        const byte_buffer_kind kind,
        const std::size_t min_size = 0)
    {
        return take(m_byte_buffers.at(kind), default_length(kind), min_size);
    }

    std::vector<char> allocate(
        const char_buffer_kind kind,
        const std::size_t min_size = 0)
    {
        return take(m_char_buffers.at(kind), default_length(kind), min_size);
    }

    void release(
        const byte_buffer_kind kind,
        std::vector<std::uint8_t>&& buffer)
    {
        keep(m_byte_buffers.at(kind), std::move(buffer));
    }

    void release(const char_buffer_kind kind, std::vector<char>&& buffer)
    {
        keep(m_char_buffers.at(kind), std::move(buffer));
    }

    // Size of the buffer currently pooled for the kind (0 if none)
    std::size_t pooled_length(const byte_buffer_kind kind) const
    {
        return m_byte_buffers.at(kind).size();
    }

    std::size_t pooled_length(const char_buffer_kind kind) const
    {
        return m_char_buffers.at(kind).size();
    }
}; // class buffer_recycler

// Per-parser view of the recycler: every buffer kind may be checked out at
// most once at a time, and must come back at least as large as it left.
class io_context
{
private:

    buffer_recycler* m_recycler;
    std::array<std::size_t, buffer_recycler::BYTE_BUFFER_KINDS>
        m_byte_checked_out {};
    std::array<std::size_t, buffer_recycler::CHAR_BUFFER_KINDS>
        m_char_checked_out {};

    buffer_recycler& recycler() const
    {
        // Without an explicit recycler the calling thread's one is used at
        // every call, so buffers may be returned from any thread
        return m_recycler ? *m_recycler : buffer_recycler::for_current_thread();
    }

    static void verify_allocation(const std::size_t checked_out)
    {
        if (checked_out != 0)
        {
            throw usage_error(
                "Trying to call same allocate() method second time");
        }
    }

    static void verify_release(
        const std::size_t checked_out,
        const std::size_t released)
    {
        if (released < checked_out)
        {
            throw usage_error("Trying to release buffer smaller than original");
        }
    }

public:

    explicit io_context(buffer_recycler* const recycler = nullptr) noexcept
    : m_recycler(recycler)
    {
    }

    io_context(const io_context&) = delete;
    io_context(io_context&&) = delete;
    io_context& operator=(const io_context&) = delete;
    io_context& operator=(io_context&&) = delete;

    std::vector<std::uint8_t> allocate(
        const buffer_recycler::byte_buffer_kind kind,
        const std::size_t min_size = 0)
    {
        std::size_t& checked_out = m_byte_checked_out.at(kind);
        verify_allocation(checked_out);

        std::vector<std::uint8_t> buffer = recycler().allocate(kind, min_size);
        checked_out = buffer.size();

        return buffer;
    }

    std::vector<char> allocate(
        const buffer_recycler::char_buffer_kind kind,
        const std::size_t min_size = 0)
    {
        std::size_t& checked_out = m_char_checked_out.at(kind);
        verify_allocation(checked_out);

        std::vector<char> buffer = recycler().allocate(kind, min_size);
        checked_out = buffer.size();

        return buffer;
    }

    // Releasing an empty buffer is a no-op
    void release(
        const buffer_recycler::byte_buffer_kind kind,
        std::vector<std::uint8_t>&& buffer)
    {
        if (buffer.empty())
        {
            return;
        }

        std::size_t& checked_out = m_byte_checked_out.at(kind);
        verify_release(checked_out, buffer.size());
        checked_out = 0;
        recycler().release(kind, std::move(buffer));
    }

    void release(
        const buffer_recycler::char_buffer_kind kind,
        std::vector<char>&& buffer)
    {
        if (buffer.empty())
        {
            return;
        }

        std::size_t& checked_out = m_char_checked_out.at(kind);
        verify_release(checked_out, buffer.size());
        checked_out = 0;
        recycler().release(kind, std::move(buffer));
    }

    bool is_checked_out(const buffer_recycler::byte_buffer_kind kind) const
    {
        return m_byte_checked_out.at(kind) != 0;
    }

    bool is_checked_out(const buffer_recycler::char_buffer_kind kind) const
    {
        return m_char_checked_out.at(kind) != 0;
    }
}; // class io_context

namespace detail
{

template<typename T>
struct buffer_kind_of;

template<>
struct buffer_kind_of<std::uint8_t>
{
    using type = buffer_recycler::byte_buffer_kind;
};

template<>
struct buffer_kind_of<char>
{
    using type = buffer_recycler::char_buffer_kind;
};

} // namespace detail

// Buffer checked out of an io_context for the lifetime of the object
template<typename T>
class recycled_buffer
{
public:

    using kind_type = typename detail::buffer_kind_of<T>::type;

private:

    io_context& m_context;
    kind_type m_kind;
    std::vector<T> m_buffer;

public:

    explicit recycled_buffer(
        io_context& context,
        const kind_type kind,
        const std::size_t min_size = 0)
    : m_context(context)
    , m_kind(kind)
    , m_buffer(context.allocate(kind, min_size))
    {
    }

    recycled_buffer(const recycled_buffer&) = delete;
    recycled_buffer(recycled_buffer&&) = delete;
    recycled_buffer& operator=(const recycled_buffer&) = delete;
    recycled_buffer& operator=(recycled_buffer&&) = delete;

    ~recycled_buffer()
    {
        release();
    }

    // Returns the buffer early; later accesses see an empty buffer.
    // The buffer never shrinks while held, so the size check cannot fail.
    void release()
    {
        m_context.release(m_kind, std::move(m_buffer));
        m_buffer.clear();
    }

    std::vector<T>& get() noexcept
    {
        return m_buffer;
    }

    const std::vector<T>& get() const noexcept
    {
        return m_buffer;
    }

    T* data() noexcept
    {
        return m_buffer.data();
    }

    std::size_t size() const noexcept
    {
        return m_buffer.size();
    }
}; // class recycled_buffer

namespace detail
{

// Growable text accumulator backed by a recycled char buffer
class text_buffer
{
private:

    recycled_buffer<char> m_storage;
    std::size_t m_length = 0;

    void grow(const std::size_t required)
    {
        std::vector<char>& storage = m_storage.get();
        std::size_t new_size = std::max<std::size_t>(storage.size(), 16);
        while (new_size < required)
        {
            new_size += new_size >> 1;
        }
        storage.resize(new_size);
    }

public:

    explicit text_buffer(
        io_context& context,
        const buffer_recycler::char_buffer_kind kind)
    : m_storage(context, kind)
    {
    }

    void clear() noexcept
    {
        m_length = 0;
    }

    void append(const char c)
    {
        if (m_length >= m_storage.size())
        {
            grow(m_length + 1);
        }
        m_storage.data()[m_length++] = c;
    }

    void append(const char* const data, const std::size_t length)
    {
        if (m_length + length > m_storage.size())
        {
            grow(m_length + length);
        }
        std::memcpy(m_storage.data() + m_length, data, length);
        m_length += length;
    }

    void append(const std::string_view text)
    {
        append(text.data(), text.size());
    }

    void pop_back() noexcept
    {
        if (m_length > 0)
        {
            --m_length;
        }
    }

    void assign(const std::string_view text)
    {
        clear();
        append(text);
    }

    std::size_t size() const noexcept
    {
        return m_length;
    }

    bool empty() const noexcept
    {
        return m_length == 0;
    }

    std::string_view view() const noexcept
    {
        return std::string_view(m_storage.get().data(), m_length);
    }
}; // class text_buffer

} // namespace detail

} // namespace cirjson

#endif // CIRJSON_BUFFERS_H
