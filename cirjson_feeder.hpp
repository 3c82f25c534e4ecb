#ifndef CIRJSON_FEEDER_H
#define CIRJSON_FEEDER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "cirjson_error.hpp"

namespace cirjson
{

// forward declaration
template<typename Feeder>
class basic_async_parser;

namespace detail
{

// Window over the chunk most recently fed by the caller. The data is not
// copied: the caller keeps it alive and unmodified until needs_more_input()
// returns true again.
class input_window
{
    template<typename Feeder> friend class cirjson::basic_async_parser;

protected:

    const std::uint8_t* m_buffer = nullptr;
    std::size_t m_pointer = 0;
    std::size_t m_end = 0;
    std::size_t m_buffer_start = 0;
    std::size_t m_original_length = 0;
    std::uint64_t m_processed = 0; // bytes of all previous chunks
    bool m_end_of_input = false;

    explicit input_window() noexcept = default;

    void accept(
        const std::uint8_t* const data,
        const std::size_t start,
        const std::size_t end)
    {
        if (m_pointer < m_end)
        {
            throw usage_error(
                "Still have " + std::to_string(m_end - m_pointer)
                + " undecoded bytes, should not call 'feed_input'");
        }
        if (end < start)
        {
            throw usage_error(
                "Input end (" + std::to_string(end)
                + ") may not be before start (" + std::to_string(start) + ")");
        }
        if (m_end_of_input)
        {
            throw usage_error("Already closed, can not feed more input");
        }

        m_processed += m_original_length;
        m_buffer = data;
        m_pointer = start;
        m_end = end;
        m_buffer_start = start;
        m_original_length = end - start;
    }

    bool has_byte() const noexcept
    {
        return m_pointer < m_end;
    }

    std::uint8_t next_byte() noexcept
    {
        return m_buffer[m_pointer++];
    }

    void unread() noexcept
    {
        --m_pointer;
    }

    // Absolute offset of the next byte to decode
    std::uint64_t position() const noexcept
    {
        return m_processed + (m_pointer - m_buffer_start);
    }

public:

    input_window(const input_window&) = delete;
    input_window(input_window&&) = delete;
    input_window& operator=(const input_window&) = delete;
    input_window& operator=(input_window&&) = delete;

    // True when the current chunk is fully consumed and end_of_input() has
    // not been called: the only time feed_input() is legal
    bool needs_more_input() const noexcept
    {
        return m_pointer >= m_end && !m_end_of_input;
    }

    // Sticky: afterwards running out of bytes means end of document
    void end_of_input() noexcept
    {
        m_end_of_input = true;
    }

    bool is_end_of_input() const noexcept
    {
        return m_end_of_input;
    }

    std::size_t available() const noexcept
    {
        return m_end - m_pointer;
    }

    // Bytes handed over through feed_input() so far
    std::uint64_t total_fed() const noexcept
    {
        return m_processed + m_original_length;
    }
}; // class input_window

} // namespace detail

class byte_array_feeder : public detail::input_window
{
public:

    explicit byte_array_feeder() noexcept = default;

    void feed_input(
        const std::uint8_t* const data,
        const std::size_t offset,
        const std::size_t length)
    {
        const std::size_t end = offset + length;
        if (end < offset)
        {
            throw usage_error(
                "Input end may not be before start ("
                + std::to_string(offset) + ")");
        }
        accept(data, offset, end);
    }

    void feed_input(
        const char* const data,
        const std::size_t offset,
        const std::size_t length)
    {
        feed_input(reinterpret_cast<const std::uint8_t*>(data), offset, length);
    }

    void feed_input(const std::string_view data)
    {
        feed_input(data.data(), 0, data.size());
    }
}; // class byte_array_feeder

// Non-owning equivalent of a position/limit byte buffer
struct byte_buffer
{
    const std::uint8_t* data = nullptr;
    std::size_t position = 0;
    std::size_t limit = 0;
};

class byte_buffer_feeder : public detail::input_window
{
public:

    explicit byte_buffer_feeder() noexcept = default;

    // Bytes [position, limit) are decoded; the buffer itself is not modified
    void feed_input(const byte_buffer& buffer)
    {
        accept(buffer.data, buffer.position, buffer.limit);
    }
}; // class byte_buffer_feeder

} // namespace cirjson

#endif // CIRJSON_FEEDER_H
