#ifndef CIRJSON_READ_CONTEXT_H
#define CIRJSON_READ_CONTEXT_H

#include <any>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "cirjson_symbols.hpp"

namespace cirjson
{

// Remembers the property names of one object. The first two names are kept
// inline since most objects are small.
class duplicate_detector
{
private:

    std::optional<std::string> m_first_name;
    std::optional<std::string> m_second_name;
    std::unordered_set<std::string> m_seen;

public:

    explicit duplicate_detector() = default;

    // Fresh detector for a nested object
    std::unique_ptr<duplicate_detector> child() const
    {
        return std::make_unique<duplicate_detector>();
    }

    void reset()
    {
        m_first_name.reset();
        m_second_name.reset();
        m_seen.clear();
    }

    bool is_duplicate(const std::string_view name)
    {
        if (!m_first_name)
        {
            m_first_name.emplace(name);
            return false;
        }
        if (*m_first_name == name)
        {
            return true;
        }
        if (!m_second_name)
        {
            m_second_name.emplace(name);
            return false;
        }
        if (*m_second_name == name)
        {
            return true;
        }

        if (m_seen.empty())
        {
            m_seen.reserve(16);
            m_seen.insert(*m_first_name);
            m_seen.insert(*m_second_name);
        }

        return !m_seen.emplace(name).second;
    }
}; // class duplicate_detector

// One level of the structural stack. Each level owns at most one child,
// which is reset and reused for every nested object or array at that depth.
class read_context
{
public:

    enum context_type
    {
        TYPE_ROOT,
        TYPE_ARRAY,
        TYPE_OBJECT
    };

private:

    read_context* const m_parent;
    std::unique_ptr<read_context> m_child;
    const std::size_t m_depth;
    context_type m_type;
    std::int64_t m_index = -1;
    name_ref m_current_name;
    std::unique_ptr<duplicate_detector> m_duplicate_detector;
    std::size_t m_start_line;
    std::size_t m_start_column;
    std::any m_current_value;

    read_context& reset(
        const context_type type,
        const std::size_t line,
        const std::size_t column)
    {
        m_type = type;
        m_index = -1;
        m_start_line = line;
        m_start_column = column;
        m_current_name.reset();
        m_current_value.reset();
        if (m_duplicate_detector)
        {
            m_duplicate_detector->reset();
        }
        return *this;
    }

    read_context& create_child(
        const context_type type,
        const std::size_t line,
        const std::size_t column)
    {
        if (!m_child)
        {
            m_child = std::make_unique<read_context>(
                this,
                m_depth + 1,
                m_duplicate_detector ? m_duplicate_detector->child() : nullptr,
                type,
                line,
                column);
            return *m_child;
        }

        return m_child->reset(type, line, column);
    }

public:

    explicit read_context(
        read_context* const parent,
        const std::size_t depth,
        std::unique_ptr<duplicate_detector> detector,
        const context_type type,
        const std::size_t line,
        const std::size_t column)
    : m_parent(parent)
    , m_depth(depth)
    , m_type(type)
    , m_duplicate_detector(std::move(detector))
    , m_start_line(line)
    , m_start_column(column)
    {
    }

    read_context(const read_context&) = delete;
    read_context(read_context&&) = delete;
    read_context& operator=(const read_context&) = delete;
    read_context& operator=(read_context&&) = delete;

    static std::unique_ptr<read_context> create_root(
        const bool detect_duplicates)
    {
        return std::make_unique<read_context>(
            nullptr,
            0,
            detect_duplicates ? std::make_unique<duplicate_detector>() : nullptr,
            TYPE_ROOT,
            1,
            0);
    }

    read_context& create_child_array(
        const std::size_t line,
        const std::size_t column)
    {
        return create_child(TYPE_ARRAY, line, column);
    }

    read_context& create_child_object(
        const std::size_t line,
        const std::size_t column)
    {
        return create_child(TYPE_OBJECT, line, column);
    }

    // Drops the attached value; the context itself stays cached for reuse
    read_context* clear_and_get_parent() noexcept
    {
        m_current_value.reset();
        return m_parent;
    }

    void value_read() noexcept
    {
        ++m_index;
    }

    // Returns false if the duplicate detector has seen the name before in
    // this object. The name is stored either way.
    bool set_current_name(name_ref name)
    {
        m_current_name = std::move(name);
        if (m_duplicate_detector && m_current_name)
        {
            return !m_duplicate_detector->is_duplicate(m_current_name->text());
        }
        return true;
    }

    const read_context* parent() const noexcept
    {
        return m_parent;
    }

    context_type type() const noexcept
    {
        return m_type;
    }

    bool in_root() const noexcept
    {
        return m_type == TYPE_ROOT;
    }

    bool in_array() const noexcept
    {
        return m_type == TYPE_ARRAY;
    }

    bool in_object() const noexcept
    {
        return m_type == TYPE_OBJECT;
    }

    std::int64_t index() const noexcept
    {
        return m_index;
    }

    std::size_t entry_count() const noexcept
    {
        return static_cast<std::size_t>(m_index + 1);
    }

    std::size_t depth() const noexcept
    {
        return m_depth;
    }

    bool has_current_name() const noexcept
    {
        return m_current_name != nullptr;
    }

    std::string_view current_name() const noexcept
    {
        return m_current_name ? m_current_name->text() : std::string_view();
    }

    const name_ref& current_name_ref() const noexcept
    {
        return m_current_name;
    }

    const duplicate_detector* get_duplicate_detector() const noexcept
    {
        return m_duplicate_detector.get();
    }

    std::size_t start_line() const noexcept
    {
        return m_start_line;
    }

    std::size_t start_column() const noexcept
    {
        return m_start_column;
    }

    const std::any& current_value() const noexcept
    {
        return m_current_value;
    }

    void assign_current_value(std::any value)
    {
        m_current_value = std::move(value);
    }
}; // class read_context

} // namespace cirjson

#endif // CIRJSON_READ_CONTEXT_H
