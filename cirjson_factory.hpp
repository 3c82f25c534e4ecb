#ifndef CIRJSON_FACTORY_H
#define CIRJSON_FACTORY_H

#include <memory>

#include "cirjson_async_parser.hpp"
#include "cirjson_features.hpp"
#include "cirjson_symbols.hpp"

namespace cirjson
{

// Creates parsers sharing one root symbol table, so that property names
// discovered by one document are found without hashing misses by the next.
// Configuration changes only affect parsers created afterwards.
class factory
{
private:

    read_features m_features;
    stream_read_constraints m_constraints;
    bool m_canonicalize_property_names = true;
    bool m_fail_on_symbol_hash_overflow = true;
    std::shared_ptr<byte_quads_canonicalizer> m_root_symbols;

    std::shared_ptr<byte_quads_canonicalizer> parser_symbols() const
    {
        return m_canonicalize_property_names ? m_root_symbols : nullptr;
    }

public:

    explicit factory(const read_features features = read_features())
    : m_features(features)
    , m_root_symbols(byte_quads_canonicalizer::create_root())
    {
    }

    factory(const factory&) = delete;
    factory(factory&&) = delete;
    factory& operator=(const factory&) = delete;
    factory& operator=(factory&&) = delete;

    factory& enable(const read_feature feature) noexcept
    {
        m_features.enable(feature);
        return *this;
    }

    factory& disable(const read_feature feature) noexcept
    {
        m_features.disable(feature);
        return *this;
    }

    factory& configure(const read_feature feature, const bool state) noexcept
    {
        m_features.configure(feature, state);
        return *this;
    }

    factory& set_constraints(const stream_read_constraints& constraints)
    {
        m_constraints = constraints;
        return *this;
    }

    factory& set_canonicalize_property_names(const bool state) noexcept
    {
        m_canonicalize_property_names = state;
        return *this;
    }

    factory& set_fail_on_symbol_hash_overflow(const bool state) noexcept
    {
        m_fail_on_symbol_hash_overflow = state;
        return *this;
    }

    const read_features& features() const noexcept
    {
        return m_features;
    }

    const stream_read_constraints& constraints() const noexcept
    {
        return m_constraints;
    }

    bool canonicalize_property_names() const noexcept
    {
        return m_canonicalize_property_names;
    }

    const std::shared_ptr<byte_quads_canonicalizer>& root_symbols() const noexcept
    {
        return m_root_symbols;
    }

    std::unique_ptr<byte_array_parser> create_non_blocking_byte_array_parser(
        buffer_recycler* const recycler = nullptr) const
    {
        return std::make_unique<byte_array_parser>(
            m_features,
            m_constraints,
            parser_symbols(),
            m_fail_on_symbol_hash_overflow,
            recycler);
    }

    std::unique_ptr<byte_buffer_parser> create_non_blocking_byte_buffer_parser(
        buffer_recycler* const recycler = nullptr) const
    {
        return std::make_unique<byte_buffer_parser>(
            m_features,
            m_constraints,
            parser_symbols(),
            m_fail_on_symbol_hash_overflow,
            recycler);
    }
}; // class factory

} // namespace cirjson

#endif // CIRJSON_FACTORY_H
