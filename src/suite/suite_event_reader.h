/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "yaml/yaml_event.h"

#include <cstddef>
#include <string_view>

namespace lyn::suite {

/**
 * Primitive readers over an event source.
 *
 * Every call consumes exactly one event. The expect_* functions fail with
 * StructuralMismatch when the event is of another kind, and with
 * UnexpectedEndOfInput when the source is exhausted. Syntax errors raised by
 * the source become MalformedInput. Nothing is ever pushed
 * back: decoders that branch on the shape of a value take the event with
 * next() and dispatch on it.
 */
class EventReader {
   public:
    explicit EventReader(yaml::EventSource& source) : _source(source) {}

    yaml::Event next(std::string_view expected);

    // Also requires the declared stream encoding to be UTF-8.
    void expect_stream_start();
    void expect_stream_end();
    void expect_document_start();
    void expect_document_end();
    void expect_mapping_start();
    void expect_mapping_end();
    void expect_sequence_start();
    void expect_sequence_end();
    yaml::Event read_scalar();

    std::size_t events_read() const { return _events_read; }
    const yaml::Mark& last_mark() const { return _last_mark; }

   private:
    yaml::Event expect(yaml::EventKind kind);

    yaml::EventSource& _source;
    std::size_t _events_read = 0;
    yaml::Mark _last_mark{};
};

}  // namespace lyn::suite
