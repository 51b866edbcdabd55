/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lyn::yaml {

enum class EventKind {
    StreamStart,
    StreamEnd,
    DocumentStart,
    DocumentEnd,
    MappingStart,
    MappingEnd,
    SequenceStart,
    SequenceEnd,
    Scalar,
    Alias,
};

enum class Encoding {
    Any,
    Utf8,
    Utf16Le,
    Utf16Be,
};

enum class ScalarStyle {
    Any,
    Plain,
    SingleQuoted,
    DoubleQuoted,
    Literal,
    Folded,
};

// 1-based source position; line 0 means unknown.
struct Mark {
    std::size_t line = 0;
    std::size_t column = 0;

    bool known() const { return line != 0; }
};

struct Event {
    EventKind kind = EventKind::StreamEnd;
    Encoding encoding = Encoding::Any;       // StreamStart only
    ScalarStyle style = ScalarStyle::Any;    // Scalar only
    std::string value;                       // Scalar text or Alias anchor
    Mark mark{};

    static Event stream_start(Encoding encoding = Encoding::Utf8);
    static Event stream_end();
    static Event document_start();
    static Event document_end();
    static Event mapping_start();
    static Event mapping_end();
    static Event sequence_start();
    static Event sequence_end();
    static Event scalar(std::string value, ScalarStyle style = ScalarStyle::Plain);
    static Event alias(std::string anchor);
};

std::string_view to_string(EventKind kind);
std::string_view to_string(Encoding encoding);
std::string_view to_string(ScalarStyle style);

/**
 * Short human readable description of an event for diagnostics,
 * e.g. `scalar "abc"` or `mapping start`.
 */
std::string describe(const Event& event);

/**
 * Forward-only, one-shot producer of structural events.
 *
 * next() returns std::nullopt once the sequence is exhausted and keeps doing so.
 * Producer-level failures (malformed text) are thrown as ParseError.
 */
class EventSource {
   public:
    virtual ~EventSource() = default;

    virtual std::optional<Event> next() = 0;
};

// Replays a prepared list of events.
class BufferedEventSource : public EventSource {
   public:
    explicit BufferedEventSource(std::vector<Event> events) : _events(std::move(events)) {}

    std::optional<Event> next() override;

    std::size_t consumed() const { return _pos; }

   private:
    std::vector<Event> _events;
    std::size_t _pos = 0;
};

}  // namespace lyn::yaml
