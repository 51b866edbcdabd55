/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "yaml/yaml_event.h"

#include <utility>

namespace lyn::yaml {
namespace {
Event make(EventKind kind) {
    Event e{};
    e.kind = kind;
    return e;
}

constexpr std::size_t kMaxDescribedScalar = 40;
}  // namespace

Event Event::stream_start(Encoding encoding) {
    Event e = make(EventKind::StreamStart);
    e.encoding = encoding;
    return e;
}

Event Event::stream_end() {
    return make(EventKind::StreamEnd);
}

Event Event::document_start() {
    return make(EventKind::DocumentStart);
}

Event Event::document_end() {
    return make(EventKind::DocumentEnd);
}

Event Event::mapping_start() {
    return make(EventKind::MappingStart);
}

Event Event::mapping_end() {
    return make(EventKind::MappingEnd);
}

Event Event::sequence_start() {
    return make(EventKind::SequenceStart);
}

Event Event::sequence_end() {
    return make(EventKind::SequenceEnd);
}

Event Event::scalar(std::string value, ScalarStyle style) {
    Event e = make(EventKind::Scalar);
    e.value = std::move(value);
    e.style = style;
    return e;
}

Event Event::alias(std::string anchor) {
    Event e = make(EventKind::Alias);
    e.value = std::move(anchor);
    return e;
}

std::string_view to_string(EventKind kind) {
    switch (kind) {
        case EventKind::StreamStart:
            return "stream start";
        case EventKind::StreamEnd:
            return "stream end";
        case EventKind::DocumentStart:
            return "document start";
        case EventKind::DocumentEnd:
            return "document end";
        case EventKind::MappingStart:
            return "mapping start";
        case EventKind::MappingEnd:
            return "mapping end";
        case EventKind::SequenceStart:
            return "sequence start";
        case EventKind::SequenceEnd:
            return "sequence end";
        case EventKind::Scalar:
            return "scalar";
        case EventKind::Alias:
            return "alias";
    }
    return "unknown event";
}

std::string_view to_string(Encoding encoding) {
    switch (encoding) {
        case Encoding::Any:
            return "unspecified";
        case Encoding::Utf8:
            return "UTF-8";
        case Encoding::Utf16Le:
            return "UTF-16LE";
        case Encoding::Utf16Be:
            return "UTF-16BE";
    }
    return "unknown";
}

std::string_view to_string(ScalarStyle style) {
    switch (style) {
        case ScalarStyle::Any:
            return "any";
        case ScalarStyle::Plain:
            return "plain";
        case ScalarStyle::SingleQuoted:
            return "single-quoted";
        case ScalarStyle::DoubleQuoted:
            return "double-quoted";
        case ScalarStyle::Literal:
            return "literal";
        case ScalarStyle::Folded:
            return "folded";
    }
    return "unknown";
}

std::string describe(const Event& event) {
    std::string out(to_string(event.kind));
    if (event.kind == EventKind::Scalar) {
        std::string shown = event.value;
        if (shown.size() > kMaxDescribedScalar) {
            shown.resize(kMaxDescribedScalar);
            shown += "...";
        }
        out += " \"" + shown + "\"";
    } else if (event.kind == EventKind::Alias) {
        out += " *" + event.value;
    }
    return out;
}

std::optional<Event> BufferedEventSource::next() {
    if (_pos >= _events.size()) {
        return std::nullopt;
    }
    return _events[_pos++];
}

}  // namespace lyn::yaml
