/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "yaml/yaml_event_source.h"

#include "yaml/yaml_error.h"

#include <yaml.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace lyn::yaml {
namespace {
struct RawEventGuard {
    yaml_event_t* event;

    ~RawEventGuard() { yaml_event_delete(event); }
};

Mark to_mark(const yaml_mark_t& m) {
    return Mark{m.line + 1, m.column + 1};
}

Encoding to_encoding(yaml_encoding_t encoding) {
    switch (encoding) {
        case YAML_UTF8_ENCODING:
            return Encoding::Utf8;
        case YAML_UTF16LE_ENCODING:
            return Encoding::Utf16Le;
        case YAML_UTF16BE_ENCODING:
            return Encoding::Utf16Be;
        default:
            return Encoding::Any;
    }
}

ScalarStyle to_style(yaml_scalar_style_t style) {
    switch (style) {
        case YAML_PLAIN_SCALAR_STYLE:
            return ScalarStyle::Plain;
        case YAML_SINGLE_QUOTED_SCALAR_STYLE:
            return ScalarStyle::SingleQuoted;
        case YAML_DOUBLE_QUOTED_SCALAR_STYLE:
            return ScalarStyle::DoubleQuoted;
        case YAML_LITERAL_SCALAR_STYLE:
            return ScalarStyle::Literal;
        case YAML_FOLDED_SCALAR_STYLE:
            return ScalarStyle::Folded;
        default:
            return ScalarStyle::Any;
    }
}

std::string to_text(const yaml_char_t* data, std::size_t length) {
    if (data == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(data), length);
}

std::string to_text(const yaml_char_t* data) {
    if (data == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(data));
}
}  // namespace

LibYamlEventSource::LibYamlEventSource(std::string text)
    : _text(std::move(text)), _parser(std::make_unique<yaml_parser_t>()) {
    if (yaml_parser_initialize(_parser.get()) == 0) {
        throw std::runtime_error(std::string("Failed to initialize libyaml parser"));
    }
    yaml_parser_set_input_string(
        _parser.get(), reinterpret_cast<const unsigned char*>(_text.data()), _text.size()
    );
}

LibYamlEventSource::~LibYamlEventSource() {
    yaml_parser_delete(_parser.get());
}

std::optional<Event> LibYamlEventSource::next() {
    if (_finished) {
        return std::nullopt;
    }

    yaml_event_t raw{};
    if (yaml_parser_parse(_parser.get(), &raw) == 0) {
        _finished = true;
        std::string problem = _parser->problem != nullptr ? _parser->problem : "parser error";
        if (_parser->context != nullptr) {
            problem = std::string(_parser->context) + ", " + problem;
        }
        throw ParseError(std::move(problem), to_mark(_parser->problem_mark));
    }
    RawEventGuard guard{&raw};

    Event out{};
    out.mark = to_mark(raw.start_mark);
    switch (raw.type) {
        case YAML_NO_EVENT:
            _finished = true;
            return std::nullopt;
        case YAML_STREAM_START_EVENT:
            out.kind = EventKind::StreamStart;
            out.encoding = to_encoding(raw.data.stream_start.encoding);
            break;
        case YAML_STREAM_END_EVENT:
            out.kind = EventKind::StreamEnd;
            _finished = true;
            break;
        case YAML_DOCUMENT_START_EVENT:
            out.kind = EventKind::DocumentStart;
            break;
        case YAML_DOCUMENT_END_EVENT:
            out.kind = EventKind::DocumentEnd;
            break;
        case YAML_ALIAS_EVENT:
            out.kind = EventKind::Alias;
            out.value = to_text(raw.data.alias.anchor);
            break;
        case YAML_SCALAR_EVENT:
            out.kind = EventKind::Scalar;
            out.value = to_text(raw.data.scalar.value, raw.data.scalar.length);
            out.style = to_style(raw.data.scalar.style);
            break;
        case YAML_SEQUENCE_START_EVENT:
            out.kind = EventKind::SequenceStart;
            break;
        case YAML_SEQUENCE_END_EVENT:
            out.kind = EventKind::SequenceEnd;
            break;
        case YAML_MAPPING_START_EVENT:
            out.kind = EventKind::MappingStart;
            break;
        case YAML_MAPPING_END_EVENT:
            out.kind = EventKind::MappingEnd;
            break;
    }
    return out;
}

}  // namespace lyn::yaml
