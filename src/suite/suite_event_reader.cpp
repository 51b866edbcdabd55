/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite/suite_event_reader.h"

#include "suite/suite_error.h"
#include "yaml/yaml_error.h"

#include <optional>
#include <utility>

namespace lyn::suite {

yaml::Event EventReader::next(std::string_view expected) {
    std::optional<yaml::Event> event;
    try {
        event = _source.next();
    } catch (const yaml::ParseError& e) {
        throw DecodeError::malformed_input(e.problem(), e.mark());
    }
    if (!event.has_value()) {
        throw DecodeError::end_of_input(expected);
    }
    _events_read++;
    if (event->mark.known()) {
        _last_mark = event->mark;
    }
    return std::move(*event);
}

yaml::Event EventReader::expect(yaml::EventKind kind) {
    const std::string_view expected = yaml::to_string(kind);
    yaml::Event event = next(expected);
    if (event.kind != kind) {
        throw DecodeError::structural_mismatch(expected, event);
    }
    return event;
}

void EventReader::expect_stream_start() {
    const yaml::Event event = expect(yaml::EventKind::StreamStart);
    if (event.encoding != yaml::Encoding::Utf8) {
        throw DecodeError::unexpected_encoding(event);
    }
}

void EventReader::expect_stream_end() {
    expect(yaml::EventKind::StreamEnd);
}

void EventReader::expect_document_start() {
    expect(yaml::EventKind::DocumentStart);
}

void EventReader::expect_document_end() {
    expect(yaml::EventKind::DocumentEnd);
}

void EventReader::expect_mapping_start() {
    expect(yaml::EventKind::MappingStart);
}

void EventReader::expect_mapping_end() {
    expect(yaml::EventKind::MappingEnd);
}

void EventReader::expect_sequence_start() {
    expect(yaml::EventKind::SequenceStart);
}

void EventReader::expect_sequence_end() {
    expect(yaml::EventKind::SequenceEnd);
}

yaml::Event EventReader::read_scalar() {
    return expect(yaml::EventKind::Scalar);
}

}  // namespace lyn::suite
