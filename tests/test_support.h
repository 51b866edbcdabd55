/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "suite/suite_error.h"
#include "yaml/yaml_event.h"

#include <optional>
#include <utility>
#include <vector>

namespace lyn::test {

using yaml::Event;

// Wraps top-level mapping entries in stream/document/mapping boundaries.
inline std::vector<Event> document_of(std::vector<Event> entries) {
    std::vector<Event> out;
    out.push_back(Event::stream_start());
    out.push_back(Event::document_start());
    out.push_back(Event::mapping_start());
    for (auto& e : entries) {
        out.push_back(std::move(e));
    }
    out.push_back(Event::mapping_end());
    out.push_back(Event::document_end());
    out.push_back(Event::stream_end());
    return out;
}

inline void append(std::vector<Event>& dst, std::vector<Event> src) {
    for (auto& e : src) {
        dst.push_back(std::move(e));
    }
}

// Events of a test element `[input, expected]`.
inline std::vector<Event> test_pair(const char* input, const char* expected) {
    return {
        Event::sequence_start(),
        Event::scalar(input, yaml::ScalarStyle::DoubleQuoted),
        Event::scalar(expected, yaml::ScalarStyle::DoubleQuoted),
        Event::sequence_end(),
    };
}

template <typename Fn>
std::optional<suite::DecodeError> decode_error_of(Fn&& fn) {
    try {
        fn();
    } catch (const suite::DecodeError& e) {
        return e;
    }
    return std::nullopt;
}

}  // namespace lyn::test
