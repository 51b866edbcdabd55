/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite/suite_field_decoders.h"

#include "suite/suite_error.h"
#include "utils/log.h"

#include <array>
#include <charconv>
#include <cstdint>
#include <string>
#include <utility>

namespace lyn::suite {
namespace {
enum class LegacyTableKey {
    Language,
    Grade,
    System,
    AssertMatch,
};

enum class FlagsKey {
    TestMode,
};

enum class TestAttribute {
    Xfail,
};

enum class XfailKey {
    Forward,
    Backward,
};

constexpr std::array<std::pair<std::string_view, LegacyTableKey>, 4> kLegacyTableKeys = {{
    {"language", LegacyTableKey::Language},
    {"grade", LegacyTableKey::Grade},
    {"system", LegacyTableKey::System},
    {"__assert-match", LegacyTableKey::AssertMatch},
}};

constexpr std::array<std::pair<std::string_view, FlagsKey>, 1> kFlagsKeys = {{
    {"testmode", FlagsKey::TestMode},
}};

constexpr std::array<std::pair<std::string_view, TestAttribute>, 1> kTestAttributes = {{
    {"xfail", TestAttribute::Xfail},
}};

// Part of the canonical test case, no source form decoded yet.
constexpr std::array<std::string_view, 5> kReservedTestAttributes = {
    "input_pos", "output_pos", "cursor_pos", "mode", "max_output_length",
};

constexpr std::array<std::pair<std::string_view, XfailKey>, 2> kXfailKeys = {{
    {"forward", XfailKey::Forward},
    {"backward", XfailKey::Backward},
}};

template <typename Key, std::size_t N>
std::optional<Key> lookup_key(
    const std::array<std::pair<std::string_view, Key>, N>& keys,
    std::string_view text
) {
    for (const auto& [name, key] : keys) {
        if (name == text) {
            return key;
        }
    }
    return std::nullopt;
}

bool is_reserved_test_attribute(std::string_view name) {
    for (const auto reserved : kReservedTestAttributes) {
        if (reserved == name) {
            return true;
        }
    }
    return false;
}

std::string parse_grade(const yaml::Event& value) {
    const std::string& text = value.value;
    std::uint8_t grade = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, grade);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw DecodeError::invalid_grade(value);
    }
    return std::to_string(static_cast<unsigned>(grade));
}

MetadataMap read_metadata_entries(EventReader& reader) {
    MetadataMap out{};
    while (true) {
        const yaml::Event key = reader.next("scalar or mapping end");
        if (key.kind == yaml::EventKind::MappingEnd) {
            break;
        }
        if (key.kind != yaml::EventKind::Scalar) {
            throw DecodeError::structural_mismatch("scalar or mapping end", key);
        }
        out.attributes[key.value] = reader.read_scalar().value;
    }
    return out;
}

FileList read_file_list(EventReader& reader) {
    FileList out{};
    while (true) {
        const yaml::Event item = reader.next("scalar or sequence end");
        if (item.kind == yaml::EventKind::SequenceEnd) {
            break;
        }
        if (item.kind != yaml::EventKind::Scalar) {
            throw DecodeError::structural_mismatch("scalar or sequence end", item);
        }
        out.paths.push_back(item.value);
    }
    return out;
}

XfailDirectional read_directional_xfail(EventReader& reader) {
    XfailDirectional out{};
    while (true) {
        const yaml::Event key = reader.next("scalar or mapping end");
        if (key.kind == yaml::EventKind::MappingEnd) {
            break;
        }
        if (key.kind != yaml::EventKind::Scalar) {
            throw DecodeError::structural_mismatch("scalar or mapping end", key);
        }
        const auto direction = lookup_key(kXfailKeys, key.value);
        if (!direction.has_value()) {
            throw DecodeError::unsupported_xfail_key(key);
        }
        const bool value = scalar_truthy(reader.read_scalar().value);
        switch (*direction) {
            case XfailKey::Forward:
                out.forward = value;
                break;
            case XfailKey::Backward:
                out.backward = value;
                break;
        }
    }
    return out;
}
}  // namespace

std::string_view to_string(SchemaRevision revision) {
    switch (revision) {
        case SchemaRevision::Current:
            return "current";
        case SchemaRevision::Legacy:
            return "legacy";
    }
    return "current";
}

std::optional<SchemaRevision> parse_schema_revision(std::string_view text) {
    if (text == "current") {
        return SchemaRevision::Current;
    }
    if (text == "legacy") {
        return SchemaRevision::Legacy;
    }
    return std::nullopt;
}

bool scalar_truthy(std::string_view text) {
    return !(text == "off" || text == "false");
}

Xfail xfail_from_scalar(std::string_view text) {
    if (text == "off" || text == "false") {
        return XfailFlag{false};
    }
    if (text == "on" || text == "true") {
        return XfailFlag{true};
    }
    return XfailReason{std::string(text)};
}

TableReference decode_table(EventReader& reader, SchemaRevision revision) {
    if (revision == SchemaRevision::Legacy) {
        return decode_legacy_table(reader);
    }
    return decode_table_by_shape(reader);
}

TableReference decode_table_by_shape(EventReader& reader) {
    yaml::Event event = reader.next("table");
    switch (event.kind) {
        case yaml::EventKind::MappingStart:
            return read_metadata_entries(reader);
        case yaml::EventKind::SequenceStart:
            return read_file_list(reader);
        case yaml::EventKind::Scalar:
            if (event.style == yaml::ScalarStyle::Plain) {
                return SingleFile{std::move(event.value)};
            }
            if (event.style == yaml::ScalarStyle::Literal) {
                return InlineDefinition{std::move(event.value)};
            }
            throw DecodeError::unsupported_table_shape(event);
        default:
            throw DecodeError::unsupported_table_shape(event);
    }
}

MetadataMap decode_legacy_table(EventReader& reader) {
    reader.expect_mapping_start();
    MetadataMap out{};
    while (true) {
        const yaml::Event key = reader.next("scalar or mapping end");
        if (key.kind == yaml::EventKind::MappingEnd) {
            break;
        }
        if (key.kind != yaml::EventKind::Scalar) {
            throw DecodeError::structural_mismatch("scalar or mapping end", key);
        }
        const auto field = lookup_key(kLegacyTableKeys, key.value);
        if (!field.has_value()) {
            throw DecodeError::unknown_field(key);
        }
        const yaml::Event value = reader.read_scalar();
        switch (*field) {
            case LegacyTableKey::Grade:
                out.attributes[key.value] = parse_grade(value);
                break;
            case LegacyTableKey::Language:
            case LegacyTableKey::System:
            case LegacyTableKey::AssertMatch:
                out.attributes[key.value] = value.value;
                break;
        }
    }
    return out;
}

TestMode decode_flags(EventReader& reader) {
    reader.expect_mapping_start();
    const yaml::Event key = reader.read_scalar();
    if (!lookup_key(kFlagsKeys, key.value).has_value()) {
        throw DecodeError::unknown_field(key);
    }
    const yaml::Event value = reader.read_scalar();
    const auto mode = parse_test_mode(value.value);
    if (!mode.has_value()) {
        throw DecodeError::unsupported_test_mode(value);
    }
    reader.expect_mapping_end();
    return *mode;
}

Xfail decode_xfail(EventReader& reader) {
    const yaml::Event event = reader.next("xfail value");
    switch (event.kind) {
        case yaml::EventKind::Scalar:
            return xfail_from_scalar(event.value);
        case yaml::EventKind::MappingStart:
            return read_directional_xfail(reader);
        default:
            throw DecodeError::unsupported_xfail_shape(event);
    }
}

TestCase decode_test(EventReader& reader) {
    TestCase test{};
    test.input = reader.read_scalar().value;
    test.expected = reader.read_scalar().value;

    const yaml::Event next = reader.next("sequence end or mapping start");
    if (next.kind == yaml::EventKind::SequenceEnd) {
        return test;
    }
    if (next.kind != yaml::EventKind::MappingStart) {
        throw DecodeError::structural_mismatch("sequence end or mapping start", next);
    }

    while (true) {
        const yaml::Event key = reader.next("scalar or mapping end");
        if (key.kind == yaml::EventKind::MappingEnd) {
            break;
        }
        if (key.kind != yaml::EventKind::Scalar) {
            throw DecodeError::structural_mismatch("scalar or mapping end", key);
        }
        const auto attribute = lookup_key(kTestAttributes, key.value);
        if (!attribute.has_value()) {
            if (is_reserved_test_attribute(key.value)) {
                throw DecodeError::unknown_test_attribute(key, "not decoded from source documents");
            }
            throw DecodeError::unknown_test_attribute(key);
        }
        switch (*attribute) {
            case TestAttribute::Xfail:
                test.xfail = decode_xfail(reader);
                break;
        }
    }

    reader.expect_sequence_end();
    return test;
}

std::vector<TestCase> decode_tests(EventReader& reader) {
    reader.expect_sequence_start();
    std::vector<TestCase> tests;
    while (true) {
        const yaml::Event event = reader.next("sequence start or sequence end");
        if (event.kind == yaml::EventKind::SequenceEnd) {
            break;
        }
        if (event.kind != yaml::EventKind::SequenceStart) {
            throw DecodeError::structural_mismatch("sequence start or sequence end", event);
        }
        tests.push_back(decode_test(reader));
    }
    LYN_LOG_DEBUG("Decoded %zu test case(s)", tests.size());
    return tests;
}

}  // namespace lyn::suite
