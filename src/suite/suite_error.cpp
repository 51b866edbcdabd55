/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite/suite_error.h"

#include <utility>

namespace lyn::suite {
namespace {
std::string format_message(
    ErrorKind kind,
    const std::string& subject,
    const std::string& expected,
    const std::string& actual,
    const yaml::Mark& mark
) {
    std::string msg;
    switch (kind) {
        case ErrorKind::StructuralMismatch:
        case ErrorKind::UnexpectedEndOfInput:
            msg = "Expected " + expected + ", got " + actual;
            break;
        case ErrorKind::UnsupportedTableShape:
            msg = "Unsupported table shape: " + actual;
            break;
        case ErrorKind::UnsupportedTestMode:
            msg = "Testmode \"" + subject + "\" not supported";
            break;
        case ErrorKind::UnsupportedXfailShape:
            msg = "Unsupported xfail value: " + actual;
            break;
        case ErrorKind::UnsupportedXfailKey:
            msg = "Expected 'forward' or 'backward' in xfail, got \"" + subject + "\"";
            break;
        case ErrorKind::UnknownField:
            msg = "Unknown field \"" + subject + "\"";
            break;
        case ErrorKind::UnknownTestAttribute:
            msg = "Unknown test attribute \"" + subject + "\"";
            if (!actual.empty()) {
                msg += " (" + actual + ")";
            }
            break;
        case ErrorKind::InvalidGrade:
            msg = "Invalid table grade \"" + subject + "\"";
            break;
        case ErrorKind::UnexpectedEncoding:
            msg = "Encoding " + subject + " not supported";
            break;
        case ErrorKind::MissingTable:
            msg = "Test cases declared before any table";
            break;
        case ErrorKind::MalformedInput:
            msg = "Malformed YAML: " + subject;
            break;
    }
    if (mark.known()) {
        msg += " at line " + std::to_string(mark.line) + ", column " + std::to_string(mark.column);
    }
    return msg;
}
}  // namespace

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::StructuralMismatch:
            return "StructuralMismatch";
        case ErrorKind::UnsupportedTableShape:
            return "UnsupportedTableShape";
        case ErrorKind::UnsupportedTestMode:
            return "UnsupportedTestMode";
        case ErrorKind::UnsupportedXfailShape:
            return "UnsupportedXfailShape";
        case ErrorKind::UnsupportedXfailKey:
            return "UnsupportedXfailKey";
        case ErrorKind::UnknownField:
            return "UnknownField";
        case ErrorKind::UnknownTestAttribute:
            return "UnknownTestAttribute";
        case ErrorKind::InvalidGrade:
            return "InvalidGrade";
        case ErrorKind::UnexpectedEncoding:
            return "UnexpectedEncoding";
        case ErrorKind::UnexpectedEndOfInput:
            return "UnexpectedEndOfInput";
        case ErrorKind::MissingTable:
            return "MissingTable";
        case ErrorKind::MalformedInput:
            return "MalformedInput";
    }
    return "Unknown";
}

DecodeError::DecodeError(
    ErrorKind kind,
    std::string subject,
    std::string expected,
    std::string actual,
    yaml::Mark mark
)
    : std::runtime_error(format_message(kind, subject, expected, actual, mark)),
      _kind(kind),
      _subject(std::move(subject)),
      _expected(std::move(expected)),
      _actual(std::move(actual)),
      _mark(mark) {}

DecodeError DecodeError::structural_mismatch(std::string_view expected, const yaml::Event& actual) {
    return DecodeError(
        ErrorKind::StructuralMismatch, {}, std::string(expected), yaml::describe(actual), actual.mark
    );
}

DecodeError DecodeError::end_of_input(std::string_view expected) {
    return DecodeError(
        ErrorKind::UnexpectedEndOfInput, {}, std::string(expected), "end of input", {}
    );
}

DecodeError DecodeError::unexpected_encoding(const yaml::Event& stream_start) {
    return DecodeError(
        ErrorKind::UnexpectedEncoding, std::string(yaml::to_string(stream_start.encoding)), "UTF-8",
        {}, stream_start.mark
    );
}

DecodeError DecodeError::unsupported_table_shape(const yaml::Event& actual) {
    std::string shown = yaml::describe(actual);
    if (actual.kind == yaml::EventKind::Scalar) {
        shown += " (" + std::string(yaml::to_string(actual.style)) + ")";
    }
    return DecodeError(ErrorKind::UnsupportedTableShape, {}, {}, std::move(shown), actual.mark);
}

DecodeError DecodeError::unsupported_test_mode(const yaml::Event& value) {
    return DecodeError(ErrorKind::UnsupportedTestMode, value.value, {}, {}, value.mark);
}

DecodeError DecodeError::unsupported_xfail_shape(const yaml::Event& actual) {
    return DecodeError(
        ErrorKind::UnsupportedXfailShape, {}, {}, yaml::describe(actual), actual.mark
    );
}

DecodeError DecodeError::unsupported_xfail_key(const yaml::Event& key) {
    return DecodeError(ErrorKind::UnsupportedXfailKey, key.value, {}, {}, key.mark);
}

DecodeError DecodeError::unknown_field(const yaml::Event& key) {
    return DecodeError(ErrorKind::UnknownField, key.value, {}, {}, key.mark);
}

DecodeError DecodeError::unknown_test_attribute(const yaml::Event& key, std::string_view note) {
    return DecodeError(ErrorKind::UnknownTestAttribute, key.value, {}, std::string(note), key.mark);
}

DecodeError DecodeError::invalid_grade(const yaml::Event& value) {
    return DecodeError(ErrorKind::InvalidGrade, value.value, {}, {}, value.mark);
}

DecodeError DecodeError::missing_table(const yaml::Mark& mark) {
    return DecodeError(ErrorKind::MissingTable, {}, {}, {}, mark);
}

DecodeError DecodeError::malformed_input(std::string problem, yaml::Mark mark) {
    return DecodeError(ErrorKind::MalformedInput, std::move(problem), {}, {}, mark);
}

}  // namespace lyn::suite
