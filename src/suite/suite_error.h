/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "yaml/yaml_event.h"

#include <stdexcept>
#include <string>
#include <string_view>

namespace lyn::suite {

enum class ErrorKind {
    StructuralMismatch,
    UnsupportedTableShape,
    UnsupportedTestMode,
    UnsupportedXfailShape,
    UnsupportedXfailKey,
    UnknownField,
    UnknownTestAttribute,
    InvalidGrade,
    UnexpectedEncoding,
    UnexpectedEndOfInput,
    MissingTable,
    MalformedInput,
};

std::string_view to_string(ErrorKind kind);

/**
 * Fatal decoding failure. Every decoder stops at the first one and lets it
 * propagate unchanged; there is no partial result.
 *
 * subject() holds the offending name or value (field name, test mode spelling,
 * grade text, ...). For StructuralMismatch and UnexpectedEndOfInput,
 * expected() and actual() describe the event kinds involved.
 */
class DecodeError : public std::runtime_error {
   public:
    DecodeError(
        ErrorKind kind,
        std::string subject,
        std::string expected,
        std::string actual,
        yaml::Mark mark
    );

    ErrorKind kind() const { return _kind; }
    const std::string& subject() const { return _subject; }
    const std::string& expected() const { return _expected; }
    const std::string& actual() const { return _actual; }
    const yaml::Mark& mark() const { return _mark; }

    static DecodeError structural_mismatch(std::string_view expected, const yaml::Event& actual);
    static DecodeError end_of_input(std::string_view expected);
    static DecodeError unexpected_encoding(const yaml::Event& stream_start);
    static DecodeError unsupported_table_shape(const yaml::Event& actual);
    static DecodeError unsupported_test_mode(const yaml::Event& value);
    static DecodeError unsupported_xfail_shape(const yaml::Event& actual);
    static DecodeError unsupported_xfail_key(const yaml::Event& key);
    static DecodeError unknown_field(const yaml::Event& key);
    static DecodeError unknown_test_attribute(const yaml::Event& key, std::string_view note = {});
    static DecodeError invalid_grade(const yaml::Event& value);
    static DecodeError missing_table(const yaml::Mark& mark);
    static DecodeError malformed_input(std::string problem, yaml::Mark mark);

   private:
    ErrorKind _kind;
    std::string _subject;
    std::string _expected;
    std::string _actual;
    yaml::Mark _mark;
};

}  // namespace lyn::suite
