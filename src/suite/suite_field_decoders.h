/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "suite/suite_event_reader.h"
#include "suite/suite_model.h"

#include <optional>
#include <string_view>
#include <vector>

namespace lyn::suite {

/**
 * Which historical form of the test-suite schema a document is read as.
 *
 * Documents carry no version marker, and the fixed-key table mapping of the
 * legacy form cannot be told apart from a metadata mapping by shape, so the
 * revision is always chosen explicitly by the caller.
 *
 * - Current: the table is selected by shape (mapping, plain scalar, literal
 *            block, sequence) and every `tests` block emits one suite.
 * - Legacy:  the table is a mapping with the fixed keys `language`, `grade`,
 *            `system` and `__assert-match`, and each document yields one suite.
 */
enum class SchemaRevision {
    Current,
    Legacy,
};

std::string_view to_string(SchemaRevision revision);
std::optional<SchemaRevision> parse_schema_revision(std::string_view text);

// `off` and `false` are false, anything else is true.
bool scalar_truthy(std::string_view text);
Xfail xfail_from_scalar(std::string_view text);

TableReference decode_table(EventReader& reader, SchemaRevision revision);
TableReference decode_table_by_shape(EventReader& reader);
MetadataMap decode_legacy_table(EventReader& reader);

TestMode decode_flags(EventReader& reader);

Xfail decode_xfail(EventReader& reader);

// Decodes one test element; its opening sequence start is already consumed.
TestCase decode_test(EventReader& reader);
std::vector<TestCase> decode_tests(EventReader& reader);

}  // namespace lyn::suite
