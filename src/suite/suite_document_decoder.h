/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "suite/suite_event_reader.h"
#include "suite/suite_field_decoders.h"
#include "suite/suite_model.h"
#include "yaml/yaml_event.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lyn::suite {

struct DecodeOptions {
    SchemaRevision revision = SchemaRevision::Current;
};

enum class TopLevelField {
    Display,
    Table,
    Flags,
    Tests,
};

std::optional<TopLevelField> parse_top_level_field(std::string_view text);

/**
 * Suite-level fields accumulated while walking the top-level mapping.
 *
 * The builder is a value: each with_* call returns an updated copy, so a
 * decoding step takes the previous state and returns the next one. Fields
 * persist across `tests` blocks; a suite built later carries whatever was
 * set most recently.
 */
class SuiteBuilder {
   public:
    SuiteBuilder with_display(std::string display_table) const;
    SuiteBuilder with_table(TableReference table) const;
    SuiteBuilder with_mode(TestMode mode) const;
    SuiteBuilder with_tests(std::vector<TestCase> tests) const;

    bool has_table() const { return _table.has_value(); }
    const std::optional<std::string>& display_table() const { return _display_table; }
    TestMode mode() const { return _mode; }
    const std::vector<TestCase>& tests() const { return _tests; }

    // Throws MissingTable (reported at `mark`) when no table was declared.
    TestSuite build(std::vector<TestCase> tests, const yaml::Mark& mark) const;

   private:
    std::optional<std::string> _display_table;
    std::optional<TableReference> _table;
    TestMode _mode = TestMode::Forward;
    std::vector<TestCase> _tests;
};

struct DocumentState {
    SuiteBuilder builder;
    std::vector<TestSuite> suites;
};

/**
 * One iteration of the top-level loop: decodes the value of `field` (whose
 * key event is `key`) and returns the resulting state.
 *
 * With SchemaRevision::Current a `tests` block immediately emits a suite;
 * with SchemaRevision::Legacy it only replaces the pending test list.
 */
DocumentState apply_top_level_field(
    DocumentState state,
    TopLevelField field,
    const yaml::Event& key,
    EventReader& reader,
    const DecodeOptions& options
);

// Suites of a document once its top-level mapping has closed.
std::vector<TestSuite> finish_document(
    DocumentState state,
    const DecodeOptions& options,
    const yaml::Mark& mark
);

/**
 * Decodes one whole stream: stream start (UTF-8), document start, the
 * top-level mapping, document end, stream end. Returns the suites in
 * declaration order.
 */
std::vector<TestSuite> decode_document(yaml::EventSource& source, const DecodeOptions& options = {});

}  // namespace lyn::suite
