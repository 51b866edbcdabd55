/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite/suite_document_decoder.h"

#include "suite/suite_error.h"
#include "utils/log.h"

#include <array>
#include <utility>

namespace lyn::suite {
namespace {
constexpr std::array<std::pair<std::string_view, TopLevelField>, 4> kTopLevelFields = {{
    {"display", TopLevelField::Display},
    {"table", TopLevelField::Table},
    {"flags", TopLevelField::Flags},
    {"tests", TopLevelField::Tests},
}};
}  // namespace

std::optional<TopLevelField> parse_top_level_field(std::string_view text) {
    for (const auto& [name, field] : kTopLevelFields) {
        if (name == text) {
            return field;
        }
    }
    return std::nullopt;
}

SuiteBuilder SuiteBuilder::with_display(std::string display_table) const {
    SuiteBuilder next = *this;
    next._display_table = std::move(display_table);
    return next;
}

SuiteBuilder SuiteBuilder::with_table(TableReference table) const {
    SuiteBuilder next = *this;
    next._table = std::move(table);
    return next;
}

SuiteBuilder SuiteBuilder::with_mode(TestMode mode) const {
    SuiteBuilder next = *this;
    next._mode = mode;
    return next;
}

SuiteBuilder SuiteBuilder::with_tests(std::vector<TestCase> tests) const {
    SuiteBuilder next = *this;
    next._tests = std::move(tests);
    return next;
}

TestSuite SuiteBuilder::build(std::vector<TestCase> tests, const yaml::Mark& mark) const {
    if (!_table.has_value()) {
        throw DecodeError::missing_table(mark);
    }
    TestSuite suite{};
    suite.display_table = _display_table;
    suite.table = *_table;
    suite.mode = _mode;
    suite.tests = std::move(tests);
    return suite;
}

DocumentState apply_top_level_field(
    DocumentState state,
    TopLevelField field,
    const yaml::Event& key,
    EventReader& reader,
    const DecodeOptions& options
) {
    switch (field) {
        case TopLevelField::Display:
            state.builder = state.builder.with_display(reader.read_scalar().value);
            break;
        case TopLevelField::Table: {
            auto table = decode_table(reader, options.revision);
            LYN_LOG_DEBUG(
                "Table (%.*s) declared at line %zu", static_cast<int>(variant_name(table).size()),
                variant_name(table).data(), key.mark.line
            );
            state.builder = state.builder.with_table(std::move(table));
            break;
        }
        case TopLevelField::Flags:
            state.builder = state.builder.with_mode(decode_flags(reader));
            break;
        case TopLevelField::Tests: {
            auto tests = decode_tests(reader);
            if (options.revision == SchemaRevision::Legacy) {
                state.builder = state.builder.with_tests(std::move(tests));
                break;
            }
            state.suites.push_back(state.builder.build(std::move(tests), key.mark));
            break;
        }
    }
    return state;
}

std::vector<TestSuite> finish_document(
    DocumentState state,
    const DecodeOptions& options,
    const yaml::Mark& mark
) {
    if (options.revision == SchemaRevision::Legacy) {
        auto tests = state.builder.tests();
        state.suites.push_back(state.builder.build(std::move(tests), mark));
    } else if (state.suites.empty() && state.builder.has_table()) {
        LYN_LOG_WARN("Table declared without a tests block, no suite emitted");
    }
    return std::move(state.suites);
}

std::vector<TestSuite> decode_document(yaml::EventSource& source, const DecodeOptions& options) {
    EventReader reader(source);

    reader.expect_stream_start();
    reader.expect_document_start();
    reader.expect_mapping_start();

    DocumentState state{};
    while (true) {
        const yaml::Event key = reader.next("scalar or mapping end");
        if (key.kind == yaml::EventKind::MappingEnd) {
            break;
        }
        if (key.kind != yaml::EventKind::Scalar) {
            throw DecodeError::structural_mismatch("scalar or mapping end", key);
        }
        const auto field = parse_top_level_field(key.value);
        if (!field.has_value()) {
            throw DecodeError::unknown_field(key);
        }
        state = apply_top_level_field(std::move(state), *field, key, reader, options);
    }
    const yaml::Mark end_mark = reader.last_mark();

    reader.expect_document_end();
    reader.expect_stream_end();

    auto suites = finish_document(std::move(state), options, end_mark);
    LYN_LOG_DEBUG(
        "Decoded %zu suite(s) from %zu events (%.*s schema)", suites.size(), reader.events_read(),
        static_cast<int>(to_string(options.revision).size()), to_string(options.revision).data()
    );
    return suites;
}

}  // namespace lyn::suite
