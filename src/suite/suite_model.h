/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lyn::suite {

enum class TestMode {
    Forward,
    Backward,
    BothDirections,
    Display,
    Hyphenate,
    HyphenateBraille,
};

// Spellings shared by the source `testmode` flag and the canonical output.
std::string_view to_string(TestMode mode);
std::optional<TestMode> parse_test_mode(std::string_view text);

struct SingleFile {
    std::string path;
};

// Table files applied in order.
struct FileList {
    std::vector<std::string> paths;
};

// Table body written directly in the document.
struct InlineDefinition {
    std::string text;
};

// Table selected by attributes (language, grade, system, __assert-match).
struct MetadataMap {
    std::map<std::string, std::string> attributes;
};

using TableReference = std::variant<SingleFile, FileList, InlineDefinition, MetadataMap>;

std::string_view variant_name(const TableReference& table);

struct XfailFlag {
    bool value = false;
};

struct XfailReason {
    std::string reason;
};

struct XfailDirectional {
    bool forward = false;
    bool backward = false;
};

using Xfail = std::variant<XfailFlag, XfailReason, XfailDirectional>;

/// True when the marker says the case fails in at least one direction.
bool is_expected_failure(const Xfail& xfail);

enum class ModeFlag {
    NoContractions,
    CompbrlAtCursor,
    DotsIo,
    CompbrlLeftCursor,
    UcBrl,
    NoUndefined,
    PartialTrans,
};

std::string_view to_string(ModeFlag flag);

/**
 * One input/expected pair.
 *
 * The position, cursor, mode and output length attributes belong to the
 * canonical schema but no source form of them is decoded yet, so decoded
 * cases always carry their defaults.
 */
struct TestCase {
    std::string input;
    std::string expected;
    Xfail xfail = XfailFlag{false};
    std::vector<std::uint16_t> input_positions;
    std::vector<std::uint16_t> output_positions;
    std::optional<std::uint16_t> cursor_position;
    std::set<ModeFlag> mode_flags;
    std::optional<std::uint16_t> max_output_length;
};

struct TestSuite {
    std::optional<std::string> display_table;
    TableReference table;
    TestMode mode = TestMode::Forward;
    std::vector<TestCase> tests;
};

}  // namespace lyn::suite
