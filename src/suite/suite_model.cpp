/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite/suite_model.h"

#include <array>
#include <utility>

namespace lyn::suite {
namespace {
constexpr std::array<std::pair<std::string_view, TestMode>, 6> kTestModes = {{
    {"forward", TestMode::Forward},
    {"backward", TestMode::Backward},
    {"bothDirections", TestMode::BothDirections},
    {"display", TestMode::Display},
    {"hyphenate", TestMode::Hyphenate},
    {"hyphenateBraille", TestMode::HyphenateBraille},
}};

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}  // namespace

std::string_view to_string(TestMode mode) {
    for (const auto& [name, value] : kTestModes) {
        if (value == mode) {
            return name;
        }
    }
    return "forward";
}

std::optional<TestMode> parse_test_mode(std::string_view text) {
    for (const auto& [name, value] : kTestModes) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view variant_name(const TableReference& table) {
    return std::visit(
        overloaded{
            [](const SingleFile&) { return std::string_view("file"); },
            [](const FileList&) { return std::string_view("files"); },
            [](const InlineDefinition&) { return std::string_view("inline"); },
            [](const MetadataMap&) { return std::string_view("metadata"); },
        },
        table
    );
}

bool is_expected_failure(const Xfail& xfail) {
    return std::visit(
        overloaded{
            [](const XfailFlag& f) { return f.value; },
            [](const XfailReason&) { return true; },
            [](const XfailDirectional& d) { return d.forward || d.backward; },
        },
        xfail
    );
}

std::string_view to_string(ModeFlag flag) {
    switch (flag) {
        case ModeFlag::NoContractions:
            return "noContractions";
        case ModeFlag::CompbrlAtCursor:
            return "compbrlAtCursor";
        case ModeFlag::DotsIo:
            return "dotsIo";
        case ModeFlag::CompbrlLeftCursor:
            return "compbrlLeftCursor";
        case ModeFlag::UcBrl:
            return "ucBrl";
        case ModeFlag::NoUndefined:
            return "noUndefined";
        case ModeFlag::PartialTrans:
            return "partialTrans";
    }
    return "unknown";
}

}  // namespace lyn::suite
