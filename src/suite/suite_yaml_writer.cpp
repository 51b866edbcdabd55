/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite/suite_yaml_writer.h"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace lyn::suite {
namespace {
// Double quoted so text such as `yes` or `123` is never read back as a bool or number.
void emit_text(YAML::Emitter& out, const std::string& text) {
    out << YAML::DoubleQuoted << text;
}

void emit_table(YAML::Emitter& out, const TableReference& table) {
    out << YAML::BeginMap;
    out << YAML::Key << std::string(variant_name(table)) << YAML::Value;
    if (const auto* file = std::get_if<SingleFile>(&table)) {
        emit_text(out, file->path);
    } else if (const auto* list = std::get_if<FileList>(&table)) {
        out << YAML::BeginSeq;
        for (const auto& path : list->paths) {
            emit_text(out, path);
        }
        out << YAML::EndSeq;
    } else if (const auto* body = std::get_if<InlineDefinition>(&table)) {
        out << YAML::Literal << body->text;
    } else if (const auto* meta = std::get_if<MetadataMap>(&table)) {
        out << YAML::BeginMap;
        for (const auto& [key, value] : meta->attributes) {
            out << YAML::Key;
            emit_text(out, key);
            out << YAML::Value;
            emit_text(out, value);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
}

void emit_xfail(YAML::Emitter& out, const Xfail& xfail) {
    if (const auto* reason = std::get_if<XfailReason>(&xfail)) {
        emit_text(out, reason->reason);
    } else if (const auto* directional = std::get_if<XfailDirectional>(&xfail)) {
        out << YAML::BeginMap;
        if (directional->forward) {
            out << YAML::Key << "forward" << YAML::Value << true;
        }
        if (directional->backward) {
            out << YAML::Key << "backward" << YAML::Value << true;
        }
        out << YAML::EndMap;
    } else {
        out << true;
    }
}

void emit_positions(YAML::Emitter& out, const char* key, const std::vector<std::uint16_t>& positions) {
    if (positions.empty()) {
        return;
    }
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto pos : positions) {
        out << static_cast<unsigned>(pos);
    }
    out << YAML::EndSeq;
}

void emit_test(YAML::Emitter& out, const TestCase& test) {
    out << YAML::BeginMap;
    out << YAML::Key << "input" << YAML::Value;
    emit_text(out, test.input);
    out << YAML::Key << "expected" << YAML::Value;
    emit_text(out, test.expected);
    if (is_expected_failure(test.xfail)) {
        out << YAML::Key << "xfail" << YAML::Value;
        emit_xfail(out, test.xfail);
    }
    emit_positions(out, "input_pos", test.input_positions);
    emit_positions(out, "output_pos", test.output_positions);
    if (test.cursor_position.has_value()) {
        out << YAML::Key << "cursor_pos" << YAML::Value
            << static_cast<unsigned>(*test.cursor_position);
    }
    if (!test.mode_flags.empty()) {
        out << YAML::Key << "mode" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto flag : test.mode_flags) {
            out << std::string(to_string(flag));
        }
        out << YAML::EndSeq;
    }
    if (test.max_output_length.has_value()) {
        out << YAML::Key << "max_output_length" << YAML::Value
            << static_cast<unsigned>(*test.max_output_length);
    }
    out << YAML::EndMap;
}

void emit_suite(YAML::Emitter& out, const TestSuite& suite) {
    out << YAML::BeginMap;
    if (suite.display_table.has_value()) {
        out << YAML::Key << "display_table" << YAML::Value;
        emit_text(out, *suite.display_table);
    }
    out << YAML::Key << "table" << YAML::Value;
    emit_table(out, suite.table);
    out << YAML::Key << "mode" << YAML::Value << std::string(to_string(suite.mode));
    if (!suite.tests.empty()) {
        out << YAML::Key << "tests" << YAML::Value << YAML::BeginSeq;
        for (const auto& test : suite.tests) {
            emit_test(out, test);
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
}
}  // namespace

std::string write_suites_yaml(const std::vector<TestSuite>& suites) {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& suite : suites) {
        emit_suite(out, suite);
    }
    out << YAML::EndSeq;
    if (!out.good()) {
        throw std::logic_error(std::string("YAML emitter rejected suite model: ") + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

}  // namespace lyn::suite
