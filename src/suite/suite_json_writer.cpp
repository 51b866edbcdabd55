/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite/suite_json_writer.h"

#include <string>

namespace lyn::suite {
namespace {
nlohmann::ordered_json table_to_json(const TableReference& table) {
    nlohmann::ordered_json value;
    if (const auto* file = std::get_if<SingleFile>(&table)) {
        value = file->path;
    } else if (const auto* list = std::get_if<FileList>(&table)) {
        value = nlohmann::ordered_json::array();
        for (const auto& path : list->paths) {
            value.push_back(path);
        }
    } else if (const auto* body = std::get_if<InlineDefinition>(&table)) {
        value = body->text;
    } else if (const auto* meta = std::get_if<MetadataMap>(&table)) {
        value = nlohmann::ordered_json::object();
        for (const auto& [key, attr] : meta->attributes) {
            value[key] = attr;
        }
    }
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out[std::string(variant_name(table))] = std::move(value);
    return out;
}

nlohmann::ordered_json xfail_to_json(const Xfail& xfail) {
    if (const auto* reason = std::get_if<XfailReason>(&xfail)) {
        return reason->reason;
    }
    if (const auto* directional = std::get_if<XfailDirectional>(&xfail)) {
        nlohmann::ordered_json out = nlohmann::ordered_json::object();
        if (directional->forward) {
            out["forward"] = true;
        }
        if (directional->backward) {
            out["backward"] = true;
        }
        return out;
    }
    return true;
}

nlohmann::ordered_json test_to_json(const TestCase& test) {
    nlohmann::ordered_json out = {
        {"input", test.input},
        {"expected", test.expected},
    };
    if (is_expected_failure(test.xfail)) {
        out["xfail"] = xfail_to_json(test.xfail);
    }
    if (!test.input_positions.empty()) {
        out["input_pos"] = test.input_positions;
    }
    if (!test.output_positions.empty()) {
        out["output_pos"] = test.output_positions;
    }
    if (test.cursor_position.has_value()) {
        out["cursor_pos"] = *test.cursor_position;
    }
    if (!test.mode_flags.empty()) {
        auto& modes = out["mode"] = nlohmann::ordered_json::array();
        for (const auto flag : test.mode_flags) {
            modes.push_back(std::string(to_string(flag)));
        }
    }
    if (test.max_output_length.has_value()) {
        out["max_output_length"] = *test.max_output_length;
    }
    return out;
}

nlohmann::ordered_json suite_to_json(const TestSuite& suite) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    if (suite.display_table.has_value()) {
        out["display_table"] = *suite.display_table;
    }
    out["table"] = table_to_json(suite.table);
    out["mode"] = std::string(to_string(suite.mode));
    if (!suite.tests.empty()) {
        auto& tests = out["tests"] = nlohmann::ordered_json::array();
        for (const auto& test : suite.tests) {
            tests.push_back(test_to_json(test));
        }
    }
    return out;
}
}  // namespace

nlohmann::ordered_json suites_to_json(const std::vector<TestSuite>& suites) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& suite : suites) {
        out.push_back(suite_to_json(suite));
    }
    return out;
}

std::string write_suites_json(const std::vector<TestSuite>& suites) {
    return suites_to_json(suites).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
           + "\n";
}

}  // namespace lyn::suite
