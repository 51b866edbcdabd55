/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <catch2/catch.hpp>

#include "suite_normalizer.h"
#include "test_support.h"
#include "utils/fs_utils.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

using namespace lyn::suite;
using lyn::test::decode_error_of;

namespace fs = std::filesystem;

namespace {
std::vector<TestSuite> normalize(const std::string& text, SchemaRevision revision = SchemaRevision::Current) {
    NormalizeOptions opt{};
    opt.revision = revision;
    return SuiteNormalizer::NormalizeYamlText(text, opt).suites;
}

ErrorKind error_kind_of(const std::string& text, SchemaRevision revision = SchemaRevision::Current) {
    const auto err = decode_error_of([&] { normalize(text, revision); });
    REQUIRE(err.has_value());
    return err->kind();
}
}  // namespace

TEST_CASE("Backward suite with a single file table", "[normalizer]")
{
    const auto res = SuiteNormalizer::NormalizeYamlText(
        "table: mytable.ctb\n"
        "flags: {testmode: backward}\n"
        "tests: [[ \"abc\", \"⠁⠃⠉\" ]]\n"
    );
    REQUIRE(res.suites.size() == 1);
    const TestSuite& suite = res.suites[0];
    REQUIRE(std::get<SingleFile>(suite.table).path == "mytable.ctb");
    REQUIRE(suite.mode == TestMode::Backward);
    REQUIRE(suite.tests.size() == 1);
    REQUIRE(suite.tests[0].input == "abc");
    REQUIRE(suite.tests[0].expected == "⠁⠃⠉");
    REQUIRE_FALSE(is_expected_failure(suite.tests[0].xfail));

    const YAML::Node out = YAML::Load(res.text);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0]["table"]["file"].as<std::string>() == "mytable.ctb");
    REQUIRE(out[0]["mode"].as<std::string>() == "backward");
    REQUIRE(out[0]["tests"][0]["expected"].as<std::string>() == "⠁⠃⠉");
}

TEST_CASE("Scalar test data keeps its string type through normalization", "[normalizer]")
{
    const auto res = SuiteNormalizer::NormalizeYamlText(
        "table: a.ctb\n"
        "tests: [[\"yes\", \"no\"], [\"true\", \"~\"], [\"123\", \"null\"], [a, b, {xfail: \"yes\"}]]\n"
    );
    const YAML::Node tests = YAML::Load(res.text)[0]["tests"];
    REQUIRE(tests.size() == 4);
    for (const auto& key : {"input", "expected"}) {
        for (std::size_t i = 0; i < 3; i++) {
            REQUIRE(tests[i][key].Tag() == "!");
        }
    }
    REQUIRE(tests[0]["input"].Scalar() == "yes");
    REQUIRE(tests[1]["expected"].Scalar() == "~");
    REQUIRE(tests[2]["input"].Scalar() == "123");
    REQUIRE(tests[3]["xfail"].Tag() == "!");
    REQUIRE(tests[3]["xfail"].Scalar() == "yes");

    NormalizeOptions opt{};
    opt.format = OutputFormat::Json;
    const auto json = nlohmann::json::parse(SuiteNormalizer::NormalizeYamlText(
        "table: a.ctb\ntests: [[\"123\", \"true\"]]\n", opt
    ).text);
    REQUIRE(json[0]["tests"][0]["input"] == "123");
    REQUIRE(json[0]["tests"][0]["expected"] == "true");
}

TEST_CASE("Table shapes are recognized from the document text", "[normalizer][table]")
{
    const auto suites = normalize(
        "display: unicode.dis\n"
        "table: |\n"
        "  include latinLetterDef6Dots.uti\n"
        "  always foo 124\n"
        "tests:\n"
        "  - [foo, \"⠋\"]\n"
        "table: [unicode.dis, en-us-g2.ctb]\n"
        "tests:\n"
        "  - [the, \"⠮\"]\n"
        "table:\n"
        "  language: en\n"
        "  grade: 2\n"
        "  __assert-match: en-us-g2.ctb\n"
        "tests:\n"
        "  - [and, \"⠯\"]\n"
    );
    REQUIRE(suites.size() == 3);

    const auto& body = std::get<InlineDefinition>(suites[0].table).text;
    REQUIRE(body == "include latinLetterDef6Dots.uti\nalways foo 124\n");
    REQUIRE(suites[0].display_table == std::optional<std::string>("unicode.dis"));

    const auto& files = std::get<FileList>(suites[1].table).paths;
    REQUIRE(files == std::vector<std::string>{"unicode.dis", "en-us-g2.ctb"});
    REQUIRE(suites[1].display_table == std::optional<std::string>("unicode.dis"));

    const auto& attrs = std::get<MetadataMap>(suites[2].table).attributes;
    REQUIRE(attrs.size() == 3);
    REQUIRE(attrs.at("grade") == "2");
    REQUIRE(attrs.at("__assert-match") == "en-us-g2.ctb");
}

TEST_CASE("Quoted, folded and aliased tables are rejected from text", "[normalizer][table]")
{
    REQUIRE(error_kind_of("table: \"a.ctb\"\n") == ErrorKind::UnsupportedTableShape);
    REQUIRE(error_kind_of("table: 'a.ctb'\n") == ErrorKind::UnsupportedTableShape);
    REQUIRE(error_kind_of("table: >\n  include a.ctb\n") == ErrorKind::UnsupportedTableShape);
    REQUIRE(error_kind_of("display: &d a.dis\ntable: *d\n") == ErrorKind::UnsupportedTableShape);
}

TEST_CASE("Xfail forms decode from text", "[normalizer][xfail]")
{
    const auto suites = normalize(
        "table: a.ctb\n"
        "tests:\n"
        "  - [a, b]\n"
        "  - [a, b, {xfail: off}]\n"
        "  - [a, b, {xfail: false}]\n"
        "  - [a, b, {xfail: on}]\n"
        "  - [a, b, {xfail: true}]\n"
        "  - [a, b, {xfail: no}]\n"
        "  - [a, b, {xfail: \"not implemented\"}]\n"
        "  - [a, b, {xfail: {forward: true, backward: off}}]\n"
    );
    REQUIRE(suites.size() == 1);
    const auto& tests = suites[0].tests;
    REQUIRE(tests.size() == 8);

    REQUIRE_FALSE(is_expected_failure(tests[0].xfail));
    REQUIRE_FALSE(is_expected_failure(tests[1].xfail));
    REQUIRE_FALSE(is_expected_failure(tests[2].xfail));
    REQUIRE(std::get<XfailFlag>(tests[3].xfail).value);
    REQUIRE(std::get<XfailFlag>(tests[4].xfail).value);
    REQUIRE(std::get<XfailReason>(tests[5].xfail).reason == "no");
    REQUIRE(std::get<XfailReason>(tests[6].xfail).reason == "not implemented");
    const auto& directional = std::get<XfailDirectional>(tests[7].xfail);
    REQUIRE(directional.forward);
    REQUIRE_FALSE(directional.backward);
}

TEST_CASE("Decode errors carry their kind and position", "[normalizer][errors]")
{
    const auto err = decode_error_of([] { normalize("table: a.ctb\nbogus: 1\n"); });
    REQUIRE(err.has_value());
    REQUIRE(err->kind() == ErrorKind::UnknownField);
    REQUIRE(err->subject() == "bogus");
    REQUIRE(err->mark().line == 2);
    REQUIRE(err->mark().column == 1);

    REQUIRE(error_kind_of("tests:\n  - [a, b]\n") == ErrorKind::MissingTable);
    REQUIRE(error_kind_of("table: a.ctb\nflags: {testmode: sideways}\n") == ErrorKind::UnsupportedTestMode);
    REQUIRE(error_kind_of("table: a.ctb\nflags: {mode: forward}\n") == ErrorKind::UnknownField);
    REQUIRE(error_kind_of("table: a.ctb\ntests:\n  - [a, b, {xfail: [x]}]\n") == ErrorKind::UnsupportedXfailShape);
    REQUIRE(error_kind_of("table: a.ctb\ntests:\n  - [a, b, {xfail: {both: true}}]\n") == ErrorKind::UnsupportedXfailKey);
    REQUIRE(error_kind_of("table: a.ctb\ntests:\n  - [a, b, {typeform: x}]\n") == ErrorKind::UnknownTestAttribute);
    REQUIRE(error_kind_of("table: a.ctb\ntests:\n  - [a, b, [1, 2, 3]]\n") == ErrorKind::StructuralMismatch);
    REQUIRE(error_kind_of("- table\n") == ErrorKind::StructuralMismatch);
    REQUIRE(error_kind_of("table: a.ctb\n---\ntable: b.ctb\n") == ErrorKind::StructuralMismatch);
    REQUIRE(error_kind_of("") == ErrorKind::StructuralMismatch);
    REQUIRE(error_kind_of("tests: [[a, b]\n") == ErrorKind::MalformedInput);
}

TEST_CASE("Reserved test attributes are not decoded", "[normalizer][errors]")
{
    const auto err = decode_error_of([] {
        normalize("table: a.ctb\ntests:\n  - [a, b, {cursor_pos: 1}]\n");
    });
    REQUIRE(err.has_value());
    REQUIRE(err->kind() == ErrorKind::UnknownTestAttribute);
    REQUIRE(std::string(err->what()).find("not decoded from source documents") != std::string::npos);
}

TEST_CASE("Legacy schema reads one suite per document", "[normalizer][legacy]")
{
    const std::string text =
        "table:\n"
        "  language: en\n"
        "  grade: 02\n"
        "  system: ueb\n"
        "flags: {testmode: forward}\n"
        "tests:\n"
        "  - [a, \"⠁\"]\n"
        "  - [b, \"⠃\"]\n";
    const auto suites = normalize(text, SchemaRevision::Legacy);
    REQUIRE(suites.size() == 1);
    const auto& attrs = std::get<MetadataMap>(suites[0].table).attributes;
    REQUIRE(attrs.at("grade") == "2");
    REQUIRE(attrs.at("system") == "ueb");
    REQUIRE(suites[0].tests.size() == 2);

    REQUIRE(error_kind_of("table:\n  grade: high\n", SchemaRevision::Legacy) == ErrorKind::InvalidGrade);
    REQUIRE(error_kind_of("table:\n  contraction: full\n", SchemaRevision::Legacy) == ErrorKind::UnknownField);
    REQUIRE(error_kind_of("table: a.ctb\n", SchemaRevision::Legacy) == ErrorKind::StructuralMismatch);
}

TEST_CASE("JSON rendering mirrors the YAML shape", "[normalizer][json]")
{
    NormalizeOptions opt{};
    opt.format = OutputFormat::Json;
    const auto res = SuiteNormalizer::NormalizeYamlText(
        "table: a.ctb\nflags: {testmode: display}\ntests:\n  - [x, y, {xfail: true}]\n", opt
    );
    const auto json = nlohmann::json::parse(res.text);
    REQUIRE(json.is_array());
    REQUIRE(json[0]["table"]["file"] == "a.ctb");
    REQUIRE(json[0]["mode"] == "display");
    REQUIRE(json[0]["tests"][0]["xfail"] == true);
}

TEST_CASE("Output format and schema names", "[normalizer]")
{
    REQUIRE(parse_output_format("yaml") == OutputFormat::Yaml);
    REQUIRE(parse_output_format("json") == OutputFormat::Json);
    REQUIRE_FALSE(parse_output_format("xml").has_value());
    REQUIRE(parse_schema_revision("legacy") == SchemaRevision::Legacy);
    REQUIRE_FALSE(parse_schema_revision("v2").has_value());
    REQUIRE(to_string(OutputFormat::Json) == "json");
    REQUIRE(to_string(SchemaRevision::Current) == "current");
}

TEST_CASE("Files are read from disk and empty files are refused", "[normalizer][file]")
{
    const fs::path dir = fs::temp_directory_path() / "lyn_normalizer_tests";
    const fs::path suite_file = dir / "suite.yaml";
    const fs::path empty_file = dir / "empty.yaml";
    lyn::fs_utils::write_text_file(suite_file, "table: a.ctb\ntests:\n  - [a, b]\n");
    lyn::fs_utils::write_text_file(empty_file, "");

    const auto res = SuiteNormalizer::NormalizeYamlFile(suite_file);
    REQUIRE(res.suites.size() == 1);
    REQUIRE(res.suites[0].tests[0].expected == "b");
    REQUIRE(lyn::fs_utils::is_yaml_file(suite_file));

    REQUIRE_THROWS_AS(SuiteNormalizer::NormalizeYamlFile(empty_file), std::runtime_error);
    REQUIRE_THROWS_AS(SuiteNormalizer::NormalizeYamlFile(dir / "missing.yaml"), std::runtime_error);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
