/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "suite/suite_document_decoder.h"
#include "suite/suite_model.h"
#include "yaml/yaml_event.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lyn::suite {

enum class OutputFormat {
    Yaml,
    Json,
};

std::string_view to_string(OutputFormat format);
std::optional<OutputFormat> parse_output_format(std::string_view text);

struct NormalizeOptions {
    SchemaRevision revision = SchemaRevision::Current;
    OutputFormat format = OutputFormat::Yaml;
};

struct NormalizeResult {
    std::vector<TestSuite> suites;
    std::string text;
};

class SuiteNormalizer {
   public:
    static NormalizeResult
    NormalizeYamlFile(const std::filesystem::path& path, const NormalizeOptions& opt = {});
    static NormalizeResult NormalizeYamlText(
        std::string text,
        const NormalizeOptions& opt = {},
        std::string_view label = {}
    );
    static NormalizeResult
    NormalizeEvents(yaml::EventSource& source, const NormalizeOptions& opt = {});

    static std::string Render(const std::vector<TestSuite>& suites, OutputFormat format);
};

}  // namespace lyn::suite
