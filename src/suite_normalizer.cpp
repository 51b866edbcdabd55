/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite_normalizer.h"

#include "suite/suite_json_writer.h"
#include "suite/suite_yaml_writer.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "yaml/yaml_event_source.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace lyn::suite {

std::string_view to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Yaml:
            return "yaml";
        case OutputFormat::Json:
            return "json";
    }
    return "yaml";
}

std::optional<OutputFormat> parse_output_format(std::string_view text) {
    if (text == "yaml") {
        return OutputFormat::Yaml;
    }
    if (text == "json") {
        return OutputFormat::Json;
    }
    return std::nullopt;
}

NormalizeResult
SuiteNormalizer::NormalizeYamlFile(const std::filesystem::path& path, const NormalizeOptions& opt) {
    auto text = lyn::fs_utils::read_text_file(path);
    if (text.empty()) {
        throw std::runtime_error("YAML file is empty: " + path.string());
    }
    return NormalizeYamlText(std::move(text), opt, path.filename().string());
}

NormalizeResult SuiteNormalizer::NormalizeYamlText(
    std::string text,
    const NormalizeOptions& opt,
    std::string_view label
) {
    const std::size_t bytes = text.size();
    const auto t0 = std::chrono::steady_clock::now();
    yaml::LibYamlEventSource source(std::move(text));
    auto result = NormalizeEvents(source, opt);
    const auto t1 = std::chrono::steady_clock::now();
    LYN_LOG_DEBUG(
        "Normalized %.*s: bytes=%zu suites=%zu time=%lldms", static_cast<int>(label.size()),
        label.data(), bytes, result.suites.size(),
        static_cast<long long>(
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
        )
    );
    return result;
}

NormalizeResult SuiteNormalizer::NormalizeEvents(yaml::EventSource& source, const NormalizeOptions& opt) {
    DecodeOptions decode_opt{};
    decode_opt.revision = opt.revision;

    NormalizeResult result{};
    result.suites = decode_document(source, decode_opt);
    result.text = Render(result.suites, opt.format);
    return result;
}

std::string SuiteNormalizer::Render(const std::vector<TestSuite>& suites, OutputFormat format) {
    switch (format) {
        case OutputFormat::Json:
            return write_suites_json(suites);
        case OutputFormat::Yaml:
            break;
    }
    return write_suites_yaml(suites);
}

}  // namespace lyn::suite
