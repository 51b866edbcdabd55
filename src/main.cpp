/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "suite_normalizer.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    std::optional<fs::path> output_path;
    lyn::suite::NormalizeOptions options{};
    bool debug = false;
};

static void print_usage() {
    LYN_LOG_INFO(
        "Usage:\n" \
        "    yaml_normalizer <file.yaml> [-o <path>] [--schema current|legacy] [--format yaml|json] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a liblouis YAML test file\n" \
        "    -o, --output  write the normalized suites to <path> instead of stdout\n" \
        "    --schema      schema revision of the input (default: current)\n" \
        "                  current: table chosen by shape, one suite per tests block\n" \
        "                  legacy:  fixed language/grade/system table, one suite per document\n" \
        "    --format      output format (default: yaml)\n" \
        "    --debug       enables extra logging\n"
    );
}

static bool take_value(int argc, char** argv, int& i, std::string_view name, std::string& out) {
    if (i + 1 >= argc) {
        LYN_LOG_ERROR("Missing value for %.*s", static_cast<int>(name.size()), name.data());
        return false;
    }
    out = argv[++i];
    return true;
}

static void write_output(const std::string& text, const Settings& settings) {
    if (!settings.output_path.has_value()) {
        std::fwrite(text.data(), 1, text.size(), stdout);
        std::fflush(stdout);
        return;
    }
    lyn::fs_utils::write_text_file(*settings.output_path, text);
    LYN_LOG_DEBUG(
        "Wrote: %s",
        lyn::fs_utils::display_path(*settings.output_path, fs::current_path()).c_str()
    );
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    const std::string_view first_arg = argv[1];
    if (first_arg == "-h" || first_arg == "--help") {
        print_usage();
        return 0;
    }
    if (!first_arg.empty() && first_arg[0] == '-') {
        LYN_LOG_ERROR("First argument must be a YAML file.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        std::string value;
        if (arg == "-o" || arg == "--output") {
            if (!take_value(argc, argv, i, arg, value)) {
                return 2;
            }
            settings.output_path = fs::path(value);
            continue;
        }
        if (arg == "--schema") {
            if (!take_value(argc, argv, i, arg, value)) {
                return 2;
            }
            const auto revision = lyn::suite::parse_schema_revision(value);
            if (!revision.has_value()) {
                LYN_LOG_ERROR("Unknown schema revision: %s", value.c_str());
                return 2;
            }
            settings.options.revision = *revision;
            continue;
        }
        if (arg == "--format") {
            if (!take_value(argc, argv, i, arg, value)) {
                return 2;
            }
            const auto format = lyn::suite::parse_output_format(value);
            if (!format.has_value()) {
                LYN_LOG_ERROR("Unknown output format: %s", value.c_str());
                return 2;
            }
            settings.options.format = *format;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        LYN_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    lyn::log::set_debug(settings.debug);

    if (!fs::exists(input)) {
        LYN_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }
    if (!lyn::fs_utils::is_yaml_file(input)) {
        LYN_LOG_WARN("Input does not have a .yaml extension: %s", input.string().c_str());
    }

    try {
        const auto res = lyn::suite::SuiteNormalizer::NormalizeYamlFile(input, settings.options);
        write_output(res.text, settings);
    } catch (const std::exception& e) {
        LYN_LOG_ERROR("Failed: %s (%s)", input.string().c_str(), e.what());
        return 1;
    }
    return 0;
}
