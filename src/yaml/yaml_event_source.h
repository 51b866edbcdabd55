/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "yaml/yaml_event.h"

#include <memory>
#include <optional>
#include <string>

struct yaml_parser_s;

namespace lyn::yaml {

/**
 * Pull-based event source backed by the libyaml parser.
 *
 * The source owns a copy of the document text because libyaml reads from the
 * caller's buffer for the whole lifetime of the parser. Syntax errors reported
 * by libyaml are thrown as ParseError with the problem position; after an
 * error or after the stream end event the source is exhausted.
 */
class LibYamlEventSource : public EventSource {
   public:
    explicit LibYamlEventSource(std::string text);
    ~LibYamlEventSource() override;

    LibYamlEventSource(const LibYamlEventSource&) = delete;
    LibYamlEventSource& operator=(const LibYamlEventSource&) = delete;

    std::optional<Event> next() override;

   private:
    std::string _text;
    std::unique_ptr<yaml_parser_s> _parser;
    bool _finished = false;
};

}  // namespace lyn::yaml
