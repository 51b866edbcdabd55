/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "yaml/yaml_event.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace lyn::yaml {

// Syntax error reported by the underlying YAML parser.
class ParseError : public std::runtime_error {
   public:
    ParseError(std::string problem, Mark mark)
        : std::runtime_error(
              problem + (mark.known() ? " at line " + std::to_string(mark.line) + ", column "
                                            + std::to_string(mark.column)
                                      : std::string())
          ),
          _problem(std::move(problem)),
          _mark(mark) {}

    const std::string& problem() const { return _problem; }
    const Mark& mark() const { return _mark; }

   private:
    std::string _problem;
    Mark _mark;
};

}  // namespace lyn::yaml
