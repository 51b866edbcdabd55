/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "suite/suite_model.h"

#include <string>
#include <vector>

namespace lyn::suite {

/**
 * Renders suites in the canonical YAML form: one sequence with a mapping per
 * suite. Fields at their default (no display table, non-failing xfail, empty
 * positions or mode flags, unset cursor or output length) are left out.
 * The table is written as a single-key mapping naming its variant
 * (`file`, `files`, `inline`, `metadata`). String data is written double
 * quoted, inline table bodies as literal blocks.
 */
std::string write_suites_yaml(const std::vector<TestSuite>& suites);

}  // namespace lyn::suite
