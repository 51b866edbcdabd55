/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "suite/suite_model.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lyn::suite {

// Same shape and omission rules as write_suites_yaml().
nlohmann::ordered_json suites_to_json(const std::vector<TestSuite>& suites);
std::string write_suites_json(const std::vector<TestSuite>& suites);

}  // namespace lyn::suite
