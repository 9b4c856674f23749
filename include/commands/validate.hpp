#pragma once

#include "report/Validator.hpp"

int cmd_validate(int argc, char** argv);

// Prints "- <path>: <message>" for each violation to stderr.
void print_violations(const report::ValidationResult& res);
