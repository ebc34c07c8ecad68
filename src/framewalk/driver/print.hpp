#pragma once

#include <string>

#include "framewalk/common/diagnostic.hpp"

namespace framewalk::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace framewalk::driver
