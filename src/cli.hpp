#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace idmill::cli {

// One line per value after a trip through the host boundary. Throws
// std::invalid_argument for an unknown kind or an empty value list.
[[nodiscard]] std::vector<std::string> inspect(const std::string& kind, const std::vector<std::string>& values);

// Body of the idmill executable; returns the process exit status
int run(int argc, char* argv[], std::ostream& out, std::ostream& err);

} // namespace idmill::cli
