#include "prompt.h"

#include <iostream>

std::optional<std::string> prompt_until_valid(std::istream& in, std::ostream& out,
                                              const std::string& label, const FieldCheck& check) {
  std::string line;
  while (true) {
    out << label << ": " << std::flush;
    if (!std::getline(in, line)) {
      out << "\n";
      return std::nullopt;
    }
    const auto finding = check(std::string_view{line});
    if (finding.valid) {
      return line;
    }
    out << "  " << finding.message << "\n";
  }
}
