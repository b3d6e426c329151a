// Copyright 2026 The snapbridge Authors

#include "capture/disambiguation_formatter.h"

#include <sstream>

namespace snapbridge {
namespace internal {

std::vector<std::string> FormatOptionLines(const AmbiguousMatch& ambiguous) {
  std::vector<std::string> lines;
  lines.reserve(ambiguous.matches.size() + 1);

  int index = 1;
  for (const auto& m : ambiguous.matches) {
    std::string line = std::to_string(index++) + ". " + m.title;
    if (!m.process_name.empty()) line += " (" + m.process_name + ")";
    lines.push_back(std::move(line));
  }

  if (!ambiguous.cancel_line.empty()) {
    lines.push_back(ambiguous.cancel_line);
  } else {
    lines.push_back(std::to_string(index) + ". Cancel capture");
  }
  return lines;
}

std::string FormatDisambiguation(const AmbiguousMatch& ambiguous) {
  std::ostringstream os;
  os << "Multiple windows found matching \"" << ambiguous.search_term
     << "\". Please choose an option:\n\n";
  for (const auto& line : FormatOptionLines(ambiguous)) os << line << '\n';
  os << "\nTo select an option, retry the screenshot with windowIndex: 2 "
        "(for option 2)\n"
     << "To cancel, simply don't retry the tool call\n\n"
     << "Example: `windowIndex: 2` to capture the second window";
  return os.str();
}

std::string FormatWindowNotFound(const std::string& search_term) {
  return "No windows found with title containing \"" + search_term +
         "\"\n\nSuggestions:\n"
         "  - Check the window's title bar for the exact text\n"
         "  - Try a shorter or different part of the title\n"
         "  - Use processName instead (e.g., 'notepad', 'chrome')";
}

std::string FormatProcessNotFound(const std::string& search_term) {
  return "No visible windows found for process \"" + search_term +
         "\"\n\nSuggestions:\n"
         "  - Make sure the application is running with visible windows\n"
         "  - Try capturing by windowTitle instead of processName\n"
         "  - Check if the process name is correct (without .exe extension)";
}

}  // namespace internal
}  // namespace snapbridge
