// Copyright 2026 The snapbridge Authors
//
// Human-actionable messages for ambiguous and unmatched window queries.

#ifndef SNAPBRIDGE_CAPTURE_DISAMBIGUATION_FORMATTER_H_
#define SNAPBRIDGE_CAPTURE_DISAMBIGUATION_FORMATTER_H_

#include <string>
#include <vector>

#include "capture/capture_types.h"

namespace snapbridge {
namespace internal {

/// Numbered option lines: "{i}. {title} ({process})" for every match, then
/// the cancel line.  Always matches.size() + 1 entries.
std::vector<std::string> FormatOptionLines(const AmbiguousMatch& ambiguous);

/// Full retry prompt: header, option lines and windowIndex guidance.
std::string FormatDisambiguation(const AmbiguousMatch& ambiguous);

std::string FormatWindowNotFound(const std::string& search_term);
std::string FormatProcessNotFound(const std::string& search_term);

}  // namespace internal
}  // namespace snapbridge

#endif  // SNAPBRIDGE_CAPTURE_DISAMBIGUATION_FORMATTER_H_
