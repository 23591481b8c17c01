//! # Common Definitions
//!
//! Out-of-line helpers for the types declared in `common.hpp`.

#include "borrowck/common.hpp"

#include <sstream>

namespace borrowck {

auto span_to_string(const SourceSpan& span) -> std::string {
    if (!span.is_known()) {
        return "<unknown>";
    }
    std::ostringstream oss;
    oss << (span.start.file.empty() ? std::string_view("<input>") : span.start.file) << ":"
        << span.start.line << ":" << span.start.column;
    return oss.str();
}

} // namespace borrowck
