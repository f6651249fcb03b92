#pragma once

#include <string>

namespace tabledep {

// RFC 4180: fields holding a comma, quote or line break are quoted and
// embedded quotes doubled.
std::string EscapeCsvField(const std::string &value);

std::string EscapeJsonString(const std::string &value);

// Pipes would split a table cell; line breaks would end the row.
std::string EscapeMarkdownCell(const std::string &value);

} // namespace tabledep
