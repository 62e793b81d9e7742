#pragma once

// Local headers
#include "Report.hxx"

// Third-party headers
#include <nlohmann/json.hpp>

// Standard library
#include <iosfwd>
#include <string>

namespace fitsmeta {
using json = nlohmann::ordered_json;

json to_json(const HeaderValue& value);
json to_json(const Header& header);
json to_json(const HduDescriptor& hdu);
json to_json(const Report& report);

// Serializes a report. A negative `indent` gives compact single-line output. Non-ASCII
// characters are escaped and invalid UTF-8 is replaced.
std::string dump_report(const Report& report, int indent = 2);

// Writes `dump_report` followed by a newline.
void write_report(std::ostream& stream, const Report& report, int indent = 2);
}  // namespace fitsmeta
