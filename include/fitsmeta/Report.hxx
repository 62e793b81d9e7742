#pragma once

// Local headers
#include "HduKind.hxx"
#include "Header.hxx"

// Standard library
#include <cstddef>
#include <string>
#include <vector>

namespace fitsmeta {

/// Normalized description of one HDU.
struct HduDescriptor {
    size_t index = 0;
    HduKind kind = HduKind::primary;
    Header header;

    // Dimension sizes, slowest-varying axis first. Empty when the HDU has no data.
    std::vector<long long> data_shape;

    // Element type name such as "float32". Empty when the HDU has no data.
    std::string data_type;

    bool has_data() const { return !data_shape.empty(); }

    bool operator==(const HduDescriptor& right) const;
    bool operator!=(const HduDescriptor& right) const { return !(*this == right); }
};

/// Result of normalizing a file: either the descriptors of every HDU, or a single error
/// message. Never both.
class Report {
public:
    static Report success(std::vector<HduDescriptor> hdus);
    static Report failure(const std::string& message);

    bool is_error() const { return is_error_; }

    // Valid only for a failure report.
    const std::string& error() const;

    // Valid only for a success report.
    const std::vector<HduDescriptor>& hdus() const;

    bool operator==(const Report& right) const;
    bool operator!=(const Report& right) const { return !(*this == right); }

private:
    Report() = default;

    bool is_error_ = false;
    std::string error_;
    std::vector<HduDescriptor> hdus_;
};
}  // namespace fitsmeta
