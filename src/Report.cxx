#include "fitsmeta/Report.hxx"

// Standard library
#include <stdexcept>
#include <utility>

namespace fitsmeta {
bool HduDescriptor::operator==(const HduDescriptor& right) const {
    return index == right.index && kind == right.kind && header == right.header &&
           data_shape == right.data_shape && data_type == right.data_type;
}

Report Report::success(std::vector<HduDescriptor> hdus) {
    Report result;
    result.hdus_ = std::move(hdus);
    return result;
}

Report Report::failure(const std::string& message) {
    Report result;
    result.is_error_ = true;
    result.error_ = message;
    return result;
}

const std::string& Report::error() const {
    if (!is_error_) throw std::logic_error("report is not a failure");
    return error_;
}

const std::vector<HduDescriptor>& Report::hdus() const {
    if (is_error_) throw std::logic_error("report is a failure");
    return hdus_;
}

bool Report::operator==(const Report& right) const {
    return is_error_ == right.is_error_ && error_ == right.error_ && hdus_ == right.hdus_;
}
}  // namespace fitsmeta
