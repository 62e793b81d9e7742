#include "fitsmeta/Header.hxx"

namespace fitsmeta {
void Header::set(const std::string& key, const HeaderValue& value) {
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        entries_[it->second].second = value;
        return;
    }
    positions_.emplace(key, entries_.size());
    entries_.emplace_back(key, value);
}

const HeaderValue* Header::find(const std::string& key) const {
    auto it = positions_.find(key);
    return it == positions_.end() ? nullptr : &entries_[it->second].second;
}
}  // namespace fitsmeta
