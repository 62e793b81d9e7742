#pragma once

// Local headers
#include "HeaderValue.hxx"

// Standard library
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fitsmeta {

/// Ordered keyword to value mapping with unique keys. Setting an existing key replaces its
/// value and keeps its original position.
class Header {
public:
    using entry = std::pair<std::string, HeaderValue>;
    using const_iterator = std::vector<entry>::const_iterator;

    void set(const std::string& key, const HeaderValue& value);

    const HeaderValue* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const Header& right) const { return entries_ == right.entries_; }
    bool operator!=(const Header& right) const { return !(*this == right); }

private:
    std::vector<entry> entries_;
    std::map<std::string, size_t> positions_;
};
}  // namespace fitsmeta
