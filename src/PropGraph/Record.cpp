/**
 * @file Record.cpp
 * @brief Implementation of Record and PartialResult
 */

#include "PropGraph/detail/Record.hpp"

#include <ostream>

namespace propgraph {

const Value* Record::find(std::string_view name) const noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].value;
}

const Value& Record::at(std::string_view name) const {
    const Value* value = find(name);
    if (!value) [[unlikely]] {
        throw PropertyNotFoundError(name, names());
    }
    return *value;
}

std::vector<std::string> Record::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    return result;
}

bool Record::operator==(const Record& other) const {
    if (entries_.size() != other.entries_.size()) return false;
    for (const auto& entry : entries_) {
        const Value* theirs = other.find(entry.name);
        if (!theirs || !(entry.value == *theirs)) return false;
    }
    return true;
}

std::string Record::to_string() const {
    std::string out = "{";
    bool first = true;
    for (const auto& entry : entries_) {
        if (!first) out += ", ";
        out += entry.name;
        out += ": ";
        out += entry.value.to_string();
        first = false;
    }
    out += "}";
    return out;
}

void Record::insert(std::string_view name, Value value) {
    auto [it, inserted] = index_.try_emplace(std::string{name}, entries_.size());
    if (!inserted) {
        throw PropertyAlreadyBoundError(name);
    }
    try {
        entries_.push_back(Entry{std::string{name}, std::move(value)});
    } catch (...) {
        index_.erase(it);
        throw;
    }
}

std::ostream& operator<<(std::ostream& os, const Record& record) {
    return os << record.to_string();
}

void PartialResult::bind(std::string_view name, Value value) {
    insert(name, std::move(value));
}

} // namespace propgraph
