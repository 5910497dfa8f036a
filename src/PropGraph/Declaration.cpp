/**
 * @file Declaration.cpp
 * @brief Implementation of PropertyDeclaration and Pattern
 */

#include "PropGraph/detail/Declaration.hpp"

#include <algorithm>

namespace propgraph {

namespace {

void append_unique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

} // namespace

std::vector<std::string> PropertyDeclaration::required_names() const {
    std::vector<std::string> result;
    for (const auto& clause : clauses) {
        for (const auto& name : clause.required_names) {
            append_unique(result, name);
        }
    }
    return result;
}

Pattern& Pattern::bind(std::string_view name) {
    fields_.push_back(Field{std::string{name}, Value{}});
    return *this;
}

bool Pattern::match(const Record& partial, PartialResult& bindings) const {
    for (const auto& field : fields_) {
        const Value* value = partial.find(field.name);
        if (!value) return false;
        if (field.expected.is_valid() && !(*value == field.expected)) return false;
        // The same property may appear in several fields
        if (!bindings.contains(field.name)) {
            bindings.bind(field.name, *value);
        }
    }
    return true;
}

std::vector<std::string> Pattern::referenced_names() const {
    std::vector<std::string> result;
    for (const auto& field : fields_) {
        append_unique(result, field.name);
    }
    return result;
}

PatternFn Pattern::predicate() const {
    if (fields_.empty()) return {};
    return [pattern = *this](const Record& partial, PartialResult& bindings) {
        return pattern.match(partial, bindings);
    };
}

} // namespace propgraph
