/**
 * @file Serialization.hpp
 * @brief JSON export of result records and schemas
 *
 * Requires nlohmann/json. Values are converted by a JsonConverter, which
 * knows bool, the integral and floating point types and std::string, and
 * accepts further types through register_type<T>().
 *
 * @code
 * JsonConverter converter;
 * converter.register_type<Vector3>([](const Vector3& v) {
 *     return nlohmann::ordered_json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
 * });
 * auto json = to_json(evaluate(schema, input), converter);
 * @endcode
 */

#ifndef PROPGRAPH_SERIALIZATION_HPP
#define PROPGRAPH_SERIALIZATION_HPP

#include "PropGraph.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace propgraph {

using json = nlohmann::ordered_json;

class JsonConverter {
public:
    using ConvertFn = std::function<json(const Value&)>;

    JsonConverter() {
        register_type<bool>([](bool v) { return json(v); });
        register_type<int>([](int v) { return json(v); });
        register_type<long>([](long v) { return json(v); });
        register_type<long long>([](long long v) { return json(v); });
        register_type<short>([](short v) { return json(v); });
        register_type<unsigned int>([](unsigned int v) { return json(v); });
        register_type<unsigned long>([](unsigned long v) { return json(v); });
        register_type<unsigned long long>([](unsigned long long v) { return json(v); });
        register_type<float>([](float v) { return json(v); });
        register_type<double>([](double v) { return json(v); });
        register_type<std::string>([](const std::string& v) { return json(v); });
    }

    /**
     * @brief Register or replace the conversion of values of type T
     */
    template<Storable T, typename F>
    JsonConverter& register_type(F fn) {
        converters_[std::type_index(typeid(T))] = [fn = std::move(fn)](const Value& value) -> json {
            return fn(value.get_unchecked<T>());
        };
        return *this;
    }

    [[nodiscard]] bool can_convert(const Value& value) const {
        return !value.is_valid() || converters_.count(value.type()) != 0;
    }

    /**
     * @brief Convert one value; an empty value becomes null
     * @throws SerializationError if no conversion is registered for its type
     */
    [[nodiscard]] json convert(const Value& value) const {
        if (!value.is_valid()) return json(nullptr);
        auto it = converters_.find(value.type());
        if (it == converters_.end()) {
            throw SerializationError("No JSON conversion registered for type '" +
                                     std::string{value.type_name()} + "'");
        }
        return it->second(value);
    }

private:
    std::unordered_map<std::type_index, ConvertFn> converters_;
};

/**
 * @brief Convert a record to a JSON object keyed by property name
 *
 * Keys keep the record's binding order.
 */
inline json to_json(const Record& record, const JsonConverter& converter = JsonConverter{}) {
    json object = json::object();
    for (const auto& entry : record) {
        object[entry.name] = converter.convert(entry.value);
    }
    return object;
}

/**
 * @brief Describe a schema: its evaluation order and, per property in
 *        declaration order, the clause count, required names and type
 */
inline json describe(const Schema& schema) {
    json properties = json::array();
    for (const auto& name : schema.declaration_order()) {
        const PropertyDeclaration& declaration = schema.declaration(name);
        json property = json::object();
        property["name"] = declaration.name;
        property["clauses"] = declaration.clauses.size();
        property["requires"] = declaration.required_names();
        property["value_type"] = declaration.value_type
            ? json(declaration.value_type_name)
            : json(nullptr);
        properties.push_back(std::move(property));
    }

    json description = json::object();
    description["evaluation_order"] = schema.evaluation_order();
    description["properties"] = std::move(properties);
    return description;
}

} // namespace propgraph

#endif // PROPGRAPH_SERIALIZATION_HPP
