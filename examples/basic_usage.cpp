/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the PropGraph property dependency library
 *
 * This example demonstrates:
 * - Declaring properties with ordered, guarded clauses
 * - Building a schema and inspecting its evaluation order
 * - Evaluating the schema against several inputs
 * - Declaring properties as plain data
 * - Error handling for cycles and unmatched clauses
 */

#include "PropGraph/PropGraph.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace propgraph;

// ============================================================================
// Property Sets
// ============================================================================

Schema buildExampleSchema() {
    SchemaBuilder<int> builder;

    builder.property<int>("p")
        .clause([](int i, const Record&) { return i + 1; });

    // First matching clause wins
    builder.property<int>("q")
        .clause(Pattern().bind("p"),
                [](int, const Record& b) { return b.get<int>("p") > 0; },
                [](int i, const Record&) { return i * 5; })
        .clause(Pattern().equals("p", 3),
                [](int i, const Record&) { return i * 5; })
        .clause(Pattern().bind("p"),
                [](int i, const Record& r) { return r.get<int>("p") * i; });

    builder.property<int>("r")
        .clause(Pattern().bind("p").bind("q").bind("z"),
                [](int, const Record& r) { return r.get<int>("p") * r.get<int>("q"); });

    builder.property<int>("z")
        .clause(Pattern().bind("q"),
                [](int, const Record& r) { return r.get<int>("q") * 5; });

    return builder.build();
}

// ============================================================================
// Example Functions
// ============================================================================

void demonstrateBasicUsage() {
    std::cout << "=== Basic Usage ===" << std::endl;

    Schema schema = buildExampleSchema();

    std::cout << "Declared properties:" << std::endl;
    for (const auto& name : schema.declaration_order()) {
        std::cout << "  - " << name << " (requires";
        for (const auto& dep : schema.dependencies_of(name)) {
            std::cout << " " << dep;
        }
        std::cout << ")" << std::endl;
    }

    std::cout << "Evaluation order:";
    for (const auto& name : schema.evaluation_order()) {
        std::cout << " " << name;
    }
    std::cout << std::endl;

    for (int input : {2, -3, 10}) {
        Record result = evaluate(schema, input);
        std::cout << "evaluate(" << input << ") = " << result << std::endl;
    }

    std::cout << std::endl;
}

void demonstrateDataDeclarations() {
    std::cout << "=== Plain Declarations ===" << std::endl;

    Clause length;
    length.body = [](const Value& input, const Record&) {
        return Value::create(input.get<std::string>().size());
    };

    Pattern needsLength = Pattern().bind("length");
    Clause shortWord;
    shortWord.pattern = needsLength.predicate();
    shortWord.required_names = needsLength.referenced_names();
    shortWord.guard = [](const Value&, const Record& b) { return b.get<std::size_t>("length") < 5; };
    shortWord.body = [](const Value&, const Record&) { return Value::create("short"); };

    Clause longWord;
    longWord.body = [](const Value&, const Record&) { return Value::create("long"); };

    Schema schema = build_schema({
        PropertyDeclaration{"size", {shortWord, longWord}},
        PropertyDeclaration{"length", {length}},
    });

    for (const char* word : {"tree", "dependency"}) {
        std::cout << word << " -> " << evaluate(schema, std::string(word)) << std::endl;
    }

    std::cout << std::endl;
}

void demonstrateErrorHandling() {
    std::cout << "=== Error Handling ===" << std::endl;

    // Mutually dependent properties are rejected when the schema is built
    try {
        SchemaBuilder<int> builder;
        builder.property<int>("a").clause(Pattern().bind("b"), [](int, const Record&) { return 0; });
        builder.property<int>("b").clause(Pattern().bind("a"), [](int, const Record&) { return 0; });
        (void)builder.build();
    } catch (const CycleError& e) {
        std::cout << "Caught CycleError: " << e.what() << std::endl;
    }

    // A clause requiring an undeclared property
    try {
        SchemaBuilder<int> builder;
        builder.property<int>("a").clause(Pattern().bind("missing"), [](int, const Record&) { return 0; });
        (void)builder.build();
    } catch (const UnknownPropertyError& e) {
        std::cout << "Caught UnknownPropertyError: " << e.what() << std::endl;
    }

    // No clause matches for odd inputs
    SchemaBuilder<int> builder;
    builder.property<int>("half")
        .clause(Pattern(),
                [](int i, const Record&) { return i % 2 == 0; },
                [](int i, const Record&) { return i / 2; });
    Schema schema = builder.build();

    try {
        (void)evaluate(schema, 7);
    } catch (const DispatchError& e) {
        std::cout << "Caught DispatchError: " << e.what() << std::endl;
        std::cout << "Snapshot: " << e.snapshot() << std::endl;
    }

    // Wrong input type
    try {
        (void)evaluate(schema, std::string("seven"));
    } catch (const InputTypeMismatchError& e) {
        std::cout << "Caught InputTypeMismatchError: " << e.what() << std::endl;
    }

    // Reading a property that is not in the record
    try {
        Record result = evaluate(schema, 8);
        (void)result.get<int>("quarter");
    } catch (const PropertyNotFoundError& e) {
        std::cout << "Caught PropertyNotFoundError: " << e.what() << std::endl;
    }

    std::cout << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "PropGraph Property Dependency Library - Basic Usage Example" << std::endl;
    std::cout << "===========================================================" << std::endl << std::endl;

    demonstrateBasicUsage();
    demonstrateDataDeclarations();
    demonstrateErrorHandling();

    std::cout << "Example completed successfully!" << std::endl;
    return 0;
}
