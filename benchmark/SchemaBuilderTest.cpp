#include <string>
#include <vector>
#include "PropGraph/PropGraph.hpp"
#include "gtest/gtest.h"

using namespace propgraph;

//-------------------------------------------------------
// Test types
//-------------------------------------------------------

struct Order
{
    std::string customer;
    int quantity;
    double unit_price;
};

Schema OrderSchema()
{
    SchemaBuilder<Order> builder;

    builder.property<double>("subtotal")
        .clause(Pattern(), [](const Order& o, const Record&) { return o.quantity * o.unit_price; });

    builder.property<std::string>("tier")
        .clause(Pattern().bind("subtotal"),
                [](const Order&, const Record& b) { return b.get<double>("subtotal") >= 100.0; },
                [](const Order&, const Record&) { return std::string("gold"); })
        .clause([](const Order&, const Record&) { return std::string("standard"); });

    builder.property<double>("discount")
        .clause(Pattern().equals("tier", "gold"),
                [](const Order&, const Record& r) { return r.get<double>("subtotal") * 0.1; })
        .clause([](const Order&, const Record&) { return 0.0; });

    builder.property<double>("total")
        .clause(Pattern().bind("subtotal").bind("discount"),
                [](const Order&, const Record& r)
                {
                    return r.get<double>("subtotal") - r.get<double>("discount");
                });

    return builder.build();
}

//-------------------------------------------------------
// Builder
//-------------------------------------------------------

TEST(SchemaBuilder, ExampleProperties)
{
    SchemaBuilder<int> builder;
    builder.property<int>("p")
        .clause([](int i, const Record&) { return i + 1; });
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

    auto schema = builder.build();
    auto result = evaluate(schema, 2);

    EXPECT_EQ(schema.evaluation_order(), (std::vector<std::string>{"p", "q", "z", "r"}));
    EXPECT_EQ(result.get<int>("p"), 3);
    EXPECT_EQ(result.get<int>("q"), 10);
    EXPECT_EQ(result.get<int>("r"), 30);
    EXPECT_EQ(result.get<int>("z"), 50);
}

TEST(SchemaBuilder, RequiredNamesComeFromPatterns)
{
    SchemaBuilder<int> builder;
    builder.property<int>("a")
        .clause(Pattern().bind("b").equals("c", 1), [](int, const Record&) { return 0; })
        .clause(Pattern().bind("c"), [](int, const Record&) { return 1; });
    builder.property<int>("b").clause([](int, const Record&) { return 0; });
    builder.property<int>("c").clause([](int, const Record&) { return 1; });

    const auto& declarations = builder.declarations();
    ASSERT_EQ(declarations.size(), 3u);
    EXPECT_EQ(declarations[0].clauses[0].required_names, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(declarations[0].required_names(), (std::vector<std::string>{"b", "c"}));
    EXPECT_TRUE(declarations[1].required_names().empty());

    auto schema = builder.build();
    EXPECT_EQ(schema.evaluation_order(), (std::vector<std::string>{"b", "c", "a"}));
}

TEST(SchemaBuilder, RepeatedPropertyAppendsClauses)
{
    SchemaBuilder<int> builder;
    builder.property<int>("sign")
        .clause(Pattern(), [](int i, const Record&) { return i < 0 ? -1 : 1; });
    builder.property<int>("other").clause([](int, const Record&) { return 0; });
    builder.property<int>("sign")
        .clause([](int, const Record&) { return 0; });

    ASSERT_EQ(builder.declarations().size(), 2u);
    EXPECT_EQ(builder.declarations()[0].clauses.size(), 2u);
    EXPECT_EQ(evaluate(builder.build(), -4).get<int>("sign"), -1);
}

TEST(SchemaBuilder, ChainedPropertyDeclarations)
{
    SchemaBuilder<int> builder;
    builder.property<int>("twice")
        .clause([](int i, const Record&) { return i * 2; })
        .property<std::string>("label")
        .clause(Pattern().bind("twice"),
                [](int, const Record& r) { return std::to_string(r.get<int>("twice")); });

    auto result = evaluate(builder.build(), 21);
    EXPECT_EQ(result.get<std::string>("label"), "42");
}

TEST(SchemaBuilder, StructuredInput)
{
    auto schema = OrderSchema();

    auto big = evaluate(schema, Order{"ada", 4, 30.0});
    EXPECT_DOUBLE_EQ(big.get<double>("subtotal"), 120.0);
    EXPECT_EQ(big.get<std::string>("tier"), "gold");
    EXPECT_DOUBLE_EQ(big.get<double>("discount"), 12.0);
    EXPECT_DOUBLE_EQ(big.get<double>("total"), 108.0);

    auto small = evaluate(schema, Order{"bob", 1, 5.0});
    EXPECT_EQ(small.get<std::string>("tier"), "standard");
    EXPECT_DOUBLE_EQ(small.get<double>("total"), 5.0);
}

TEST(SchemaBuilder, BuiltSchemaFixesInputType)
{
    auto schema = OrderSchema();
    EXPECT_TRUE(schema.input_type().has_value());
    EXPECT_THROW((void)evaluate(schema, 5), InputTypeMismatchError);
}

TEST(SchemaBuilder, DeclaredTypesAreRecorded)
{
    auto schema = OrderSchema();
    ASSERT_TRUE(schema.declaration("tier").value_type.has_value());
    EXPECT_TRUE(*schema.declaration("tier").value_type == std::type_index(typeid(std::string)));
    EXPECT_TRUE(*schema.declaration("total").value_type == std::type_index(typeid(double)));
}

TEST(SchemaBuilder, BodyResultIsConvertedToPropertyType)
{
    SchemaBuilder<int> builder;
    // int expression stored as a long property
    builder.property<long>("wide").clause([](int i, const Record&) { return i * 3; });

    auto result = evaluate(builder.build(), 7);
    EXPECT_TRUE(result.at("wide").is_type<long>());
    EXPECT_EQ(result.get<long>("wide"), 21L);
}

TEST(SchemaBuilder, MixesWithPlainDeclarations)
{
    Clause constant;
    constant.body = [](const Value&, const Record&) { return Value::create(100); };

    SchemaBuilder<int> builder;
    builder.declare(PropertyDeclaration{"base", {constant}});
    builder.property<int>("sum")
        .clause(Pattern().bind("base"), [](int i, const Record& r) { return r.get<int>("base") + i; });

    EXPECT_EQ(evaluate(builder.build(), 5).get<int>("sum"), 105);
}

TEST(SchemaBuilder, ConflictingPropertyTypesRejectedWhenDeclared)
{
    SchemaBuilder<int> builder;
    builder.property<int>("p")
        .clause(Pattern(), [](int i, const Record&) { return i > 100; }, [](int i, const Record&) { return i; });

    try
    {
        builder.property<double>("p").clause([](int i, const Record&) { return i * 0.5; });
        FAIL() << "expected InvalidDeclarationError";
    }
    catch (const InvalidDeclarationError& e)
    {
        EXPECT_EQ(e.property_name(), "p");
    }

    // The rejected declaration left the property untouched
    ASSERT_EQ(builder.declarations().size(), 1u);
    EXPECT_EQ(builder.declarations()[0].clauses.size(), 1u);
    EXPECT_TRUE(*builder.declarations()[0].value_type == std::type_index(typeid(int)));
}

TEST(SchemaBuilder, UntypedDeclarationAdoptsBuilderType)
{
    Clause constant;
    constant.body = [](const Value&, const Record&) { return Value::create(100); };

    SchemaBuilder<int> builder;
    builder.declare(PropertyDeclaration{"base", {constant}});
    builder.property<int>("base").clause([](int i, const Record&) { return i; });

    ASSERT_TRUE(builder.declarations()[0].value_type.has_value());
    EXPECT_TRUE(*builder.declarations()[0].value_type == std::type_index(typeid(int)));
    EXPECT_EQ(evaluate(builder.build(), 5).get<int>("base"), 100);
}

TEST(SchemaBuilder, CycleThroughBuilderIsRejected)
{
    SchemaBuilder<int> builder;
    builder.property<int>("a").clause(Pattern().bind("b"), [](int, const Record&) { return 0; });
    builder.property<int>("b").clause(Pattern().bind("a"), [](int, const Record&) { return 0; });

    EXPECT_THROW((void)builder.build(), CycleError);
}

TEST(SchemaBuilder, LoggingLevelDoesNotAffectResult)
{
    const LogLevel previous = log_level();
    set_log_level(LogLevel::Off);
    EXPECT_EQ(log_level(), LogLevel::Off);

    SchemaOptions options;
    options.log_order = true;

    SchemaBuilder<int> builder;
    builder.property<int>("p").clause([](int i, const Record&) { return i; });
    EXPECT_EQ(evaluate(builder.build(options), 3).get<int>("p"), 3);

    set_log_level(previous);
}

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
