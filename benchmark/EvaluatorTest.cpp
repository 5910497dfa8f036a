#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "PropGraph/PropGraph.hpp"
#include "gtest/gtest.h"

using namespace propgraph;

//-------------------------------------------------------
// The p/q/r/z property set, declared as plain data
//-------------------------------------------------------

int Input(const Value& input)
{
    return input.get<int>();
}

std::vector<PropertyDeclaration> ExampleDeclarations()
{
    // p(i, _) = i + 1
    Clause p_clause;
    p_clause.body = [](const Value& in, const Record&) { return Value::create(Input(in) + 1); };

    // q(i, {p: p}) when p > 0 = i * 5
    Pattern bind_p = Pattern().bind("p");
    Clause q_guarded;
    q_guarded.pattern = bind_p.predicate();
    q_guarded.guard = [](const Value&, const Record& b) { return b.get<int>("p") > 0; };
    q_guarded.body = [](const Value& in, const Record&) { return Value::create(Input(in) * 5); };
    q_guarded.required_names = bind_p.referenced_names();

    // q(i, {p: 3}) = i * 5
    Pattern p_is_3 = Pattern().equals("p", 3);
    Clause q_literal;
    q_literal.pattern = p_is_3.predicate();
    q_literal.body = [](const Value& in, const Record&) { return Value::create(Input(in) * 5); };
    q_literal.required_names = p_is_3.referenced_names();

    // q(i, {p: p}) = p * i
    Clause q_fallback;
    q_fallback.pattern = bind_p.predicate();
    q_fallback.body = [](const Value& in, const Record& r) { return Value::create(r.get<int>("p") * Input(in)); };
    q_fallback.required_names = bind_p.referenced_names();

    // r(_, {p: p, q: q, z: _}) = p * q
    Pattern pqz = Pattern().bind("p").bind("q").bind("z");
    Clause r_clause;
    r_clause.pattern = pqz.predicate();
    r_clause.body = [](const Value&, const Record& r) { return Value::create(r.get<int>("p") * r.get<int>("q")); };
    r_clause.required_names = pqz.referenced_names();

    // z(_, {q: q}) = q * 5
    Pattern bind_q = Pattern().bind("q");
    Clause z_clause;
    z_clause.pattern = bind_q.predicate();
    z_clause.body = [](const Value&, const Record& r) { return Value::create(r.get<int>("q") * 5); };
    z_clause.required_names = bind_q.referenced_names();

    return {
        PropertyDeclaration{"p", {p_clause}},
        PropertyDeclaration{"q", {q_guarded, q_literal, q_fallback}},
        PropertyDeclaration{"r", {r_clause}},
        PropertyDeclaration{"z", {z_clause}},
    };
}

//-------------------------------------------------------
// Evaluation
//-------------------------------------------------------

TEST(Evaluator, DerivesAllPropertiesFromInput)
{
    auto schema = build_schema(ExampleDeclarations());
    auto result = evaluate(schema, Value::create(2));

    EXPECT_EQ(schema.evaluation_order(), (std::vector<std::string>{"p", "q", "z", "r"}));
    EXPECT_EQ(result.size(), 4u);
    EXPECT_EQ(result.get<int>("p"), 3);
    EXPECT_EQ(result.get<int>("q"), 10);
    EXPECT_EQ(result.get<int>("r"), 30);
    EXPECT_EQ(result.get<int>("z"), 50);
    EXPECT_EQ(result.to_string(), "{p: 3, q: 10, z: 50, r: 30}");
}

TEST(Evaluator, FirstMatchingClauseWins)
{
    auto schema = build_schema(ExampleDeclarations());

    // p = 3 > 0: the guarded clause is picked before the p == 3 clause
    EXPECT_EQ(evaluate(schema, 2).get<int>("q"), 10);

    // p = -2: guard fails, p != 3, the fallback p * i applies
    auto negative = evaluate(schema, -3);
    EXPECT_EQ(negative.get<int>("p"), -2);
    EXPECT_EQ(negative.get<int>("q"), 6);
    EXPECT_EQ(negative.get<int>("z"), 30);
    EXPECT_EQ(negative.get<int>("r"), -12);
}

TEST(Evaluator, ExactlyOneValuePerProperty)
{
    auto schema = build_schema(ExampleDeclarations());
    auto result = evaluate(schema, 7);

    std::set<std::string> names;
    for (const auto& entry : result)
    {
        EXPECT_TRUE(names.insert(entry.name).second) << entry.name << " bound twice";
    }
    EXPECT_EQ(names, (std::set<std::string>{"p", "q", "r", "z"}));
}

TEST(Evaluator, DependenciesVisibleToClauses)
{
    std::vector<std::vector<std::string>> seen;

    Clause a;
    a.body = [](const Value&, const Record&) { return Value::create(1); };

    Clause b;
    b.required_names = {"a"};
    b.pattern = Pattern().bind("a").predicate();
    b.body = [&seen](const Value&, const Record& partial)
    {
        seen.push_back(partial.names());
        return Value::create(partial.get<int>("a") + 1);
    };

    auto schema = build_schema({PropertyDeclaration{"b", {b}}, PropertyDeclaration{"a", {a}}});
    auto result = evaluate(schema, 0);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], (std::vector<std::string>{"a"}));
    EXPECT_EQ(result.get<int>("b"), 2);
}

TEST(Evaluator, RepeatedEvaluationIsDeterministic)
{
    auto schema = build_schema(ExampleDeclarations());
    const auto order = schema.evaluation_order();
    const Record first = evaluate(schema, 11);

    for (int i = 0; i < 50; ++i)
    {
        const Record again = evaluate(schema, 11);
        EXPECT_TRUE(again == first);
        EXPECT_EQ(again.names(), first.names());
        EXPECT_EQ(schema.evaluation_order(), order);
    }
}

//-------------------------------------------------------
// Failures
//-------------------------------------------------------

TEST(Evaluator, NoMatchingClauseRaisesDispatchError)
{
    Clause p;
    p.body = [](const Value& in, const Record&) { return Value::create(Input(in) + 1); };

    // Only handles p == 3, no fallback
    Pattern p_is_3 = Pattern().equals("p", 3);
    Clause q;
    q.pattern = p_is_3.predicate();
    q.required_names = p_is_3.referenced_names();
    q.body = [](const Value&, const Record&) { return Value::create(0); };

    auto schema = build_schema({PropertyDeclaration{"p", {p}}, PropertyDeclaration{"q", {q}}});

    EXPECT_NO_THROW((void)evaluate(schema, 2));

    try
    {
        (void)evaluate(schema, 3);
        FAIL() << "expected DispatchError";
    }
    catch (const DispatchError& e)
    {
        EXPECT_EQ(e.property_name(), "q");
        EXPECT_EQ(e.snapshot().size(), 1u);
        EXPECT_EQ(e.snapshot().get<int>("p"), 4);
        EXPECT_NE(std::string(e.what()).find("{p: 4}"), std::string::npos);
    }
}

TEST(Evaluator, GuardSeesPatternBindings)
{
    Clause p;
    p.body = [](const Value& in, const Record&) { return Value::create(Input(in)); };

    Pattern bind_p = Pattern().bind("p");
    Clause even;
    even.pattern = bind_p.predicate();
    even.required_names = bind_p.referenced_names();
    even.guard = [](const Value&, const Record& bindings)
    {
        return bindings.size() == 1 && bindings.get<int>("p") % 2 == 0;
    };
    even.body = [](const Value&, const Record&) { return Value::create(std::string("even")); };

    Clause odd;
    odd.body = [](const Value&, const Record&) { return Value::create(std::string("odd")); };

    auto schema = build_schema({PropertyDeclaration{"p", {p}}, PropertyDeclaration{"parity", {even, odd}}});
    EXPECT_EQ(evaluate(schema, 4).get<std::string>("parity"), "even");
    EXPECT_EQ(evaluate(schema, 5).get<std::string>("parity"), "odd");
}

TEST(Evaluator, BodyExceptionsPropagate)
{
    Clause boom;
    boom.body = [](const Value&, const Record&) -> Value { throw std::domain_error("boom"); };
    auto schema = build_schema({PropertyDeclaration{"boom", {boom}}});

    EXPECT_THROW((void)evaluate(schema, 1), std::domain_error);
}

TEST(Evaluator, DeclaredTypeIsEnforced)
{
    Clause wrong;
    wrong.body = [](const Value&, const Record&) { return Value::create(1.5); };
    PropertyDeclaration p{"p", {wrong}};
    p.expect_type<int>();
    auto schema = build_schema({p});

    try
    {
        (void)evaluate(schema, 0);
        FAIL() << "expected PropertyTypeMismatchError";
    }
    catch (const PropertyTypeMismatchError& e)
    {
        EXPECT_EQ(e.property_name(), "p");
        EXPECT_EQ(e.expected_type(), "int");
        EXPECT_EQ(e.actual_type(), "double");
    }
}

TEST(Evaluator, InputTypeIsCheckedWhenSchemaFixesIt)
{
    Clause p;
    p.body = [](const Value& in, const Record&) { return Value::create(Input(in)); };

    SchemaOptions options;
    options.input_type = std::type_index(typeid(int));
    options.input_type_name = "int";
    auto schema = build_schema({PropertyDeclaration{"p", {p}}}, options);

    EXPECT_EQ(evaluate(schema, 9).get<int>("p"), 9);
    EXPECT_THROW((void)evaluate(schema, std::string("nine")), InputTypeMismatchError);
}

TEST(Evaluator, EmptySchemaYieldsEmptyRecord)
{
    auto schema = build_schema({});
    EXPECT_TRUE(evaluate(schema, 1).empty());
}

TEST(Evaluator, TracingDoesNotChangeResult)
{
    auto schema = build_schema(ExampleDeclarations());
    EvaluationOptions options;
    options.trace = true;

    const Record traced = evaluate(schema, Value::create(2), options);
    const Record plain = evaluate(schema, 2);
    EXPECT_TRUE(traced == plain);
}

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
