#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"
#include "runner.hpp"

// Runs a program and captures everything it prints
class EvaluatorTestHelper {
   public:
    explicit EvaluatorTestHelper(EvaluatorOptions options = {}) : runner(out, options) {}

    std::string run(const std::string& source) {
        out.str("");
        status = runner.run(source, "<test>");
        return out.str();
    }

    std::string lastError() const {
        const auto& all = runner.diagnostics().all();
        return all.empty() ? "" : all.back().message;
    }

    std::ostringstream out;
    Runner runner;
    RunStatus status = RunStatus::Ok;
};

static std::string output(const std::string& source) {
    EvaluatorTestHelper h;
    std::string printed = h.run(source);
    EXPECT_EQ(h.status, RunStatus::Ok) << h.lastError();
    return printed;
}

// ============================================================================
// ARITHMETIC AND VALUES
// ============================================================================

TEST(EvaluatorTest, Arithmetic) {
    EXPECT_EQ(output("print 5 + 3;"), "8\n");
    EXPECT_EQ(output("print 4 * 7;"), "28\n");
    EXPECT_EQ(output("print 10 - 2 * 3;"), "4\n");
    EXPECT_EQ(output("print (10 - 2) * 3;"), "24\n");
    EXPECT_EQ(output("print 7 / 2;"), "3.5\n");
    EXPECT_EQ(output("print -(1 + 2);"), "-3\n");
    EXPECT_EQ(output("print 1 - 2 - 3;"), "-4\n");
}

TEST(EvaluatorTest, Comparison) {
    EXPECT_EQ(output("print 1 < 2; print 2 <= 2; print 3 > 4; print 3 >= 4;"), "true\ntrue\nfalse\nfalse\n");
}

TEST(EvaluatorTest, StringConcatenation) {
    EXPECT_EQ(output("print \"foo\" + \"bar\";"), "foobar\n");
    EXPECT_EQ(output("var s = \"a\"; s = s + \"b\" + \"c\"; print s;"), "abc\n");
}

TEST(EvaluatorTest, Truthiness) {
    EXPECT_EQ(output("print !nil; print !false; print !0; print !\"\"; print !!true;"),
        "true\ntrue\nfalse\nfalse\ntrue\n");
    EXPECT_EQ(output("if (0) print \"zero is truthy\"; else print \"no\";"), "zero is truthy\n");
}

TEST(EvaluatorTest, Equality) {
    EXPECT_EQ(output("print 1 == 1; print \"a\" == \"a\"; print nil == nil; print nil == false;"),
        "true\ntrue\ntrue\nfalse\n");
    EXPECT_EQ(output("print 1 == \"1\"; print 0 == false; print 1 != 2;"), "false\nfalse\ntrue\n");
}

TEST(EvaluatorTest, EqualityOfObjectsIsIdentity) {
    EXPECT_EQ(output(
                  "class A {}\n"
                  "var a = A(); var b = A(); var c = a;\n"
                  "print a == b; print a == c;\n"
                  "fun f() {} var g = f; print f == g;\n"),
        "false\ntrue\ntrue\n");
}

TEST(EvaluatorTest, LogicalOperatorsReturnOperands) {
    EXPECT_EQ(output("print nil or \"yes\"; print 1 or 2; print nil and 1; print 1 and 2;"),
        "yes\n1\nnil\n2\n");
}

TEST(EvaluatorTest, LogicalOperatorsShortCircuit) {
    EXPECT_EQ(output(
                  "var hits = 0;\n"
                  "fun touch() { hits = hits + 1; return true; }\n"
                  "false and touch();\n"
                  "true or touch();\n"
                  "print hits;\n"),
        "0\n");
}

TEST(EvaluatorTest, PrintsValues) {
    EXPECT_EQ(output("print nil; print true; print \"text\";"), "nil\ntrue\ntext\n");
    EXPECT_EQ(output("fun f() {} print f; print clock;"), "<fn f>\n<native fn>\n");
    EXPECT_EQ(output("class Point {} print Point; print Point();"), "Point\nPoint instance\n");
}

// ============================================================================
// VARIABLES AND SCOPES
// ============================================================================

TEST(EvaluatorTest, UninitializedVariableIsNil) {
    EXPECT_EQ(output("var a; print a;"), "nil\n");
}

TEST(EvaluatorTest, GlobalRedeclarationReplacesValue) {
    EXPECT_EQ(output("var a = \"1\"; var a = \"2\"; print a;"), "2\n");
}

TEST(EvaluatorTest, GlobalRedeclarationReadsOldValue) {
    EXPECT_EQ(output("var x = 1; var x = x + 1; print x;"), "2\n");
}

TEST(EvaluatorTest, AssignmentIsAnExpression) {
    EXPECT_EQ(output("var a; var b; a = b = 3; print a; print b;"), "3\n3\n");
}

TEST(EvaluatorTest, BlockScoping) {
    EXPECT_EQ(output(
                  "var a = \"global\";\n"
                  "{ var a = \"outer\"; { var a = \"inner\"; print a; } print a; }\n"
                  "print a;\n"),
        "inner\nouter\nglobal\n");
}

TEST(EvaluatorTest, ClosureBindsLexically) {
    // the resolved binding does not change when a later shadow appears
    EXPECT_EQ(output(
                  "var a = \"global\";\n"
                  "{\n"
                  "  fun show() { print a; }\n"
                  "  show();\n"
                  "  var a = \"block\";\n"
                  "  show();\n"
                  "}\n"),
        "global\nglobal\n");
}

// ============================================================================
// CONTROL FLOW
// ============================================================================

TEST(EvaluatorTest, IfElse) {
    EXPECT_EQ(output("if (1 > 2) print \"a\"; else if (2 > 1) print \"b\"; else print \"c\";"), "b\n");
}

TEST(EvaluatorTest, WhileLoop) {
    EXPECT_EQ(output("var i = 0; while (i < 3) { print i; i = i + 1; }"), "0\n1\n2\n");
}

TEST(EvaluatorTest, ForLoop) {
    EXPECT_EQ(output("for (var i = 0; i < 3; i = i + 1) print i;"), "0\n1\n2\n");
    EXPECT_EQ(output("var i = 10; for (i = 0; i < 2; i = i + 1) {} print i;"), "2\n");
}

TEST(EvaluatorTest, BreakAndContinue) {
    EXPECT_EQ(output(
                  "for (var i = 0; i < 10; i = i + 1) {\n"
                  "  if (i == 1) continue;\n"
                  "  if (i == 4) break;\n"
                  "  print i;\n"
                  "}\n"),
        "0\n2\n3\n");
    EXPECT_EQ(output(
                  "var i = 0;\n"
                  "while (true) { i = i + 1; if (i < 3) continue; break; }\n"
                  "print i;\n"),
        "3\n");
}

TEST(EvaluatorTest, BreakOnlyLeavesInnermostLoop) {
    EXPECT_EQ(output(
                  "for (var i = 0; i < 2; i = i + 1) {\n"
                  "  for (var j = 0; j < 5; j = j + 1) { if (j == 1) break; print i * 10 + j; }\n"
                  "}\n"),
        "0\n10\n");
}

TEST(EvaluatorTest, ForLoopClosuresCaptureEachIteration) {
    EXPECT_EQ(output(
                  "var fs = nil; var gs = nil; var hs = nil;\n"
                  "for (var i = 0; i < 3; i = i + 1) {\n"
                  "  fun f() { print i; }\n"
                  "  if (i == 0) fs = f;\n"
                  "  if (i == 1) gs = f;\n"
                  "  if (i == 2) hs = f;\n"
                  "}\n"
                  "fs(); gs(); hs();\n"),
        "0\n1\n2\n");
}

// ============================================================================
// FUNCTIONS AND CLOSURES
// ============================================================================

TEST(EvaluatorTest, FunctionCallAndReturn) {
    EXPECT_EQ(output("fun add(a, b) { return a + b; } print add(2, 3);"), "5\n");
    EXPECT_EQ(output("fun f() { return; } print f();"), "nil\n");
    EXPECT_EQ(output("fun g() {} print g();"), "nil\n");
}

TEST(EvaluatorTest, Recursion) {
    EXPECT_EQ(output("fun fib(n) { if (n < 2) return n; return fib(n - 1) + fib(n - 2); } print fib(15);"), "610\n");
}

TEST(EvaluatorTest, ReturnUnwindsLoops) {
    EXPECT_EQ(output(
                  "fun first() { for (var i = 0; ; i = i + 1) { while (true) { return i + 7; } } }\n"
                  "print first();\n"),
        "7\n");
}

TEST(EvaluatorTest, CounterClosure) {
    EXPECT_EQ(output(
                  "fun makeCounter() {\n"
                  "  var n = 0;\n"
                  "  fun inc() { n = n + 1; return n; }\n"
                  "  return inc;\n"
                  "}\n"
                  "var a = makeCounter(); var b = makeCounter();\n"
                  "a(); a();\n"
                  "print a(); print b();\n"),
        "3\n1\n");
}

TEST(EvaluatorTest, ClosuresShareCapturedVariable) {
    EXPECT_EQ(output(
                  "var get; var set;\n"
                  "{\n"
                  "  var v = 1;\n"
                  "  fun g() { return v; }\n"
                  "  fun s(x) { v = x; }\n"
                  "  get = g; set = s;\n"
                  "}\n"
                  "set(42); print get();\n"),
        "42\n");
}

TEST(EvaluatorTest, ClockReturnsNonDecreasingNumber) {
    EXPECT_EQ(output(
                  "var a = clock(); var b = clock();\n"
                  "print a >= 0; print b >= a;\n"),
        "true\ntrue\n");
}

// ============================================================================
// CLASSES
// ============================================================================

TEST(EvaluatorTest, ClassFieldsAndMethods) {
    EXPECT_EQ(output(
                  "class Point {\n"
                  "  init(x, y) { this.x = x; this.y = y; }\n"
                  "  sum() { return this.x + this.y; }\n"
                  "}\n"
                  "var p = Point(1, 2);\n"
                  "print p.sum();\n"
                  "p.x = 10;\n"
                  "print p.sum();\n"),
        "3\n12\n");
}

TEST(EvaluatorTest, FieldsShadowMethods) {
    EXPECT_EQ(output(
                  "class A { m() { return \"method\"; } }\n"
                  "var a = A();\n"
                  "fun other() { return \"field\"; }\n"
                  "a.m = other;\n"
                  "print a.m();\n"),
        "field\n");
}

TEST(EvaluatorTest, InstancesAreSharedByReference) {
    EXPECT_EQ(output(
                  "class Box {}\n"
                  "var a = Box(); var b = a;\n"
                  "b.v = \"shared\";\n"
                  "print a.v;\n"),
        "shared\n");
}

TEST(EvaluatorTest, BoundMethodsRememberReceiver) {
    EXPECT_EQ(output(
                  "class Person { init(n) { this.name = n; } hi() { print \"hi \" + this.name; } }\n"
                  "var m = Person(\"ada\").hi;\n"
                  "m();\n"),
        "hi ada\n");
}

TEST(EvaluatorTest, BoundMethodCarriesReceiver) {
    EvaluatorTestHelper h;
    h.run("class A { m() {} } var a = A(); var bound = a.m;");
    ASSERT_EQ(h.status, RunStatus::Ok);

    Value* bound = h.runner.evaluator().globals()->find("bound");
    Value* a = h.runner.evaluator().globals()->find("a");
    ASSERT_NE(bound, nullptr);
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(std::holds_alternative<FunctionPtr>(*bound));
    EXPECT_EQ(std::get<FunctionPtr>(*bound)->receiver, std::get<InstancePtr>(*a));
    EXPECT_EQ(std::get<FunctionPtr>(*bound)->name, "m");
}

TEST(EvaluatorTest, InitializerReturnsInstance) {
    EXPECT_EQ(output(
                  "class A { init() { this.v = 1; return; } }\n"
                  "var a = A();\n"
                  "print a.init();\n"
                  "print a.init() == a;\n"),
        "A instance\ntrue\n");
}

TEST(EvaluatorTest, InheritanceAndSuper) {
    EXPECT_EQ(output(
                  "class A { greet() { return \"A\"; } only() { return \"only A\"; } }\n"
                  "class B < A { greet() { return \"B/\" + super.greet(); } }\n"
                  "class C < B { greet() { return \"C/\" + super.greet(); } }\n"
                  "print C().greet();\n"
                  "print C().only();\n"),
        "C/B/A\nonly A\n");
}

TEST(EvaluatorTest, SuperDispatchesFromDefiningClass) {
    // super in B's method always means A, even when called on a C
    EXPECT_EQ(output(
                  "class A { m() { return \"A\"; } }\n"
                  "class B < A { test() { return super.m(); } m() { return \"B\"; } }\n"
                  "class C < B { m() { return \"C\"; } }\n"
                  "print C().test();\n"),
        "A\n");
}

TEST(EvaluatorTest, InheritedInitializer) {
    EXPECT_EQ(output(
                  "class A { init(v) { this.v = v; } }\n"
                  "class B < A {}\n"
                  "print B(5).v;\n"),
        "5\n");
}

// ============================================================================
// RUNTIME ERRORS
// ============================================================================

TEST(EvaluatorErrorTest, AddingNumberAndString) {
    EvaluatorTestHelper h;
    h.run("print 1 + \"1\";");
    EXPECT_EQ(h.status, RunStatus::RuntimeError);
    EXPECT_EQ(h.lastError(), "TypeError: Operands must be two numbers or two strings.");
}

TEST(EvaluatorErrorTest, NegatingNonNumber) {
    EvaluatorTestHelper h;
    h.run("print -\"x\";");
    EXPECT_EQ(h.status, RunStatus::RuntimeError);
    EXPECT_EQ(h.lastError(), "TypeError: Operand must be a number.");
}

TEST(EvaluatorErrorTest, ComparingNonNumbers) {
    EvaluatorTestHelper h;
    h.run("print \"a\" < \"b\";");
    EXPECT_EQ(h.lastError(), "TypeError: Operands must be numbers.");
}

TEST(EvaluatorErrorTest, DivisionByZero) {
    EvaluatorTestHelper h;
    h.run("print 1 / 0;");
    EXPECT_EQ(h.status, RunStatus::RuntimeError);
    EXPECT_EQ(h.lastError(), "ZeroDivisionError: Division by zero.");
}

TEST(EvaluatorErrorTest, UndefinedVariable) {
    EvaluatorTestHelper h;
    h.run("print missing;");
    EXPECT_EQ(h.lastError(), "ReferenceError: Undefined variable 'missing'.");
    h.run("missing = 1;");
    EXPECT_EQ(h.lastError(), "ReferenceError: Undefined variable 'missing'.");
}

TEST(EvaluatorErrorTest, PropertyErrors) {
    EvaluatorTestHelper h;
    h.run("class A {} print A().nope;");
    EXPECT_EQ(h.lastError(), "ReferenceError: Undefined property 'nope'.");
    h.run("var n = 1; print n.x;");
    EXPECT_EQ(h.lastError(), "TypeError: Only instances have properties.");
    h.run("var s = \"str\"; s.x = 1;");
    EXPECT_EQ(h.lastError(), "TypeError: Only instances have fields.");
}

TEST(EvaluatorErrorTest, CallingNonCallable) {
    EvaluatorTestHelper h;
    h.run("\"text\"();");
    EXPECT_EQ(h.lastError(), "TypeError: Can only call functions and classes.");
}

TEST(EvaluatorErrorTest, ArityMismatch) {
    EvaluatorTestHelper h;
    h.run("fun f(a, b) {} f(1);");
    EXPECT_EQ(h.lastError(), "ArityError: Expected 2 arguments but got 1.");
    h.run("class P { init(x) {} } P();");
    EXPECT_EQ(h.lastError(), "ArityError: Expected 1 arguments but got 0.");
    h.run("class Q {} Q(1);");
    EXPECT_EQ(h.lastError(), "ArityError: Expected 0 arguments but got 1.");
    h.run("clock(1);");
    EXPECT_EQ(h.lastError(), "ArityError: Expected 0 arguments but got 1.");
}

TEST(EvaluatorErrorTest, SuperclassMustBeClass) {
    EvaluatorTestHelper h;
    h.run("var NotAClass = 1; class B < NotAClass {}");
    EXPECT_EQ(h.lastError(), "TypeError: Superclass must be a class.");
}

TEST(EvaluatorErrorTest, UnboundedRecursionOverflows) {
    EvaluatorOptions options;
    options.max_call_depth = 64;
    EvaluatorTestHelper h(options);
    h.run("fun down(n) { return down(n + 1); } down(0);");
    EXPECT_EQ(h.status, RunStatus::RuntimeError);
    EXPECT_EQ(h.lastError(), "StackOverflowError: Stack overflow.");
    EXPECT_EQ(h.runner.evaluator().call_depth(), 0);

    // recursion within the limit still works afterwards
    EXPECT_EQ(h.run("fun sum(n) { if (n == 0) return 0; return n + sum(n - 1); } print sum(50);"), "1275\n");
    EXPECT_EQ(h.status, RunStatus::Ok);
}

TEST(EvaluatorErrorTest, RecursionReachesTheDepthCap) {
    EvaluatorOptions options;
    options.max_call_depth = kMaxCallDepthLimit;
    EvaluatorTestHelper h(options);
    EXPECT_EQ(h.run("fun r(n) { if (n == 0) return 0; return r(n - 1); } print r(9990);"), "0\n");
    EXPECT_EQ(h.status, RunStatus::Ok) << h.lastError();

    h.run("fun down(n) { return down(n + 1); } down(0);");
    EXPECT_EQ(h.status, RunStatus::RuntimeError);
    EXPECT_EQ(h.lastError(), "StackOverflowError: Stack overflow.");
}

TEST(EvaluatorErrorTest, CallDepthOptionIsClamped) {
    std::ostringstream out;
    EvaluatorOptions options;
    options.max_call_depth = kMaxCallDepthLimit * 10;
    Evaluator big(out, options);
    EXPECT_EQ(big.options().max_call_depth, kMaxCallDepthLimit);

    options.max_call_depth = 0;
    Evaluator small(out, options);
    EXPECT_EQ(small.options().max_call_depth, 1);
}

TEST(EvaluatorErrorTest, EvaluationStackGrowsWithDepth) {
    EXPECT_LT(evaluation_stack_size(256), evaluation_stack_size(kMaxCallDepthLimit));
    EXPECT_GE(evaluation_stack_size(1), 1024u * 1024u);
}

TEST(EvaluatorErrorTest, OutputBeforeErrorIsKept) {
    EvaluatorTestHelper h;
    std::string printed = h.run("print \"before\"; print nil + 1; print \"after\";");
    EXPECT_EQ(printed, "before\n");
    EXPECT_EQ(h.status, RunStatus::RuntimeError);
}

TEST(EvaluatorErrorTest, RuntimeErrorCarriesLine) {
    EvaluatorTestHelper h;
    h.run("var a = 1;\n\nprint a + nil;");
    ASSERT_EQ(h.runner.diagnostics().count(), 1u);
    EXPECT_EQ(h.runner.diagnostics().all()[0].phase, Phase::Runtime);
    EXPECT_EQ(h.runner.diagnostics().all()[0].line, 3);
}

// ============================================================================
// NUMBER FORMATTING
// ============================================================================

TEST(NumberFormatTest, IntegralValuesHaveNoFraction) {
    EXPECT_EQ(format_number(0.0), "0");
    EXPECT_EQ(format_number(42.0), "42");
    EXPECT_EQ(format_number(-7.0), "-7");
    EXPECT_EQ(format_number(1e15), "1000000000000000");
}

TEST(NumberFormatTest, NegativeZeroKeepsSign) {
    EXPECT_EQ(format_number(-0.0), "-0");
}

TEST(NumberFormatTest, FractionsUseShortestRoundTrip) {
    EXPECT_EQ(format_number(3.5), "3.5");
    EXPECT_EQ(format_number(0.1), "0.1");
    EXPECT_EQ(format_number(0.1 + 0.2), "0.30000000000000004");
    EXPECT_EQ(format_number(1.0 / 3.0), "0.3333333333333333");
}

TEST(NumberFormatTest, LargeAndSpecialValues) {
    EXPECT_EQ(format_number(1e20), "1e+20");
    EXPECT_EQ(format_number(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(format_number(-std::numeric_limits<double>::infinity()), "-inf");
    EXPECT_EQ(format_number(std::nan("")), "nan");
}

TEST(NumberFormatTest, OverflowingLiteralIsInfinite) {
    std::string huge = "1" + std::string(400, '0');
    EXPECT_EQ(output("print " + huge + ";"), "inf\n");
    EXPECT_EQ(output("print -" + huge + ";"), "-inf\n");
    EXPECT_EQ(output("print " + huge + " - " + huge + ";"), "nan\n");
}

TEST(NumberFormatTest, PrintUsesSameFormatting) {
    EXPECT_EQ(output("print 10 / 4; print 2 * 0.5; print 0.1 + 0.2;"), "2.5\n1\n0.30000000000000004\n");
}

// ============================================================================
// MEMORY RECLAMATION
// ============================================================================

TEST(HeapTest, ClosureCycleIsReclaimed) {
    EvaluatorTestHelper h;
    h.run("fun outer() { var x = 1; fun inner() { return x; } return inner; } var f = outer();");
    ASSERT_EQ(h.status, RunStatus::Ok);

    std::weak_ptr<Environment> scope;
    {
        Value* f = h.runner.evaluator().globals()->find("f");
        ASSERT_NE(f, nullptr);
        scope = std::get<FunctionPtr>(*f)->closure;
    }
    h.runner.evaluator().collect_garbage();
    EXPECT_FALSE(scope.expired());  // still reachable through f

    h.run("f = nil;");
    EXPECT_GE(h.runner.evaluator().collect_garbage(), 1u);
    EXPECT_TRUE(scope.expired());
}

TEST(HeapTest, InstanceSelfReferenceIsReclaimed) {
    EvaluatorTestHelper h;
    h.run("class Node {} var n = Node(); n.self = n;");
    ASSERT_EQ(h.status, RunStatus::Ok);

    std::weak_ptr<InstanceValue> node;
    {
        Value* n = h.runner.evaluator().globals()->find("n");
        ASSERT_NE(n, nullptr);
        node = std::get<InstancePtr>(*n);
    }
    h.run("n = nil;");
    h.runner.evaluator().collect_garbage();
    EXPECT_TRUE(node.expired());
    EXPECT_EQ(h.runner.evaluator().heap().live_instances(), 0u);
}

TEST(HeapTest, RepeatedClosuresStayBounded) {
    EvaluatorTestHelper h;
    h.run(
        "fun outer() { var x = 1; fun inner() { return x; } return inner; }\n"
        "for (var i = 0; i < 10000; i = i + 1) outer();\n");
    ASSERT_EQ(h.status, RunStatus::Ok) << h.lastError();
    // collections ran during the loop
    EXPECT_LT(h.runner.evaluator().heap().live_environments(), 10000u);

    h.runner.evaluator().collect_garbage();
    EXPECT_LT(h.runner.evaluator().heap().live_environments(), 16u);
    EXPECT_EQ(h.runner.evaluator().heap().root_count(), 0u);
}

TEST(HeapTest, CollectionKeepsReachableObjects) {
    EXPECT_EQ(output(
                  "class Node { init(v, next) { this.v = v; this.next = next; } }\n"
                  "var head = nil;\n"
                  "for (var i = 0; i < 5000; i = i + 1) head = Node(i, head);\n"
                  "fun total(list) { var s = 0; while (list != nil) { s = s + list.v; list = list.next; } return s; }\n"
                  "print total(head);\n"
                  "fun make(n) { fun get() { return n; } return get; }\n"
                  "var fs = nil;\n"
                  "for (var i = 0; i < 5000; i = i + 1) fs = Node(make(i), fs);\n"
                  "print fs.v() + fs.next.v();\n"),
        "12497500\n9997\n");
}

TEST(HeapTest, EvaluatorShutdownReleasesCycles) {
    std::weak_ptr<Environment> scope;
    {
        EvaluatorTestHelper h;
        h.run("fun outer() { var x = 1; fun inner() { return x; } return inner; } var f = outer();");
        ASSERT_EQ(h.status, RunStatus::Ok);
        scope = std::get<FunctionPtr>(*h.runner.evaluator().globals()->find("f"))->closure;
    }
    EXPECT_TRUE(scope.expired());
}
