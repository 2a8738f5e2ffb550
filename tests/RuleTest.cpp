// =================================================================
// tests/RuleTest.cpp
// =================================================================
// Unit tests for the literal-character and trailing-character rules.

#include "Renamarion/Rule.hpp"
#include "Renamarion/RuleSet.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

class RuleTest {
private:
    std::vector<std::string> sampleNames() const {
        return {
            "plain.txt",
            "foo<bar>.txt",
            "a<<b<<c",
            "<",
            "report: final?.docx",
            "quote\"d|piped*",
            "back\\slash",
            "carriage\rreturn",
            "sync\xEF\x80\xA2" "conflict",
            "notes, ",
            "trailing , , ,",
            " ,",
            "ends with space ",
            "mixed<,>: , "
        };
    }

public:
    void testLiteralMatchAndApply() {
        std::cout << "Testing literal-character rule..." << std::endl;

        Renamarion::LiteralCharacterRule rule("<", "(");
        assert(rule.getKey() == "<");
        assert(rule.isEditable());
        assert(rule.matches("foo<bar"));
        assert(!rule.matches("foobar"));
        assert(rule.apply("foo<bar") == "foo(bar");
        assert(rule.apply("<a<<b<") == "(a((b(" && "Every occurrence is replaced");
        assert(rule.apply("foobar") == "foobar" && "Non-matching names are unchanged");

        Renamarion::LiteralCharacterRule removal("\r", "");
        assert(removal.apply("Icon\r") == "Icon");
        assert(removal.describe() == "will be removed");

        std::cout << "✓ Literal-character rule test passed" << std::endl;
    }

    void testMultiByteCharacter() {
        std::cout << "Testing multi-byte forbidden character..." << std::endl;

        const std::string private_use = "\xEF\x80\xA2";  // U+F022
        Renamarion::LiteralCharacterRule rule(private_use, "-");

        assert(rule.matches("a" + private_use + "b"));
        assert(rule.apply("a" + private_use + "b" + private_use) == "a-b-");
        // Another character sharing the lead byte must not match
        assert(!rule.matches("a\xEF\x80\xA3" "b"));

        std::cout << "✓ Multi-byte forbidden character test passed" << std::endl;
    }

    void testTrailingCharacterRule() {
        std::cout << "Testing trailing-character rule..." << std::endl;

        Renamarion::TrailingCharacterRule rule;
        assert(rule.getKey() == "termination");
        assert(!rule.isEditable());

        assert(rule.matches("notes, "));
        assert(rule.matches("notes,"));
        assert(rule.matches("notes "));
        assert(!rule.matches("notes"));
        assert(!rule.matches("a, b"));
        assert(!rule.matches(""));

        assert(rule.apply("notes, ") == "notes");
        assert(rule.apply("notes , , ,") == "notes" && "Stripping repeats until no trailing character is left");
        assert(rule.apply("a, b") == "a, b");
        assert(rule.apply(" , ").empty());

        std::cout << "✓ Trailing-character rule test passed" << std::endl;
    }

    void testSingleApplicationResolvesViolation() {
        std::cout << "Testing that one application resolves every default rule..." << std::endl;

        Renamarion::RuleSet rules = Renamarion::RuleSet::createDefault();
        for (const auto& rule : rules) {
            for (const auto& name : sampleNames()) {
                if (rule->matches(name)) {
                    assert(!rule->matches(rule->apply(name)));
                } else {
                    assert(rule->apply(name) == name);
                }
            }
        }

        std::cout << "✓ Single application test passed" << std::endl;
    }

    void testDisplayEscaping() {
        std::cout << "Testing display escaping..." << std::endl;

        assert(Renamarion::Rule::escapeForDisplay("<") == "<");
        assert(Renamarion::Rule::escapeForDisplay("\\") == "\\");
        assert(Renamarion::Rule::escapeForDisplay("\r") == "\\r");
        assert(Renamarion::Rule::escapeForDisplay("\x01") == "\\x01");
        assert(Renamarion::Rule::escapeForDisplay("\xEF\x80\xA2") == "\\uf022");

        Renamarion::LiteralCharacterRule rule("\r", "");
        assert(rule.getDisplayKey() == "\\r");

        std::cout << "✓ Display escaping test passed" << std::endl;
    }

    void testRuleKeySetFormatting() {
        std::cout << "Testing violated-rule set formatting..." << std::endl;

        Renamarion::RuleKeySet keys = {">", "<"};
        assert(Renamarion::formatRuleKeySet(keys) == "{<, >}");
        assert(Renamarion::formatRuleKeySet({}) == "{}");
        assert(Renamarion::formatRuleKeySet({"\r", "termination"}) == "{\\r, termination}");

        std::cout << "✓ Violated-rule set formatting test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Rule unit tests..." << std::endl;

        testLiteralMatchAndApply();
        testMultiByteCharacter();
        testTrailingCharacterRule();
        testSingleApplicationResolvesViolation();
        testDisplayEscaping();
        testRuleKeySetFormatting();

        std::cout << "All Rule tests passed!" << std::endl;
    }
};

int main() {
    try {
        RuleTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Rule component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
