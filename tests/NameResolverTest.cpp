// =================================================================
// tests/NameResolverTest.cpp
// =================================================================
// Unit tests for NameResolver.

#include "Renamarion/NameResolver.hpp"
#include "Renamarion/Classifier.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class NameResolverTest {
private:
    Renamarion::RuleSet m_rules;

    Renamarion::Entry makeEntry(const std::string& name) {
        Renamarion::Classifier classifier(m_rules);
        return classifier.classifyEntry("/data", name, Renamarion::EntryType::FILE);
    }

    // Classify the resolved path again and resolve once more
    fs::path resolveTwice(const Renamarion::Entry& entry) {
        Renamarion::Classifier classifier(m_rules);
        Renamarion::NameResolver resolver(m_rules);
        fs::path once = resolver.resolve(entry);
        auto again = classifier.classifyEntry(once.parent_path(), once.filename().string(), entry.type);
        return resolver.resolve(again);
    }

public:
    NameResolverTest() : m_rules(Renamarion::RuleSet::createDefault()) {}

    void testScenarios() {
        std::cout << "Testing resolution scenarios..." << std::endl;

        Renamarion::NameResolver resolver(m_rules);

        assert(resolver.resolve(makeEntry("foo<bar>.txt")) == fs::path("/data/foo(bar).txt"));
        assert(resolver.resolve(makeEntry("notes, ")) == fs::path("/data/notes"));
        assert(resolver.resolve(makeEntry("a:b|c")) == fs::path("/data/a-b_c"));
        assert(resolver.resolve(makeEntry("what?*")) == fs::path("/data/what.x"));
        assert(resolver.resolve(makeEntry("sync\xEF\x80\xA2" "copy")) == fs::path("/data/sync-copy"));

        std::cout << "✓ Resolution scenarios test passed" << std::endl;
    }

    void testValidEntryIsIdentity() {
        std::cout << "Testing identity for valid entries..." << std::endl;

        Renamarion::NameResolver resolver(m_rules);
        auto entry = makeEntry("plain.txt");
        assert(!entry.invalid);
        assert(resolver.resolve(entry) == entry.path);

        auto proposal = resolver.propose(entry);
        assert(proposal.isNoop());
        assert(proposal.applicable);

        std::cout << "✓ Identity test passed" << std::endl;
    }

    void testLiteralRulesApplyBeforeTermination() {
        std::cout << "Testing rule application order..." << std::endl;

        Renamarion::NameResolver resolver(m_rules);
        assert(resolver.resolveName("a<,", {"<", "termination"}) == "a(");
        assert(resolver.resolveName("report: , ", {":", "termination"}) == "report-");

        std::cout << "✓ Rule application order test passed" << std::endl;
    }

    void testOnlyCapturedRulesApply() {
        std::cout << "Testing that only captured rules are applied..." << std::endl;

        Renamarion::NameResolver resolver(m_rules);
        assert(resolver.resolveName("a<b>", {"<"}) == "a(b>");
        assert(resolver.resolveName("a<b>", {}) == "a<b>");

        std::cout << "✓ Captured rules test passed" << std::endl;
    }

    void testFixedPoint() {
        std::cout << "Testing resolve fixed point..." << std::endl;

        Renamarion::NameResolver resolver(m_rules);
        std::vector<std::string> names = {
            "plain.txt", "foo<bar>.txt", "notes, ", "a:b?c*d", "x\"y\"z|", "dir\\name , ,",
            "sync\xEF\x80\xA2", "<<>>", "end?"
        };
        for (const auto& name : names) {
            auto entry = makeEntry(name);
            assert(resolveTwice(entry) == resolver.resolve(entry));
        }

        std::cout << "✓ Fixed point test passed" << std::endl;
    }

    void testSinglePassLimitation() {
        std::cout << "Testing single-pass resolution across rules..." << std::endl;

        Renamarion::NameResolver resolver(m_rules);
        auto entry = makeEntry("notes,\r");
        assert((entry.violated == Renamarion::RuleKeySet{"\r"}));

        // Removing the carriage return exposes a trailing comma, which the
        // single pass does not fix. A second run does.
        fs::path once = resolver.resolve(entry);
        assert(once == fs::path("/data/notes,"));
        assert(resolveTwice(entry) == fs::path("/data/notes"));

        std::cout << "✓ Single-pass resolution test passed" << std::endl;
    }

    void testUnusableNames() {
        std::cout << "Testing unusable sanitized names..." << std::endl;

        Renamarion::NameResolver resolver(m_rules);

        auto proposal = resolver.propose(makeEntry(" , "));
        assert(!proposal.applicable);
        assert(!proposal.problem.empty());

        proposal = resolver.propose(makeEntry(". "));
        assert(!proposal.applicable && "'.' is not a usable name");

        proposal = resolver.propose(makeEntry("a:b"));
        assert(proposal.applicable);
        assert(proposal.original_path == fs::path("/data/a:b"));
        assert(proposal.proposed_path == fs::path("/data/a-b"));

        std::cout << "✓ Unusable names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running NameResolver unit tests..." << std::endl;

        testScenarios();
        testValidEntryIsIdentity();
        testLiteralRulesApplyBeforeTermination();
        testOnlyCapturedRulesApply();
        testFixedPoint();
        testSinglePassLimitation();
        testUnusableNames();

        std::cout << "All NameResolver tests passed!" << std::endl;
    }
};

int main() {
    try {
        NameResolverTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All NameResolver component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
