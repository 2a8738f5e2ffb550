// =================================================================
// tests/InteractiveConfirmationTest.cpp
// =================================================================
// Unit tests for the interactive prompts: Console, InteractiveConfirmation,
// RuleEditor and ReportPrinter.

#include "Renamarion/InteractiveConfirmation.hpp"
#include "Renamarion/Classifier.hpp"
#include "Renamarion/Console.hpp"
#include "Renamarion/ReportPrinter.hpp"
#include "Renamarion/RuleEditor.hpp"
#include <iostream>
#include <cassert>
#include <sstream>
#include <string>

using Renamarion::ConfirmationAction;

class InteractiveConfirmationTest {
private:
    Renamarion::RuleSet m_rules;

    Renamarion::RenameProposal makeProposal(const std::string& name) {
        Renamarion::Classifier classifier(m_rules);
        Renamarion::NameResolver resolver(m_rules);
        return resolver.propose(classifier.classifyEntry("/data", name, Renamarion::EntryType::FILE));
    }

public:
    InteractiveConfirmationTest() : m_rules(Renamarion::RuleSet::createDefault()) {}

    void testKeyBindings() {
        std::cout << "Testing key bindings..." << std::endl;

        std::istringstream in;
        std::ostringstream out;
        Renamarion::Console console(in, out, false);
        Renamarion::InteractiveConfirmation confirmation(console);

        ConfirmationAction action;
        assert(confirmation.parseUserInput("y", action) && action == ConfirmationAction::ACCEPT);
        assert(confirmation.parseUserInput(" YES ", action) && action == ConfirmationAction::ACCEPT);
        assert(confirmation.parseUserInput("n", action) && action == ConfirmationAction::REJECT);
        assert(confirmation.parseUserInput("a", action) && action == ConfirmationAction::ACCEPT_ALL);
        assert(confirmation.parseUserInput("r", action) && action == ConfirmationAction::REJECT_ALL);
        assert(confirmation.parseUserInput("?", action) && action == ConfirmationAction::HELP);
        assert(confirmation.parseUserInput("q", action) && action == ConfirmationAction::QUIT);
        assert(!confirmation.parseUserInput("maybe", action));
        assert(!confirmation.parseUserInput("", action));

        std::cout << "✓ Key bindings test passed" << std::endl;
    }

    void testDecidePrompt() {
        std::cout << "Testing rename prompt..." << std::endl;

        std::istringstream in("maybe\n?\ny\n");
        std::ostringstream out;
        Renamarion::Console console(in, out, false);
        Renamarion::InteractiveConfirmation confirmation(console);

        auto action = confirmation.decide(makeProposal("a:b"), 3, 7);
        assert(action == ConfirmationAction::ACCEPT);

        std::string text = out.str();
        assert(text.find(" - [3/7] File : /data/a:b will be renamed into /data/a-b") != std::string::npos);
        assert(text.find("Unknown answer 'maybe'.") != std::string::npos);
        assert(text.find("--- ACTIONS ---") != std::string::npos);

        std::cout << "✓ Rename prompt test passed" << std::endl;
    }

    void testEndOfInputQuits() {
        std::cout << "Testing end of input..." << std::endl;

        std::istringstream in("");
        std::ostringstream out;
        Renamarion::Console console(in, out, false);
        Renamarion::InteractiveConfirmation confirmation(console);

        assert(confirmation.decide(makeProposal("a:b"), 1, 1) == ConfirmationAction::QUIT);

        std::cout << "✓ End of input test passed" << std::endl;
    }

    void testConsoleConfirm() {
        std::cout << "Testing yes/no questions..." << std::endl;

        std::istringstream in("what\r\nNo\r\n");
        std::ostringstream out;
        Renamarion::Console console(in, out, false);

        bool answer = true;
        assert(console.confirm("Proceed?", answer));
        assert(!answer);
        assert(out.str().find("Please answer 'y' or 'n'.") != std::string::npos);
        assert(!console.confirm("Again?", answer) && "End of input is not an answer");

        Renamarion::Console colored(in, out, true);
        assert(colored.paint("x", Renamarion::Console::RED) == std::string("\033[31mx\033[0m"));
        assert(console.paint("x", Renamarion::Console::RED) == "x");

        std::cout << "✓ Yes/no questions test passed" << std::endl;
    }

    void testRuleEditorSession() {
        std::cout << "Testing rule review dialogue..." << std::endl;

        std::istringstream in("n\n#\ntermination\n<\n>\n(, \n[\ny\n");
        std::ostringstream out;
        Renamarion::Console console(in, out, false);
        Renamarion::ReportPrinter printer(console);
        Renamarion::RuleEditor editor(console, printer);

        auto builder = Renamarion::RuleSetBuilder::withDefaults();
        assert(editor.run(builder));

        std::string text = out.str();
        assert(text.find("Forbidden characters are :") != std::string::npos);
        assert(text.find(" - < will be converted to (") != std::string::npos);
        assert(text.find("'#' is not a forbidden character.") != std::string::npos);
        assert(text.find("Rule termination cannot be edited.") != std::string::npos);
        size_t first_rejection = text.find("Invalid input, as it would leave a forbidden character in the name.");
        assert(first_rejection != std::string::npos);
        assert(text.find("Invalid input", first_rejection + 1) != std::string::npos &&
               "A replacement ending with ', ' is rejected too");
        assert(text.find(" - < will be converted to [") != std::string::npos);

        auto rules = builder.build();
        auto less = dynamic_cast<const Renamarion::LiteralCharacterRule*>(rules.find("<"));
        assert(less != nullptr && less->getReplacement() == "[");

        std::cout << "✓ Rule review dialogue test passed" << std::endl;
    }

    void testRuleEditorEndOfInput() {
        std::cout << "Testing rule review end of input..." << std::endl;

        std::istringstream in("n\n<\n");
        std::ostringstream out;
        Renamarion::Console console(in, out, false);
        Renamarion::ReportPrinter printer(console);
        Renamarion::RuleEditor editor(console, printer);

        auto builder = Renamarion::RuleSetBuilder::withDefaults();
        assert(!editor.run(builder));

        std::cout << "✓ Rule review end of input test passed" << std::endl;
    }

    void testReportPrinter() {
        std::cout << "Testing report output..." << std::endl;

        std::istringstream in;
        std::ostringstream out;
        Renamarion::Console console(in, out, false);
        Renamarion::ReportPrinter printer(console, true);

        Renamarion::Classifier classifier(m_rules);
        Renamarion::Inventory inventory;
        inventory.add(classifier.classifyEntry("/data", "a:b", Renamarion::EntryType::FILE));
        inventory.add(classifier.classifyEntry("/data", "c:d", Renamarion::EntryType::FILE));
        inventory.add(classifier.classifyEntry("/data", "ok", Renamarion::EntryType::DIRECTORY));
        printer.printScanSummary(inventory);

        Renamarion::RenameOutcome outcome;
        outcome.proposal = makeProposal("a:b");
        outcome.status = Renamarion::RenameStatus::RENAMED;
        printer.onOutcome(outcome);

        Renamarion::SessionReport report;
        report.outcomes.push_back(outcome);
        report.renamed = 1;
        printer.printSessionSummary(report, false);

        std::string text = out.str();
        assert(text.find("Scanned 2 total files.") != std::string::npos);
        assert(text.find("Scanned 1 total directories.") != std::string::npos);
        assert(text.find("Found 2 problematic files.") != std::string::npos);
        assert(text.find("Found 0 problematic directories.") != std::string::npos);
        assert(text.find(" - {:} contains 2") != std::string::npos);
        assert(text.find("/data/a:b -> /data/a-b : renamed") != std::string::npos);
        assert(text.find("=== SESSION SUMMARY ===") != std::string::npos);
        assert(text.find("Renamed: 1") != std::string::npos);

        std::cout << "✓ Report output test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running interactive prompt unit tests..." << std::endl;

        testKeyBindings();
        testDecidePrompt();
        testEndOfInputQuits();
        testConsoleConfirm();
        testRuleEditorSession();
        testRuleEditorEndOfInput();
        testReportPrinter();

        std::cout << "All interactive prompt tests passed!" << std::endl;
    }
};

int main() {
    try {
        InteractiveConfirmationTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All InteractiveConfirmation component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
