// tests/test_scoring.cpp
//
// Log-likelihood scoring, list ordering, the decision-list text format and
// a small end-to-end training run.

#include "declist/decision_list.hpp"
#include "declist/scorer.hpp"
#include "declist/trainer.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) < tol;
}

declist::Decision counted(const std::string& feature, double pos, double neg) {
    declist::Decision d(feature);
    d.positive_count = pos;
    d.negative_count = neg;
    return d;
}

declist::Decision scored(const std::string& feature, double ll, bool cls) {
    declist::Decision d(feature, cls);
    d.log_likelihood = ll;
    return d;
}

int test_laplace() {
    std::cout << "Testing Laplace scoring...\n";
    int failed = 0;

    expect(near(declist::signed_log_likelihood(5, 0), std::log2(6.0)), "5/0 -> log2(6)", failed);
    expect(near(declist::signed_log_likelihood(0, 4), -std::log2(5.0)), "0/4 -> -log2(5)",
           failed);
    expect(near(declist::signed_log_likelihood(6, 2), std::log2(3.0)), "6/2 -> log2(3)", failed);
    expect(near(declist::signed_log_likelihood(2, 2), 0.0), "equal counts -> 0", failed);
    expect(near(declist::signed_log_likelihood(0, 0), 0.0), "no evidence -> 0", failed);

    auto pos = counted("great", 5, 0);
    declist::score_decision(pos);
    expect(pos.scored && pos.classification, "5/0 is positive", failed);
    expect(near(pos.log_likelihood, std::log2(6.0)), "magnitude kept", failed);

    auto neg = counted("awful", 0, 4);
    declist::score_decision(neg);
    expect(!neg.classification, "0/4 is negative", failed);
    expect(near(neg.log_likelihood, std::log2(5.0)), "negative score stored as magnitude", failed);

    auto tie = counted("film", 3, 3);
    declist::score_decision(tie);
    expect(!tie.classification && near(tie.log_likelihood, 0.0), "tie goes negative at 0",
           failed);

    bool threw = false;
    try {
        declist::score_decision(pos);
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect(threw, "scoring twice rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_quadratic() {
    std::cout << "Testing quadratic smoothing...\n";
    int failed = 0;
    const auto q = declist::Smoothing::QUADRATIC;

    expect(near(declist::signed_log_likelihood(3, 0, q), std::log2(5.0)), "3/0 -> log2(5)",
           failed);
    expect(near(declist::signed_log_likelihood(0, 3, q), -std::log2(5.0)), "0/3 -> -log2(5)",
           failed);
    expect(near(declist::signed_log_likelihood(6, 2, q), std::log2(3.0)),
           "both sides seen: same as Laplace", failed);

    auto none = counted("x", 0, 0);
    declist::score_decision(none, q);
    expect(!none.classification && near(none.log_likelihood, 1.0), "0/0 -> 1, negative", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_sort() {
    std::cout << "Testing decision ordering...\n";
    int failed = 0;

    declist::DecisionList list = {scored("a", 1.0, true), scored("b", 2.0, false),
                                  scored("c", 1.0, false), scored("d", 2.0, true)};
    declist::sort_decisions(list);
    std::string order;
    for (const auto& d : list) order += d.feature;
    expect(order == "bdac", "stable descending order, got " + order, failed);

    declist::DecisionList unscored = {scored("a", 1.0, true), declist::Decision("b")};
    bool threw = false;
    try {
        declist::sort_decisions(unscored);
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect(threw, "unscored entry rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_write_format() {
    std::cout << "Testing decision-list text format...\n";
    int failed = 0;

    {
        std::ostringstream oss;
        declist::DecisionList list = {scored("great", 3.2, true)};
        size_t n = declist::write_decision_list(oss, list, 2.5);
        const std::string expected = "great" + std::string(35, ' ') + " " + "  3.2000" + " " +
                                     "   1\n";
        expect(n == 1, "one line written", failed);
        expect(oss.str() == expected, "line layout: '" + oss.str() + "'", failed);
    }

    {
        std::ostringstream oss;
        declist::DecisionList list = {scored("NOT_good", 12.34567, false)};
        declist::write_decision_list(oss, list, 2.5);
        expect(oss.str() == "NOT_good" + std::string(32, ' ') + "  12.3457    0\n",
               "rounded to 4 places: '" + oss.str() + "'", failed);
    }

    {
        // Threshold is inclusive and writing stops at the first miss
        std::ostringstream oss;
        declist::DecisionList list = {scored("a", 4.0, true), scored("b", 2.5, false),
                                      scored("c", 2.4999, true), scored("d", 3.0, true)};
        size_t n = declist::write_decision_list(oss, list, 2.5);
        expect(n == 2, "two lines at threshold 2.5, got " + std::to_string(n), failed);
        expect(oss.str().find("c ") == std::string::npos, "below threshold omitted", failed);
        expect(oss.str().find("d ") == std::string::npos, "nothing after the first miss",
               failed);
    }

    {
        std::ostringstream oss;
        declist::DecisionList list = {scored("a", 1.0, true)};
        expect(declist::write_decision_list(oss, list, 2.5) == 0 && oss.str().empty(),
               "everything below threshold writes nothing", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_parse_line() {
    std::cout << "Testing decision-line parsing...\n";
    int failed = 0;

    declist::Decision d;
    {
        std::ostringstream oss;
        declist::DecisionList list = {scored("NOT_like NOT_this", 4.5, false)};
        declist::write_decision_list(oss, list, 0.0);
        std::string line = oss.str();
        line.pop_back();
        expect(declist::parse_decision_line(line, d), "written line parses", failed);
        expect(d.feature == "NOT_like NOT_this", "bigram feature recovered: '" + d.feature + "'",
               failed);
        expect(!d.classification && d.scored, "class recovered", failed);
    }

    // Feature longer than its column
    const std::string long_feature(45, 'x');
    expect(declist::parse_decision_line(long_feature + "   9.0000    1", d) &&
               d.feature == long_feature && d.classification,
           "overlong feature parses", failed);

    expect(!declist::parse_decision_line("great 3.2 2", d), "class must be 0 or 1", failed);
    expect(!declist::parse_decision_line("great abc 1", d), "score must be numeric", failed);
    expect(!declist::parse_decision_line("great -1.0 1", d), "score must be non-negative",
           failed);
    expect(!declist::parse_decision_line("3.2 1", d), "feature required", failed);
    expect(!declist::parse_decision_line("", d), "empty line rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_trainer() {
    std::cout << "Testing trainer end to end...\n";
    int failed = 0;

    declist::Trainer trainer;
    trainer.add_document("a great great film .", true);
    trainer.add_document(declist::LabeledDocument{"d2", false, "a bad film ."});
    declist::DecisionList list = trainer.finish();

    std::vector<std::string> features;
    for (const auto& d : list) features.push_back(d.feature);
    const std::vector<std::string> expected = {"great", "great great", "great film",
                                               "bad",   "bad film",    "film"};
    expect(features == expected, "ordered by score then arrival", failed);
    if (list.size() == 6) {
        expect(list[0].classification && near(list[0].log_likelihood, 1.0), "great: 1.0 positive",
               failed);
        expect(!list[3].classification && near(list[3].log_likelihood, 1.0),
               "bad: 1.0 negative", failed);
        expect(!list[5].classification && near(list[5].log_likelihood, 0.0),
               "film: 0.0 negative", failed);
    }

    const auto& stats = trainer.stats();
    expect(stats.documents == 2 && stats.positive_documents == 1 &&
               stats.negative_documents == 1,
           "document counts", failed);
    expect(stats.sentences == 2 && stats.features == 6, "sentence and feature counts", failed);
    expect(trainer.finished(), "finished flag", failed);

    bool threw = false;
    try {
        trainer.finish();
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect(threw, "finish twice rejected", failed);

    threw = false;
    try {
        trainer.add_document("late", true);
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect(threw, "add after finish rejected", failed);

    // Frequency mode changes the evidence, not the feature set
    declist::TrainConfig cfg;
    cfg.mode = declist::CountingMode::FREQUENCY;
    declist::Trainer freq(cfg);
    freq.add_document("a great great film .", true);
    freq.add_document("a bad film .", false);
    auto freq_list = freq.finish();
    expect(freq_list.size() == 6 && freq_list[0].feature == "great" &&
               near(freq_list[0].log_likelihood, std::log2(3.0)),
           "frequency: great 2/0 -> log2(3)", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_laplace();
    total += test_quadratic();
    total += test_sort();
    total += test_write_format();
    total += test_parse_line();
    total += test_trainer();

    if (total == 0) {
        std::cout << "\nAll scoring tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
