// tests/test_evaluator.cpp
//
// Confusion counts, metrics and the evaluation report.

#include "declist/evaluator.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol = 1e-12) {
    return std::fabs(a - b) < tol;
}

declist::LabelSet labels(const std::string& pairs) {
    // "A1 B0 ..." -> ordered label set
    declist::LabelSet set;
    std::istringstream iss(pairs);
    std::string item;
    while (iss >> item) set.add(item.substr(0, item.size() - 1), item.back() == '1');
    return set;
}

int test_report() {
    std::cout << "Testing evaluation report...\n";
    int failed = 0;

    auto result = declist::evaluate(labels("A1 B0 C1 D0"), labels("A1 B1 C0 D0"));
    const auto& c = result.counts;
    expect(c.true_positive == 1 && c.false_positive == 1 && c.false_negative == 1 &&
               c.true_negative == 1,
           "one of each outcome", failed);
    expect(near(result.accuracy(), 0.5), "accuracy 0.5", failed);
    expect(near(result.precision(), 0.5), "precision 0.5", failed);
    expect(near(result.recall(), 0.5), "recall 0.5", failed);

    std::ostringstream oss;
    declist::write_report(oss, result);
    const std::string expected =
        "A 1 1\nB 0 1\nC 1 0\nD 0 0\n"
        "Accuracy: 0.5000\nPrecision: 0.5000\nRecall: 0.5000\n";
    expect(oss.str() == expected, "report text:\n" + oss.str(), failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_gold_order() {
    std::cout << "Testing gold-order traversal...\n";
    int failed = 0;

    auto result = declist::evaluate(labels("z1 y1 x0"), labels("x0 z1 y0"));
    std::string order;
    for (const auto& row : result.rows) order += row.id;
    expect(order == "zyx", "rows follow gold order, got " + order, failed);
    expect(near(result.accuracy(), 2.0 / 3.0), "accuracy 2/3", failed);
    expect(near(result.precision(), 1.0), "precision 1", failed);
    expect(near(result.recall(), 0.5), "recall 1/2", failed);

    std::ostringstream oss;
    declist::write_report(oss, result);
    expect(oss.str().find("Accuracy: 0.6667\n") != std::string::npos,
           "accuracy rounded to 4 places", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_id_mismatch() {
    std::cout << "Testing id mismatches...\n";
    int failed = 0;

    bool threw = false;
    try {
        declist::evaluate(labels("A1 B0"), labels("A1"), "gold.txt", "sys.txt");
    } catch (const std::runtime_error& e) {
        const std::string what = e.what();
        threw = what.find("'B'") != std::string::npos &&
                what.find("sys.txt") != std::string::npos;
    }
    expect(threw, "id missing from system output reported", failed);

    threw = false;
    try {
        declist::evaluate(labels("A1"), labels("A1 Q0"), "gold.txt", "sys.txt");
    } catch (const std::runtime_error& e) {
        const std::string what = e.what();
        threw = what.find("'Q'") != std::string::npos &&
                what.find("gold.txt") != std::string::npos;
    }
    expect(threw, "extra system id reported", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_undefined_metrics() {
    std::cout << "Testing zero denominators...\n";
    int failed = 0;

    // No positive predictions
    auto r = declist::evaluate(labels("A1 B0"), labels("A0 B0"));
    expect(!r.precision_defined() && r.precision() == 0.0, "precision undefined -> 0", failed);
    expect(r.recall_defined() && r.recall() == 0.0, "recall defined and 0", failed);

    // No positive gold documents
    auto n = declist::evaluate(labels("A0 B0"), labels("A1 B0"));
    expect(!n.recall_defined() && n.recall() == 0.0, "recall undefined -> 0", failed);
    expect(n.precision_defined() && n.precision() == 0.0, "precision 0/1", failed);

    auto empty = declist::evaluate(declist::LabelSet{}, declist::LabelSet{});
    expect(!empty.accuracy_defined() && empty.accuracy() == 0.0, "empty accuracy -> 0", failed);

    std::ostringstream oss;
    declist::write_report(oss, empty);
    expect(oss.str() == "Accuracy: 0.0000\nPrecision: 0.0000\nRecall: 0.0000\n",
           "empty report:\n" + oss.str(), failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_round_to() {
    std::cout << "Testing rounding...\n";
    int failed = 0;

    expect(near(declist::round_to(0.66666, 4), 0.6667), "0.66666 -> 0.6667", failed);
    expect(near(declist::round_to(0.12344, 4), 0.1234), "0.12344 -> 0.1234", failed);
    expect(near(declist::round_to(2.5, 0), 3.0), "half rounds away from zero", failed);
    expect(near(declist::round_to(1.0, 4), 1.0), "exact value unchanged", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_report();
    total += test_gold_order();
    total += test_id_mismatch();
    total += test_undefined_metrics();
    total += test_round_to();

    if (total == 0) {
        std::cout << "\nAll evaluator tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
