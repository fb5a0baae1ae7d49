#include "declist/decision_list.hpp"
#include "declist/corpus_io.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <stdexcept>

namespace declist {

namespace {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Strip the last whitespace-delimited field off `s` and return it
std::string_view pop_last_field(std::string_view& s) {
    size_t end = s.size();
    while (end > 0 && is_space(s[end - 1])) --end;
    size_t begin = end;
    while (begin > 0 && !is_space(s[begin - 1])) --begin;
    std::string_view field = s.substr(begin, end - begin);
    s = s.substr(0, begin);
    return field;
}

bool parse_score(std::string_view field) {
    if (field.empty()) return false;
    const std::string text(field);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    return end && *end == '\0' && errno == 0 && std::isfinite(value) && value >= 0.0;
}

}  // namespace

void sort_decisions(DecisionList& decisions) {
    for (const Decision& d : decisions) {
        if (!d.scored) {
            throw std::logic_error("cannot sort unscored decision: " + d.feature);
        }
    }
    std::stable_sort(decisions.begin(), decisions.end(),
                     [](const Decision& a, const Decision& b) {
                         return a.log_likelihood > b.log_likelihood;
                     });
}

size_t write_decision_list(std::ostream& os, const DecisionList& decisions, double threshold) {
    size_t written = 0;
    os << std::fixed << std::setprecision(SCORE_PRECISION);
    for (const Decision& d : decisions) {
        if (!d.scored) {
            throw std::logic_error("cannot write unscored decision: " + d.feature);
        }
        if (d.log_likelihood < threshold) break;
        os << std::left << std::setw(FEATURE_WIDTH) << d.feature << ' '
           << std::right << std::setw(SCORE_WIDTH) << d.log_likelihood << ' '
           << std::setw(CLASS_WIDTH) << label_char(d.classification) << '\n';
        ++written;
    }
    return written;
}

size_t write_decision_list_file(const std::string& filename, const DecisionList& decisions,
                                double threshold) {
    OutputFile out(filename);
    const size_t written = write_decision_list(out.stream(), decisions, threshold);
    out.close();
    return written;
}

bool parse_decision_line(std::string_view line, Decision& out) {
    std::string_view rest = line;
    const std::string_view cls = pop_last_field(rest);
    const std::string_view score = pop_last_field(rest);
    if (cls != "0" && cls != "1") return false;
    if (!parse_score(score)) return false;

    // rest still ends with the separator before the score
    while (!rest.empty() && is_space(rest.back())) rest.remove_suffix(1);
    while (!rest.empty() && is_space(rest.front())) rest.remove_prefix(1);
    if (rest.empty()) return false;

    out = Decision(std::string(rest), cls == "1");
    return true;
}

DecisionList read_decision_list(const std::string& filename) {
    LineReader reader(filename);
    DecisionList decisions;
    std::string line;
    Decision d;
    while (reader.read_line(line)) {
        if (std::all_of(line.begin(), line.end(), is_space)) continue;
        if (!parse_decision_line(line, d)) {
            throw std::runtime_error(reader.filename() + ":" + std::to_string(reader.line_number()) +
                                     ": malformed decision line (expected '<feature> <score> <0|1>')");
        }
        decisions.push_back(std::move(d));
    }
    return decisions;
}

}  // namespace declist
