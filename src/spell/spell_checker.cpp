#include "spell_checker.hpp"

#include <cctype>
#include <fstream>
#include <utility>

static char toLowerAscii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

static bool isAsciiLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool isSeparator(char c) {
    const unsigned char u = static_cast<unsigned char>(c);
    if (u >= 0x80) return false;
    return std::ispunct(u) || std::isspace(u);
}

static void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
}

// A directory opens fine on Linux but fails on the first read.
static std::ifstream openForRead(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw FileNotFoundError(path);
    ifs.peek();
    if (ifs.bad()) throw FileNotFoundError(path);
    return ifs;
}

SpellChecker::SpellChecker(RadixTree dictionary) : dictionary(std::move(dictionary)) {}

SpellChecker SpellChecker::standard() {
    return fromFile(kStandardDictionaryPath);
}

SpellChecker SpellChecker::fromFile(const std::string& path) {
    std::ifstream ifs = openForRead(path);
    return SpellChecker(loadDictionary(ifs));
}

RadixTree SpellChecker::loadDictionary(std::istream& is) {
    RadixTree tree;
    std::string word;
    while (std::getline(is, word)) {
        stripCarriageReturn(word);
        for (char& c : word) c = toLowerAscii(c);
        tree.insert(word);
    }
    if (is.bad()) throw std::runtime_error("failed to read dictionary");
    return tree;
}

std::vector<std::string> SpellChecker::tokenize(std::string_view line) {
    std::vector<std::string> out;
    std::string token;
    bool valid = true;

    auto flush = [&]() {
        if (!token.empty() && valid) out.push_back(token);
        token.clear();
        valid = true;
    };

    for (char c : line) {
        if (isSeparator(c)) {
            flush();
            continue;
        }
        if (!isAsciiLetter(c)) valid = false;
        token.push_back(toLowerAscii(c));
    }
    flush();
    return out;
}

bool SpellChecker::isCorrect(std::string_view word) const {
    return dictionary.contains(word);
}

std::vector<std::string> SpellChecker::misspelled(std::string_view line) const {
    std::vector<std::string> incorrect;
    for (auto& w : tokenize(line)) {
        if (!isCorrect(w)) incorrect.push_back(std::move(w));
    }
    return incorrect;
}

std::vector<LineReport> SpellChecker::check(const std::vector<std::string>& lines) const {
    std::vector<LineReport> reports;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto words = misspelled(lines[i]);
        if (words.empty()) continue;

        LineReport r;
        r.lineNumber = i;
        r.line = lines[i];
        r.words = std::move(words);
        reports.push_back(std::move(r));
    }
    return reports;
}

const RadixTree& SpellChecker::getDictionary() const { return dictionary; }

std::vector<std::string> readLines(std::istream& is) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(is, line)) {
        stripCarriageReturn(line);
        lines.push_back(line);
    }
    if (is.bad()) throw std::runtime_error("failed to read document");
    return lines;
}

std::vector<std::string> readLinesFromFile(const std::string& path) {
    std::ifstream ifs = openForRead(path);
    return readLines(ifs);
}

void printReport(std::ostream& os, const std::vector<LineReport>& reports) {
    for (const auto& r : reports) {
        os << r.lineNumber << " " << r.line << "\n\n";
        for (std::size_t i = 0; i < r.words.size(); ++i) {
            if (i > 0) os << " ";
            os << r.words[i];
        }
        os << "\n\n";
    }
}
