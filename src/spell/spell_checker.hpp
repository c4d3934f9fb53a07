#pragma once
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "radix/radix_tree.hpp"

class FileNotFoundError : public std::runtime_error {
public:
    explicit FileNotFoundError(const std::string& path)
        : std::runtime_error("failed to open file for read: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

struct LineReport {
    std::size_t lineNumber{0};
    std::string line;
    std::vector<std::string> words;
};

class SpellChecker {
public:
    static constexpr const char* kStandardDictionaryPath = "/usr/share/dict/words";

    explicit SpellChecker(RadixTree dictionary);

    static SpellChecker standard();
    static SpellChecker fromFile(const std::string& path);

    // One word per line; lines are lowercased before insertion.
    static RadixTree loadDictionary(std::istream& is);

    // Splits at ASCII punctuation and whitespace. Tokens that are not made
    // only of ASCII letters are dropped; the rest are lowercased.
    static std::vector<std::string> tokenize(std::string_view line);

    bool isCorrect(std::string_view word) const;
    std::vector<std::string> misspelled(std::string_view line) const;
    std::vector<LineReport> check(const std::vector<std::string>& lines) const;

    const RadixTree& getDictionary() const;

private:
    RadixTree dictionary;
};

std::vector<std::string> readLines(std::istream& is);
std::vector<std::string> readLinesFromFile(const std::string& path);

void printReport(std::ostream& os, const std::vector<LineReport>& reports);
