#include "radix_tree.hpp"

#include <utility>

static std::size_t commonPrefixLength(std::string_view a, std::string_view b) {
    std::size_t j = 0;
    while (j < a.size() && j < b.size() && a[j] == b[j]) ++j;
    return j;
}

static bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::size_t countNodes(const RadixNode& node) {
    std::size_t n = 1;
    for (const auto& kv : node.edges) n += countNodes(*kv.second);
    return n;
}

static std::size_t countWords(const RadixNode& node) {
    std::size_t n = 0;
    for (const auto& kv : node.edges) {
        const RadixNode& child = *kv.second;
        // "ab" -> {"" -> Ø, ...}: the empty edge is counted one level down.
        n += child.isLeaf() ? 1 : countWords(child);
    }
    return n;
}

void RadixNode::insert(std::string_view word) {
    // Edge whose label shares the longest common prefix with word.
    auto leading = edges.end();
    std::size_t rootLength = 0;

    for (auto it = edges.begin(); it != edges.end(); ++it) {
        const std::size_t j = commonPrefixLength(it->first, word);
        if (j > rootLength) {
            leading = it;
            rootLength = j;
        }
    }

    if (rootLength == 0) {
        // emplace keeps an existing empty edge as is.
        edges.emplace(std::string(word), std::make_unique<RadixNode>());
        return;
    }

    RadixNode* child = leading->second.get();

    if (rootLength == leading->first.size()) {
        if (rootLength == word.size()) {
            // The path already exists. A child with edges still needs the
            // terminal marker or the word would not be reachable.
            if (!child->isLeaf()) child->insert(std::string_view{});
            return;
        }
        // Keep the shorter word that ends at this leaf.
        if (child->isLeaf()) child->insert(std::string_view{});
        child->insert(word.substr(rootLength));
        return;
    }

    // Partial match: split the edge at rootLength.
    const std::string rest = leading->first.substr(rootLength);
    std::unique_ptr<RadixNode> original = std::move(leading->second);
    edges.erase(leading);

    auto split = std::make_unique<RadixNode>();
    split->edges.emplace(std::string(word.substr(rootLength)), std::make_unique<RadixNode>());
    split->edges.emplace(rest, std::move(original));

    edges.emplace(std::string(word.substr(0, rootLength)), std::move(split));
}

bool RadixNode::contains(std::string_view word) const {
    const RadixNode* best = nullptr;
    std::size_t rootLength = 0;

    for (const auto& kv : edges) {
        const std::string& label = kv.first;
        if (!startsWith(word, label)) continue;

        if (label.size() == word.size()) {
            const RadixNode& child = *kv.second;
            return child.isLeaf() || child.contains(std::string_view{});
        }
        if (label.size() > rootLength) {
            rootLength = label.size();
            best = kv.second.get();
        }
    }

    return best != nullptr && best->contains(word.substr(rootLength));
}

std::string RadixNode::toString() const {
    if (isLeaf()) return "Ø";

    std::string out = "{";
    bool first = true;
    for (const auto& kv : edges) {
        if (!first) out += ", ";
        first = false;
        out += kv.first.empty() ? std::string("λ") : "\"" + kv.first + "\"";
        out += " → ";
        out += kv.second->toString();
    }
    out += "}";
    return out;
}

RadixTree::RadixTree() : root(std::make_unique<RadixNode>()) {}

void RadixTree::insert(std::string_view word) { root->insert(word); }

bool RadixTree::contains(std::string_view word) const { return root->contains(word); }

bool RadixTree::isLeaf() const { return root->isLeaf(); }

std::string RadixTree::toString() const { return root->toString(); }

RadixNode* RadixTree::getRoot() { return root.get(); }
const RadixNode* RadixTree::getRoot() const { return root.get(); }

std::size_t RadixTree::getNodeSize() const { return countNodes(*root); }

std::size_t RadixTree::getWordCount() const { return countWords(*root); }
