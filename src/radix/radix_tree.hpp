#pragma once
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <cstddef>

// Node of a radix tree. Each edge is a (label, child) entry; a node without
// edges is a leaf and marks the end of a stored word. An empty label marks
// that the path to this node is itself a word while longer words continue.
struct RadixNode {
    std::map<std::string, std::unique_ptr<RadixNode>> edges;

    bool isLeaf() const { return edges.empty(); }

    RadixNode* getChild(const std::string& label) {
        auto it = edges.find(label);
        return (it == edges.end()) ? nullptr : it->second.get();
    }
    const RadixNode* getChild(const std::string& label) const {
        auto it = edges.find(label);
        return (it == edges.end()) ? nullptr : it->second.get();
    }

    void insert(std::string_view word);
    bool contains(std::string_view word) const;

    std::string toString() const;
};

class RadixTree {
public:
    RadixTree();

    RadixTree(RadixTree&&) noexcept = default;
    RadixTree& operator=(RadixTree&&) noexcept = default;
    RadixTree(const RadixTree&) = delete;
    RadixTree& operator=(const RadixTree&) = delete;

    void insert(std::string_view word);
    bool contains(std::string_view word) const;
    bool isLeaf() const;

    // Nested rendering, e.g. {"ca" → {"p" → Ø, "r" → Ø}}.
    std::string toString() const;

    RadixNode* getRoot();
    const RadixNode* getRoot() const;

    std::size_t getNodeSize() const;
    std::size_t getWordCount() const;

private:
    std::unique_ptr<RadixNode> root;
};
