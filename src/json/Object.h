#ifndef LAZYJSON_JSON_OBJECT_H
#define LAZYJSON_JSON_OBJECT_H

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "Value.h"

namespace lazyjson::json {

// Insertion-ordered map for the small objects JSON documents mostly carry. Entries form a
// singly linked chain hanging off a sentinel head; lookups are linear.
class Object {
public:
    struct Node {
        std::string key;
        Value value;
        std::unique_ptr<Node> next;
    };

    template <typename NodeT>
    class BasicIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Node;
        using difference_type = std::ptrdiff_t;
        using pointer = NodeT *;
        using reference = NodeT &;

        BasicIterator() = default;
        explicit BasicIterator(NodeT *node) : node_(node) {}

        reference operator*() const { return *node_; }
        pointer operator->() const { return node_; }
        BasicIterator &operator++() {
            node_ = node_->next.get();
            return *this;
        }
        BasicIterator operator++(int) {
            BasicIterator copy = *this;
            ++*this;
            return copy;
        }
        bool operator==(const BasicIterator &other) const = default;

    private:
        NodeT *node_ = nullptr;
    };

    using iterator = BasicIterator<Node>;
    using const_iterator = BasicIterator<const Node>;

    Object() = default;
    ~Object();
    Object(const Object &other);
    Object &operator=(const Object &other);
    Object(Object &&other) noexcept;
    Object &operator=(Object &&other) noexcept;

    [[nodiscard]] Value *find(std::string_view key);
    [[nodiscard]] const Value *find(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }
    // Copy of the member, or `fallback` when absent.
    [[nodiscard]] Value get(std::string_view key, Value fallback = nullptr) const;

    // Overwrites an existing member in place, otherwise appends.
    void set(std::string key, Value value);
    bool remove(std::string_view key);
    void clear();

    [[nodiscard]] std::size_t size() const { return size_; }
    [[nodiscard]] bool empty() const { return size_ == 0; }
    [[nodiscard]] std::vector<std::string> keys() const;

    // Sentinel before the first entry; pass it to append_after() on an empty object.
    [[nodiscard]] Node *head() { return &head_; }
    [[nodiscard]] Node *tail();
    // Links a new entry after `tail` without checking for duplicates. Returns the new tail.
    Node *append_after(Node *tail, std::string key, Value value);

    iterator begin() { return iterator(head_.next.get()); }
    iterator end() { return iterator(); }
    const_iterator begin() const { return const_iterator(head_.next.get()); }
    const_iterator end() const { return const_iterator(); }

    // Same members with equal values, in any order.
    bool operator==(const Object &other) const;

private:
    Node head_;
    std::size_t size_ = 0;
};

} // namespace lazyjson::json

#endif // LAZYJSON_JSON_OBJECT_H
