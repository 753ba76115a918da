#include "Object.h"

namespace lazyjson::json {

Object::~Object() {
    clear();
}

Object::Object(const Object &other) {
    Node *last = &head_;
    for (const Node &node : other) {
        last = append_after(last, node.key, node.value);
    }
}

Object &Object::operator=(const Object &other) {
    if (this != &other) {
        Object copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Object::Object(Object &&other) noexcept : size_(other.size_) {
    head_.next = std::move(other.head_.next);
    other.size_ = 0;
}

Object &Object::operator=(Object &&other) noexcept {
    if (this != &other) {
        clear();
        head_.next = std::move(other.head_.next);
        size_ = other.size_;
        other.size_ = 0;
    }
    return *this;
}

Value *Object::find(std::string_view key) {
    for (Node *node = head_.next.get(); node; node = node->next.get()) {
        if (node->key == key) {
            return &node->value;
        }
    }
    return nullptr;
}

const Value *Object::find(std::string_view key) const {
    for (const Node *node = head_.next.get(); node; node = node->next.get()) {
        if (node->key == key) {
            return &node->value;
        }
    }
    return nullptr;
}

Value Object::get(std::string_view key, Value fallback) const {
    if (const Value *value = find(key)) {
        return *value;
    }
    return fallback;
}

void Object::set(std::string key, Value value) {
    Node *last = &head_;
    for (Node *node = head_.next.get(); node; node = node->next.get()) {
        if (node->key == key) {
            node->value = std::move(value);
            return;
        }
        last = node;
    }
    append_after(last, std::move(key), std::move(value));
}

bool Object::remove(std::string_view key) {
    Node *prev = &head_;
    while (Node *node = prev->next.get()) {
        if (node->key == key) {
            std::unique_ptr<Node> detached = std::move(prev->next);
            prev->next = std::move(detached->next);
            size_ -= 1;
            return true;
        }
        prev = node;
    }
    return false;
}

void Object::clear() {
    // Unlink one node at a time so long chains do not recurse through unique_ptr.
    std::unique_ptr<Node> cur = std::move(head_.next);
    while (cur) {
        cur = std::move(cur->next);
    }
    size_ = 0;
}

std::vector<std::string> Object::keys() const {
    std::vector<std::string> out;
    out.reserve(size_);
    for (const Node &node : *this) {
        out.push_back(node.key);
    }
    return out;
}

Object::Node *Object::tail() {
    Node *last = &head_;
    while (last->next) {
        last = last->next.get();
    }
    return last;
}

Object::Node *Object::append_after(Node *tail, std::string key, Value value) {
    auto node = std::make_unique<Node>();
    node->key = std::move(key);
    node->value = std::move(value);
    node->next = std::move(tail->next);
    tail->next = std::move(node);
    size_ += 1;
    return tail->next.get();
}

bool Object::operator==(const Object &other) const {
    if (size_ != other.size_) {
        return false;
    }
    for (const Node &node : *this) {
        const Value *value = other.find(node.key);
        if (!value || !(node.value == *value)) {
            return false;
        }
    }
    return true;
}

} // namespace lazyjson::json
