#include "Buffer.h"

#include <cmath>
#include <cstdlib>
#include <cstring>

#include "../Assert.h"

namespace lazyjson::mem {

Buffer::Buffer()
    : data_(nullptr), total_(0), size_(0) {}

Buffer::Buffer(std::size_t initial)
    : Buffer() {
    if (initial > 0) {
        auto *data = static_cast<char *>(std::malloc(initial));
        if (data) {
            data_ = data;
            total_ = initial;
        }
    }
}

Buffer::~Buffer() {
    std::free(data_);
}

void Buffer::clear() {
    size_ = 0;
}

bool Buffer::append(const char *data, std::size_t len) {
    if (len == 0) {
        return true;
    }
    if (!data) {
        return false;
    }
    if (!reserve(size_ + len)) {
        return false;
    }
    std::memcpy(data_ + size_, data, len);
    size_ += len;
    return true;
}

bool Buffer::append(char ch) {
    return append(&ch, 1);
}

char *Buffer::tail(std::size_t len) {
    if (!reserve(size_ + len)) {
        return nullptr;
    }
    return data_ + size_;
}

void Buffer::commit(std::size_t len) {
    LAZYJSON_ASSERT(size_ + len <= total_);
    size_ += len;
}

void Buffer::unwind(std::size_t len) {
    LAZYJSON_ASSERT(len <= size_);
    size_ -= len;
}

bool Buffer::fits(std::size_t len) const {
    return size_ + len <= total_;
}

const char *Buffer::data() const {
    return data_;
}

std::size_t Buffer::size() const {
    return size_;
}

std::size_t Buffer::capacity() const {
    return total_;
}

std::string Buffer::str() const {
    if (size_ == 0) {
        return {};
    }
    return std::string(data_, size_);
}

std::size_t Buffer::grow_size(std::size_t n) {
    const double base = static_cast<double>(n);
    return static_cast<std::size_t>(std::ceil(base + 4.0 * std::pow(base, 7.0 / 8.0) + base / 8.0));
}

bool Buffer::reserve(std::size_t desired) {
    if (desired <= total_) {
        return true;
    }
    std::size_t new_total = grow_size(desired);
    auto *new_data = static_cast<char *>(std::realloc(data_, new_total));
    if (!new_data) {
        return false;
    }
    data_ = new_data;
    total_ = new_total;
    return true;
}

} // namespace lazyjson::mem
