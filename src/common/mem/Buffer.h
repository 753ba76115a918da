#ifndef LAZYJSON_MEM_BUFFER_H
#define LAZYJSON_MEM_BUFFER_H

#include <cstddef>
#include <string>

namespace lazyjson::mem {

// Growable byte buffer backing the JSON writer. Growth is sub-linear: roughly 5x for tiny
// buffers, approaching 1.125x for large ones.
class Buffer {
public:
    Buffer();
    explicit Buffer(std::size_t initial);
    ~Buffer();
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;
    Buffer(Buffer &&) = delete;
    Buffer &operator=(Buffer &&) = delete;

    void clear();
    [[nodiscard]] bool append(const char *data, std::size_t len);
    [[nodiscard]] bool append(char ch);

    // Returns a pointer to at least `len` writable bytes past the end; commit() publishes them.
    [[nodiscard]] char *tail(std::size_t len);
    void commit(std::size_t len);
    // Drops the last `len` bytes.
    void unwind(std::size_t len);

    [[nodiscard]] bool reserve(std::size_t desired);
    [[nodiscard]] bool fits(std::size_t len) const;

    [[nodiscard]] const char *data() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const;
    [[nodiscard]] std::string str() const;

    [[nodiscard]] static std::size_t grow_size(std::size_t n);

private:
    char *data_;
    std::size_t total_;
    std::size_t size_;
};

} // namespace lazyjson::mem

#endif // LAZYJSON_MEM_BUFFER_H
