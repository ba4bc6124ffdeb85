#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "errors.hpp"

// Immutable byte source. A root buffer owns its storage; a window shares the
// storage of another buffer but carries its own id, so it gets its own ledger.
class Buffer {
public:
    static std::shared_ptr<const Buffer> fromBytes(std::vector<uint8_t> bytes, std::string name = "");
    static std::shared_ptr<const Buffer> window(const std::shared_ptr<const Buffer>& parent,
                                                size_t offset, size_t length, std::string name = "");

    uint64_t id() const { return bufferId; }
    size_t size() const { return length; }
    const uint8_t* data() const { return storage->data() + base; }
    const std::string& name() const { return label; }

    bool sharesStorageWith(const Buffer& other) const { return storage == other.storage; }
    // Position of byte 0 of this buffer inside the shared storage.
    size_t storageOffset() const { return base; }

private:
    Buffer(std::shared_ptr<const std::vector<uint8_t>> storage, size_t base, size_t length, std::string name);

    std::shared_ptr<const std::vector<uint8_t>> storage;
    size_t base;
    size_t length;
    uint64_t bufferId;
    std::string label;

    static std::atomic<uint64_t> nextId;
};

using BufferPtr = std::shared_ptr<const Buffer>;

// (buffer, offset, length) view. Every read is bounds-checked against the
// region, not the buffer, so a parser can never see past the bytes it was given.
class ByteRegion {
public:
    ByteRegion() = default;
    explicit ByteRegion(BufferPtr buffer);
    ByteRegion(BufferPtr buffer, size_t offset, size_t length);

    const BufferPtr& buffer() const { return source; }
    uint64_t bufferId() const;
    size_t offset() const { return start; }
    size_t length() const { return count; }
    size_t end() const { return start + count; }
    bool empty() const { return count == 0; }
    bool valid() const { return source != nullptr; }
    const uint8_t* data() const;

    // Sub-views, relative to this region.
    ByteRegion sub(size_t relOffset, size_t length) const;
    ByteRegion from(size_t relOffset) const;
    ByteRegion first(size_t length) const { return sub(0, length); }

    // True when both regions live in the same storage and other lies inside this.
    bool contains(const ByteRegion& other) const;
    bool sharesStorageWith(const ByteRegion& other) const;
    // Absolute position inside the shared storage.
    size_t storagePosition() const;

    void require(size_t pos, size_t n) const;
    bool has(size_t pos, size_t n) const { return pos <= count && n <= count - pos; }

    uint8_t u8(size_t pos) const;
    uint16_t le16(size_t pos) const;
    uint32_t le32(size_t pos) const;
    uint64_t le64(size_t pos) const;
    uint16_t be16(size_t pos) const;
    uint32_t be32(size_t pos) const;
    uint64_t be64(size_t pos) const;

    // NUL-terminated string of at most maxLength bytes.
    std::string string(size_t pos, size_t maxLength) const;
    // Non-throwing comparison; false when the pattern would run past the end.
    bool matches(size_t pos, const uint8_t* pattern, size_t n) const;
    bool matches(size_t pos, const std::string& text) const;

    std::vector<uint8_t> bytes() const;

    bool operator==(const ByteRegion& other) const {
        return source == other.source && start == other.start && count == other.count;
    }

private:
    BufferPtr source;
    size_t start = 0;
    size_t count = 0;
};

// Wraps freshly produced bytes (decompressed data, say) in a new root buffer.
ByteRegion makeOwnedRegion(std::vector<uint8_t> bytes, std::string name = "");
