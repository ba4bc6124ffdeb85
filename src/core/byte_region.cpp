#include "byte_region.hpp"
#include <cstring>

std::atomic<uint64_t> Buffer::nextId{1};

Buffer::Buffer(std::shared_ptr<const std::vector<uint8_t>> storage, size_t base, size_t length, std::string name)
    : storage(std::move(storage)), base(base), length(length),
      bufferId(nextId.fetch_add(1, std::memory_order_relaxed)), label(std::move(name)) {}

BufferPtr Buffer::fromBytes(std::vector<uint8_t> bytes, std::string name) {
    auto storage = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    size_t size = storage->size();
    return BufferPtr(new Buffer(std::move(storage), 0, size, std::move(name)));
}

BufferPtr Buffer::window(const BufferPtr& parent, size_t offset, size_t length, std::string name) {
    if (offset > parent->size() || length > parent->size() - offset)
        throw BufferBoundsError(offset, length, parent->size());
    return BufferPtr(new Buffer(parent->storage, parent->base + offset, length, std::move(name)));
}

ByteRegion::ByteRegion(BufferPtr buffer)
    : source(std::move(buffer)), start(0), count(source ? source->size() : 0) {}

ByteRegion::ByteRegion(BufferPtr buffer, size_t offset, size_t length)
    : source(std::move(buffer)), start(offset), count(length) {
    size_t available = source ? source->size() : 0;
    if (offset > available || length > available - offset)
        throw BufferBoundsError(offset, length, available);
}

uint64_t ByteRegion::bufferId() const {
    return source ? source->id() : 0;
}

const uint8_t* ByteRegion::data() const {
    return source ? source->data() + start : nullptr;
}

ByteRegion ByteRegion::sub(size_t relOffset, size_t length) const {
    require(relOffset, length);
    return ByteRegion(source, start + relOffset, length);
}

ByteRegion ByteRegion::from(size_t relOffset) const {
    require(relOffset, 0);
    return ByteRegion(source, start + relOffset, count - relOffset);
}

bool ByteRegion::sharesStorageWith(const ByteRegion& other) const {
    return source && other.source && source->sharesStorageWith(*other.source);
}

size_t ByteRegion::storagePosition() const {
    return source ? source->storageOffset() + start : start;
}

bool ByteRegion::contains(const ByteRegion& other) const {
    if (!sharesStorageWith(other))
        return false;
    size_t outer = storagePosition();
    size_t inner = other.storagePosition();
    return inner >= outer && inner + other.count <= outer + count;
}

void ByteRegion::require(size_t pos, size_t n) const {
    if (!has(pos, n))
        throw BufferBoundsError(pos, n, count);
}

uint8_t ByteRegion::u8(size_t pos) const {
    require(pos, 1);
    return data()[pos];
}

uint16_t ByteRegion::le16(size_t pos) const {
    require(pos, 2);
    const uint8_t* p = data() + pos;
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t ByteRegion::le32(size_t pos) const {
    require(pos, 4);
    const uint8_t* p = data() + pos;
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t ByteRegion::le64(size_t pos) const {
    return static_cast<uint64_t>(le32(pos)) | (static_cast<uint64_t>(le32(pos + 4)) << 32);
}

uint16_t ByteRegion::be16(size_t pos) const {
    require(pos, 2);
    const uint8_t* p = data() + pos;
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t ByteRegion::be32(size_t pos) const {
    require(pos, 4);
    const uint8_t* p = data() + pos;
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

uint64_t ByteRegion::be64(size_t pos) const {
    return (static_cast<uint64_t>(be32(pos)) << 32) | static_cast<uint64_t>(be32(pos + 4));
}

std::string ByteRegion::string(size_t pos, size_t maxLength) const {
    std::string result;
    for (size_t i = 0; i < maxLength && has(pos + i, 1); ++i) {
        char c = static_cast<char>(data()[pos + i]);
        if (c == '\0') break;
        result += c;
    }
    return result;
}

bool ByteRegion::matches(size_t pos, const uint8_t* pattern, size_t n) const {
    if (!has(pos, n))
        return false;
    return std::memcmp(data() + pos, pattern, n) == 0;
}

bool ByteRegion::matches(size_t pos, const std::string& text) const {
    return matches(pos, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::vector<uint8_t> ByteRegion::bytes() const {
    if (count == 0)
        return {};
    return std::vector<uint8_t>(data(), data() + count);
}

ByteRegion makeOwnedRegion(std::vector<uint8_t> bytes, std::string name) {
    return ByteRegion(Buffer::fromBytes(std::move(bytes), std::move(name)));
}
