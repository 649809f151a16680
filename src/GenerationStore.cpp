#include "GenerationStore.hpp"
#include "Errors.hpp"
#include <array>
#include <cstring>
#include <filesystem>

// ============================================================================
// MemoryStore
// ============================================================================

Generation MemoryStore::load(BoardIndex index) const {
    if (index >= entries_.size()) {
        throw IndexNotFound(index);
    }
    return entries_[index];
}

void MemoryStore::append(const Generation& generation) {
    if (!initialized_) {
        throw StorageError("Memory store is not initialized");
    }
    entries_.push_back(generation);
}

void MemoryStore::replace(BoardIndex index, const Generation& generation) {
    if (index >= entries_.size()) {
        throw IndexNotFound(index);
    }
    entries_[index] = generation;
}

// ============================================================================
// FileStore
// ============================================================================

namespace {

template <typename T>
void putLE(uint8_t* out, T value) {
    for (size_t i = 0; i < sizeof(T); i++) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

template <typename T>
T getLE(const uint8_t* in) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        value |= static_cast<T>(in[i]) << (8 * i);
    }
    return value;
}

} // namespace

FileStore::FileStore(const std::string& path)
    : path_(path)
    , initialized_(false)
    , count_(0) {
    if (std::filesystem::exists(path_)) {
        open();
        readHeader();
        initialized_ = true;
    }
}

void FileStore::initialize() {
    if (initialized_) {
        return;
    }

    std::array<uint8_t, HEADER_SIZE> header{};
    std::memcpy(header.data(), MAGIC, sizeof(MAGIC));
    putLE<uint16_t>(header.data() + 4, VERSION);
    putLE<uint16_t>(header.data() + 6, 0);
    putLE<uint32_t>(header.data() + 8, static_cast<uint32_t>(BitBoard::FIELD_LEN));
    putLE<uint64_t>(header.data() + COUNT_OFFSET, 0);

    {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(header.data()), header.size());
        out.flush();
        if (!out) {
            throw StorageError("Cannot create state file " + path_);
        }
    }

    open();
    count_ = 0;
    initialized_ = true;
}

Generation FileStore::load(BoardIndex index) const {
    if (index >= count_) {
        throw IndexNotFound(index);
    }

    std::array<uint8_t, RECORD_SIZE> record{};
    file_.seekg(static_cast<std::streamoff>(HEADER_SIZE + index * RECORD_SIZE));
    file_.read(reinterpret_cast<char*>(record.data()), record.size());
    checkStream("read record from");

    BitBoard board = BitBoard::fromBytes(record.data(), BitBoard::FIELD_LEN);
    uint64_t current = getLE<uint64_t>(record.data() + BitBoard::FIELD_LEN);
    uint64_t previous = getLE<uint64_t>(record.data() + BitBoard::FIELD_LEN + 8);
    return Generation(board, current, previous);
}

void FileStore::append(const Generation& generation) {
    if (!initialized_) {
        throw StorageError("State file " + path_ + " is not initialized");
    }

    // Record first, then the count, so a failed append never exposes a
    // half-written entry.
    writeRecord(count_, generation);
    writeCount(count_ + 1);
    count_++;
}

void FileStore::replace(BoardIndex index, const Generation& generation) {
    if (index >= count_) {
        throw IndexNotFound(index);
    }
    writeRecord(index, generation);
}

void FileStore::open() {
    file_.close();
    file_.clear();
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file_.is_open()) {
        throw StorageError("Cannot open state file " + path_);
    }
}

void FileStore::readHeader() {
    std::array<uint8_t, HEADER_SIZE> header{};
    file_.seekg(0);
    file_.read(reinterpret_cast<char*>(header.data()), header.size());
    if (!file_) {
        throw StorageError("State file " + path_ + " is too short for a header");
    }

    if (std::memcmp(header.data(), MAGIC, sizeof(MAGIC)) != 0) {
        throw StorageError("State file " + path_ + " has a bad magic number");
    }
    uint16_t version = getLE<uint16_t>(header.data() + 4);
    if (version != VERSION) {
        throw StorageError("State file " + path_ + " has unsupported version " + std::to_string(version));
    }
    uint32_t fieldLen = getLE<uint32_t>(header.data() + 8);
    if (fieldLen != BitBoard::FIELD_LEN) {
        throw StorageError("State file " + path_ + " stores " + std::to_string(fieldLen) +
                           "-byte fields, expected " + std::to_string(BitBoard::FIELD_LEN));
    }

    uint64_t count = getLE<uint64_t>(header.data() + COUNT_OFFSET);
    uintmax_t fileSize = std::filesystem::file_size(path_);
    if (fileSize < HEADER_SIZE || count > (fileSize - HEADER_SIZE) / RECORD_SIZE) {
        throw StorageError("State file " + path_ + " is truncated: header claims " + std::to_string(count) +
                           " records");
    }
    count_ = count;
}

void FileStore::writeCount(uint64_t count) {
    std::array<uint8_t, 8> bytes{};
    putLE<uint64_t>(bytes.data(), count);
    file_.seekp(static_cast<std::streamoff>(COUNT_OFFSET));
    file_.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    file_.flush();
    checkStream("write record count to");
}

void FileStore::writeRecord(BoardIndex index, const Generation& generation) {
    std::array<uint8_t, RECORD_SIZE> record{};
    const BitBoard::Field& field = generation.board.bytes();
    std::memcpy(record.data(), field.data(), field.size());
    putLE<uint64_t>(record.data() + BitBoard::FIELD_LEN, generation.currentHeight);
    putLE<uint64_t>(record.data() + BitBoard::FIELD_LEN + 8, generation.previousHeight);

    file_.seekp(static_cast<std::streamoff>(HEADER_SIZE + index * RECORD_SIZE));
    file_.write(reinterpret_cast<const char*>(record.data()), record.size());
    file_.flush();
    checkStream("write record to");
}

void FileStore::checkStream(const char* action) const {
    if (!file_) {
        file_.clear();
        throw StorageError(std::string("Failed to ") + action + " state file " + path_);
    }
}
