#ifndef GENERATION_STORE_HPP
#define GENERATION_STORE_HPP

#include "Generation.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

using BoardIndex = uint64_t;

// ============================================================================
// Indexed storage for generations
// ============================================================================
// Ordered, dense, append/replace-by-index. Entries are never removed or
// reordered. load/replace on an index >= size() throw IndexNotFound.

class GenerationStore {
public:
    virtual ~GenerationStore() = default;

    virtual bool isInitialized() const = 0;
    // Creates an empty collection if none exists; keeps existing entries.
    virtual void initialize() = 0;

    virtual uint64_t size() const = 0;
    virtual Generation load(BoardIndex index) const = 0;
    virtual void append(const Generation& generation) = 0;
    virtual void replace(BoardIndex index, const Generation& generation) = 0;
};

// Process-lifetime store.
class MemoryStore : public GenerationStore {
public:
    MemoryStore() : initialized_(false) {}

    bool isInitialized() const override { return initialized_; }
    void initialize() override { initialized_ = true; }

    uint64_t size() const override { return entries_.size(); }
    Generation load(BoardIndex index) const override;
    void append(const Generation& generation) override;
    void replace(BoardIndex index, const Generation& generation) override;

private:
    bool initialized_;
    std::vector<Generation> entries_;
};

// Durable store backed by one binary file of fixed-size records.
//
// Layout (little-endian):
//   header: "LGEN" | u16 version | u16 reserved | u32 field length | u64 count
//   record: field bytes | u64 currentHeight | u64 previousHeight
class FileStore : public GenerationStore {
public:
    static constexpr char MAGIC[4] = {'L', 'G', 'E', 'N'};
    static constexpr uint16_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 4 + 2 + 2 + 4 + 8;
    static constexpr size_t COUNT_OFFSET = 4 + 2 + 2 + 4;
    static constexpr size_t RECORD_SIZE = BitBoard::FIELD_LEN + 8 + 8;

    // Opens path if it exists and validates its header; throws StorageError
    // on a malformed file. A missing file leaves the store uninitialized.
    explicit FileStore(const std::string& path);

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    bool isInitialized() const override { return initialized_; }
    void initialize() override;

    uint64_t size() const override { return count_; }
    Generation load(BoardIndex index) const override;
    void append(const Generation& generation) override;
    void replace(BoardIndex index, const Generation& generation) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::fstream file_;
    bool initialized_;
    uint64_t count_;

    void open();
    void readHeader();
    void writeCount(uint64_t count);
    void writeRecord(BoardIndex index, const Generation& generation);
    void checkStream(const char* action) const;
};

#endif // GENERATION_STORE_HPP
