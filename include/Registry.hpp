#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include "BitBoard.hpp"
#include "Clock.hpp"
#include "Generation.hpp"
#include "GenerationStore.hpp"
#include <optional>

// Sequence of generations addressed by dense 0-based indices.
//
// Indices are handed out by create() in order and never reused. advance() is
// the only operation that rewrites an entry, and it does so in place. Callers
// serialize operations; there is no locking here.
class Registry {
public:
    Registry(GenerationStore& store, const Clock& clock);

    void initialize();
    bool isInitialized() const { return store_.isInitialized(); }

    BoardIndex create(const BitBoard& board);
    std::optional<Generation> find(BoardIndex index) const;
    Generation get(BoardIndex index) const;           // throws IndexNotFound
    // Throws IndexNotFound, or HeightRegression when the clock reads below
    // the stored generation's height. The entry is unchanged on failure.
    Generation advance(BoardIndex index);

    // Highest currentHeight among stored generations, 0 when empty.
    uint64_t latestHeight() const;

    uint64_t size() const;

private:
    GenerationStore& store_;
    const Clock& clock_;

    void requireInitialized() const;
};

#endif // REGISTRY_HPP
