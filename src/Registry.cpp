#include "Registry.hpp"
#include "Errors.hpp"
#include <algorithm>

Registry::Registry(GenerationStore& store, const Clock& clock)
    : store_(store)
    , clock_(clock) {
}

void Registry::initialize() {
    store_.initialize();
}

BoardIndex Registry::create(const BitBoard& board) {
    requireInitialized();

    Generation generation(board, clock_.currentHeight());
    BoardIndex index = store_.size();
    store_.append(generation);
    return index;
}

std::optional<Generation> Registry::find(BoardIndex index) const {
    requireInitialized();

    if (index >= store_.size()) {
        return std::nullopt;
    }
    return store_.load(index);
}

Generation Registry::get(BoardIndex index) const {
    std::optional<Generation> generation = find(index);
    if (!generation) {
        throw IndexNotFound(index);
    }
    return *generation;
}

Generation Registry::advance(BoardIndex index) {
    Generation current = get(index);
    uint64_t now = clock_.currentHeight();
    if (now < current.currentHeight) {
        throw HeightRegression(now, current.currentHeight);
    }

    Generation next = current.step(clock_);
    store_.replace(index, next);
    return next;
}

uint64_t Registry::latestHeight() const {
    requireInitialized();

    uint64_t latest = 0;
    for (BoardIndex index = 0; index < store_.size(); index++) {
        latest = std::max(latest, store_.load(index).currentHeight);
    }
    return latest;
}

uint64_t Registry::size() const {
    requireInitialized();
    return store_.size();
}

void Registry::requireInitialized() const {
    if (!store_.isInitialized()) {
        throw RegistryNotInitialized();
    }
}
