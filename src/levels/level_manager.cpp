#include "relativity/levels/level_manager.hpp"

#include <stdexcept>
#include <utility>

#include "relativity/levels/level_one.hpp"
#include "relativity/levels/level_two.hpp"

LevelManager::LevelManager() {
    levels.push_back(std::make_unique<LevelOne>());
    levels.push_back(std::make_unique<LevelTwo>());
}

LevelManager::LevelManager(std::vector<std::unique_ptr<ILevel>> levels)
    : levels(std::move(levels))
{
    if (this->levels.empty()) {
        throw std::invalid_argument("LevelManager requires at least one level");
    }
}

const ILevel& LevelManager::current() const {
    return *levels[index];
}

bool LevelManager::next() {
    if (index + 1 >= levels.size()) {
        return false;
    }
    ++index;
    return true;
}

void LevelManager::select(std::size_t i) {
    if (i >= levels.size()) {
        throw std::out_of_range("LevelManager::select: no such level");
    }
    index = i;
}
