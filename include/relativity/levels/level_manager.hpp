/**
 * @file level_manager.hpp
 * @brief Ordered catalog of levels and the current selection
 */

#ifndef RELATIVITY_LEVEL_MANAGER_HPP
#define RELATIVITY_LEVEL_MANAGER_HPP

#include <cstddef>
#include <memory>
#include <vector>

#include "relativity/levels/i_level.hpp"

/**
 * @class LevelManager
 * @brief Owns the levels in play order and tracks the current one
 */
class LevelManager {
public:
    /** @brief Registers the built-in levels */
    LevelManager();

    /** @brief Uses the given levels instead, must not be empty */
    explicit LevelManager(std::vector<std::unique_ptr<ILevel>> levels);

    const ILevel& current() const;
    std::size_t currentIndex() const { return index; }
    std::size_t count() const { return levels.size(); }

    /**
     * @brief Moves to the next level
     * @return false, leaving the selection unchanged, on the last level
     */
    bool next();

    /** @throws std::out_of_range */
    void select(std::size_t i);

private:
    std::vector<std::unique_ptr<ILevel>> levels;
    std::size_t index = 0;
};

#endif // RELATIVITY_LEVEL_MANAGER_HPP
