/**
 * @file PatternLibrary.h
 * @brief Declares the immutable catalog of canonical Life shapes used to build entities.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "Pattern.h"

/**
 * @class PatternLibrary
 * @brief Named still lifes, oscillators, spaceships and methuselahs with their periods.
 *
 * Derived orientations (e.g. DRAGON_VERTICAL) are computed once from their base pattern when
 * the catalog is built and are ordinary entries afterwards.
 */
class PatternLibrary {
public:
    /** @brief The shared catalog; built once on first use and never mutated. */
    static const PatternLibrary& standard();

    /** @brief Pattern by name, or nullptr when unknown. */
    const Pattern* find(const std::string& name) const;
    /** @brief Pattern by name. @throws ConfigError when unknown. */
    const Pattern& at(const std::string& name) const;
    /** @brief Whether @p name is in the catalog. */
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /** @brief All names in catalog order. */
    std::vector<std::string> names() const;
    /** @brief Names whose category is @p category, in catalog order. */
    std::vector<std::string> namesInCategory(PatternCategory category) const;
    /** @brief Uniformly random name from @p category. @throws ConfigError if the category is empty. */
    std::string randomInCategory(PatternCategory category, std::mt19937& rng) const;

    /** @brief Generations per cycle (1 for still lifes). @throws ConfigError when unknown. */
    int period(const std::string& name) const { return at(name).period(); }
    /** @brief Category of @p name. @throws ConfigError when unknown. */
    PatternCategory category(const std::string& name) const { return at(name).category(); }
    /** @brief Period greater than one, so a loop-mode entity actually animates. */
    bool supportsLoopMode(const std::string& name) const { return period(name) > 1; }

    size_t size() const { return patterns.size(); }

private:
    PatternLibrary();
    void add(Pattern p);

    std::vector<Pattern> patterns;                   /**< catalog in insertion order */
    std::unordered_map<std::string, size_t> byName;  /**< name -> index into patterns */
};
