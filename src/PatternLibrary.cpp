/**
 * @file PatternLibrary.cpp
 * @brief Canonical shapes from the LifeWiki catalogue (https://conwaylife.com/wiki/).
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PatternLibrary.h"
#include "ArcadeConfig.h"

#include <utility>

const PatternLibrary& PatternLibrary::standard() {
    static const PatternLibrary lib;
    return lib;
}

void PatternLibrary::add(Pattern p) {
    byName[p.name()] = patterns.size();
    patterns.push_back(std::move(p));
}

PatternLibrary::PatternLibrary() {
    using C = PatternCategory;
    using S = SizeClass;

    // Still lifes
    add(Pattern::fromRows("BLOCK", {
            "OO",
            "OO",
        }, 1, C::StillLife, S::Tiny));
    add(Pattern::fromRows("BEEHIVE", {
            ".OO.",
            "O..O",
            ".OO.",
        }, 1, C::StillLife));
    add(Pattern::fromRows("LOAF", {
            ".OO.",
            "O..O",
            ".O.O",
            "..O.",
        }, 1, C::StillLife));
    add(Pattern::fromRows("BOAT", {
            "OO.",
            "O.O",
            ".O.",
        }, 1, C::StillLife));
    add(Pattern::fromRows("TUB", {
            ".O.",
            "O.O",
            ".O.",
        }, 1, C::StillLife));
    add(Pattern::fromRows("POND", {
            ".OO.",
            "O..O",
            "O..O",
            ".OO.",
        }, 1, C::StillLife));
    add(Pattern::fromRows("SHIP", {
            "OO.",
            "O.O",
            ".OO",
        }, 1, C::StillLife));

    // Oscillators. BLINKER starts vertical; TOAD carries a blank row above and below
    // so both phases fit its box.
    add(Pattern::fromRows("BLINKER", {
            ".O.",
            ".O.",
            ".O.",
        }, 2, C::Oscillator));
    add(Pattern::fromRows("TOAD", {
            "....",
            ".OOO",
            "OOO.",
            "....",
        }, 2, C::Oscillator));
    add(Pattern::fromRows("BEACON", {
            "OO..",
            "OO..",
            "..OO",
            "..OO",
        }, 2, C::Oscillator));
    add(Pattern::fromRows("PULSAR", {
            "..OOO...OOO..",
            ".............",
            "O....O.O....O",
            "O....O.O....O",
            "O....O.O....O",
            "..OOO...OOO..",
            ".............",
            "..OOO...OOO..",
            "O....O.O....O",
            "O....O.O....O",
            "O....O.O....O",
            ".............",
            "..OOO...OOO..",
        }, 3, C::Oscillator, S::Large));

    // Spaceships
    add(Pattern::fromRows("GLIDER", {
            ".O.",
            "..O",
            "OOO",
        }, 4, C::Spaceship));
    // Travels right, with one blank cell of margin on every side.
    add(Pattern::fromRows("LIGHTWEIGHT_SPACESHIP", {
            ".......",
            ".O..O..",
            ".....O.",
            ".O...O.",
            "..OOOO.",
            ".......",
        }, 4, C::Spaceship, S::Medium));
    add(Pattern::fromRows("COPPERHEAD", {
            ".OO..OO.",
            "...OO...",
            "...OO...",
            "O.O..O.O",
            "O......O",
            "........",
            "O......O",
            ".OO..OO.",
            "..OOOO..",
            "........",
            "...OO...",
            "...OO...",
        }, 10, C::Spaceship, S::Medium));
    add(Pattern::fromRows("DRAGON", {
            "............O................",
            "............OO..............O",
            "..........O.OO.....O.O....OO.",
            ".....O...O...OOO..O....O.....",
            "OO...O..O......O.O.....OOO..O",
            "OO...O.OO......O...O.O.O.....",
            "OO...O..........O.O.......OO.",
            ".....OO..............O......O",
            ".......O............O.O......",
            ".......O............O.O......",
            ".....OO..............O......O",
            "OO...O..........O.O.......OO.",
            "OO...O.OO......O...O.O.O.....",
            "OO...O..O......O.O.....OOO..O",
            ".....O...O...OOO..O....O.....",
            "..........O.OO.....O.O....OO.",
            "............OO..............O",
            "............O................",
        }, 6, C::Spaceship, S::Large));
    add(rotate90(at("DRAGON")).withName("DRAGON_VERTICAL"));

    // Methuselahs: no period; rendered as period 1.
    add(Pattern::fromRows("R_PENTOMINO", {
            ".OO",
            "OO.",
            ".O.",
        }, 1, C::Methuselah));
    add(Pattern::fromRows("ACORN", {
            ".O.....",
            "...O...",
            "OO..OOO",
        }, 1, C::Methuselah));
    add(Pattern::fromRows("DIEHARD", {
            "......O.",
            "OO......",
            ".O...OOO",
        }, 1, C::Methuselah));
}

const Pattern* PatternLibrary::find(const std::string& name) const {
    auto it = byName.find(name);
    if (it == byName.end()) return nullptr;
    return &patterns[it->second];
}

const Pattern& PatternLibrary::at(const std::string& name) const {
    const Pattern* p = find(name);
    if (!p) throw ConfigError("unknown pattern: " + name);
    return *p;
}

std::vector<std::string> PatternLibrary::names() const {
    std::vector<std::string> out;
    out.reserve(patterns.size());
    for (const auto& p : patterns) out.push_back(p.name());
    return out;
}

std::vector<std::string> PatternLibrary::namesInCategory(PatternCategory category) const {
    std::vector<std::string> out;
    for (const auto& p : patterns) {
        if (p.category() == category) out.push_back(p.name());
    }
    return out;
}

std::string PatternLibrary::randomInCategory(PatternCategory category, std::mt19937& rng) const {
    auto candidates = namesInCategory(category);
    if (candidates.empty()) {
        throw ConfigError(std::string("no patterns in category ") + categoryName(category));
    }
    std::uniform_int_distribution<size_t> d(0, candidates.size() - 1);
    return candidates[d(rng)];
}
