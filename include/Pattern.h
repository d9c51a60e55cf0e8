/**
 * @file Pattern.h
 * @brief Declares the immutable Pattern value and the pure geometric transforms over it.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

/** @brief Behavioural family of a pattern under B3/S23. */
enum class PatternCategory { StillLife, Oscillator, Spaceship, Methuselah };

/** @brief Rough on-screen size used for filtering and layout. */
enum class SizeClass { Tiny, Small, Medium, Large };

/** @brief "still-life", "oscillator", "spaceship" or "methuselah". */
const char* categoryName(PatternCategory c);
/** @brief "tiny", "small", "medium" or "large". */
const char* sizeClassName(SizeClass s);

/**
 * @class Pattern
 * @brief Named row-major boolean matrix plus its period and category.
 *
 * Values never change after construction; transforms return new Patterns.
 */
class Pattern {
public:
    /**
     * @brief Build from a flattened row-major cell vector of size width*height.
     * @throws ConfigError on empty dimensions, a size mismatch, or period < 1.
     */
    Pattern(std::string name, int width, int height, std::vector<uint8_t> cells,
            int period, PatternCategory category, SizeClass size = SizeClass::Small);

    /**
     * @brief Build from a text picture, one string per row; 'O', '*' and '1' are alive.
     * @throws ConfigError if rows are empty or ragged.
     */
    static Pattern fromRows(std::string name, const std::vector<std::string>& rows,
                            int period, PatternCategory category, SizeClass size = SizeClass::Small);

    const std::string& name() const { return nm; }
    int width() const { return w; }
    int height() const { return h; }
    int period() const { return per; }
    PatternCategory category() const { return cat; }
    SizeClass sizeClass() const { return sz; }

    /** @brief Cell at column @p x, row @p y; false outside the matrix. */
    bool cell(int x, int y) const {
        if (x < 0 || y < 0 || x >= w || y >= h) return false;
        return cells[static_cast<size_t>(y * w + x)] != 0;
    }
    /** @brief Number of live cells. */
    int liveCount() const;
    /** @brief Raw row-major storage (0 dead, 1 alive). */
    const std::vector<uint8_t>& data() const { return cells; }

    /** @brief Copy of this pattern under another name (used for derived library entries). */
    Pattern withName(std::string newName) const;

    /** @brief Same shape and cells; name and metadata are ignored. */
    bool sameCells(const Pattern& other) const {
        return w == other.w && h == other.h && cells == other.cells;
    }

private:
    std::string nm;
    int w, h;
    std::vector<uint8_t> cells;
    int per;
    PatternCategory cat;
    SizeClass sz;
};

/** @brief Rotate 90 degrees clockwise; a WxH pattern becomes HxW. */
Pattern rotate90(const Pattern& p);
/** @brief Mirror left/right (reverse every row). */
Pattern flipHorizontal(const Pattern& p);
/** @brief Mirror top/bottom (reverse the row order). */
Pattern flipVertical(const Pattern& p);
