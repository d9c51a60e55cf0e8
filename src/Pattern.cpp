/**
 * @file Pattern.cpp
 * @brief Pattern construction and transforms.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Pattern.h"
#include "ArcadeConfig.h"

#include <algorithm>
#include <utility>

const char* categoryName(PatternCategory c) {
    switch (c) {
        case PatternCategory::StillLife: return "still-life";
        case PatternCategory::Oscillator: return "oscillator";
        case PatternCategory::Spaceship: return "spaceship";
        case PatternCategory::Methuselah: return "methuselah";
    }
    return "unknown";
}

const char* sizeClassName(SizeClass s) {
    switch (s) {
        case SizeClass::Tiny: return "tiny";
        case SizeClass::Small: return "small";
        case SizeClass::Medium: return "medium";
        case SizeClass::Large: return "large";
    }
    return "unknown";
}

Pattern::Pattern(std::string name, int width, int height, std::vector<uint8_t> data,
                 int period, PatternCategory category, SizeClass size)
    : nm(std::move(name)), w(width), h(height), cells(std::move(data)),
      per(period), cat(category), sz(size) {
    if (w <= 0 || h <= 0) {
        throw ConfigError("pattern " + nm + ": dimensions must be positive");
    }
    if (cells.size() != static_cast<size_t>(w) * static_cast<size_t>(h)) {
        throw ConfigError("pattern " + nm + ": cell count does not match " +
                          std::to_string(w) + "x" + std::to_string(h));
    }
    if (per < 1) {
        throw ConfigError("pattern " + nm + ": period must be >= 1");
    }
    for (auto& c : cells) c = c ? 1 : 0;
}

Pattern Pattern::fromRows(std::string name, const std::vector<std::string>& rows,
                          int period, PatternCategory category, SizeClass size) {
    if (rows.empty() || rows.front().empty()) {
        throw ConfigError("pattern " + name + ": no rows");
    }
    const int width = static_cast<int>(rows.front().size());
    std::vector<uint8_t> data;
    data.reserve(rows.size() * rows.front().size());
    for (const auto& r : rows) {
        if (static_cast<int>(r.size()) != width) {
            throw ConfigError("pattern " + name + ": ragged rows");
        }
        for (char ch : r) data.push_back((ch == 'O' || ch == '*' || ch == '1') ? 1 : 0);
    }
    return Pattern(std::move(name), width, static_cast<int>(rows.size()), std::move(data),
                   period, category, size);
}

int Pattern::liveCount() const {
    return static_cast<int>(std::count(cells.begin(), cells.end(), static_cast<uint8_t>(1)));
}

Pattern Pattern::withName(std::string newName) const {
    Pattern copy(*this);
    copy.nm = std::move(newName);
    return copy;
}

Pattern rotate90(const Pattern& p) {
    // Row y of the result is column y of the source read bottom-up.
    const int outW = p.height();
    const int outH = p.width();
    std::vector<uint8_t> out(static_cast<size_t>(outW * outH));
    for (int y = 0; y < outH; ++y) {
        for (int x = 0; x < outW; ++x) {
            out[static_cast<size_t>(y * outW + x)] = p.cell(y, p.height() - 1 - x) ? 1 : 0;
        }
    }
    return Pattern(p.name(), outW, outH, std::move(out), p.period(), p.category(), p.sizeClass());
}

Pattern flipHorizontal(const Pattern& p) {
    std::vector<uint8_t> out(p.data());
    for (int y = 0; y < p.height(); ++y) {
        auto row = out.begin() + y * p.width();
        std::reverse(row, row + p.width());
    }
    return Pattern(p.name(), p.width(), p.height(), std::move(out), p.period(), p.category(), p.sizeClass());
}

Pattern flipVertical(const Pattern& p) {
    std::vector<uint8_t> out;
    out.reserve(p.data().size());
    for (int y = p.height() - 1; y >= 0; --y) {
        auto row = p.data().begin() + y * p.width();
        out.insert(out.end(), row, row + p.width());
    }
    return Pattern(p.name(), p.width(), p.height(), std::move(out), p.period(), p.category(), p.sizeClass());
}
