#pragma once
#include "CostModel.hpp"
#include "KeySpace.hpp"
#include <string>
#include <vector>

// Compact form: the symbols in position order
std::string layoutString(const Layout& layout);

/**
 * @brief Staggered keyboard picture, one line per key-space row.
 *
 * Row r is indented by r spaces; symbols are separated by single spaces.
 */
std::string formatLayoutAscii(const KeySpace& keySpace, const Layout& layout);

/**
 * @brief Unicode block sparkline of a series, at most about `width` glyphs.
 *
 * A flat series renders as the lowest block.
 */
std::string sparkline(const std::vector<double>& values, size_t width = 60);

/**
 * @brief Per-key costs laid out like the keyboard, one row per line.
 */
std::string formatKeyCostGrid(const KeySpace& keySpace, const KeyCostMap& costs);

/**
 * @brief Writes the layout string, a blank line, then the ASCII picture.
 * @throws std::runtime_error if the file cannot be written.
 */
void writeLayoutFile(const std::string& path, const KeySpace& keySpace, const Layout& layout);
