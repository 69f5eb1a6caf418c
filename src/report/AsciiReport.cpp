#include "AsciiReport.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string layoutString(const Layout& layout) {
    return layout;
}

std::string formatLayoutAscii(const KeySpace& keySpace, const Layout& layout) {
    std::ostringstream out;
    const auto& rows = keySpace.rowSizes();

    for (size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) out << "\n";
        out << std::string(r, ' ');
        size_t start = keySpace.rowStart(r);
        for (size_t k = 0; k < rows[r]; ++k) {
            size_t idx = start + k;
            if (idx >= layout.size()) break;
            if (k > 0) out << ' ';
            out << layout[idx];
        }
    }
    return out.str();
}

std::string sparkline(const std::vector<double>& values, size_t width) {
    static const char* const blocks[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
    const size_t levels = 8;

    if (values.empty() || width == 0) return "";

    auto bounds = std::minmax_element(values.begin(), values.end());
    double lo = *bounds.first;
    double hi = *bounds.second;

    std::string out;
    if (hi - lo < 1e-12) {
        for (size_t i = 0; i < std::min(width, values.size()); ++i) out += blocks[0];
        return out;
    }

    size_t step = std::max<size_t>(1, values.size() / width);
    for (size_t i = 0; i < values.size(); i += step) {
        double norm = (values[i] - lo) / (hi - lo);
        size_t level = static_cast<size_t>(std::lround(norm * static_cast<double>(levels - 1)));
        out += blocks[std::min(levels - 1, level)];
    }
    return out;
}

std::string formatKeyCostGrid(const KeySpace& keySpace, const KeyCostMap& costs) {
    std::ostringstream out;
    const auto& rows = keySpace.rowSizes();

    for (size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) out << "\n";
        out << std::string(r * 4, ' ');
        size_t start = keySpace.rowStart(r);
        for (size_t k = 0; k < rows[r]; ++k) {
            char key = keySpace.symbolAt(start + k);
            auto it = costs.find(key);
            double value = it == costs.end() ? 0.0 : it->second;
            if (k > 0) out << ' ';
            out << key << ':' << std::fixed << std::setprecision(0) << std::setw(7) << value;
        }
    }
    return out.str();
}

void writeLayoutFile(const std::string& path, const KeySpace& keySpace, const Layout& layout) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open layout file for writing: " + path);
    }
    out << layoutString(layout) << "\n\n" << formatLayoutAscii(keySpace, layout) << "\n";
    if (!out) {
        throw std::runtime_error("failed writing layout file: " + path);
    }
}
