#pragma once
#include "Palette.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

using ColorTable = std::map<std::string, Rgb>;

// Deterministic category -> color mapping. Keys are sorted and assigned
// palette[index % size]. Callers pass the union of cost and usage
// categories so a model keeps one color across both charts.
class ColorAssigner {
public:
    explicit ColorAssigner(std::vector<Rgb> palette);

    ColorTable assign(const std::set<std::string>& categories) const;
    ColorTable assign(const std::vector<std::string>& categories) const;

    // Color for a key missing from `table` (white, as a neutral fallback)
    static Rgb lookup(const ColorTable& table, const std::string& key);

    size_t paletteSize() const { return palette_.size(); }

private:
    std::vector<Rgb> palette_;
};
