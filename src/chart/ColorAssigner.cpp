#include "chart/ColorAssigner.hpp"
#include <stdexcept>

ColorAssigner::ColorAssigner(std::vector<Rgb> palette)
    : palette_(std::move(palette))
{
    if (palette_.empty())
        throw std::invalid_argument("ColorAssigner requires a non-empty palette");
}

ColorTable ColorAssigner::assign(const std::set<std::string>& categories) const {
    ColorTable table;
    size_t index = 0;
    // std::set iterates in lexicographic order
    for (auto& key : categories)
        table[key] = palette_[index++ % palette_.size()];
    return table;
}

ColorTable ColorAssigner::assign(const std::vector<std::string>& categories) const {
    return assign(std::set<std::string>(categories.begin(), categories.end()));
}

Rgb ColorAssigner::lookup(const ColorTable& table, const std::string& key) {
    auto it = table.find(key);
    if (it != table.end()) return it->second;
    return {0xFF, 0xFF, 0xFF};
}
