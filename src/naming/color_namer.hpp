#pragma once

#include "naming/named_colors.hpp"
#include <string>
#include <vector>

namespace chroma {

// Closest dictionary name by redmean-weighted RGB distance. Prefixes "Dark "
// or "Light " when the query's channel mean is more than 40 away from the
// entry's. Never fails.
std::string color_name(const RGB& rgb);

const NamedColor& nearest_named_color(const RGB& rgb);
float redmean_distance(const RGB& a, const RGB& b);

std::vector<NamedColor> all_named_colors();
std::vector<NamedColor> colors_by_family(ColorFamily family);

// Lowercase family name ("red" ... "special"); anything else gives an empty list.
std::vector<NamedColor> colors_by_category(const std::string& category);

// Case-insensitive substring match, dictionary order.
std::vector<NamedColor> search_colors_by_name(const std::string& query);

const char* family_name(ColorFamily family);

}
