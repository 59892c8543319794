#include "naming/named_colors.hpp"

namespace chroma {

namespace {

constexpr std::array<NamedColor, kNamedColorCount> kNamedColors = {{
    // Reds
    {"Red", {255, 0, 0}, ColorFamily::Red},
    {"Crimson", {220, 20, 60}, ColorFamily::Red},
    {"Scarlet", {255, 36, 0}, ColorFamily::Red},
    {"Ruby", {224, 17, 95}, ColorFamily::Red},
    {"Cherry", {222, 49, 99}, ColorFamily::Red},
    {"Wine", {114, 47, 55}, ColorFamily::Red},
    {"Burgundy", {128, 0, 32}, ColorFamily::Red},
    {"Maroon", {128, 0, 0}, ColorFamily::Red},
    {"Brick", {203, 65, 84}, ColorFamily::Red},
    {"Rose", {255, 0, 127}, ColorFamily::Red},
    {"Salmon", {250, 128, 114}, ColorFamily::Red},
    {"Coral", {255, 127, 80}, ColorFamily::Red},
    {"Tomato", {255, 99, 71}, ColorFamily::Red},

    // Oranges
    {"Orange", {255, 165, 0}, ColorFamily::Orange},
    {"Tangerine", {255, 159, 0}, ColorFamily::Orange},
    {"Pumpkin", {255, 117, 24}, ColorFamily::Orange},
    {"Carrot", {237, 145, 33}, ColorFamily::Orange},
    {"Apricot", {251, 206, 177}, ColorFamily::Orange},
    {"Peach", {255, 218, 185}, ColorFamily::Orange},
    {"Burnt Orange", {204, 85, 0}, ColorFamily::Orange},
    {"Rust", {183, 65, 14}, ColorFamily::Orange},
    {"Terracotta", {226, 114, 91}, ColorFamily::Orange},
    {"Amber", {255, 191, 0}, ColorFamily::Orange},

    // Yellows
    {"Yellow", {255, 255, 0}, ColorFamily::Yellow},
    {"Gold", {255, 215, 0}, ColorFamily::Yellow},
    {"Honey", {235, 150, 5}, ColorFamily::Yellow},
    {"Mustard", {255, 219, 88}, ColorFamily::Yellow},
    {"Lemon", {255, 247, 0}, ColorFamily::Yellow},
    {"Canary", {255, 239, 0}, ColorFamily::Yellow},
    {"Butter", {255, 255, 149}, ColorFamily::Yellow},
    {"Cream", {255, 253, 208}, ColorFamily::Yellow},
    {"Champagne", {247, 231, 206}, ColorFamily::Yellow},
    {"Blonde", {250, 240, 190}, ColorFamily::Yellow},

    // Greens
    {"Green", {0, 128, 0}, ColorFamily::Green},
    {"Lime", {0, 255, 0}, ColorFamily::Green},
    {"Emerald", {80, 200, 120}, ColorFamily::Green},
    {"Jade", {0, 168, 107}, ColorFamily::Green},
    {"Mint", {152, 255, 152}, ColorFamily::Green},
    {"Sage", {176, 208, 176}, ColorFamily::Green},
    {"Forest", {34, 139, 34}, ColorFamily::Green},
    {"Olive", {128, 128, 0}, ColorFamily::Green},
    {"Moss", {138, 154, 91}, ColorFamily::Green},
    {"Grass", {124, 252, 0}, ColorFamily::Green},
    {"Seafoam", {159, 226, 191}, ColorFamily::Green},
    {"Teal", {0, 128, 128}, ColorFamily::Green},
    {"Pine", {1, 121, 111}, ColorFamily::Green},
    {"Jungle", {41, 171, 135}, ColorFamily::Green},
    {"Hunter", {53, 94, 59}, ColorFamily::Green},
    {"Spring", {0, 255, 127}, ColorFamily::Green},
    {"Pistachio", {147, 197, 114}, ColorFamily::Green},
    {"Chartreuse", {127, 255, 0}, ColorFamily::Green},

    // Blues
    {"Blue", {0, 0, 255}, ColorFamily::Blue},
    {"Sky", {135, 206, 235}, ColorFamily::Blue},
    {"Azure", {0, 127, 255}, ColorFamily::Blue},
    {"Navy", {0, 0, 128}, ColorFamily::Blue},
    {"Royal", {65, 105, 225}, ColorFamily::Blue},
    {"Cobalt", {0, 71, 171}, ColorFamily::Blue},
    {"Sapphire", {15, 82, 186}, ColorFamily::Blue},
    {"Ocean", {0, 119, 190}, ColorFamily::Blue},
    {"Cerulean", {0, 123, 167}, ColorFamily::Blue},
    {"Denim", {21, 96, 189}, ColorFamily::Blue},
    {"Steel", {70, 130, 180}, ColorFamily::Blue},
    {"Powder", {176, 224, 230}, ColorFamily::Blue},
    {"Baby Blue", {137, 207, 240}, ColorFamily::Blue},
    {"Ice", {153, 255, 255}, ColorFamily::Blue},
    {"Turquoise", {64, 224, 208}, ColorFamily::Blue},
    {"Aqua", {0, 255, 255}, ColorFamily::Blue},
    {"Cyan", {0, 255, 255}, ColorFamily::Blue},
    {"Midnight", {25, 25, 112}, ColorFamily::Blue},

    // Purples
    {"Purple", {128, 0, 128}, ColorFamily::Purple},
    {"Violet", {238, 130, 238}, ColorFamily::Purple},
    {"Lavender", {230, 230, 250}, ColorFamily::Purple},
    {"Lilac", {200, 162, 200}, ColorFamily::Purple},
    {"Plum", {142, 69, 133}, ColorFamily::Purple},
    {"Orchid", {218, 112, 214}, ColorFamily::Purple},
    {"Grape", {111, 45, 168}, ColorFamily::Purple},
    {"Amethyst", {153, 102, 204}, ColorFamily::Purple},
    {"Mauve", {224, 176, 255}, ColorFamily::Purple},
    {"Indigo", {75, 0, 130}, ColorFamily::Purple},
    {"Eggplant", {97, 64, 81}, ColorFamily::Purple},
    {"Magenta", {255, 0, 255}, ColorFamily::Purple},
    {"Fuchsia", {255, 0, 255}, ColorFamily::Purple},
    {"Periwinkle", {204, 204, 255}, ColorFamily::Purple},

    // Pinks
    {"Pink", {255, 192, 203}, ColorFamily::Pink},
    {"Hot Pink", {255, 105, 180}, ColorFamily::Pink},
    {"Blush", {222, 93, 131}, ColorFamily::Pink},
    {"Bubblegum", {255, 193, 204}, ColorFamily::Pink},
    {"Flamingo", {252, 142, 172}, ColorFamily::Pink},
    {"Watermelon", {253, 70, 89}, ColorFamily::Pink},
    {"Raspberry", {227, 11, 92}, ColorFamily::Pink},
    {"Rouge", {169, 64, 118}, ColorFamily::Pink},
    {"Dusty Rose", {194, 137, 162}, ColorFamily::Pink},

    // Browns
    {"Brown", {139, 69, 19}, ColorFamily::Brown},
    {"Chocolate", {123, 63, 0}, ColorFamily::Brown},
    {"Coffee", {111, 78, 55}, ColorFamily::Brown},
    {"Mocha", {151, 114, 92}, ColorFamily::Brown},
    {"Chestnut", {149, 69, 53}, ColorFamily::Brown},
    {"Cinnamon", {210, 105, 30}, ColorFamily::Brown},
    {"Caramel", {255, 213, 145}, ColorFamily::Brown},
    {"Tan", {210, 180, 140}, ColorFamily::Brown},
    {"Beige", {245, 245, 220}, ColorFamily::Brown},
    {"Khaki", {195, 176, 145}, ColorFamily::Brown},
    {"Sand", {194, 178, 128}, ColorFamily::Brown},
    {"Taupe", {72, 60, 50}, ColorFamily::Brown},
    {"Umber", {99, 81, 71}, ColorFamily::Brown},
    {"Sienna", {160, 82, 45}, ColorFamily::Brown},
    {"Mahogany", {192, 64, 0}, ColorFamily::Brown},
    {"Auburn", {165, 42, 42}, ColorFamily::Brown},
    {"Copper", {184, 115, 51}, ColorFamily::Brown},
    {"Bronze", {205, 127, 50}, ColorFamily::Brown},

    // Neutrals
    {"White", {255, 255, 255}, ColorFamily::Neutral},
    {"Ivory", {255, 255, 240}, ColorFamily::Neutral},
    {"Pearl", {234, 224, 200}, ColorFamily::Neutral},
    {"Snow", {255, 250, 250}, ColorFamily::Neutral},
    {"Bone", {227, 218, 201}, ColorFamily::Neutral},
    {"Linen", {250, 240, 230}, ColorFamily::Neutral},
    {"Silver", {192, 192, 192}, ColorFamily::Neutral},
    {"Ash", {178, 190, 181}, ColorFamily::Neutral},
    {"Slate", {112, 128, 144}, ColorFamily::Neutral},
    {"Charcoal", {54, 69, 79}, ColorFamily::Neutral},
    {"Smoke", {115, 130, 118}, ColorFamily::Neutral},
    {"Fog", {175, 180, 175}, ColorFamily::Neutral},
    {"Gray", {128, 128, 128}, ColorFamily::Neutral},
    {"Graphite", {65, 65, 65}, ColorFamily::Neutral},
    {"Onyx", {53, 56, 57}, ColorFamily::Neutral},
    {"Ebony", {33, 36, 33}, ColorFamily::Neutral},
    {"Jet", {52, 52, 52}, ColorFamily::Neutral},
    {"Black", {0, 0, 0}, ColorFamily::Neutral},

    // Metallics
    {"Rose Gold", {183, 110, 121}, ColorFamily::Special},
    {"Brass", {181, 166, 66}, ColorFamily::Special},
    {"Pewter", {142, 142, 130}, ColorFamily::Special},
}};

}

const std::array<NamedColor, kNamedColorCount>& named_colors() {
    return kNamedColors;
}

}
