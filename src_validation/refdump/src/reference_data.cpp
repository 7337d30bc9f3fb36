#include "golden_refdump/reference_data.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace golden::refdump {

namespace {

constexpr std::optional<double> kNone = std::nullopt;

// clang-format off
const std::array<ElementData, kLastElement> kElements = {{
    {1, "H", "Hydrogen", 1.00794, 13.598},
    {2, "He", "Helium", 4.002602, 24.587},
    {3, "Li", "Lithium", 6.941, 5.392},
    {4, "Be", "Beryllium", 9.012182, 9.323},
    {5, "B", "Boron", 10.811, 8.298},
    {6, "C", "Carbon", 12.0107, 11.260},
    {7, "N", "Nitrogen", 14.0067, 14.534},
    {8, "O", "Oxygen", 15.9994, 13.618},
    {9, "F", "Fluorine", 18.998, 17.423},
    {10, "Ne", "Neon", 20.1797, 21.565},
    {11, "Na", "Sodium", 22.989770, 5.139},
    {12, "Mg", "Magnesium", 24.3050, 7.646},
    {13, "Al", "Aluminum", 26.981538, 5.986},
    {14, "Si", "Silicon", 28.0855, 8.152},
    {15, "P", "Phosphorus", 30.973761, 10.487},
    {16, "S", "Sulfur", 32.065, 10.360},
    {17, "Cl", "Chlorine", 35.453, 12.968},
    {18, "Ar", "Argon", 39.948, 15.760},
    {19, "K", "Potassium", 39.0983, 4.341},
    {20, "Ca", "Calcium", 40.078, 6.113},
    {21, "Sc", "Scandium", 44.955910, 6.561},
    {22, "Ti", "Titanium", 47.867, 6.828},
    {23, "V", "Vanadium", 50.9415, 6.746},
    {24, "Cr", "Chromium", 51.9961, 6.767},
    {25, "Mn", "Manganese", 54.938, 7.434},
    {26, "Fe", "Iron", 55.845, 7.902},
    {27, "Co", "Cobalt", 58.933, 7.881},
    {28, "Ni", "Nickel", 58.6934, 7.640},
    {29, "Cu", "Copper", 63.546, 7.726},
    {30, "Zn", "Zinc", 65.409, 9.394},
    {31, "Ga", "Gallium", 69.723, 5.999},
    {32, "Ge", "Germanium", 72.64, 7.899},
    {33, "As", "Arsenic", 74.92160, 9.789},
    {34, "Se", "Selenium", 78.96, 9.752},
    {35, "Br", "Bromine", 79.904, 11.814},
    {36, "Kr", "Krypton", 83.798, 14.000},
    {37, "Rb", "Rubidium", 85.4678, kNone},
    {38, "Sr", "Strontium", 87.62, kNone},
    {39, "Y", "Yttrium", 88.905, kNone},
    {40, "Zr", "Zirconium", 91.224, kNone},
    {41, "Nb", "Niobium", 92.906, kNone},
    {42, "Mo", "Molybdenum", 95.94, kNone},
    {43, "Tc", "Technetium", 98.0, kNone},
    {44, "Ru", "Ruthenium", 101.07, kNone},
    {45, "Rh", "Rhodium", 102.90550, kNone},
    {46, "Pd", "Palladium", 106.42, kNone},
    {47, "Ag", "Silver", 107.8682, 7.576},
    {48, "Cd", "Cadmium", 112.411, kNone},
    {49, "In", "Indium", 114.818, kNone},
    {50, "Sn", "Tin", 118.710, kNone},
    {51, "Sb", "Antimony", 121.760, kNone},
    {52, "Te", "Tellurium", 127.60, kNone},
    {53, "I", "Iodine", 126.904, kNone},
    {54, "Xe", "Xenon", 131.293, kNone},
    {55, "Cs", "Cesium", 132.904, kNone},
    {56, "Ba", "Barium", 137.327, kNone},
    {57, "La", "Lanthanum", 138.9055, kNone},
    {58, "Ce", "Cerium", 140.116, kNone},
    {59, "Pr", "Praseodymium", 140.907, kNone},
    {60, "Nd", "Neodymium", 144.24, kNone},
    {61, "Pm", "Promethium", 145.0, kNone},
    {62, "Sm", "Samarium", 150.36, kNone},
    {63, "Eu", "Europium", 151.964, kNone},
    {64, "Gd", "Gadolinium", 157.25, kNone},
    {65, "Tb", "Terbium", 158.925, kNone},
    {66, "Dy", "Dysprosium", 162.500, kNone},
    {67, "Ho", "Holmium", 164.930, kNone},
    {68, "Er", "Erbium", 167.259, kNone},
    {69, "Tm", "Thulium", 168.934, kNone},
    {70, "Yb", "Ytterbium", 173.04, kNone},
    {71, "Lu", "Lutetium", 174.967, kNone},
    {72, "Hf", "Hafnium", 178.49, kNone},
    {73, "Ta", "Tantalum", 180.9479, kNone},
    {74, "W", "Tungsten", 183.84, kNone},
    {75, "Re", "Rhenium", 186.207, kNone},
    {76, "Os", "Osmium", 190.23, kNone},
    {77, "Ir", "Iridium", 192.217, kNone},
    {78, "Pt", "Platinum", 195.078, kNone},
    {79, "Au", "Gold", 196.96655, 9.226},
    {80, "Hg", "Mercury", 200.59, kNone},
    {81, "Tl", "Thallium", 204.3833, kNone},
    {82, "Pb", "Lead", 207.2, 7.417},
    {83, "Bi", "Bismuth", 208.980, kNone},
    {84, "Po", "Polonium", 209.0, kNone},
    {85, "At", "Astatine", 210.0, kNone},
    {86, "Rn", "Radon", 222.0, kNone},
    {87, "Fr", "Francium", 223.0, kNone},
    {88, "Ra", "Radium", 226.0, kNone},
    {89, "Ac", "Actinium", 227.0, kNone},
    {90, "Th", "Thorium", 232.0381, kNone},
    {91, "Pa", "Protactinium", 231.03588, kNone},
    {92, "U", "Uranium", 238.02891, kNone},
    {93, "Np", "Neptunium", 237.0, kNone},
    {94, "Pu", "Plutonium", 244.0, kNone},
    {95, "Am", "Americium", 243.0, kNone},
    {96, "Cm", "Curium", 247.0, kNone},
    {97, "Bk", "Berkelium", 247.0, kNone},
    {98, "Cf", "Californium", 251.0, kNone},
    {99, "Es", "Einsteinium", 252.0, kNone},
    {100, "Fm", "Fermium", 257.0, kNone},
    {101, "Md", "Mendelevium", 258.0, kNone},
    {102, "No", "Nobelium", 259.0, kNone},
    {103, "Lr", "Lawrencium", 262.0, kNone},
    {104, "Rf", "Rutherfordium", 261.0, kNone},
    {105, "Db", "Dubnium", 262.0, kNone},
    {106, "Sg", "Seaborgium", 266.0, kNone},
    {107, "Bh", "Bohrium", 264.0, kNone},
    {108, "Hs", "Hassium", 277.0, kNone},
    {109, "Mt", "Meitnerium", 268.0, kNone},
}};

const std::vector<XRayLine> kLines = {
    {"KA1", "K", "L3", "K", true, 1.0},
    {"KA2", "K", "L2", "K", true, 0.5},
    {"KB1", "K", "M3", "K", true, 0.12},
    {"KB3", "K", "M2", "K", true, 0.06},
    {"LA1", "L3", "M5", "L", true, 1.0},
    {"LA2", "L3", "M4", "L", true, 0.11},
    {"LB1", "L2", "M4", "L", true, 0.6},
    {"LB3", "L1", "M3", "L", true, 0.08},
    {"LB4", "L1", "M2", "L", false, 0.05},
    {"LG1", "L2", "N4", "L", true, 0.1},
    {"LL", "L3", "M1", "L", false, 0.04},
    {"MA1", "M5", "N7", "M", true, 1.0},
};

using EdgeTable = std::map<std::string_view, double>;

const std::map<int, EdgeTable> kEdges = {
    {6, {{"K", 284.2}}},
    {13, {{"K", 1559.6}, {"L1", 117.8}, {"L2", 72.95}, {"L3", 72.55}}},
    {14, {{"K", 1839.0}, {"L1", 149.7}, {"L2", 99.82}, {"L3", 99.42}}},
    {26, {{"K", 7112.0}, {"L1", 844.6}, {"L2", 719.9}, {"L3", 706.8}, {"M1", 91.3}, {"M2", 52.7}, {"M3", 52.7}}},
    {29, {{"K", 8979.0}, {"L1", 1096.7}, {"L2", 952.3}, {"L3", 932.7}, {"M1", 122.5}, {"M2", 77.3}, {"M3", 75.1}}},
    {79, {{"K", 80725.0}, {"L1", 14353.0}, {"L2", 13734.0}, {"L3", 11919.0}, {"M1", 3425.0}, {"M2", 3148.0},
          {"M3", 2743.0}, {"M4", 2291.0}, {"M5", 2206.0}, {"N4", 353.2}, {"N7", 84.0}}},
};
// clang-format on

constexpr std::array<std::string_view, 7> kFamilies = {"K", "L", "M", "N", "O", "P", "Q"};
constexpr std::array<std::string_view, 13> kRoman = {"I", "II",  "III", "IV", "V",   "VI",  "VII",
                                                     "VIII", "IX", "X",  "XI", "XII", "XIII"};
constexpr std::string_view kOrbitals = "SPDFGHI";

// Shells of family f occupy indices [f*f, (f+1)*(f+1)); the k-th one has l = (k+1)/2 and
// takes j = l - 1/2 for odd k, j = l + 1/2 for even k.
std::vector<ShellData> build_shells() {
    std::vector<ShellData> shells;
    shells.reserve(kShellCount);
    for (int f = 0; f < static_cast<int>(kFamilies.size()); ++f) {
        const std::string family{kFamilies[static_cast<std::size_t>(f)]};
        for (int k = 0; k <= 2 * f; ++k) {
            ShellData data{};
            data.index = static_cast<int>(shells.size());
            data.family = family;
            data.principal_quantum_number = f + 1;
            data.orbital_angular_momentum = (k + 1) / 2;
            const double l = data.orbital_angular_momentum;
            data.total_angular_momentum = k == 0 ? 0.5 : (k % 2 == 1 ? l - 0.5 : l + 0.5);
            data.capacity = static_cast<int>(2.0 * data.total_angular_momentum + 1.0);
            if (f == 0) {
                data.siegbahn_name = family;
                data.iupac_name = family;
            } else {
                data.siegbahn_name = family + std::string{kRoman[static_cast<std::size_t>(k)]};
                data.iupac_name = family + std::to_string(k + 1);
            }
            data.atomic_name = std::to_string(data.principal_quantum_number) +
                               kOrbitals[static_cast<std::size_t>(data.orbital_angular_momentum)];
            if (data.orbital_angular_momentum > 0) {
                data.atomic_name += std::to_string(2 * data.orbital_angular_momentum + (k % 2 == 1 ? -1 : 1)) + "/2";
            }
            shells.push_back(std::move(data));
        }
    }
    return shells;
}

const std::vector<ShellData>& shells() {
    static const std::vector<ShellData> table = build_shells();
    return table;
}

int shell_index_of(int n, int l, bool upper_j) {
    const int f = n - 1;
    const int k = l == 0 ? 0 : 2 * l - (upper_j ? 0 : 1);
    return f * f + k;
}

}  // namespace

const ElementData& element(int atomic_number) {
    if (atomic_number < kFirstElement || atomic_number > kLastElement) {
        throw std::out_of_range("No element with atomic number " + std::to_string(atomic_number));
    }
    return kElements[static_cast<std::size_t>(atomic_number - 1)];
}

double mass_in_kg(const ElementData& data) {
    return data.atomic_weight * kKilogramsPerDalton;
}

double mean_ionization_potential_ev(int atomic_number) {
    const double z = static_cast<double>(atomic_number);
    return 9.76 * z + 58.8 * std::pow(z, -0.19);
}

const ShellData& shell(int index) {
    if (index < 0 || index >= kShellCount) {
        throw std::out_of_range("No atomic shell with index " + std::to_string(index));
    }
    return shells()[static_cast<std::size_t>(index)];
}

int ground_state_occupancy(int atomic_number, int shell_index) {
    (void)element(atomic_number);
    (void)shell(shell_index);

    // Subshells (n, l) ordered by n + l, then n.
    std::vector<std::pair<int, int>> order;
    for (int n = 1; n <= static_cast<int>(kFamilies.size()); ++n) {
        for (int l = 0; l < n; ++l) {
            order.emplace_back(n, l);
        }
    }
    std::stable_sort(order.begin(), order.end(), [](const auto& a, const auto& b) {
        const int ka = a.first + a.second;
        const int kb = b.first + b.second;
        return ka != kb ? ka < kb : a.first < b.first;
    });

    int remaining = atomic_number;
    for (const auto& [n, l] : order) {
        if (remaining == 0) {
            break;
        }
        if (l == 0) {
            const int filled = std::min(remaining, 2);
            if (shell_index_of(n, 0, false) == shell_index) {
                return filled;
            }
            remaining -= filled;
            continue;
        }
        const int lower = std::min(remaining, 2 * l);
        const int upper = std::min(remaining - lower, 2 * l + 2);
        if (shell_index_of(n, l, false) == shell_index) {
            return lower;
        }
        if (shell_index_of(n, l, true) == shell_index) {
            return upper;
        }
        remaining -= lower + upper;
    }
    return 0;
}

const std::vector<XRayLine>& xray_lines() {
    return kLines;
}

std::optional<double> edge_energy_ev(int atomic_number, std::string_view shell) {
    const auto table = kEdges.find(atomic_number);
    if (table == kEdges.end()) {
        return std::nullopt;
    }
    const auto edge = table->second.find(shell);
    if (edge == table->second.end()) {
        return std::nullopt;
    }
    return edge->second;
}

}  // namespace golden::refdump
