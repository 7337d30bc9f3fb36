#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace golden::refdump {

constexpr int kFirstElement = 1;
constexpr int kLastElement = 109;

constexpr double kJoulesPerElectronVolt = 1.602176634e-19;
constexpr double kKilogramsPerDalton = 1.66053906660e-27;

struct ElementData {
    int atomic_number;
    std::string_view symbol;
    std::string_view name;
    double atomic_weight;                        // g/mol
    std::optional<double> ionization_energy_ev;  // first ionization energy
};

/// Throws std::out_of_range outside [kFirstElement, kLastElement].
[[nodiscard]] const ElementData& element(int atomic_number);

[[nodiscard]] double mass_in_kg(const ElementData& data);

/// Berger-Seltzer parametrization J = 9.76 Z + 58.8 Z^-0.19 (eV).
[[nodiscard]] double mean_ionization_potential_ev(int atomic_number);

struct XRayLine {
    std::string_view name;               // Siegbahn name
    std::string_view source_shell;       // shell carrying the initial vacancy
    std::string_view destination_shell;  // shell the filling electron comes from
    std::string_view family;
    bool well_known;
    double relative_weight;              // relative to the strongest line of the family
};

/// Line table; XRayTransition's trans argument indexes into it.
[[nodiscard]] const std::vector<XRayLine>& xray_lines();

constexpr int kShellCount = 49;  // K through QXIII

struct ShellData {
    int index;
    std::string siegbahn_name;  // K, LI, LII, ...
    std::string iupac_name;     // K, L1, L2, ...
    std::string atomic_name;    // 1S, 2S, 2P1/2, ...
    std::string family;         // K..Q
    int principal_quantum_number;
    int orbital_angular_momentum;
    double total_angular_momentum;
    int capacity;
};

/// Throws std::out_of_range outside [0, kShellCount).
[[nodiscard]] const ShellData& shell(int index);

/// Electrons in \a shell_index for the neutral ground state, filled in Madelung order with the
/// lower-j subshell first. Configuration anomalies (Cr, Cu, ...) are not modelled.
[[nodiscard]] int ground_state_occupancy(int atomic_number, int shell_index);

/// Binding energy of \a shell (K, L1..L3, M1..M5, N4, N7) when tabulated for the element.
[[nodiscard]] std::optional<double> edge_energy_ev(int atomic_number, std::string_view shell);

}  // namespace golden::refdump
