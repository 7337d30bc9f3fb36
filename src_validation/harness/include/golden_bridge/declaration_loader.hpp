#pragma once

#include "declaration.hpp"

#include <filesystem>
#include <vector>

namespace golden::bridge {

/**
 * \brief Loads oracle declarations from disk.
 *
 * Line-oriented syntax, easy to author by hand and friendly to version control. Each file
 * is composed of one or more declaration blocks separated by a line containing three
 * dashes (`---`). Within a block, key/value pairs take the form `key=value` with
 * leading/trailing whitespace ignored.
 *
 * Recognised keys:
 *   - `test`: Optional test name. Falls back to `<file-stem>#<index>`.
 *   - `module`: Dump module producing the reference data (required).
 *   - `param.<name>`: Parametrization axis; either a comma-separated value list or an
 *                     inclusive integer range `first..last`. Axes keep file order.
 *
 * Example:
 * \code{.txt}
 * test=element_properties
 * module=Element
 * param.Z=26,79
 * ---
 * test=xray_lines
 * module=XRayTransition
 * param.Z=20..30
 * param.trans=KA1,KB1
 * \endcode
 *
 * Lines starting with `#` or empty lines are ignored. Errors name the file and line.
 */
class DeclarationLoader {
public:
    DeclarationLoader() = default;

    [[nodiscard]] std::vector<OracleDeclaration> load(const std::filesystem::path& file) const;

    /// Every regular file below \a root in path order; a plain file is loaded on its own.
    [[nodiscard]] std::vector<OracleDeclaration> load_directory(const std::filesystem::path& root) const;
};

}  // namespace golden::bridge
