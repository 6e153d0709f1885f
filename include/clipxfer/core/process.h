/**
 * @file process.h
 * @brief Locating and running external tools
 */

#ifndef CLIPXFER_CORE_PROCESS_H
#define CLIPXFER_CORE_PROCESS_H

#include <clipxfer/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clipxfer {

/**
 * @brief Find an executable on PATH
 * @param name Executable name (no directory part)
 * @return Full path of the first match, if any
 */
[[nodiscard]] auto find_executable(const std::string& name)
    -> std::optional<std::filesystem::path>;

/**
 * @brief Run a command and wait for it
 * @param argv Program (looked up on PATH) followed by its arguments
 * @return Exit status of the child, or error if it could not be started
 *
 * The child's standard streams are redirected to /dev/null.
 */
[[nodiscard]] auto run_process(const std::vector<std::string>& argv) -> result<int>;

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_PROCESS_H
