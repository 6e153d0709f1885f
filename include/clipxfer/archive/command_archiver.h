/**
 * @file command_archiver.h
 * @brief Archiver running an installed command line tool
 */

#ifndef CLIPXFER_ARCHIVE_COMMAND_ARCHIVER_H
#define CLIPXFER_ARCHIVE_COMMAND_ARCHIVER_H

#include <clipxfer/archive/archiver_interface.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipxfer {

/**
 * @brief Supported archive tools
 */
enum class archive_tool {
    seven_zip,  ///< 7z a -mx=9
    tar_xz,     ///< tar -cJf
    zip         ///< zip -9 -j
};

/**
 * @brief Archiver backed by 7z, tar or zip
 *
 * @code
 * auto archiver = command_archiver::detect();
 * if (!archiver) {
 *     // archiver_not_found
 * }
 * auto archived = archiver.value()->archive("data.bin", work_dir);
 * @endcode
 */
class command_archiver : public archiver_interface {
public:
    /**
     * @brief Tools tried by detect(), in order of preference
     */
    [[nodiscard]] static auto preference_order() -> std::vector<archive_tool>;

    /**
     * @brief Pick the first tool found on PATH
     * @return Archiver, or archiver_not_found
     */
    [[nodiscard]] static auto detect() -> result<std::unique_ptr<command_archiver>>;

    [[nodiscard]] static auto executable_of(archive_tool tool) -> std::string;

    [[nodiscard]] static auto extension_of(archive_tool tool) -> std::string;

    /**
     * @brief Command line producing archive from source
     */
    [[nodiscard]] static auto command_line(
        archive_tool tool,
        const std::filesystem::path& archive,
        const std::filesystem::path& source) -> std::vector<std::string>;

    explicit command_archiver(archive_tool tool);

    [[nodiscard]] auto name() const -> std::string_view override;

    [[nodiscard]] auto archive(
        const std::filesystem::path& source,
        const std::filesystem::path& work_dir) -> result<archive_result> override;

    [[nodiscard]] auto tool() const -> archive_tool { return tool_; }

private:
    archive_tool tool_;
    std::string executable_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_ARCHIVE_COMMAND_ARCHIVER_H
