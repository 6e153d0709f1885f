/**
 * @file archiver_interface.h
 * @brief Archiver collaborator used by the sender before chunking
 */

#ifndef CLIPXFER_ARCHIVE_ARCHIVER_INTERFACE_H
#define CLIPXFER_ARCHIVE_ARCHIVER_INTERFACE_H

#include <clipxfer/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace clipxfer {

/**
 * @brief Artifact produced by an archiver
 */
struct archive_result {
    std::filesystem::path path;
    uint64_t size_bytes = 0;
    std::string archive_type;  ///< File extension, e.g. ".7z"
};

/**
 * @brief Archiver interface
 *
 * Compresses a single file into a new archive inside a work directory
 * owned by the caller.
 */
class archiver_interface {
public:
    virtual ~archiver_interface() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Archive a file
     * @param source File to compress
     * @param work_dir Directory receiving the archive
     * @return Archive path, size and type, or error
     */
    [[nodiscard]] virtual auto archive(
        const std::filesystem::path& source,
        const std::filesystem::path& work_dir) -> result<archive_result> = 0;
};

}  // namespace clipxfer

#endif  // CLIPXFER_ARCHIVE_ARCHIVER_INTERFACE_H
