/**
 * @file scoped_directory.h
 * @brief Temporary directory removed on scope exit
 */

#ifndef CLIPXFER_CORE_SCOPED_DIRECTORY_H
#define CLIPXFER_CORE_SCOPED_DIRECTORY_H

#include <clipxfer/core/types.h>

#include <filesystem>
#include <string>

namespace clipxfer {

/**
 * @brief Owns a uniquely named directory and removes it recursively
 */
class scoped_directory {
public:
    /**
     * @brief Create a fresh directory under parent
     * @param parent Parent directory (created if missing)
     * @param prefix Name prefix of the new directory
     */
    [[nodiscard]] static auto create(
        const std::filesystem::path& parent,
        const std::string& prefix) -> result<scoped_directory>;

    ~scoped_directory();

    scoped_directory(scoped_directory&& other) noexcept;
    auto operator=(scoped_directory&& other) noexcept -> scoped_directory&;

    scoped_directory(const scoped_directory&) = delete;
    auto operator=(const scoped_directory&) -> scoped_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Remove the directory now; further calls are no-ops
     */
    void remove() noexcept;

private:
    explicit scoped_directory(std::filesystem::path path);

    std::filesystem::path path_;
};

/**
 * @brief Random lowercase hex string used for temp names
 */
[[nodiscard]] auto random_hex(std::size_t length) -> std::string;

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_SCOPED_DIRECTORY_H
