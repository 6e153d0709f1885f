/**
 * @file command_archiver.cpp
 * @brief Implementation of command_archiver
 */

#include <clipxfer/archive/command_archiver.h>

#include <clipxfer/core/logging.h>
#include <clipxfer/core/process.h>

namespace clipxfer {

auto command_archiver::preference_order() -> std::vector<archive_tool> {
    return {archive_tool::seven_zip, archive_tool::tar_xz, archive_tool::zip};
}

auto command_archiver::executable_of(archive_tool tool) -> std::string {
    switch (tool) {
        case archive_tool::seven_zip: return "7z";
        case archive_tool::tar_xz: return "tar";
        case archive_tool::zip: return "zip";
    }
    return {};
}

auto command_archiver::extension_of(archive_tool tool) -> std::string {
    switch (tool) {
        case archive_tool::seven_zip: return ".7z";
        case archive_tool::tar_xz: return ".tar.xz";
        case archive_tool::zip: return ".zip";
    }
    return {};
}

auto command_archiver::command_line(
    archive_tool tool,
    const std::filesystem::path& archive,
    const std::filesystem::path& source) -> std::vector<std::string> {
    auto exe = executable_of(tool);
    switch (tool) {
        case archive_tool::seven_zip:
            return {exe, "a", "-mx=9", archive.string(), source.string()};
        case archive_tool::tar_xz: {
            // Store the bare file name, not the directory it came from
            auto parent = source.parent_path().empty() ? std::filesystem::path(".")
                                                       : source.parent_path();
            return {exe, "-cJf", archive.string(), "-C", parent.string(),
                    source.filename().string()};
        }
        case archive_tool::zip:
            return {exe, "-9", "-j", archive.string(), source.string()};
    }
    return {};
}

auto command_archiver::detect() -> result<std::unique_ptr<command_archiver>> {
    for (auto tool : preference_order()) {
        if (find_executable(executable_of(tool))) {
            return std::make_unique<command_archiver>(tool);
        }
    }
    return unexpected(error{error_code::archiver_not_found,
                            "no compatible archiver found (7z, tar, zip)"});
}

command_archiver::command_archiver(archive_tool tool)
    : tool_(tool), executable_(executable_of(tool)) {}

auto command_archiver::name() const -> std::string_view {
    return executable_;
}

auto command_archiver::archive(
    const std::filesystem::path& source,
    const std::filesystem::path& work_dir) -> result<archive_result> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return unexpected(error{error_code::file_not_found,
                                "cannot archive " + source.string() + ": not a regular file"});
    }

    archive_result out;
    out.archive_type = extension_of(tool_);
    out.path = work_dir / (source.filename().string() + out.archive_type);
    std::filesystem::remove(out.path, ec);

    CX_LOG_INFO(log_category::archive,
                "Compressing " + source.filename().string() + " with " + executable_);

    auto status = run_process(command_line(tool_, std::filesystem::absolute(out.path, ec),
                                           std::filesystem::absolute(source, ec)));
    if (!status) {
        return unexpected(error{error_code::archive_failed, status.error().message});
    }
    if (status.value() != 0) {
        return unexpected(error{error_code::archive_failed,
                                executable_ + " exited with status " +
                                    std::to_string(status.value())});
    }

    auto size = std::filesystem::file_size(out.path, ec);
    if (ec) {
        return unexpected(error{error_code::archive_failed,
                                executable_ + " produced no archive: " + ec.message()});
    }
    out.size_bytes = size;

    CX_LOG_INFO(log_category::archive,
                "Compression complete, archive size " + std::to_string(out.size_bytes) + " bytes");
    return out;
}

}  // namespace clipxfer
