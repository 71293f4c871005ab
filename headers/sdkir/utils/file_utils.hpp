//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef SDKIR_FILE_UTILS_HPP
#define SDKIR_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Reading and writing whole files, and home-directory expansion for
 * configured paths. All operations use Result<T, Error> for error handling.
 */

#include "sdkir/result.hpp"
#include "sdkir/error.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace sdkir::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents, NotFound if the file does not exist, or
     *         IoError if it cannot be read.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Writes a string to a file, creating parent directories as needed.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Ensures a directory exists.
     */
    inline Result<void, Error> ensure_directory(const fs::path& dir) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            return Result<void, Error>::success();
        }

        fs::create_directories(dir, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to create directory: " + ec.message(), dir.string())
            );
        }
        return Result<void, Error>::success();
    }

    /**
     * Expands a leading "~" to the HOME directory. Paths without a
     * leading tilde, or without HOME set, are returned unchanged.
     */
    inline fs::path expand_home(const std::string_view path) {
        if (path.empty() || path.front() != '~') {
            return fs::path(path);
        }

        const char* home = std::getenv("HOME");
        if (home == nullptr || *home == '\0') {
            return fs::path(path);
        }

        std::string_view rest = path.substr(1);
        while (!rest.empty() && (rest.front() == '/' || rest.front() == '\\')) {
            rest.remove_prefix(1);
        }
        return fs::path(home) / fs::path(rest);
    }

}  // namespace sdkir::file_utils

#endif //SDKIR_FILE_UTILS_HPP
