#include "clawbridge/client/filesystem.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "clawbridge/error_codes.hpp"

namespace clawbridge::client
{

    namespace
    {

        [[noreturn]] void throw_io_error(const std::string &action, const std::string &path, const std::error_code &ec)
        {
            throw FilesystemError(ErrorCode::FilesystemError, action + " " + path + ": " + ec.message());
        }

    } // namespace

    Filesystem::Filesystem(std::filesystem::path root) : root_(std::move(root)) {}

    std::string Filesystem::normalize(const std::string &requested) const
    {
        const std::filesystem::path relative(requested);
        if (relative.has_root_directory() || relative.has_root_name())
        {
            throw FilesystemError(ErrorCode::InvalidPath, "Absolute path rejected: " + requested);
        }

        std::filesystem::path sanitized;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FilesystemError(ErrorCode::InvalidPath, "Path traversal rejected: " + requested);
            }
            sanitized /= part;
        }
        if (sanitized.empty())
        {
            throw FilesystemError(ErrorCode::InvalidPath, "Empty path rejected");
        }
        return sanitized.generic_string();
    }

    std::filesystem::path Filesystem::resolve(const std::string &requested) const
    {
        return root_ / std::filesystem::path(normalize(requested));
    }

    void Filesystem::write_file(const std::string &relative_path, const std::string &content) const
    {
        const auto target = resolve(relative_path);
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
        {
            throw_io_error("mkdir", target.parent_path().string(), ec);
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw FilesystemError(ErrorCode::FilesystemError, "Unable to open " + target.string() + " for writing");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out)
        {
            throw FilesystemError(ErrorCode::FilesystemError, "Failed writing " + target.string());
        }
    }

    bool Filesystem::remove_file(const std::string &relative_path) const
    {
        const auto target = resolve(relative_path);
        std::error_code ec;
        const bool removed = std::filesystem::remove(target, ec);
        if (ec)
        {
            throw_io_error("remove", target.string(), ec);
        }
        return removed;
    }

    bool Filesystem::move_path(const std::string &from, const std::string &to) const
    {
        const auto source = resolve(from);
        const auto destination = resolve(to);
        std::error_code ec;
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            throw_io_error("mkdir", destination.parent_path().string(), ec);
        }
        std::filesystem::rename(source, destination, ec);
        if (ec == std::errc::no_such_file_or_directory)
        {
            return false;
        }
        if (ec)
        {
            throw_io_error("rename", source.string(), ec);
        }
        return true;
    }

    std::string Filesystem::read_file(const std::string &relative_path) const
    {
        const auto target = resolve(relative_path);
        std::ifstream in(target, std::ios::binary);
        if (!in.is_open())
        {
            throw FilesystemError(ErrorCode::FilesystemError, "Unable to open " + target.string());
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    bool Filesystem::is_regular_file(const std::string &relative_path) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(resolve(relative_path), ec);
    }

} // namespace clawbridge::client
