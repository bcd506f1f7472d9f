#pragma once

#include <filesystem>
#include <string>

namespace clawbridge::client
{

    // Notes tree rooted at one directory. Every relative path handed in is checked before it touches
    // the disk: absolute paths and ".." components throw FilesystemError(InvalidPath).
    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        // Forward-slash relative form of `requested`, with "." components dropped.
        std::string normalize(const std::string &requested) const;

        std::filesystem::path resolve(const std::string &requested) const;

        // Creates missing parent directories.
        void write_file(const std::string &relative_path, const std::string &content) const;

        // Returns false when the file did not exist.
        bool remove_file(const std::string &relative_path) const;

        // Returns false when the source did not exist. Creates the destination's parent directories.
        bool move_path(const std::string &from, const std::string &to) const;

        std::string read_file(const std::string &relative_path) const;
        bool is_regular_file(const std::string &relative_path) const;

    private:
        std::filesystem::path root_;
    };

} // namespace clawbridge::client
