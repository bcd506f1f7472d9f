#include "clawbridge/client/file_scanner.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace clawbridge::client
{

    namespace
    {

        bool is_hidden(const std::filesystem::path &path)
        {
            const auto name = path.filename().string();
            return !name.empty() && name.front() == '.';
        }

        bool read_whole_file(const std::filesystem::path &path, std::string &content)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                return false;
            }
            content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
            return !in.bad();
        }

        // An unreadable directory is skipped on its own; its siblings are still scanned. Symlinks are
        // never followed.
        void collect_documents(const std::filesystem::path &root, const std::filesystem::path &directory,
                               std::vector<protocol::FileRecord> &files)
        {
            std::error_code ec;
            std::filesystem::directory_iterator it(directory, ec);
            for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec))
            {
                if (is_hidden(it->path()))
                {
                    continue;
                }
                std::error_code status_ec;
                const auto status = it->symlink_status(status_ec);
                if (status_ec)
                {
                    continue;
                }
                if (std::filesystem::is_directory(status))
                {
                    collect_documents(root, it->path(), files);
                    continue;
                }
                if (!std::filesystem::is_regular_file(status) || it->path().extension() != kDocumentExtension)
                {
                    continue;
                }
                protocol::FileRecord record;
                record.path = it->path().lexically_relative(root).generic_string();
                if (read_whole_file(it->path(), record.content))
                {
                    files.push_back(std::move(record));
                }
            }
        }

    } // namespace

    bool is_document_path(std::string_view relative_path)
    {
        if (relative_path.empty() || relative_path.size() <= kDocumentExtension.size())
        {
            return false;
        }
        if (relative_path.substr(relative_path.size() - kDocumentExtension.size()) != kDocumentExtension)
        {
            return false;
        }
        std::size_t start = 0;
        while (start < relative_path.size())
        {
            auto end = relative_path.find('/', start);
            if (end == std::string_view::npos)
            {
                end = relative_path.size();
            }
            const auto part = relative_path.substr(start, end - start);
            if (part.empty() || part.front() == '.')
            {
                return false;
            }
            start = end + 1;
        }
        return true;
    }

    std::vector<protocol::FileRecord> scan_documents(const std::filesystem::path &root)
    {
        std::vector<protocol::FileRecord> files;
        collect_documents(root, root, files);

        std::sort(files.begin(), files.end(),
                  [](const protocol::FileRecord &lhs, const protocol::FileRecord &rhs)
                  { return lhs.path < rhs.path; });
        return files;
    }

} // namespace clawbridge::client
