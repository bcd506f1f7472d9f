#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "clawbridge/protocol.hpp"

namespace clawbridge::client
{

    inline constexpr std::string_view kDocumentExtension = ".md";

    // True for forward-slash relative paths whose components are not dot-prefixed and whose file name
    // ends with the document extension.
    bool is_document_path(std::string_view relative_path);

    // Recursive scan of `root` for documents, sorted by path. Dot-prefixed files and directories are
    // skipped, as are files that cannot be read. A missing root yields an empty list.
    std::vector<protocol::FileRecord> scan_documents(const std::filesystem::path &root);

} // namespace clawbridge::client
