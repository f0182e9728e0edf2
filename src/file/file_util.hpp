#pragma once

#include <string>

#include "jsonconfig/api/status.hpp"

namespace jsonconfig {
namespace file {

// True when path names an existing regular file (not a directory or device).
bool IsRegularFile(const std::string& path);

bool IsDirectory(const std::string& path);

// Whole file content as bytes. kNotFound when missing, kIoError when unreadable.
api::Result<std::string> ReadTextFile(const std::string& path);

// With atomic_replace the content lands in a uniquely named temp file beside the
// target first and is renamed over it, so an existing file is only replaced by a
// completely written one. A symlinked path is followed and the link kept; an
// existing target's permission bits carry over.
api::Status WriteTextFile(const std::string& path, const std::string& content,
                          bool atomic_replace);

}  // namespace file
}  // namespace jsonconfig
