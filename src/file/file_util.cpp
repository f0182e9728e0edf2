#include "file/file_util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#if defined(_WIN32)
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace jsonconfig {
namespace file {

#define JC_STATUS(code, detail, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kFile, (detail))
namespace {

std::string ErrnoText() {
  const int err = errno;
  return err == 0 ? std::string("unknown error") : std::string(std::strerror(err));
}

api::Status WriteStream(const std::string& path, const std::string& content) {
  errno = 0;
  std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                     "open " + path + " for write failed: " + ErrnoText());
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out.good()) {
    return JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                     "write " + path + " failed: " + ErrnoText());
  }
  out.close();
  if (out.fail()) {
    return JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                     "close " + path + " failed: " + ErrnoText());
  }
  return api::Status::Ok();
}

#if !defined(_WIN32)
std::string DirName(const std::string& path) {
  const std::size_t pos = path.find_last_of('/');
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

// A symlinked path is replaced at the file it points to, so the link survives.
// A dangling link resolves to its (not yet existing) destination.
std::string ResolveTarget(const std::string& path) {
  struct stat info;
  if (lstat(path.c_str(), &info) != 0 || !S_ISLNK(info.st_mode)) return path;

  char resolved[PATH_MAX];
  if (realpath(path.c_str(), resolved) != NULL) return std::string(resolved);

  char link[PATH_MAX];
  const ssize_t len = readlink(path.c_str(), link, sizeof(link) - 1);
  if (len <= 0) return path;
  link[len] = '\0';
  if (link[0] == '/') return std::string(link);
  return DirName(path) + "/" + link;
}

api::Status WriteFd(int fd, const std::string& path, const std::string& content) {
  const char* data = content.data();
  std::size_t left = content.size();
  while (left > 0) {
    const ssize_t n = ::write(fd, data, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      return JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                       "write " + path + " failed: " + ErrnoText());
    }
    data += n;
    left -= static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    return JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                     "sync " + path + " failed: " + ErrnoText());
  }
  return api::Status::Ok();
}

// Writes content to a fresh "<target>.XXXXXX" beside target, carrying over the
// mode of an existing target. The temp name is returned through temp_path.
api::Status WriteTempFile(const std::string& target, const std::string& content,
                          std::string* temp_path) {
  std::string pattern = target + ".XXXXXX";
  errno = 0;
  const int fd = mkstemp(&pattern[0]);
  if (fd < 0) {
    return JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                     "create temp file for " + target + " failed: " + ErrnoText());
  }
  *temp_path = pattern;

  // mkstemp creates 0600; a new target gets the usual umask-derived mode instead.
  struct stat info;
  mode_t mode;
  if (stat(target.c_str(), &info) == 0) {
    mode = info.st_mode & 07777;
  } else {
    const mode_t mask = umask(0);
    umask(mask);
    mode = 0666 & ~mask;
  }
  api::Status st;
  if (fchmod(fd, mode) != 0) {
    st = JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                   "chmod " + pattern + " failed: " + ErrnoText());
  } else {
    st = WriteFd(fd, pattern, content);
  }
  if (::close(fd) != 0 && st.ok()) {
    st = JC_STATUS(api::StatusCode::kIoError, api::kDetailFileWriteFailed,
                   "close " + pattern + " failed: " + ErrnoText());
  }
  return st;
}
#endif

}  // namespace

bool IsRegularFile(const std::string& path) {
  if (path.empty()) return false;
#if defined(_WIN32)
  struct _stat info;
  if (_stat(path.c_str(), &info) != 0) return false;
  return (info.st_mode & _S_IFREG) != 0;
#else
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
  return S_ISREG(info.st_mode);
#endif
}

bool IsDirectory(const std::string& path) {
  if (path.empty()) return false;
#if defined(_WIN32)
  struct _stat info;
  if (_stat(path.c_str(), &info) != 0) return false;
  return (info.st_mode & _S_IFDIR) != 0;
#else
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
  return S_ISDIR(info.st_mode);
#endif
}

api::Result<std::string> ReadTextFile(const std::string& path) {
  if (!IsRegularFile(path)) {
    return api::Result<std::string>(JC_STATUS(api::StatusCode::kNotFound,
                                              api::kDetailFileNotFound,
                                              "file not found: " + path));
  }
  errno = 0;
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<std::string>(JC_STATUS(api::StatusCode::kIoError,
                                              api::kDetailFileReadFailed,
                                              "open " + path + " failed: " + ErrnoText()));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return api::Result<std::string>(JC_STATUS(api::StatusCode::kIoError,
                                              api::kDetailFileReadFailed,
                                              "read " + path + " failed: " + ErrnoText()));
  }
  return api::Result<std::string>(buffer.str());
}

api::Status WriteTextFile(const std::string& path, const std::string& content,
                          bool atomic_replace) {
  if (!atomic_replace) return WriteStream(path, content);

#if defined(_WIN32)
  const std::string target = path;
  const std::string temp_path = path + ".tmp";
  api::Status st = WriteStream(temp_path, content);
  if (!st.ok()) {
    std::remove(temp_path.c_str());
    return st;
  }
  // rename() does not replace an existing target on Windows.
  std::remove(target.c_str());
#else
  const std::string target = ResolveTarget(path);
  std::string temp_path;
  api::Status st = WriteTempFile(target, content, &temp_path);
  if (!st.ok()) {
    if (!temp_path.empty()) std::remove(temp_path.c_str());
    return st;
  }
#endif
  errno = 0;
  if (std::rename(temp_path.c_str(), target.c_str()) != 0) {
    const std::string reason = ErrnoText();
    std::remove(temp_path.c_str());
    return JC_STATUS(api::StatusCode::kIoError, api::kDetailFileRenameFailed,
                     "replace " + path + " failed: " + reason);
  }
  return api::Status::Ok();
}

#undef JC_STATUS

}  // namespace file
}  // namespace jsonconfig
