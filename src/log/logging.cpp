#include "jsonconfig/log/logging.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <mutex>

#include "file/file_util.hpp"
#include "jsonconfig/config/reader.hpp"
#include "jsonconfig/json/i_json.hpp"

namespace jsonconfig {
namespace log {

#define JC_STATUS(message)                                                         \
  api::Status::FromModule(api::StatusCode::kInvalidArgument, (message),            \
                          api::ErrorModule::kConfig, api::kDetailConfigInvalidOption)
namespace {

std::mutex& GlobalMutex() {
  static std::mutex m;
  return m;
}

LoggingOptions& GlobalOptions() {
  static LoggingOptions opts;
  return opts;
}

// glog keeps the pointer handed to InitGoogleLogging.
std::string& GlobalAppName() {
  static std::string name;
  return name;
}

bool& GlobalInitialized() {
  static bool initialized = false;
  return initialized;
}

std::string BaseName(const std::string& path) {
  const std::size_t end = path.find_last_not_of("/\\");
  if (end == std::string::npos) return std::string();
  const std::size_t pos = path.find_last_of("/\\", end);
  if (pos == std::string::npos) return path.substr(0, end + 1);
  return path.substr(pos + 1, end - pos);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

api::Status ReadBool(const json::Value& config, const char* key, bool* out) {
  json::Value::const_iterator it = config.find(key);
  if (it == config.end()) return api::Status::Ok();
  if (it->is_boolean()) {
    *out = it->get<bool>();
    return api::Status::Ok();
  }
  if (it->is_number_integer() && (it->get<long long>() == 0 || it->get<long long>() == 1)) {
    *out = it->get<long long>() == 1;
    return api::Status::Ok();
  }
  if (it->is_string()) {
    const std::string v = ToLower(it->get<std::string>());
    if (v == "true" || v == "yes" || v == "on") {
      *out = true;
      return api::Status::Ok();
    }
    if (v == "false" || v == "no" || v == "off") {
      *out = false;
      return api::Status::Ok();
    }
  }
  return JC_STATUS(std::string(key) + " must be a boolean");
}

api::Status ReadInt(const json::Value& config, const char* key, int* out) {
  json::Value::const_iterator it = config.find(key);
  if (it == config.end()) return api::Status::Ok();
  if (!it->is_number_integer()) {
    return JC_STATUS(std::string(key) + " must be an integer");
  }
  const bool fits = it->is_number_unsigned()
                        ? it->get<unsigned long long>() <= static_cast<unsigned long long>(INT_MAX)
                        : it->get<long long>() >= INT_MIN && it->get<long long>() <= INT_MAX;
  if (!fits) {
    return JC_STATUS(std::string(key) + " is out of range");
  }
  *out = static_cast<int>(it->get<long long>());
  return api::Status::Ok();
}

api::Status ReadLevel(const json::Value& config, const char* key, int* out) {
  json::Value::const_iterator it = config.find(key);
  if (it == config.end()) return api::Status::Ok();
  if (it->is_string()) {
    const std::string v = ToLower(it->get<std::string>());
    if (v == "info") {
      *out = google::GLOG_INFO;
    } else if (v == "warning" || v == "warn") {
      *out = google::GLOG_WARNING;
    } else if (v == "error") {
      *out = google::GLOG_ERROR;
    } else if (v == "fatal") {
      *out = google::GLOG_FATAL;
    } else {
      return JC_STATUS(std::string(key) + " has unknown level '" + v + "'");
    }
    return api::Status::Ok();
  }
  int level = *out;
  api::Status st = ReadInt(config, key, &level);
  if (!st.ok()) return st;
  if (level < google::GLOG_INFO || level > google::GLOG_FATAL) {
    return JC_STATUS(std::string(key) + " must be between 0 and 3");
  }
  *out = level;
  return api::Status::Ok();
}

api::Status ApplyOptions(const LoggingOptions& options) {
  if (!options.log_dir.empty() && !file::IsDirectory(options.log_dir)) {
    return JC_STATUS("log_dir does not exist: " + options.log_dir);
  }
  FLAGS_log_dir = options.log_dir;
  FLAGS_logtostderr = options.logtostderr;
  FLAGS_alsologtostderr = options.alsologtostderr;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_log_prefix = options.log_prefix;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  GlobalOptions() = options;
  return api::Status::Ok();
}

}  // namespace

api::Result<LoggingOptions> LoadLoggingOptions(const std::string& source) {
  api::Result<json::Value> loaded = config::ReadConfig(source);
  if (!loaded.ok()) {
    return api::Result<LoggingOptions>(loaded.status());
  }
  const json::Value& root = loaded.value();
  if (!root.is_object()) {
    return api::Result<LoggingOptions>(JC_STATUS("logging config must be a JSON object"));
  }

  LoggingOptions options;
  json::Value::const_iterator dir = root.find("log_dir");
  if (dir != root.end()) {
    if (!dir->is_string()) {
      return api::Result<LoggingOptions>(JC_STATUS("log_dir must be a string"));
    }
    options.log_dir = dir->get<std::string>();
  }

  api::Status st = ReadBool(root, "logtostderr", &options.logtostderr);
  if (st.ok()) st = ReadBool(root, "alsologtostderr", &options.alsologtostderr);
  if (st.ok()) st = ReadBool(root, "colorlogtostderr", &options.colorlogtostderr);
  if (st.ok()) st = ReadBool(root, "log_prefix", &options.log_prefix);
  if (st.ok()) st = ReadLevel(root, "minloglevel", &options.min_log_level);
  if (st.ok()) st = ReadLevel(root, "stderrthreshold", &options.stderr_threshold);
  if (st.ok()) st = ReadInt(root, "verbosity", &options.verbosity);
  if (st.ok()) st = ReadInt(root, "v", &options.verbosity);
  if (!st.ok()) {
    return api::Result<LoggingOptions>(st);
  }
  return api::Result<LoggingOptions>(options);
}

api::Status InitLogging(const std::string& app_name, const LoggingOptions& options) {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (app_name.empty()) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "app_name is empty",
                                   api::ErrorModule::kLog);
  }
  if (!GlobalInitialized()) {
    const std::string base = BaseName(app_name);
    if (!google::IsGoogleLoggingInitialized()) {
      GlobalAppName() = base.empty() ? "jsonconfig" : base;
      google::InitGoogleLogging(GlobalAppName().c_str());
    }
    GlobalInitialized() = true;
  }
  return ApplyOptions(options);
}

LoggingOptions CurrentLoggingOptions() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  return GlobalOptions();
}

void ShutdownLogging() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalInitialized()) return;
  google::ShutdownGoogleLogging();
  GlobalOptions() = LoggingOptions();
  GlobalInitialized() = false;
}

#undef JC_STATUS

}  // namespace log
}  // namespace jsonconfig
