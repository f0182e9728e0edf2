#include "jsonconfig/json/i_json.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include "file/file_util.hpp"

namespace jsonconfig {
namespace json {
namespace {

bool KeyLess(const Value::const_iterator& left, const Value::const_iterator& right) {
  return left.key() < right.key();
}

}  // namespace

api::Result<Value> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Value>(Value::parse(text));
  } catch (const Value::parse_error& ex) {
    std::ostringstream msg;
    msg << "json parse failed at byte " << ex.byte << ": " << ex.what();
    return api::Result<Value>(api::Status::FromModule(api::StatusCode::kParseError, msg.str(),
                                                      api::ErrorModule::kJson,
                                                      api::kDetailJsonParseFailed));
  } catch (const std::exception& ex) {
    return api::Result<Value>(api::Status::FromModule(
        api::StatusCode::kParseError, std::string("json parse failed: ") + ex.what(),
        api::ErrorModule::kJson, api::kDetailJsonParseFailed));
  }
}

api::Result<Value> JsonCodec::LoadFile(const std::string& path) {
  api::Result<std::string> text = file::ReadTextFile(path);
  if (!text.ok()) {
    return api::Result<Value>(text.status());
  }
  return Parse(text.value());
}

api::Status JsonCodec::SaveFile(const std::string& path, const Value& value, int indent) {
  api::Result<std::string> text = Dump(value, indent);
  if (!text.ok()) {
    return text.status();
  }
  return file::WriteTextFile(path, text.value() + "\n", true);
}

api::Result<std::string> JsonCodec::Dump(const Value& value, int indent, bool ensure_ascii) {
  try {
    return api::Result<std::string>(value.dump(indent < 0 ? -1 : indent, ' ', ensure_ascii));
  } catch (const std::exception& ex) {
    return api::Result<std::string>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, std::string("json dump failed: ") + ex.what(),
        api::ErrorModule::kJson, api::kDetailJsonInvalidUtf8));
  }
}

Value JsonCodec::SortKeys(const Value& value) {
  if (value.is_object()) {
    std::vector<Value::const_iterator> members;
    members.reserve(value.size());
    for (Value::const_iterator it = value.cbegin(); it != value.cend(); ++it) {
      members.push_back(it);
    }
    std::sort(members.begin(), members.end(), KeyLess);

    Value sorted = Value::object();
    for (std::size_t i = 0; i < members.size(); ++i) {
      sorted[members[i].key()] = SortKeys(members[i].value());
    }
    return sorted;
  }
  if (value.is_array()) {
    Value sorted = Value::array();
    for (Value::const_iterator it = value.cbegin(); it != value.cend(); ++it) {
      sorted.push_back(SortKeys(*it));
    }
    return sorted;
  }
  return value;
}

}  // namespace json
}  // namespace jsonconfig
