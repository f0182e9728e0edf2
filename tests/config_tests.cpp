#include "jsonconfig/jsonconfig.hpp"

#include <cstdint>
#include <string>

#include "tests/test_util.hpp"

namespace {

using jsonconfig::api::Result;
using jsonconfig::api::Status;
using jsonconfig::api::StatusCode;
using jsonconfig::config::ReadConfig;
using jsonconfig::config::ReadOptions;
using jsonconfig::config::WriteConfig;
using jsonconfig::config::WriteOptions;
using jsonconfig::json::JsonCodec;
using jsonconfig::json::Value;
using testutil::JoinPath;

// Written files are key-sorted, so compare independent of member order.
bool SameDocument(const Value& left, const Value& right) {
  return JsonCodec::SortKeys(left) == JsonCodec::SortKeys(right);
}

bool RoundTrip(const Value& data) {
  const std::string dir = testutil::MakeTestDir("roundtrip");
  const std::string path = JoinPath(dir, "test.json");
  bool ok = WriteConfig(path, data).ok();
  if (ok) {
    Result<Value> read = ReadConfig(path);
    ok = read.ok() && SameDocument(read.value(), data);
  }
  testutil::RemoveTree(dir);
  return ok;
}

bool TestWriteAndReadFile() {
  const Value data = {{"foo", 123}, {"bar", {1, 2, 3}}, {"baz", {{"nested", true}}}};
  return RoundTrip(data);
}

bool TestWriteThenReadFileContentAsString() {
  const std::string dir = testutil::MakeTestDir("as_string");
  const std::string path = JoinPath(dir, "test.json");
  const Value data = {1, 2, 3, {{"a", "b"}}};
  bool ok = WriteConfig(path, data).ok();
  if (ok) {
    const std::string text = testutil::ReadTextFile(path);
    Result<Value> read = ReadConfig(text);
    ok = read.ok() && read.value() == data;
  }
  testutil::RemoveTree(dir);
  return ok;
}

bool TestReadMalformedFails() {
  Result<Value> r = ReadConfig("{\"foo\": 123, \"bar\": [1, 2, 3]");
  if (r.ok() || r.status().code() != StatusCode::kParseError) return false;
  const jsonconfig::api::ErrorCatalogEntry* entry =
      jsonconfig::api::FindErrorCatalogEntry(r.status().hex_code());
  return entry != NULL && std::string(entry->symbol) == "JSON_PARSE_FAILED";
}

bool TestReadAcceptsAllTopLevelTypes() {
  const char* cases[] = {"\"a string\"", "123", "3.14", "true", "false", "null",
                         "[1, 2, 3]", "{\"a\": 1}"};
  for (std::size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
    if (!ReadConfig(cases[i]).ok()) return false;
  }
  Result<Value> coerced = ReadConfig("\"42\"");
  return coerced.ok() && coerced.value() == 42;
}

bool TestCommentsAndControlCharactersRemoved() {
  Result<Value> with_comments = ReadConfig(
      "\n        // This is a comment\n"
      "        {\"foo\": 1, \"bar\": 2} // another comment\n        ");
  const Value foo_bar = {{"foo", 1}, {"bar", 2}};
  if (!with_comments.ok() || !SameDocument(with_comments.value(), foo_bar)) return false;

  Result<Value> with_ctrl = ReadConfig("{\"foo\": \"bar\x01\x02\"}");
  const Value stripped = {{"foo", "bar"}};
  if (!with_ctrl.ok() || with_ctrl.value() != stripped) return false;

  Result<Value> short_form = ReadConfig("// c\n{\"a\":1} // c2");
  const Value a_one = {{"a", 1}};
  return short_form.ok() && short_form.value() == a_one;
}

bool TestNumericStringsAreCoercedOnRead() {
  Result<Value> r = ReadConfig("{\"i\": \"42\", \"f\": \"3.14\", \"s\": \"abc\", \"n\": [\"-7\"]}");
  if (!r.ok()) return false;
  const Value& v = r.value();
  if (!v["i"].is_number_integer() || v["i"] != 42) return false;
  if (!v["f"].is_number_float() || v["f"] != 3.14) return false;
  if (v["s"] != "abc" || v["n"][0] != -7) return false;

  ReadOptions raw;
  raw.coerce_numbers = false;
  Result<Value> kept = ReadConfig("{\"i\": \"42\"}", raw);
  return kept.ok() && kept.value()["i"] == "42";
}

bool TestWriteRejectsNonContainerValues() {
  const std::string dir = testutil::MakeTestDir("invalid_type");
  const std::string path = JoinPath(dir, "test.json");
  const Value bad[] = {Value(42), Value(true), Value(nullptr), Value(2.5)};
  bool ok = true;
  for (std::size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
    Status st = WriteConfig(path, bad[i]);
    if (st.code() != StatusCode::kInvalidArgument) ok = false;
  }
  if (testutil::PathExists(path)) ok = false;

  const jsonconfig::api::ErrorCatalogEntry* entry =
      jsonconfig::api::FindErrorCatalogEntry(WriteConfig(path, Value(1)).hex_code());
  if (entry == NULL || std::string(entry->symbol) != "CONFIG_INVALID_SOURCE") ok = false;
  testutil::RemoveTree(dir);
  return ok;
}

bool TestWriteRejectsNegativeIndent() {
  const std::string dir = testutil::MakeTestDir("negative_indent");
  const std::string path = JoinPath(dir, "test.json");
  Status st = WriteConfig(path, Value::object(), -1);
  const bool ok = st.code() == StatusCode::kInvalidArgument && !testutil::PathExists(path);
  testutil::RemoveTree(dir);
  return ok;
}

bool TestRoundTripNestedStructures() {
  const Value data = {{"a", {1, {{"b", {2, 3, {{"c", "d"}}}}}}}};
  return RoundTrip(data);
}

bool TestEmptyStructures() { return RoundTrip(Value::object()) && RoundTrip(Value::array()); }

bool TestUnicodeAndSpecialCharacters() {
  const Value data = {{"emoji", "\xF0\x9F\x98\x80"},
                      {"accented", "caf\xC3\xA9"},
                      {"newline", "line1\nline2"},
                      {"tab", "a\tb"}};
  return RoundTrip(data);
}

bool TestPrettyPrintedSortedOutput() {
  const std::string dir = testutil::MakeTestDir("pretty");
  const std::string path = JoinPath(dir, "test.json");
  const Value data = {{"b", 1}, {"a", {1, 2}}, {"c", Value::object()}};
  bool ok = WriteConfig(path, data).ok();
  const std::string expected =
      "{\n"
      "  \"a\": [\n"
      "    1,\n"
      "    2\n"
      "  ],\n"
      "  \"b\": 1,\n"
      "  \"c\": {}\n"
      "}\n";
  ok = ok && testutil::ReadTextFile(path) == expected;
  ok = ok && testutil::ListDirectory(dir).size() == 1;
  testutil::RemoveTree(dir);
  return ok;
}

bool TestUnsortedKeepsSourceOrder() {
  const std::string dir = testutil::MakeTestDir("unsorted");
  const std::string path = JoinPath(dir, "test.json");
  bool ok = WriteConfig(path, "{\"b\": 1, \"a\": {\"z\": 0, \"y\": 0}}", 4, false).ok();
  const std::string expected =
      "{\n"
      "    \"b\": 1,\n"
      "    \"a\": {\n"
      "        \"z\": 0,\n"
      "        \"y\": 0\n"
      "    }\n"
      "}\n";
  ok = ok && testutil::ReadTextFile(path) == expected;
  testutil::RemoveTree(dir);
  return ok;
}

bool TestEnsureAsciiEscapesByDefault() {
  const std::string dir = testutil::MakeTestDir("ascii");
  const std::string path = JoinPath(dir, "test.json");
  const Value data = {{"k", "caf\xC3\xA9"}};

  bool ok = WriteConfig(path, data).ok() &&
            testutil::ReadTextFile(path).find("caf\\u00e9") != std::string::npos;

  WriteOptions raw;
  raw.ensure_ascii = false;
  ok = ok && WriteConfig(path, data, raw).ok() &&
       testutil::ReadTextFile(path).find("caf\xC3\xA9") != std::string::npos;
  testutil::RemoveTree(dir);
  return ok;
}

bool TestStringSourceWithCommentsIsNormalized() {
  const std::string dir = testutil::MakeTestDir("string_source");
  const std::string path = JoinPath(dir, "test.json");
  bool ok = WriteConfig(path, "# generated\n// header\n{\"a\": \"1\"} // trailing").ok();
  ok = ok && testutil::ReadTextFile(path) == "{\n  \"a\": \"1\"\n}\n";

  // A string Value is JSON text too.
  ok = ok && WriteConfig(path, Value("[1, 2]")).ok() &&
       testutil::ReadTextFile(path) == "[\n  1,\n  2\n]\n";
  testutil::RemoveTree(dir);
  return ok;
}

bool TestFailedWriteKeepsExistingFile() {
  const std::string dir = testutil::MakeTestDir("keep_existing");
  const std::string path = JoinPath(dir, "test.json");
  const std::string original = "{\"keep\": true}";
  bool ok = testutil::WriteTextFile(path, original);

  Status st = WriteConfig(path, "{\"broken\": ");
  ok = ok && st.code() == StatusCode::kParseError;
  st = WriteConfig(path, Value(false));
  ok = ok && st.code() == StatusCode::kInvalidArgument;
  ok = ok && testutil::ReadTextFile(path) == original && testutil::ListDirectory(dir).size() == 1;
  testutil::RemoveTree(dir);
  return ok;
}

bool TestWriteOverwritesExistingFile() {
  const std::string dir = testutil::MakeTestDir("overwrite");
  const std::string path = JoinPath(dir, "test.json");
  bool ok = testutil::WriteTextFile(path, "{\"old\": \"a much longer previous body\"}");
  const Value fresh = {{"new", 1}};
  ok = ok && WriteConfig(path, fresh).ok();
  ok = ok && testutil::ReadTextFile(path) == "{\n  \"new\": 1\n}\n";

  WriteOptions in_place;
  in_place.atomic_replace = false;
  const Value replaced = {{"x", 2}};
  ok = ok && WriteConfig(path, replaced, in_place).ok();
  ok = ok && testutil::ReadTextFile(path) == "{\n  \"x\": 2\n}\n";
  testutil::RemoveTree(dir);
  return ok;
}

bool TestUnwritablePathIsIoError() {
  const std::string dir = testutil::MakeTestDir("unwritable");
  const std::string path = JoinPath(JoinPath(dir, "missing"), "test.json");
  Status st = WriteConfig(path, Value::object());
  const bool ok = st.code() == StatusCode::kIoError && !testutil::PathExists(path);
  testutil::RemoveTree(dir);
  return ok;
}

bool TestWriteThroughSymlinkKeepsLinkAndMode() {
#if defined(_WIN32)
  return true;
#else
  const std::string dir = testutil::MakeTestDir("symlink");
  const std::string real = JoinPath(dir, "real.json");
  const std::string link = JoinPath(dir, "link.json");
  bool ok = testutil::WriteTextFile(real, "{}") && chmod(real.c_str(), 0600) == 0 &&
            symlink("real.json", link.c_str()) == 0;

  const Value data = {{"new", 1}};
  ok = ok && WriteConfig(link, data).ok();

  struct stat info;
  ok = ok && lstat(link.c_str(), &info) == 0 && S_ISLNK(info.st_mode);
  ok = ok && stat(real.c_str(), &info) == 0 && (info.st_mode & 07777) == 0600;
  ok = ok && testutil::ReadTextFile(real) == "{\n  \"new\": 1\n}\n";
  ok = ok && testutil::ListDirectory(dir).size() == 2;

  // A dangling link creates the file it names.
  const std::string dangling = JoinPath(dir, "dangling.json");
  ok = ok && symlink("created.json", dangling.c_str()) == 0;
  ok = ok && WriteConfig(dangling, data).ok();
  ok = ok && lstat(dangling.c_str(), &info) == 0 && S_ISLNK(info.st_mode);
  ok = ok && testutil::ReadTextFile(JoinPath(dir, "created.json")) == "{\n  \"new\": 1\n}\n";
  testutil::RemoveTree(dir);
  return ok;
#endif
}

bool TestWriteLeavesNeighbouringTmpFileAlone() {
  const std::string dir = testutil::MakeTestDir("neighbour_tmp");
  const std::string path = JoinPath(dir, "test.json");
  const std::string user_file = path + ".tmp";
  bool ok = testutil::WriteTextFile(user_file, "user data");
  const Value data = {{"a", 1}};
  ok = ok && WriteConfig(path, data).ok();
  ok = ok && testutil::ReadTextFile(user_file) == "user data";
  ok = ok && testutil::ReadTextFile(path) == "{\n  \"a\": 1\n}\n";
  testutil::RemoveTree(dir);
  return ok;
}

bool TestWriteIsIdempotent() {
  const std::string dir = testutil::MakeTestDir("idempotent");
  const std::string first = JoinPath(dir, "first.json");
  const std::string second = JoinPath(dir, "second.json");
  const Value data = {{"name", "svc"}, {"ports", {80, 443}}, {"ratio", 0.5}, {"on", false}};

  bool ok = WriteConfig(first, data).ok();
  const std::string first_text = testutil::ReadTextFile(first);
  ok = ok && WriteConfig(second, first_text).ok();
  ok = ok && testutil::ReadTextFile(second) == first_text;

  Result<Value> a = ReadConfig(first);
  Result<Value> b = ReadConfig(second);
  ok = ok && a.ok() && b.ok() && a.value() == b.value() && SameDocument(a.value(), data);
  testutil::RemoveTree(dir);
  return ok;
}

bool TestSlashesInStructuredStrings() {
  const std::string dir = testutil::MakeTestDir("slashes");
  const std::string path = JoinPath(dir, "test.json");
  const Value data = {{"url", "http://example.com"}};

  // Line based comment stripping cuts the value short.
  bool ok = WriteConfig(path, data).code() == StatusCode::kParseError;
  ok = ok && !testutil::PathExists(path);

  WriteOptions write_options;
  write_options.sanitize.string_aware = true;
  ReadOptions read_options;
  read_options.sanitize.string_aware = true;
  ok = ok && WriteConfig(path, data, write_options).ok();
  Result<Value> read = ReadConfig(path, read_options);
  ok = ok && read.ok() && read.value() == data;
  testutil::RemoveTree(dir);
  return ok;
}

bool TestReadConfigFileAndString() {
  Result<Value> missing = jsonconfig::config::ReadConfigFile("/nonexistent/jsonconfig.json");
  if (missing.ok() || missing.status().code() != StatusCode::kNotFound) return false;

  // Not a file, so the path itself is parsed as JSON text.
  Result<Value> as_text = ReadConfig("/nonexistent/jsonconfig.json");
  if (as_text.ok() || as_text.status().code() != StatusCode::kParseError) return false;

  const std::string dir = testutil::MakeTestDir("file_and_string");
  Result<Value> directory = ReadConfig(dir);
  testutil::RemoveTree(dir);
  if (directory.ok() || directory.status().code() != StatusCode::kParseError) return false;

  Result<Value> text = jsonconfig::config::ReadConfigString("[\"1\"]");
  return text.ok() && text.value()[0] == 1;
}

bool TestReaderAndWriterLogThroughInjectedLogger() {
  const std::string dir = testutil::MakeTestDir("logger");
  const std::string path = JoinPath(dir, "test.json");
  testutil::RecordingLogger logger;

  WriteOptions write_options;
  write_options.logger = &logger;
  ReadOptions read_options;
  read_options.logger = &logger;

  const Value data = {{"a", 1}};
  bool ok = WriteConfig(path, data, write_options).ok();
  ok = ok && ReadConfig(path, read_options).ok();
  ok = ok && !ReadConfig("{oops", read_options).ok();
  testutil::RemoveTree(dir);

  using jsonconfig::log::LogSeverity;
  return ok && logger.Contains(LogSeverity::kDebug, "Writing JSON file " + path) &&
         logger.Contains(LogSeverity::kDebug, "Reading JSON file " + path) &&
         logger.Contains(LogSeverity::kDebug, "Parsing JSON string") &&
         logger.Contains(LogSeverity::kWarning, "kParseError");
}

bool TestCodecLoadAndSave() {
  const std::string dir = testutil::MakeTestDir("codec");
  const std::string path = JoinPath(dir, "codec.json");
  const Value data = {{"b", "2"}, {"a", 1}};

  bool ok = JsonCodec::SaveFile(path, data, 0).ok();
  ok = ok && testutil::ReadTextFile(path) == "{\n\"b\": \"2\",\n\"a\": 1\n}\n";

  Result<Value> loaded = JsonCodec::LoadFile(path);
  // The codec itself never coerces.
  ok = ok && loaded.ok() && loaded.value() == data && loaded.value()["b"] == "2";

  Result<Value> missing = JsonCodec::LoadFile(JoinPath(dir, "missing.json"));
  ok = ok && missing.status().code() == StatusCode::kNotFound;

  ok = ok && testutil::WriteTextFile(path, "// comment\n{}");
  ok = ok && JsonCodec::LoadFile(path).status().code() == StatusCode::kParseError;
  testutil::RemoveTree(dir);

  Result<std::string> compact = JsonCodec::Dump(data, -1);
  ok = ok && compact.ok() && compact.value() == "{\"b\":\"2\",\"a\":1}";
  Result<std::string> bad_utf8 = JsonCodec::Dump(Value("\xFF"), 2);
  return ok && bad_utf8.status().code() == StatusCode::kInvalidArgument;
}

bool TestStatusFormatting() {
  const Status st = Status::FromModule(StatusCode::kIoError, "disk full",
                                       jsonconfig::api::ErrorModule::kFile,
                                       jsonconfig::api::kDetailFileWriteFailed);
  return st.hex_code_string() == "0x20400002" &&
         st.ToString() == "kIoError(0x20400002): disk full" && Status::Ok().ok() &&
         std::string(jsonconfig::api::ErrorModuleName(jsonconfig::api::ErrorModule::kConfig)) ==
             "config" &&
         std::string(jsonconfig::api::StatusCodeName(StatusCode::kIoError)) == "kIoError";
}

bool TestCoreCatalogCoversEveryStatusCode() {
  const StatusCode codes[] = {StatusCode::kOk, StatusCode::kInvalidArgument,
                              StatusCode::kParseError, StatusCode::kNotFound,
                              StatusCode::kIoError};
  for (std::size_t i = 0; i < sizeof(codes) / sizeof(codes[0]); ++i) {
    const std::uint32_t hex =
        jsonconfig::api::MakeErrorCode(jsonconfig::api::ErrorModule::kCore, codes[i]);
    if (jsonconfig::api::FindErrorCatalogEntry(hex) == NULL) return false;
    if (std::string(jsonconfig::api::StatusCodeName(codes[i])) == "kUnknown") return false;
  }
  // A failed Result carries no value.
  const Result<int> failed(Status(StatusCode::kNotFound, "gone"));
  return !failed.ok() && failed.value() == 0;
}

}  // namespace

int main() {
  const testutil::TestCase tests[] = {
      {"write_and_read_file", TestWriteAndReadFile},
      {"write_then_read_file_content_as_string", TestWriteThenReadFileContentAsString},
      {"read_malformed_fails", TestReadMalformedFails},
      {"read_accepts_all_top_level_types", TestReadAcceptsAllTopLevelTypes},
      {"comments_and_control_characters_removed", TestCommentsAndControlCharactersRemoved},
      {"numeric_strings_are_coerced_on_read", TestNumericStringsAreCoercedOnRead},
      {"write_rejects_non_container_values", TestWriteRejectsNonContainerValues},
      {"write_rejects_negative_indent", TestWriteRejectsNegativeIndent},
      {"round_trip_nested_structures", TestRoundTripNestedStructures},
      {"empty_structures", TestEmptyStructures},
      {"unicode_and_special_characters", TestUnicodeAndSpecialCharacters},
      {"pretty_printed_sorted_output", TestPrettyPrintedSortedOutput},
      {"unsorted_keeps_source_order", TestUnsortedKeepsSourceOrder},
      {"ensure_ascii_escapes_by_default", TestEnsureAsciiEscapesByDefault},
      {"string_source_with_comments_is_normalized", TestStringSourceWithCommentsIsNormalized},
      {"failed_write_keeps_existing_file", TestFailedWriteKeepsExistingFile},
      {"write_overwrites_existing_file", TestWriteOverwritesExistingFile},
      {"unwritable_path_is_io_error", TestUnwritablePathIsIoError},
      {"write_through_symlink_keeps_link_and_mode", TestWriteThroughSymlinkKeepsLinkAndMode},
      {"write_leaves_neighbouring_tmp_file_alone", TestWriteLeavesNeighbouringTmpFileAlone},
      {"write_is_idempotent", TestWriteIsIdempotent},
      {"slashes_in_structured_strings", TestSlashesInStructuredStrings},
      {"read_config_file_and_string", TestReadConfigFileAndString},
      {"reader_and_writer_log_through_injected_logger",
       TestReaderAndWriterLogThroughInjectedLogger},
      {"codec_load_and_save", TestCodecLoadAndSave},
      {"status_formatting", TestStatusFormatting},
      {"core_catalog_covers_every_status_code", TestCoreCatalogCoversEveryStatusCode},
  };
  return testutil::RunTests(tests, sizeof(tests) / sizeof(tests[0]));
}
