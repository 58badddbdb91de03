#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "tai/tools/args.hpp"
#include "tai/tools/builtin/fetch_url.hpp"
#include "tai/tools/builtin/file_patch.hpp"
#include "tai/tools/builtin/file_read.hpp"
#include "tai/tools/builtin/file_write.hpp"
#include "tai/tools/builtin/list_dir.hpp"
#include "tai/tools/builtin/stat.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace {

using tai::testing::parse_payload;

std::string field(const std::string &payload, const std::string &key) {
  return tai::common::json_field_string(parse_payload(payload), key);
}

std::string raw_field(const std::string &payload, const std::string &key) {
  return parse_payload(payload).at(key);
}

std::size_t array_size(const std::string &payload, const std::string &key) {
  auto items = tai::common::json_parse_array(raw_field(payload, key));
  return items.ok() ? items.value().size() : 0;
}

} // namespace

void register_tools_tests(std::vector<tai::tests::TestCase> &tests) {
  using tai::tests::contains;
  using tai::tests::require;
  namespace common = tai::common;
  namespace testing = tai::testing;
  namespace tools = tai::tools;

  tests.push_back({"args_null_counts_as_absent", [] {
                     const auto args = parse_payload(R"({"limit":null,"flag":"true","n":"12"})");
                     require(!tools::has_arg(args, "limit"), "null should be absent");
                     auto limit = tools::u64_or(args, "limit", 7);
                     require(limit.ok() && limit.value() == 7, "fallback expected");
                     auto flag = tools::bool_or(args, "flag", false);
                     require(flag.ok() && flag.value(), "string boolean should parse");
                     auto n = tools::u64_or(args, "n", 0);
                     require(n.ok() && n.value() == 12, "digit string should parse");
                   }});

  tests.push_back({"args_wrong_type_names_key", [] {
                     const auto args = parse_payload(R"({"limit":"many","path":3})");
                     auto limit = tools::u64_or(args, "limit", 0);
                     require(!limit.ok(), "non-numeric limit should fail");
                     require(limit.kind() == common::ErrorKind::Validation, "kind mismatch");
                     require(contains(limit.error(), "limit"), "error should name the key");
                     auto path = tools::required_string(args, "path");
                     require(!path.ok() && contains(path.error(), "path"),
                             "number for string should fail");
                   }});

  tests.push_back({"tool_spec_schema_lists_required", [] {
                     testing::TempWorkspace ws;
                     tools::FileReadTool tool(ws.sandbox());
                     const auto spec = tool.spec();
                     require(spec.name == "read_file", "name mismatch");
                     require(spec.group == "fs", "group mismatch");
                     const auto schema = spec.parameters_json();
                     require(contains(schema, R"("required":["path"])"), "required list missing");
                     require(contains(schema, R"("offset":{"type":"integer")"),
                             "offset schema missing");
                   }});

  tests.push_back({"read_file_slices_lines", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("notes.txt", "one\ntwo\r\nthree\n");
                     tools::FileReadTool tool(ws.sandbox());
                     auto result = tool.execute(parse_payload(R"({"path":"notes.txt","offset":1,"limit":5})"));
                     require(result.ok(), result.error());
                     const auto &payload = result.value();
                     require(raw_field(payload, "start") == "1", "start mismatch");
                     require(raw_field(payload, "end") == "3", "end should clamp to total");
                     require(raw_field(payload, "total_lines") == "3", "total mismatch");
                     require(field(payload, "content") == "two\nthree", "content mismatch");
                   }});

  tests.push_back({"read_file_latin1_payload_stays_valid_json", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("latin1.txt", "caf\xe9\n");
                     tools::FileReadTool tool(ws.sandbox());
                     auto result = tool.execute(parse_payload(R"({"path":"latin1.txt"})"));
                     require(result.ok(), result.error());
                     require(field(result.value(), "content") == "caf\xEF\xBF\xBD",
                             "invalid byte should become U+FFFD");
                   }});

  tests.push_back({"read_file_offset_past_end_is_empty", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("a.txt", "x\n");
                     tools::FileReadTool tool(ws.sandbox());
                     auto result = tool.execute(parse_payload(R"({"path":"a.txt","offset":10})"));
                     require(result.ok(), result.error());
                     require(raw_field(result.value(), "start") == "1", "start should clamp");
                     require(field(result.value(), "content").empty(), "content should be empty");
                   }});

  tests.push_back({"read_file_rejects_binary_and_escape", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("blob.bin", std::string("a\0b", 3));
                     tools::FileReadTool tool(ws.sandbox());
                     auto binary = tool.execute(parse_payload(R"({"path":"blob.bin"})"));
                     require(!binary.ok() && contains(binary.error(), "Binary"),
                             "binary read should fail");
                     auto escape = tool.execute(parse_payload(R"({"path":"../outside.txt"})"));
                     require(!escape.ok(), "escape should fail");
                     require(escape.kind() == common::ErrorKind::PathEscape, "kind mismatch");
                   }});

  tests.push_back({"write_file_creates_parents", [] {
                     testing::TempWorkspace ws;
                     tools::FileWriteTool tool(ws.sandbox());
                     auto result = tool.execute(
                         parse_payload(R"({"path":"deep/er/out.txt","content":"héllo"})"));
                     require(result.ok(), result.error());
                     require(ws.read_file("deep/er/out.txt") == "héllo", "content mismatch");
                     require(raw_field(result.value(), "bytes") == "6", "byte count mismatch");
                   }});

  tests.push_back({"write_file_without_parents_fails", [] {
                     testing::TempWorkspace ws;
                     tools::FileWriteTool tool(ws.sandbox());
                     auto result = tool.execute(parse_payload(
                         R"({"path":"missing/out.txt","content":"x","create_parents":false})"));
                     require(!result.ok(), "missing parent should fail");
                     require(!std::filesystem::exists(ws.path() / "missing"),
                             "directory must not be created");
                   }});

  tests.push_back({"write_file_rejects_directory_target", [] {
                     testing::TempWorkspace ws;
                     ws.create_dir("folder");
                     tools::FileWriteTool tool(ws.sandbox());
                     auto result =
                         tool.execute(parse_payload(R"({"path":"folder","content":"x"})"));
                     require(!result.ok() && contains(result.error(), "directory"),
                             "directory target should fail");
                   }});

  tests.push_back({"write_file_direct_mode", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("a.txt", "old content");
                     tools::FileWriteTool tool(ws.sandbox());
                     auto result = tool.execute(
                         parse_payload(R"({"path":"a.txt","content":"new","atomic":false})"));
                     require(result.ok(), result.error());
                     require(ws.read_file("a.txt") == "new", "file not truncated");
                   }});

  tests.push_back({"patch_file_applies_in_order", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("code.txt", "foo bar foo baz foo");
                     tools::FilePatchTool tool(ws.sandbox());
                     auto result = tool.execute(parse_payload(R"({"path":"code.txt","replacements":[
                         {"old_string":"foo","new_string":"qux","replace_all":true},
                         {"old_string":"bar","new_string":"BAR"},
                         {"old_string":"missing","new_string":"x"}]})"));
                     require(result.ok(), result.error());
                     require(ws.read_file("code.txt") == "qux BAR qux baz qux", "content mismatch");
                     require(raw_field(result.value(), "replacements") == "[3,1,0]",
                             "per-replacement counts mismatch");
                     require(raw_field(result.value(), "total_replacements") == "4",
                             "total mismatch");
                     require(raw_field(result.value(), "changed") == "true", "changed mismatch");
                   }});

  tests.push_back({"patch_file_without_match_leaves_file", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("a.txt", "abc");
                     tools::FilePatchTool tool(ws.sandbox());
                     auto result = tool.execute(parse_payload(
                         R"({"path":"a.txt","replacements":[{"old_string":"zzz","new_string":"y"}]})"));
                     require(result.ok(), result.error());
                     require(raw_field(result.value(), "changed") == "false", "should be unchanged");
                     require(ws.read_file("a.txt") == "abc", "file modified");
                   }});

  tests.push_back({"patch_file_validates_before_writing", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("a.txt", "abc");
                     tools::FilePatchTool tool(ws.sandbox());
                     auto empty_old = tool.execute(parse_payload(R"({"path":"a.txt","replacements":[
                         {"old_string":"a","new_string":"b"},{"old_string":"","new_string":"x"}]})"));
                     require(!empty_old.ok(), "empty old_string should fail");
                     require(empty_old.kind() == common::ErrorKind::Validation, "kind mismatch");
                     require(contains(empty_old.error(), "replacement 1"), "index missing");
                     require(ws.read_file("a.txt") == "abc", "file must stay untouched");

                     auto not_array = tool.execute(
                         parse_payload(R"({"path":"a.txt","replacements":"nope"})"));
                     require(!not_array.ok() && not_array.kind() == common::ErrorKind::Parse,
                             "non-array should be a parse error");
                   }});

  tests.push_back({"list_dir_sorted_and_hides_dotfiles", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("b.txt", "b");
                     ws.create_file("a.txt", "a");
                     ws.create_file(".hidden", "h");
                     ws.create_dir("sub");
                     tools::ListDirTool tool(ws.sandbox(), 1000);
                     auto result = tool.execute(parse_payload("{}"));
                     require(result.ok(), result.error());
                     require(raw_field(result.value(), "count") == "3", "count mismatch");
                     auto items = common::json_parse_array(raw_field(result.value(), "items"));
                     require(items.ok(), items.error());
                     require(contains(common::json_field_string(parse_payload(items.value()[0]), "path"),
                                      "a.txt"),
                             "first item should be a.txt");
                     require(common::json_field_string(parse_payload(items.value()[2]), "type") ==
                                 "dir",
                             "sub should be a dir");
                   }});

  tests.push_back({"list_dir_recursive_with_filters", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("src/main.cpp", "");
                     ws.create_file("src/util.hpp", "");
                     ws.create_file("build/out.o", "");
                     ws.create_file(".git/config", "");
                     tools::ListDirTool tool(ws.sandbox(), 1000);
                     auto result = tool.execute(parse_payload(
                         R"({"recursive":true,"include_globs":["*.cpp"],"exclude_globs":["build"]})"));
                     require(result.ok(), result.error());
                     require(raw_field(result.value(), "count") == "1", "only main.cpp expected");
                     require(contains(raw_field(result.value(), "items"), "main.cpp"),
                             "main.cpp missing");
                   }});

  tests.push_back({"list_dir_honours_limit", [] {
                     testing::TempWorkspace ws;
                     for (int i = 0; i < 5; ++i) {
                       ws.create_file("f" + std::to_string(i) + ".txt", "");
                     }
                     tools::ListDirTool tool(ws.sandbox(), 1000);
                     auto result = tool.execute(parse_payload(R"({"limit":2})"));
                     require(result.ok(), result.error());
                     require(array_size(result.value(), "items") == 2, "limit not applied");
                   }});

  tests.push_back({"stat_reports_entry", [] {
                     testing::TempWorkspace ws;
                     ws.create_file("a.txt", "12345");
                     tools::StatTool tool(ws.sandbox());
                     auto result = tool.execute(parse_payload(R"({"path":"a.txt"})"));
                     require(result.ok(), result.error());
                     const auto fields = parse_payload(result.value());
                     require(common::json_field_string(fields, "type") == "file", "type mismatch");
                     require(fields.at("size") == "5", "size mismatch");
                     const auto modified = common::json_field_string(fields, "modified");
                     require(modified.size() == 20 && modified.back() == 'Z',
                             "modified should be RFC 3339 UTC");
                     require(common::json_field_string(fields, "mode").size() >= 6,
                             "octal mode expected");
                   }});

  tests.push_back({"fetch_url_returns_status_headers_text", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     common::HttpResponse response;
                     response.status = 200;
                     response.body = "hello world";
                     response.headers = {{"content-type", "text/plain"}, {"a-first", "1"}};
                     response.final_url = "https://example.com/final";
                     http->push_response(response);
                     tools::FetchUrlTool tool(http, 10, 200000);
                     auto result = tool.execute(parse_payload(
                         R"({"url":"https://example.com","method":"post","headers":{"X-Test":"1"},"body":"b"})"));
                     require(result.ok(), result.error());
                     require(http->requests().size() == 1, "one request expected");
                     require(http->requests()[0].method == "POST", "method not upper-cased");
                     require(http->requests()[0].body == "b", "body not forwarded");
                     require(raw_field(result.value(), "status") == "200", "status mismatch");
                     require(field(result.value(), "final_url") == "https://example.com/final",
                             "final url mismatch");
                     require(field(result.value(), "text") == "hello world", "text mismatch");
                     require(raw_field(result.value(), "headers") ==
                                 R"({"a-first":"1","content-type":"text/plain"})",
                             "headers should be sorted");
                   }});

  tests.push_back({"fetch_url_truncates_at_max_bytes", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     http->push_json(200, "0123456789");
                     tools::FetchUrlTool tool(http, 10, 200000);
                     auto result = tool.execute(
                         parse_payload(R"({"url":"http://example.com","max_bytes":4})"));
                     require(result.ok(), result.error());
                     require(http->requests()[0].max_body_bytes == 4, "cap not forwarded");
                     require(field(result.value(), "text") == "0123", "text not truncated");
                     require(raw_field(result.value(), "truncated") == "true",
                             "truncation not flagged");
                   }});

  tests.push_back({"fetch_url_rejects_scheme_and_method", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     tools::FetchUrlTool tool(http, 10, 200000);
                     auto scheme = tool.execute(parse_payload(R"({"url":"file:///etc/passwd"})"));
                     require(!scheme.ok() && scheme.kind() == common::ErrorKind::Validation,
                             "file scheme should fail");
                     auto method = tool.execute(
                         parse_payload(R"({"url":"http://example.com","method":"TRACE"})"));
                     require(!method.ok() && contains(method.error(), "Unsupported method"),
                             "TRACE should fail");
                     require(http->requests().empty(), "no request should be sent");
                   }});

  tests.push_back({"fetch_url_scheme_is_case_insensitive", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     tools::FetchUrlTool tool(http, 10, 200000);
                     auto result = tool.execute(parse_payload(R"({"url":"HTTPS://Example.com/x"})"));
                     require(result.ok(), result.error());
                     require(http->requests().size() == 1 &&
                                 http->requests()[0].url == "HTTPS://Example.com/x",
                             "request not sent");
                     auto bare = tool.execute(parse_payload(R"({"url":"example.com"})"));
                     require(!bare.ok() && bare.kind() == common::ErrorKind::Validation,
                             "missing scheme should fail");
                   }});

  tests.push_back({"fetch_url_rejects_zero_limits", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     tools::FetchUrlTool tool(http, 10, 200000);
                     for (const char *args :
                          {R"({"url":"http://example.com","timeout_sec":0})",
                           R"({"url":"http://example.com","max_bytes":0})",
                           R"({"url":"http://example.com","timeout_sec":18446744073709551615})"}) {
                       auto result = tool.execute(parse_payload(args));
                       require(!result.ok() && result.kind() == common::ErrorKind::Validation,
                               std::string("should be rejected: ") + args);
                     }
                     require(http->requests().empty(), "no request should be sent");
                     auto ok = tool.execute(
                         parse_payload(R"({"url":"http://example.com","timeout_sec":5})"));
                     require(ok.ok(), ok.error());
                     require(http->requests()[0].timeout_ms == 5000, "timeout not forwarded");
                   }});

  tests.push_back({"fetch_url_maps_transport_failures", [] {
                     auto http = std::make_shared<testing::FakeHttpClient>();
                     common::HttpResponse timeout;
                     timeout.timeout = true;
                     http->push_response(timeout);
                     common::HttpResponse down;
                     down.network_error = true;
                     down.network_error_message = "Could not resolve host";
                     http->push_response(down);
                     tools::FetchUrlTool tool(http, 10, 200000);
                     auto first = tool.execute(parse_payload(R"({"url":"http://slow.test"})"));
                     require(!first.ok() && first.kind() == common::ErrorKind::Timeout,
                             "timeout kind expected");
                     auto second = tool.execute(parse_payload(R"({"url":"http://down.test"})"));
                     require(!second.ok() && second.kind() == common::ErrorKind::Network,
                             "network kind expected");
                     require(contains(second.error(), "Could not resolve host"),
                             "transport message missing");
                   }});
}
