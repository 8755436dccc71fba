#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/lanlink_test_toml_") + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(!tr.load("/tmp/lanlink_test_toml_nonexistent_file.toml"));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "[network]\n"
    "auto_discovery = true\n"
    "port = 9090\n"
    "\n"
    "[hotspot]\n"
    "ssid = \"office-ap\"\n"
    "max_clients = 4\n"
  );
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("network", "auto_discovery", false), true);
  ASSERT_EQ(tr.get_int("network", "port"), 9090);
  ASSERT_EQ(tr.get_string("hotspot", "ssid"), "office-ap");
  ASSERT_EQ(tr.get_int("hotspot", "max_clients"), 4);
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  auto path = tmp_path("defaults");
  write_file(path, "[network]\nqr_code = true\n");
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("network", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("network", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("network", "missing_bool", true), true);
  // Missing section entirely
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
  remove_file(path);
}

TEST(toml_has) {
  auto path = tmp_path("has");
  write_file(path, "[hotspot]\ntimeout_s = 600\n");
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_TRUE(tr.has("hotspot", "timeout_s"));
  ASSERT_TRUE(!tr.has("hotspot", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "timeout_s"));
  remove_file(path);
}

TEST(toml_bool_variants) {
  auto path = tmp_path("bool");
  write_file(path,
    "[b]\n"
    "a = true\n"
    "b = True\n"
    "c = TRUE\n"
    "d = 1\n"
    "e = false\n"
    "f = False\n"
    "g = FALSE\n"
    "h = 0\n"
    "i = junk\n"
  );
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b"), true);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d"), true);
  ASSERT_EQ(tr.get_bool("b", "e"), false);
  ASSERT_EQ(tr.get_bool("b", "f"), false);
  ASSERT_EQ(tr.get_bool("b", "g"), false);
  ASSERT_EQ(tr.get_bool("b", "h"), false);
  // "junk" -> returns default
  ASSERT_EQ(tr.get_bool("b", "i", true), true);
  ASSERT_EQ(tr.get_bool("b", "i", false), false);
  remove_file(path);
}

TEST(toml_int_coercion) {
  auto path = tmp_path("int");
  write_file(path,
    "[n]\n"
    "pos = 42\n"
    "neg = -7\n"
    "zero = 0\n"
    "str = hello\n"
  );
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("n", "pos"), 42);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "zero"), 0);
  // non-numeric string returns default
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  remove_file(path);
}

TEST(toml_quoted_strings) {
  auto path = tmp_path("quoted");
  write_file(path,
    "[s]\n"
    "plain = hello\n"
    "quoted = \"world\"\n"
    "empty = \"\"\n"
    "hex = \"#FF00AA\"\n"
  );
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("s", "plain"), "hello");
  ASSERT_EQ(tr.get_string("s", "quoted"), "world");
  ASSERT_EQ(tr.get_string("s", "empty"), "");
  ASSERT_EQ(tr.get_string("s", "hex"), "#FF00AA");
  remove_file(path);
}

TEST(toml_comments_and_whitespace) {
  auto path = tmp_path("comments");
  write_file(path,
    "# Top-level comment\n"
    "\n"
    "[ network ]  \n"
    "  key1  =  val1  \n"
    "# inline section comment\n"
    "  key2 = 10\n"
  );
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("network", "key1"), "val1");
  ASSERT_EQ(tr.get_int("network", "key2"), 10);
  remove_file(path);
}

TEST(toml_set_and_overwrite) {
  lanlink::util::TomlReader tr;
  tr.set("network", "qr_code", true);
  tr.set("network", "port", 8080);
  tr.set("hotspot", "ssid", std::string("lanlink"));
  ASSERT_EQ(tr.get_bool("network", "qr_code"), true);
  ASSERT_EQ(tr.get_int("network", "port"), 8080);
  ASSERT_EQ(tr.get_string("hotspot", "ssid"), "lanlink");
  // Overwrite
  tr.set("network", "port", 9000);
  ASSERT_EQ(tr.get_int("network", "port"), 9000);
}

TEST(toml_roundtrip) {
  auto path = tmp_path("roundtrip");
  lanlink::util::TomlReader tr;
  tr.set("network", "port", 8080);
  tr.set("network", "password_protection", false);
  tr.set_u64("network", "max_file_size", 5000000000ull);
  tr.set("hotspot", "ssid", std::string("my hotspot"));
  tr.set("hotspot", "security", std::string("wpa2"));
  ASSERT_TRUE(tr.save(path));

  lanlink::util::TomlReader tr2;
  ASSERT_TRUE(tr2.load(path));
  ASSERT_EQ(tr2.get_int("network", "port"), 8080);
  ASSERT_EQ(tr2.get_bool("network", "password_protection", true), false);
  ASSERT_EQ(tr2.get_u64("network", "max_file_size"), 5000000000ull);
  ASSERT_EQ(tr2.get_string("hotspot", "ssid"), "my hotspot");
  ASSERT_EQ(tr2.get_string("hotspot", "security"), "wpa2");
  remove_file(path);
}

TEST(toml_load_string_sections_in_order) {
  lanlink::util::TomlReader tr;
  tr.load_string("[net:aa:bb]\nssid_hex = 6869\n[net:cc:dd]\nssid_hex = 7a\n");
  auto secs = tr.sections();
  ASSERT_EQ(secs.size(), 2u);
  ASSERT_EQ(secs[0], "net:aa:bb");
  ASSERT_EQ(secs[1], "net:cc:dd");
  ASSERT_EQ(tr.get_string("net:cc:dd", "ssid_hex"), "7a");
}

TEST(toml_u64_rejects_negative) {
  lanlink::util::TomlReader tr;
  tr.load_string("[n]\nneg = -5\nbig = 18446744073709551615\n");
  ASSERT_EQ(tr.get_u64("n", "neg", 7), 7u);
  ASSERT_EQ(tr.get_u64("n", "big"), 18446744073709551615ull);
}

TEST(toml_global_keys_no_section) {
  auto path = tmp_path("global");
  write_file(path, "key = value\n[sec]\nother = 1\n");
  lanlink::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  // Keys before any [section] go under empty-string section
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);
  remove_file(path);
}
