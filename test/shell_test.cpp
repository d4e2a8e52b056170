#include "../include/mwclient/shell.hpp"

#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using nlohmann::json;

namespace {

// Minimal POSIX word splitter: single quotes, double quotes with \" \\ \$ \`
// escapes, and backslash outside quotes.
std::vector<std::string> shell_split(const std::string &line) {
  std::vector<std::string> words;
  std::string cur;
  bool in_word = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '\'') {
      in_word = true;
      auto end = line.find('\'', i + 1);
      assert(end != std::string::npos);
      cur += line.substr(i + 1, end - i - 1);
      i = end;
    } else if (c == '"') {
      in_word = true;
      for (++i; i < line.size() && line[i] != '"'; ++i) {
        if (line[i] == '\\' && i + 1 < line.size() &&
            std::string("\"\\$`").find(line[i + 1]) != std::string::npos)
          ++i;
        cur.push_back(line[i]);
      }
      assert(i < line.size());
    } else if (c == '\\' && i + 1 < line.size()) {
      in_word = true;
      cur.push_back(line[++i]);
    } else if (c == ' ' || c == '\t') {
      if (in_word) {
        words.push_back(cur);
        cur.clear();
        in_word = false;
      }
    } else {
      in_word = true;
      cur.push_back(c);
    }
  }
  if (in_word)
    words.push_back(cur);
  return words;
}

// Arguments after "sudo midclt call [-j] <method>".
std::vector<json> parsed_args(const std::string &cmd) {
  auto words = shell_split(cmd);
  std::size_t skip = words.size() > 3 && words[3] == "-j" ? 5 : 4;
  std::vector<json> out;
  for (std::size_t i = skip; i < words.size(); ++i)
    out.push_back(json::parse(words[i]));
  return out;
}

} // namespace

int main() {
  int passed = 0;

  // --- build_command ---
  assert(mwclient::build_command("system.version", nullptr, false) ==
         "sudo midclt call system.version");
  ++passed;
  assert(mwclient::build_command("app.delete", json::array({"caddy"}), true) ==
         "sudo midclt call -j app.delete '\"caddy\"'");
  ++passed;
  {
    json params = {{"name", "tank/apps"}, {"type", "FILESYSTEM"}};
    auto cmd = mwclient::build_command("pool.dataset.create", params, false);
    auto args = parsed_args(cmd);
    assert(args.size() == 1 && args[0] == params);
    ++passed;
  }
  {
    auto cmd = mwclient::build_command("app.update",
                                       json::array({"caddy", {{"values", {{"a", 1}}}}}),
                                       false);
    auto args = parsed_args(cmd);
    assert(args.size() == 2);
    ++passed;
    assert(args[0] == "caddy");
    ++passed;
    assert(args[1]["values"]["a"] == 1);
    ++passed;
  }
  {
    auto cmd = mwclient::build_command("filesystem.stat", "/mnt/tank/apps", false);
    auto args = parsed_args(cmd);
    assert(args.size() == 1 && args[0] == "/mnt/tank/apps");
    ++passed;
  }

  // --- quoting round-trips hostile content ---
  {
    std::string compose =
        "services:\n  web:\n    image: \"nginx:latest\"\n    command: sh -c 'echo "
        "$HOME && echo `id`; echo \\\\ done'\n";
    json params = json::array(
        {"it's", "a \"quoted\" $word", compose, {{"compose_config", compose}}});
    auto cmd = mwclient::build_command("app.create", params, true);
    auto args = parsed_args(cmd);
    assert(args.size() == params.size());
    ++passed;
    for (std::size_t i = 0; i < args.size(); ++i)
      assert(args[i] == params[i]);
    ++passed;
  }

  // --- shell_quote ---
  assert(mwclient::shell_quote("") == "''");
  ++passed;
  assert(mwclient::shell_quote("/mnt/tank") == "/mnt/tank");
  ++passed;
  assert(mwclient::shell_quote("a b") == "'a b'");
  ++passed;
  assert(shell_split(mwclient::shell_quote("it's"))[0] == "it's");
  ++passed;

  // --- method validation ---
  assert(mwclient::is_valid_method("pool.dataset.create"));
  ++passed;
  assert(!mwclient::is_valid_method("Pool.create"));
  ++passed;
  assert(!mwclient::is_valid_method("app.create; rm -rf /"));
  ++passed;
  {
    bool threw = false;
    try {
      mwclient::build_command("app.create && reboot", nullptr, false);
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert(threw);
    ++passed;
  }

  // --- output handling ---
  assert(mwclient::strip_ansi("\x1b[32mok\x1b[0m") == "ok");
  ++passed;
  assert(mwclient::strip_ansi("\x1b]0;title\x07done") == "done");
  ++passed;
  assert(mwclient::extract_json_line("Status: 10%\nStatus: 90%\n{\"id\": 5}\n") ==
         "{\"id\": 5}");
  ++passed;
  assert(mwclient::extract_json_line("\x1b[2K[50%] working\n[1, 2]") == "[1, 2]");
  ++passed;
  assert(mwclient::parse_output("").is_null());
  ++passed;
  assert(mwclient::parse_output("42\n") == 42);
  ++passed;
  assert(mwclient::parse_output("TrueNAS-SCALE-24.10.2.4\n") == "TrueNAS-SCALE-24.10.2.4");
  ++passed;
  assert(mwclient::parse_output("{\"ok\": true}")["ok"] == true);
  ++passed;

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
