#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using bugreportd::tests::common::AssertContains;
using bugreportd::tests::common::DispatchWithCapturedOutput;
using bugreportd::tests::common::Fail;

namespace {

void WriteText(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    Fail("failed to write " + path.string());
  }
  out << text;
}

void ExpectExit(const std::vector<std::string>& argv, int expected, std::string& out,
                std::string& err) {
  const int exit_code = DispatchWithCapturedOutput(argv, out, err);
  if (exit_code != expected) {
    std::cerr << "stdout:\n" << out << "\nstderr:\n" << err << '\n';
    Fail("unexpected exit code " + std::to_string(exit_code) + " for " + argv.at(1));
  }
}

} // namespace

int main() {
  std::string out;
  std::string err;

  ExpectExit({"bugreportd", "version"}, 0, out, err);
  AssertContains(out, "bugreportd 0.1.0");
  ExpectExit({"bugreportd", "version", "extra"}, 2, out, err);

  ExpectExit({"bugreportd", "modes"}, 0, out, err);
  AssertContains(out, "full\n");
  AssertContains(out, "interactive (screenshot)\n");
  AssertContains(out, "wear (screenshot)\n");
  AssertContains(out, "telephony\n");
  AssertContains(out, "default\n");

  ExpectExit({"bugreportd", "help"}, 0, out, err);
  AssertContains(out, "bugreportd capture --out <report>");

  ExpectExit({"bugreportd"}, 2, out, err);
  ExpectExit({"bugreportd", "frobnicate"}, 2, out, err);
  AssertContains(err, "unknown subcommand: frobnicate");

  // Capture argument contract.
  ExpectExit({"bugreportd", "capture"}, 2, out, err);
  AssertContains(err, "capture requires --out <report>");
  ExpectExit({"bugreportd", "capture", "--out", "/tmp/x", "--mode", "audio"}, 2, out, err);
  AssertContains(err, "invalid capture mode 'audio'");
  ExpectExit({"bugreportd", "capture", "--out", "/tmp/x", "--bogus", "1"}, 2, out, err);
  AssertContains(err, "unknown option: --bogus");
  ExpectExit({"bugreportd", "capture", "--out", "/tmp/x", "--steps", "many"}, 2, out, err);
  AssertContains(err, "invalid --steps value: many");
  ExpectExit({"bugreportd", "capture", "--out"}, 2, out, err);
  AssertContains(err, "missing value for --out");
  ExpectExit({"bugreportd", "capture", "--out", "/tmp/x", "--consent", "maybe"}, 2, out, err);
  ExpectExit({"bugreportd", "capture", "report.txt"}, 2, out, err);
  AssertContains(err, "does not accept positional arguments");

  const fs::path root = bugreportd::tests::common::CreateUniqueTempDir("bugreportd-cli-commands");
  const fs::path good = root / "good.json";
  const fs::path bad = root / "bad.json";
  WriteText(good, R"({"consent_timeout_ms": 1000, "consent_exempt_uids": [0, 2000]})");
  WriteText(bad, R"({"consent_timeout_ms": "soon", "mystery": true})");

  ExpectExit({"bugreportd", "validate-config", good.string()}, 0, out, err);
  AssertContains(out, "valid: " + good.string());

  ExpectExit({"bugreportd", "validate-config", bad.string()}, 10, out, err);
  AssertContains(err, "invalid config: " + bad.string());
  AssertContains(err, "$.consent_timeout_ms: must be a number (got string)");
  AssertContains(err, "$.mystery: unknown config key");

  ExpectExit({"bugreportd", "validate-config", (root / "missing.json").string()}, 10, out, err);
  ExpectExit({"bugreportd", "validate-config"}, 2, out, err);

  bugreportd::tests::common::RemovePathBestEffort(root);
  std::cout << "cli_commands_smoke: ok\n";
  return 0;
}
