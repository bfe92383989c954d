#include <gtest/gtest.h>
#include <casper/crypto/verify.hpp>
#include <casper/schema/primitives.hpp>
#include <casper/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/wait.h>

#ifndef CASPER_DEPLOY_TOOL_PATH
#define CASPER_DEPLOY_TOOL_PATH ""
#endif

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_tool_command(const std::string& tool,
                             const std::string_view args) {
  auto command = shell_quote(tool) + " " + std::string{args} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

// Returns the text after "<field>: " on the first matching line.
std::string field_of(const std::string& output, const std::string_view field) {
  auto stream = std::istringstream{output};
  auto line = std::string{};
  auto prefix = std::string{field} + ": ";
  while (std::getline(stream, line)) {
    if (line.starts_with(prefix)) {
      return line.substr(prefix.size());
    }
  }
  return {};
}

std::vector<std::string> fields_of(const std::string& output,
                                   const std::string_view field) {
  auto out = std::vector<std::string>{};
  auto stream = std::istringstream{output};
  auto line = std::string{};
  auto prefix = std::string{field} + ": ";
  while (std::getline(stream, line)) {
    if (line.starts_with(prefix)) {
      out.push_back(line.substr(prefix.size()));
    }
  }
  return out;
}

std::string tool_path() {
  return std::string{CASPER_DEPLOY_TOOL_PATH};
}

}  // namespace

TEST(deploy_tool, pinned_transfer_matches_library_hash) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "deploy_tool binary not available: " << tool;
  }

  auto output = run_tool_command(
      tool, "transfer --account 01" +
                std::string{casper::testing::kEd25519Public} +
                " --timestamp 1700000030000 --payment 100000000 --target " +
                casper::testing::kAllATarget + " --amount 2500000000");
  auto expected = casper::testing::make_transfer_deploy();
  EXPECT_EQ(field_of(output, "deploy_hash"),
            casper::schema::to_hex(expected.hash));
  EXPECT_EQ(field_of(output, "deploy_hash"),
            "a2fbb371d208a979d6c6307402bdbce8ecfbe8a4ddcd986e8f4daffe0456181a");
  EXPECT_EQ(field_of(output, "body_hash"),
            "8db58df96e05011b2fa492e02d58a6c8445e068b26ca07c6795479b7228764cc");
  EXPECT_EQ(field_of(output, "timestamp"), "2023-11-14T22:13:20.000Z");
  EXPECT_TRUE(fields_of(output, "approval").empty());
}

TEST(deploy_tool, iso_timestamp_is_equivalent_to_milliseconds) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "deploy_tool binary not available: " << tool;
  }

  auto common = " --account 01" + std::string{casper::testing::kEd25519Public} +
                " --payment 100000000 --target " +
                casper::testing::kAllATarget + " --amount 2500000000";
  auto by_millis =
      run_tool_command(tool, "transfer --timestamp 1700000030000" + common);
  auto by_iso = run_tool_command(
      tool, "transfer --timestamp 2023-11-14T22:13:50.000Z" + common);
  EXPECT_EQ(field_of(by_millis, "deploy_hash"),
            field_of(by_iso, "deploy_hash"));
}

TEST(deploy_tool, secret_keys_produce_verifiable_approvals) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "deploy_tool binary not available: " << tool;
  }

  auto output = run_tool_command(
      tool, "transfer --secret-key ed25519:" +
                std::string{casper::testing::kEd25519Secret} +
                " secp256k1:" + std::string{casper::testing::kSecp256k1ScalarOne} +
                " --timestamp 1700000030000 --payment 100000000 --target " +
                casper::testing::kAllATarget + " --amount 2500000000 --bytes");
  EXPECT_EQ(field_of(output, "deploy_hash"),
            "a2fbb371d208a979d6c6307402bdbce8ecfbe8a4ddcd986e8f4daffe0456181a");
  EXPECT_FALSE(field_of(output, "bytes").empty());

  auto approvals = fields_of(output, "approval");
  ASSERT_EQ(approvals.size(), 2u);
  EXPECT_TRUE(approvals[0].starts_with(
      "01" + std::string{casper::testing::kEd25519Public} + " 01"));
  EXPECT_TRUE(approvals[1].starts_with(
      std::string{casper::testing::kSecp256k1Generator} + " 02"));
  for (const auto& approval : approvals) {
    auto space = approval.find(' ');
    ASSERT_NE(space, std::string::npos);
    EXPECT_TRUE(casper::crypto::verify_signature(
        field_of(output, "deploy_hash"), approval.substr(space + 1),
        approval.substr(0, space)));
  }
}

TEST(deploy_tool, account_hash_of_known_key) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "deploy_tool binary not available: " << tool;
  }

  EXPECT_EQ(
      run_tool_command(tool, "account-hash --public-key 01" +
                                 std::string{casper::testing::kEd25519Public}),
      "account-hash-"
      "b6c0e5c9ee25f43f57e577b5821688b9ac164eb7c4c08a24d43d1806ac721342");
  EXPECT_EQ(
      run_tool_command(tool, "account-hash --public-key " +
                                 std::string{
                                     casper::testing::kSecp256k1Generator}),
      "account-hash-"
      "86937931937ee0281e50806b94f8d4993e8869b0689dfa0a21d2946ab677183c");
}

TEST(deploy_tool, keygen_prints_consistent_key_material) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "deploy_tool binary not available: " << tool;
  }

  auto output = run_tool_command(tool, "keygen --key-algorithm secp256k1");
  EXPECT_EQ(field_of(output, "algorithm"), "secp256k1");
  EXPECT_EQ(field_of(output, "private_key").size(), 64u);
  auto public_key = field_of(output, "public_key");
  ASSERT_EQ(public_key.size(), 68u);
  EXPECT_EQ(public_key.substr(0, 2), "02");
  auto account = run_tool_command(tool, "account-hash --public-key " + public_key);
  EXPECT_EQ(field_of(output, "account_hash"), account);
}

TEST(deploy_tool, missing_account_fails) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "deploy_tool binary not available: " << tool;
  }

  auto [exit_code, output] = run_capture(
      shell_quote(tool) +
      " transfer --payment 1 --amount 1 --target " +
      casper::testing::kAllATarget + " 2>/dev/null");
  EXPECT_NE(exit_code, 0);
  EXPECT_TRUE(field_of(output, "deploy_hash").empty());
}
