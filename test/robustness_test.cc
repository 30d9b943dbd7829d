#include "test_helpers.hh"

#include <algorithm>
#include <vector>

using namespace wasmdec;
using namespace wasmdec::test;

namespace {

auto sample() -> bytes {
  return wasm_prefix() +
    make_section(SEC_TYPE, make_vec({"60017f017f"_bytes})) +
    make_section(SEC_IMPORT, make_vec({
      make_name("env") + make_name("log") + "0000"_bytes})) +
    make_section(SEC_FUNC, "0100"_bytes) +
    make_section(SEC_MEMORY, "010001"_bytes) +
    make_section(SEC_GLOBAL, "017f01410a0b"_bytes) +
    make_section(SEC_EXPORT, make_vec({make_name("inc") + "0001"_bytes})) +
    make_section(SEC_CODE, make_vec({add_size_prefix(
      "0101" "7e" "027f" "2000" "4101" "6a" "0b" "0440" "01" "05" "00" "0b"
      "0e020001" "00" "28021000" "0b"_bytes)})) +
    make_section(SEC_DATA, "010041000b026869"_bytes) +
    make_section(SEC_CUSTOM, make_name("note") + "0102"_bytes);
}

// Section boundaries, found by framing the sample once.
auto boundaries(const bytes& binary) -> std::vector<size_t> {
  std::vector<size_t> result;
  own<Module*> module;
  auto error = decode(binary, module);
  EXPECT_FALSE(error);
  if (!module) return result;
  auto& sections = module->sections();
  for (size_t i = 0; i < sections.size(); ++i) {
    result.push_back(sections[i].offset);
  }
  result.push_back(binary.size());
  return result;
}

auto is_structured(const own<Error*>& error) -> bool {
  if (error->kind() > ERROR_OUT_OF_MEMORY) return false;
  return !to_string(error->message()).empty();
}

}  // namespace

TEST(robustness, sample_decodes) {
  own<Module*> module;
  auto error = decode(sample(), module);
  ASSERT_FALSE(error) << to_string(error->message());
  EXPECT_EQ(module->codes()[0]->body().size(), 5u);
}

TEST(robustness, truncated) {
  auto binary = sample();
  auto cuts = boundaries(binary);
  ASSERT_FALSE(cuts.empty());
  for (size_t size = 0; size < binary.size(); ++size) {
    own<Module*> module;
    auto error = decode(binary.substr(0, size), module);
    auto at_boundary =
      std::find(cuts.begin(), cuts.end(), size) != cuts.end();
    if (at_boundary) {
      // Whole sections only; a missing code section still has to be noticed.
      if (error) {
        EXPECT_EQ(error->kind(), ERROR_FUNCTION_CODE_MISMATCH) << size;
      }
    } else if (size >= 8) {
      ASSERT_TRUE(error) << size;
      EXPECT_EQ(error->kind(), ERROR_UNEXPECTED_END) << size;
      EXPECT_LE(error->offset(), size) << size;
      EXPECT_FALSE(module) << size;
    } else {
      ASSERT_TRUE(error) << size;
      EXPECT_EQ(error->kind(), ERROR_UNEXPECTED_END) << size;
    }
  }
}

TEST(robustness, mutated) {
  auto binary = sample();
  const uint8_t values[] = {0x00, 0x01, 0x0b, 0x40, 0x7f, 0x80, 0xff};
  for (size_t i = 0; i < binary.size(); ++i) {
    for (auto value : values) {
      auto mutated = binary;
      mutated[i] = static_cast<char>(value);
      own<Module*> module;
      auto error = decode(mutated, module);
      if (error) {
        EXPECT_TRUE(is_structured(error)) << i;
        EXPECT_LE(error->offset(), mutated.size()) << i;
        EXPECT_FALSE(module) << i;
      } else {
        EXPECT_TRUE(module) << i;
      }
    }
  }
}

TEST(robustness, random) {
  uint32_t state = 12345;
  auto next = [&state]() -> uint8_t {
    state = state * 1103515245u + 12345u;
    return static_cast<uint8_t>(state >> 16);
  };

  for (int round = 0; round < 2000; ++round) {
    auto length = next() % 64;
    auto binary = round % 2 ? wasm_prefix() : bytes();
    for (size_t i = 0; i < length; ++i) {
      binary.push_back(static_cast<char>(next()));
    }
    own<Module*> module;
    auto error = decode(binary, module);
    if (error) {
      EXPECT_TRUE(is_structured(error)) << round;
      EXPECT_LE(error->offset(), binary.size()) << round;
    } else {
      EXPECT_TRUE(module) << round;
    }
  }
}

TEST(robustness, huge_counts) {
  const char* inputs[] = {
    "0105ffffffff0f",        // type vector
    "0307ffffffff0f0000",    // function vector
    "0a05ffffffff0f",        // code vector
    "0006ffffffff0f00",      // custom name
  };
  for (auto hex : inputs) {
    own<Module*> module;
    auto error = decode(wasm_prefix() + from_hex(hex, std::strlen(hex)), module);
    ASSERT_TRUE(error) << hex;
    EXPECT_TRUE(is_structured(error)) << hex;
  }
}
