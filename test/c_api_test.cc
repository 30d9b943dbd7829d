#include "test_helpers.hh"
#include "wasmdec.h"

using namespace wasmdec::test;

namespace {

auto byte_vec(const bytes& b) -> wasmdec_byte_vec_t {
  wasmdec_byte_vec_t v;
  wasmdec_byte_vec_new(&v, b.size(), b.data());
  return v;
}

auto name_string(const wasmdec_name_t& name) -> std::string {
  return std::string(name.data, name.size);
}

auto sample() -> bytes {
  return wasm_prefix() +
    make_section(wasmdec::SEC_TYPE, "01600000"_bytes) +
    make_section(wasmdec::SEC_IMPORT, make_vec({
      make_name("env") + make_name("f") + "0000"_bytes,
      make_name("env") + make_name("m") + "020001"_bytes})) +
    make_section(wasmdec::SEC_FUNC, "0100"_bytes) +
    make_section(wasmdec::SEC_EXPORT, make_vec({
      make_name("run") + "0001"_bytes})) +
    make_section(wasmdec::SEC_START, "01"_bytes) +
    make_section(wasmdec::SEC_CODE, make_vec({add_size_prefix("00010b"_bytes)})) +
    make_section(wasmdec::SEC_CUSTOM, make_name("meta") + "0a0b0c"_bytes);
}

}  // namespace

TEST(c_api, decode) {
  auto decoder = wasmdec_decoder_new();
  ASSERT_NE(decoder, nullptr);
  auto binary = byte_vec(sample());

  wasmdec_module_t* module = nullptr;
  auto error = wasmdec_decode(decoder, &binary, &module);
  ASSERT_EQ(error, nullptr);
  ASSERT_NE(module, nullptr);

  EXPECT_EQ(wasmdec_module_section_count(module), 7u);
  auto section = wasmdec_module_section(module, 0);
  EXPECT_EQ(section.id, WASMDEC_SECTION_TYPE);
  EXPECT_EQ(section.offset, 8u);
  EXPECT_EQ(section.size, 4u);

  EXPECT_EQ(wasmdec_module_type_count(module), 1u);
  EXPECT_EQ(wasmdec_module_import_count(module), 2u);
  EXPECT_EQ(wasmdec_module_func_count(module), 1u);
  EXPECT_EQ(wasmdec_module_table_count(module), 0u);
  EXPECT_EQ(wasmdec_module_memory_count(module), 0u);
  EXPECT_EQ(wasmdec_module_global_count(module), 0u);
  EXPECT_EQ(wasmdec_module_export_count(module), 1u);
  EXPECT_EQ(wasmdec_module_elem_count(module), 0u);
  EXPECT_EQ(wasmdec_module_code_count(module), 1u);
  EXPECT_EQ(wasmdec_module_data_count(module), 0u);
  EXPECT_EQ(wasmdec_module_custom_count(module), 1u);

  uint32_t start = 0;
  EXPECT_TRUE(wasmdec_module_start(module, &start));
  EXPECT_EQ(start, 1u);

  wasmdec_name_t name;
  wasmdec_module_import_module(module, 1, &name);
  EXPECT_EQ(name_string(name), "env");
  wasmdec_name_delete(&name);
  wasmdec_module_import_name(module, 1, &name);
  EXPECT_EQ(name_string(name), "m");
  wasmdec_name_delete(&name);
  EXPECT_EQ(wasmdec_module_import_kind(module, 0), WASMDEC_EXTERN_FUNC);
  EXPECT_EQ(wasmdec_module_import_kind(module, 1), WASMDEC_EXTERN_MEMORY);

  wasmdec_module_export_name(module, 0, &name);
  EXPECT_EQ(name_string(name), "run");
  wasmdec_name_delete(&name);
  EXPECT_EQ(wasmdec_module_export_kind(module, 0), WASMDEC_EXTERN_FUNC);
  EXPECT_EQ(wasmdec_module_export_index(module, 0), 1u);

  wasmdec_module_custom_name(module, 0, &name);
  EXPECT_EQ(name_string(name), "meta");
  wasmdec_name_delete(&name);
  size_t size = 0;
  auto data = wasmdec_module_custom_data(module, 0, &size);
  ASSERT_EQ(size, 3u);
  EXPECT_EQ(data, binary.data + binary.size - 3);

  wasmdec_module_delete(module);
  wasmdec_byte_vec_delete(&binary);
  wasmdec_decoder_delete(decoder);
}

TEST(c_api, no_start) {
  auto decoder = wasmdec_decoder_new();
  auto binary = byte_vec(wasm_prefix());
  wasmdec_module_t* module = nullptr;
  ASSERT_EQ(wasmdec_decode(decoder, &binary, &module), nullptr);
  uint32_t start = 7;
  EXPECT_FALSE(wasmdec_module_start(module, &start));
  EXPECT_EQ(start, 7u);
  EXPECT_EQ(wasmdec_module_section_count(module), 0u);
  wasmdec_module_delete(module);
  wasmdec_byte_vec_delete(&binary);
  wasmdec_decoder_delete(decoder);
}

TEST(c_api, error) {
  auto decoder = wasmdec_decoder_new();
  auto binary = byte_vec("0061736d01000000""0180"_bytes);
  wasmdec_module_t* module = nullptr;
  auto error = wasmdec_decode(decoder, &binary, &module);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(module, nullptr);
  EXPECT_EQ(wasmdec_error_kind(error), WASMDEC_ERROR_UNEXPECTED_END);
  EXPECT_EQ(wasmdec_error_offset(error), 10u);

  wasmdec_message_t message;
  wasmdec_error_message(error, &message);
  ASSERT_GT(message.size, 0u);
  EXPECT_EQ(message.data[message.size - 1], '\0');
  EXPECT_GT(std::strlen(message.data), 0u);
  wasmdec_byte_vec_delete(&message);

  wasmdec_error_delete(error);
  wasmdec_byte_vec_delete(&binary);
  wasmdec_decoder_delete(decoder);
}

TEST(c_api, config) {
  auto config = wasmdec_config_new();
  ASSERT_NE(config, nullptr);
  wasmdec_config_set_max_nesting_depth(config, 0);
  wasmdec_config_set_check_section_order(config, false);
  auto decoder = wasmdec_decoder_new_with_config(config);
  ASSERT_NE(decoder, nullptr);

  auto prefix = wasm_prefix() +
    make_section(wasmdec::SEC_FUNC, "0100"_bytes) +
    make_section(wasmdec::SEC_TYPE, "01600000"_bytes);

  auto binary = byte_vec(prefix + make_section(wasmdec::SEC_CODE,
    make_vec({add_size_prefix("00010b"_bytes)})));
  wasmdec_module_t* module = nullptr;
  auto error = wasmdec_decode(decoder, &binary, &module);
  ASSERT_EQ(error, nullptr);
  EXPECT_EQ(wasmdec_module_section(module, 0).id, WASMDEC_SECTION_FUNC);
  wasmdec_module_delete(module);
  wasmdec_byte_vec_delete(&binary);

  binary = byte_vec(prefix + make_section(wasmdec::SEC_CODE,
    make_vec({add_size_prefix("0002400b0b"_bytes)})));
  module = nullptr;
  error = wasmdec_decode(decoder, &binary, &module);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(wasmdec_error_kind(error), WASMDEC_ERROR_NESTING_TOO_DEEP);
  EXPECT_EQ(module, nullptr);
  wasmdec_error_delete(error);
  wasmdec_byte_vec_delete(&binary);
  wasmdec_decoder_delete(decoder);
}

TEST(c_api, vectors) {
  wasmdec_byte_vec_t empty;
  wasmdec_byte_vec_new_empty(&empty);
  EXPECT_EQ(empty.size, 0u);
  wasmdec_byte_vec_delete(&empty);

  wasmdec_name_t name;
  wasmdec_name_new_from_string(&name, "hello");
  wasmdec_name_t copy;
  wasmdec_name_copy(&copy, &name);
  EXPECT_EQ(name_string(copy), "hello");
  EXPECT_NE(copy.data, name.data);
  wasmdec_name_delete(&copy);
  wasmdec_name_delete(&name);
}
