#include "test_helpers.hh"

using namespace wasmdec;
using namespace wasmdec::test;

namespace {

// Frames sections until the input is exhausted or an error occurs.
auto sections(Input& input, ModuleImpl& m,
  own<Config*>&& config = Config::make()) -> bool {
  while (input.in && input.in.remaining() > 0) {
    bin::section(input.in, *config, m);
  }
  return bool(input.in);
}

}  // namespace

TEST(section, custom) {
  Input input("000805""68656c6c6f""fffe"_bytes);
  ModuleImpl m;
  ASSERT_TRUE(bin::section(input.in, *Config::make(), m));
  EXPECT_EQ(input.consumed(), 10u);
  ASSERT_TRUE(m.finish());

  ASSERT_EQ(m.sections.size(), 1u);
  EXPECT_EQ(m.sections[0].id, SEC_CUSTOM);
  EXPECT_EQ(m.sections[0].offset, 0u);
  EXPECT_EQ(m.sections[0].size, 8u);

  ASSERT_EQ(m.customs.size(), 1u);
  auto custom = m.customs[0].get();
  EXPECT_EQ(to_string(custom->name()), "hello");
  ASSERT_EQ(custom->size(), 2u);
  EXPECT_EQ(custom->data(), input.data() + 8);
  EXPECT_EQ(static_cast<uint8_t>(custom->data()[0]), 0xff);
  EXPECT_EQ(static_cast<uint8_t>(custom->data()[1]), 0xfe);
}

TEST(section, custom_empty_payload) {
  Input input("0002016e"_bytes);
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  ASSERT_TRUE(m.finish());
  ASSERT_EQ(m.customs.size(), 1u);
  EXPECT_EQ(to_string(m.customs[0]->name()), "n");
  EXPECT_EQ(m.customs[0]->size(), 0u);
}

TEST(section, custom_name_exceeds_section) {
  Input input("0002056869""0000"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 2u);

  Input last("0002056869"_bytes);
  ModuleImpl n;
  EXPECT_FALSE(sections(last, n));
  EXPECT_EQ(last.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(last.error_offset(), 2u);
}

TEST(section, custom_invalid_name) {
  Input input("000201ff"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_UTF8);
  EXPECT_EQ(input.error_offset(), 3u);
}

TEST(section, custom_interleaved) {
  Input input(
    make_section(SEC_CUSTOM, make_name("a")) +
    make_section(SEC_TYPE, "00"_bytes) +
    make_section(SEC_CUSTOM, make_name("b") + "01"_bytes) +
    make_section(SEC_FUNC, "00"_bytes) +
    make_section(SEC_CUSTOM, make_name("a")));
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  ASSERT_TRUE(m.finish());
  ASSERT_EQ(m.sections.size(), 5u);
  EXPECT_EQ(m.sections[1].id, SEC_TYPE);
  EXPECT_EQ(m.sections[1].offset, 4u);
  EXPECT_EQ(m.sections[3].id, SEC_FUNC);
  ASSERT_EQ(m.customs.size(), 3u);
  EXPECT_EQ(to_string(m.customs[1]->name()), "b");
  EXPECT_EQ(m.customs[1]->size(), 1u);
  EXPECT_EQ(to_string(m.customs[2]->name()), "a");
}

TEST(section, type) {
  Input input(make_section(SEC_TYPE, make_vec({
    "60017f017f"_bytes, "600000"_bytes})));
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  ASSERT_EQ(m.types.size(), 2u);
  EXPECT_EQ(m.types[0]->params().size(), 1u);
  EXPECT_EQ(m.types[1]->results().size(), 0u);
}

TEST(section, start) {
  Input input("080105"_bytes);
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  EXPECT_TRUE(m.has_start);
  EXPECT_EQ(m.start, 5u);
}

TEST(section, payload_shorter_than_declared) {
  // One function type consumes four of the five declared bytes.
  Input input("010501600000ff"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 6u);
}

TEST(section, payload_longer_than_declared) {
  // The result vector of the function type lies past the declared end.
  Input input("0103016000""000000"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 5u);
}

TEST(section, final_payload_longer_than_declared) {
  // Same overrun with nothing after the section: the input is long enough
  // for the declared size, so the payload is what disagrees.
  Input input("0103016000"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 5u);
}

TEST(section, final_code_body_exceeds_section) {
  Input input("0a030105""00"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 4u);
}

TEST(section, size_exceeds_input) {
  Input input("010500"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_UNEXPECTED_END);
  EXPECT_EQ(input.error_offset(), 0u);
}

TEST(section, truncated_size) {
  Input input("0180"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_UNEXPECTED_END);
}

TEST(section, invalid_id) {
  Input input("0c00"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_INVALID_TAG);
  EXPECT_EQ(input.error_offset(), 0u);
}

TEST(section, out_of_order) {
  Input input("030100""010100"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_ORDER);
  EXPECT_EQ(input.error_offset(), 3u);
}

TEST(section, out_of_order_unchecked) {
  Input input("030100""010100"_bytes);
  ModuleImpl m;
  auto config = Config::make();
  config->set_check_section_order(false);
  ASSERT_TRUE(sections(input, m, std::move(config)));
  ASSERT_TRUE(m.finish());
  ASSERT_EQ(m.sections.size(), 2u);
  EXPECT_EQ(m.sections[0].id, SEC_FUNC);
  EXPECT_EQ(m.sections[1].id, SEC_TYPE);
}

TEST(section, duplicate) {
  Input input("010100""010100"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_ORDER);
  EXPECT_EQ(input.error_offset(), 3u);
}

TEST(section, duplicate_unchecked) {
  Input input("010100""00020161""010100"_bytes);
  ModuleImpl m;
  auto config = Config::make();
  config->set_check_section_order(false);
  EXPECT_FALSE(sections(input, m, std::move(config)));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_ORDER);
  EXPECT_EQ(input.error_offset(), 7u);
}

TEST(section, code) {
  Input input(make_section(SEC_CODE, make_vec({
    add_size_prefix("0102" "7f" "20000b"_bytes),
    add_size_prefix("00010b"_bytes)})));
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  ASSERT_EQ(m.codes.size(), 2u);
  auto code = m.codes[0].get();
  EXPECT_EQ(code->size(), 6u);
  ASSERT_EQ(code->locals().size(), 1u);
  EXPECT_EQ(code->locals()[0].count, 2u);
  EXPECT_EQ(code->locals()[0].kind, I32);
  ASSERT_EQ(code->body().size(), 1u);
  EXPECT_EQ(code->body()[0]->opcode(), OP_LOCAL_GET);
  EXPECT_EQ(m.codes[1]->locals().size(), 0u);
  EXPECT_EQ(m.codes[1]->body().size(), 1u);
}

TEST(section, code_body_shorter_than_declared) {
  Input input("0a0601040001""0bff"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 7u);
}

TEST(section, code_body_longer_than_declared) {
  Input input("0a05010300""01010b"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 7u);
}

TEST(section, code_body_exceeds_section) {
  Input input("0a030105""00""000000"_bytes);
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_SECTION_LENGTH_MISMATCH);
  EXPECT_EQ(input.error_offset(), 4u);
}

TEST(section, import_kinds) {
  Input input(make_section(SEC_IMPORT, make_vec({
    make_name("env") + make_name("f") + "0002"_bytes,
    make_name("env") + make_name("t") + "0170000a"_bytes,
    make_name("env") + make_name("m") + "020101ff01"_bytes,
    make_name("env") + make_name("g") + "037e01"_bytes})));
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  ASSERT_EQ(m.imports.size(), 4u);
  EXPECT_EQ(m.imports[0]->kind(), EXTERN_FUNC);
  EXPECT_EQ(m.imports[0]->type_index(), 2u);
  EXPECT_EQ(m.imports[0]->type(), nullptr);
  EXPECT_EQ(m.imports[1]->kind(), EXTERN_TABLE);
  EXPECT_EQ(m.imports[1]->type()->table()->limits().min, 10u);
  EXPECT_EQ(m.imports[2]->kind(), EXTERN_MEMORY);
  EXPECT_EQ(m.imports[2]->type()->memory()->limits().max, 255u);
  EXPECT_EQ(m.imports[3]->kind(), EXTERN_GLOBAL);
  EXPECT_EQ(m.imports[3]->type()->global()->mutability(), VAR);
  EXPECT_EQ(to_string(m.imports[3]->module()), "env");
  EXPECT_EQ(to_string(m.imports[3]->name()), "g");
}

TEST(section, import_invalid_kind) {
  Input input(make_section(SEC_IMPORT, make_vec({
    make_name("a") + make_name("b") + "0400"_bytes})));
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_INVALID_TAG);
  EXPECT_EQ(input.error_offset(), 7u);
}

TEST(section, export_invalid_kind) {
  Input input(make_section(SEC_EXPORT, make_vec({
    make_name("x") + "0400"_bytes})));
  ModuleImpl m;
  EXPECT_FALSE(sections(input, m));
  EXPECT_EQ(input.error_kind(), ERROR_INVALID_TAG);
  EXPECT_EQ(input.error_offset(), 5u);
}

TEST(section, elem_and_data) {
  Input input(
    make_section(SEC_ELEM, make_vec({"0041000b020001"_bytes})) +
    make_section(SEC_DATA, make_vec({"0041080b03616263"_bytes})));
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  ASSERT_EQ(m.elems.size(), 1u);
  EXPECT_EQ(m.elems[0]->table_index(), 0u);
  EXPECT_EQ(m.elems[0]->offset()[0]->i32(), 0);
  ASSERT_EQ(m.elems[0]->funcs().size(), 2u);
  EXPECT_EQ(m.elems[0]->funcs()[1], 1u);
  ASSERT_EQ(m.datas.size(), 1u);
  EXPECT_EQ(m.datas[0]->offset()[0]->i32(), 8);
  ASSERT_EQ(m.datas[0]->size(), 3u);
  EXPECT_EQ(std::string(m.datas[0]->data(), 3), "abc");
}

TEST(section, global_init) {
  Input input(make_section(SEC_GLOBAL, make_vec({
    "7f01412a0b"_bytes, "7d0043000000400b"_bytes})));
  ModuleImpl m;
  ASSERT_TRUE(sections(input, m));
  ASSERT_EQ(m.globals.size(), 2u);
  EXPECT_EQ(m.globals[0]->type()->mutability(), VAR);
  EXPECT_EQ(m.globals[0]->init()[0]->i32(), 42);
  EXPECT_EQ(m.globals[1]->type()->content()->kind(), F32);
  EXPECT_EQ(m.globals[1]->init()[0]->f32(), 2.0f);
}
