#include "wasmdec.h"
#include "wasmdec.hh"

#include <cstring>

using namespace wasmdec;

extern "C" {

///////////////////////////////////////////////////////////////////////////////
// Auxiliaries

#define WASMDEC_DEFINE_OWN(name, Name) \
  struct wasmdec_##name##_t : Name {}; \
  \
  void wasmdec_##name##_delete(wasmdec_##name##_t* x) { \
    delete x; \
  } \
  \
  extern "C++" inline auto hide_##name(Name* x) -> wasmdec_##name##_t* { \
    return static_cast<wasmdec_##name##_t*>(x); \
  } \
  extern "C++" inline auto hide_##name(const Name* x) \
  -> const wasmdec_##name##_t* { \
    return static_cast<const wasmdec_##name##_t*>(x); \
  } \
  extern "C++" inline auto reveal_##name(wasmdec_##name##_t* x) -> Name* { \
    return x; \
  } \
  extern "C++" inline auto reveal_##name(const wasmdec_##name##_t* x) \
  -> const Name* { \
    return x; \
  } \
  extern "C++" inline auto release_##name(own<Name*>&& x) \
  -> wasmdec_##name##_t* { \
    return hide_##name(x.release()); \
  } \
  extern "C++" inline auto adopt_##name(wasmdec_##name##_t* x) \
  -> own<Name*> { \
    return make_own(reveal_##name(x)); \
  }


// Vectors

#define WASMDEC_DEFINE_VEC_PLAIN(name, Name) \
  static_assert( \
    sizeof(wasmdec_##name##_vec_t) == sizeof(vec<Name>), \
    "C/C++ incompatibility" \
  ); \
  static_assert( \
    sizeof(wasmdec_##name##_t) == sizeof(Name), \
    "C/C++ incompatibility" \
  ); \
  \
  extern "C++" inline auto release_##name##_vec(vec<Name>&& v) \
  -> wasmdec_##name##_vec_t { \
    if (!v) { \
      wasmdec_##name##_vec_t v2 = { 0, nullptr }; \
      return v2; \
    } \
    wasmdec_##name##_vec_t v2 = { v.size(), v.release() }; \
    return v2; \
  } \
  extern "C++" inline auto adopt_##name##_vec(wasmdec_##name##_vec_t* v) \
  -> vec<Name> { \
    return vec<Name>::adopt(v->size, v->data); \
  } \
  \
  void wasmdec_##name##_vec_new_uninitialized( \
    wasmdec_##name##_vec_t* out, size_t size \
  ) { \
    *out = release_##name##_vec(vec<Name>::make_uninitialized(size)); \
  } \
  \
  void wasmdec_##name##_vec_new_empty(wasmdec_##name##_vec_t* out) { \
    wasmdec_##name##_vec_new_uninitialized(out, 0); \
  } \
  \
  void wasmdec_##name##_vec_new( \
    wasmdec_##name##_vec_t* out, \
    size_t size, \
    const wasmdec_##name##_t data[] \
  ) { \
    auto v2 = vec<Name>::make_uninitialized(size); \
    if (v2 && v2.size() != 0) { \
      std::memcpy(v2.get(), data, size * sizeof(wasmdec_##name##_t)); \
    } \
    *out = release_##name##_vec(std::move(v2)); \
  } \
  \
  void wasmdec_##name##_vec_copy( \
    wasmdec_##name##_vec_t* out, const wasmdec_##name##_vec_t* v \
  ) { \
    wasmdec_##name##_vec_new(out, v->size, v->data); \
  } \
  \
  void wasmdec_##name##_vec_delete(wasmdec_##name##_vec_t* v) { \
    adopt_##name##_vec(v); \
    v->size = 0; \
    v->data = nullptr; \
  }


// Byte vectors

WASMDEC_DEFINE_VEC_PLAIN(byte, byte_t)


///////////////////////////////////////////////////////////////////////////////
// Decoder Environment

// Configuration

WASMDEC_DEFINE_OWN(config, Config)

wasmdec_config_t* wasmdec_config_new() {
  return release_config(Config::make());
}

void wasmdec_config_set_max_nesting_depth(
  wasmdec_config_t* config, uint32_t depth
) {
  reveal_config(config)->set_max_nesting_depth(depth);
}

void wasmdec_config_set_check_section_order(
  wasmdec_config_t* config, bool check
) {
  reveal_config(config)->set_check_section_order(check);
}


// Errors

static_assert(WASMDEC_ERROR_UNEXPECTED_END == ERROR_UNEXPECTED_END,
  "C/C++ incompatibility");
static_assert(WASMDEC_ERROR_OUT_OF_MEMORY == ERROR_OUT_OF_MEMORY,
  "C/C++ incompatibility");

WASMDEC_DEFINE_OWN(error, Error)

wasmdec_error_kind_t wasmdec_error_kind(const wasmdec_error_t* error) {
  return static_cast<wasmdec_error_kind_t>(reveal_error(error)->kind());
}

size_t wasmdec_error_offset(const wasmdec_error_t* error) {
  return reveal_error(error)->offset();
}

void wasmdec_error_message(
  const wasmdec_error_t* error, wasmdec_message_t* out
) {
  *out = release_byte_vec(reveal_error(error)->message());
}


// Decoders

WASMDEC_DEFINE_OWN(decoder, Decoder)
WASMDEC_DEFINE_OWN(module, Module)

wasmdec_decoder_t* wasmdec_decoder_new() {
  return release_decoder(Decoder::make());
}

wasmdec_decoder_t* wasmdec_decoder_new_with_config(wasmdec_config_t* config) {
  return release_decoder(Decoder::make(adopt_config(config)));
}

wasmdec_error_t* wasmdec_decode(
  const wasmdec_decoder_t* decoder, const wasmdec_byte_vec_t* binary,
  wasmdec_module_t** out
) {
  own<Module*> module;
  auto error = reveal_decoder(decoder)->decode(
    binary->size, binary->data, module);
  if (!error) *out = release_module(std::move(module));
  return release_error(std::move(error));
}


///////////////////////////////////////////////////////////////////////////////
// Modules

static_assert(WASMDEC_EXTERN_GLOBAL == EXTERN_GLOBAL, "C/C++ incompatibility");
static_assert(WASMDEC_SECTION_DATA == SEC_DATA, "C/C++ incompatibility");

size_t wasmdec_module_section_count(const wasmdec_module_t* module) {
  return reveal_module(module)->sections().size();
}

wasmdec_section_t wasmdec_module_section(
  const wasmdec_module_t* module, size_t index
) {
  auto& section = reveal_module(module)->sections()[index];
  wasmdec_section_t result = {
    static_cast<wasmdec_section_id_t>(section.id), section.offset, section.size
  };
  return result;
}

size_t wasmdec_module_type_count(const wasmdec_module_t* module) {
  return reveal_module(module)->types().size();
}

size_t wasmdec_module_import_count(const wasmdec_module_t* module) {
  return reveal_module(module)->imports().size();
}

size_t wasmdec_module_func_count(const wasmdec_module_t* module) {
  return reveal_module(module)->funcs().size();
}

size_t wasmdec_module_table_count(const wasmdec_module_t* module) {
  return reveal_module(module)->tables().size();
}

size_t wasmdec_module_memory_count(const wasmdec_module_t* module) {
  return reveal_module(module)->memories().size();
}

size_t wasmdec_module_global_count(const wasmdec_module_t* module) {
  return reveal_module(module)->globals().size();
}

size_t wasmdec_module_export_count(const wasmdec_module_t* module) {
  return reveal_module(module)->exports().size();
}

size_t wasmdec_module_elem_count(const wasmdec_module_t* module) {
  return reveal_module(module)->elems().size();
}

size_t wasmdec_module_code_count(const wasmdec_module_t* module) {
  return reveal_module(module)->codes().size();
}

size_t wasmdec_module_data_count(const wasmdec_module_t* module) {
  return reveal_module(module)->datas().size();
}

size_t wasmdec_module_custom_count(const wasmdec_module_t* module) {
  return reveal_module(module)->customs().size();
}

bool wasmdec_module_start(const wasmdec_module_t* module, uint32_t* out) {
  auto m = reveal_module(module);
  if (!m->has_start()) return false;
  *out = m->start();
  return true;
}


// Imports and exports

void wasmdec_module_import_module(
  const wasmdec_module_t* module, size_t index, wasmdec_name_t* out
) {
  *out = release_byte_vec(
    reveal_module(module)->imports()[index]->module().clone());
}

void wasmdec_module_import_name(
  const wasmdec_module_t* module, size_t index, wasmdec_name_t* out
) {
  *out = release_byte_vec(
    reveal_module(module)->imports()[index]->name().clone());
}

wasmdec_externkind_t wasmdec_module_import_kind(
  const wasmdec_module_t* module, size_t index
) {
  return static_cast<wasmdec_externkind_t>(
    reveal_module(module)->imports()[index]->kind());
}

void wasmdec_module_export_name(
  const wasmdec_module_t* module, size_t index, wasmdec_name_t* out
) {
  *out = release_byte_vec(
    reveal_module(module)->exports()[index]->name().clone());
}

wasmdec_externkind_t wasmdec_module_export_kind(
  const wasmdec_module_t* module, size_t index
) {
  return static_cast<wasmdec_externkind_t>(
    reveal_module(module)->exports()[index]->kind());
}

uint32_t wasmdec_module_export_index(
  const wasmdec_module_t* module, size_t index
) {
  return reveal_module(module)->exports()[index]->index();
}


// Custom sections

void wasmdec_module_custom_name(
  const wasmdec_module_t* module, size_t index, wasmdec_name_t* out
) {
  *out = release_byte_vec(
    reveal_module(module)->customs()[index]->name().clone());
}

const byte_t* wasmdec_module_custom_data(
  const wasmdec_module_t* module, size_t index, size_t* size
) {
  auto& custom = reveal_module(module)->customs()[index];
  *size = custom->size();
  return custom->data();
}

}  // extern "C"
