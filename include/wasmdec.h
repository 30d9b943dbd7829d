// WebAssembly Binary Decoder C API

#ifndef __WASMDEC_H
#define __WASMDEC_H

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>
#include <string.h>


#ifdef __cplusplus
extern "C" {
#endif

///////////////////////////////////////////////////////////////////////////////
// Auxiliaries

// Machine types

typedef char byte_t;


// Ownership

#define own

// The qualified `own` marks ownership, read like a `const` qualifier:
//
// - `own wasmdec_xxx_t*` owns the pointed-to data
// - `own wasmdec_xxx_vec_t` owns the vector as well as its elements
// - an `own` parameter passes ownership from caller to callee
// - an `own` result passes ownership from callee to caller
//
// Own data is released with the matching `wasmdec_xxx_delete` function.


#define WASMDEC_DECLARE_OWN(name) \
  typedef struct wasmdec_##name##_t wasmdec_##name##_t; \
  \
  void wasmdec_##name##_delete(own wasmdec_##name##_t*);


// Vectors

#define WASMDEC_DECLARE_VEC(name, ptr_or_none) \
  typedef struct wasmdec_##name##_vec_t { \
    size_t size; \
    wasmdec_##name##_t ptr_or_none* data; \
  } wasmdec_##name##_vec_t; \
  \
  void wasmdec_##name##_vec_new_empty(own wasmdec_##name##_vec_t* out); \
  void wasmdec_##name##_vec_new_uninitialized( \
    own wasmdec_##name##_vec_t* out, size_t); \
  void wasmdec_##name##_vec_new( \
    own wasmdec_##name##_vec_t* out, \
    size_t, own wasmdec_##name##_t ptr_or_none const[]); \
  void wasmdec_##name##_vec_copy( \
    own wasmdec_##name##_vec_t* out, const wasmdec_##name##_vec_t*); \
  void wasmdec_##name##_vec_delete(own wasmdec_##name##_vec_t*);


// Byte vectors

typedef byte_t wasmdec_byte_t;
WASMDEC_DECLARE_VEC(byte, )

typedef wasmdec_byte_vec_t wasmdec_name_t;

#define wasmdec_name wasmdec_byte_vec
#define wasmdec_name_new wasmdec_byte_vec_new
#define wasmdec_name_new_empty wasmdec_byte_vec_new_empty
#define wasmdec_name_new_uninitialized wasmdec_byte_vec_new_uninitialized
#define wasmdec_name_copy wasmdec_byte_vec_copy
#define wasmdec_name_delete wasmdec_byte_vec_delete

static inline void wasmdec_name_new_from_string(
  own wasmdec_name_t* out, const char* s
) {
  wasmdec_name_new(out, strlen(s), s);
}

typedef wasmdec_byte_vec_t wasmdec_message_t;  // null terminated


///////////////////////////////////////////////////////////////////////////////
// Decoder Environment

// Configuration

WASMDEC_DECLARE_OWN(config)

own wasmdec_config_t* wasmdec_config_new(void);

void wasmdec_config_set_max_nesting_depth(wasmdec_config_t*, uint32_t);
void wasmdec_config_set_check_section_order(wasmdec_config_t*, bool);


// Errors

typedef uint8_t wasmdec_error_kind_t;
enum wasmdec_error_kind_enum {
  WASMDEC_ERROR_UNEXPECTED_END,
  WASMDEC_ERROR_INVALID_TAG,
  WASMDEC_ERROR_UTF8,
  WASMDEC_ERROR_INTEGER_OVERFLOW,
  WASMDEC_ERROR_UNKNOWN_OPCODE,
  WASMDEC_ERROR_SECTION_LENGTH_MISMATCH,
  WASMDEC_ERROR_SECTION_ORDER,
  WASMDEC_ERROR_MAGIC_OR_VERSION,
  WASMDEC_ERROR_NESTING_TOO_DEEP,
  WASMDEC_ERROR_FUNCTION_CODE_MISMATCH,
  WASMDEC_ERROR_OUT_OF_MEMORY,
};

WASMDEC_DECLARE_OWN(error)

wasmdec_error_kind_t wasmdec_error_kind(const wasmdec_error_t*);
size_t wasmdec_error_offset(const wasmdec_error_t*);
void wasmdec_error_message(const wasmdec_error_t*, own wasmdec_message_t* out);


// Decoders

WASMDEC_DECLARE_OWN(decoder)
WASMDEC_DECLARE_OWN(module)

own wasmdec_decoder_t* wasmdec_decoder_new(void);
own wasmdec_decoder_t* wasmdec_decoder_new_with_config(own wasmdec_config_t*);

// Returns null and stores the module in `out` on success.
// The binary has to outlive the module.
own wasmdec_error_t* wasmdec_decode(
  const wasmdec_decoder_t*, const wasmdec_byte_vec_t* binary,
  own wasmdec_module_t** out);


///////////////////////////////////////////////////////////////////////////////
// Modules

typedef uint8_t wasmdec_externkind_t;
enum wasmdec_externkind_enum {
  WASMDEC_EXTERN_FUNC,
  WASMDEC_EXTERN_TABLE,
  WASMDEC_EXTERN_MEMORY,
  WASMDEC_EXTERN_GLOBAL,
};

typedef uint8_t wasmdec_section_id_t;
enum wasmdec_section_id_enum {
  WASMDEC_SECTION_CUSTOM,
  WASMDEC_SECTION_TYPE,
  WASMDEC_SECTION_IMPORT,
  WASMDEC_SECTION_FUNC,
  WASMDEC_SECTION_TABLE,
  WASMDEC_SECTION_MEMORY,
  WASMDEC_SECTION_GLOBAL,
  WASMDEC_SECTION_EXPORT,
  WASMDEC_SECTION_START,
  WASMDEC_SECTION_ELEM,
  WASMDEC_SECTION_CODE,
  WASMDEC_SECTION_DATA,
};

typedef struct wasmdec_section_t {
  wasmdec_section_id_t id;
  size_t offset;
  uint32_t size;
} wasmdec_section_t;

// Indexed accessors take an index below the matching *_count; an index out
// of range is undefined.

size_t wasmdec_module_section_count(const wasmdec_module_t*);
wasmdec_section_t wasmdec_module_section(const wasmdec_module_t*, size_t index);

size_t wasmdec_module_type_count(const wasmdec_module_t*);
size_t wasmdec_module_import_count(const wasmdec_module_t*);
size_t wasmdec_module_func_count(const wasmdec_module_t*);
size_t wasmdec_module_table_count(const wasmdec_module_t*);
size_t wasmdec_module_memory_count(const wasmdec_module_t*);
size_t wasmdec_module_global_count(const wasmdec_module_t*);
size_t wasmdec_module_export_count(const wasmdec_module_t*);
size_t wasmdec_module_elem_count(const wasmdec_module_t*);
size_t wasmdec_module_code_count(const wasmdec_module_t*);
size_t wasmdec_module_data_count(const wasmdec_module_t*);
size_t wasmdec_module_custom_count(const wasmdec_module_t*);

bool wasmdec_module_start(const wasmdec_module_t*, uint32_t* out);

void wasmdec_module_import_module(
  const wasmdec_module_t*, size_t index, own wasmdec_name_t* out);
void wasmdec_module_import_name(
  const wasmdec_module_t*, size_t index, own wasmdec_name_t* out);
wasmdec_externkind_t wasmdec_module_import_kind(
  const wasmdec_module_t*, size_t index);

void wasmdec_module_export_name(
  const wasmdec_module_t*, size_t index, own wasmdec_name_t* out);
wasmdec_externkind_t wasmdec_module_export_kind(
  const wasmdec_module_t*, size_t index);
uint32_t wasmdec_module_export_index(const wasmdec_module_t*, size_t index);

void wasmdec_module_custom_name(
  const wasmdec_module_t*, size_t index, own wasmdec_name_t* out);
// Borrowed from the decoded binary.
const byte_t* wasmdec_module_custom_data(
  const wasmdec_module_t*, size_t index, size_t* size);


///////////////////////////////////////////////////////////////////////////////

#undef own

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // #ifdef __WASMDEC_H
