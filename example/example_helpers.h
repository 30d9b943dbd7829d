#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <inttypes.h>

#include "wasmdec.h"

#define own

void check(bool success) {
  if (!success) {
    printf("> Error, expected success\n");
    exit(1);
  }
}

void print_name(const wasmdec_name_t* name) {
  printf("%.*s", (int)name->size, name->data);
}

void load_binary(const char *file_path, wasmdec_byte_vec_t *binary) {
  // Load binary.
  printf("Loading binary...\n");
  FILE* file = fopen(file_path, "rb");
  if (!file) {
    printf("> Error loading module!\n");
    exit(EXIT_FAILURE);
  }
  fseek(file, 0L, SEEK_END);
  long file_size = ftell(file);
  fseek(file, 0L, SEEK_SET);
  if (file_size < 0) {
    printf("> Error loading module!\n");
    exit(EXIT_FAILURE);
  }
  wasmdec_byte_vec_new_uninitialized(binary, (size_t)file_size);
  if (file_size > 0 && fread(binary->data, (size_t)file_size, 1, file) != 1) {
    printf("> Error loading module!\n");
    exit(EXIT_FAILURE);
  }
  fclose(file);
}

void decode_wasm(const char *file_path, void (*action)(const wasmdec_module_t*)) {
  // Initialize.
  printf("Initializing...\n");
  own wasmdec_config_t* config = wasmdec_config_new();
  wasmdec_config_set_check_section_order(config, true);
  own wasmdec_decoder_t* decoder = wasmdec_decoder_new_with_config(config);

  wasmdec_byte_vec_t binary;
  load_binary(file_path, &binary);

  // Decode.
  printf("Decoding module...\n");
  own wasmdec_module_t* module = NULL;
  own wasmdec_error_t* error = wasmdec_decode(decoder, &binary, &module);
  if (error) {
    wasmdec_message_t message;
    wasmdec_error_message(error, &message);
    printf("> Error decoding module at offset %zu: %s\n",
      wasmdec_error_offset(error), message.data);
    wasmdec_byte_vec_delete(&message);
    wasmdec_error_delete(error);
    exit(EXIT_FAILURE);
  }

  action(module);

  // The module borrows custom section bytes from the binary.
  wasmdec_module_delete(module);
  wasmdec_byte_vec_delete(&binary);

  // Shut down.
  printf("Shutting down...\n");
  wasmdec_decoder_delete(decoder);

  // All done.
  printf("Done.\n");
}
