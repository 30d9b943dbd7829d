#include <algorithm>
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <string>
#include <cinttypes>
#include <cstdio>

#include "wasmdec.hh"

// A module with a type, an import, a function, a memory, an export,
// a data segment and a custom section.
const byte_t sample_binary[] = {
  0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00,
  0x01, 0x06, 0x01, 0x60, 0x01, 0x7f, 0x01, 0x7f,
  0x02, 0x0b, 0x01, 0x03, 'e', 'n', 'v', 0x03, 'l', 'o', 'g', 0x00, 0x00,
  0x03, 0x02, 0x01, 0x00,
  0x05, 0x03, 0x01, 0x00, 0x01,
  0x07, 0x07, 0x01, 0x03, 'i', 'n', 'c', 0x00, 0x01,
  0x0a, 0x0c, 0x01, 0x0a, 0x00, 0x02, 0x7f, 0x20, 0x00, 0x41, 0x01, 0x6a,
    0x0b, 0x0b,
  0x0b, 0x09, 0x01, 0x00, 0x41, 0x00, 0x0b, 0x03, 'h', 'i', '!',
  0x00, 0x07, 0x04, 'n', 'o', 't', 'e', 0x01, 0x02,
};

auto load_binary(const char* file_path) -> wasmdec::vec<byte_t> {
  std::cout << "Loading binary..." << std::endl;
  std::ifstream file(file_path, std::ios::binary);
  file.seekg(0, std::ios_base::end);
  auto file_size = file.tellg();
  file.seekg(0);
  if (file.fail() || file_size < 0) {
    std::cout << "> Error loading module!" << std::endl;
    exit(EXIT_FAILURE);
  }
  auto binary = wasmdec::vec<byte_t>::make_uninitialized(file_size);
  file.read(binary.get(), file_size);
  file.close();
  if (!binary || file.fail()) {
    std::cout << "> Error loading module!" << std::endl;
    exit(EXIT_FAILURE);
  }
  return binary;
}

auto sample() -> wasmdec::vec<byte_t> {
  auto binary = wasmdec::vec<byte_t>::make_uninitialized(sizeof(sample_binary));
  std::copy(sample_binary, sample_binary + sizeof(sample_binary), binary.get());
  return binary;
}

auto to_string(const wasmdec::Name& name) -> std::string {
  return std::string(name.get(), name.size());
}

auto to_string(wasmdec::ValKind kind) -> const char* {
  switch (kind) {
    case wasmdec::I32: return "i32";
    case wasmdec::I64: return "i64";
    case wasmdec::F32: return "f32";
    case wasmdec::F64: return "f64";
    case wasmdec::FUNCREF: return "funcref";
  }
  return "?";
}

auto to_string(wasmdec::ExternKind kind) -> const char* {
  switch (kind) {
    case wasmdec::EXTERN_FUNC: return "func";
    case wasmdec::EXTERN_TABLE: return "table";
    case wasmdec::EXTERN_MEMORY: return "memory";
    case wasmdec::EXTERN_GLOBAL: return "global";
  }
  return "?";
}
