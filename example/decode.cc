#include <iostream>
#include <string>

#include "wasmdec.hh"
#include "example_helpers.hh"


void print_expr(const wasmdec::Expr& expr, int indent) {
  for (size_t i = 0; i < expr.size(); ++i) {
    auto instr = expr[i].get();
    std::cout << std::string(indent, ' ') << instr->name();
    switch (instr->immediate()) {
      case wasmdec::IMM_LABEL:
      case wasmdec::IMM_FUNC:
      case wasmdec::IMM_INDEX:
      case wasmdec::IMM_CALL_INDIRECT:
        std::cout << " " << instr->index();
        break;
      case wasmdec::IMM_LABELS:
        for (size_t j = 0; j < instr->labels().size(); ++j) {
          std::cout << " " << instr->labels()[j];
        }
        std::cout << " " << instr->index();
        break;
      case wasmdec::IMM_MEMARG:
        std::cout << " offset=" << instr->memarg().offset
          << " align=" << instr->memarg().align;
        break;
      case wasmdec::IMM_I32: std::cout << " " << instr->i32(); break;
      case wasmdec::IMM_I64: std::cout << " " << instr->i64(); break;
      case wasmdec::IMM_F32: std::cout << " " << instr->f32(); break;
      case wasmdec::IMM_F64: std::cout << " " << instr->f64(); break;
      default: break;
    }
    std::cout << std::endl;
    if (instr->immediate() == wasmdec::IMM_BLOCK ||
        instr->immediate() == wasmdec::IMM_IF) {
      print_expr(instr->body(), indent + 2);
      if (instr->else_body().size() > 0) {
        std::cout << std::string(indent, ' ') << "else" << std::endl;
        print_expr(instr->else_body(), indent + 2);
      }
      std::cout << std::string(indent, ' ') << "end" << std::endl;
    }
  }
}


void run(int argc, const char* argv[]) {
  // Initialize.
  std::cout << "Initializing..." << std::endl;
  auto config = wasmdec::Config::make();
  config->set_max_nesting_depth(256);
  auto decoder = wasmdec::Decoder::make(std::move(config));

  // Load binary.
  auto binary = argc > 1 ? load_binary(argv[1]) : sample();

  // Decode.
  std::cout << "Decoding module..." << std::endl;
  wasmdec::own<wasmdec::Module*> module;
  auto error = decoder->decode(binary, module);
  if (error) {
    std::cout << "> Error decoding module at offset " << error->offset()
      << ": " << error->message().get() << std::endl;
    exit(EXIT_FAILURE);
  }

  // Sections.
  std::cout << "Sections:" << std::endl;
  auto& sections = module->sections();
  for (size_t i = 0; i < sections.size(); ++i) {
    std::cout << "> id " << static_cast<int>(sections[i].id)
      << " at " << sections[i].offset
      << ", " << sections[i].size << " bytes" << std::endl;
  }

  // Signatures.
  std::cout << "Types:" << std::endl;
  auto& types = module->types();
  for (size_t i = 0; i < types.size(); ++i) {
    std::cout << "> " << i << ": (";
    for (size_t j = 0; j < types[i]->params().size(); ++j) {
      std::cout << (j ? " " : "") << to_string(types[i]->params()[j]->kind());
    }
    std::cout << ") -> (";
    for (size_t j = 0; j < types[i]->results().size(); ++j) {
      std::cout << (j ? " " : "") << to_string(types[i]->results()[j]->kind());
    }
    std::cout << ")" << std::endl;
  }

  // Imports and exports.
  std::cout << "Imports:" << std::endl;
  auto& imports = module->imports();
  for (size_t i = 0; i < imports.size(); ++i) {
    std::cout << "> " << to_string(imports[i]->kind()) << " "
      << to_string(imports[i]->module()) << "."
      << to_string(imports[i]->name()) << std::endl;
  }
  std::cout << "Exports:" << std::endl;
  auto& exports = module->exports();
  for (size_t i = 0; i < exports.size(); ++i) {
    std::cout << "> " << to_string(exports[i]->kind()) << " "
      << exports[i]->index() << " as "
      << to_string(exports[i]->name()) << std::endl;
  }

  // Function bodies.
  size_t func_imports = 0;
  for (size_t i = 0; i < imports.size(); ++i) {
    if (imports[i]->kind() == wasmdec::EXTERN_FUNC) ++func_imports;
  }
  auto& codes = module->codes();
  for (size_t i = 0; i < codes.size(); ++i) {
    std::cout << "Function " << func_imports + i
      << ", " << codes[i]->size() << " bytes:" << std::endl;
    print_expr(codes[i]->body(), 2);
  }

  // Custom sections.
  auto& customs = module->customs();
  for (size_t i = 0; i < customs.size(); ++i) {
    std::cout << "Custom section \"" << to_string(customs[i]->name())
      << "\", " << customs[i]->size() << " bytes" << std::endl;
  }

  // Shut down.
  std::cout << "Shutting down..." << std::endl;
}


int main(int argc, const char* argv[]) {
  run(argc, argv);
  std::cout << "Done." << std::endl;
  return 0;
}
