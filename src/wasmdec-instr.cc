#include "wasmdec-bin.hh"
#include "wasmdec-impl.hh"

#include <vector>

namespace wasmdec {
namespace bin {

////////////////////////////////////////////////////////////////////////////////
// Opcode table

namespace {

const OpcodeInfo opcodes[] = {
#define WASMDEC_OPCODE_INFO(name, code, family, imm, text) \
  {OP_##name, FAMILY_##family, IMM_##imm, text},
  WASMDEC_FOREACH_OPCODE(WASMDEC_OPCODE_INFO)
#undef WASMDEC_OPCODE_INFO
};

const uint8_t PREFIX_MISC = 0xfc;
const size_t PREFIXED_SIZE = 0x20;

struct OpcodeTable {
  const OpcodeInfo* primary[256];
  const OpcodeInfo* prefixed[PREFIXED_SIZE];

  OpcodeTable() {
    for (auto& p : primary) p = nullptr;
    for (auto& p : prefixed) p = nullptr;
    for (auto& info : opcodes) {
      uint32_t code = info.opcode;
      if (code < 0x100) {
        primary[code] = &info;
      } else {
        assert((code >> 8) == PREFIX_MISC && (code & 0xff) < PREFIXED_SIZE);
        prefixed[code & 0xff] = &info;
      }
    }
  }

  auto lookup(uint32_t code) const -> const OpcodeInfo* {
    if (code < 0x100) return primary[code];
    if ((code >> 8) == PREFIX_MISC && (code & 0xff) < PREFIXED_SIZE) {
      return prefixed[code & 0xff];
    }
    return nullptr;
  }
};

auto table() -> const OpcodeTable& {
  static const OpcodeTable instance;
  return instance;
}

}  // namespace

auto opcode_info(Opcode op) -> const OpcodeInfo* {
  return table().lookup(op);
}


////////////////////////////////////////////////////////////////////////////////
// Immediates

namespace {

auto reserved(Reader& in) -> bool {
  auto start = in.offset();
  auto b = bin::u8(in);
  if (in && b != 0) {
    return in.fail_at(start, ERROR_INVALID_TAG,
      "reserved byte must be zero, got 0x%02x", b);
  }
  return bool(in);
}

auto immediates(Reader& in, InstrImpl* instr) -> bool {
  switch (instr->info->immediate) {
    case IMM_NONE:
      break;
    case IMM_BLOCK:
    case IMM_IF:
      instr->type = bin::blocktype(in);
      break;
    case IMM_LABEL:
    case IMM_FUNC:
    case IMM_INDEX:
      instr->index = bin::u32(in);
      break;
    case IMM_LABELS: {
      auto size = bin::vec_size(in);
      if (!in) return false;
      auto labels = vec<uint32_t>::make_uninitialized(size);
      if (!labels) return in.fail_oom();
      for (uint32_t i = 0; i < size; ++i) labels[i] = bin::u32(in);
      instr->labels = std::move(labels);
      instr->index = bin::u32(in);
    } break;
    case IMM_CALL_INDIRECT:
      instr->index = bin::u32(in);
      reserved(in);
      break;
    case IMM_MEMARG:
      instr->memarg.align = bin::u32(in);
      instr->memarg.offset = bin::u32(in);
      break;
    case IMM_MEMORY:
      reserved(in);
      break;
    case IMM_I32:
      instr->value.i32 = bin::s32(in);
      break;
    case IMM_I64:
      instr->value.i64 = bin::s64(in);
      break;
    case IMM_F32:
      instr->value.f32 = bin::f32(in);
      break;
    case IMM_F64:
      instr->value.f64 = bin::f64(in);
      break;
  }
  return bool(in);
}


////////////////////////////////////////////////////////////////////////////////
// Structured decoding

using Seq = std::vector<own<Instr*>>;

// An open block, loop or if; the root frame has no instruction.
struct Frame {
  own<Instr*> instr;
  Seq body;
  Seq else_body;
  bool in_else;

  explicit Frame(own<Instr*>&& instr = own<Instr*>()) :
    instr(std::move(instr)), in_else(false) {}

  auto current() -> Seq& { return in_else ? else_body : body; }
};

auto sequence(Reader& in, Seq& seq) -> ownvec<Instr> {
  auto v = ownvec<Instr>::make(seq.size(), seq.data());
  if (!v) in.fail_oom();
  seq.clear();
  return v;
}

// Decodes instructions with an explicit frame stack. In single mode the
// first completed top-level instruction is returned in the root body;
// otherwise decoding stops at the `end` that closes the root.
auto structured(Reader& in, uint32_t max_depth, bool single) -> Seq {
  std::vector<Frame> stack;
  stack.emplace_back();

  while (in) {
    if (single && !stack.front().body.empty()) break;

    auto start = in.offset();
    auto b = bin::u8(in);
    if (!in) break;

    if (b == 0x0b) {
      if (stack.size() == 1) {
        if (single) {
          in.fail_at(start, ERROR_INVALID_TAG, "unexpected end");
          break;
        }
        return std::move(stack.front().body);
      }
      auto frame = std::move(stack.back());
      stack.pop_back();
      auto instr = impl(frame.instr.get());
      instr->body = sequence(in, frame.body);
      instr->else_body = sequence(in, frame.else_body);
      if (!in) break;
      stack.back().current().push_back(std::move(frame.instr));
      continue;
    }

    if (b == 0x05) {
      auto& frame = stack.back();
      if (stack.size() == 1 || frame.in_else ||
          frame.instr->opcode() != OP_IF) {
        in.fail_at(start, ERROR_INVALID_TAG, "unexpected else");
        break;
      }
      frame.in_else = true;
      continue;
    }

    uint32_t code = b;
    if (b == PREFIX_MISC) {
      auto selector = bin::u32(in);
      if (!in) break;
      if (selector >= PREFIXED_SIZE) {
        in.fail_at(start, ERROR_UNKNOWN_OPCODE,
          "unknown opcode 0x%02x %u", b, selector);
        break;
      }
      code = (code << 8) | selector;
    }
    auto info = table().lookup(code);
    if (!info) {
      if (code > 0xff) {
        in.fail_at(start, ERROR_UNKNOWN_OPCODE,
          "unknown opcode 0x%02x %u", code >> 8, code & 0xff);
      } else {
        in.fail_at(start, ERROR_UNKNOWN_OPCODE, "unknown opcode 0x%02x", b);
      }
      break;
    }

    auto instr = made(in, own<Instr*>(
      seal<Instr>(new(std::nothrow) InstrImpl(info))));
    if (!instr) break;

    auto opens = info->immediate == IMM_BLOCK || info->immediate == IMM_IF;
    if (opens && stack.size() - 1 >= max_depth) {
      in.fail_at(start, ERROR_NESTING_TOO_DEEP,
        "%s nested deeper than %u", info->name, max_depth);
      break;
    }
    if (!immediates(in, impl(instr.get()))) break;

    if (opens) {
      stack.emplace_back(std::move(instr));
    } else {
      stack.back().current().push_back(std::move(instr));
    }
  }

  if (in && single) return std::move(stack.front().body);
  return Seq();
}

}  // namespace


auto instr(Reader& in, uint32_t max_depth) -> own<Instr*> {
  auto seq = structured(in, max_depth, true);
  if (!in || seq.empty()) return own<Instr*>();
  return std::move(seq.front());
}

auto expr(Reader& in, uint32_t max_depth) -> Expr {
  auto seq = structured(in, max_depth, false);
  if (!in) return Expr::invalid();
  return sequence(in, seq);
}

}  // namespace bin
}  // namespace wasmdec
