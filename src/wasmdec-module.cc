#include "wasmdec-bin.hh"
#include "wasmdec-impl.hh"

#ifdef WASMDEC_DEBUG_LOG
#include <iostream>
#endif

namespace wasmdec {
namespace bin {

namespace {

const char* const section_names[] = {
  "custom", "type", "import", "function", "table", "memory",
  "global", "export", "start", "element", "code", "data"
};


////////////////////////////////////////////////////////////////////////////////
// Section entries

auto import_entry(Reader& in) -> own<Import*> {
  auto module = bin::name(in);
  auto name = bin::name(in);
  auto start = in.offset();
  auto kind = bin::u8(in);
  if (!in) return own<Import*>();

  own<ExternType*> type;
  switch (kind) {
    case EXTERN_FUNC: {
      auto index = bin::u32(in);
      if (!in) return own<Import*>();
      return made(in, Import::make(std::move(module), std::move(name), index));
    }
    case EXTERN_TABLE: type = bin::tabletype(in); break;
    case EXTERN_MEMORY: type = bin::memtype(in); break;
    case EXTERN_GLOBAL: type = bin::globaltype(in); break;
    default:
      in.fail_at(start, ERROR_INVALID_TAG, "invalid import kind 0x%02x", kind);
      return own<Import*>();
  }
  if (!in) return own<Import*>();
  return made(in, Import::make(
    std::move(module), std::move(name), std::move(type)));
}

auto global(Reader& in, uint32_t depth) -> own<Global*> {
  auto type = bin::globaltype(in);
  auto init = bin::expr(in, depth);
  if (!in) return own<Global*>();
  return made(in, Global::make(std::move(type), std::move(init)));
}

auto export_entry(Reader& in) -> own<Export*> {
  auto name = bin::name(in);
  auto start = in.offset();
  auto kind = bin::u8(in);
  auto index = bin::u32(in);
  if (!in) return own<Export*>();
  if (kind > EXTERN_GLOBAL) {
    in.fail_at(start, ERROR_INVALID_TAG, "invalid export kind 0x%02x", kind);
    return own<Export*>();
  }
  return made(in, Export::make(
    std::move(name), static_cast<ExternKind>(kind), index));
}

auto indices(Reader& in) -> vec<uint32_t> {
  auto size = bin::vec_size(in);
  if (!in) return vec<uint32_t>::invalid();
  auto v = vec<uint32_t>::make_uninitialized(size);
  if (!v) {
    in.fail_oom();
    return vec<uint32_t>::invalid();
  }
  for (uint32_t i = 0; i < size && in; ++i) v[i] = bin::u32(in);
  return in ? std::move(v) : vec<uint32_t>::invalid();
}

auto elem(Reader& in, uint32_t depth) -> own<Elem*> {
  auto table = bin::u32(in);
  auto offset = bin::expr(in, depth);
  auto funcs = indices(in);
  if (!in) return own<Elem*>();
  return made(in, Elem::make(table, std::move(offset), std::move(funcs)));
}

auto locals(Reader& in) -> vec<Local> {
  auto size = bin::vec_size(in);
  if (!in) return vec<Local>::invalid();
  auto v = vec<Local>::make_uninitialized(size);
  if (!v) {
    in.fail_oom();
    return vec<Local>::invalid();
  }
  for (uint32_t i = 0; i < size && in; ++i) {
    auto count = bin::u32(in);
    auto type = bin::valtype(in);
    if (in) v[i] = Local{count, type->kind()};
  }
  return in ? std::move(v) : vec<Local>::invalid();
}

// Each body is its own length-prefixed region, accounted like a section.
auto code(Reader& in, uint32_t depth) -> own<Code*> {
  auto start = in.offset();
  auto size = bin::u32(in);
  if (!in) return own<Code*>();
  if (size > in.remaining()) {
    in.take(size);  // reports the overrun
    return own<Code*>();
  }

  auto limit = in.enter(size);
  auto locals = bin::locals(in);
  auto body = bin::expr(in, depth);
  if (in && !in.at_limit()) {
    in.fail(ERROR_SECTION_LENGTH_MISMATCH,
      "function body at %zu ends %zu bytes before its declared size %u",
      start, in.remaining(), size);
  }
  in.leave(limit);
  if (!in) return own<Code*>();
  return made(in, Code::make(size, std::move(locals), std::move(body)));
}

auto data(Reader& in, uint32_t depth) -> own<Data*> {
  auto memory = bin::u32(in);
  auto offset = bin::expr(in, depth);
  auto size = bin::vec_size(in);
  auto bytes = in.take(size);
  if (!in) return own<Data*>();
  return made(in, Data::make(memory, std::move(offset), bytes, size));
}


////////////////////////////////////////////////////////////////////////////////
// Section payloads

void custom(Reader& in, ModuleImpl& m) {
  auto name = bin::name(in);
  if (!in) return;
  auto size = in.remaining();
  auto bytes = in.take(size);
  auto section = made(in, Custom::make(std::move(name), bytes, size));
  if (section) m.pending_customs.push_back(std::move(section));
}

void payload(Reader& in, uint8_t id, uint32_t depth, ModuleImpl& m) {
  switch (id) {
    case SEC_CUSTOM: {
      custom(in, m);
    } break;
    case SEC_TYPE: {
      m.types = bin::vector<FuncType>(in, bin::functype);
    } break;
    case SEC_IMPORT: {
      m.imports = bin::vector<Import>(in, import_entry);
    } break;
    case SEC_FUNC: {
      m.funcs = indices(in);
    } break;
    case SEC_TABLE: {
      m.tables = bin::vector<TableType>(in, bin::tabletype);
    } break;
    case SEC_MEMORY: {
      m.memories = bin::vector<MemoryType>(in, bin::memtype);
    } break;
    case SEC_GLOBAL: {
      m.globals = bin::vector<Global>(in,
        [depth](Reader& in) { return global(in, depth); });
    } break;
    case SEC_EXPORT: {
      m.exports = bin::vector<Export>(in, export_entry);
    } break;
    case SEC_START: {
      m.start = bin::u32(in);
      m.has_start = bool(in);
    } break;
    case SEC_ELEM: {
      m.elems = bin::vector<Elem>(in,
        [depth](Reader& in) { return elem(in, depth); });
    } break;
    case SEC_CODE: {
      m.codes = bin::vector<Code>(in,
        [depth](Reader& in) { return code(in, depth); });
    } break;
    case SEC_DATA: {
      m.datas = bin::vector<Data>(in,
        [depth](Reader& in) { return data(in, depth); });
    } break;
  }
}

}  // namespace


////////////////////////////////////////////////////////////////////////////////
// Sections

auto section(Reader& in, const Config& config, ModuleImpl& m) -> bool {
  auto start = in.offset();
  auto id = bin::u8(in);
  if (!in) return false;
  if (id > SEC_DATA) {
    return in.fail_at(start, ERROR_INVALID_TAG, "invalid section id %u", id);
  }

  if (id != SEC_CUSTOM) {
    if (m.seen & (1u << id)) {
      return in.fail_at(start, ERROR_SECTION_ORDER,
        "duplicate %s section", section_names[id]);
    }
    if (config.check_section_order() && id < m.last_id) {
      return in.fail_at(start, ERROR_SECTION_ORDER,
        "%s section after %s section",
        section_names[id], section_names[m.last_id]);
    }
    m.seen |= 1u << id;
    if (id > m.last_id) m.last_id = id;
  }

  auto size = bin::u32(in);
  if (!in) return false;
  if (size > in.remaining()) {
    return in.fail_at(start, ERROR_UNEXPECTED_END,
      "%s section of %u bytes exceeds the %zu bytes left",
      section_names[id], size, in.remaining());
  }

#ifdef WASMDEC_DEBUG_LOG
  std::clog << "[section] " << section_names[id] << " @" << start
    << " size " << size << std::endl;
#endif
  m.framed.push_back(Section{static_cast<SectionId>(id), start, size});

  auto limit = in.enter(size);
  payload(in, id, config.max_nesting_depth(), m);
  if (in && !in.at_limit()) {
    in.fail(ERROR_SECTION_LENGTH_MISMATCH,
      "%s section at %zu leaves %zu of %u declared bytes unread",
      section_names[id], start, in.remaining(), size);
  }
  in.leave(limit);
  return bool(in);
}


////////////////////////////////////////////////////////////////////////////////
// Modules

auto module(Reader& in, const Config& config) -> own<Module*> {
  static const uint8_t preamble[8] = {0x00, 0x61, 0x73, 0x6d, 1, 0, 0, 0};

  // A mismatching byte wins over a short buffer.
  auto available = in.remaining() < 8 ? in.remaining() : 8;
  for (size_t i = 0; i < available; ++i) {
    if (static_cast<uint8_t>(in.pos()[i]) != preamble[i]) {
      in.fail_at(in.offset() + i, ERROR_MAGIC_OR_VERSION, "%s",
        i < 4 ? "magic header not detected" : "unknown binary version");
      return own<Module*>();
    }
  }
  if (!in.take(8)) return own<Module*>();

  auto m = make_own(new(std::nothrow) ModuleImpl());
  if (!m) {
    in.fail_oom();
    return own<Module*>();
  }

  while (in && in.remaining() > 0) bin::section(in, config, *m);
  if (!in) return own<Module*>();

  if (m->funcs.size() != m->codes.size()) {
    size_t at = in.offset();
    for (auto& section : m->framed) {
      if (section.id == SEC_FUNC || section.id == SEC_CODE) at = section.offset;
    }
    in.fail_at(at, ERROR_FUNCTION_CODE_MISMATCH,
      "%zu functions declared but %zu bodies given",
      m->funcs.size(), m->codes.size());
    return own<Module*>();
  }

  if (!m->finish()) {
    in.fail_oom();
    return own<Module*>();
  }
  return own<Module*>(seal<Module>(m.release()));
}

}  // namespace bin
}  // namespace wasmdec
