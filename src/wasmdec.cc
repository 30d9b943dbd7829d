#include "wasmdec.hh"
#include "wasmdec-impl.hh"
#include "wasmdec-bin.hh"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>


namespace wasmdec {

///////////////////////////////////////////////////////////////////////////////
// Debug aids

#ifdef WASMDEC_DEBUG
const char* Stats::name[CATEGORY_COUNT] = {
  "Config", "Decoder", "Error",
  "ValType", "FuncType", "GlobalType", "TableType", "MemoryType",
  "Import", "Export", "Global", "Elem", "Code", "Data", "Custom",
  "Instr", "Module"
};

Stats::Stats() {
  for (int i = 0; i < CATEGORY_COUNT; ++i) {
    made[i] = freed[i] = 0;
  }
}

Stats::~Stats() {
  bool leak = false;
  for (int i = 0; i < CATEGORY_COUNT; ++i) {
    auto live = made[i] - freed[i];
    if (live) {
      std::cerr << "Leaked " << live << " instances of wasmdec::" << name[i]
        << ", made " << made[i] << ", freed " << freed[i] << "!"
        << std::endl;
      leak = true;
    }
  }
  if (leak) exit(1);
}
#endif

void Stats::make(category_t i, void* ptr) {
#ifdef WASMDEC_DEBUG
#ifdef WASMDEC_DEBUG_LOG
  if (ptr) {
    std::clog << "[make] " << ptr << " wasmdec::" << name[i] << std::endl;
  }
#endif
  made[i] += 1;
#endif
}

void Stats::free(category_t i, void* ptr) {
#ifdef WASMDEC_DEBUG
#ifdef WASMDEC_DEBUG_LOG
  if (ptr) {
    std::clog << "[free] " << ptr << " wasmdec::" << name[i] << std::endl;
  }
#endif
  freed[i] += 1;
  if (freed[i] > made[i]) {
    std::cerr << "Deleting instance of wasmdec::" << name[i]
      << " when none is alive"
      << ", made " << made[i] << ", freed " << freed[i] << "!"
      << std::endl;
    exit(1);
  }
#endif
}


Stats stats;


///////////////////////////////////////////////////////////////////////////////
// Decoder Environment

// Configuration

struct ConfigImpl {
  uint32_t max_nesting_depth = 1024;
  bool check_section_order = true;

  ConfigImpl() { stats.make(Stats::CONFIG, this); }
  ~ConfigImpl() { stats.free(Stats::CONFIG, this); }
};

template<> struct implement<Config> { using type = ConfigImpl; };


Config::~Config() {
  impl(this)->~ConfigImpl();
}

void Config::operator delete(void *p) {
  ::operator delete(p);
}

auto Config::make() -> own<Config*> {
  return own<Config*>(seal<Config>(new(std::nothrow) ConfigImpl()));
}

auto Config::max_nesting_depth() const -> uint32_t {
  return impl(this)->max_nesting_depth;
}

void Config::set_max_nesting_depth(uint32_t depth) {
  impl(this)->max_nesting_depth = depth;
}

auto Config::check_section_order() const -> bool {
  return impl(this)->check_section_order;
}

void Config::set_check_section_order(bool check) {
  impl(this)->check_section_order = check;
}


// Errors

struct ErrorImpl {
  ErrorKind kind;
  size_t offset;
  Message message;

  ErrorImpl(ErrorKind kind, size_t offset, Message& message) :
    kind(kind), offset(offset), message(std::move(message))
  {
    stats.make(Stats::ERROR, this);
  }

  ~ErrorImpl() {
    stats.free(Stats::ERROR, this);
  }
};

template<> struct implement<Error> { using type = ErrorImpl; };


Error::~Error() {
  impl(this)->~ErrorImpl();
}

void Error::operator delete(void *p) {
  ::operator delete(p);
}

auto Error::make(ErrorKind kind, size_t offset, const Message& msg)
  -> own<Error*> {
  auto message = msg.clone();
  return message
    ? own<Error*>(
        seal<Error>(new(std::nothrow) ErrorImpl(kind, offset, message)))
    : own<Error*>();
}

auto Error::clone() const -> own<Error*> {
  return make(kind(), offset(), impl(this)->message);
}

auto Error::kind() const -> ErrorKind {
  return impl(this)->kind;
}

auto Error::offset() const -> size_t {
  return impl(this)->offset;
}

auto Error::message() const -> Message {
  return impl(this)->message.clone();
}


///////////////////////////////////////////////////////////////////////////////
// Type Representations

// Value Types

struct ValTypeImpl {
  ValKind kind;

  ValTypeImpl(ValKind kind) : kind(kind) {}
};

template<> struct implement<ValType> { using type = ValTypeImpl; };

ValTypeImpl* valtype_i32 = new ValTypeImpl(I32);
ValTypeImpl* valtype_i64 = new ValTypeImpl(I64);
ValTypeImpl* valtype_f32 = new ValTypeImpl(F32);
ValTypeImpl* valtype_f64 = new ValTypeImpl(F64);
ValTypeImpl* valtype_funcref = new ValTypeImpl(FUNCREF);


ValType::~ValType() {
  stats.free(Stats::VALTYPE, this);
}

void ValType::operator delete(void*) {}

auto ValType::make(ValKind k) -> own<ValType*> {
  ValTypeImpl* valtype;
  switch (k) {
    case I32: valtype = valtype_i32; break;
    case I64: valtype = valtype_i64; break;
    case F32: valtype = valtype_f32; break;
    case F64: valtype = valtype_f64; break;
    case FUNCREF: valtype = valtype_funcref; break;
    default:
      return own<ValType*>();
  }
  auto result = seal<ValType>(valtype);
  stats.make(Stats::VALTYPE, result);
  return own<ValType*>(result);
}

auto ValType::clone() const -> own<ValType*> {
  return make(kind());
}

auto ValType::kind() const -> ValKind {
  return impl(this)->kind;
}


// Extern Types

struct ExternTypeImpl {
  ExternKind kind;

  explicit ExternTypeImpl(ExternKind kind) : kind(kind) {}
  virtual ~ExternTypeImpl() {}
};

template<> struct implement<ExternType> { using type = ExternTypeImpl; };


ExternType::~ExternType() {
  impl(this)->~ExternTypeImpl();
}

void ExternType::operator delete(void *p) {
  ::operator delete(p);
}

auto ExternType::clone() const -> own<ExternType*> {
  switch (kind()) {
    case EXTERN_FUNC: return func()->clone();
    case EXTERN_GLOBAL: return global()->clone();
    case EXTERN_TABLE: return table()->clone();
    case EXTERN_MEMORY: return memory()->clone();
  }
  return own<ExternType*>();
}

auto ExternType::kind() const -> ExternKind {
  return impl(this)->kind;
}


// Function Types

struct FuncTypeImpl : ExternTypeImpl {
  ownvec<ValType> params;
  ownvec<ValType> results;

  FuncTypeImpl(ownvec<ValType>& params, ownvec<ValType>& results) :
    ExternTypeImpl(EXTERN_FUNC),
    params(std::move(params)), results(std::move(results))
  {
    stats.make(Stats::FUNCTYPE, this);
  }

  ~FuncTypeImpl() {
    stats.free(Stats::FUNCTYPE, this);
  }
};

template<> struct implement<FuncType> { using type = FuncTypeImpl; };


FuncType::~FuncType() {}

auto FuncType::make(ownvec<ValType>&& params, ownvec<ValType>&& results)
  -> own<FuncType*> {
  return params && results
    ? own<FuncType*>(
        seal<FuncType>(new(std::nothrow) FuncTypeImpl(params, results)))
    : own<FuncType*>();
}

auto FuncType::clone() const -> own<FuncType*> {
  return make(params().clone(), results().clone());
}

auto FuncType::params() const -> const ownvec<ValType>& {
  return impl(this)->params;
}

auto FuncType::results() const -> const ownvec<ValType>& {
  return impl(this)->results;
}


auto ExternType::func() -> FuncType* {
  return kind() == EXTERN_FUNC
    ? seal<FuncType>(static_cast<FuncTypeImpl*>(impl(this)))
    : nullptr;
}

auto ExternType::func() const -> const FuncType* {
  return kind() == EXTERN_FUNC
    ? seal<FuncType>(static_cast<const FuncTypeImpl*>(impl(this)))
    : nullptr;
}


// Global Types

struct GlobalTypeImpl : ExternTypeImpl {
  own<ValType*> content;
  Mutability mutability;

  GlobalTypeImpl(own<ValType*>& content, Mutability mutability) :
    ExternTypeImpl(EXTERN_GLOBAL),
    content(std::move(content)), mutability(mutability)
  {
    stats.make(Stats::GLOBALTYPE, this);
  }

  ~GlobalTypeImpl() {
    stats.free(Stats::GLOBALTYPE, this);
  }
};

template<> struct implement<GlobalType> { using type = GlobalTypeImpl; };


GlobalType::~GlobalType() {}

auto GlobalType::make(
  own<ValType*>&& content, Mutability mutability
) -> own<GlobalType*> {
  return content
    ? own<GlobalType*>(
        seal<GlobalType>(new(std::nothrow) GlobalTypeImpl(content, mutability)))
    : own<GlobalType*>();
}

auto GlobalType::clone() const -> own<GlobalType*> {
  return make(content()->clone(), mutability());
}

auto GlobalType::content() const -> const ValType* {
  return impl(this)->content.get();
}

auto GlobalType::mutability() const -> Mutability {
  return impl(this)->mutability;
}


auto ExternType::global() -> GlobalType* {
  return kind() == EXTERN_GLOBAL
    ? seal<GlobalType>(static_cast<GlobalTypeImpl*>(impl(this)))
    : nullptr;
}

auto ExternType::global() const -> const GlobalType* {
  return kind() == EXTERN_GLOBAL
    ? seal<GlobalType>(static_cast<const GlobalTypeImpl*>(impl(this)))
    : nullptr;
}


// Table Types

struct TableTypeImpl : ExternTypeImpl {
  own<ValType*> element;
  Limits limits;

  TableTypeImpl(own<ValType*>& element, Limits limits) :
    ExternTypeImpl(EXTERN_TABLE), element(std::move(element)), limits(limits)
  {
    stats.make(Stats::TABLETYPE, this);
  }

  ~TableTypeImpl() {
    stats.free(Stats::TABLETYPE, this);
  }
};

template<> struct implement<TableType> { using type = TableTypeImpl; };


TableType::~TableType() {}

auto TableType::make(own<ValType*>&& element, Limits limits) -> own<TableType*> {
  return element
    ? own<TableType*>(
        seal<TableType>(new(std::nothrow) TableTypeImpl(element, limits)))
    : own<TableType*>();
}

auto TableType::clone() const -> own<TableType*> {
  return make(element()->clone(), limits());
}

auto TableType::element() const -> const ValType* {
  return impl(this)->element.get();
}

auto TableType::limits() const -> const Limits& {
  return impl(this)->limits;
}


auto ExternType::table() -> TableType* {
  return kind() == EXTERN_TABLE
    ? seal<TableType>(static_cast<TableTypeImpl*>(impl(this)))
    : nullptr;
}

auto ExternType::table() const -> const TableType* {
  return kind() == EXTERN_TABLE
    ? seal<TableType>(static_cast<const TableTypeImpl*>(impl(this)))
    : nullptr;
}


// Memory Types

struct MemoryTypeImpl : ExternTypeImpl {
  Limits limits;

  MemoryTypeImpl(Limits limits) :
    ExternTypeImpl(EXTERN_MEMORY), limits(limits)
  {
    stats.make(Stats::MEMORYTYPE, this);
  }

  ~MemoryTypeImpl() {
    stats.free(Stats::MEMORYTYPE, this);
  }
};

template<> struct implement<MemoryType> { using type = MemoryTypeImpl; };


MemoryType::~MemoryType() {}

auto MemoryType::make(Limits limits) -> own<MemoryType*> {
  return own<MemoryType*>(
    seal<MemoryType>(new(std::nothrow) MemoryTypeImpl(limits)));
}

auto MemoryType::clone() const -> own<MemoryType*> {
  return MemoryType::make(limits());
}

auto MemoryType::limits() const -> const Limits& {
  return impl(this)->limits;
}


auto ExternType::memory() -> MemoryType* {
  return kind() == EXTERN_MEMORY
    ? seal<MemoryType>(static_cast<MemoryTypeImpl*>(impl(this)))
    : nullptr;
}

auto ExternType::memory() const -> const MemoryType* {
  return kind() == EXTERN_MEMORY
    ? seal<MemoryType>(static_cast<const MemoryTypeImpl*>(impl(this)))
    : nullptr;
}


///////////////////////////////////////////////////////////////////////////////
// Instructions

namespace {

void detach(ownvec<Instr>& v, std::vector<Instr*>& pending) {
  for (size_t i = 0; i < v.size(); ++i) {
    if (auto instr = v[i].release()) pending.push_back(instr);
  }
}

}  // namespace

// Nested bodies are torn down through a worklist, so freeing a tree takes
// constant native stack however deep it was decoded.
InstrImpl::~InstrImpl() {
  std::vector<Instr*> pending;
  detach(body, pending);
  detach(else_body, pending);
  while (!pending.empty()) {
    auto instr = pending.back();
    pending.pop_back();
    detach(impl(instr)->body, pending);
    detach(impl(instr)->else_body, pending);
    delete instr;
  }
  stats.free(Stats::INSTR, this);
}

Instr::~Instr() {
  impl(this)->~InstrImpl();
}

void Instr::operator delete(void *p) {
  ::operator delete(p);
}

auto Instr::opcode() const -> Opcode {
  return impl(this)->info->opcode;
}

auto Instr::family() const -> InstrFamily {
  return impl(this)->info->family;
}

auto Instr::immediate() const -> Immediate {
  return impl(this)->info->immediate;
}

auto Instr::name() const -> const char* {
  return impl(this)->info->name;
}

auto Instr::block_type() const -> BlockType {
  assert(immediate() == IMM_BLOCK || immediate() == IMM_IF);
  return impl(this)->type;
}

auto Instr::body() const -> const ownvec<Instr>& {
  return impl(this)->body;
}

auto Instr::else_body() const -> const ownvec<Instr>& {
  return impl(this)->else_body;
}

auto Instr::index() const -> uint32_t {
  return impl(this)->index;
}

auto Instr::labels() const -> const vec<uint32_t>& {
  return impl(this)->labels;
}

auto Instr::memarg() const -> MemArg {
  assert(immediate() == IMM_MEMARG);
  return impl(this)->memarg;
}

auto Instr::i32() const -> int32_t {
  assert(immediate() == IMM_I32);
  return impl(this)->value.i32;
}

auto Instr::i64() const -> int64_t {
  assert(immediate() == IMM_I64);
  return impl(this)->value.i64;
}

auto Instr::f32() const -> float32_t {
  assert(immediate() == IMM_F32);
  return impl(this)->value.f32;
}

auto Instr::f64() const -> float64_t {
  assert(immediate() == IMM_F64);
  return impl(this)->value.f64;
}


///////////////////////////////////////////////////////////////////////////////
// Module Components

// Imports

struct ImportImpl {
  Name module;
  Name name;
  ExternKind kind;
  uint32_t type_index;
  own<ExternType*> type;

  ImportImpl(Name& module, Name& name, uint32_t type_index) :
    module(std::move(module)), name(std::move(name)),
    kind(EXTERN_FUNC), type_index(type_index)
  {
    stats.make(Stats::IMPORT, this);
  }

  ImportImpl(Name& module, Name& name, own<ExternType*>& type) :
    module(std::move(module)), name(std::move(name)),
    kind(type->kind()), type_index(0), type(std::move(type))
  {
    stats.make(Stats::IMPORT, this);
  }

  ~ImportImpl() {
    stats.free(Stats::IMPORT, this);
  }
};

template<> struct implement<Import> { using type = ImportImpl; };


Import::~Import() {
  impl(this)->~ImportImpl();
}

void Import::operator delete(void *p) {
  ::operator delete(p);
}

auto Import::make(Name&& module, Name&& name, uint32_t type_index)
  -> own<Import*> {
  return module && name
    ? own<Import*>(
        seal<Import>(new(std::nothrow) ImportImpl(module, name, type_index)))
    : own<Import*>();
}

auto Import::make(Name&& module, Name&& name, own<ExternType*>&& type)
  -> own<Import*> {
  return module && name && type && type->kind() != EXTERN_FUNC
    ? own<Import*>(
        seal<Import>(new(std::nothrow) ImportImpl(module, name, type)))
    : own<Import*>();
}

auto Import::module() const -> const Name& {
  return impl(this)->module;
}

auto Import::name() const -> const Name& {
  return impl(this)->name;
}

auto Import::kind() const -> ExternKind {
  return impl(this)->kind;
}

auto Import::type_index() const -> uint32_t {
  assert(kind() == EXTERN_FUNC);
  return impl(this)->type_index;
}

auto Import::type() const -> const ExternType* {
  return impl(this)->type.get();
}


// Exports

struct ExportImpl {
  Name name;
  ExternKind kind;
  uint32_t index;

  ExportImpl(Name& name, ExternKind kind, uint32_t index) :
    name(std::move(name)), kind(kind), index(index)
  {
    stats.make(Stats::EXPORT, this);
  }

  ~ExportImpl() {
    stats.free(Stats::EXPORT, this);
  }
};

template<> struct implement<Export> { using type = ExportImpl; };


Export::~Export() {
  impl(this)->~ExportImpl();
}

void Export::operator delete(void *p) {
  ::operator delete(p);
}

auto Export::make(Name&& name, ExternKind kind, uint32_t index)
  -> own<Export*> {
  return name
    ? own<Export*>(
        seal<Export>(new(std::nothrow) ExportImpl(name, kind, index)))
    : own<Export*>();
}

auto Export::name() const -> const Name& {
  return impl(this)->name;
}

auto Export::kind() const -> ExternKind {
  return impl(this)->kind;
}

auto Export::index() const -> uint32_t {
  return impl(this)->index;
}


// Globals

struct GlobalImpl {
  own<GlobalType*> type;
  Expr init;

  GlobalImpl(own<GlobalType*>& type, Expr& init) :
    type(std::move(type)), init(std::move(init))
  {
    stats.make(Stats::GLOBAL, this);
  }

  ~GlobalImpl() {
    stats.free(Stats::GLOBAL, this);
  }
};

template<> struct implement<Global> { using type = GlobalImpl; };


Global::~Global() {
  impl(this)->~GlobalImpl();
}

void Global::operator delete(void *p) {
  ::operator delete(p);
}

auto Global::make(own<GlobalType*>&& type, Expr&& init) -> own<Global*> {
  return type && init
    ? own<Global*>(seal<Global>(new(std::nothrow) GlobalImpl(type, init)))
    : own<Global*>();
}

auto Global::type() const -> const GlobalType* {
  return impl(this)->type.get();
}

auto Global::init() const -> const Expr& {
  return impl(this)->init;
}


// Element Segments

struct ElemImpl {
  uint32_t table;
  Expr offset;
  vec<uint32_t> funcs;

  ElemImpl(uint32_t table, Expr& offset, vec<uint32_t>& funcs) :
    table(table), offset(std::move(offset)), funcs(std::move(funcs))
  {
    stats.make(Stats::ELEM, this);
  }

  ~ElemImpl() {
    stats.free(Stats::ELEM, this);
  }
};

template<> struct implement<Elem> { using type = ElemImpl; };


Elem::~Elem() {
  impl(this)->~ElemImpl();
}

void Elem::operator delete(void *p) {
  ::operator delete(p);
}

auto Elem::make(uint32_t table, Expr&& offset, vec<uint32_t>&& funcs)
  -> own<Elem*> {
  return offset && funcs
    ? own<Elem*>(seal<Elem>(new(std::nothrow) ElemImpl(table, offset, funcs)))
    : own<Elem*>();
}

auto Elem::table_index() const -> uint32_t {
  return impl(this)->table;
}

auto Elem::offset() const -> const Expr& {
  return impl(this)->offset;
}

auto Elem::funcs() const -> const vec<uint32_t>& {
  return impl(this)->funcs;
}


// Function Bodies

struct CodeImpl {
  uint32_t size;
  vec<Local> locals;
  Expr body;

  CodeImpl(uint32_t size, vec<Local>& locals, Expr& body) :
    size(size), locals(std::move(locals)), body(std::move(body))
  {
    stats.make(Stats::CODE, this);
  }

  ~CodeImpl() {
    stats.free(Stats::CODE, this);
  }
};

template<> struct implement<Code> { using type = CodeImpl; };


Code::~Code() {
  impl(this)->~CodeImpl();
}

void Code::operator delete(void *p) {
  ::operator delete(p);
}

auto Code::make(uint32_t size, vec<Local>&& locals, Expr&& body)
  -> own<Code*> {
  return locals && body
    ? own<Code*>(seal<Code>(new(std::nothrow) CodeImpl(size, locals, body)))
    : own<Code*>();
}

auto Code::size() const -> uint32_t {
  return impl(this)->size;
}

auto Code::locals() const -> const vec<Local>& {
  return impl(this)->locals;
}

auto Code::body() const -> const Expr& {
  return impl(this)->body;
}


// Data Segments

struct DataImpl {
  uint32_t memory;
  Expr offset;
  const byte_t* data;
  size_t size;

  DataImpl(uint32_t memory, Expr& offset, const byte_t* data, size_t size) :
    memory(memory), offset(std::move(offset)), data(data), size(size)
  {
    stats.make(Stats::DATA, this);
  }

  ~DataImpl() {
    stats.free(Stats::DATA, this);
  }
};

template<> struct implement<Data> { using type = DataImpl; };


Data::~Data() {
  impl(this)->~DataImpl();
}

void Data::operator delete(void *p) {
  ::operator delete(p);
}

auto Data::make(uint32_t memory, Expr&& offset, const byte_t* data, size_t size)
  -> own<Data*> {
  return offset
    ? own<Data*>(
        seal<Data>(new(std::nothrow) DataImpl(memory, offset, data, size)))
    : own<Data*>();
}

auto Data::memory_index() const -> uint32_t {
  return impl(this)->memory;
}

auto Data::offset() const -> const Expr& {
  return impl(this)->offset;
}

auto Data::data() const -> const byte_t* {
  return impl(this)->data;
}

auto Data::size() const -> size_t {
  return impl(this)->size;
}


// Custom Sections

struct CustomImpl {
  Name name;
  const byte_t* data;
  size_t size;

  CustomImpl(Name& name, const byte_t* data, size_t size) :
    name(std::move(name)), data(data), size(size)
  {
    stats.make(Stats::CUSTOM, this);
  }

  ~CustomImpl() {
    stats.free(Stats::CUSTOM, this);
  }
};

template<> struct implement<Custom> { using type = CustomImpl; };


Custom::~Custom() {
  impl(this)->~CustomImpl();
}

void Custom::operator delete(void *p) {
  ::operator delete(p);
}

auto Custom::make(Name&& name, const byte_t* data, size_t size)
  -> own<Custom*> {
  return name
    ? own<Custom*>(seal<Custom>(new(std::nothrow) CustomImpl(name, data, size)))
    : own<Custom*>();
}

auto Custom::name() const -> const Name& {
  return impl(this)->name;
}

auto Custom::data() const -> const byte_t* {
  return impl(this)->data;
}

auto Custom::size() const -> size_t {
  return impl(this)->size;
}


///////////////////////////////////////////////////////////////////////////////
// Modules

ModuleImpl::ModuleImpl() :
  sections(vec<Section>::make()),
  types(ownvec<FuncType>::make()),
  imports(ownvec<Import>::make()),
  funcs(vec<uint32_t>::make()),
  tables(ownvec<TableType>::make()),
  memories(ownvec<MemoryType>::make()),
  globals(ownvec<Global>::make()),
  exports(ownvec<Export>::make()),
  has_start(false), start(0),
  elems(ownvec<Elem>::make()),
  codes(ownvec<Code>::make()),
  datas(ownvec<Data>::make()),
  customs(ownvec<Custom>::make()),
  seen(0), last_id(SEC_CUSTOM)
{
  stats.make(Stats::MODULE, this);
}

ModuleImpl::~ModuleImpl() {
  stats.free(Stats::MODULE, this);
}

auto ModuleImpl::finish() -> bool {
  auto framed_sections = vec<Section>::make_uninitialized(framed.size());
  if (!framed_sections) return false;
  for (size_t i = 0; i < framed.size(); ++i) framed_sections[i] = framed[i];

  auto found = ownvec<Custom>::make(
    pending_customs.size(), pending_customs.data());
  if (!found) return false;

  sections = std::move(framed_sections);
  customs = std::move(found);
  framed.clear();
  pending_customs.clear();
  return true;
}


Module::~Module() {
  impl(this)->~ModuleImpl();
}

void Module::operator delete(void *p) {
  ::operator delete(p);
}

auto Module::sections() const -> const vec<Section>& {
  return impl(this)->sections;
}

auto Module::types() const -> const ownvec<FuncType>& {
  return impl(this)->types;
}

auto Module::imports() const -> const ownvec<Import>& {
  return impl(this)->imports;
}

auto Module::funcs() const -> const vec<uint32_t>& {
  return impl(this)->funcs;
}

auto Module::tables() const -> const ownvec<TableType>& {
  return impl(this)->tables;
}

auto Module::memories() const -> const ownvec<MemoryType>& {
  return impl(this)->memories;
}

auto Module::globals() const -> const ownvec<Global>& {
  return impl(this)->globals;
}

auto Module::exports() const -> const ownvec<Export>& {
  return impl(this)->exports;
}

auto Module::has_start() const -> bool {
  return impl(this)->has_start;
}

auto Module::start() const -> uint32_t {
  assert(has_start());
  return impl(this)->start;
}

auto Module::elems() const -> const ownvec<Elem>& {
  return impl(this)->elems;
}

auto Module::codes() const -> const ownvec<Code>& {
  return impl(this)->codes;
}

auto Module::datas() const -> const ownvec<Data>& {
  return impl(this)->datas;
}

auto Module::customs() const -> const ownvec<Custom>& {
  return impl(this)->customs;
}


///////////////////////////////////////////////////////////////////////////////
// Decoder

struct DecoderImpl {
  own<Config*> config;

  explicit DecoderImpl(own<Config*>& config) : config(std::move(config)) {
    stats.make(Stats::DECODER, this);
  }

  ~DecoderImpl() {
    stats.free(Stats::DECODER, this);
  }
};

template<> struct implement<Decoder> { using type = DecoderImpl; };


Decoder::~Decoder() {
  impl(this)->~DecoderImpl();
}

void Decoder::operator delete(void *p) {
  ::operator delete(p);
}

auto Decoder::make(own<Config*>&& config) -> own<Decoder*> {
  return config
    ? own<Decoder*>(seal<Decoder>(new(std::nothrow) DecoderImpl(config)))
    : own<Decoder*>();
}

auto Decoder::config() const -> const Config* {
  return impl(this)->config.get();
}

auto Decoder::decode(size_t size, const byte_t binary[], own<Module*>& module)
  const -> own<Error*> {
  bin::Reader in(binary, binary + size);
  auto result = bin::module(in, *config());
  if (!result) {
    auto error = in.release_error();
    if (!error) {
      error = Error::make(ERROR_OUT_OF_MEMORY, in.offset(),
        Message::make('o', 'u', 't', ' ', 'o', 'f', ' ',
          'm', 'e', 'm', 'o', 'r', 'y', '\0'));
    }
    return error;
  }
  module = std::move(result);
  return own<Error*>();
}

}  // namespace wasmdec
