#ifndef __WASMDEC_IMPL_HH
#define __WASMDEC_IMPL_HH

#include "wasmdec.hh"

#include <vector>

#ifdef WASMDEC_DEBUG
#include <atomic>
#endif


namespace wasmdec {

///////////////////////////////////////////////////////////////////////////////
// Auxiliaries

template<class C> struct implement;

template<class C>
auto impl(C* x) -> typename implement <C>::type* {
  return reinterpret_cast<typename implement<C>::type*>(x);
}

template<class C>
auto impl(const C* x) -> const typename implement<C>::type* {
  return reinterpret_cast<const typename implement<C>::type*>(x);
}

template<class C>
auto seal(typename implement <C>::type* x) -> C* {
  return reinterpret_cast<C*>(x);
}

template<class C>
auto seal(const typename implement <C>::type* x) -> const C* {
  return reinterpret_cast<const C*>(x);
}


///////////////////////////////////////////////////////////////////////////////
// Debug aids

struct Stats {
  enum category_t {
    CONFIG, DECODER, ERROR,
    VALTYPE, FUNCTYPE, GLOBALTYPE, TABLETYPE, MEMORYTYPE,
    IMPORT, EXPORT, GLOBAL, ELEM, CODE, DATA, CUSTOM,
    INSTR, MODULE,
    CATEGORY_COUNT
  };

#ifdef WASMDEC_DEBUG
  static const char* name[CATEGORY_COUNT];

  std::atomic<size_t> made[CATEGORY_COUNT];
  std::atomic<size_t> freed[CATEGORY_COUNT];

  Stats();
  ~Stats();
#endif

  void make(category_t i, void* ptr);
  void free(category_t i, void* ptr);
};

extern Stats stats;


///////////////////////////////////////////////////////////////////////////////
// Shared implementations

// Instructions

struct OpcodeInfo {
  Opcode opcode;
  InstrFamily family;
  Immediate immediate;
  const char* name;
};

struct InstrImpl {
  const OpcodeInfo* info;
  BlockType type;
  ownvec<Instr> body;
  ownvec<Instr> else_body;
  vec<uint32_t> labels;
  uint32_t index;
  MemArg memarg;
  union {
    int32_t i32;
    int64_t i64;
    float32_t f32;
    float64_t f64;
  } value;

  explicit InstrImpl(const OpcodeInfo* info) :
    info(info), type(BlockType::empty()),
    body(ownvec<Instr>::make()), else_body(ownvec<Instr>::make()),
    labels(vec<uint32_t>::make()), index(0), memarg{0, 0}
  {
    value.i64 = 0;
    stats.make(Stats::INSTR, this);
  }

  ~InstrImpl();
};

template<> struct implement<Instr> { using type = InstrImpl; };


// Modules

struct ModuleImpl {
  vec<Section> sections;
  ownvec<FuncType> types;
  ownvec<Import> imports;
  vec<uint32_t> funcs;
  ownvec<TableType> tables;
  ownvec<MemoryType> memories;
  ownvec<Global> globals;
  ownvec<Export> exports;
  bool has_start;
  uint32_t start;
  ownvec<Elem> elems;
  ownvec<Code> codes;
  ownvec<Data> datas;
  ownvec<Custom> customs;

  // Assembly state, folded into the vectors above by finish().
  std::vector<Section> framed;
  std::vector<own<Custom*>> pending_customs;
  uint32_t seen;      // bit set of known section ids
  uint8_t last_id;    // highest known section id so far

  ModuleImpl();
  ~ModuleImpl();

  auto finish() -> bool;
};

template<> struct implement<Module> { using type = ModuleImpl; };

}  // namespace wasmdec

#endif  // #ifdef __WASMDEC_IMPL_HH
