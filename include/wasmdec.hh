// WebAssembly Binary Decoder C++ API

#ifndef __WASMDEC_HH
#define __WASMDEC_HH

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <limits>
#include <new>
#include <utility>


///////////////////////////////////////////////////////////////////////////////
// Auxiliaries

// Machine types

static_assert(sizeof(float) == sizeof(int32_t), "incompatible float type");
static_assert(sizeof(double) == sizeof(int64_t), "incompatible double type");
static_assert(sizeof(intptr_t) == sizeof(int32_t) ||
              sizeof(intptr_t) == sizeof(int64_t), "incompatible pointer type");

using byte_t = char;
using float32_t = float;
using float64_t = double;


namespace wasmdec {

// Ownership

template<class T> struct owner { using type = T; };
template<class T> struct owner<T*> { using type = std::unique_ptr<T>; };

template<class T>
using own = typename owner<T>::type;

template<class T>
auto make_own(T* x) -> own<T*> { return own<T*>(x); }


// Vectors

template<class T>
struct vec_traits {
  static void construct(size_t size, T data[]) {}
  static void destruct(size_t size, T data[]) {}
  static void move(size_t size, T* data, T init[]) {
    for (size_t i = 0; i < size; ++i) data[i] = std::move(init[i]);
  }
  static void clone(size_t size, T data[], const T init[]) {
    for (size_t i = 0; i < size; ++i) data[i] = init[i];
  }

  using proxy = T&;
};

template<class T>
struct vec_traits<T*> {
  static void construct(size_t size, T* data[]) {
    for (size_t i = 0; i < size; ++i) data[i] = nullptr;
  }
  static void destruct(size_t size, T* data[]) {
    for (size_t i = 0; i < size; ++i) {
      if (data[i]) delete data[i];
    }
  }
  static void move(size_t size, T* data[], own<T*> init[]) {
    for (size_t i = 0; i < size; ++i) data[i] = init[i].release();
  }
  static void clone(size_t size, T* data[], const T* const init[]) {
    for (size_t i = 0; i < size; ++i) {
      if (init[i]) data[i] = init[i]->clone().release();
    }
  }

  class proxy {
    T*& elem_;
  public:
    proxy(T*& elem) : elem_(elem) {}
    auto operator=(own<T*>&& elem) -> proxy& {
      reset(std::move(elem));
      return *this;
    }
    void reset(own<T*>&& val = own<T*>()) {
      if (elem_) delete elem_;
      elem_ = val.release();
    }
    auto release() -> T* {
      auto elem = elem_;
      elem_ = nullptr;
      return elem;
    }
    auto move() -> own<T*> { return make_own(release()); }
    auto get() -> T* { return elem_; }
    auto get() const -> const T* { return elem_; }
    auto operator->() -> T* { return elem_; }
    auto operator->() const -> const T* { return elem_; }
  };
};


template<class T>
class vec {
  static const size_t invalid_size = SIZE_MAX;

  size_t size_;
  std::unique_ptr<T[]> data_;

  vec(size_t size) : vec(size, size ? new(std::nothrow) T[size] : nullptr) {}
  vec(size_t size, T* data) : size_(data || !size ? size : invalid_size), data_(data) {}

public:
  vec(vec&& that) : vec(that.size_, that.data_.release()) {
    that.size_ = 0;
  }

  ~vec() {
    if (data_) vec_traits<T>::destruct(size_, data_.get());
  }

  operator bool() const {
    return bool(size_ != invalid_size);
  }

  auto size() const -> size_t {
    return size_;
  }

  auto get() const -> const T* {
    return data_.get();
  }

  auto get() -> T* {
    return data_.get();
  }

  auto release() -> T* {
    size_ = 0;
    return data_.release();
  }

  void reset() {
    if (data_) vec_traits<T>::destruct(size_, data_.get());
    size_ = 0;
    data_.reset();
  }

  void reset(vec& that) {
    reset();
    size_ = that.size_;
    data_.reset(that.data_.release());
    that.size_ = 0;
  }

  auto operator=(vec&& that) -> vec& {
    reset(that);
    return *this;
  }

  auto operator[](size_t i) -> typename vec_traits<T>::proxy {
    assert(i < size_);
    return typename vec_traits<T>::proxy(data_[i]);
  }

  auto operator[](size_t i) const -> const typename vec_traits<T>::proxy {
    assert(i < size_);
    return typename vec_traits<T>::proxy(data_[i]);
  }

  auto clone() const -> vec {
    if (size_ == invalid_size) return invalid();
    auto v = vec(size_);
    if (v) {
      vec_traits<T>::construct(size_, v.data_.get());
      vec_traits<T>::clone(size_, v.data_.get(), data_.get());
    }
    return v;
  }

  static auto make_uninitialized(size_t size = 0) -> vec {
    auto v = vec(size);
    if (v) vec_traits<T>::construct(size, v.data_.get());
    return v;
  }

  static auto make() -> vec {
    return vec(0);
  }

  static auto make(size_t size, own<T> init[]) -> vec {
    auto v = vec(size);
    if (v) vec_traits<T>::move(size, v.data_.get(), init);
    return v;
  }

  template<class U, class... Ts>
  static auto make(U&& arg, Ts&&... args) -> vec {
    own<T> data[] = { std::move(arg), std::move(args)... };
    return make(1 + sizeof...(Ts), data);
  }

  static auto adopt(size_t size, T data[]) -> vec {
    return vec(size, data);
  }

  static auto invalid() -> vec {
    return vec(invalid_size, nullptr);
  }
};

template<class T>
using ownvec = vec<T*>;


// Names and messages

// Names are raw UTF-8 byte strings without a terminator,
// messages are terminated by '\0'.
using Name = vec<byte_t>;
using Message = vec<byte_t>;


///////////////////////////////////////////////////////////////////////////////
// Decoder Environment

// Configuration

class Config {
public:
  Config() = delete;
  ~Config();
  void operator delete(void*);

  static auto make() -> own<Config*>;

  // Upper bound on simultaneously open block/loop/if constructs
  // within one expression. Zero rejects every structured instruction.
  auto max_nesting_depth() const -> uint32_t;
  void set_max_nesting_depth(uint32_t);

  // Reject known sections that appear after a section with a higher id.
  // Duplicate known sections are rejected regardless.
  auto check_section_order() const -> bool;
  void set_check_section_order(bool);
};


// Errors

enum ErrorKind : uint8_t {
  ERROR_UNEXPECTED_END,
  ERROR_INVALID_TAG,
  ERROR_UTF8,
  ERROR_INTEGER_OVERFLOW,
  ERROR_UNKNOWN_OPCODE,
  ERROR_SECTION_LENGTH_MISMATCH,
  ERROR_SECTION_ORDER,
  ERROR_MAGIC_OR_VERSION,
  ERROR_NESTING_TOO_DEEP,
  ERROR_FUNCTION_CODE_MISMATCH,
  ERROR_OUT_OF_MEMORY,
};

class Error {
public:
  Error() = delete;
  ~Error();
  void operator delete(void*);

  static auto make(ErrorKind, size_t offset, const Message& msg) -> own<Error*>;
  auto clone() const -> own<Error*>;

  auto kind() const -> ErrorKind;
  auto offset() const -> size_t;
  auto message() const -> Message;
};


///////////////////////////////////////////////////////////////////////////////
// Type Representations

// Type attributes

enum Mutability : uint8_t { CONST, VAR };

struct Limits {
  uint32_t min;
  uint32_t max;
  bool has_max;

  Limits(uint32_t min) :
    min(min), max(std::numeric_limits<uint32_t>::max()), has_max(false) {}
  Limits(uint32_t min, uint32_t max) :
    min(min), max(max), has_max(true) {}
};


// Value Types

enum ValKind : uint8_t {
  I32, I64, F32, F64,
  FUNCREF = 128,
};

inline bool is_num(ValKind k) { return k < FUNCREF; }
inline bool is_ref(ValKind k) { return k >= FUNCREF; }


class ValType {
public:
  ValType() = delete;
  ~ValType();
  void operator delete(void*);

  static auto make(ValKind) -> own<ValType*>;
  auto clone() const -> own<ValType*>;

  auto kind() const -> ValKind;
  auto is_num() const -> bool { return wasmdec::is_num(kind()); }
  auto is_ref() const -> bool { return wasmdec::is_ref(kind()); }
};


// External Types

// Enumerators follow the binary import/export descriptor tags.
enum ExternKind : uint8_t {
  EXTERN_FUNC, EXTERN_TABLE, EXTERN_MEMORY, EXTERN_GLOBAL
};

class FuncType;
class TableType;
class MemoryType;
class GlobalType;

class ExternType {
public:
  ExternType() = delete;
  ~ExternType();
  void operator delete(void*);

  auto clone() const-> own<ExternType*>;

  auto kind() const -> ExternKind;

  auto func() -> FuncType*;
  auto global() -> GlobalType*;
  auto table() -> TableType*;
  auto memory() -> MemoryType*;

  auto func() const -> const FuncType*;
  auto global() const -> const GlobalType*;
  auto table() const -> const TableType*;
  auto memory() const -> const MemoryType*;
};


// Function Types

class FuncType : public ExternType {
public:
  FuncType() = delete;
  ~FuncType();

  static auto make(
    ownvec<ValType>&& params = ownvec<ValType>::make(),
    ownvec<ValType>&& results = ownvec<ValType>::make()
  ) -> own<FuncType*>;

  auto clone() const -> own<FuncType*>;

  auto params() const -> const ownvec<ValType>&;
  auto results() const -> const ownvec<ValType>&;
};


// Global Types

class GlobalType : public ExternType {
public:
  GlobalType() = delete;
  ~GlobalType();

  static auto make(own<ValType*>&&, Mutability) -> own<GlobalType*>;
  auto clone() const -> own<GlobalType*>;

  auto content() const -> const ValType*;
  auto mutability() const -> Mutability;
};


// Table Types

class TableType : public ExternType {
public:
  TableType() = delete;
  ~TableType();

  static auto make(own<ValType*>&&, Limits) -> own<TableType*>;
  auto clone() const -> own<TableType*>;

  auto element() const -> const ValType*;
  auto limits() const -> const Limits&;
};


// Memory Types

class MemoryType : public ExternType {
public:
  MemoryType() = delete;
  ~MemoryType();

  static auto make(Limits) -> own<MemoryType*>;
  auto clone() const -> own<MemoryType*>;

  auto limits() const -> const Limits&;
};


// Block Types

struct BlockType {
  enum Kind : uint8_t { EMPTY, VALUE, INDEX };

  Kind kind;
  ValKind value;   // VALUE only
  uint32_t index;  // INDEX only, a type section index

  static auto empty() -> BlockType { return BlockType(EMPTY, I32, 0); }
  static auto result(ValKind k) -> BlockType { return BlockType(VALUE, k, 0); }
  static auto type(uint32_t i) -> BlockType { return BlockType(INDEX, I32, i); }

private:
  BlockType(Kind kind, ValKind value, uint32_t index) :
    kind(kind), value(value), index(index) {}
};


///////////////////////////////////////////////////////////////////////////////
// Instructions

// Opcode list: name, encoding, family, immediate, text format name.
// Prefixed opcodes are encoded as (prefix << 8) | selector.

#define WASMDEC_FOREACH_OPCODE(V) \
  V(UNREACHABLE, 0x00, CONTROL, NONE, "unreachable") \
  V(NOP, 0x01, CONTROL, NONE, "nop") \
  V(BLOCK, 0x02, CONTROL, BLOCK, "block") \
  V(LOOP, 0x03, CONTROL, BLOCK, "loop") \
  V(IF, 0x04, CONTROL, IF, "if") \
  V(BR, 0x0c, CONTROL, LABEL, "br") \
  V(BR_IF, 0x0d, CONTROL, LABEL, "br_if") \
  V(BR_TABLE, 0x0e, CONTROL, LABELS, "br_table") \
  V(RETURN, 0x0f, CONTROL, NONE, "return") \
  V(CALL, 0x10, CONTROL, FUNC, "call") \
  V(CALL_INDIRECT, 0x11, CONTROL, CALL_INDIRECT, "call_indirect") \
  \
  V(DROP, 0x1a, PARAMETRIC, NONE, "drop") \
  V(SELECT, 0x1b, PARAMETRIC, NONE, "select") \
  \
  V(LOCAL_GET, 0x20, VARIABLE, INDEX, "local.get") \
  V(LOCAL_SET, 0x21, VARIABLE, INDEX, "local.set") \
  V(LOCAL_TEE, 0x22, VARIABLE, INDEX, "local.tee") \
  V(GLOBAL_GET, 0x23, VARIABLE, INDEX, "global.get") \
  V(GLOBAL_SET, 0x24, VARIABLE, INDEX, "global.set") \
  \
  V(I32_LOAD, 0x28, MEMORY, MEMARG, "i32.load") \
  V(I64_LOAD, 0x29, MEMORY, MEMARG, "i64.load") \
  V(F32_LOAD, 0x2a, MEMORY, MEMARG, "f32.load") \
  V(F64_LOAD, 0x2b, MEMORY, MEMARG, "f64.load") \
  V(I32_LOAD8_S, 0x2c, MEMORY, MEMARG, "i32.load8_s") \
  V(I32_LOAD8_U, 0x2d, MEMORY, MEMARG, "i32.load8_u") \
  V(I32_LOAD16_S, 0x2e, MEMORY, MEMARG, "i32.load16_s") \
  V(I32_LOAD16_U, 0x2f, MEMORY, MEMARG, "i32.load16_u") \
  V(I64_LOAD8_S, 0x30, MEMORY, MEMARG, "i64.load8_s") \
  V(I64_LOAD8_U, 0x31, MEMORY, MEMARG, "i64.load8_u") \
  V(I64_LOAD16_S, 0x32, MEMORY, MEMARG, "i64.load16_s") \
  V(I64_LOAD16_U, 0x33, MEMORY, MEMARG, "i64.load16_u") \
  V(I64_LOAD32_S, 0x34, MEMORY, MEMARG, "i64.load32_s") \
  V(I64_LOAD32_U, 0x35, MEMORY, MEMARG, "i64.load32_u") \
  V(I32_STORE, 0x36, MEMORY, MEMARG, "i32.store") \
  V(I64_STORE, 0x37, MEMORY, MEMARG, "i64.store") \
  V(F32_STORE, 0x38, MEMORY, MEMARG, "f32.store") \
  V(F64_STORE, 0x39, MEMORY, MEMARG, "f64.store") \
  V(I32_STORE8, 0x3a, MEMORY, MEMARG, "i32.store8") \
  V(I32_STORE16, 0x3b, MEMORY, MEMARG, "i32.store16") \
  V(I64_STORE8, 0x3c, MEMORY, MEMARG, "i64.store8") \
  V(I64_STORE16, 0x3d, MEMORY, MEMARG, "i64.store16") \
  V(I64_STORE32, 0x3e, MEMORY, MEMARG, "i64.store32") \
  V(MEMORY_SIZE, 0x3f, MEMORY, MEMORY, "memory.size") \
  V(MEMORY_GROW, 0x40, MEMORY, MEMORY, "memory.grow") \
  \
  V(I32_CONST, 0x41, NUMERIC, I32, "i32.const") \
  V(I64_CONST, 0x42, NUMERIC, I64, "i64.const") \
  V(F32_CONST, 0x43, NUMERIC, F32, "f32.const") \
  V(F64_CONST, 0x44, NUMERIC, F64, "f64.const") \
  \
  V(I32_EQZ, 0x45, NUMERIC, NONE, "i32.eqz") \
  V(I32_EQ, 0x46, NUMERIC, NONE, "i32.eq") \
  V(I32_NE, 0x47, NUMERIC, NONE, "i32.ne") \
  V(I32_LT_S, 0x48, NUMERIC, NONE, "i32.lt_s") \
  V(I32_LT_U, 0x49, NUMERIC, NONE, "i32.lt_u") \
  V(I32_GT_S, 0x4a, NUMERIC, NONE, "i32.gt_s") \
  V(I32_GT_U, 0x4b, NUMERIC, NONE, "i32.gt_u") \
  V(I32_LE_S, 0x4c, NUMERIC, NONE, "i32.le_s") \
  V(I32_LE_U, 0x4d, NUMERIC, NONE, "i32.le_u") \
  V(I32_GE_S, 0x4e, NUMERIC, NONE, "i32.ge_s") \
  V(I32_GE_U, 0x4f, NUMERIC, NONE, "i32.ge_u") \
  V(I64_EQZ, 0x50, NUMERIC, NONE, "i64.eqz") \
  V(I64_EQ, 0x51, NUMERIC, NONE, "i64.eq") \
  V(I64_NE, 0x52, NUMERIC, NONE, "i64.ne") \
  V(I64_LT_S, 0x53, NUMERIC, NONE, "i64.lt_s") \
  V(I64_LT_U, 0x54, NUMERIC, NONE, "i64.lt_u") \
  V(I64_GT_S, 0x55, NUMERIC, NONE, "i64.gt_s") \
  V(I64_GT_U, 0x56, NUMERIC, NONE, "i64.gt_u") \
  V(I64_LE_S, 0x57, NUMERIC, NONE, "i64.le_s") \
  V(I64_LE_U, 0x58, NUMERIC, NONE, "i64.le_u") \
  V(I64_GE_S, 0x59, NUMERIC, NONE, "i64.ge_s") \
  V(I64_GE_U, 0x5a, NUMERIC, NONE, "i64.ge_u") \
  V(F32_EQ, 0x5b, NUMERIC, NONE, "f32.eq") \
  V(F32_NE, 0x5c, NUMERIC, NONE, "f32.ne") \
  V(F32_LT, 0x5d, NUMERIC, NONE, "f32.lt") \
  V(F32_GT, 0x5e, NUMERIC, NONE, "f32.gt") \
  V(F32_LE, 0x5f, NUMERIC, NONE, "f32.le") \
  V(F32_GE, 0x60, NUMERIC, NONE, "f32.ge") \
  V(F64_EQ, 0x61, NUMERIC, NONE, "f64.eq") \
  V(F64_NE, 0x62, NUMERIC, NONE, "f64.ne") \
  V(F64_LT, 0x63, NUMERIC, NONE, "f64.lt") \
  V(F64_GT, 0x64, NUMERIC, NONE, "f64.gt") \
  V(F64_LE, 0x65, NUMERIC, NONE, "f64.le") \
  V(F64_GE, 0x66, NUMERIC, NONE, "f64.ge") \
  \
  V(I32_CLZ, 0x67, NUMERIC, NONE, "i32.clz") \
  V(I32_CTZ, 0x68, NUMERIC, NONE, "i32.ctz") \
  V(I32_POPCNT, 0x69, NUMERIC, NONE, "i32.popcnt") \
  V(I32_ADD, 0x6a, NUMERIC, NONE, "i32.add") \
  V(I32_SUB, 0x6b, NUMERIC, NONE, "i32.sub") \
  V(I32_MUL, 0x6c, NUMERIC, NONE, "i32.mul") \
  V(I32_DIV_S, 0x6d, NUMERIC, NONE, "i32.div_s") \
  V(I32_DIV_U, 0x6e, NUMERIC, NONE, "i32.div_u") \
  V(I32_REM_S, 0x6f, NUMERIC, NONE, "i32.rem_s") \
  V(I32_REM_U, 0x70, NUMERIC, NONE, "i32.rem_u") \
  V(I32_AND, 0x71, NUMERIC, NONE, "i32.and") \
  V(I32_OR, 0x72, NUMERIC, NONE, "i32.or") \
  V(I32_XOR, 0x73, NUMERIC, NONE, "i32.xor") \
  V(I32_SHL, 0x74, NUMERIC, NONE, "i32.shl") \
  V(I32_SHR_S, 0x75, NUMERIC, NONE, "i32.shr_s") \
  V(I32_SHR_U, 0x76, NUMERIC, NONE, "i32.shr_u") \
  V(I32_ROTL, 0x77, NUMERIC, NONE, "i32.rotl") \
  V(I32_ROTR, 0x78, NUMERIC, NONE, "i32.rotr") \
  V(I64_CLZ, 0x79, NUMERIC, NONE, "i64.clz") \
  V(I64_CTZ, 0x7a, NUMERIC, NONE, "i64.ctz") \
  V(I64_POPCNT, 0x7b, NUMERIC, NONE, "i64.popcnt") \
  V(I64_ADD, 0x7c, NUMERIC, NONE, "i64.add") \
  V(I64_SUB, 0x7d, NUMERIC, NONE, "i64.sub") \
  V(I64_MUL, 0x7e, NUMERIC, NONE, "i64.mul") \
  V(I64_DIV_S, 0x7f, NUMERIC, NONE, "i64.div_s") \
  V(I64_DIV_U, 0x80, NUMERIC, NONE, "i64.div_u") \
  V(I64_REM_S, 0x81, NUMERIC, NONE, "i64.rem_s") \
  V(I64_REM_U, 0x82, NUMERIC, NONE, "i64.rem_u") \
  V(I64_AND, 0x83, NUMERIC, NONE, "i64.and") \
  V(I64_OR, 0x84, NUMERIC, NONE, "i64.or") \
  V(I64_XOR, 0x85, NUMERIC, NONE, "i64.xor") \
  V(I64_SHL, 0x86, NUMERIC, NONE, "i64.shl") \
  V(I64_SHR_S, 0x87, NUMERIC, NONE, "i64.shr_s") \
  V(I64_SHR_U, 0x88, NUMERIC, NONE, "i64.shr_u") \
  V(I64_ROTL, 0x89, NUMERIC, NONE, "i64.rotl") \
  V(I64_ROTR, 0x8a, NUMERIC, NONE, "i64.rotr") \
  V(F32_ABS, 0x8b, NUMERIC, NONE, "f32.abs") \
  V(F32_NEG, 0x8c, NUMERIC, NONE, "f32.neg") \
  V(F32_CEIL, 0x8d, NUMERIC, NONE, "f32.ceil") \
  V(F32_FLOOR, 0x8e, NUMERIC, NONE, "f32.floor") \
  V(F32_TRUNC, 0x8f, NUMERIC, NONE, "f32.trunc") \
  V(F32_NEAREST, 0x90, NUMERIC, NONE, "f32.nearest") \
  V(F32_SQRT, 0x91, NUMERIC, NONE, "f32.sqrt") \
  V(F32_ADD, 0x92, NUMERIC, NONE, "f32.add") \
  V(F32_SUB, 0x93, NUMERIC, NONE, "f32.sub") \
  V(F32_MUL, 0x94, NUMERIC, NONE, "f32.mul") \
  V(F32_DIV, 0x95, NUMERIC, NONE, "f32.div") \
  V(F32_MIN, 0x96, NUMERIC, NONE, "f32.min") \
  V(F32_MAX, 0x97, NUMERIC, NONE, "f32.max") \
  V(F32_COPYSIGN, 0x98, NUMERIC, NONE, "f32.copysign") \
  V(F64_ABS, 0x99, NUMERIC, NONE, "f64.abs") \
  V(F64_NEG, 0x9a, NUMERIC, NONE, "f64.neg") \
  V(F64_CEIL, 0x9b, NUMERIC, NONE, "f64.ceil") \
  V(F64_FLOOR, 0x9c, NUMERIC, NONE, "f64.floor") \
  V(F64_TRUNC, 0x9d, NUMERIC, NONE, "f64.trunc") \
  V(F64_NEAREST, 0x9e, NUMERIC, NONE, "f64.nearest") \
  V(F64_SQRT, 0x9f, NUMERIC, NONE, "f64.sqrt") \
  V(F64_ADD, 0xa0, NUMERIC, NONE, "f64.add") \
  V(F64_SUB, 0xa1, NUMERIC, NONE, "f64.sub") \
  V(F64_MUL, 0xa2, NUMERIC, NONE, "f64.mul") \
  V(F64_DIV, 0xa3, NUMERIC, NONE, "f64.div") \
  V(F64_MIN, 0xa4, NUMERIC, NONE, "f64.min") \
  V(F64_MAX, 0xa5, NUMERIC, NONE, "f64.max") \
  V(F64_COPYSIGN, 0xa6, NUMERIC, NONE, "f64.copysign") \
  \
  V(I32_WRAP_I64, 0xa7, NUMERIC, NONE, "i32.wrap_i64") \
  V(I32_TRUNC_F32_S, 0xa8, NUMERIC, NONE, "i32.trunc_f32_s") \
  V(I32_TRUNC_F32_U, 0xa9, NUMERIC, NONE, "i32.trunc_f32_u") \
  V(I32_TRUNC_F64_S, 0xaa, NUMERIC, NONE, "i32.trunc_f64_s") \
  V(I32_TRUNC_F64_U, 0xab, NUMERIC, NONE, "i32.trunc_f64_u") \
  V(I64_EXTEND_I32_S, 0xac, NUMERIC, NONE, "i64.extend_i32_s") \
  V(I64_EXTEND_I32_U, 0xad, NUMERIC, NONE, "i64.extend_i32_u") \
  V(I64_TRUNC_F32_S, 0xae, NUMERIC, NONE, "i64.trunc_f32_s") \
  V(I64_TRUNC_F32_U, 0xaf, NUMERIC, NONE, "i64.trunc_f32_u") \
  V(I64_TRUNC_F64_S, 0xb0, NUMERIC, NONE, "i64.trunc_f64_s") \
  V(I64_TRUNC_F64_U, 0xb1, NUMERIC, NONE, "i64.trunc_f64_u") \
  V(F32_CONVERT_I32_S, 0xb2, NUMERIC, NONE, "f32.convert_i32_s") \
  V(F32_CONVERT_I32_U, 0xb3, NUMERIC, NONE, "f32.convert_i32_u") \
  V(F32_CONVERT_I64_S, 0xb4, NUMERIC, NONE, "f32.convert_i64_s") \
  V(F32_CONVERT_I64_U, 0xb5, NUMERIC, NONE, "f32.convert_i64_u") \
  V(F32_DEMOTE_F64, 0xb6, NUMERIC, NONE, "f32.demote_f64") \
  V(F64_CONVERT_I32_S, 0xb7, NUMERIC, NONE, "f64.convert_i32_s") \
  V(F64_CONVERT_I32_U, 0xb8, NUMERIC, NONE, "f64.convert_i32_u") \
  V(F64_CONVERT_I64_S, 0xb9, NUMERIC, NONE, "f64.convert_i64_s") \
  V(F64_CONVERT_I64_U, 0xba, NUMERIC, NONE, "f64.convert_i64_u") \
  V(F64_PROMOTE_F32, 0xbb, NUMERIC, NONE, "f64.promote_f32") \
  V(I32_REINTERPRET_F32, 0xbc, NUMERIC, NONE, "i32.reinterpret_f32") \
  V(I64_REINTERPRET_F64, 0xbd, NUMERIC, NONE, "i64.reinterpret_f64") \
  V(F32_REINTERPRET_I32, 0xbe, NUMERIC, NONE, "f32.reinterpret_i32") \
  V(F64_REINTERPRET_I64, 0xbf, NUMERIC, NONE, "f64.reinterpret_i64") \
  \
  V(I32_EXTEND8_S, 0xc0, NUMERIC, NONE, "i32.extend8_s") \
  V(I32_EXTEND16_S, 0xc1, NUMERIC, NONE, "i32.extend16_s") \
  V(I64_EXTEND8_S, 0xc2, NUMERIC, NONE, "i64.extend8_s") \
  V(I64_EXTEND16_S, 0xc3, NUMERIC, NONE, "i64.extend16_s") \
  V(I64_EXTEND32_S, 0xc4, NUMERIC, NONE, "i64.extend32_s") \
  \
  V(I32_TRUNC_SAT_F32_S, 0xfc00, NUMERIC, NONE, "i32.trunc_sat_f32_s") \
  V(I32_TRUNC_SAT_F32_U, 0xfc01, NUMERIC, NONE, "i32.trunc_sat_f32_u") \
  V(I32_TRUNC_SAT_F64_S, 0xfc02, NUMERIC, NONE, "i32.trunc_sat_f64_s") \
  V(I32_TRUNC_SAT_F64_U, 0xfc03, NUMERIC, NONE, "i32.trunc_sat_f64_u") \
  V(I64_TRUNC_SAT_F32_S, 0xfc04, NUMERIC, NONE, "i64.trunc_sat_f32_s") \
  V(I64_TRUNC_SAT_F32_U, 0xfc05, NUMERIC, NONE, "i64.trunc_sat_f32_u") \
  V(I64_TRUNC_SAT_F64_S, 0xfc06, NUMERIC, NONE, "i64.trunc_sat_f64_s") \
  V(I64_TRUNC_SAT_F64_U, 0xfc07, NUMERIC, NONE, "i64.trunc_sat_f64_u")


enum Opcode : uint32_t {
#define WASMDEC_OPCODE_ENUM(name, code, family, imm, text) OP_##name = code,
  WASMDEC_FOREACH_OPCODE(WASMDEC_OPCODE_ENUM)
#undef WASMDEC_OPCODE_ENUM
};

enum InstrFamily : uint8_t {
  FAMILY_CONTROL, FAMILY_PARAMETRIC, FAMILY_VARIABLE, FAMILY_MEMORY,
  FAMILY_NUMERIC
};

// Shape of the operands following an opcode.
enum Immediate : uint8_t {
  IMM_NONE,
  IMM_BLOCK,          // blocktype, body
  IMM_IF,             // blocktype, then body, else body
  IMM_LABEL,          // label index
  IMM_LABELS,         // label vector, default label
  IMM_FUNC,           // function index
  IMM_CALL_INDIRECT,  // type index, reserved zero byte
  IMM_INDEX,          // local or global index
  IMM_MEMARG,         // alignment, offset
  IMM_MEMORY,         // reserved zero byte
  IMM_I32, IMM_I64, IMM_F32, IMM_F64,
};

struct MemArg {
  uint32_t align;
  uint32_t offset;
};


class Instr {
public:
  Instr() = delete;
  ~Instr();
  void operator delete(void*);

  auto opcode() const -> Opcode;
  auto family() const -> InstrFamily;
  auto immediate() const -> Immediate;
  auto name() const -> const char*;

  // IMM_BLOCK and IMM_IF; for `if`, body() is the then branch.
  auto block_type() const -> BlockType;
  auto body() const -> const ownvec<Instr>&;
  auto else_body() const -> const ownvec<Instr>&;

  // Label, function, type, local or global index; for br_table the default.
  auto index() const -> uint32_t;
  auto labels() const -> const vec<uint32_t>&;
  auto memarg() const -> MemArg;

  auto i32() const -> int32_t;
  auto i64() const -> int64_t;
  auto f32() const -> float32_t;
  auto f64() const -> float64_t;
};

// Instructions up to, not including, the terminating `end`.
using Expr = ownvec<Instr>;


///////////////////////////////////////////////////////////////////////////////
// Module Components

// Sections

enum SectionId : uint8_t {
  SEC_CUSTOM = 0,
  SEC_TYPE = 1,
  SEC_IMPORT = 2,
  SEC_FUNC = 3,
  SEC_TABLE = 4,
  SEC_MEMORY = 5,
  SEC_GLOBAL = 6,
  SEC_EXPORT = 7,
  SEC_START = 8,
  SEC_ELEM = 9,
  SEC_CODE = 10,
  SEC_DATA = 11,
};

struct Section {
  SectionId id;
  size_t offset;   // of the id byte
  uint32_t size;   // declared payload size
};


// Imports

class Import {
public:
  Import() = delete;
  ~Import();
  void operator delete(void*);

  static auto make(Name&& module, Name&& name, uint32_t type_index) -> own<Import*>;
  static auto make(Name&& module, Name&& name, own<ExternType*>&&) -> own<Import*>;

  auto module() const -> const Name&;
  auto name() const -> const Name&;
  auto kind() const -> ExternKind;

  // Function imports refer to the type section, the others carry their type.
  auto type_index() const -> uint32_t;
  auto type() const -> const ExternType*;
};


// Exports

class Export {
public:
  Export() = delete;
  ~Export();
  void operator delete(void*);

  static auto make(Name&& name, ExternKind, uint32_t index) -> own<Export*>;

  auto name() const -> const Name&;
  auto kind() const -> ExternKind;
  auto index() const -> uint32_t;
};


// Globals

class Global {
public:
  Global() = delete;
  ~Global();
  void operator delete(void*);

  static auto make(own<GlobalType*>&&, Expr&& init) -> own<Global*>;

  auto type() const -> const GlobalType*;
  auto init() const -> const Expr&;
};


// Element Segments

class Elem {
public:
  Elem() = delete;
  ~Elem();
  void operator delete(void*);

  static auto make(uint32_t table, Expr&& offset, vec<uint32_t>&& funcs) -> own<Elem*>;

  auto table_index() const -> uint32_t;
  auto offset() const -> const Expr&;
  auto funcs() const -> const vec<uint32_t>&;
};


// Function Bodies

struct Local {
  uint32_t count;
  ValKind kind;
};

class Code {
public:
  Code() = delete;
  ~Code();
  void operator delete(void*);

  static auto make(uint32_t size, vec<Local>&& locals, Expr&& body) -> own<Code*>;

  auto size() const -> uint32_t;
  auto locals() const -> const vec<Local>&;
  auto body() const -> const Expr&;
};


// Data Segments

// The segment bytes are borrowed from the decoded binary,
// which has to outlive the module.
class Data {
public:
  Data() = delete;
  ~Data();
  void operator delete(void*);

  static auto make(uint32_t memory, Expr&& offset, const byte_t* data, size_t size) -> own<Data*>;

  auto memory_index() const -> uint32_t;
  auto offset() const -> const Expr&;
  auto data() const -> const byte_t*;
  auto size() const -> size_t;
};


// Custom Sections

// Like data segments, the payload is a view into the decoded binary.
class Custom {
public:
  Custom() = delete;
  ~Custom();
  void operator delete(void*);

  static auto make(Name&& name, const byte_t* data, size_t size) -> own<Custom*>;

  auto name() const -> const Name&;
  auto data() const -> const byte_t*;
  auto size() const -> size_t;
};


///////////////////////////////////////////////////////////////////////////////
// Modules

class Module {
public:
  Module() = delete;
  ~Module();
  void operator delete(void*);

  // Framed sections in binary order, custom sections included.
  auto sections() const -> const vec<Section>&;

  auto types() const -> const ownvec<FuncType>&;
  auto imports() const -> const ownvec<Import>&;
  auto funcs() const -> const vec<uint32_t>&;
  auto tables() const -> const ownvec<TableType>&;
  auto memories() const -> const ownvec<MemoryType>&;
  auto globals() const -> const ownvec<Global>&;
  auto exports() const -> const ownvec<Export>&;
  auto has_start() const -> bool;
  auto start() const -> uint32_t;
  auto elems() const -> const ownvec<Elem>&;
  auto codes() const -> const ownvec<Code>&;
  auto datas() const -> const ownvec<Data>&;
  auto customs() const -> const ownvec<Custom>&;
};


// Decoder

class Decoder {
public:
  Decoder() = delete;
  ~Decoder();
  void operator delete(void*);

  static auto make(own<Config*>&& = Config::make()) -> own<Decoder*>;

  auto config() const -> const Config*;

  // On success returns null and stores the module; otherwise leaves
  // `module` untouched. Decoders hold no per-call state.
  auto decode(size_t size, const byte_t binary[], own<Module*>& module) const
    -> own<Error*>;
  auto decode(const vec<byte_t>& binary, own<Module*>& module) const
    -> own<Error*> {
    return decode(binary.size(), binary.get(), module);
  }
};


///////////////////////////////////////////////////////////////////////////////

}  // namespace wasmdec

#endif  // #ifdef __WASMDEC_HH
