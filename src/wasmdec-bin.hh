#ifndef __WASMDEC_BIN_HH
#define __WASMDEC_BIN_HH

#include "wasmdec.hh"

#include <cstdarg>

namespace wasmdec {

class Config;
struct OpcodeInfo;
struct ModuleImpl;

namespace bin {

////////////////////////////////////////////////////////////////////////////////
// Input

// A cursor over the input with a read limit that narrows to the innermost
// length-prefixed region. The first failure is kept; afterwards every read
// yields zero or null without advancing.
class Reader {
  const byte_t* begin_;
  const byte_t* pos_;
  const byte_t* limit_;
  size_t regions_;
  own<Error*> error_;
  bool out_of_memory_;

public:
  Reader(const byte_t* begin, const byte_t* end) :
    begin_(begin), pos_(begin), limit_(end), regions_(0),
    out_of_memory_(false) {}

  explicit operator bool() const { return !error_ && !out_of_memory_; }

  auto offset() const -> size_t { return pos_ - begin_; }
  auto pos() const -> const byte_t* { return pos_; }
  auto remaining() const -> size_t { return limit_ - pos_; }
  auto at_limit() const -> bool { return pos_ == limit_; }
  auto in_region() const -> bool { return regions_ > 0; }

  // Narrows the limit to the next `size` bytes, which must be available.
  // Returns the previous limit for leave(). Reading past the limit of an
  // open region is a length mismatch even where the region ends with the
  // input.
  auto enter(size_t size) -> const byte_t*;
  void leave(const byte_t* limit) { limit_ = limit; --regions_; }

  // Record an error at the current or a given offset; always false.
  auto fail(ErrorKind, const char* format, ...) -> bool;
  auto fail_at(size_t offset, ErrorKind, const char* format, ...) -> bool;
  auto fail_oom() -> bool;

  // Consumes `n` bytes, or fails and returns null.
  auto take(size_t n) -> const byte_t*;
  auto peek(byte_t& b) const -> bool;

  auto error() const -> const Error* { return error_.get(); }
  auto release_error() -> own<Error*>;

private:
  auto fail_v(size_t offset, ErrorKind, const char* format, va_list) -> bool;
};


////////////////////////////////////////////////////////////////////////////////
// Primitives

auto u8(Reader&) -> uint8_t;
auto uleb(Reader&, unsigned bits) -> uint64_t;
auto sleb(Reader&, unsigned bits) -> int64_t;

inline auto u32(Reader& in) -> uint32_t {
  return static_cast<uint32_t>(uleb(in, 32));
}
inline auto s32(Reader& in) -> int32_t {
  return static_cast<int32_t>(sleb(in, 32));
}
inline auto s33(Reader& in) -> int64_t { return sleb(in, 33); }
inline auto s64(Reader& in) -> int64_t { return sleb(in, 64); }

auto vec_size(Reader&) -> uint32_t;
auto name(Reader&) -> Name;
auto f32(Reader&) -> float32_t;
auto f64(Reader&) -> float64_t;

auto valid_utf8(const byte_t* data, size_t size) -> bool;


////////////////////////////////////////////////////////////////////////////////
// Types

auto valtype(Reader&) -> own<ValType*>;
auto resulttype(Reader&) -> ownvec<ValType>;
auto functype(Reader&) -> own<FuncType*>;
auto limits(Reader&) -> Limits;
auto elemtype(Reader&) -> own<ValType*>;
auto tabletype(Reader&) -> own<TableType*>;
auto memtype(Reader&) -> own<MemoryType*>;
auto globaltype(Reader&) -> own<GlobalType*>;
auto blocktype(Reader&) -> BlockType;


////////////////////////////////////////////////////////////////////////////////
// Instructions

auto opcode_info(Opcode) -> const OpcodeInfo*;

auto instr(Reader&, uint32_t max_depth) -> own<Instr*>;
auto expr(Reader&, uint32_t max_depth) -> Expr;


////////////////////////////////////////////////////////////////////////////////
// Modules

auto section(Reader&, const Config&, ModuleImpl&) -> bool;
auto module(Reader&, const Config&) -> own<Module*>;


////////////////////////////////////////////////////////////////////////////////
// Helpers

// Turns a failed allocation into an error on the reader.
template<class T>
auto made(Reader& in, std::unique_ptr<T>&& x) -> std::unique_ptr<T> {
  if (!x && in) in.fail_oom();
  return std::move(x);
}

// Decodes a length-prefixed vector of owned elements.
template<class T, class F>
auto vector(Reader& in, F element) -> ownvec<T> {
  auto size = bin::vec_size(in);
  if (!in) return ownvec<T>::invalid();
  auto v = ownvec<T>::make_uninitialized(size);
  if (!v) { in.fail_oom(); return ownvec<T>::invalid(); }
  for (uint32_t i = 0; i < size; ++i) {
    v[i] = element(in);
    if (!in) return ownvec<T>::invalid();
  }
  return v;
}

}  // namespace bin
}  // namespace wasmdec

#endif  // #ifdef __WASMDEC_BIN_HH
