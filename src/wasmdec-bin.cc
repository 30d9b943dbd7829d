#include "wasmdec-bin.hh"

#include <cstdio>
#include <cstring>

#ifdef WASMDEC_DEBUG_LOG
#include <iostream>
#endif

namespace wasmdec {
namespace bin {

////////////////////////////////////////////////////////////////////////////////
// Input

auto Reader::enter(size_t size) -> const byte_t* {
  assert(size <= remaining());
  auto limit = limit_;
  limit_ = pos_ + size;
  ++regions_;
  return limit;
}

auto Reader::fail(ErrorKind kind, const char* format, ...) -> bool {
  va_list args;
  va_start(args, format);
  fail_v(offset(), kind, format, args);
  va_end(args);
  return false;
}

auto Reader::fail_at(size_t at, ErrorKind kind, const char* format, ...)
  -> bool {
  va_list args;
  va_start(args, format);
  fail_v(at, kind, format, args);
  va_end(args);
  return false;
}

auto Reader::fail_oom() -> bool {
  return fail(ERROR_OUT_OF_MEMORY, "out of memory");
}

auto Reader::fail_v(size_t at, ErrorKind kind, const char* format, va_list args)
  -> bool {
  if (!*this) return false;
  char buffer[256];
  auto length = vsnprintf(buffer, sizeof(buffer), format, args);
  if (length < 0) length = 0;
  if (static_cast<size_t>(length) >= sizeof(buffer)) {
    length = sizeof(buffer) - 1;
  }
  auto message = Message::make_uninitialized(length + 1);
  if (message) {
    std::memcpy(message.get(), buffer, length);
    message[length] = '\0';
    error_ = Error::make(kind, at, message);
  }
  if (!error_) out_of_memory_ = true;
#ifdef WASMDEC_DEBUG_LOG
  std::clog << "[error] @" << at << " " << buffer << std::endl;
#endif
  return false;
}

auto Reader::take(size_t n) -> const byte_t* {
  if (!*this) return nullptr;
  if (n > remaining()) {
    if (in_region()) {
      fail(ERROR_SECTION_LENGTH_MISMATCH,
        "read of %zu bytes crosses the region end at offset %zu",
        n, static_cast<size_t>(limit_ - begin_));
    } else {
      fail(ERROR_UNEXPECTED_END,
        "unexpected end of input, %zu bytes needed, %zu left",
        n, remaining());
    }
    return nullptr;
  }
  auto p = pos_;
  pos_ += n;
  return p;
}

auto Reader::peek(byte_t& b) const -> bool {
  if (!*this || pos_ == limit_) return false;
  b = *pos_;
  return true;
}

auto Reader::release_error() -> own<Error*> {
  return std::move(error_);
}


////////////////////////////////////////////////////////////////////////////////
// Primitives

// Numbers

auto u8(Reader& in) -> uint8_t {
  auto p = in.take(1);
  return p ? static_cast<uint8_t>(*p) : 0;
}

auto uleb(Reader& in, unsigned bits) -> uint64_t {
  auto start = in.offset();
  uint64_t n = 0;
  unsigned shift = 0;
  while (true) {
    auto p = in.take(1);
    if (!p) return 0;
    auto b = static_cast<uint8_t>(*p);
    if (bits - shift <= 7) {
      // Last permitted byte: no continuation, no bits beyond the width.
      auto rest = bits - shift;
      if ((b & 0x80) || (b & (0x7f << rest) & 0x7f)) {
        in.fail_at(start, ERROR_INTEGER_OVERFLOW,
          "integer too large for u%u", bits);
        return 0;
      }
      return n | (uint64_t(b) << shift);
    }
    n |= uint64_t(b & 0x7f) << shift;
    shift += 7;
    if ((b & 0x80) == 0) return n;
  }
}

auto sleb(Reader& in, unsigned bits) -> int64_t {
  auto start = in.offset();
  uint64_t n = 0;
  unsigned shift = 0;
  uint8_t b;
  do {
    auto p = in.take(1);
    if (!p) return 0;
    b = static_cast<uint8_t>(*p);
    if (bits - shift <= 7) {
      // Last permitted byte: unused high bits must repeat the sign bit.
      auto rest = bits - shift;
      uint8_t mask = (0x7f << (rest - 1)) & 0x7f;
      if ((b & 0x80) || ((b & mask) != 0 && (b & mask) != mask)) {
        in.fail_at(start, ERROR_INTEGER_OVERFLOW,
          "integer too large for s%u", bits);
        return 0;
      }
    }
    n |= uint64_t(b & 0x7f) << shift;
    shift += 7;
  } while ((b & 0x80) != 0);
  if (shift < 64 && (b & 0x40)) n |= ~uint64_t(0) << shift;
  return static_cast<int64_t>(n);
}

auto vec_size(Reader& in) -> uint32_t {
  auto start = in.offset();
  auto size = bin::u32(in);
  if (in && size > in.remaining()) {
    in.fail_at(start,
      in.in_region() ? ERROR_SECTION_LENGTH_MISMATCH : ERROR_UNEXPECTED_END,
      "vector of %u elements exceeds the %zu bytes left",
      size, in.remaining());
    return 0;
  }
  return size;
}

auto f32(Reader& in) -> float32_t {
  auto p = in.take(4);
  if (!p) return 0;
  uint32_t bits = 0;
  for (int i = 3; i >= 0; --i) bits = (bits << 8) | static_cast<uint8_t>(p[i]);
  float32_t x;
  std::memcpy(&x, &bits, sizeof(x));
  return x;
}

auto f64(Reader& in) -> float64_t {
  auto p = in.take(8);
  if (!p) return 0;
  uint64_t bits = 0;
  for (int i = 7; i >= 0; --i) bits = (bits << 8) | static_cast<uint8_t>(p[i]);
  float64_t x;
  std::memcpy(&x, &bits, sizeof(x));
  return x;
}


// Names

auto valid_utf8(const byte_t* data, size_t size) -> bool {
  auto s = reinterpret_cast<const uint8_t*>(data);
  size_t i = 0;
  while (i < size) {
    uint8_t c = s[i];
    if (c < 0x80) { ++i; continue; }
    size_t n;
    uint32_t cp;
    uint32_t min;
    if ((c & 0xe0) == 0xc0) { n = 1; cp = c & 0x1f; min = 0x80; }
    else if ((c & 0xf0) == 0xe0) { n = 2; cp = c & 0x0f; min = 0x800; }
    else if ((c & 0xf8) == 0xf0) { n = 3; cp = c & 0x07; min = 0x10000; }
    else return false;
    if (size - i - 1 < n) return false;
    for (size_t j = 1; j <= n; ++j) {
      if ((s[i + j] & 0xc0) != 0x80) return false;
      cp = (cp << 6) | (s[i + j] & 0x3f);
    }
    if (cp < min || cp > 0x10ffff) return false;
    if (cp >= 0xd800 && cp <= 0xdfff) return false;
    i += n + 1;
  }
  return true;
}

auto name(Reader& in) -> Name {
  auto size = bin::vec_size(in);
  auto start = in.offset();
  auto p = in.take(size);
  if (!p) return Name::invalid();
  if (!valid_utf8(p, size)) {
    in.fail_at(start, ERROR_UTF8, "malformed UTF-8 in name of %u bytes", size);
    return Name::invalid();
  }
  auto name = Name::make_uninitialized(size);
  if (!name) {
    in.fail_oom();
    return Name::invalid();
  }
  if (size > 0) std::memcpy(name.get(), p, size);
  return name;
}


////////////////////////////////////////////////////////////////////////////////
// Types

auto valtype(Reader& in) -> own<ValType*> {
  auto start = in.offset();
  auto b = bin::u8(in);
  if (!in) return own<ValType*>();
  switch (b) {
    case 0x7f: return ValType::make(I32);
    case 0x7e: return ValType::make(I64);
    case 0x7d: return ValType::make(F32);
    case 0x7c: return ValType::make(F64);
    default:
      in.fail_at(start, ERROR_INVALID_TAG, "invalid value type 0x%02x", b);
      return own<ValType*>();
  }
}

auto resulttype(Reader& in) -> ownvec<ValType> {
  return bin::vector<ValType>(in, bin::valtype);
}

auto functype(Reader& in) -> own<FuncType*> {
  auto start = in.offset();
  auto tag = bin::u8(in);
  if (!in) return own<FuncType*>();
  if (tag != 0x60) {
    in.fail_at(start, ERROR_INVALID_TAG, "invalid function type 0x%02x", tag);
    return own<FuncType*>();
  }
  auto params = bin::resulttype(in);
  auto results = bin::resulttype(in);
  if (!in) return own<FuncType*>();
  return made(in, FuncType::make(std::move(params), std::move(results)));
}

auto limits(Reader& in) -> Limits {
  auto start = in.offset();
  auto tag = bin::u8(in);
  if (!in) return Limits(0);
  switch (tag) {
    case 0x00: {
      auto min = bin::u32(in);
      return Limits(min);
    }
    case 0x01: {
      auto min = bin::u32(in);
      auto max = bin::u32(in);
      return Limits(min, max);
    }
    default:
      in.fail_at(start, ERROR_INVALID_TAG, "invalid limits flag 0x%02x", tag);
      return Limits(0);
  }
}

auto elemtype(Reader& in) -> own<ValType*> {
  auto start = in.offset();
  auto b = bin::u8(in);
  if (!in) return own<ValType*>();
  if (b != 0x70) {
    in.fail_at(start, ERROR_INVALID_TAG, "invalid element type 0x%02x", b);
    return own<ValType*>();
  }
  return ValType::make(FUNCREF);
}

auto tabletype(Reader& in) -> own<TableType*> {
  auto elem = bin::elemtype(in);
  auto limits = bin::limits(in);
  if (!in) return own<TableType*>();
  return made(in, TableType::make(std::move(elem), limits));
}

auto memtype(Reader& in) -> own<MemoryType*> {
  auto limits = bin::limits(in);
  if (!in) return own<MemoryType*>();
  return made(in, MemoryType::make(limits));
}

auto globaltype(Reader& in) -> own<GlobalType*> {
  auto content = bin::valtype(in);
  auto start = in.offset();
  auto b = bin::u8(in);
  if (!in) return own<GlobalType*>();
  if (b > 0x01) {
    in.fail_at(start, ERROR_INVALID_TAG, "invalid mutability 0x%02x", b);
    return own<GlobalType*>();
  }
  auto mutability = b ? VAR : CONST;
  return made(in, GlobalType::make(std::move(content), mutability));
}

auto blocktype(Reader& in) -> BlockType {
  byte_t b;
  if (in.peek(b)) {
    switch (static_cast<uint8_t>(b)) {
      case 0x40:
        bin::u8(in);
        return BlockType::empty();
      case 0x7f:
      case 0x7e:
      case 0x7d:
      case 0x7c:
        return BlockType::result(bin::valtype(in)->kind());
    }
  }
  auto start = in.offset();
  auto index = bin::s33(in);
  if (!in) return BlockType::empty();
  if (index < 0) {
    in.fail_at(start, ERROR_INVALID_TAG,
      "invalid block type %lld", static_cast<long long>(index));
    return BlockType::empty();
  }
  return BlockType::type(static_cast<uint32_t>(index));
}

}  // namespace bin
}  // namespace wasmdec
