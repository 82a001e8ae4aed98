// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "jfr.hpp"

#include "../../common/lean/formats/primitive.h"
#include "../../common/util/log.hpp"
#include "../../common/util/lzmastream.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <system_error>

using namespace pollcatch;
using namespace sources;
namespace jfr = formats::jfr;

// Chunks are read in blocks of this size, so a bogus chunk size costs no more
// memory than the bytes actually present.
static constexpr std::size_t blockSize = 1 << 20;

// Values nest no deeper than this in any sane trace.
static constexpr unsigned int maxDepth = 32;

const Value* Object::field(std::string_view name) const noexcept {
  if(!layout) return nullptr;
  auto idx = layout->field(name);
  if(!idx || *idx >= fields.size()) return nullptr;
  return &fields[*idx];
}

std::optional<std::size_t> ClassLayout::field(std::string_view n) const noexcept {
  for(std::size_t i = 0; i < fields.size(); i++)
    if(fields[i].name == n) return i;
  return std::nullopt;
}

void Metadata::add(ClassLayout cl) {
  auto id = cl.id;
  classes.insert_or_assign(id, std::make_shared<const ClassLayout>(std::move(cl)));
}

const std::shared_ptr<const ClassLayout>* Metadata::find(std::int64_t id) const noexcept {
  auto it = classes.find(id);
  return it == classes.end() ? nullptr : &it->second;
}

const ClassLayout* Metadata::find(std::string_view name) const noexcept {
  for(const auto& [id, cl]: classes)
    if(cl->name == name) return cl.get();
  return nullptr;
}

std::uint32_t ConstantPools::intern(std::string_view n) {
  auto it = indices.find(std::string(n));
  if(it != indices.end()) return it->second;
  const auto idx = (std::uint32_t)names.size();
  names.emplace_back(n);
  indices.emplace(names.back(), idx);
  pools.emplace_back();
  return idx;
}

std::optional<std::uint32_t> ConstantPools::type(std::string_view n) const noexcept {
  auto it = indices.find(std::string(n));
  if(it == indices.end()) return std::nullopt;
  return it->second;
}

const std::string& ConstantPools::name(std::uint32_t t) const noexcept {
  return names.at(t);
}

bool ConstantPools::add(std::uint32_t t, std::int64_t key, Value v) {
  return pools.at(t).try_emplace(key, std::move(v)).second;
}

const Value* ConstantPools::find(std::uint32_t t, std::int64_t key) const noexcept {
  if(t >= pools.size()) return nullptr;
  auto it = pools[t].find(key);
  return it == pools[t].end() ? nullptr : &it->second;
}

std::size_t ConstantPools::size() const noexcept {
  std::size_t n = 0;
  for(const auto& p: pools) n += p.size();
  return n;
}

namespace {

/// Bounds-checked reader over the bytes of one segment.
class Cursor {
public:
  Cursor(const char* b, const char* e, bool c) : cur(b), end(e), compressed(c) {};

  std::size_t remaining() const noexcept { return end - cur; }

  std::uint8_t u8() {
    need(1);
    return (std::uint8_t)*cur++;
  }

  // LEB128, with the 9th byte contributing all 8 of its bits.
  std::uint64_t varint() {
    std::uint64_t v = 0;
    for(unsigned int shift = 0; shift < 56; shift += 7) {
      const std::uint8_t b = u8();
      v |= (std::uint64_t)(b & 0x7f) << shift;
      if((b & 0x80) == 0) return v;
    }
    return v | ((std::uint64_t)u8() << 56);
  }

  std::int32_t i32() {
    if(compressed) return (std::int32_t)varint();
    need(4);
    auto v = (std::int32_t)fmt_u32_readbe(cur);
    cur += 4;
    return v;
  }

  std::int64_t i64() {
    if(compressed) return (std::int64_t)varint();
    need(8);
    auto v = (std::int64_t)fmt_u64_readbe(cur);
    cur += 8;
    return v;
  }

  std::int16_t i16() {
    if(compressed) return (std::int16_t)varint();
    need(2);
    auto v = (std::int16_t)fmt_u16_readbe(cur);
    cur += 2;
    return v;
  }

  float f32() {
    need(4);
    auto v = fmt_f32_readbe(cur);
    cur += 4;
    return v;
  }

  double f64() {
    need(8);
    auto v = fmt_f64_readbe(cur);
    cur += 8;
    return v;
  }

  /// Non-negative count, bounded by the bytes left (each element takes at
  /// least one byte).
  std::size_t count() {
    const auto n = i32();
    if(n < 0 || (std::size_t)n > remaining())
      throw CorruptTrace("invalid element count " + std::to_string(n));
    return n;
  }

  std::string bytes(std::size_t n) {
    need(n);
    std::string s(cur, n);
    cur += n;
    return s;
  }

private:
  void need(std::size_t n) const {
    if(remaining() < n)
      throw CorruptTrace("value extends past the end of its event");
  }

  const char* cur;
  const char* end;
  bool compressed;
};

void appendUtf8(std::string& s, std::uint32_t c) {
  if(c < 0x80) {
    s += (char)c;
  } else if(c < 0x800) {
    s += (char)(0xc0 | (c >> 6));
    s += (char)(0x80 | (c & 0x3f));
  } else {
    s += (char)(0xe0 | (c >> 12));
    s += (char)(0x80 | ((c >> 6) & 0x3f));
    s += (char)(0x80 | (c & 0x3f));
  }
}

/// Read a string in any of its encodings. Strings stored in the constant pool
/// come back as a Ref to the java.lang.String pool.
Value readString(Cursor& c, ConstantPools& pools) {
  switch((jfr::StringEncoding)c.u8()) {
  case jfr::StringEncoding::null: return Value();
  case jfr::StringEncoding::empty: return Value(std::string());
  case jfr::StringEncoding::constantPool:
    return Value(Ref{pools.intern("java.lang.String"), c.i64()});
  case jfr::StringEncoding::utf8:
    return Value(c.bytes(c.count()));
  case jfr::StringEncoding::charArray: {
    const auto n = c.count();
    std::string s;
    s.reserve(n);
    for(std::size_t i = 0; i < n; i++) appendUtf8(s, (std::uint16_t)c.i16());
    return Value(std::move(s));
  }
  case jfr::StringEncoding::latin1: {
    const auto n = c.count();
    std::string s;
    s.reserve(n);
    for(std::size_t i = 0; i < n; i++) appendUtf8(s, c.u8());
    return Value(std::move(s));
  }
  }
  throw CorruptTrace("unknown string encoding");
}

/// Chunk-local state for decoding values.
struct ValueReader {
  const Metadata& meta;
  ConstantPools& pools;

  Value read(Cursor& c, std::int64_t classId, unsigned int depth) {
    if(depth > maxDepth) throw CorruptTrace("values nested too deeply");
    const auto* cl = meta.find(classId);
    if(cl == nullptr)
      throw CorruptTrace("reference to undefined class " + std::to_string(classId));
    const auto& name = (*cl)->name;
    if(name == "long") return Value(c.i64());
    if(name == "int") return Value((std::int64_t)c.i32());
    if(name == "short") return Value((std::int64_t)c.i16());
    if(name == "char") return Value((std::int64_t)(std::uint16_t)c.i16());
    if(name == "byte") return Value((std::int64_t)(std::int8_t)c.u8());
    if(name == "boolean") return Value((std::int64_t)c.u8());
    if(name == "float") return Value((double)c.f32());
    if(name == "double") return Value(c.f64());
    if(name == "java.lang.String") return readString(c, pools);

    Object obj;
    obj.layout = *cl;
    obj.fields.reserve((*cl)->fields.size());
    for(const auto& f: (*cl)->fields) obj.fields.push_back(field(c, f, depth + 1));
    return Value(std::move(obj));
  }

  Value field(Cursor& c, const FieldLayout& f, unsigned int depth) {
    if(f.array) {
      Array arr;
      const auto n = c.count();
      arr.items.reserve(n);
      for(std::size_t i = 0; i < n; i++) arr.items.push_back(scalar(c, f, depth));
      return Value(std::move(arr));
    }
    return scalar(c, f, depth);
  }

  Value scalar(Cursor& c, const FieldLayout& f, unsigned int depth) {
    if(f.constantPool) {
      const auto* cl = meta.find(f.classId);
      if(cl == nullptr)
        throw CorruptTrace("field " + f.name + " refers to undefined class "
                           + std::to_string(f.classId));
      return Value(Ref{pools.intern((*cl)->name), c.i64()});
    }
    return read(c, f.classId, depth);
  }
};

// Element tree of the metadata event, with names and attributes resolved.
struct Element {
  std::string name;
  std::vector<std::pair<std::string, std::string>> attributes;
  std::vector<Element> children;

  const std::string* attribute(std::string_view k) const noexcept {
    for(const auto& [key, value]: attributes)
      if(key == k) return &value;
    return nullptr;
  }
};

const std::string& poolString(const std::vector<std::string>& strings, std::int32_t idx) {
  if(idx < 0 || (std::size_t)idx >= strings.size())
    throw CorruptTrace("metadata refers to undefined string " + std::to_string(idx));
  return strings[idx];
}

Element readElement(Cursor& c, const std::vector<std::string>& strings, unsigned int depth) {
  if(depth > maxDepth) throw CorruptTrace("metadata nested too deeply");
  Element e;
  e.name = poolString(strings, c.i32());
  const auto nattrs = c.count();
  for(std::size_t i = 0; i < nattrs; i++) {
    const auto& k = poolString(strings, c.i32());
    const auto& v = poolString(strings, c.i32());
    e.attributes.emplace_back(k, v);
  }
  const auto nchildren = c.count();
  for(std::size_t i = 0; i < nchildren; i++)
    e.children.push_back(readElement(c, strings, depth + 1));
  return e;
}

std::int64_t parseId(const std::string& s) {
  std::int64_t v = 0;
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if(ec != std::errc() || end != s.data() + s.size())
    throw CorruptTrace("invalid class id '" + s + "' in metadata");
  return v;
}

void collectClasses(const Element& e, Metadata& meta) {
  if(e.name == "class") {
    ClassLayout cl;
    const auto* id = e.attribute("id");
    const auto* name = e.attribute("name");
    if(id == nullptr || name == nullptr)
      throw CorruptTrace("metadata class without an id or name");
    cl.id = parseId(*id);
    cl.name = *name;
    if(const auto* st = e.attribute("superType")) cl.superType = *st;
    for(const auto& f: e.children) {
      if(f.name != "field") continue;
      const auto* fname = f.attribute("name");
      const auto* fclass = f.attribute("class");
      if(fname == nullptr || fclass == nullptr)
        throw CorruptTrace("metadata field without a name or class in " + cl.name);
      FieldLayout fl;
      fl.name = *fname;
      fl.classId = parseId(*fclass);
      const auto* cp = f.attribute("constantPool");
      fl.constantPool = cp != nullptr && *cp == "true";
      const auto* dim = f.attribute("dimension");
      fl.array = dim != nullptr && *dim == "1";
      cl.fields.push_back(std::move(fl));
    }
    meta.add(std::move(cl));
    return;
  }
  for(const auto& c: e.children) collectClasses(c, meta);
}

/// Position a Cursor on the body of a segment, past its size and type.
Cursor body(const Chunk& chunk, const Segment& seg) {
  const bool comp = chunk.header.compressedInts();
  Cursor c(chunk.data.data() + seg.offset, chunk.data.data() + seg.offset + seg.size, comp);
  c.i32();  // size
  c.i64();  // type
  return c;
}

Metadata readMetadata(const Chunk& chunk, const Segment& seg) {
  Cursor c = body(chunk, seg);
  c.i64();  // start time
  c.i64();  // duration
  c.i64();  // metadata id
  std::vector<std::string> strings;
  const auto nstrings = c.count();
  strings.reserve(nstrings);
  // Metadata strings are always inline, a scratch pool absorbs anything else
  ConstantPools scratch;
  for(std::size_t i = 0; i < nstrings; i++) {
    auto s = readString(c, scratch);
    if(auto* str = std::get_if<std::string>(&s)) strings.push_back(std::move(*str));
    else strings.emplace_back();
  }
  Metadata meta;
  collectClasses(readElement(c, strings, 0), meta);
  return meta;
}

void readCheckpoint(const Chunk& chunk, const Segment& seg, ValueReader& vr) {
  Cursor c = body(chunk, seg);
  c.i64();  // start time
  c.i64();  // duration
  c.i64();  // delta to the previous checkpoint
  c.u8();   // type mask
  const auto npools = c.count();
  for(std::size_t i = 0; i < npools; i++) {
    const auto classId = c.i64();
    const auto* cl = vr.meta.find(classId);
    if(cl == nullptr)
      throw CorruptTrace("constant pool for undefined class " + std::to_string(classId));
    const auto type = vr.pools.intern((*cl)->name);
    const auto n = c.count();
    for(std::size_t j = 0; j < n; j++) {
      const auto key = c.i64();
      if(!vr.pools.add(type, key, vr.read(c, classId, 0)))
        util::log::debug{} << "Ignoring redefinition of " << (*cl)->name << " " << key;
    }
  }
}

}

JfrReader::JfrReader(std::istream& i) : in(i) {};

std::optional<Chunk> JfrReader::next() {
  Chunk chunk;
  chunk.fileOffset = pos;
  chunk.data.resize(jfr::SZ_ChunkHeader);
  in.read(chunk.data.data(), jfr::SZ_ChunkHeader);
  const auto got = (std::size_t)in.gcount();
  if(got == 0) {
    // A failed read between chunks is not the end of the trace
    if(in.bad()) throw CorruptTrace("read error at offset " + std::to_string(pos));
    return std::nullopt;
  }
  if(got < jfr::SZ_ChunkHeader)
    throw CorruptTrace("truncated chunk header at offset " + std::to_string(pos));

  auto hdr = jfr::readChunkHeader(chunk.data.data());
  if(!hdr)
    throw CorruptTrace("bad chunk magic at offset " + std::to_string(pos));
  if(hdr->major != 1 && hdr->major != 2)
    throw CorruptTrace("unsupported chunk version " + std::to_string(hdr->major)
                       + "." + std::to_string(hdr->minor));
  if(hdr->size < (std::int64_t)jfr::SZ_ChunkHeader)
    throw CorruptTrace("chunk at offset " + std::to_string(pos) + " declares size "
                       + std::to_string(hdr->size));
  if(hdr->metadataOffset < (std::int64_t)jfr::SZ_ChunkHeader || hdr->metadataOffset >= hdr->size)
    throw CorruptTrace("chunk at offset " + std::to_string(pos)
                       + " has its metadata outside the chunk");
  if(hdr->cpOffset != 0 && (hdr->cpOffset < (std::int64_t)jfr::SZ_ChunkHeader || hdr->cpOffset >= hdr->size))
    throw CorruptTrace("chunk at offset " + std::to_string(pos)
                       + " has its constant pool outside the chunk");
  if(hdr->ticksPerSecond <= 0)
    throw CorruptTrace("chunk at offset " + std::to_string(pos) + " has no tick rate");
  chunk.header = *hdr;

  // Pull in the body block by block, the declared size must be backed by data
  std::uint64_t have = jfr::SZ_ChunkHeader;
  const auto want = (std::uint64_t)hdr->size;
  while(have < want) {
    const auto step = (std::size_t)std::min<std::uint64_t>(blockSize, want - have);
    chunk.data.resize(have + step);
    in.read(chunk.data.data() + have, step);
    const auto n = (std::size_t)in.gcount();
    have += n;
    if(n < step)
      throw CorruptTrace("chunk at offset " + std::to_string(pos) + " declares "
                         + std::to_string(want) + " bytes but only "
                         + std::to_string(have) + " are present");
  }
  if(in.bad())
    throw CorruptTrace("read error in chunk at offset " + std::to_string(pos));

  // Split the body into segments, each of which must fit in what remains
  const bool comp = hdr->compressedInts();
  std::uint64_t off = jfr::SZ_ChunkHeader;
  bool sawMetadata = false;
  while(off < want) {
    Cursor c(chunk.data.data() + off, chunk.data.data() + want, comp);
    std::int64_t size;
    std::int64_t type;
    try {
      size = c.i32();
      type = c.i64();
    } catch(CorruptTrace&) {
      throw CorruptTrace("truncated event header at offset " + std::to_string(pos + off));
    }
    if(size <= 0 || (std::uint64_t)size > want - off)
      throw CorruptTrace("event at offset " + std::to_string(pos + off) + " declares size "
                         + std::to_string(size) + " with " + std::to_string(want - off)
                         + " bytes left in the chunk");
    Segment seg;
    seg.type = type;
    seg.offset = off;
    seg.size = size;
    seg.kind = type == jfr::typeMetadata ? Segment::Kind::metadata
             : type == jfr::typeCheckpoint ? Segment::Kind::constantPool
             : Segment::Kind::events;
    if((std::int64_t)off == hdr->metadataOffset) {
      if(seg.kind != Segment::Kind::metadata)
        throw CorruptTrace("chunk at offset " + std::to_string(pos)
                           + " points at a non-metadata event for its metadata");
      sawMetadata = true;
    }
    chunk.segments.push_back(seg);
    off += size;
  }
  if(!sawMetadata)
    throw CorruptTrace("chunk at offset " + std::to_string(pos)
                       + " has no metadata event at its declared offset");

  pos += want;
  return chunk;
}

JfrTrace::JfrTrace(std::istream& in) {
  JfrReader reader(in);
  while(auto chunk = reader.next()) {
    parse(*chunk);
    ++m_chunks;
  }
  util::log::info{} << "Read " << m_chunks << " chunks (" << reader.offset() << " bytes), "
                    << m_events.size() << " samples, " << m_pools.size()
                    << " constant pool entries";
}

JfrTrace JfrTrace::open(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios_base::in | std::ios_base::binary);
  if(!file)
    throw std::system_error(errno, std::generic_category(), "unable to open " + path.string());

  char head[6] = {0};
  file.read(head, sizeof head);
  const auto n = (std::size_t)file.gcount();
  file.clear();
  file.seekg(0);
  if(util::isXz(head, n)) {
    util::log::debug{} << path.string() << " is XZ-compressed";
    util::ilzmastream xz(*file.rdbuf());
    return JfrTrace(xz);
  }
  return JfrTrace(file);
}

void JfrTrace::parse(const Chunk& chunk) {
  // Class layouts first, so the rest of the chunk can be decoded in any order
  Metadata meta;
  for(const auto& seg: chunk.segments) {
    if((std::int64_t)seg.offset == chunk.header.metadataOffset) {
      meta = readMetadata(chunk, seg);
      break;
    }
  }
  ValueReader vr{meta, m_pools};

  for(const auto& seg: chunk.segments)
    if(seg.kind == Segment::Kind::constantPool) readCheckpoint(chunk, seg, vr);

  const ClassLayout* wallClock = meta.find("profiler.WallClockSample");
  const ClassLayout* execution = meta.find("jdk.ExecutionSample");
  const ClassLayout* setting = meta.find("jdk.ActiveSetting");

  for(const auto& seg: chunk.segments) {
    if(seg.kind != Segment::Kind::events) continue;
    const ClassLayout* cl = nullptr;
    if(wallClock != nullptr && seg.type == wallClock->id) cl = wallClock;
    else if(execution != nullptr && seg.type == execution->id) cl = execution;
    else if(setting != nullptr && seg.type == setting->id) cl = setting;
    else continue;

    Cursor c = body(chunk, seg);
    auto v = vr.read(c, seg.type, 0);
    const auto* objp = std::get_if<Object>(&v);
    if(objp == nullptr)
      throw CorruptTrace("event type " + cl->name + " is not laid out as a class");
    const auto& obj = *objp;

    if(cl == setting) {
      RawSetting s;
      if(const auto* f = obj.field("name")) s.name = *f;
      if(const auto* f = obj.field("value")) s.value = *f;
      m_events.emplace_back(std::move(s));
      continue;
    }

    RawSample s;
    s.ticks = 0;
    s.ticksPerSecond = chunk.header.ticksPerSecond;
    if(const auto* f = obj.field("startTime"))
      if(const auto* t = std::get_if<std::int64_t>(f)) s.ticks = *t;
    if(const auto* f = obj.field("sampledThread")) s.thread = *f;
    if(const auto* f = obj.field("stackTrace"))
      if(const auto* r = std::get_if<Ref>(f)) s.stackId = r->key;
    if(cl == wallClock)
      if(const auto* f = obj.field("appword"))
        if(const auto* a = std::get_if<std::int64_t>(f)) s.appword = *a;
    m_events.emplace_back(std::move(s));
  }
}
