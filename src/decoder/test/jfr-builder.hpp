// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_TEST_JFR_BUILDER_H
#define POLLCATCH_DECODER_TEST_JFR_BUILDER_H

#include "../formats/jfr.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pollcatch::test {

/// Serializer for JFR values, in either integer encoding.
class JfrWriter {
public:
  explicit JfrWriter(bool c) : compressed(c) {};

  void u8(std::uint8_t v) { buf += (char)v; }

  void varint(std::uint64_t v) {
    for(int i = 0; i < 8; i++) {
      if(v < 0x80) {
        u8(v);
        return;
      }
      u8((v & 0x7f) | 0x80);
      v >>= 7;
    }
    u8(v);
  }

  void be(std::uint64_t v, int bytes) {
    for(int i = bytes - 1; i >= 0; i--) u8((v >> (8 * i)) & 0xff);
  }

  void i64(std::int64_t v) { compressed ? varint(v) : be(v, 8); }
  void i32(std::int32_t v) { compressed ? varint((std::uint32_t)v) : be((std::uint32_t)v, 4); }
  void i16(std::int16_t v) { compressed ? varint((std::uint16_t)v) : be((std::uint16_t)v, 2); }
  void boolean(bool v) { u8(v ? 1 : 0); }

  void utf8(const std::string& s) {
    u8((std::uint8_t)formats::jfr::StringEncoding::utf8);
    i32(s.size());
    buf += s;
  }
  void latin1(const std::string& s) {
    u8((std::uint8_t)formats::jfr::StringEncoding::latin1);
    i32(s.size());
    for(char c: s) u8(c);
  }
  void poolString(std::int64_t key) {
    u8((std::uint8_t)formats::jfr::StringEncoding::constantPool);
    i64(key);
  }
  void nullString() { u8((std::uint8_t)formats::jfr::StringEncoding::null); }

  const bool compressed;
  std::string buf;
};

/// Builder for a single JFR chunk with the classes the profiler emits.
class ChunkBuilder {
public:
  enum : std::int64_t {
    tLong = 20, tInt = 21, tString = 22, tBoolean = 23,
    tThread = 30, tStackTrace = 31, tStackFrame = 32, tMethod = 33, tClass = 34, tSymbol = 35,
    tWallClock = 101, tExecution = 102, tSetting = 103,
  };

  struct Field {
    std::string name;
    std::int64_t classId;
    bool constantPool = false;
    bool array = false;
  };

  explicit ChunkBuilder(bool compressed = true, std::int64_t tps = 1000000000)
    : compressed(compressed), tps(tps) {
    defineClass(tLong, "long", {});
    defineClass(tInt, "int", {});
    defineClass(tString, "java.lang.String", {});
    defineClass(tBoolean, "boolean", {});
    defineClass(tSymbol, "jdk.types.Symbol", {{"string", tString}});
    defineClass(tClass, "java.lang.Class", {{"name", tSymbol, true}, {"modifiers", tInt}});
    defineClass(tMethod, "jdk.types.Method",
                {{"type", tClass, true}, {"name", tSymbol, true},
                 {"descriptor", tSymbol, true}, {"hidden", tBoolean}});
    defineClass(tStackFrame, "jdk.types.StackFrame",
                {{"method", tMethod, true}, {"lineNumber", tInt}});
    defineClass(tStackTrace, "jdk.types.StackTrace",
                {{"truncated", tBoolean}, {"frames", tStackFrame, false, true}});
    defineClass(tThread, "java.lang.Thread",
                {{"osName", tString}, {"osThreadId", tLong}, {"javaName", tString},
                 {"javaThreadId", tLong}});
    defineClass(tWallClock, "profiler.WallClockSample",
                {{"startTime", tLong}, {"sampledThread", tThread, true},
                 {"stackTrace", tStackTrace, true}, {"appword", tLong}},
                "jdk.jfr.Event");
    defineClass(tExecution, "jdk.ExecutionSample",
                {{"startTime", tLong}, {"sampledThread", tThread, true},
                 {"stackTrace", tStackTrace, true}},
                "jdk.jfr.Event");
    defineClass(tSetting, "jdk.ActiveSetting",
                {{"startTime", tLong}, {"id", tLong}, {"name", tString}, {"value", tString}},
                "jdk.jfr.Event");
  }

  void defineClass(std::int64_t id, std::string name, std::vector<Field> fields,
                   std::string superType = {}) {
    classes[id] = {std::move(name), std::move(superType), std::move(fields)};
  }

  /// Start a new checkpoint event. Entries go to the last one started.
  ChunkBuilder& checkpoint() {
    checkpoints.emplace_back();
    return *this;
  }

  /// Add a constant pool entry, written by the given function.
  ChunkBuilder& entry(std::int64_t classId, std::int64_t key,
                      const std::function<void(JfrWriter&)>& value) {
    if(checkpoints.empty()) checkpoint();
    JfrWriter w(compressed);
    w.i64(key);
    value(w);
    checkpoints.back()[classId].push_back(std::move(w.buf));
    return *this;
  }

  ChunkBuilder& symbol(std::int64_t key, const std::string& text) {
    return entry(tSymbol, key, [&](JfrWriter& w) { w.utf8(text); });
  }
  ChunkBuilder& javaClass(std::int64_t key, std::int64_t nameSymbol) {
    return entry(tClass, key, [&](JfrWriter& w) { w.i64(nameSymbol); w.i32(1); });
  }
  ChunkBuilder& method(std::int64_t key, std::int64_t classKey, std::int64_t nameSymbol) {
    return entry(tMethod, key, [&](JfrWriter& w) {
      w.i64(classKey);
      w.i64(nameSymbol);
      w.i64(0);
      w.boolean(false);
    });
  }
  ChunkBuilder& stack(std::int64_t key, const std::vector<std::int64_t>& methods) {
    return entry(tStackTrace, key, [&](JfrWriter& w) {
      w.boolean(false);
      w.i32(methods.size());
      for(auto m: methods) {
        w.i64(m);
        w.i32(42);
      }
    });
  }
  ChunkBuilder& thread(std::int64_t key, std::int64_t osTid, std::int64_t javaTid = 1) {
    return entry(tThread, key, [&](JfrWriter& w) {
      w.latin1("worker");
      w.i64(osTid);
      w.nullString();
      w.i64(javaTid);
    });
  }

  /// Add an event of the given type, its fields written by the given function.
  ChunkBuilder& event(std::int64_t type, const std::function<void(JfrWriter&)>& fields) {
    JfrWriter w(compressed);
    w.i64(type);
    fields(w);
    events.push_back(std::move(w.buf));
    return *this;
  }

  ChunkBuilder& wallClock(std::int64_t ticks, std::int64_t threadKey, std::int64_t stackKey,
                          std::int64_t appword) {
    return event(tWallClock, [&](JfrWriter& w) {
      w.i64(ticks);
      w.i64(threadKey);
      w.i64(stackKey);
      w.i64(appword);
    });
  }
  ChunkBuilder& execution(std::int64_t ticks, std::int64_t threadKey, std::int64_t stackKey) {
    return event(tExecution, [&](JfrWriter& w) {
      w.i64(ticks);
      w.i64(threadKey);
      w.i64(stackKey);
    });
  }
  ChunkBuilder& setting(const std::string& name, const std::string& value) {
    return event(tSetting, [&](JfrWriter& w) {
      w.i64(0);
      w.i64(1);
      w.utf8(name);
      w.utf8(value);
    });
  }

  /// Serialize the whole chunk: header, events, metadata, checkpoints.
  std::string build() const {
    std::string out(formats::jfr::SZ_ChunkHeader, '\0');
    for(const auto& e: events) out += segment(e);

    const std::int64_t metadataOffset = out.size();
    out += segment(metadata());

    std::int64_t cpOffset = 0;
    for(const auto& cp: checkpoints) {
      cpOffset = out.size();
      JfrWriter w(compressed);
      w.i64(formats::jfr::typeCheckpoint);
      w.i64(0);
      w.i64(0);
      w.i64(0);
      w.u8(1);
      w.i32(cp.size());
      for(const auto& [classId, entries]: cp) {
        w.i64(classId);
        w.i32(entries.size());
        for(const auto& e: entries) w.buf += e;
      }
      out += segment(w.buf);
    }

    JfrWriter h(false);
    h.buf.assign(formats::jfr::magic, sizeof formats::jfr::magic);
    h.be(2, 2);
    h.be(0, 2);
    h.be(out.size(), 8);
    h.be(cpOffset, 8);
    h.be(metadataOffset, 8);
    h.be(0, 8);
    h.be(0, 8);
    h.be(0, 8);
    h.be(tps, 8);
    h.be(compressed ? formats::jfr::featureCompressedInts : 0, 4);
    out.replace(0, h.buf.size(), h.buf);
    return out;
  }

private:
  struct ClassDef {
    std::string name;
    std::string superType;
    std::vector<Field> fields;
  };

  // Prefix a type-led body with its size, which counts the size field too.
  std::string segment(const std::string& body) const {
    const std::uint32_t size = body.size() + 4;
    JfrWriter w(compressed);
    if(compressed) {
      // Padded to 4 bytes so the size can be known up front
      w.u8((size & 0x7f) | 0x80);
      w.u8(((size >> 7) & 0x7f) | 0x80);
      w.u8(((size >> 14) & 0x7f) | 0x80);
      w.u8((size >> 21) & 0x7f);
    } else {
      w.be(size, 4);
    }
    return w.buf + body;
  }

  std::string metadata() const {
    std::vector<std::string> strings;
    std::map<std::string, std::int32_t> index;
    const auto str = [&](const std::string& s) {
      auto it = index.find(s);
      if(it != index.end()) return it->second;
      strings.push_back(s);
      return index[s] = strings.size() - 1;
    };

    JfrWriter tree(compressed);
    const auto element = [&](const std::string& name,
                             const std::vector<std::pair<std::string, std::string>>& attrs,
                             std::size_t nchildren) {
      tree.i32(str(name));
      tree.i32(attrs.size());
      for(const auto& [k, v]: attrs) {
        tree.i32(str(k));
        tree.i32(str(v));
      }
      tree.i32(nchildren);
    };
    element("root", {}, 1);
    element("metadata", {}, classes.size());
    for(const auto& [id, cl]: classes) {
      std::vector<std::pair<std::string, std::string>> attrs = {
        {"id", std::to_string(id)}, {"name", cl.name}};
      if(!cl.superType.empty()) attrs.emplace_back("superType", cl.superType);
      element("class", attrs, cl.fields.size());
      for(const auto& f: cl.fields) {
        std::vector<std::pair<std::string, std::string>> fattrs = {
          {"name", f.name}, {"class", std::to_string(f.classId)}};
        if(f.constantPool) fattrs.emplace_back("constantPool", "true");
        if(f.array) fattrs.emplace_back("dimension", "1");
        element("field", fattrs, 0);
      }
    }

    JfrWriter w(compressed);
    w.i64(formats::jfr::typeMetadata);
    w.i64(0);
    w.i64(0);
    w.i64(1);
    w.i32(strings.size());
    for(const auto& s: strings) w.utf8(s);
    return w.buf + tree.buf;
  }

  bool compressed;
  std::int64_t tps;
  std::map<std::int64_t, ClassDef> classes;
  std::vector<std::string> events;
  std::vector<std::map<std::int64_t, std::vector<std::string>>> checkpoints;
};

}

#endif  // POLLCATCH_DECODER_TEST_JFR_BUILDER_H
