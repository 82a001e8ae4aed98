// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_SOURCES_JFR_H
#define POLLCATCH_DECODER_SOURCES_JFR_H

#include "../formats/jfr.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pollcatch::sources {

/// The trace is damaged beyond use: a bad header, a size that does not fit the
/// bytes available, or a reference into metadata that does not exist.
class CorruptTrace : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ClassLayout;
struct Value;

/// Reference to an entry in the constant pool of the given (interned) type.
struct Ref {
  std::uint32_t type;
  std::int64_t key;
};

/// Structured value, laid out as given by its class.
struct Object {
  std::shared_ptr<const ClassLayout> layout;
  std::vector<Value> fields;

  /// Get the named field, or nullptr if the class has no such field.
  const Value* field(std::string_view) const noexcept;
};

struct Array {
  std::vector<Value> items;
};

/// Any value that can appear in an event or constant pool entry.
struct Value : std::variant<std::monostate, std::int64_t, double, std::string,
                            Ref, Object, Array> {
  using variant::variant;
};

/// Description of a single field of a class, from the chunk metadata.
struct FieldLayout {
  std::string name;
  std::int64_t classId;
  bool constantPool = false;
  bool array = false;
};

/// Description of a class (event type, pool type or primitive), from the
/// chunk metadata.
struct ClassLayout {
  std::int64_t id;
  std::string name;
  std::string superType;
  std::vector<FieldLayout> fields;

  /// Index of the named field, if present.
  std::optional<std::size_t> field(std::string_view) const noexcept;
};

/// Class layouts of a single chunk, by class id.
class Metadata {
public:
  Metadata() = default;

  void add(ClassLayout);

  /// Get the class with the given id, or nullptr if unknown.
  const std::shared_ptr<const ClassLayout>* find(std::int64_t) const noexcept;

  /// Get the class with the given name, or nullptr if unknown.
  const ClassLayout* find(std::string_view) const noexcept;

private:
  std::unordered_map<std::int64_t, std::shared_ptr<const ClassLayout>> classes;
};

/// Constant pools of a whole file, merged across chunks. Pools are keyed by
/// type name since class ids are only meaningful within one chunk. The first
/// definition of a key wins.
class ConstantPools {
public:
  ConstantPools() = default;

  /// Get the index for a type name, adding it if needed.
  std::uint32_t intern(std::string_view);

  /// Get the index for a type name, if it has been seen.
  std::optional<std::uint32_t> type(std::string_view) const noexcept;

  /// Name of an interned type.
  const std::string& name(std::uint32_t) const noexcept;

  /// Add an entry. Returns false if the key was already defined.
  bool add(std::uint32_t type, std::int64_t key, Value);

  /// Look up an entry, or nullptr if it was never defined.
  const Value* find(std::uint32_t type, std::int64_t key) const noexcept;
  const Value* find(const Ref& r) const noexcept { return find(r.type, r.key); }

  /// Total number of entries across all pools.
  std::size_t size() const noexcept;

private:
  std::vector<std::string> names;
  std::unordered_map<std::string, std::uint32_t> indices;
  std::vector<std::unordered_map<std::int64_t, Value>> pools;
};

/// Self-sized record within a chunk.
struct Segment {
  enum class Kind { metadata, constantPool, events };
  Kind kind;
  std::int64_t type;
  std::uint64_t offset;  ///< From the start of the chunk
  std::uint64_t size;
};

/// One chunk of a JFR file, held entirely in memory.
struct Chunk {
  formats::jfr::ChunkHeader header;
  std::vector<char> data;  ///< Whole chunk, header included
  std::vector<Segment> segments;
  std::uint64_t fileOffset;
};

/// Streaming splitter of a JFR file into validated chunks and segments.
class JfrReader final {
public:
  explicit JfrReader(std::istream&);
  ~JfrReader() = default;

  JfrReader(const JfrReader&) = delete;
  JfrReader& operator=(const JfrReader&) = delete;

  /// Read the next chunk, or nothing once the input ends cleanly between
  /// chunks. Throws CorruptTrace.
  std::optional<Chunk> next();

  /// Bytes consumed so far.
  std::uint64_t offset() const noexcept { return pos; }

private:
  std::istream& in;
  std::uint64_t pos = 0;
};

/// A profiler sample as found in the trace, nothing resolved yet.
struct RawSample {
  std::int64_t ticks;
  std::int64_t ticksPerSecond;
  Value thread;
  std::optional<std::int64_t> stackId;
  std::optional<std::int64_t> appword;  ///< Only wall-clock samples carry one
};

/// A recording setting becoming active, nothing resolved yet.
struct RawSetting {
  Value name;
  Value value;
};

using RawEvent = std::variant<RawSample, RawSetting>;

/// First pass over a JFR file: every chunk parsed, constant pools merged and
/// raw samples collected in trace order.
class JfrTrace final {
public:
  /// Decode the whole stream. Throws CorruptTrace.
  explicit JfrTrace(std::istream&);
  ~JfrTrace() = default;

  JfrTrace(JfrTrace&&) = default;
  JfrTrace& operator=(JfrTrace&&) = default;

  /// Decode the file at the given path, transparently decompressing XZ.
  /// Throws CorruptTrace, or std::system_error if the file cannot be read.
  static JfrTrace open(const std::filesystem::path&);

  const ConstantPools& pools() const noexcept { return m_pools; }
  const std::vector<RawEvent>& events() const noexcept { return m_events; }
  std::size_t chunks() const noexcept { return m_chunks; }

private:
  void parse(const Chunk&);

  ConstantPools m_pools;
  std::vector<RawEvent> m_events;
  std::size_t m_chunks = 0;
};

}

#endif  // POLLCATCH_DECODER_SOURCES_JFR_H
