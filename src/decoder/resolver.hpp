// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_RESOLVER_H
#define POLLCATCH_DECODER_RESOLVER_H

#include "poll.hpp"
#include "sources/jfr.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace pollcatch {

/// Resolves stack ids, threads and strings against the merged constant pools
/// of one trace. Nothing here fails: whatever cannot be resolved comes back
/// as a placeholder.
class Resolver final {
public:
  explicit Resolver(const sources::ConstantPools&);
  ~Resolver() = default;

  Resolver(const Resolver&) = delete;
  Resolver& operator=(const Resolver&) = delete;

  /// Get the stack for the given id, leaf frame first. A missing id or
  /// constant pool entry gives an unresolved Stack with no frames.
  // MT: Externally Synchronized
  const Stack& stack(std::optional<std::int64_t>);

  /// OS thread id for a sampled thread, falling back to the Java thread id
  /// and then to the constant pool key.
  std::int64_t thread(const sources::Value&) const noexcept;

  /// Follow a constant pool reference, or nullptr if it dangles.
  const sources::Value* deref(const sources::Value&) const noexcept;

  /// String contents of a value, looking through references and symbols.
  std::optional<std::string> string(const sources::Value&) const;

  /// Integer contents of a value, looking through references.
  std::optional<std::int64_t> integer(const sources::Value&) const noexcept;

private:
  StackFrame frame(const sources::Value&) const;

  const sources::ConstantPools& pools;
  std::optional<std::uint32_t> stackType;
  std::unordered_map<std::int64_t, Stack> stacks;
  Stack missing;
};

}

#endif  // POLLCATCH_DECODER_RESOLVER_H
