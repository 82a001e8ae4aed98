// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "resolver.hpp"

#include "../common/util/log.hpp"

#include <sstream>

using namespace pollcatch;
using namespace sources;

// Chains of references or symbols are never longer than this.
static constexpr unsigned int maxHops = 8;

Resolver::Resolver(const ConstantPools& p)
  : pools(p), stackType(p.type("jdk.types.StackTrace")), missing{0, {}, false} {}

const Value* Resolver::deref(const Value& v) const noexcept {
  const Value* cur = &v;
  for(unsigned int i = 0; i < maxHops; i++) {
    const auto* r = std::get_if<Ref>(cur);
    if(r == nullptr) return cur;
    cur = pools.find(*r);
    if(cur == nullptr) return nullptr;
  }
  return nullptr;
}

std::optional<std::string> Resolver::string(const Value& v) const {
  const Value* cur = &v;
  for(unsigned int i = 0; i < maxHops; i++) {
    cur = deref(*cur);
    if(cur == nullptr) return std::nullopt;
    if(const auto* s = std::get_if<std::string>(cur)) return *s;
    // Symbols wrap their text in a single "string" field
    const auto* o = std::get_if<Object>(cur);
    if(o == nullptr) return std::nullopt;
    cur = o->field("string");
    if(cur == nullptr) return std::nullopt;
  }
  return std::nullopt;
}

std::optional<std::int64_t> Resolver::integer(const Value& v) const noexcept {
  const Value* d = deref(v);
  if(d == nullptr) return std::nullopt;
  if(const auto* i = std::get_if<std::int64_t>(d)) return *i;
  return std::nullopt;
}

std::int64_t Resolver::thread(const Value& v) const noexcept {
  if(const Value* d = deref(v)) {
    if(const auto* o = std::get_if<Object>(d)) {
      for(const char* name: {"osThreadId", "javaThreadId"}) {
        if(const auto* f = o->field(name))
          if(auto id = integer(*f)) return *id;
      }
    }
  }
  if(const auto* r = std::get_if<Ref>(&v)) return r->key;
  return -1;
}

StackFrame Resolver::frame(const Value& v) const {
  StackFrame f{0, {}, false};
  const Value* method = nullptr;
  if(const Value* d = deref(v)) {
    if(const auto* o = std::get_if<Object>(d)) method = o->field("method");
  }
  if(method != nullptr) {
    if(const auto* r = std::get_if<Ref>(method)) f.id = r->key;
    if(const Value* m = deref(*method)) {
      if(const auto* mo = std::get_if<Object>(m)) {
        std::optional<std::string> name;
        std::optional<std::string> cls;
        if(const auto* n = mo->field("name")) name = string(*n);
        if(const auto* t = mo->field("type")) {
          if(const Value* c = deref(*t))
            if(const auto* co = std::get_if<Object>(c))
              if(const auto* cn = co->field("name")) cls = string(*cn);
        }
        if(name) {
          f.symbol = cls && !cls->empty() ? *cls + "." + *name : *name;
          f.resolved = true;
          return f;
        }
      }
    }
  }
  std::ostringstream ss;
  ss << "0x" << std::hex << f.id;
  f.symbol = ss.str();
  return f;
}

const Stack& Resolver::stack(std::optional<std::int64_t> id) {
  if(!id) return missing;
  auto it = stacks.find(*id);
  if(it != stacks.end()) return it->second;

  Stack s{*id, {}, false};
  const Value* trace = stackType ? pools.find(*stackType, *id) : nullptr;
  if(trace != nullptr) {
    if(const auto* o = std::get_if<Object>(trace)) {
      if(const auto* fv = o->field("frames")) {
        if(const auto* arr = std::get_if<Array>(fv)) {
          s.resolved = true;
          s.frames.reserve(arr->items.size());
          for(const auto& item: arr->items) s.frames.push_back(frame(item));
        }
      }
    }
  }
  if(!s.resolved)
    util::log::debug{} << "Stack " << *id << " has no usable constant pool entry";
  return stacks.emplace(*id, std::move(s)).first->second;
}
