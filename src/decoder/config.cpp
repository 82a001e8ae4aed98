// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "config.hpp"

#include "../common/util/log.hpp"

#include <yaml-cpp/yaml.h>

using namespace pollcatch;

static DecoderConfig fromNode(const YAML::Node& root, const std::string& where) {
  DecoderConfig cfg;
  if(root.IsNull()) return cfg;
  if(!root.IsMap())
    throw std::runtime_error(where + ": expected a mapping at the top level");

  for(const auto& kv: root) {
    const auto key = kv.first.as<std::string>();
    const YAML::Node& val = kv.second;
    if(key == "stack-depth") {
      const auto d = val.as<long long>();
      if(d < 0) throw std::runtime_error(where + ": stack-depth must not be negative");
      cfg.stackDepth = (std::size_t)d;
    } else if(key == "skip-frames") {
      if(val.IsScalar()) cfg.skipFrames.push_back(val.as<std::string>());
      else if(val.IsSequence()) {
        for(const auto& f: val) cfg.skipFrames.push_back(f.as<std::string>());
      } else if(!val.IsNull())
        throw std::runtime_error(where + ": skip-frames must be a list of strings");
    } else if(key == "pr-file") {
      cfg.prFile = val.as<std::string>();
    } else if(key == "export") {
      cfg.exportPath = val.as<std::string>();
    } else {
      util::log::warning{} << where << ": ignoring unknown key '" << key << "'";
    }
  }
  return cfg;
}

DecoderConfig DecoderConfig::load(const std::filesystem::path& path) {
  try {
    return fromNode(YAML::LoadFile(path.string()), path.string());
  } catch(YAML::BadFile&) {
    throw std::runtime_error(path.string() + ": unable to open configuration file");
  } catch(YAML::Exception& e) {
    throw std::runtime_error(path.string() + ": " + e.what());
  }
}

DecoderConfig DecoderConfig::parse(const std::string& text) {
  try {
    return fromNode(YAML::Load(text), "<config>");
  } catch(YAML::Exception& e) {
    throw std::runtime_error(std::string("<config>: ") + e.what());
  }
}
