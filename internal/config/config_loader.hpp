#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"
#include "provgate/policy/v1/policy.pb.h"

namespace provgate::config {

/*
  Loads RuntimeConfig and Policy documents from YAML files.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected so typos in a policy never go unnoticed.
*/
class ConfigLoader {
 public:
  static provgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static provgate::policy::v1::Policy             LoadPolicyFromYaml(const std::string& path);

  // Parses a YAML document held in memory into message.
  static void ParseYaml(const std::string& yaml_text, google::protobuf::Message* message);

 private:
  static void LoadFile(const std::string& path, google::protobuf::Message* message);
};

} // namespace provgate::config
