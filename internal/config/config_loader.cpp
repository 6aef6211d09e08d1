#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace avatarpool::config {

using avatarpool::runtime::config::RuntimeConfig;

namespace {

std::string Where(const YAML::Node& node) {
  const auto mark = node.Mark();
  if (mark.is_null()) return "";
  return " (line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1) + ")";
}

// Plain scalars are typed by content; quoted scalars ("5s", "0755") stay strings.
void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!" || text.empty()) {
    out->set_string_value(text);
  } else if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
  } else {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      out->set_number_value(number);
    } else {
      out->set_string_value(text);
    }
  }
}

void Convert(const YAML::Node& node, google::protobuf::Value* out) {
  if (node.IsNull()) {
    out->set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    ConvertScalar(node, out);
  } else if (node.IsSequence()) {
    auto* list = out->mutable_list_value();
    for (const auto& item : node) {
      Convert(item, list->add_values());
    }
  } else if (node.IsMap()) {
    auto& fields = *out->mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      if (!entry.first.IsScalar()) {
        throw std::runtime_error("Invalid configuration: non-scalar key" + Where(entry.first));
      }
      const auto& key = entry.first.Scalar();
      if (fields.count(key) != 0) {
        throw std::runtime_error("Invalid configuration: duplicate key '" + key + "'" + Where(entry.first));
      }
      Convert(entry.second, &fields[key]);
    }
  } else {
    throw std::runtime_error("Invalid configuration: unsupported YAML node" + Where(node));
  }
}

RuntimeConfig FromYaml(const YAML::Node& root) {
  RuntimeConfig config;
  if (!root.IsDefined() || root.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping" + Where(root));
  }

  google::protobuf::Value value;
  Convert(root, &value);

  std::string json;
  const auto  to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(parsed.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

void RequireNonEmpty(const std::string& value, const char* field) {
  if (value.empty()) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " is required");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromYaml(root);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return FromYaml(root);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  RequireNonEmpty(config.pool().directory(), "pool.directory");
  RequireNonEmpty(config.profiles().root(), "profiles.root");

  if (config.database().has_sqlite()) {
    RequireNonEmpty(config.database().sqlite().path(), "database.sqlite.path");
  }
  if (config.identity().has_sqlite()) {
    RequireNonEmpty(config.identity().sqlite().path(), "identity.sqlite.path");
  }

  const auto& delay = config.reconcile().startup_delay();
  if (!delay.empty()) {
    try {
      (void)avatarpool::util::ParseDuration(delay);
    } catch (const std::logic_error& e) {
      throw std::runtime_error("Invalid configuration: reconcile.startup_delay: " + std::string(e.what()));
    }
  }
}

} // namespace avatarpool::config
