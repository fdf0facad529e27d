// scopelink/project/link_config.cpp - Project configuration implementation
//
#include "scopelink/project/link_config.hpp"

#include <yaml-cpp/yaml.h>

namespace scopelink
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  LinkConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'link' section
  if (root["link"]) {
    const auto & link = root["link"];

    if (link["global_packages"]) {
      if (!link["global_packages"].IsSequence()) {
        return ConfigLoadResult::fail("link.global_packages must be a list");
      }
      config.link.global_packages.clear();
      for (const auto & name : link["global_packages"]) {
        config.link.global_packages.push_back(name.as<std::string>());
      }
    }

    if (link["ids"]) {
      const auto ids = link["ids"].as<std::string>();
      const auto strategy = parse_id_strategy(ids);
      if (!strategy) {
        return ConfigLoadResult::fail(
          "invalid link.ids: '" + ids + "' (must be 'counter' or 'random')");
      }
      config.link.id_strategy = *strategy;
    }

    if (link["verbose"]) {
      config.verbose = link["verbose"].as<bool>();
    }
  }

  // Parse 'check' section
  if (root["check"]) {
    const auto & check = root["check"];
    if (check["unresolved_references"]) {
      config.check.unresolved_references = check["unresolved_references"].as<bool>();
    }
  }

  // Parse 'inputs' section
  if (root["inputs"]) {
    if (!root["inputs"].IsSequence()) {
      return ConfigLoadResult::fail("inputs must be a list");
    }
    for (const auto & input : root["inputs"]) {
      std::filesystem::path path = input.as<std::string>();
      if (path.is_relative()) {
        path = project_root / path;
      }
      config.inputs.push_back(path.lexically_normal());
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_link_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_link_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  const fs::path project_root = fs::absolute(config_path).parent_path();
  try {
    return parse_root(YAML::LoadFile(config_path.string()), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_link_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_link_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace scopelink
