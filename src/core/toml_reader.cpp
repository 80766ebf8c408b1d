/**
 * @file toml_reader.cpp
 * @brief Implementation of TOML file parsing utilities
 */

#include "core/toml_reader.hpp"
#include "wsforge/log.hpp"

#include <filesystem>
#include <sstream>

namespace wsforge {

toml_reader::toml_reader(const toml::table &table)
    : toml_data(std::make_shared<const toml::table>(table)) {}

bool toml_reader::load(const std::string &filepath) {
  toml_data.reset();
  error_.clear();

  if (!std::filesystem::exists(filepath)) {
    error_ = "TOML file does not exist: " + filepath;
    logger::print_error(error_);
    return false;
  }

  try {
    toml_data = std::make_shared<const toml::table>(toml::parse_file(filepath));
    return true;
  } catch (const toml::parse_error &err) {
    std::stringstream ss;
    ss << "Error parsing TOML file " << filepath << ": " << err.description()
       << " at line " << err.source().begin.line;
    error_ = ss.str();
    logger::print_error(error_);
    return false;
  } catch (const std::exception &ex) {
    error_ = "Error reading TOML file " + filepath + ": " + ex.what();
    logger::print_error(error_);
    return false;
  }
}

bool toml_reader::parse(const std::string &content,
                        const std::string &source_name) {
  toml_data.reset();
  error_.clear();

  try {
    toml_data = std::make_shared<const toml::table>(
        toml::parse(content, std::string_view(source_name)));
    return true;
  } catch (const toml::parse_error &err) {
    std::stringstream ss;
    ss << "Error parsing TOML from " << source_name << ": "
       << err.description() << " at line " << err.source().begin.line;
    error_ = ss.str();
    logger::print_error(error_);
    return false;
  }
}

toml::node_view<const toml::node>
toml_reader::at(const std::string &key) const {
  if (!toml_data) {
    return {};
  }
  return toml_data->at_path(key);
}

std::string toml_reader::get_string(const std::string &key,
                                    const std::string &default_value) const {
  auto value = at(key);
  if (!value || !value.is_string()) {
    return default_value;
  }
  return value.as_string()->get();
}

int64_t toml_reader::get_int(const std::string &key,
                             int64_t default_value) const {
  auto value = at(key);
  if (!value || !value.is_integer()) {
    return default_value;
  }
  return value.as_integer()->get();
}

bool toml_reader::get_bool(const std::string &key, bool default_value) const {
  auto value = at(key);
  if (!value || !value.is_boolean()) {
    return default_value;
  }
  return value.as_boolean()->get();
}

std::vector<std::string>
toml_reader::get_string_array(const std::string &key) const {
  std::vector<std::string> result;
  auto value = at(key);
  if (!value || !value.is_array()) {
    return result;
  }

  for (const auto &val : *value.as_array()) {
    if (val.is_string()) {
      result.push_back(val.as_string()->get());
    }
  }
  return result;
}

bool toml_reader::has_key(const std::string &key) const {
  return static_cast<bool>(at(key));
}

std::vector<std::string>
toml_reader::get_table_keys(const std::string &table_name) const {
  std::vector<std::string> result;
  if (!toml_data) {
    return result;
  }

  const toml::table *table = toml_data.get();

  // Navigate to subtable if specified
  if (!table_name.empty()) {
    auto node = at(table_name);
    if (!node || !node.is_table()) {
      return result;
    }
    table = node.as_table();
  }

  for (const auto &[key, _] : *table) {
    result.push_back(std::string(key.str()));
  }
  return result;
}

std::vector<toml_reader>
toml_reader::get_table_array(const std::string &key) const {
  std::vector<toml_reader> result;
  auto value = at(key);
  if (!value || !value.is_array()) {
    return result;
  }

  for (const auto &item : *value.as_array()) {
    if (item.is_table()) {
      result.emplace_back(*item.as_table());
    }
  }
  return result;
}

} // namespace wsforge
