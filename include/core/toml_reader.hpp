/**
 * @file toml_reader.hpp
 * @brief TOML file parsing utilities using tomlplusplus
 */

#ifndef WSFORGE_TOML_READER_H
#define WSFORGE_TOML_READER_H

#include <memory>
#include <string>
#include <vector>

#include "core/types.h"

#include <toml++/toml.hpp>

namespace wsforge {

/**
 * @brief Read-only view of a parsed TOML document or one of its tables
 *
 * Copies share the parsed data.
 */
class toml_reader {
public:
  /**
   * @brief Constructor
   */
  toml_reader() = default;

  /**
   * @brief Constructor that takes a toml::table directly
   * @param table The TOML table to wrap
   */
  explicit toml_reader(const toml::table &table);

  /**
   * @brief Load and parse a TOML file
   * @param filepath Path to the TOML file
   * @return True if the file was successfully loaded and parsed
   */
  bool load(const std::string &filepath);

  /**
   * @brief Parse a TOML document held in memory
   * @param content The document text
   * @param source_name Name used in error messages
   * @return True if the document was successfully parsed
   */
  bool parse(const std::string &content,
             const std::string &source_name = "<memory>");

  /**
   * @brief Check if a document is loaded
   */
  bool is_loaded() const { return static_cast<bool>(toml_data); }

  /**
   * @brief Get the reason the last load() or parse() failed
   */
  const std::string &last_error() const { return error_; }

  /**
   * @brief Get a string value from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  std::string get_string(const std::string &key,
                         const std::string &default_value = "") const;

  /**
   * @brief Get an integer value from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  int64_t get_int(const std::string &key, int64_t default_value = 0) const;

  /**
   * @brief Get a boolean value from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @param default_value The default value to return if the key is not found
   * @return The value associated with the key, or default_value if not found
   */
  bool get_bool(const std::string &key, bool default_value = false) const;

  /**
   * @brief Get a string array from the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @return The array associated with the key, or empty vector if not found
   */
  std::vector<std::string> get_string_array(const std::string &key) const;

  /**
   * @brief Check if a key exists in the TOML file
   * @param key The key to look up (can be dotted for tables)
   * @return True if the key exists
   */
  bool has_key(const std::string &key) const;

  /**
   * @brief Get all keys in a table
   * @param table The table name (empty for root table)
   * @return Vector of keys in the table
   */
  std::vector<std::string> get_table_keys(const std::string &table = "") const;

  /**
   * @brief Get an array of tables from the TOML file
   * @param key The key to look up (e.g., "project" for [[project]])
   * @return Vector of toml_reader objects, each wrapping one table from the array
   */
  std::vector<toml_reader> get_table_array(const std::string &key) const;

private:
  toml::node_view<const toml::node> at(const std::string &key) const;

  std::shared_ptr<const toml::table> toml_data;
  std::string error_;
};

} // namespace wsforge

#endif // WSFORGE_TOML_READER_H
