#pragma once
#include "type.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct NodeTypeDesc {
  std::string _type_name;
  node_tag_t  _tag;
  std::string _tag_str;
  NodeTypeDesc(std::string name, node_tag_t tag) :
    _type_name(std::move(name)), _tag(tag), _tag_str(std::to_string(tag)) {}
};

/**
 * @brief ordered catalogue of node types. the i-th declared type gets tag i+1.
 * NO REORDERING! a tag is baked into every global id handed out so far, so
 * new types may only be appended to the end of the list.
 *
 * Filled once by init() and read-only afterwards, so lookups take no latch.
 */
class NodeRegistry {
 private:
  std::vector<NodeTypeDesc> _types; // _types[tag - 1]
  bool _initialized = false;

  static std::string trim(const std::string & s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
  }
  const NodeTypeDesc & get_desc(const node_tag_t tag) const {
    if (tag == kUnknownTag || tag > _types.size()) {
      throw RegistryException(Formatter() << "Unknown node tag " << tag);
    }
    return _types[tag - 1];
  }
 public:
  NodeRegistry() {}
  explicit NodeRegistry(const std::vector<std::string> & type_names) { init(type_names); }
  NodeRegistry(const NodeRegistry &) = delete;
  NodeRegistry & operator=(const NodeRegistry &) = delete;

  void init(const std::vector<std::string> & type_names) {
    if (_initialized) throw FatalException("Node registry already initialized");
    if (type_names.empty()) throw RegistryException("Node registry needs at least one type");
    std::unordered_set<std::string> seen;
    std::vector<NodeTypeDesc> types;
    for (size_t i = 0; i < type_names.size(); i++) {
      const std::string & name = type_names[i];
      if (name.empty()) throw RegistryException(Formatter() << "Empty node type name at position " << i);
      if (!seen.insert(name).second) throw RegistryException(Formatter() << "Duplicated node type " << name);
      types.emplace_back(name, static_cast<node_tag_t>(i + 1));
    }
    _types = std::move(types);
    _initialized = true;
    LOG_DEBUG("node registry initialized with %zu types", _types.size());
  }
  /**
   * @brief one type name per line, '#' starts a comment line.
   */
  void init(const std::string & fname) {
    std::ifstream f(fname);
    if (!f.is_open()) throw RegistryException(Formatter() << "Can not open node type list " << fname);
    LOG_INFO("initializing node registry using %s", fname.c_str());
    std::vector<std::string> names;
    std::string line;
    while (std::getline(f, line)) {
      std::string name = trim(line);
      if (name.empty()) continue;
      if (name[0] == '#') continue;
      names.push_back(name);
    }
    init(names);
  }

  bool initialized() const { return _initialized; }
  size_t size() const { return _types.size(); }

  /**
   * @brief exact string match against the registered tag strings. "02" or
   * "2 " do not match tag 2.
   * @return kUnknownTag if nothing matches
   */
  node_tag_t find_tag(const std::string & tag_str) const {
    for (auto & desc : _types) {
      if (desc._tag_str == tag_str) return desc._tag;
    }
    return kUnknownTag;
  }
  std::optional<std::string> lookup(const std::string & tag_str) const {
    node_tag_t tag = find_tag(tag_str);
    if (tag == kUnknownTag) return std::nullopt;
    return get_desc(tag)._type_name;
  }
  node_tag_t get_tag_by_name(const std::string & name) const {
    for (auto & desc : _types) {
      if (desc._type_name == name) return desc._tag;
    }
    throw RegistryException(Formatter() << "Unregistered node type " << name);
  }
  const std::string & get_type_name(const node_tag_t tag) const {
    return get_desc(tag)._type_name;
  }
  const std::string & get_tag_str(const node_tag_t tag) const {
    return get_desc(tag)._tag_str;
  }
  const std::vector<NodeTypeDesc> & types() const { return _types; }

  void print(std::ostream & os = std::cout) const {
    for (auto & desc : _types) {
      os << "tag: " << desc._tag << " is " << desc._type_name << "\n";
    }
  }
  static NodeRegistry* get() {
    static NodeRegistry reg;
    return &reg;
  }
};
