#include "archcheck/registry/registry.h"

namespace archcheck::registry {

const ArchitectureNode* Registry::find_node(const std::string& arch_id) const {
  const auto it = nodes.find(arch_id);
  return it == nodes.end() ? nullptr : &it->second;
}

const Mixin* Registry::find_mixin(const std::string& mixin_id) const {
  const auto it = mixins.find(mixin_id);
  return it == mixins.end() ? nullptr : &it->second;
}

}  // namespace archcheck::registry
