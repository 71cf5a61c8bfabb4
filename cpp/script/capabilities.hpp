#ifndef SCRIPT_CAPABILITIES_HPP
#define SCRIPT_CAPABILITIES_HPP

#include <string>
#include <vector>

namespace script {

// An entry of the allow-list: a builtin ("len"), a module ("math"), a module
// member ("math.sqrt") or a method ("str.upper").
struct Capability {
  std::string name;
  std::string description;
};

// Static read-only index of everything a snippet can reach, in display
// order. help() and the "capabilities" command read it.
const std::vector<Capability>& CapabilityIndex();

// Returns nullptr if name is not in the index.
const Capability* FindCapability(const std::string& name);

// Process, filesystem, network and reflection names that raise
// CapabilityError instead of NameError.
bool IsDeniedName(const std::string& name);

bool IsAllowedModule(const std::string& name);
const std::vector<std::string>& AllowedModules();

}  // namespace script

#endif
