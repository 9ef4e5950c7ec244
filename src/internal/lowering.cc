#include "shepherd/internal/lowering.hpp"

#include <unistd.h>

#include <map>
#include <string>

#if SHEPHERD_PLATFORM_MACOS
#include <crt_externs.h>
#endif

namespace shepherd::internal {

namespace {

char** process_environ() {
#if SHEPHERD_PLATFORM_MACOS
  char*** envp = _NSGetEnviron();
  return (envp != nullptr) ? *envp : nullptr;
#else
  return ::environ;
#endif
}

}  // namespace

Result<SpawnSpec> lower_spec(const ProcessSpec& spec) {
  if (spec.executable().empty()) {
    return Error{.code = make_error_code(errc::empty_executable), .context = "executable"};
  }

  SpawnSpec lowered;
  lowered.argv.reserve(spec.args().size() + 1);
  lowered.argv.push_back(spec.executable());
  lowered.argv.insert(lowered.argv.end(), spec.args().begin(), spec.args().end());
  lowered.cwd = spec.working_directory();

  std::map<std::string, std::string, std::less<>> env_map;
  for (char** env = process_environ(); env != nullptr && *env != nullptr; ++env) {
    std::string_view entry(*env);
    auto pos = entry.find('=');
    if (pos == std::string_view::npos) {
      continue;
    }
    env_map[std::string(entry.substr(0, pos))] = std::string(entry.substr(pos + 1));
  }

  for (const auto& [key, entry] : spec.env()) {
    if (entry.value) {
      env_map[key] = *entry.value;
    } else {
      env_map.erase(key);
    }
  }

  lowered.envp.reserve(env_map.size());
  for (const auto& [key, value] : env_map) {
    lowered.envp.push_back(key + "=" + value);
  }
  return lowered;
}

}  // namespace shepherd::internal
