#pragma once

#include "util.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace playpack {

struct resolver_result {
  int exit_code;
  std::optional<int> signal;
};

// Installs the roles listed in a requirements descriptor into a target directory.
// Only the overall exit status is meaningful; per-role failures are the resolver's own
// business.
class dependency_resolver : unmovable {
 public:
  using ptr_t = std::unique_ptr<dependency_resolver>;

  virtual ~dependency_resolver() = default;
  virtual resolver_result resolve(std::filesystem::path const &descriptor,
                                  std::filesystem::path const &target_dir) = 0;

 protected:
  dependency_resolver() = default;
};

// ansible-galaxy subprocess adapter.
class galaxy_resolver : public dependency_resolver {
 public:
  // Empty executable selects $PLAYPACK_RESOLVER, falling back to "ansible-galaxy".
  explicit galaxy_resolver(std::string executable = {});

  resolver_result resolve(std::filesystem::path const &descriptor,
                          std::filesystem::path const &target_dir) override;

  std::vector<std::string> command_line(std::filesystem::path const &descriptor,
                                        std::filesystem::path const &target_dir) const;

 private:
  std::string executable_;
};

// Remove every resolver install-metadata file under install_dir. Returns the count.
std::size_t strip_install_metadata(std::filesystem::path const &install_dir);

// If <staging_root>/requirements.yml exists, resolve it into <staging_root>/roles and
// strip install metadata. Throws dependency_error on resolver failure and
// interrupted_error if a termination signal arrived meanwhile.
void materialize_dependencies(std::filesystem::path const &staging_root,
                              dependency_resolver &resolver);

}  // namespace playpack
