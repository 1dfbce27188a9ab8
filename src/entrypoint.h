#pragma once

#include <filesystem>

namespace playpack {

struct runtime_assets;

// Copy the runtime entrypoint to <staging_root>/run.sh with mode 0750.
void install_entrypoint(runtime_assets const &assets,
                        std::filesystem::path const &staging_root);

}  // namespace playpack
