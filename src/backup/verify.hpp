#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include "backup_orchestrator.hpp"

struct ArtifactCheck {
    std::string filename;
    bool exists = false;
    std::uintmax_t size = 0;
};

struct VerifyReport {
    std::vector<ArtifactCheck> artifacts;
    std::vector<std::string> warnings;

    bool ok() const { return warnings.empty(); }
};

// Last "Cryptochecksum:<hex>" line of a saved configuration.
std::optional<std::string> find_cryptochecksum(const std::string& config_text);

// Looks at the artifacts of the units that succeeded in a local
// destination directory: missing and zero-length files are flagged. When
// both legacy configurations of a unit were copied, differing checksums mean
// the running configuration was never saved. A context configuration that
// differs between the active and the standby unit means replication failed.
VerifyReport verify_destination(const std::filesystem::path& dir, const RunReport& report);
