#include <spdlog/spdlog.h>

#include "core/Collaborators.hpp"
#include "aux/Sha256Hasher.hpp"
#include "util/file.hpp"

bool LocalArtifactCheck::alreadyPresent(const ResolvedArtifact &resolved, const std::string &destination)
{
    std::int64_t existing = fileSize(destination);
    if (existing < 0)
    {
        return false;
    }

    // A size mismatch rules the file out without reading it
    if (resolved.size > 0 && existing != resolved.size)
    {
        return false;
    }

    if (!resolved.expectedHash.empty())
    {
        std::string actual = sha256OfFile(destination);
        bool matches = digestsEqual(actual, resolved.expectedHash);
        spdlog::debug("existing file {} hash {} (expected {})", destination, actual, resolved.expectedHash);
        return matches;
    }

    // Without a hash the size is the only evidence, and an unknown size proves nothing
    return resolved.size > 0;
}
