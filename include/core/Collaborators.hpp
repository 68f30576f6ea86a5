#ifndef COLLABORATORS_HPP
#define COLLABORATORS_HPP

#include <string>
#include <vector>
#include <cstdint>

#include "core/TransferError.hpp"

struct TaskInput
{
    std::string url;
    std::string destinationDirectory;
    std::string fileName;     // empty: take the name the resolver reports
    std::string expectedHash; // hex SHA-256, empty: taken from the resolver if it has one
    std::string label;
};

struct ResolvedArtifact
{
    std::string downloadUrl;
    std::string filename;
    std::int64_t size{-1};
    std::string expectedHash;
    std::vector<std::string> headers; // extra request headers, e.g. authorisation
};

class CatalogResolver
{
public:
    virtual ~CatalogResolver() = default;

    virtual Result<ResolvedArtifact> resolve(const TaskInput &input) = 0;
};

class ArtifactCheck
{
public:
    virtual ~ArtifactCheck() = default;

    virtual bool alreadyPresent(const ResolvedArtifact &resolved, const std::string &destination) = 0;
};

// Present when the file on disk has the expected hash, or failing that the expected size
class LocalArtifactCheck : public ArtifactCheck
{
public:
    bool alreadyPresent(const ResolvedArtifact &resolved, const std::string &destination) override;
};

#endif
