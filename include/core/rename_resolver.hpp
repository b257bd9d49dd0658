#pragma once

#include "core/settings.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Canonical filename proposed for a source file
 */
struct NameProposal
{
    bool success = false;
    std::string filename;      // Sanitized basename, set on success
    std::string output;        // Full diagnostic text of the resolver
    std::string error_message; // Set on failure
};

/**
 * @brief Black-box source of canonical movie filenames
 */
class RenameResolver
{
public:
    virtual ~RenameResolver() = default;

    /**
     * @brief Propose a canonical filename for the file at file_path
     * @return NameProposal; success=false means the entry must fail without retry
     */
    virtual NameProposal proposeName(const std::string &file_path) = 0;

    /**
     * @brief Build the resolver selected by settings.enabled
     */
    static std::unique_ptr<RenameResolver> create(const RenamerSettings &settings);
};

/**
 * @brief Keeps the original filename (used when the external renamer is disabled)
 */
class PassthroughRenameResolver : public RenameResolver
{
public:
    NameProposal proposeName(const std::string &file_path) override;
};

/**
 * @brief Runs the mnamer command line tool and parses its rename line
 *
 * stdout and stderr are captured together. The child is killed when it
 * outlives timeout_seconds.
 */
class MnamerRenameResolver : public RenameResolver
{
public:
    explicit MnamerRenameResolver(const RenamerSettings &settings);

    NameProposal proposeName(const std::string &file_path) override;

    std::vector<std::string> buildArguments(const std::string &file_path) const;

    /**
     * @brief Extract the new basename from "old -> new", "old → new" or "... renamed to new"
     */
    static std::optional<std::string> parseOutput(const std::string &output);

private:
    RenamerSettings settings_;
};
