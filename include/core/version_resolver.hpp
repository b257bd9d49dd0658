#pragma once

#include "core/settings.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

/**
 * @brief Outcome of duplicate detection against a destination listing
 */
struct VersionDecision
{
    bool is_duplicate = false;
    int version_number = 1;
    std::string output_filename;
    std::vector<std::string> matched_files;
};

/**
 * @brief Finds earlier copies of a title in the destination and picks the next version tag
 *
 * Pure: all input comes through resolve(), the destination listing is
 * gathered by the caller (see FileUtils::listDestinationFiles).
 */
class VersionResolver
{
public:
    explicit VersionResolver(const VersionDetectionSettings &settings);

    /**
     * @brief Decide the version of a candidate filename
     * @param candidate_filename Proposed canonical filename, with extension
     * @param destination_listing Basenames already present in the destination
     * @return Version 1 and the unchanged name when nothing matches, otherwise max+1
     */
    VersionDecision resolve(const std::string &candidate_filename,
                            const std::vector<std::string> &destination_listing) const;

    /**
     * @brief Title with extension and trailing version suffix removed
     */
    std::string normalizedTitle(const std::string &filename) const;

    /**
     * @brief Version carried by the filename's suffix, if any
     */
    std::optional<int> extractVersion(const std::string &filename) const;

    std::string formatSuffix(int version) const;

    /**
     * @brief Split "Name.ext" into "Name" and ".ext"
     *
     * A trailing dotted part counts as an extension only when it is short,
     * alphanumeric and contains a letter, so "Title.2020" keeps its year.
     */
    std::string splitExtension(const std::string &filename, std::string &extension) const;

private:
    bool titlesMatch(const std::string &candidate_title, const std::string &existing_title) const;

    VersionDetectionSettings settings_;
    std::regex version_regex_;
};
