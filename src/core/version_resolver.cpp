#include "core/version_resolver.hpp"
#include "core/file_utils.hpp"
#include "core/sequence_similarity.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace
{
    std::string escapeRegex(const std::string &text)
    {
        static const std::string special = R"(\^$.|?*+()[]{})";
        std::string escaped;
        for (char c : text)
        {
            if (special.find(c) != std::string::npos)
                escaped.push_back('\\');
            escaped.push_back(c);
        }
        return escaped;
    }

    std::string trim(const std::string &value)
    {
        size_t start = value.find_first_not_of(" \t");
        if (start == std::string::npos)
            return "";
        size_t end = value.find_last_not_of(" \t");
        return value.substr(start, end - start + 1);
    }
}

VersionResolver::VersionResolver(const VersionDetectionSettings &settings)
    : settings_(settings)
{
    const std::string placeholder = "{number}";
    std::string pattern;
    size_t pos = settings_.format.find(placeholder);
    if (pos == std::string::npos)
    {
        Logger::warn("Version format '" + settings_.format + "' has no {number} placeholder, using .v{number}");
        settings_.format = ".v{number}";
        pos = 2;
    }
    pattern = escapeRegex(settings_.format.substr(0, pos)) + "(\\d+)" +
              escapeRegex(settings_.format.substr(pos + placeholder.size())) + "$";
    version_regex_ = std::regex(pattern, std::regex::icase);
}

std::string VersionResolver::splitExtension(const std::string &filename, std::string &extension) const
{
    extension.clear();
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= filename.size())
    {
        return filename;
    }

    std::string candidate = filename.substr(dot);
    if (candidate.size() > 6)
    {
        return filename;
    }

    bool has_letter = false;
    for (size_t i = 1; i < candidate.size(); ++i)
    {
        unsigned char c = static_cast<unsigned char>(candidate[i]);
        if (!std::isalnum(c))
            return filename;
        if (std::isalpha(c))
            has_letter = true;
    }
    if (!has_letter || std::regex_match(candidate, version_regex_))
    {
        return filename;
    }

    extension = candidate;
    return filename.substr(0, dot);
}

std::string VersionResolver::normalizedTitle(const std::string &filename) const
{
    std::string extension;
    std::string stem = splitExtension(filename, extension);
    return trim(std::regex_replace(stem, version_regex_, ""));
}

std::optional<int> VersionResolver::extractVersion(const std::string &filename) const
{
    std::string extension;
    std::string stem = splitExtension(filename, extension);
    std::smatch match;
    if (std::regex_search(stem, match, version_regex_))
    {
        try
        {
            return std::stoi(match[1].str());
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string VersionResolver::formatSuffix(int version) const
{
    std::string suffix = settings_.format;
    suffix.replace(suffix.find("{number}"), 8, std::to_string(version));
    return suffix;
}

bool VersionResolver::titlesMatch(const std::string &candidate_title, const std::string &existing_title) const
{
    if (FileUtils::toLower(candidate_title) == FileUtils::toLower(existing_title))
    {
        return true;
    }
    if (!settings_.check_similar)
    {
        return false;
    }

    double similarity = SequenceSimilarity::titleSimilarity(candidate_title, existing_title);
    if (similarity >= settings_.similarity_threshold)
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << similarity;
        Logger::debug("Found similar file title: '" + existing_title + "' (similarity: " + ss.str() + ")");
        return true;
    }
    return false;
}

VersionDecision VersionResolver::resolve(const std::string &candidate_filename,
                                         const std::vector<std::string> &destination_listing) const
{
    VersionDecision decision;
    decision.output_filename = candidate_filename;

    if (!settings_.enabled)
    {
        Logger::debug("Version detection is disabled");
        return decision;
    }

    const std::string title = normalizedTitle(candidate_filename);
    int highest = 0;
    for (const auto &existing : destination_listing)
    {
        if (!titlesMatch(title, normalizedTitle(existing)))
            continue;
        decision.matched_files.push_back(existing);
        highest = std::max(highest, extractVersion(existing).value_or(1));
    }

    if (decision.matched_files.empty())
    {
        Logger::info("No existing versions found for: " + candidate_filename);
        return decision;
    }

    std::string extension;
    splitExtension(candidate_filename, extension);
    decision.is_duplicate = true;
    decision.version_number = highest + 1;
    decision.output_filename = title + formatSuffix(decision.version_number) + extension;

    Logger::info("Existing versions found. New file will be: " + decision.output_filename +
                 " (version " + std::to_string(decision.version_number) + ")");
    return decision;
}
