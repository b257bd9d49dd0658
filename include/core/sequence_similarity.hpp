#pragma once

#include <cstddef>
#include <string>

/**
 * @brief Ratcliff/Obershelp string similarity
 *
 * ratio = 2*M / T where M is the number of characters in matching blocks found
 * by recursively taking the longest common substring, and T is the combined
 * length of both strings.
 */
class SequenceSimilarity
{
public:
    /**
     * @brief Similarity of two strings in [0, 1]; two empty strings score 1.0
     */
    static double ratio(const std::string &a, const std::string &b);

    /**
     * @brief Total length of all matching blocks between a and b
     */
    static size_t matchingCharacters(const std::string &a, const std::string &b);

    /**
     * @brief Lowercase and fold runs of '.', '_', '-' and spaces into one space
     */
    static std::string normalizeForComparison(const std::string &value);

    // ratio() over normalizeForComparison() of both titles
    static double titleSimilarity(const std::string &a, const std::string &b);

private:
    static size_t matchRange(const std::string &a, size_t alo, size_t ahi,
                             const std::string &b, size_t blo, size_t bhi);
};
