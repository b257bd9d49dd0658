#include "core/sequence_similarity.hpp"
#include <cctype>
#include <vector>

double SequenceSimilarity::ratio(const std::string &a, const std::string &b)
{
    size_t total = a.size() + b.size();
    if (total == 0)
    {
        return 1.0;
    }
    return 2.0 * static_cast<double>(matchingCharacters(a, b)) / static_cast<double>(total);
}

size_t SequenceSimilarity::matchingCharacters(const std::string &a, const std::string &b)
{
    return matchRange(a, 0, a.size(), b, 0, b.size());
}

size_t SequenceSimilarity::matchRange(const std::string &a, size_t alo, size_t ahi,
                                      const std::string &b, size_t blo, size_t bhi)
{
    if (alo >= ahi || blo >= bhi)
    {
        return 0;
    }

    // Longest common substring; ties resolve to the earliest block in a, then in b
    size_t best_i = alo, best_j = blo, best_size = 0;
    std::vector<size_t> prev(bhi - blo + 1, 0), curr(bhi - blo + 1, 0);
    for (size_t i = alo; i < ahi; ++i)
    {
        for (size_t j = blo; j < bhi; ++j)
        {
            size_t col = j - blo + 1;
            if (a[i] == b[j])
            {
                curr[col] = prev[col - 1] + 1;
                if (curr[col] > best_size)
                {
                    best_size = curr[col];
                    best_i = i + 1 - best_size;
                    best_j = j + 1 - best_size;
                }
            }
            else
            {
                curr[col] = 0;
            }
        }
        std::swap(prev, curr);
    }

    if (best_size == 0)
    {
        return 0;
    }

    return best_size +
           matchRange(a, alo, best_i, b, blo, best_j) +
           matchRange(a, best_i + best_size, ahi, b, best_j + best_size, bhi);
}

std::string SequenceSimilarity::normalizeForComparison(const std::string &value)
{
    std::string result;
    result.reserve(value.size());
    bool pending_separator = false;
    for (unsigned char c : value)
    {
        if (c == '.' || c == '_' || c == '-' || std::isspace(c))
        {
            pending_separator = !result.empty();
            continue;
        }
        if (pending_separator)
        {
            result.push_back(' ');
            pending_separator = false;
        }
        result.push_back(static_cast<char>(std::tolower(c)));
    }
    return result;
}

double SequenceSimilarity::titleSimilarity(const std::string &a, const std::string &b)
{
    return ratio(normalizeForComparison(a), normalizeForComparison(b));
}
