#ifndef __JM_JSON_FIELDS__
#define __JM_JSON_FIELDS__

#include "Headers.hpp"

namespace jm {
/**
 * @brief Finds a non-null field by its camelCase key, falling back to the
 * snake_case spelling.  Returns NULL when absent or when `j` is not an
 * object.
 */
const json* findField(const json& j, const string& camelKey,
                      const string& snakeKey = "");

/** @brief Reads an integer that may be encoded as a number or a string. */
optional<int64_t> jsonInt64(const json& j, const string& camelKey,
                            const string& snakeKey = "");

optional<double> jsonDouble(const json& j, const string& camelKey,
                            const string& snakeKey = "");

optional<string> jsonString(const json& j, const string& camelKey,
                            const string& snakeKey = "");

optional<bool> jsonBool(const json& j, const string& camelKey,
                        const string& snakeKey = "");
}  // namespace jm

#endif  // __JM_JSON_FIELDS__
