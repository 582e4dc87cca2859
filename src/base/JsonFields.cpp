#include "JsonFields.hpp"

#include <cmath>

namespace jm {
const json* findField(const json& j, const string& camelKey,
                      const string& snakeKey) {
  if (!j.is_object()) {
    return NULL;
  }
  auto it = j.find(camelKey);
  if (it != j.end() && !it->is_null()) {
    return &(*it);
  }
  if (!snakeKey.empty()) {
    it = j.find(snakeKey);
    if (it != j.end() && !it->is_null()) {
      return &(*it);
    }
  }
  return NULL;
}

optional<int64_t> jsonInt64(const json& j, const string& camelKey,
                            const string& snakeKey) {
  const json* value = findField(j, camelKey, snakeKey);
  if (!value) {
    return std::nullopt;
  }
  if (value->is_number_unsigned()) {
    uint64_t u = value->get<uint64_t>();
    if (u > uint64_t(std::numeric_limits<int64_t>::max())) {
      VLOG(2) << "Field " << camelKey << " is out of range";
      return std::nullopt;
    }
    return int64_t(u);
  }
  if (value->is_number_integer()) {
    return value->get<int64_t>();
  }
  if (value->is_number()) {
    double d = value->get<double>();
    // 2^63 is exact as a double; anything at or past it does not fit.
    if (!std::isfinite(d) || d < -9223372036854775808.0 ||
        d >= 9223372036854775808.0) {
      VLOG(2) << "Field " << camelKey << " is out of range";
      return std::nullopt;
    }
    return int64_t(d);
  }
  if (value->is_string()) {
    try {
      return stoll(value->get<string>());
    } catch (const std::logic_error& e) {
      VLOG(2) << "Field " << camelKey << " is not a number";
    }
  }
  return std::nullopt;
}

optional<double> jsonDouble(const json& j, const string& camelKey,
                            const string& snakeKey) {
  const json* value = findField(j, camelKey, snakeKey);
  if (!value) {
    return std::nullopt;
  }
  if (value->is_number()) {
    return value->get<double>();
  }
  if (value->is_string()) {
    try {
      return stod(value->get<string>());
    } catch (const std::logic_error& e) {
      VLOG(2) << "Field " << camelKey << " is not a number";
    }
  }
  return std::nullopt;
}

optional<string> jsonString(const json& j, const string& camelKey,
                            const string& snakeKey) {
  const json* value = findField(j, camelKey, snakeKey);
  if (!value || !value->is_string()) {
    return std::nullopt;
  }
  return value->get<string>();
}

optional<bool> jsonBool(const json& j, const string& camelKey,
                        const string& snakeKey) {
  const json* value = findField(j, camelKey, snakeKey);
  if (!value || !value->is_boolean()) {
    return std::nullopt;
  }
  return value->get<bool>();
}
}  // namespace jm
