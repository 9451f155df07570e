#pragma once

#include <string>

namespace TesseraUtility {
/**
 * @brief Concatenates the string form of every element in a range, placing
 * `separator` between consecutive elements.
 *
 * @tparam TIterator An input iterator whose value type converts to
 * `std::string`.
 * @param begin The first element.
 * @param end One past the last element.
 * @param separator Inserted between elements, but not before the first or
 * after the last.
 * @return The joined string, or an empty string if the range is empty.
 */
template <class TIterator>
std::string
joinToString(TIterator begin, TIterator end, const std::string& separator) {
  std::string result;
  for (TIterator it = begin; it != end; ++it) {
    if (it != begin) {
      result += separator;
    }
    result += *it;
  }
  return result;
}

/**
 * @brief Concatenates every element of a collection, placing `separator`
 * between consecutive elements.
 *
 * @tparam TCollection A collection with `cbegin` and `cend`.
 * @param collection The elements to join.
 * @param separator Inserted between elements.
 * @return The joined string.
 */
template <class TCollection>
std::string
joinToString(const TCollection& collection, const std::string& separator) {
  return joinToString(collection.cbegin(), collection.cend(), separator);
}
} // namespace TesseraUtility
