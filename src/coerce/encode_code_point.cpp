/***
 * Name: pyhost::coerce::encodeCodePoint
 * Purpose: One Unicode scalar value as UTF-8.
 * Inputs:
 *   - codePoint: U+0000..U+10FFFF excluding surrogates
 * Outputs: 1 to 4 bytes of UTF-8
 * Theory of Operation: ICU's U8_APPEND writes into a fixed buffer and flags
 *   values that are not scalar values.
 */
#include "pyhost/coerce/Containers.h"

#include <unicode/utf8.h>

#include <cstdint>
#include <string>

#include "pyhost/exceptions/usage_error.h"

namespace pyhost::coerce {

std::string encodeCodePoint(char32_t codePoint) {
  const auto value = static_cast<UChar32>(codePoint);
  uint8_t buf[U8_MAX_LENGTH];
  int32_t length = 0;
  UBool isError = false;
  U8_APPEND(buf, length, U8_MAX_LENGTH, value, isError);
  if (isError) {
    throw exceptions::UsageError("not a Unicode scalar value: " + std::to_string(static_cast<uint32_t>(codePoint)));
  }
  return std::string(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(length));
}

} // namespace pyhost::coerce
