/***
 * Name: pyhost::coerce::detail::fromUtf8
 * Purpose: Host UTF-8 bytes to a Python str.
 */
#include "pyhost/coerce/ToForeign.h"

namespace pyhost::coerce::detail {

object::ProxyObject fromUtf8(Bridge& bridge, std::string_view text) {
  return bridge.receive(
      bridge.api().unicodeFromStringAndSize(text.data(), static_cast<Py_ssize_t>(text.size())), "str");
}

} // namespace pyhost::coerce::detail
