/***
 * Name: pyhost::support (environment helpers)
 * Purpose: Read boolean switches from the environment.
 * Theory of Operation: "1", "true" and "yes" (case-insensitive) are true;
 *   anything else, including an unset variable, is false.
 */
#pragma once

namespace pyhost::support {

bool isTrueValue(const char* value);

bool envFlag(const char* name);

} // namespace pyhost::support
