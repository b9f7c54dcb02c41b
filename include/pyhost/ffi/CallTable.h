/***
 * Name: pyhost::ffi::CallTable
 * Purpose: The set of CPython entry points the bridge calls through.
 * Inputs: Bound once by linkedCallTable() (or a test substitute)
 * Outputs: Function pointers grouped by protocol
 * Theory of Operation:
 *   Every member documents how the handle it returns is owned:
 *     new      - caller receives one reference (wrap with ReferenceManager::receive)
 *     borrowed - caller owns nothing (wrap with ReferenceManager::borrow)
 *     steals   - the entry point takes over one reference of its argument,
 *                so the caller increments first
 *   Status-returning members signal failure with -1 (or a NULL handle) and set
 *   the CPython error indicator; the ErrorTranslator is the only reader of it.
 *   Nothing here manages lifetimes; the table is plain data so tests can copy
 *   it and replace single entries.
 */
#pragma once

#ifndef PY_SSIZE_T_CLEAN
#define PY_SSIZE_T_CLEAN
#endif
#include <Python.h>

#include <cstddef>
#include <cstdint>

namespace pyhost::ffi {

using Handle = PyObject*;

// Rich comparison operator codes (Py_LT .. Py_GE).
enum class CompareOp : int { Lt = 0, Le = 1, Eq = 2, Ne = 3, Gt = 4, Ge = 5 };

struct CallTable {
  using Unary = Handle (*)(Handle);
  using Binary = Handle (*)(Handle, Handle);
  using Ternary = Handle (*)(Handle, Handle, Handle);

  // Reference counting (null-safe)
  void (*incRef)(Handle){nullptr};
  void (*decRef)(Handle){nullptr};

  // Error state
  Handle (*errOccurred)(){nullptr};                           // borrowed; NULL when clear
  void (*errFetch)(Handle*, Handle*, Handle*){nullptr};       // new x3 (any may be NULL), clears indicator
  void (*errNormalize)(Handle*, Handle*, Handle*){nullptr};   // replaces values in place, ownership kept

  // Object protocol
  Handle (*getAttrString)(Handle, const char*){nullptr};      // new
  int (*setAttrString)(Handle, const char*, Handle){nullptr}; // -1 on failure
  Handle (*getItem)(Handle, Handle){nullptr};                 // new
  int (*setItem)(Handle, Handle, Handle){nullptr};            // -1 on failure
  int (*richCompareBool)(Handle, Handle, int){nullptr};       // -1 on failure
  Unary str{nullptr};                                         // new
  Unary repr{nullptr};                                        // new
  Py_hash_t (*hash)(Handle){nullptr};                         // -1 on failure (or a legitimate -1)
  int (*isTrue)(Handle){nullptr};                             // -1 on failure
  Unary getIter{nullptr};                                     // new
  Ternary call{nullptr};                                      // new; (callable, args tuple, kwargs dict or NULL)
  Handle (*vectorcall)(Handle, Handle const*, std::size_t, Handle){nullptr};       // new
  Handle (*vectorcallMethod)(Handle, Handle const*, std::size_t, Handle){nullptr}; // new; args[0] is self
  int (*callableCheck)(Handle){nullptr};                      // 1/0, never fails

  // Number protocol: binary
  Binary numberAdd{nullptr};
  Binary numberSubtract{nullptr};
  Binary numberMultiply{nullptr};
  Binary numberMatrixMultiply{nullptr};
  Binary numberFloorDivide{nullptr};
  Binary numberTrueDivide{nullptr};
  Binary numberRemainder{nullptr};
  Ternary numberPower{nullptr};                               // third argument is the modulus (None for none)
  Binary numberLshift{nullptr};
  Binary numberRshift{nullptr};
  Binary numberAnd{nullptr};
  Binary numberXor{nullptr};
  Binary numberOr{nullptr};

  // Number protocol: in-place (all new; may return the left operand itself)
  Binary numberInPlaceAdd{nullptr};
  Binary numberInPlaceSubtract{nullptr};
  Binary numberInPlaceMultiply{nullptr};
  Binary numberInPlaceMatrixMultiply{nullptr};
  Binary numberInPlaceFloorDivide{nullptr};
  Binary numberInPlaceTrueDivide{nullptr};
  Binary numberInPlaceRemainder{nullptr};
  Ternary numberInPlacePower{nullptr};
  Binary numberInPlaceLshift{nullptr};
  Binary numberInPlaceRshift{nullptr};
  Binary numberInPlaceAnd{nullptr};
  Binary numberInPlaceXor{nullptr};
  Binary numberInPlaceOr{nullptr};

  // Number protocol: unary (new)
  Unary numberNegative{nullptr};
  Unary numberPositive{nullptr};
  Unary numberInvert{nullptr};

  // Sequence / mapping / iterator
  Handle (*sequenceGetItem)(Handle, Py_ssize_t){nullptr};     // new
  Unary mappingItems{nullptr};                                // new; list of (key, value) tuples
  Unary iterNext{nullptr};                                    // new; NULL + clear = exhausted

  // Constructors and accessors
  Handle (*longFromLongLong)(long long){nullptr};             // new
  Handle (*longFromUnsignedLongLong)(unsigned long long){nullptr}; // new
  long long (*longAsLongLong)(Handle){nullptr};               // -1 on failure (or a legitimate -1)
  Handle (*boolFromLong)(long){nullptr};                      // new
  Handle (*floatFromDouble)(double){nullptr};                 // new
  double (*floatAsDouble)(Handle){nullptr};                   // -1.0 on failure (or a legitimate -1.0)
  Handle (*unicodeFromStringAndSize)(const char*, Py_ssize_t){nullptr}; // new
  const char* (*unicodeAsUTF8AndSize)(Handle, Py_ssize_t*){nullptr};    // buffer owned by the object; NULL on failure
  Handle (*tupleNew)(Py_ssize_t){nullptr};                    // new
  int (*tupleSetItem)(Handle, Py_ssize_t, Handle){nullptr};   // steals item
  Handle (*listNew)(Py_ssize_t){nullptr};                     // new
  int (*listSetItem)(Handle, Py_ssize_t, Handle){nullptr};    // steals item
  Handle (*dictNew)(){nullptr};                               // new
  int (*dictSetItem)(Handle, Handle, Handle){nullptr};        // does not steal
  Unary setNew{nullptr};                                      // new; argument is an iterable or NULL
  int (*setAdd)(Handle, Handle){nullptr};                     // does not steal
  Ternary sliceNew{nullptr};                                  // new; NULL bounds mean None
  Handle (*none)(){nullptr};                                  // borrowed

  // Lifecycle
  Handle (*importModule)(const char*){nullptr};               // new
  Handle (*evalGetBuiltins)(){nullptr};                       // borrowed
  int (*runSimpleString)(const char*, PyCompilerFlags*){nullptr}; // 0 on success, prints its own traceback
  int (*isInitialized)(){nullptr};
};

// Table bound to the libpython this binary links against.
const CallTable& linkedCallTable();

// Major.minor of the linked runtime, e.g. "python3.11".
const char* linkedLibraryName();

}  // namespace pyhost::ffi
